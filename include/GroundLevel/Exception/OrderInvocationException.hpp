#ifndef GROUND_LEVEL_EXCEPTION_ORDERINVOCATIONEXCEPTION_HPP
#define GROUND_LEVEL_EXCEPTION_ORDERINVOCATIONEXCEPTION_HPP
//****************************************************************************************************************************************************
//* Zero-Clause BSD (0BSD)
//*
//* Copyright (c) 2025, Mana Battery
//*
//* Permission to use, copy, modify, and/or distribute this software for any purpose with or without fee is hereby granted.
//*
//* THE SOFTWARE IS PROVIDED "AS IS" AND THE AUTHOR DISCLAIMS ALL WARRANTIES WITH REGARD TO THIS SOFTWARE INCLUDING ALL IMPLIED WARRANTIES OF
//* MERCHANTABILITY AND FITNESS. IN NO EVENT SHALL THE AUTHOR BE LIABLE FOR ANY SPECIAL, DIRECT, INDIRECT, OR CONSEQUENTIAL DAMAGES OR ANY DAMAGES
//* WHATSOEVER RESULTING FROM LOSS OF USE, DATA OR PROFITS, WHETHER IN AN ACTION OF CONTRACT, NEGLIGENCE OR OTHER TORTIOUS ACTION, ARISING OUT OF
//* OR IN CONNECTION WITH THE USE OR PERFORMANCE OF THIS SOFTWARE.
//****************************************************************************************************************************************************

#include <stdexcept>
#include <string>

namespace GroundLevel
{
  /// @brief Exception thrown when a duck-typed GetOrder accessor fails.
  ///
  /// The component's accessor is expected to be a plain getter. An exception escaping it means the component is
  /// broken, so the failure is never mapped to a default priority. The original exception is attached as a
  /// nested exception and can be retrieved with std::rethrow_if_nested.
  class OrderInvocationException : public std::runtime_error
  {
  public:
    explicit OrderInvocationException(const std::string& message)
      : std::runtime_error(message)
    {
    }
  };
}

#endif
