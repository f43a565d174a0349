#ifndef GROUND_LEVEL_EXCEPTION_ATTRIBUTETYPEEXCEPTION_HPP
#define GROUND_LEVEL_EXCEPTION_ATTRIBUTETYPEEXCEPTION_HPP
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
  /// @brief Exception thrown when an annotation attribute holds a different type than the one requested.
  ///
  /// For example an ordering annotation whose "value" attribute is a string instead of an int32_t.
  /// This indicates malformed metadata and is propagated to the caller unmodified.
  class AttributeTypeException : public std::runtime_error
  {
  public:
    explicit AttributeTypeException(const std::string& message)
      : std::runtime_error(message)
    {
    }
  };
}

#endif
