#ifndef GROUND_LEVEL_EXCEPTION_COMPONENTREGISTRYEXCEPTION_HPP
#define GROUND_LEVEL_EXCEPTION_COMPONENTREGISTRYEXCEPTION_HPP
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
  /// @brief Exception thrown when attempting to register a component name that is already registered.
  ///
  /// This exception is thrown by ComponentRegistry::RegisterComponent. Each registration identity can only
  /// be used once per registry.
  class DuplicateComponentRegistrationException : public std::logic_error
  {
  public:
    explicit DuplicateComponentRegistrationException(const std::string& message)
      : std::logic_error(message)
    {
    }
  };

  /// @brief Exception thrown when attempting to register invalid registration metadata.
  ///
  /// This exception is thrown by ComponentRegistry::RegisterComponent when the registration name is empty.
  class InvalidComponentRegistrationException : public std::logic_error
  {
  public:
    explicit InvalidComponentRegistrationException(const std::string& message)
      : std::logic_error(message)
    {
    }
  };

  /// @brief Exception thrown when metadata is requested for a name that is not registered.
  class UnknownComponentException : public std::runtime_error
  {
  public:
    explicit UnknownComponentException(const std::string& message)
      : std::runtime_error(message)
    {
    }
  };

}

#endif
