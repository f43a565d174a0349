#ifndef GROUND_LEVEL_ORDERING_IORDERED_HPP
#define GROUND_LEVEL_ORDERING_IORDERED_HPP
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

#include <cstdint>

namespace GroundLevel
{
  /// @brief Interface for components that report their own ordering priority.
  ///
  /// Checked by OrderComparator after ordering annotations. Lower values sort first.
  class IOrdered
  {
  public:
    virtual ~IOrdered() = default;

    /// @brief Gets the ordering priority of this component.
    virtual int32_t GetOrder() const = 0;
  };

}

#endif
