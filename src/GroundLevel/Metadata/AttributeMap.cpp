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

#include <GroundLevel/Metadata/AttributeMap.hpp>
#include <type_traits>

namespace GroundLevel
{
  std::string_view GetAttributeTypeName(const AttributeValue& value) noexcept
  {
    return std::visit(
      [](const auto& held) -> std::string_view
      {
        using TValue = std::decay_t<decltype(held)>;
        if constexpr (std::is_same_v<TValue, bool>)
        {
          return "bool";
        }
        else if constexpr (std::is_same_v<TValue, int32_t>)
        {
          return "int32";
        }
        else if constexpr (std::is_same_v<TValue, int64_t>)
        {
          return "int64";
        }
        else if constexpr (std::is_same_v<TValue, double>)
        {
          return "double";
        }
        else
        {
          return "string";
        }
      },
      value);
  }

  void MergeAttributes(AttributeMap& base, const AttributeMap& overlay)
  {
    for (const auto& entry : overlay)
    {
      base.insert_or_assign(entry.first, entry.second);
    }
  }
}
