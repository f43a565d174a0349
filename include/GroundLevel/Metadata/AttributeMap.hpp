#ifndef GROUND_LEVEL_METADATA_ATTRIBUTEMAP_HPP
#define GROUND_LEVEL_METADATA_ATTRIBUTEMAP_HPP
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

#include <GroundLevel/Exception/AttributeTypeException.hpp>
#include <fmt/format.h>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>

namespace GroundLevel
{
  /// @brief The decoded value of a single annotation attribute.
  using AttributeValue = std::variant<bool, int32_t, int64_t, double, std::string>;

  /// @brief Decoded contents of one annotation instance: attribute name to attribute value.
  using AttributeMap = std::unordered_map<std::string, AttributeValue>;

  /// @brief Gets a readable name for the type currently held by an attribute value.
  std::string_view GetAttributeTypeName(const AttributeValue& value) noexcept;

  /// @brief Overlays the attributes of overlay onto base.
  ///
  /// Attributes present in both maps take the value from overlay. Attributes only present in base are kept.
  /// @param base The map that receives the attributes.
  /// @param overlay The attributes that replace or extend base.
  void MergeAttributes(AttributeMap& base, const AttributeMap& overlay);

  /// @brief Looks up an attribute and returns it as T.
  ///
  /// @tparam T One of the alternatives of AttributeValue.
  /// @param attributes The attribute map to search.
  /// @param name The attribute name.
  /// @return The value, or std::nullopt if the attribute is absent.
  /// @throws AttributeTypeException if the attribute is present but does not hold a T.
  template <typename T>
  std::optional<T> TryGetAttribute(const AttributeMap& attributes, const std::string& name)
  {
    const auto itrFind = attributes.find(name);
    if (itrFind == attributes.end())
    {
      return std::nullopt;
    }
    const T* pValue = std::get_if<T>(&itrFind->second);
    if (pValue == nullptr)
    {
      throw AttributeTypeException(
        fmt::format("Attribute '{}' holds a value of type '{}' which is not the requested type", name, GetAttributeTypeName(itrFind->second)));
    }
    return *pValue;
  }
}

#endif
