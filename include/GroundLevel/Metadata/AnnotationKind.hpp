#ifndef GROUND_LEVEL_METADATA_ANNOTATIONKIND_HPP
#define GROUND_LEVEL_METADATA_ANNOTATIONKIND_HPP
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

#include <string>
#include <string_view>
#include <utility>

namespace GroundLevel
{
  /// @brief Identifies an annotation kind by a stable name.
  ///
  /// Annotation kinds are not C++ types. Two kinds are equal when their names are equal, which lets
  /// metadata produced elsewhere (generated tables, configuration) refer to the same kind.
  class AnnotationKind
  {
    std::string m_name;

  public:
    explicit AnnotationKind(std::string name)
      : m_name(std::move(name))
    {
    }

    [[nodiscard]] const std::string& GetName() const noexcept
    {
      return m_name;
    }

    bool operator==(const AnnotationKind& other) const noexcept = default;
  };

  namespace AnnotationKinds
  {
    /// @brief Name of the well-known ordering annotation.
    inline constexpr std::string_view OrderName = "Order";

    /// @brief Name of the conventional attribute carrying an annotation's primary value.
    inline constexpr std::string_view ValueAttribute = "value";

    inline AnnotationKind Order()
    {
      return AnnotationKind(std::string(OrderName));
    }
  }
}

#endif
