#ifndef GROUND_LEVEL_METADATA_ANNOTATIONSET_HPP
#define GROUND_LEVEL_METADATA_ANNOTATIONSET_HPP
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

#include <GroundLevel/Metadata/AnnotationKind.hpp>
#include <GroundLevel/Metadata/AttributeMap.hpp>
#include <optional>
#include <string>
#include <unordered_map>

namespace GroundLevel
{
  /// @brief The annotations declared on one element (a type or a producer method).
  ///
  /// Holds at most one annotation instance per kind. Each instance is stored as its decoded attribute map.
  class AnnotationSet
  {
    std::unordered_map<std::string, AttributeMap> m_annotations;

  public:
    AnnotationSet() = default;

    /// @brief Declares an annotation of the given kind, replacing any previous declaration of that kind.
    /// @param kind The annotation kind.
    /// @param attributes The decoded attributes of the annotation. May be empty (marker annotation).
    /// @return *this, to allow chaining.
    AnnotationSet& Add(const AnnotationKind& kind, AttributeMap attributes = {});

    /// @brief Checks whether an annotation of the given kind is declared.
    [[nodiscard]] bool IsAnnotated(const AnnotationKind& kind) const;

    /// @brief Gets the attributes of the annotation of the given kind.
    /// @return The attributes, or std::nullopt if no such annotation is declared.
    [[nodiscard]] std::optional<AttributeMap> TryGetAttributes(const AnnotationKind& kind) const;

    [[nodiscard]] bool Empty() const noexcept
    {
      return m_annotations.empty();
    }
  };
}

#endif
