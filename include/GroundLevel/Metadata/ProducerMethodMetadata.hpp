#ifndef GROUND_LEVEL_METADATA_PRODUCERMETHODMETADATA_HPP
#define GROUND_LEVEL_METADATA_PRODUCERMETHODMETADATA_HPP
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

#include <GroundLevel/Metadata/AnnotationSet.hpp>
#include <optional>
#include <string>

namespace GroundLevel
{
  /// @brief Describes the factory method that produced a component, as opposed to direct type instantiation.
  ///
  /// Annotations declared on the producer method take precedence over annotations declared on the
  /// component's type when attributes are resolved.
  struct ProducerMethodMetadata
  {
    /// @brief Name of the type that declares the producer method (e.g. a configuration class).
    std::string DeclaringTypeName;

    /// @brief Name of the producer method.
    std::string MethodName;

    /// @brief Annotations declared on the producer method.
    AnnotationSet Annotations;

    [[nodiscard]] bool IsAnnotated(const AnnotationKind& kind) const
    {
      return Annotations.IsAnnotated(kind);
    }

    [[nodiscard]] std::optional<AttributeMap> GetAnnotationAttributes(const AnnotationKind& kind) const
    {
      return Annotations.TryGetAttributes(kind);
    }
  };
}

#endif
