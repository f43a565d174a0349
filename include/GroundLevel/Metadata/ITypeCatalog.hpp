#ifndef GROUND_LEVEL_METADATA_ITYPECATALOG_HPP
#define GROUND_LEVEL_METADATA_ITYPECATALOG_HPP
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
#include <GroundLevel/Metadata/TypeDescriptor.hpp>
#include <optional>
#include <typeindex>

namespace GroundLevel
{
  /// @brief Read-only query interface over class-level type metadata.
  class ITypeCatalog
  {
  public:
    virtual ~ITypeCatalog() = default;

    /// @brief Finds an annotation declared on a type or on one of its declared base types.
    ///
    /// @param type The type to search.
    /// @param kind The annotation kind.
    /// @return The decoded attributes of the first annotation found, or std::nullopt if none is found.
    virtual std::optional<AttributeMap> FindAnnotation(const std::type_index& type, const AnnotationKind& kind) const = 0;

    /// @brief Finds the descriptor of a type.
    ///
    /// @param type The type.
    /// @return The descriptor, or nullptr if the type is not in the catalog. The pointer stays valid as long
    ///         as the catalog is not modified.
    virtual const TypeDescriptor* FindDescriptor(const std::type_index& type) const = 0;
  };

}

#endif
