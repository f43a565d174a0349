#ifndef GROUND_LEVEL_METADATA_ANNOTATIONATTRIBUTERESOLVER_HPP
#define GROUND_LEVEL_METADATA_ANNOTATIONATTRIBUTERESOLVER_HPP
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
#include <GroundLevel/Metadata/ITypeCatalog.hpp>
#include <GroundLevel/Ordering/CandidateRef.hpp>
#include <GroundLevel/Registry/IComponentRegistry.hpp>
#include <string>
#include <vector>

namespace GroundLevel
{
  /// @brief Resolves the attributes of an annotation for a component instance.
  ///
  /// The attributes are merged from two sources:
  /// - the annotation declared on the component's runtime type (or one of its declared base types),
  /// - the annotation declared on the producer method the component was registered through.
  ///
  /// Producer method attributes replace type attributes with the same name.
  ///
  /// Take a component type declared with `Order(value = 1)`. Resolving the Order annotation for an instance
  /// gives {"value": 1}. If the same type is also registered through a producer method declared with
  /// `Order(value = 2)`, resolving gives {"value": 2}.
  ///
  /// @note If several registrations of the component's type carry the annotation on their producer method,
  ///       the first one in registry iteration order contributes. Which registration produced a given
  ///       instance is not tracked, so this choice is unspecified from the caller's point of view.
  ///
  /// The resolver does not own the registry or the catalog; both must outlive it. Resolution is stateless and
  /// may run concurrently as long as neither is mutated.
  class AnnotationAttributeResolver
  {
    const IComponentRegistry* m_pRegistry;
    const ITypeCatalog* m_pTypes;

  public:
    AnnotationAttributeResolver(const IComponentRegistry& registry, const ITypeCatalog& types) noexcept;

    /// @brief Resolves the merged attributes of an annotation kind for a candidate.
    ///
    /// @param kind The annotation kind.
    /// @param candidate The component instance. The null candidate yields an empty map.
    /// @return The merged attributes. Empty, not an error, when the annotation is found nowhere.
    AttributeMap Resolve(const AnnotationKind& kind, const CandidateRef& candidate) const;

    [[nodiscard]] const IComponentRegistry& GetRegistry() const noexcept
    {
      return *m_pRegistry;
    }

    [[nodiscard]] const ITypeCatalog& GetTypes() const noexcept
    {
      return *m_pTypes;
    }
  };

  /// @brief Gets the names of all registrations whose producer method carries the given annotation kind.
  ///
  /// @param registry The registry to search.
  /// @param names The registration names to consider, usually all names of the registry.
  /// @param kind The annotation kind.
  /// @return The matching names, in the order given.
  std::vector<std::string> ComponentsAnnotatedWith(const IComponentRegistry& registry, const std::vector<std::string>& names,
                                                   const AnnotationKind& kind);
}

#endif
