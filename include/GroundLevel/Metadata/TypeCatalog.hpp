#ifndef GROUND_LEVEL_METADATA_TYPECATALOG_HPP
#define GROUND_LEVEL_METADATA_TYPECATALOG_HPP
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

#include <GroundLevel/Metadata/ITypeCatalog.hpp>
#include <GroundLevel/Metadata/TypeDescriptor.hpp>
#include <string>
#include <typeindex>
#include <typeinfo>
#include <unordered_map>
#include <utility>
#include <vector>

namespace GroundLevel
{
  /// @brief In-memory implementation of ITypeCatalog.
  ///
  /// Types are registered once, usually during application start-up, together with their class-level
  /// annotations. Registering a type also captures its ordering probe, so a component's ordering capability
  /// is known from its runtime type even when it is handled through a base class pointer.
  ///
  /// Example usage:
  /// @code
  /// TypeCatalog catalog;
  /// catalog.RegisterType<AuditFilter>(AnnotationSet().Add(AnnotationKinds::Order(), {{"value", 10}}));
  /// catalog.RegisterType<TracingAuditFilter>(AnnotationSet(), {typeid(AuditFilter)});
  /// @endcode
  ///
  /// The catalog is not internally synchronized.
  class TypeCatalog : public ITypeCatalog
  {
    std::unordered_map<std::type_index, TypeDescriptor> m_descriptors;

  public:
    TypeCatalog() = default;
    ~TypeCatalog() override = default;

    TypeCatalog(const TypeCatalog&) = delete;
    TypeCatalog& operator=(const TypeCatalog&) = delete;
    TypeCatalog(TypeCatalog&&) = delete;
    TypeCatalog& operator=(TypeCatalog&&) = delete;

    /// @brief Registers a type descriptor.
    /// @throws DuplicateTypeRegistrationException if the type is already registered.
    void RegisterType(TypeDescriptor descriptor);

    /// @brief Registers T with its class-level annotations and declared base types.
    /// @throws DuplicateTypeRegistrationException if T is already registered.
    template <typename T>
    void RegisterType(AnnotationSet annotations = {}, std::vector<std::type_index> baseTypes = {})
    {
      RegisterType(TypeDescriptor::For<T>(typeid(T).name(), std::move(annotations), std::move(baseTypes)));
    }

    std::optional<AttributeMap> FindAnnotation(const std::type_index& type, const AnnotationKind& kind) const override;
    const TypeDescriptor* FindDescriptor(const std::type_index& type) const override;

  private:
    std::optional<AttributeMap> FindAnnotationRecursive(const std::type_index& type, const AnnotationKind& kind,
                                                        std::vector<std::type_index>& rVisited) const;
  };

}

#endif
