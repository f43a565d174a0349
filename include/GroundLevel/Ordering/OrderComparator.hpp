#ifndef GROUND_LEVEL_ORDERING_ORDERCOMPARATOR_HPP
#define GROUND_LEVEL_ORDERING_ORDERCOMPARATOR_HPP
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

#include <GroundLevel/Metadata/AnnotationAttributeResolver.hpp>
#include <GroundLevel/Metadata/AnnotationKind.hpp>
#include <GroundLevel/Metadata/ITypeCatalog.hpp>
#include <GroundLevel/Ordering/CandidateRef.hpp>
#include <GroundLevel/Ordering/OrderComparatorConfig.hpp>
#include <GroundLevel/Ordering/OrderPriority.hpp>
#include <GroundLevel/Registry/IComponentRegistry.hpp>
#include <compare>
#include <optional>
#include <string>

namespace GroundLevel
{
  /// @brief Orders components by priority, ascending (lower values first).
  ///
  /// The priority of a component is resolved through a fixed precedence chain. The first step that yields a
  /// value wins and later steps are not consulted:
  /// 1. The ordering annotation. The producer method annotation takes precedence over the annotation on the
  ///    component type (see AnnotationAttributeResolver).
  /// 2. The IOrdered interface.
  /// 3. A public, zero-argument `int32_t GetOrder()` method (const-qualified or not) on the component type, even if it does not implement IOrdered.
  ///    Exceptions escaping this method are rethrown as OrderInvocationException with the original nested.
  /// 4. OrderPriority::LowestPrecedence(), also used for the null candidate.
  ///
  /// The comparator is stateless besides its configuration and may be copied freely; it references the registry
  /// and catalog, which must outlive it and must not be mutated while a sort is in progress.
  ///
  /// Example usage:
  /// @code
  /// OrderComparator comparator(registry, catalog);
  /// std::stable_sort(filters.begin(), filters.end(), comparator);
  /// @endcode
  class OrderComparator
  {
    using OrderStrategy = std::optional<OrderPriority> (OrderComparator::*)(const CandidateRef&) const;

    AnnotationAttributeResolver m_resolver;
    AnnotationKind m_orderAnnotation;
    std::string m_valueAttribute;

  public:
    OrderComparator(const IComponentRegistry& registry, const ITypeCatalog& types, const OrderComparatorConfig& config = {});

    /// @brief Resolves the priority of a candidate.
    ///
    /// @param candidate The component instance.
    /// @return The resolved priority, or OrderPriority::LowestPrecedence() if none of the strategies apply.
    /// @throws AttributeTypeException if the ordering annotation value is not an int32_t.
    /// @throws OrderInvocationException if a duck-typed GetOrder accessor throws.
    OrderPriority ResolveOrder(const CandidateRef& candidate) const;

    /// @brief Compares the resolved priorities of two candidates.
    std::strong_ordering Compare(const CandidateRef& lhs, const CandidateRef& rhs) const;

    /// @brief Strict weak ordering predicate for standard algorithms.
    bool operator()(const CandidateRef& lhs, const CandidateRef& rhs) const
    {
      return Compare(lhs, rhs) < 0;
    }

    /// @brief Strict weak ordering predicate over objects, raw pointers or shared pointers.
    template <typename T>
    bool operator()(const T& lhs, const T& rhs) const
    {
      return Compare(CandidateRef::Of(lhs), CandidateRef::Of(rhs)) < 0;
    }

    [[nodiscard]] const AnnotationAttributeResolver& GetResolver() const noexcept
    {
      return m_resolver;
    }

  private:
    std::optional<OrderPriority> TryAnnotationOrder(const CandidateRef& candidate) const;
    std::optional<OrderPriority> TryOrderedInterface(const CandidateRef& candidate) const;
    std::optional<OrderPriority> TryOrderAccessor(const CandidateRef& candidate) const;
  };
}

#endif
