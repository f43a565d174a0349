#ifndef GROUND_LEVEL_ORDERING_SORTEDBYPRIORITY_HPP
#define GROUND_LEVEL_ORDERING_SORTEDBYPRIORITY_HPP
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

#include <GroundLevel/Ordering/CandidateRef.hpp>
#include <GroundLevel/Ordering/OrderComparator.hpp>
#include <GroundLevel/Ordering/OrderPriority.hpp>
#include <algorithm>
#include <cstddef>
#include <memory>
#include <utility>
#include <vector>

namespace GroundLevel
{
  namespace Detail
  {
    // Resolves every priority once, then sorts by it. Equal priorities keep their input order.
    template <typename TElement>
    std::vector<TElement> SortByResolvedPriority(const OrderComparator& comparator, std::vector<TElement> candidates)
    {
      std::vector<std::pair<OrderPriority, std::size_t>> keys;
      keys.reserve(candidates.size());
      for (std::size_t i = 0; i < candidates.size(); ++i)
      {
        keys.emplace_back(comparator.ResolveOrder(CandidateRef::Of(candidates[i])), i);
      }
      std::stable_sort(keys.begin(), keys.end(), [](const auto& lhs, const auto& rhs) { return lhs.first < rhs.first; });

      std::vector<TElement> result;
      result.reserve(candidates.size());
      for (const auto& key : keys)
      {
        result.push_back(std::move(candidates[key.second]));
      }
      return result;
    }
  }

  /// @brief Returns the components sorted by ascending priority.
  ///
  /// Each component's priority is resolved exactly once. Components with equal priority keep their relative order.
  /// Null entries are kept and sort as OrderPriority::LowestPrecedence().
  ///
  /// @param comparator The comparator resolving priorities.
  /// @param candidates The components to sort.
  /// @return The sorted components.
  /// @throws OrderInvocationException if a duck-typed GetOrder accessor throws.
  template <typename T>
  std::vector<std::shared_ptr<T>> SortedByPriority(const OrderComparator& comparator, std::vector<std::shared_ptr<T>> candidates)
  {
    return Detail::SortByResolvedPriority(comparator, std::move(candidates));
  }

  /// @brief Returns the components sorted by ascending priority.
  ///
  /// Same as the shared_ptr overload, for components owned elsewhere.
  template <typename T>
  std::vector<T*> SortedByPriority(const OrderComparator& comparator, std::vector<T*> candidates)
  {
    return Detail::SortByResolvedPriority(comparator, std::move(candidates));
  }

  /// @brief Returns the components sorted by ascending priority, using a comparator over the given registry and catalog.
  template <typename T>
  std::vector<std::shared_ptr<T>> SortedByPriority(const IComponentRegistry& registry, const ITypeCatalog& types,
                                                   std::vector<std::shared_ptr<T>> candidates)
  {
    return SortedByPriority(OrderComparator(registry, types), std::move(candidates));
  }
}

#endif
