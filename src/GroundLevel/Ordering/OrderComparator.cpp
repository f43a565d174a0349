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

#include <GroundLevel/Common/LogHelper.hpp>
#include <GroundLevel/Exception/OrderInvocationException.hpp>
#include <GroundLevel/Ordering/OrderComparator.hpp>
#include <fmt/format.h>
#include <array>
#include <exception>

namespace GroundLevel
{
  namespace
  {
    struct BoundProbe
    {
      const OrderProbe* pProbe;
      const void* pObject;
    };

    // Prefers the probe of the runtime type, which is exact, over the probe of the type the handle was created from
    BoundProbe SelectProbe(const ITypeCatalog& types, const CandidateRef& candidate)
    {
      const TypeDescriptor* pDescriptor = types.FindDescriptor(candidate.GetType());
      if (pDescriptor != nullptr)
      {
        return {&pDescriptor->GetProbe(), candidate.GetCompleteObject()};
      }
      return {&candidate.GetStaticProbe(), candidate.GetObject()};
    }
  }

  OrderComparator::OrderComparator(const IComponentRegistry& registry, const ITypeCatalog& types, const OrderComparatorConfig& config)
    : m_resolver(registry, types)
    , m_orderAnnotation(config.OrderAnnotationKind)
    , m_valueAttribute(config.ValueAttribute)
  {
  }

  OrderPriority OrderComparator::ResolveOrder(const CandidateRef& candidate) const
  {
    static constexpr std::array<OrderStrategy, 3> PrecedenceChain = {&OrderComparator::TryAnnotationOrder, &OrderComparator::TryOrderedInterface,
                                                                      &OrderComparator::TryOrderAccessor};
    if (!candidate.IsNull())
    {
      for (const OrderStrategy strategy : PrecedenceChain)
      {
        const std::optional<OrderPriority> priority = (this->*strategy)(candidate);
        if (priority.has_value())
        {
          return *priority;
        }
      }
    }
    return OrderPriority::LowestPrecedence();
  }

  std::strong_ordering OrderComparator::Compare(const CandidateRef& lhs, const CandidateRef& rhs) const
  {
    return ResolveOrder(lhs) <=> ResolveOrder(rhs);
  }

  std::optional<OrderPriority> OrderComparator::TryAnnotationOrder(const CandidateRef& candidate) const
  {
    const AttributeMap attributes = m_resolver.Resolve(m_orderAnnotation, candidate);
    const std::optional<int32_t> value = TryGetAttribute<int32_t>(attributes, m_valueAttribute);
    if (!value.has_value())
    {
      return std::nullopt;
    }
    LogHelper::GetLogger()->trace("OrderComparator: '{}' ordered by annotation with priority {}", candidate.GetType().name(), *value);
    return OrderPriority(*value);
  }

  std::optional<OrderPriority> OrderComparator::TryOrderedInterface(const CandidateRef& candidate) const
  {
    const BoundProbe bound = SelectProbe(m_resolver.GetTypes(), candidate);
    const IOrdered* pOrdered = bound.pProbe->AsOrdered(bound.pObject);
    if (pOrdered == nullptr)
    {
      return std::nullopt;
    }
    return OrderPriority(pOrdered->GetOrder());
  }

  std::optional<OrderPriority> OrderComparator::TryOrderAccessor(const CandidateRef& candidate) const
  {
    const BoundProbe bound = SelectProbe(m_resolver.GetTypes(), candidate);
    if (bound.pProbe->GetCapability() != OrderCapability::ExposesAccessor)
    {
      return std::nullopt;
    }

    try
    {
      return OrderPriority(bound.pProbe->InvokeAccessor(bound.pObject));
    }
    catch (const std::exception& ex)
    {
      LogHelper::GetLogger()->error("OrderComparator: GetOrder accessor of '{}' failed: {}", candidate.GetType().name(), ex.what());
      std::throw_with_nested(OrderInvocationException(fmt::format("GetOrder accessor of '{}' failed: {}", candidate.GetType().name(), ex.what())));
    }
    catch (...)
    {
      LogHelper::GetLogger()->error("OrderComparator: GetOrder accessor of '{}' failed with an unknown exception", candidate.GetType().name());
      std::throw_with_nested(OrderInvocationException(fmt::format("GetOrder accessor of '{}' failed", candidate.GetType().name())));
    }
  }
}
