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

#include <GroundLevel/Metadata/TypeCatalog.hpp>
#include <GroundLevel/Ordering/SortedByPriority.hpp>
#include <GroundLevel/Registry/ComponentRegistry.hpp>
#include <gtest/gtest.h>
#include <memory>
#include <string>
#include <utility>
#include <vector>
#include "../TestComponents.hpp"

namespace GroundLevel::Test
{
  namespace
  {
    // Counts how often its priority was queried
    class CountingComponent : public IComponent
    {
      std::string m_name;
      int32_t m_order;
      mutable int m_queryCount{0};

    public:
      CountingComponent(std::string name, const int32_t order)
        : m_name(std::move(name))
        , m_order(order)
      {
      }

      std::string GetName() const override
      {
        return m_name;
      }

      int32_t GetOrder() const
      {
        ++m_queryCount;
        return m_order;
      }

      int GetQueryCount() const
      {
        return m_queryCount;
      }
    };

    std::vector<std::string> NamesOf(const std::vector<std::shared_ptr<IComponent>>& components)
    {
      std::vector<std::string> names;
      for (const auto& component : components)
      {
        names.push_back(component ? component->GetName() : "<null>");
      }
      return names;
    }
  }

  class SortedByPriorityTest : public ::testing::Test
  {
  protected:
    ComponentRegistry registry;
    TypeCatalog catalog;
  };

  TEST_F(SortedByPriorityTest, EmptyInput_ReturnsEmpty)
  {
    const OrderComparator comparator(registry, catalog);
    EXPECT_TRUE(SortedByPriority(comparator, std::vector<std::shared_ptr<IComponent>>()).empty());
  }

  TEST_F(SortedByPriorityTest, SortsAscendingAcrossAllSignals)
  {
    catalog.RegisterType<NamedComponent>();
    catalog.RegisterType<NamedAccessorComponent>();
    registry.RegisterComponent(RegistrationMetadata("annotated", typeid(NamedComponent), [] {
      ProducerMethodMetadata producer;
      producer.DeclaringTypeName = "TestConfiguration";
      producer.MethodName = "annotatedComponent";
      producer.Annotations.Add(AnnotationKinds::Order(), {{"value", 5}});
      return producer;
    }()));

    const OrderComparator comparator(registry, catalog);
    const std::vector<std::shared_ptr<IComponent>> components{
      std::make_shared<NamedAccessorComponent>("accessor", 7), std::make_shared<NamedComponent>("annotated"),
      std::make_shared<NamedOrderedComponent>("ordered", 3)};

    const std::vector<std::string> expected{"ordered", "annotated", "accessor"};
    EXPECT_EQ(NamesOf(SortedByPriority(comparator, components)), expected);
  }

  TEST_F(SortedByPriorityTest, EqualPriorities_KeepInputOrder)
  {
    const OrderComparator comparator(registry, catalog);
    const std::vector<std::shared_ptr<IComponent>> components{
      std::make_shared<NamedOrderedComponent>("b", 1), std::make_shared<NamedOrderedComponent>("first", 0),
      std::make_shared<NamedOrderedComponent>("a", 1), std::make_shared<NamedOrderedComponent>("c", 1)};

    const std::vector<std::string> expected{"first", "b", "a", "c"};
    EXPECT_EQ(NamesOf(SortedByPriority(comparator, components)), expected);
  }

  TEST_F(SortedByPriorityTest, UnorderedAndNullComponentsSortLast)
  {
    const OrderComparator comparator(registry, catalog);
    const std::vector<std::shared_ptr<IComponent>> components{nullptr, std::make_shared<NamedComponent>("plain"),
                                                              std::make_shared<NamedOrderedComponent>("ordered", 100)};

    const std::vector<std::string> expected{"ordered", "<null>", "plain"};
    EXPECT_EQ(NamesOf(SortedByPriority(comparator, components)), expected);
  }

  TEST_F(SortedByPriorityTest, ResolvesEachPriorityOnce)
  {
    catalog.RegisterType<CountingComponent>();
    const auto first = std::make_shared<CountingComponent>("first", 2);
    const auto second = std::make_shared<CountingComponent>("second", 1);
    const auto third = std::make_shared<CountingComponent>("third", 3);

    const OrderComparator comparator(registry, catalog);
    const auto sorted = SortedByPriority(comparator, std::vector<std::shared_ptr<IComponent>>{first, second, third});

    const std::vector<std::string> expected{"second", "first", "third"};
    EXPECT_EQ(NamesOf(sorted), expected);
    EXPECT_EQ(first->GetQueryCount(), 1);
    EXPECT_EQ(second->GetQueryCount(), 1);
    EXPECT_EQ(third->GetQueryCount(), 1);
  }

  TEST_F(SortedByPriorityTest, RawPointers_AreSorted)
  {
    const OrderedComponent low(-5);
    const OrderedComponent high(5);
    const OrderedComponent middle(0);

    const OrderComparator comparator(registry, catalog);
    const auto sorted = SortedByPriority(comparator, std::vector<const OrderedComponent*>{&high, &low, &middle});

    ASSERT_EQ(sorted.size(), 3u);
    EXPECT_EQ(sorted[0], &low);
    EXPECT_EQ(sorted[1], &middle);
    EXPECT_EQ(sorted[2], &high);
  }

  TEST_F(SortedByPriorityTest, RegistryOverload_UsesDefaultConfiguration)
  {
    catalog.RegisterType<NamedComponent>(AnnotationSet().Add(AnnotationKinds::Order(), {{"value", -1}}));
    const std::vector<std::shared_ptr<IComponent>> components{std::make_shared<NamedOrderedComponent>("ordered", 0),
                                                              std::make_shared<NamedComponent>("annotated")};

    const std::vector<std::string> expected{"annotated", "ordered"};
    EXPECT_EQ(NamesOf(SortedByPriority(registry, catalog, components)), expected);
  }

  // Two filters, A annotated 2 and B annotated 1, end up as [B, A]
  TEST_F(SortedByPriorityTest, AnnotatedFilters_AreOrderedByAnnotationValue)
  {
    AnnotationSet annotations;
    annotations.Add(AnnotationKinds::Order(), {{"value", 2}});
    catalog.RegisterType<AnnotatedComponent>(annotations);
    annotations = AnnotationSet();
    annotations.Add(AnnotationKinds::Order(), {{"value", 1}});
    catalog.RegisterType<OtherAnnotatedComponent>(annotations);

    const auto filterA = std::make_shared<AnnotatedComponent>();
    const auto filterB = std::make_shared<OtherAnnotatedComponent>();
    const OrderComparator comparator(registry, catalog);

    EXPECT_TRUE(comparator(CandidateRef::Of(filterB), CandidateRef::Of(filterA)));
    EXPECT_FALSE(comparator(CandidateRef::Of(filterA), CandidateRef::Of(filterB)));
  }
}
