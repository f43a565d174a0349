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
#include <GroundLevel/Ordering/OrderComparator.hpp>
#include <GroundLevel/Ordering/SortedByPriority.hpp>
#include <GroundLevel/Registry/ComponentRegistry.hpp>
#include <GroundLevel/Util/LockHelper.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>
#include <gtest/gtest.h>
#include <atomic>
#include <memory>
#include <shared_mutex>
#include <string>
#include <vector>
#include "../TestComponents.hpp"

namespace GroundLevel::Test
{
  namespace
  {
    constexpr int WorkerCount = 4;
    constexpr int JobCount = 64;

    ProducerMethodMetadata MakeOrderProducer(const std::string& methodName, const int32_t value)
    {
      ProducerMethodMetadata producer;
      producer.DeclaringTypeName = "TestConfiguration";
      producer.MethodName = methodName;
      producer.Annotations.Add(AnnotationKinds::Order(), {{"value", value}});
      return producer;
    }
  }

  class OrderComparatorConcurrencyTest : public ::testing::Test
  {
  protected:
    ComponentRegistry registry;
    TypeCatalog catalog;
    std::vector<std::shared_ptr<IComponent>> components;

    void SetUp() override
    {
      catalog.RegisterType<NamedComponent>();
      catalog.RegisterType<NamedAccessorComponent>();
      registry.RegisterComponent(RegistrationMetadata("annotated", typeid(NamedComponent), MakeOrderProducer("annotatedComponent", 2)));

      components.push_back(std::make_shared<NamedAccessorComponent>("accessor", 3));
      components.push_back(std::make_shared<NamedComponent>("annotated"));
      components.push_back(std::make_shared<NamedOrderedComponent>("ordered", 1));
    }

    static std::vector<std::string> NamesOf(const std::vector<std::shared_ptr<IComponent>>& sorted)
    {
      std::vector<std::string> names;
      for (const auto& component : sorted)
      {
        names.push_back(component->GetName());
      }
      return names;
    }
  };

  TEST_F(OrderComparatorConcurrencyTest, SharedComparator_SortsConsistentlyFromManyThreads)
  {
    const OrderComparator comparator(registry, catalog);
    const std::vector<std::string> expected{"ordered", "annotated", "accessor"};
    std::atomic<int> matchCount{0};

    boost::asio::thread_pool pool(WorkerCount);
    for (int i = 0; i < JobCount; ++i)
    {
      boost::asio::post(pool,
                        [&]()
                        {
                          if (NamesOf(SortedByPriority(comparator, components)) == expected)
                          {
                            ++matchCount;
                          }
                        });
    }
    pool.join();

    EXPECT_EQ(matchCount.load(), JobCount);
  }

  TEST_F(OrderComparatorConcurrencyTest, RegistryGuardedBySharedMutex_ReadersSeeCompleteRegistrations)
  {
    std::shared_mutex registryMutex;
    const OrderComparator comparator(registry, catalog);
    std::atomic<int> validCount{0};

    boost::asio::thread_pool pool(WorkerCount);
    for (int i = 0; i < JobCount; ++i)
    {
      if (i % 8 == 0)
      {
        boost::asio::post(pool,
                          [&, i]()
                          {
                            LockHelper::WithWriteLock(registryMutex,
                                                      [&]()
                                                      {
                                                        registry.RegisterComponent(
                                                          RegistrationMetadata("late" + std::to_string(i), typeid(PlainComponent)));
                                                      });
                          });
      }
      boost::asio::post(pool,
                        [&]()
                        {
                          const int32_t order = LockHelper::WithReadLock(
                            registryMutex, [&]() { return comparator.ResolveOrder(CandidateRef::Of(components[1])).GetValue(); });
                          if (order == 2)
                          {
                            ++validCount;
                          }
                        });
    }
    pool.join();

    EXPECT_EQ(validCount.load(), JobCount);
    EXPECT_EQ(registry.GetComponentNames().size(), 1u + JobCount / 8);
  }
}
