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
#include <GroundLevel/Metadata/TypeCatalog.hpp>
#include <GroundLevel/Ordering/IOrdered.hpp>
#include <GroundLevel/Ordering/OrderComparator.hpp>
#include <GroundLevel/Ordering/SortedByPriority.hpp>
#include <GroundLevel/Registry/ComponentRegistry.hpp>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>
#include <cstdlib>
#include <exception>
#include <memory>
#include <string>
#include <vector>

namespace
{
  class IRequestFilter
  {
  public:
    virtual ~IRequestFilter() = default;
    virtual std::string GetName() const = 0;
  };

  // Ordered through the annotation on its type, overridden by its producer method
  class AuthenticationFilter final : public IRequestFilter
  {
  public:
    std::string GetName() const override
    {
      return "authentication";
    }
  };

  class CompressionFilter final
    : public IRequestFilter
    , public GroundLevel::IOrdered
  {
  public:
    std::string GetName() const override
    {
      return "compression";
    }

    int32_t GetOrder() const override
    {
      return 3;
    }
  };

  // Does not implement IOrdered, but looks like it does
  class MetricsFilter final : public IRequestFilter
  {
  public:
    std::string GetName() const override
    {
      return "metrics";
    }

    int32_t GetOrder() const
    {
      return 7;
    }
  };

  class AuditFilter final : public IRequestFilter
  {
  public:
    std::string GetName() const override
    {
      return "audit";
    }
  };

  // spdlog::set_level updates every registered logger, including the library logger if it already exists
  void ConfigureLogging()
  {
    const char* pLevel = std::getenv("GROUND_LEVEL_LOG_LEVEL");
    spdlog::set_level(pLevel != nullptr ? spdlog::level::from_str(pLevel) : spdlog::level::info);
  }
}

int main()
{
  ConfigureLogging();

  try
  {
    using namespace GroundLevel;

    TypeCatalog catalog;
    catalog.RegisterType<AuthenticationFilter>(AnnotationSet().Add(AnnotationKinds::Order(), {{"value", 10}}));
    catalog.RegisterType<CompressionFilter>();
    catalog.RegisterType<MetricsFilter>();
    catalog.RegisterType<AuditFilter>();

    ProducerMethodMetadata authenticationProducer;
    authenticationProducer.DeclaringTypeName = "WebConfiguration";
    authenticationProducer.MethodName = "authenticationFilter";
    authenticationProducer.Annotations.Add(AnnotationKinds::Order(), {{"value", 5}});

    ComponentRegistry registry;
    registry.RegisterComponent(RegistrationMetadata("authenticationFilter", typeid(AuthenticationFilter), std::move(authenticationProducer)));
    registry.RegisterComponent(RegistrationMetadata("compressionFilter", typeid(CompressionFilter)));
    registry.RegisterComponent(RegistrationMetadata("metricsFilter", typeid(MetricsFilter)));
    registry.RegisterComponent(RegistrationMetadata("auditFilter", typeid(AuditFilter)));

    std::vector<std::shared_ptr<IRequestFilter>> filters{std::make_shared<AuditFilter>(), std::make_shared<AuthenticationFilter>(),
                                                         std::make_shared<MetricsFilter>(), std::make_shared<CompressionFilter>()};

    const OrderComparator comparator(registry, catalog);
    const auto sorted = SortedByPriority(comparator, filters);

    std::vector<std::string> names;
    for (const auto& filter : sorted)
    {
      names.push_back(fmt::format("{}({})", filter->GetName(), comparator.ResolveOrder(CandidateRef::Of(filter)).GetValue()));
    }
    spdlog::info("Filter chain: {}", fmt::join(names, " -> "));

    const auto annotated = ComponentsAnnotatedWith(registry, registry.GetComponentNames(), AnnotationKinds::Order());
    spdlog::info("Components with an ordering producer method: {}", fmt::join(annotated, ", "));
  }
  catch (const std::exception& ex)
  {
    spdlog::critical("Exception: {}", ex.what());
    return 1;
  }
  return 0;
}
