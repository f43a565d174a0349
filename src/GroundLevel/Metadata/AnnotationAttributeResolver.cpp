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
#include <GroundLevel/Metadata/AnnotationAttributeResolver.hpp>
#include <memory>

namespace GroundLevel
{
  namespace
  {
    bool HasProducerAnnotation(const RegistrationMetadata& metadata, const AnnotationKind& kind)
    {
      return metadata.Producer.has_value() && metadata.Producer->IsAnnotated(kind);
    }

    // Finds the first live registration of the type whose producer method carries the annotation
    std::shared_ptr<const RegistrationMetadata> FindAnnotatedProducer(const IComponentRegistry& registry, const std::type_index& type,
                                                                      const AnnotationKind& kind)
    {
      for (const auto& name : registry.LookupByType(type))
      {
        // LookupByType may report names of partially constructed or removed registrations
        if (!registry.IsRegistered(name))
        {
          continue;
        }
        auto metadata = registry.MetadataFor(name);
        if (HasProducerAnnotation(*metadata, kind))
        {
          return metadata;
        }
      }
      return nullptr;
    }
  }

  AnnotationAttributeResolver::AnnotationAttributeResolver(const IComponentRegistry& registry, const ITypeCatalog& types) noexcept
    : m_pRegistry(&registry)
    , m_pTypes(&types)
  {
  }

  AttributeMap AnnotationAttributeResolver::Resolve(const AnnotationKind& kind, const CandidateRef& candidate) const
  {
    if (candidate.IsNull())
    {
      return {};
    }

    const auto logger = LogHelper::GetLogger();

    // Load annotation attributes from the component type
    AttributeMap result = m_pTypes->FindAnnotation(candidate.GetType(), kind).value_or(AttributeMap());

    // Load annotation attributes from the producer method
    const auto producerMetadata = FindAnnotatedProducer(*m_pRegistry, candidate.GetType(), kind);
    if (producerMetadata)
    {
      const auto producerAttributes = producerMetadata->Producer->GetAnnotationAttributes(kind);
      if (producerAttributes.has_value())
      {
        logger->trace("AnnotationAttributeResolver::Resolve: '{}' on type '{}' overridden by producer method '{}' of component '{}'",
                      kind.GetName(), candidate.GetType().name(), producerMetadata->Producer->MethodName, producerMetadata->Name);
        MergeAttributes(result, *producerAttributes);
      }
    }

    logger->trace("AnnotationAttributeResolver::Resolve: resolved {} attribute(s) of '{}' for type '{}'", result.size(), kind.GetName(),
                  candidate.GetType().name());
    return result;
  }

  std::vector<std::string> ComponentsAnnotatedWith(const IComponentRegistry& registry, const std::vector<std::string>& names,
                                                   const AnnotationKind& kind)
  {
    std::vector<std::string> result;
    for (const auto& name : names)
    {
      if (registry.IsRegistered(name) && HasProducerAnnotation(*registry.MetadataFor(name), kind))
      {
        result.push_back(name);
      }
    }
    return result;
  }
}
