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
#include <GroundLevel/Exception/TypeCatalogException.hpp>
#include <GroundLevel/Metadata/TypeCatalog.hpp>
#include <fmt/format.h>
#include <algorithm>

namespace GroundLevel
{
  void TypeCatalog::RegisterType(TypeDescriptor descriptor)
  {
    const auto logger = LogHelper::GetLogger();
    if (m_descriptors.find(descriptor.GetType()) != m_descriptors.end())
    {
      logger->error("TypeCatalog::RegisterType: type '{}' is already registered", descriptor.GetName());
      throw DuplicateTypeRegistrationException(fmt::format("Type '{}' is already registered", descriptor.GetName()));
    }

    logger->debug("TypeCatalog::RegisterType: registering type '{}' with {} base type(s)", descriptor.GetName(), descriptor.GetBaseTypes().size());
    const std::type_index type = descriptor.GetType();
    m_descriptors.emplace(type, std::move(descriptor));
  }

  std::optional<AttributeMap> TypeCatalog::FindAnnotation(const std::type_index& type, const AnnotationKind& kind) const
  {
    std::vector<std::type_index> visited;
    return FindAnnotationRecursive(type, kind, visited);
  }

  const TypeDescriptor* TypeCatalog::FindDescriptor(const std::type_index& type) const
  {
    const auto itrFind = m_descriptors.find(type);
    return itrFind != m_descriptors.end() ? &itrFind->second : nullptr;
  }

  std::optional<AttributeMap> TypeCatalog::FindAnnotationRecursive(const std::type_index& type, const AnnotationKind& kind,
                                                                   std::vector<std::type_index>& rVisited) const
  {
    // Guard against cyclic base type declarations
    if (std::find(rVisited.begin(), rVisited.end(), type) != rVisited.end())
    {
      return std::nullopt;
    }
    rVisited.push_back(type);

    const TypeDescriptor* pDescriptor = FindDescriptor(type);
    if (pDescriptor == nullptr)
    {
      return std::nullopt;
    }

    auto attributes = pDescriptor->GetAnnotations().TryGetAttributes(kind);
    if (attributes.has_value())
    {
      return attributes;
    }

    for (const auto& baseType : pDescriptor->GetBaseTypes())
    {
      attributes = FindAnnotationRecursive(baseType, kind, rVisited);
      if (attributes.has_value())
      {
        return attributes;
      }
    }
    return std::nullopt;
  }
}
