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
#include <GroundLevel/Exception/ComponentRegistryException.hpp>
#include <GroundLevel/Registry/ComponentRegistry.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <utility>

namespace GroundLevel
{
  void ComponentRegistry::RegisterComponent(RegistrationMetadata metadata)
  {
    const auto logger = LogHelper::GetLogger();

    // Validate name is not empty
    if (metadata.Name.empty())
    {
      logger->error("ComponentRegistry::RegisterComponent: registration name is empty");
      throw InvalidComponentRegistrationException("Cannot register a component with an empty name");
    }

    // Check if this name is already registered
    if (m_registrations.find(metadata.Name) != m_registrations.end())
    {
      logger->error("ComponentRegistry::RegisterComponent: component '{}' is already registered", metadata.Name);
      throw DuplicateComponentRegistrationException(fmt::format("Component '{}' is already registered", metadata.Name));
    }

    logger->debug("ComponentRegistry::RegisterComponent: registering component '{}' of type '{}' (producer method: {})", metadata.Name,
                  metadata.ObjectType.name(), metadata.Producer.has_value() ? metadata.Producer->MethodName : std::string("none"));

    std::string name = metadata.Name;
    m_registrations.emplace(name, std::make_shared<RegistrationMetadata>(std::move(metadata)));
    m_names.push_back(std::move(name));
  }

  bool ComponentRegistry::RemoveComponent(const std::string& name)
  {
    if (m_registrations.erase(name) == 0u)
    {
      return false;
    }
    m_names.erase(std::remove(m_names.begin(), m_names.end(), name), m_names.end());
    LogHelper::GetLogger()->debug("ComponentRegistry::RemoveComponent: removed component '{}'", name);
    return true;
  }

  std::vector<std::string> ComponentRegistry::GetComponentNames() const
  {
    return m_names;
  }

  std::vector<std::string> ComponentRegistry::LookupByType(const std::type_index& type) const
  {
    std::vector<std::string> result;
    for (const auto& name : m_names)
    {
      const auto itrFind = m_registrations.find(name);
      if (itrFind != m_registrations.end() && itrFind->second->ObjectType == type)
      {
        result.push_back(name);
      }
    }
    return result;
  }

  bool ComponentRegistry::IsRegistered(const std::string& name) const
  {
    return m_registrations.find(name) != m_registrations.end();
  }

  std::shared_ptr<const RegistrationMetadata> ComponentRegistry::MetadataFor(const std::string& name) const
  {
    const auto itrFind = m_registrations.find(name);
    if (itrFind == m_registrations.end())
    {
      LogHelper::GetLogger()->error("ComponentRegistry::MetadataFor: component '{}' is not registered", name);
      throw UnknownComponentException(fmt::format("Component '{}' is not registered", name));
    }
    return itrFind->second;
  }
}
