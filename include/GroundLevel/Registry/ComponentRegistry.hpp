#ifndef GROUND_LEVEL_REGISTRY_COMPONENTREGISTRY_HPP
#define GROUND_LEVEL_REGISTRY_COMPONENTREGISTRY_HPP
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

#include <GroundLevel/Registry/IComponentRegistry.hpp>
#include <GroundLevel/Registry/RegistrationMetadata.hpp>
#include <memory>
#include <string>
#include <typeindex>
#include <unordered_map>
#include <vector>

namespace GroundLevel
{
  /// @brief In-memory implementation of IComponentRegistry.
  ///
  /// ComponentRegistry stores registration metadata keyed by registration name and keeps the registration
  /// order, which is the iteration order reported by LookupByType and GetComponentNames.
  ///
  /// The registry is not internally synchronized. Guard it externally (see LockHelper) if it is mutated
  /// while other threads read it.
  class ComponentRegistry : public IComponentRegistry
  {
  private:
    /// @brief Map of registration name to metadata.
    std::unordered_map<std::string, std::shared_ptr<const RegistrationMetadata>> m_registrations;

    /// @brief Registration names in registration order.
    std::vector<std::string> m_names;

  public:
    ComponentRegistry() = default;
    ~ComponentRegistry() override = default;

    ComponentRegistry(const ComponentRegistry&) = delete;
    ComponentRegistry& operator=(const ComponentRegistry&) = delete;
    ComponentRegistry(ComponentRegistry&&) = delete;
    ComponentRegistry& operator=(ComponentRegistry&&) = delete;

    /// @brief Registers a component.
    ///
    /// @param metadata The registration metadata. The name is used as the unique key.
    ///
    /// @throws InvalidComponentRegistrationException if the name is empty
    /// @throws DuplicateComponentRegistrationException if the name is already registered
    void RegisterComponent(RegistrationMetadata metadata);

    /// @brief Removes a registration.
    ///
    /// Metadata previously obtained via MetadataFor stays valid.
    /// @return true if the registration existed and was removed.
    bool RemoveComponent(const std::string& name);

    /// @brief Gets all registration names in registration order.
    std::vector<std::string> GetComponentNames() const;

    std::vector<std::string> LookupByType(const std::type_index& type) const override;
    bool IsRegistered(const std::string& name) const override;
    std::shared_ptr<const RegistrationMetadata> MetadataFor(const std::string& name) const override;
  };

}

#endif
