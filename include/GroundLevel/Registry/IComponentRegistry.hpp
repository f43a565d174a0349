#ifndef GROUND_LEVEL_REGISTRY_ICOMPONENTREGISTRY_HPP
#define GROUND_LEVEL_REGISTRY_ICOMPONENTREGISTRY_HPP
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

#include <GroundLevel/Registry/RegistrationMetadata.hpp>
#include <memory>
#include <string>
#include <typeindex>
#include <vector>

namespace GroundLevel
{
  /// @brief Read-only query interface over the registrations of a component container.
  ///
  /// The ordering engine only reads through this interface. Implementations are not required to be
  /// thread-safe; callers must not mutate the registry while a sort that reads it is in progress.
  class IComponentRegistry
  {
  public:
    virtual ~IComponentRegistry() = default;

    /// @brief Looks up the names of all registrations whose object type is the given type.
    ///
    /// @param type The concrete object type.
    /// @return The matching registration names, in registry iteration order. Empty if there are none.
    virtual std::vector<std::string> LookupByType(const std::type_index& type) const = 0;

    /// @brief Checks whether a registration with the given name exists.
    ///
    /// @param name The registration identity.
    /// @return true if the name is registered.
    virtual bool IsRegistered(const std::string& name) const = 0;

    /// @brief Gets the metadata of a registration.
    ///
    /// @param name The registration identity.
    /// @return The registration metadata. Never null.
    /// @throws UnknownComponentException if the name is not registered.
    virtual std::shared_ptr<const RegistrationMetadata> MetadataFor(const std::string& name) const = 0;
  };

}

#endif
