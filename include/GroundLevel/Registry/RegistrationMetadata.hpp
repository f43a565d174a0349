#ifndef GROUND_LEVEL_REGISTRY_REGISTRATIONMETADATA_HPP
#define GROUND_LEVEL_REGISTRY_REGISTRATIONMETADATA_HPP
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

#include <GroundLevel/Metadata/ProducerMethodMetadata.hpp>
#include <optional>
#include <string>
#include <typeindex>
#include <typeinfo>
#include <utility>

namespace GroundLevel
{
  /// @brief Read-only record describing how a component was registered.
  ///
  /// Records are owned by the registry and shared as std::shared_ptr<const RegistrationMetadata>, so a
  /// record obtained from IComponentRegistry::MetadataFor stays valid even if the component is removed later.
  struct RegistrationMetadata
  {
    /// @brief The registration identity. Unique within a registry.
    std::string Name;

    /// @brief The concrete type of the registered object.
    std::type_index ObjectType{typeid(void)};

    /// @brief The factory method that produced the object, if any.
    std::optional<ProducerMethodMetadata> Producer;

    RegistrationMetadata() = default;

    RegistrationMetadata(std::string name, std::type_index objectType)
      : Name(std::move(name))
      , ObjectType(objectType)
    {
    }

    RegistrationMetadata(std::string name, std::type_index objectType, ProducerMethodMetadata producer)
      : Name(std::move(name))
      , ObjectType(objectType)
      , Producer(std::move(producer))
    {
    }
  };
}

#endif
