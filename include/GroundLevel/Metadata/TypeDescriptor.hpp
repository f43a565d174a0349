#ifndef GROUND_LEVEL_METADATA_TYPEDESCRIPTOR_HPP
#define GROUND_LEVEL_METADATA_TYPEDESCRIPTOR_HPP
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

#include <GroundLevel/Metadata/AnnotationSet.hpp>
#include <GroundLevel/Ordering/OrderProbe.hpp>
#include <string>
#include <typeindex>
#include <typeinfo>
#include <utility>
#include <vector>

namespace GroundLevel
{
  /// @brief Class-level metadata of a C++ type registered in a type catalog.
  ///
  /// A descriptor can only be created through For<T>(), which binds the type and its ordering probe together.
  class TypeDescriptor
  {
    std::type_index m_type;
    std::string m_name;
    OrderProbe m_probe;
    AnnotationSet m_annotations;
    std::vector<std::type_index> m_baseTypes;

    TypeDescriptor(const std::type_index& type, std::string name, const OrderProbe& probe, AnnotationSet annotations,
                   std::vector<std::type_index> baseTypes)
      : m_type(type)
      , m_name(std::move(name))
      , m_probe(probe)
      , m_annotations(std::move(annotations))
      , m_baseTypes(std::move(baseTypes))
    {
    }

  public:
    /// @brief Creates the descriptor of T.
    ///
    /// @param name Human readable type name used in log messages.
    /// @param annotations Annotations declared on T itself.
    /// @param baseTypes Declared base types, searched in order when an annotation is not declared on T itself.
    template <typename T>
    static TypeDescriptor For(std::string name = typeid(T).name(), AnnotationSet annotations = {}, std::vector<std::type_index> baseTypes = {})
    {
      return TypeDescriptor(std::type_index(typeid(T)), std::move(name), OrderProbe::For<T>(), std::move(annotations), std::move(baseTypes));
    }

    const std::type_index& GetType() const noexcept
    {
      return m_type;
    }

    const std::string& GetName() const noexcept
    {
      return m_name;
    }

    /// @brief Ordering capability of the type. Applies to pointers to the most-derived object.
    const OrderProbe& GetProbe() const noexcept
    {
      return m_probe;
    }

    const AnnotationSet& GetAnnotations() const noexcept
    {
      return m_annotations;
    }

    const std::vector<std::type_index>& GetBaseTypes() const noexcept
    {
      return m_baseTypes;
    }
  };
}

#endif
