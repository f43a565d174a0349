#ifndef GROUND_LEVEL_ORDERING_CANDIDATEREF_HPP
#define GROUND_LEVEL_ORDERING_CANDIDATEREF_HPP
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

#include <GroundLevel/Ordering/OrderProbe.hpp>
#include <cstddef>
#include <memory>
#include <type_traits>
#include <typeindex>
#include <typeinfo>

namespace GroundLevel
{
  /// @brief Non-owning handle to an object whose ordering priority is resolved.
  ///
  /// The handle records the object's runtime type and the ordering probe of the static type it was created
  /// from. For polymorphic types the runtime type is the dynamic type of the object, and the address of the
  /// most-derived object is recorded as well so a probe for the runtime type can be applied to it.
  ///
  /// A default constructed handle, or one created from a null pointer, is the null candidate.
  /// The referenced object must outlive the handle.
  class CandidateRef
  {
    const void* m_pObject{nullptr};
    const void* m_pCompleteObject{nullptr};
    std::type_index m_type{typeid(void)};
    OrderProbe m_staticProbe;

  public:
    /// @brief Creates the null candidate.
    CandidateRef() noexcept = default;

    /// @brief Creates a handle to an object.
    template <typename T>
    static CandidateRef Of(const T& object)
    {
      CandidateRef candidate;
      candidate.m_pObject = static_cast<const void*>(&object);
      if constexpr (std::is_polymorphic_v<T>)
      {
        candidate.m_pCompleteObject = dynamic_cast<const void*>(&object);
        candidate.m_type = std::type_index(typeid(object));
      }
      else
      {
        candidate.m_pCompleteObject = candidate.m_pObject;
        candidate.m_type = std::type_index(typeid(T));
      }
      candidate.m_staticProbe = OrderProbe::For<T>();
      return candidate;
    }

    /// @brief Creates a handle to the pointed-to object, or the null candidate if pObject is null.
    template <typename T>
    static CandidateRef Of(T* pObject)
    {
      return pObject != nullptr ? Of(*pObject) : CandidateRef();
    }

    static CandidateRef Of(std::nullptr_t) noexcept
    {
      return {};
    }

    /// @brief Creates a handle to the pointed-to object, or the null candidate if object is null.
    template <typename T>
    static CandidateRef Of(const std::shared_ptr<T>& object)
    {
      return Of(object.get());
    }

    [[nodiscard]] bool IsNull() const noexcept
    {
      return m_pObject == nullptr;
    }

    /// @brief Gets the runtime type of the referenced object (typeid(void) for the null candidate).
    [[nodiscard]] const std::type_index& GetType() const noexcept
    {
      return m_type;
    }

    /// @brief Gets the address of the object as the static type the handle was created from.
    [[nodiscard]] const void* GetObject() const noexcept
    {
      return m_pObject;
    }

    /// @brief Gets the address of the most-derived object.
    [[nodiscard]] const void* GetCompleteObject() const noexcept
    {
      return m_pCompleteObject;
    }

    /// @brief Gets the probe of the static type. Applies to GetObject().
    [[nodiscard]] const OrderProbe& GetStaticProbe() const noexcept
    {
      return m_staticProbe;
    }
  };
}

#endif
