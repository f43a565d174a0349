#ifndef GROUND_LEVEL_ORDERING_ORDERPROBE_HPP
#define GROUND_LEVEL_ORDERING_ORDERPROBE_HPP
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

#include <GroundLevel/Ordering/IOrdered.hpp>
#include <concepts>
#include <cstdint>
#include <type_traits>

namespace GroundLevel
{
  /// @brief How a type exposes its ordering priority.
  enum class OrderCapability
  {
    /// @brief The type implements IOrdered.
    DeclaresInterface,
    /// @brief The type does not implement IOrdered but has a public, zero-argument `int32_t GetOrder()`.
    ExposesAccessor,
    /// @brief Neither.
    None
  };

  /// @brief Satisfied by types with a public, zero-argument GetOrder() returning exactly int32_t.
  ///
  /// The accessor does not need to be const-qualified.
  template <typename T>
  concept HasOrderAccessor = requires(T& value) {
    {
      value.GetOrder()
    } -> std::same_as<int32_t>;
  };

  /// @brief Satisfied by types whose GetOrder accessor can be called on a const object.
  template <typename T>
  concept HasConstOrderAccessor = requires(const T& value) {
    {
      value.GetOrder()
    } -> std::same_as<int32_t>;
  };

  /// @brief Type-erased ordering capability of one C++ type, computed at compile time.
  ///
  /// A probe is bound to a type T and operates on `const void*` pointers that point to a T object.
  /// Passing a pointer to an object of another type is undefined behaviour.
  ///
  /// Example usage:
  /// @code
  /// constexpr OrderProbe probe = OrderProbe::For<MyComponent>();
  /// if (probe.GetCapability() == OrderCapability::ExposesAccessor)
  /// {
  ///   int32_t order = probe.InvokeAccessor(&component);
  /// }
  /// @endcode
  class OrderProbe
  {
    using AsOrderedFunction = const IOrdered* (*)(const void*);
    using AccessorFunction = int32_t (*)(const void*);

    OrderCapability m_capability{OrderCapability::None};
    AsOrderedFunction m_asOrdered{nullptr};
    AccessorFunction m_accessor{nullptr};

    constexpr OrderProbe(const OrderCapability capability, const AsOrderedFunction asOrdered, const AccessorFunction accessor) noexcept
      : m_capability(capability)
      , m_asOrdered(asOrdered)
      , m_accessor(accessor)
    {
    }

  public:
    /// @brief A probe for a type without any ordering capability.
    constexpr OrderProbe() noexcept = default;

    /// @brief Creates the probe for T.
    ///
    /// When T is polymorphic but does not derive from IOrdered, the IOrdered check is deferred to a
    /// dynamic_cast, since a derived object may still implement the interface.
    template <typename T>
    static constexpr OrderProbe For() noexcept
    {
      using TValue = std::remove_cv_t<T>;

      AsOrderedFunction asOrdered = nullptr;
      if constexpr (std::is_base_of_v<IOrdered, TValue>)
      {
        asOrdered = [](const void* pObject) -> const IOrdered* { return static_cast<const TValue*>(pObject); };
      }
      else if constexpr (std::is_polymorphic_v<TValue>)
      {
        asOrdered = [](const void* pObject) -> const IOrdered* { return dynamic_cast<const IOrdered*>(static_cast<const TValue*>(pObject)); };
      }

      if constexpr (std::is_base_of_v<IOrdered, TValue>)
      {
        return OrderProbe(OrderCapability::DeclaresInterface, asOrdered, nullptr);
      }
      else if constexpr (HasConstOrderAccessor<TValue>)
      {
        return OrderProbe(OrderCapability::ExposesAccessor, asOrdered,
                          [](const void* pObject) -> int32_t { return static_cast<const TValue*>(pObject)->GetOrder(); });
      }
      else if constexpr (HasOrderAccessor<TValue>)
      {
        // The accessor is not const-qualified
        return OrderProbe(OrderCapability::ExposesAccessor, asOrdered,
                          [](const void* pObject) -> int32_t { return const_cast<TValue*>(static_cast<const TValue*>(pObject))->GetOrder(); });
      }
      else
      {
        return OrderProbe(OrderCapability::None, asOrdered, nullptr);
      }
    }

    /// @brief Gets the capability declared by the probed type.
    [[nodiscard]] constexpr OrderCapability GetCapability() const noexcept
    {
      return m_capability;
    }

    /// @brief Gets the IOrdered interface of an object.
    ///
    /// @param pObject Pointer to an object of the probed type. May be null.
    /// @return The interface, or nullptr if the object does not implement IOrdered.
    [[nodiscard]] const IOrdered* AsOrdered(const void* pObject) const
    {
      if (pObject == nullptr || m_asOrdered == nullptr)
      {
        return nullptr;
      }
      return m_asOrdered(pObject);
    }

    /// @brief Checks whether the probed type exposes a duck-typed GetOrder accessor.
    [[nodiscard]] constexpr bool HasAccessor() const noexcept
    {
      return m_accessor != nullptr;
    }

    /// @brief Invokes the duck-typed GetOrder accessor.
    ///
    /// @param pObject Pointer to an object of the probed type. Must not be null.
    /// @pre HasAccessor() is true.
    /// Exceptions thrown by the accessor propagate unmodified.
    int32_t InvokeAccessor(const void* pObject) const
    {
      return m_accessor(pObject);
    }
  };
}

#endif
