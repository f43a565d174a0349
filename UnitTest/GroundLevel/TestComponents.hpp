#ifndef GROUND_LEVEL_UNITTEST_TESTCOMPONENTS_HPP
#define GROUND_LEVEL_UNITTEST_TESTCOMPONENTS_HPP
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
#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>

namespace GroundLevel::Test
{
  // No ordering signal at all
  struct PlainComponent
  {
    int Payload{0};
  };

  // Receives its priority from annotations in the tests
  struct AnnotatedComponent
  {
  };

  // Second annotated type, used for multiple registrations
  struct OtherAnnotatedComponent
  {
  };

  class OrderedComponent : public IOrdered
  {
    int32_t m_order;

  public:
    explicit OrderedComponent(const int32_t order)
      : m_order(order)
    {
    }

    int32_t GetOrder() const override
    {
      return m_order;
    }
  };

  // Looks like IOrdered without implementing it
  class AccessorComponent
  {
    int32_t m_order;

  public:
    explicit AccessorComponent(const int32_t order)
      : m_order(order)
    {
    }

    int32_t GetOrder() const
    {
      return m_order;
    }
  };

  // Accessor without const qualification
  class NonConstAccessorComponent
  {
    int32_t m_order;
    int m_callCount{0};

  public:
    explicit NonConstAccessorComponent(const int32_t order)
      : m_order(order)
    {
    }

    int32_t GetOrder()
    {
      ++m_callCount;
      return m_order;
    }

    int GetCallCount() const
    {
      return m_callCount;
    }
  };

  class WideAccessorComponent
  {
  public:
    int64_t GetOrder() const
    {
      return 7;
    }
  };

  class StringAccessorComponent
  {
  public:
    std::string GetOrder() const
    {
      return "7";
    }
  };

  class PrivateAccessorComponent
  {
    int32_t GetOrder() const
    {
      return 7;
    }

  public:
    int32_t Peek() const
    {
      return GetOrder();
    }
  };

  class ParameterAccessorComponent
  {
  public:
    int32_t GetOrder(const int32_t offset) const
    {
      return offset;
    }
  };

  class ThrowingAccessorComponent
  {
  public:
    int32_t GetOrder() const
    {
      throw std::runtime_error("order not available");
    }
  };

  class ThrowingOrderedComponent : public IOrdered
  {
  public:
    int32_t GetOrder() const override
    {
      throw std::runtime_error("order not available");
    }
  };

  // Polymorphic hierarchy, handled through the base class
  class IComponent
  {
  public:
    virtual ~IComponent() = default;
    virtual std::string GetName() const = 0;
  };

  class NamedComponent : public IComponent
  {
    std::string m_name;

  public:
    explicit NamedComponent(std::string name)
      : m_name(std::move(name))
    {
    }

    std::string GetName() const override
    {
      return m_name;
    }
  };

  class NamedOrderedComponent
    : public NamedComponent
    , public IOrdered
  {
    int32_t m_order;

  public:
    NamedOrderedComponent(std::string name, const int32_t order)
      : NamedComponent(std::move(name))
      , m_order(order)
    {
    }

    int32_t GetOrder() const override
    {
      return m_order;
    }
  };

  class NamedAccessorComponent : public NamedComponent
  {
    int32_t m_order;

  public:
    NamedAccessorComponent(std::string name, const int32_t order)
      : NamedComponent(std::move(name))
      , m_order(order)
    {
    }

    int32_t GetOrder() const
    {
      return m_order;
    }
  };
}

#endif
