#ifndef GROUND_LEVEL_ORDERING_ORDERPRIORITY_HPP
#define GROUND_LEVEL_ORDERING_ORDERPRIORITY_HPP
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

#include <compare>
#include <cstdint>
#include <limits>

namespace GroundLevel
{
  /// @brief Represents the ordering priority of a component.
  ///
  /// Lower values sort first. Components whose priority cannot be resolved receive LowestPrecedence(),
  /// which places them after every component with an explicit priority.
  ///
  /// @note Priority values are arbitrary int32_t values. HighestPrecedence() and LowestPrecedence() are
  ///       the two ends of the range and can be used as anchors (e.g. LowestPrecedence().GetValue() - 10).
  class OrderPriority
  {
  private:
    int32_t m_priority{0};

  public:
    /// @brief Default constructor. Initializes priority to 0.
    constexpr OrderPriority() noexcept = default;

    /// @brief Constructs an OrderPriority with the specified priority value.
    ///
    /// @param priority The priority value. Lower values sort first.
    explicit constexpr OrderPriority(const int32_t priority) noexcept
      : m_priority(priority)
    {
    }

    /// @brief The priority that sorts before every other priority.
    static constexpr OrderPriority HighestPrecedence() noexcept
    {
      return OrderPriority(std::numeric_limits<int32_t>::min());
    }

    /// @brief The priority assigned when nothing else applies. Sorts after every other priority.
    static constexpr OrderPriority LowestPrecedence() noexcept
    {
      return OrderPriority(std::numeric_limits<int32_t>::max());
    }

    /// @brief Gets the underlying priority value.
    ///
    /// @return The priority value as a signed 32-bit integer.
    [[nodiscard]] constexpr int32_t GetValue() const noexcept
    {
      return m_priority;
    }

    /// @brief Three-way comparison operator for priority ordering.
    constexpr auto operator<=>(const OrderPriority& other) const noexcept = default;

    /// @brief Equality comparison operator.
    constexpr bool operator==(const OrderPriority& other) const noexcept = default;
  };

}

#endif
