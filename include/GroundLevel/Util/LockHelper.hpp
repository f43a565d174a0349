#ifndef GROUND_LEVEL_UTIL_LOCKHELPER_HPP
#define GROUND_LEVEL_UTIL_LOCKHELPER_HPP
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

#include <mutex>
#include <shared_mutex>
#include <utility>

namespace GroundLevel::LockHelper
{
  /// @brief Runs a callable while holding an exclusive lock and returns its result.
  ///
  /// The lock is released when the callable returns or throws.
  ///
  /// Example usage:
  /// @code
  /// auto sorted = LockHelper::WithReadLock(m_registryMutex, [&]() { return SortedByPriority(comparator, filters); });
  /// @endcode
  template <typename TMutex, typename TFunc>
  decltype(auto) WithLock(TMutex& rMutex, TFunc&& func)
  {
    std::lock_guard<TMutex> lock(rMutex);
    return std::forward<TFunc>(func)();
  }

  /// @brief Runs a callable while holding a shared (read) lock and returns its result.
  template <typename TFunc>
  decltype(auto) WithReadLock(std::shared_mutex& rMutex, TFunc&& func)
  {
    std::shared_lock<std::shared_mutex> lock(rMutex);
    return std::forward<TFunc>(func)();
  }

  /// @brief Runs a callable while holding an exclusive (write) lock and returns its result.
  template <typename TFunc>
  decltype(auto) WithWriteLock(std::shared_mutex& rMutex, TFunc&& func)
  {
    return WithLock(rMutex, std::forward<TFunc>(func));
  }
}

#endif
