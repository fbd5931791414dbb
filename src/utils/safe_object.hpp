/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <mutex>
#include <shared_mutex>
#include <utility>

namespace oppool::utils {

  /**
   * @brief Thread-safe wrapper for any object
   *
   * SafeObject provides exclusive and shared access patterns to an internal
   * object. Every instance owns its own mutex.
   *
   * @tparam T The type of object to wrap
   * @tparam M The mutex type to use for synchronization (defaults to
   * std::shared_mutex)
   */
  template <typename T, typename M = std::shared_mutex>
  struct SafeObject {
    using Type = T;

    template <typename... Args>
    SafeObject(Args &&...args) : t_(std::forward<Args>(args)...) {}

    /**
     * @brief Provides exclusive (write) access to the wrapped object
     *
     * @param f Function to apply to the wrapped object
     * @return The result of applying the function to the wrapped object
     */
    template <typename F>
    inline auto exclusiveAccess(F &&f) {
      std::unique_lock lock(cs_);
      return std::forward<F>(f)(t_);
    }

    /**
     * @brief Provides shared (read) access to the wrapped object
     *
     * @param f Function to apply to the wrapped object
     * @return The result of applying the function to the wrapped object
     */
    template <typename F>
    inline auto sharedAccess(F &&f) const {
      std::shared_lock lock(cs_);
      return std::forward<F>(f)(t_);
    }

   private:
    T t_;           ///< The wrapped object
    mutable M cs_;  ///< Mutex for synchronization
  };

}  // namespace oppool::utils
