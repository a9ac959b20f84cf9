/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <functional>
#include <optional>
#include <type_traits>
#include <unordered_map>
#include <utility>

namespace vigil::parachain {

  template <typename K, typename V>
  using StorePair = std::pair<std::decay_t<K>, std::decay_t<V>>;

  /// Keyed storage of one value type
  template <typename T>
  struct StoreUnit {
    using K = typename T::first_type;
    using V = typename T::second_type;

    StoreUnit() = default;
    ~StoreUnit() = default;

    StoreUnit(StoreUnit &&) = default;
    StoreUnit(const StoreUnit &) = delete;

    StoreUnit &operator=(StoreUnit &&) = default;
    StoreUnit &operator=(const StoreUnit &) = delete;

    std::optional<std::reference_wrapper<V>> get(const K &k) {
      if (auto it = store_.find(k); it != store_.end()) {
        return it->second;
      }
      return std::nullopt;
    }

    std::optional<std::reference_wrapper<const V>> get(const K &k) const {
      if (auto it = store_.find(k); it != store_.end()) {
        return it->second;
      }
      return std::nullopt;
    }

    bool contains(const K &k) const {
      return store_.find(k) != store_.end();
    }

    std::reference_wrapper<V> set(const K &k, V &&v) {
      return store_.insert_or_assign(k, std::move(v)).first->second;
    }

    size_t size() const {
      return store_.size();
    }

   private:
    std::unordered_map<K, V> store_;
  };

  /// Several StoreUnits in one object, addressed with `as<StorePair<K, V>>`
  template <typename T, typename... A>
  struct Store : StoreUnit<T>, Store<A...> {};

  template <typename T>
  struct Store<T> : StoreUnit<T> {};

  template <typename T, typename... A>
  inline constexpr StoreUnit<T> &as(Store<A...> &ref) {
    return static_cast<StoreUnit<T> &>(ref);
  }

  template <typename T, typename... A>
  inline constexpr const StoreUnit<T> &as(const Store<A...> &ref) {
    return static_cast<const StoreUnit<T> &>(ref);
  }
}  // namespace vigil::parachain
