/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>

#include <sszpp/basic_types.hpp>
#include <sszpp/container.hpp>
#include <sszpp/lists.hpp>

namespace dataworker {

  /**
   * Optional value encoded as List[T; max=1].
   * An absent root is persisted as an empty list.
   */
  template <typename T>
  struct SszMaybe : public ssz::ssz_variable_size_container {
    ssz::list<T, 1> inner;

    SSZ_CONT(inner);

    static SszMaybe from(const std::optional<T> &opt) {
      SszMaybe res;
      if (opt.has_value()) {
        res.inner.push_back(opt.value());
      }
      return res;
    }

    bool has_value() const {
      return inner.size() == 1;
    }

    const T &value() const {
      return inner[0];
    }

    std::optional<T> toOptional() const {
      if (has_value()) {
        return value();
      }
      return std::nullopt;
    }

    bool operator==(const SszMaybe &) const = default;
  };

}  // namespace dataworker
