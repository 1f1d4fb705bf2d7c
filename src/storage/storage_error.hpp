/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <qtils/enum_error_code.hpp>

namespace dataworker::storage {

  /**
   * @brief Errors of the key-value layer under bundles, leaf statuses and
   * running balances; shared by the RocksDB and in-memory backends.
   */
  enum class StorageError : uint8_t {
    NOT_SUPPORTED = 1,    ///< backend can't perform the operation
    CORRUPTION,           ///< stored bytes don't decode to a valid value
    INVALID_ARGUMENT,     ///< backend rejected the arguments
    IO_ERROR,             ///< backend failed to read or write the disk
    NOT_FOUND,            ///< no value under the key
    DB_PATH_NOT_CREATED,  ///< database directory can't be created
    STORAGE_GONE,         ///< database was closed before the call
    UNKNOWN,              ///< backend failure of any other kind
  };

}  // namespace dataworker::storage

OUTCOME_HPP_DECLARE_ERROR(dataworker::storage, StorageError);
