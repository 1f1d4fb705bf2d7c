/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "storage/storage_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(dataworker::storage, StorageError, e) {
  using E = StorageError;
  switch (e) {
    case E::NOT_SUPPORTED:
      return "Operation is not supported by the storage backend";
    case E::CORRUPTION:
      return "Stored value is corrupted";
    case E::INVALID_ARGUMENT:
      return "Storage backend rejected the arguments";
    case E::IO_ERROR:
      return "Storage backend IO failure";
    case E::NOT_FOUND:
      return "Storage entry not found";
    case E::DB_PATH_NOT_CREATED:
      return "Database directory can't be created";
    case E::STORAGE_GONE:
      return "Database is already closed";
    case E::UNKNOWN:
      break;
  }
  return "Unknown storage error";
}
