/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>

#ifndef DATAWORKER_BUILD_VERSION
#define DATAWORKER_BUILD_VERSION "undefined"
#endif

namespace dataworker {

  /// Version string baked in at configure time
  inline const std::string &buildVersion() {
    static const std::string version{DATAWORKER_BUILD_VERSION};
    return version;
  }

}  // namespace dataworker
