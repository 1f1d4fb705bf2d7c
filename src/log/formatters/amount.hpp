/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <fmt/ostream.h>

#include "types/primitives.hpp"

// Amounts are printed as decimal integers
template <>
struct fmt::formatter<dataworker::Amount> : fmt::ostream_formatter {};

template <>
struct fmt::formatter<dataworker::SignedAmount> : fmt::ostream_formatter {};
