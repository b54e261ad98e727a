// ecparams: Pairing curve parameters decoding
// Copyright 2026 The ecparams Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "errors.hpp"

namespace ecparams
{
/// The payload of a `[1-byte length L][L bytes]` blob.
struct LengthPrefixed
{
    bytes_view payload;
    size_t length = 0;
};

/// Reads a length-prefixed blob from the front of the input.
///
/// The payload is not interpreted. Fails with missing_length_prefix for empty input
/// and with incomplete_blob if fewer than L bytes follow the prefix.
[[nodiscard]] DecodeResult<LengthPrefixed> read_length_prefixed(bytes_view input) noexcept;
}  // namespace ecparams
