// ecparams: Pairing curve parameters decoding
// Copyright 2026 The ecparams Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <cstddef>
#include <cstdint>

namespace ecparams
{
/// Size of the length prefix of the modulus and group order encodings.
constexpr size_t BYTES_FOR_LENGTH_ENCODING = 1;

/// The maximum length a single length prefix can declare.
constexpr size_t MAX_LENGTH_PREFIXED_SIZE = 255;

constexpr size_t EXTENSION_DEGREE_ENCODING_LENGTH = 1;
constexpr uint8_t EXTENSION_DEGREE_2 = 2;
constexpr uint8_t EXTENSION_DEGREE_3 = 3;

/// The widest supported modulus, in 64-bit limbs (1024 bits).
constexpr size_t MAX_MODULUS_LIMBS = 16;
}  // namespace ecparams
