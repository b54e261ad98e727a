// ecparams: Pairing curve parameters decoding
// Copyright 2026 The ecparams Authors.
// SPDX-License-Identifier: Apache-2.0

#include "reader.hpp"
#include "constants.hpp"

namespace ecparams
{
DecodeResult<LengthPrefixed> read_length_prefixed(bytes_view input) noexcept
{
    if (input.size() < BYTES_FOR_LENGTH_ENCODING)
        return DecodeError::missing_length_prefix;

    const size_t length = input[0];
    const auto rest = input.substr(BYTES_FOR_LENGTH_ENCODING);
    if (rest.size() < length)
        return DecodeError::incomplete_blob;

    return Decoded<LengthPrefixed>{{rest.substr(0, length), length}, rest.substr(length)};
}
}  // namespace ecparams
