// ecparams: Pairing curve parameters decoding
// Copyright 2026 The ecparams Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <ecparams/errors.hpp>
#include <ecparams/encoding.hpp>
#include <evmc/hex.hpp>
#include <stdexcept>
#include <string>

namespace ecparams::test
{
/// Produces bytes out of a hex string literal. Whitespace between the digits is ignored.
inline bytes operator""_hex(const char* s, size_t size)
{
    const auto b = evmc::from_spaced_hex({s, size}).value();
    return {b.begin(), b.end()};
}

/// Returns the successfully decoded value. Throws if decoding failed.
template <typename T>
const Decoded<T>& decoded(const DecodeResult<T>& result)
{
    if (const auto* err = std::get_if<DecodeError>(&result))
    {
        throw std::invalid_argument{
            "unexpected decoding error: " + std::string{get_error_message(*err)}};
    }
    return std::get<Decoded<T>>(result);
}

/// Returns the decoding error. Throws if decoding succeeded.
template <typename T>
DecodeError error_of(const DecodeResult<T>& result)
{
    if (const auto* err = std::get_if<DecodeError>(&result))
        return *err;
    throw std::invalid_argument{"decoding unexpectedly succeeded"};
}
}  // namespace ecparams::test
