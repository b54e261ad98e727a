// ecparams: Pairing curve parameters decoding
// Copyright 2026 The ecparams Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "constants.hpp"
#include "errors.hpp"
#include <intx/intx.hpp>
#include <algorithm>
#include <cassert>
#include <optional>
#include <string>
#include <vector>

namespace ecparams
{
using bytes = std::basic_string<uint8_t>;

/// The integer type wide enough for any length-prefixed big-endian value.
using wide_uint = intx::uint<2048>;
static_assert(sizeof(wide_uint) >= MAX_LENGTH_PREFIXED_SIZE);

/// Loads a big-endian unsigned integer of arbitrary encoded length.
///
/// Leading zero bytes are ignored. Returns std::nullopt if the value does not fit UintT.
template <typename UintT>
std::optional<UintT> load_be(bytes_view data) noexcept
{
    static constexpr auto UINT_SIZE = sizeof(UintT);
    const auto it = std::ranges::find_if(data, [](auto b) { return b != 0; });
    data = bytes_view{it, data.end()};
    if (data.size() > UINT_SIZE)
        return std::nullopt;

    uint8_t tmp[UINT_SIZE]{};
    std::ranges::copy(data, &tmp[UINT_SIZE - data.size()]);
    return intx::be::load<UintT>(tmp);
}

/// Stores x as a big-endian integer filling the whole dst, zero padded on the left.
///
/// The value must fit dst. This is only asserted, the caller must guarantee it, e.g. by
/// using the encoded length of a modulus greater than x.
template <typename UintT>
void store_be(uint8_t* dst, size_t dst_size, const UintT& x) noexcept
{
    static constexpr auto UINT_SIZE = sizeof(UintT);
    uint8_t tmp[UINT_SIZE];
    intx::be::unsafe::store(tmp, x);
    if (dst_size >= UINT_SIZE)
    {
        std::fill_n(dst, dst_size - UINT_SIZE, uint8_t{0});
        std::copy_n(tmp, UINT_SIZE, &dst[dst_size - UINT_SIZE]);
    }
    else
    {
        assert(std::all_of(tmp, &tmp[UINT_SIZE - dst_size], [](auto b) { return b == 0; }));
        std::copy_n(&tmp[UINT_SIZE - dst_size], dst_size, dst);
    }
}

/// Returns the number of 64-bit limbs needed to represent x. Zero needs no limbs.
template <unsigned N>
constexpr size_t num_limbs(const intx::uint<N>& x) noexcept
{
    return (N - intx::clz(x) + 63) / 64;
}

/// Converts x into little-endian 64-bit limbs without the high zero limbs.
template <unsigned N>
std::vector<uint64_t> to_limbs(const intx::uint<N>& x)
{
    std::vector<uint64_t> limbs(num_limbs(x));
    for (size_t i = 0; i < limbs.size(); ++i)
        limbs[i] = x[i];
    return limbs;
}
}  // namespace ecparams
