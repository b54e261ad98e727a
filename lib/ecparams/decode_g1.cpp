// ecparams: Pairing curve parameters decoding
// Copyright 2026 The ecparams Authors.
// SPDX-License-Identifier: Apache-2.0

#include "decode_g1.hpp"
#include "reader.hpp"

namespace ecparams
{
DecodeResult<ModulusParams> get_base_field_params(bytes_view input) noexcept
{
    const auto blob_or_error = read_length_prefixed(input);
    if (const auto* err = std::get_if<DecodeError>(&blob_or_error))
        return *err;
    const auto& [blob, rest] = std::get<Decoded<LengthPrefixed>>(blob_or_error);

    // Any payload of a length-prefixed blob fits wide_uint.
    const auto modulus = *load_be<wide_uint>(blob.payload);
    if (modulus == 0)
        return DecodeError::zero_modulus;

    const auto limbs = num_limbs(modulus);
    if (limbs > MAX_MODULUS_LIMBS)
        return DecodeError::unsupported_modulus;

    return Decoded<ModulusParams>{{modulus, blob.length, limbs}, rest};
}

DecodeResult<GroupOrder> parse_group_order_from_encoding(bytes_view input)
{
    const auto blob_or_error = read_length_prefixed(input);
    if (const auto* err = std::get_if<DecodeError>(&blob_or_error))
        return *err;
    const auto& [blob, rest] = std::get<Decoded<LengthPrefixed>>(blob_or_error);

    const auto order = *load_be<wide_uint>(blob.payload);
    if (order == 0)
        return DecodeError::zero_group_order;

    return Decoded<GroupOrder>{{order, to_limbs(order), blob.length}, rest};
}

DecodeResult<std::vector<uint64_t>> decode_scalar_representation(
    bytes_view input, const GroupOrder& order)
{
    if (input.size() < order.byte_len)
        return DecodeError::incomplete_scalar;

    const auto scalar = *load_be<wide_uint>(input.substr(0, order.byte_len));
    if (scalar >= order.value)
        return DecodeError::scalar_out_of_range;

    auto repr = to_limbs(scalar);
    if (repr.size() < order.limbs.size())
        repr.resize(order.limbs.size(), 0);

    return Decoded<std::vector<uint64_t>>{std::move(repr), input.substr(order.byte_len)};
}
}  // namespace ecparams
