// ecparams: Pairing curve parameters decoding
// Copyright 2026 The ecparams Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "encoding.hpp"
#include "extension_field.hpp"
#include "field.hpp"

namespace ecparams
{
/// Decodes a field element from exactly field_byte_len big-endian bytes.
///
/// The encoding may have leading zero bytes but the value must be less than the modulus.
template <typename UintT>
[[nodiscard]] DecodeResult<Fp<UintT>> decode_fp(
    bytes_view input, size_t field_byte_len, const PrimeField<UintT>& field) noexcept
{
    if (input.size() < field_byte_len)
        return DecodeError::incomplete_field_element;

    const auto v = load_be<UintT>(input.substr(0, field_byte_len));
    if (!v.has_value())
        return DecodeError::non_canonical_field_element;

    const auto e = Fp<UintT>::from_int(field, *v);
    if (!e.has_value())
        return DecodeError::non_canonical_field_element;

    return Decoded<Fp<UintT>>{*e, input.substr(field_byte_len)};
}

/// Decodes the DEGREE coefficients of an extension element, lowest first.
template <typename ExtT>
[[nodiscard]] DecodeResult<ExtFieldElem<ExtT>> decode_ext(
    bytes_view input, size_t field_byte_len, const ExtT& ext) noexcept
{
    typename ExtFieldElem<ExtT>::CoeffArrT cs;
    for (auto& c : cs)
    {
        auto r = decode_fp(input, field_byte_len, ext.base_field());
        if (const auto* err = std::get_if<DecodeError>(&r))
            return *err;
        const auto& decoded = std::get<Decoded<Fp<typename ExtT::uint_type>>>(r);
        c = decoded.value;
        input = decoded.rest;
    }
    return Decoded<ExtFieldElem<ExtT>>{{ext, cs}, input};
}

template <typename UintT>
[[nodiscard]] DecodeResult<Fp2<UintT>> decode_fp2(
    bytes_view input, size_t field_byte_len, const Extension2<UintT>& ext) noexcept
{
    return decode_ext(input, field_byte_len, ext);
}

template <typename UintT>
[[nodiscard]] DecodeResult<Fp3<UintT>> decode_fp3(
    bytes_view input, size_t field_byte_len, const Extension3<UintT>& ext) noexcept
{
    return decode_ext(input, field_byte_len, ext);
}

/// Encodes a field element as exactly modulus_len big-endian bytes.
///
/// The modulus_len must be the encoded length the field was parsed with (or more),
/// which fits every canonical element. A shorter length is a precondition violation.
template <typename UintT>
bytes serialize_fp_fixed_len(size_t modulus_len, const Fp<UintT>& x)
{
    bytes result(modulus_len, 0);
    store_be(result.data(), modulus_len, x.value());
    return result;
}

/// Encodes an extension element as the concatenation of its coefficients, lowest first.
template <typename ExtT>
bytes serialize_ext_fixed_len(size_t modulus_len, const ExtFieldElem<ExtT>& x)
{
    bytes result;
    result.reserve(modulus_len * ExtT::DEGREE);
    for (const auto& c : x.coeffs())
        result += serialize_fp_fixed_len(modulus_len, c);
    return result;
}

template <typename UintT>
bytes serialize_fp2_fixed_len(size_t modulus_len, const Fp2<UintT>& x)
{
    return serialize_ext_fixed_len(modulus_len, x);
}

template <typename UintT>
bytes serialize_fp3_fixed_len(size_t modulus_len, const Fp3<UintT>& x)
{
    return serialize_ext_fixed_len(modulus_len, x);
}

/// Decodes an element of the given field or extension. Used by the generic point codec.
template <typename UintT>
[[nodiscard]] DecodeResult<Fp<UintT>> decode_element(
    bytes_view input, size_t field_byte_len, const PrimeField<UintT>& field) noexcept
{
    return decode_fp(input, field_byte_len, field);
}

template <typename ExtT>
[[nodiscard]] DecodeResult<ExtFieldElem<ExtT>> decode_element(
    bytes_view input, size_t field_byte_len, const ExtT& ext) noexcept
{
    return decode_ext(input, field_byte_len, ext);
}

template <typename UintT>
bytes serialize_element(size_t modulus_len, const Fp<UintT>& x)
{
    return serialize_fp_fixed_len(modulus_len, x);
}

template <typename ExtT>
bytes serialize_element(size_t modulus_len, const ExtFieldElem<ExtT>& x)
{
    return serialize_ext_fixed_len(modulus_len, x);
}
}  // namespace ecparams
