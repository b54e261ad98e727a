// ecparams: Pairing curve parameters decoding
// Copyright 2026 The ecparams Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "decode_g1.hpp"

namespace ecparams
{
namespace detail
{
/// Reads the extension degree tag and the non-zero non-residue following it.
template <typename UintT>
[[nodiscard]] DecodeResult<Fp<UintT>> decode_extension_header(bytes_view input,
    uint8_t expected_degree, size_t field_byte_len, const PrimeField<UintT>& base_field) noexcept
{
    if (input.size() < EXTENSION_DEGREE_ENCODING_LENGTH)
        return DecodeError::incomplete_extension_degree;
    if (input[0] != expected_degree)
        return DecodeError::unexpected_extension_degree;

    auto non_residue_or_error =
        decode_fp(input.substr(EXTENSION_DEGREE_ENCODING_LENGTH), field_byte_len, base_field);
    if (const auto* non_residue = std::get_if<Decoded<Fp<UintT>>>(&non_residue_or_error);
        non_residue != nullptr && non_residue->value.is_zero())
        return DecodeError::zero_non_residue;
    return non_residue_or_error;
}
}  // namespace detail

/// Parses the `[degree = 2][non-residue]` encoding and constructs the quadratic extension.
///
/// The non-residue must not be zero and must not be a quadratic residue. The Frobenius
/// coefficients are computed before the extension is returned.
template <typename UintT>
[[nodiscard]] DecodeResult<std::unique_ptr<const Extension2<UintT>>> create_fp2_extension(
    bytes_view input, size_t field_byte_len, const PrimeField<UintT>& base_field)
{
    const auto header_or_error =
        detail::decode_extension_header(input, EXTENSION_DEGREE_2, field_byte_len, base_field);
    if (const auto* err = std::get_if<DecodeError>(&header_or_error))
        return *err;
    const auto& [non_residue, rest] = std::get<Decoded<Fp<UintT>>>(header_or_error);

    if (legendre_symbol(non_residue) != LegendreSymbol::quadratic_non_residue)
        return DecodeError::non_residue_is_residue;

    auto extension = std::make_unique<Extension2<UintT>>(non_residue);
    if (!extension->calculate_frobenius_coeffs())
        return DecodeError::frobenius_coeffs_unavailable;

    return Decoded<std::unique_ptr<const Extension2<UintT>>>{std::move(extension), rest};
}

/// Parses the `[degree = 3][non-residue]` encoding and constructs the cubic extension.
///
/// Only a zero non-residue is rejected here, the cubic residuosity is not checked.
/// Fails with frobenius_coeffs_unavailable if p ≢ 1 (mod 3).
template <typename UintT>
[[nodiscard]] DecodeResult<std::unique_ptr<const Extension3<UintT>>> create_fp3_extension(
    bytes_view input, size_t field_byte_len, const PrimeField<UintT>& base_field)
{
    const auto header_or_error =
        detail::decode_extension_header(input, EXTENSION_DEGREE_3, field_byte_len, base_field);
    if (const auto* err = std::get_if<DecodeError>(&header_or_error))
        return *err;
    const auto& [non_residue, rest] = std::get<Decoded<Fp<UintT>>>(header_or_error);

    auto extension = std::make_unique<Extension3<UintT>>(non_residue);
    if (!extension->calculate_frobenius_coeffs())
        return DecodeError::frobenius_coeffs_unavailable;

    return Decoded<std::unique_ptr<const Extension3<UintT>>>{std::move(extension), rest};
}

template <typename UintT>
[[nodiscard]] DecodeResult<CurvePoint<Fp2<UintT>>> decode_g2_point_from_xy_in_fp2(
    bytes_view input, size_t field_byte_len, const WeierstrassCurve<Fp2<UintT>>& curve) noexcept
{
    return decode_point_from_xy(input, field_byte_len, curve);
}

template <typename UintT>
[[nodiscard]] DecodeResult<CurvePoint<Fp3<UintT>>> decode_g2_point_from_xy_in_fp3(
    bytes_view input, size_t field_byte_len, const WeierstrassCurve<Fp3<UintT>>& curve) noexcept
{
    return decode_point_from_xy(input, field_byte_len, curve);
}

template <typename UintT>
bytes serialize_g2_point_in_fp2(size_t modulus_len, const CurvePoint<Fp2<UintT>>& point)
{
    return serialize_point(modulus_len, point);
}

template <typename UintT>
bytes serialize_g2_point_in_fp3(size_t modulus_len, const CurvePoint<Fp3<UintT>>& point)
{
    return serialize_point(modulus_len, point);
}

template <typename UintT>
[[nodiscard]] DecodeResult<CurveCoeffs<Fp2<UintT>>> parse_ab_in_fp2_from_encoding(
    bytes_view input, size_t modulus_len, const Extension2<UintT>& field) noexcept
{
    return parse_ab_from_encoding(input, modulus_len, field);
}

template <typename UintT>
[[nodiscard]] DecodeResult<CurveCoeffs<Fp3<UintT>>> parse_ab_in_fp3_from_encoding(
    bytes_view input, size_t modulus_len, const Extension3<UintT>& field) noexcept
{
    return parse_ab_from_encoding(input, modulus_len, field);
}
}  // namespace ecparams
