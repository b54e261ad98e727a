// ecparams: Pairing curve parameters decoding
// Copyright 2026 The ecparams Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "curve.hpp"
#include "decode_fp.hpp"
#include <cassert>
#include <memory>
#include <vector>

namespace ecparams
{
/// The modulus read from the head of the input, before a field is instantiated for it.
struct ModulusParams
{
    wide_uint modulus;

    /// The encoded length of the modulus. Every field element is encoded with this length.
    size_t modulus_len = 0;

    /// The number of 64-bit limbs the modulus needs. Never above MAX_MODULUS_LIMBS.
    size_t num_limbs = 0;
};

/// Reads the length-prefixed modulus.
///
/// Fails with zero_modulus for a zero value and unsupported_modulus if it needs more than
/// MAX_MODULUS_LIMBS limbs.
[[nodiscard]] DecodeResult<ModulusParams> get_base_field_params(bytes_view input) noexcept;

/// A prime field constructed from the input together with its encoding parameters.
template <typename UintT>
struct BaseField
{
    std::unique_ptr<const PrimeField<UintT>> field;
    size_t modulus_len = 0;
    UintT modulus;
};

/// Parses the modulus and constructs the prime field for it using the UintT representation.
///
/// Fails with unsupported_modulus if the modulus does not fit UintT, is even or is 1,
/// and with incomplete_field_element if the rest of the input cannot hold a single element.
template <typename UintT>
[[nodiscard]] DecodeResult<BaseField<UintT>> parse_base_field_from_encoding(bytes_view input)
{
    const auto params_or_error = get_base_field_params(input);
    if (const auto* err = std::get_if<DecodeError>(&params_or_error))
        return *err;
    const auto& [params, rest] = std::get<Decoded<ModulusParams>>(params_or_error);

    if (params.num_limbs > UintT::num_words || (params.modulus[0] & 1) == 0 || params.modulus < 3)
        return DecodeError::unsupported_modulus;

    if (rest.size() < params.modulus_len)
        return DecodeError::incomplete_field_element;

    const auto modulus = static_cast<UintT>(params.modulus);
    return Decoded<BaseField<UintT>>{
        {std::make_unique<const PrimeField<UintT>>(modulus), params.modulus_len, modulus}, rest};
}

/// Invokes fn.template operator()<UintT>() with the narrowest field representation able to
/// hold a modulus of num_limbs limbs.
template <typename Fn>
decltype(auto) with_modulus_width(size_t num_limbs, Fn&& fn)
{
    assert(num_limbs <= MAX_MODULUS_LIMBS);

    if (num_limbs <= 4)
        return fn.template operator()<intx::uint256>();
    else if (num_limbs <= 6)
        return fn.template operator()<intx::uint384>();
    else if (num_limbs <= 8)
        return fn.template operator()<intx::uint512>();
    else if (num_limbs <= 12)
        return fn.template operator()<intx::uint<768>>();
    else
        return fn.template operator()<intx::uint<1024>>();
}

/// The order of the main subgroup, i.e. the modulus of the scalar field.
struct GroupOrder
{
    wide_uint value;

    /// Little-endian 64-bit limbs of the order without high zero limbs.
    std::vector<uint64_t> limbs;

    /// The encoded length of the order. Every scalar is encoded with this length.
    size_t byte_len = 0;
};

/// Reads the length-prefixed group order. Fails with zero_group_order for a zero value.
[[nodiscard]] DecodeResult<GroupOrder> parse_group_order_from_encoding(bytes_view input);

/// Decodes a scalar of order.byte_len big-endian bytes.
///
/// The scalar must be less than the order. The result is little-endian 64-bit limbs,
/// zero extended to at least the number of limbs of the order.
[[nodiscard]] DecodeResult<std::vector<uint64_t>> decode_scalar_representation(
    bytes_view input, const GroupOrder& order);

/// The a and b coefficients of a short Weierstrass curve.
template <typename ElemT>
struct CurveCoeffs
{
    ElemT a;
    ElemT b;
};

/// Decodes two consecutive elements of the given field or extension as curve coefficients.
template <typename FieldT>
[[nodiscard]] DecodeResult<CurveCoeffs<typename FieldT::element_type>> parse_ab_from_encoding(
    bytes_view input, size_t modulus_len, const FieldT& field) noexcept
{
    using ElemT = typename FieldT::element_type;
    using ResultT = DecodeResult<CurveCoeffs<ElemT>>;

    const auto a_or_error = decode_element(input, modulus_len, field);
    if (const auto* err = std::get_if<DecodeError>(&a_or_error))
        return ResultT{*err};
    const auto& a = std::get<Decoded<ElemT>>(a_or_error);

    const auto b_or_error = decode_element(a.rest, modulus_len, field);
    if (const auto* err = std::get_if<DecodeError>(&b_or_error))
        return ResultT{*err};
    const auto& b = std::get<Decoded<ElemT>>(b_or_error);

    return ResultT{Decoded<CurveCoeffs<ElemT>>{{a.value, b.value}, b.rest}};
}

template <typename UintT>
[[nodiscard]] DecodeResult<CurveCoeffs<Fp<UintT>>> parse_ab_in_base_field_from_encoding(
    bytes_view input, size_t modulus_len, const PrimeField<UintT>& base_field) noexcept
{
    return parse_ab_from_encoding(input, modulus_len, base_field);
}

/// Decodes the X‖Y encoding of an affine point. No curve membership check is done.
///
/// Failures are reported for the coordinate that is short (incomplete_x, incomplete_y)
/// or malformed (invalid_x, invalid_y).
template <typename ElemT>
[[nodiscard]] DecodeResult<CurvePoint<ElemT>> decode_point_from_xy(
    bytes_view input, size_t field_byte_len, const WeierstrassCurve<ElemT>& curve) noexcept
{
    const auto x_or_error = decode_element(input, field_byte_len, curve.field());
    if (const auto* err = std::get_if<DecodeError>(&x_or_error))
    {
        return get_error_kind(*err) == ErrorKind::truncated_input ? DecodeError::incomplete_x :
                                                                    DecodeError::invalid_x;
    }
    const auto& x = std::get<Decoded<ElemT>>(x_or_error);

    const auto y_or_error = decode_element(x.rest, field_byte_len, curve.field());
    if (const auto* err = std::get_if<DecodeError>(&y_or_error))
    {
        return get_error_kind(*err) == ErrorKind::truncated_input ? DecodeError::incomplete_y :
                                                                    DecodeError::invalid_y;
    }
    const auto& y = std::get<Decoded<ElemT>>(y_or_error);

    return Decoded<CurvePoint<ElemT>>{
        CurvePoint<ElemT>::point_from_xy(curve, x.value, y.value), y.rest};
}

template <typename UintT>
[[nodiscard]] DecodeResult<CurvePoint<Fp<UintT>>> decode_g1_point_from_xy(
    bytes_view input, size_t field_byte_len, const WeierstrassCurve<Fp<UintT>>& curve) noexcept
{
    return decode_point_from_xy(input, field_byte_len, curve);
}

/// Encodes a point as X‖Y with each base field component taking modulus_len bytes.
template <typename ElemT>
bytes serialize_point(size_t modulus_len, const CurvePoint<ElemT>& point)
{
    const auto [x, y] = point.into_xy();
    auto result = serialize_element(modulus_len, x);
    result += serialize_element(modulus_len, y);
    return result;
}

template <typename UintT>
bytes serialize_g1_point(size_t modulus_len, const CurvePoint<Fp<UintT>>& point)
{
    return serialize_point(modulus_len, point);
}
}  // namespace ecparams
