// ecparams: Pairing curve parameters decoding
// Copyright 2026 The ecparams Authors.
// SPDX-License-Identifier: Apache-2.0

#include "errors.hpp"
#include <intx/intx.hpp>
#include <ostream>

namespace ecparams
{
ErrorKind get_error_kind(DecodeError err) noexcept
{
    switch (err)
    {
    case DecodeError::missing_length_prefix:
    case DecodeError::incomplete_blob:
    case DecodeError::incomplete_field_element:
    case DecodeError::incomplete_extension_degree:
    case DecodeError::incomplete_x:
    case DecodeError::incomplete_y:
    case DecodeError::incomplete_scalar:
        return ErrorKind::truncated_input;
    case DecodeError::zero_modulus:
    case DecodeError::zero_group_order:
    case DecodeError::zero_non_residue:
        return ErrorKind::unexpected_zero;
    case DecodeError::unsupported_modulus:
    case DecodeError::non_canonical_field_element:
    case DecodeError::invalid_x:
    case DecodeError::invalid_y:
        return ErrorKind::input_error;
    case DecodeError::unexpected_extension_degree:
    case DecodeError::frobenius_coeffs_unavailable:
        return ErrorKind::unknown_parameter;
    case DecodeError::non_residue_is_residue:
        return ErrorKind::residue_violation;
    case DecodeError::scalar_out_of_range:
        return ErrorKind::scalar_out_of_range;
    }
    intx::unreachable();
}

std::string_view get_error_message(DecodeError err) noexcept
{
    switch (err)
    {
    case DecodeError::missing_length_prefix:
        return "missing_length_prefix";
    case DecodeError::incomplete_blob:
        return "incomplete_blob";
    case DecodeError::zero_modulus:
        return "zero_modulus";
    case DecodeError::unsupported_modulus:
        return "unsupported_modulus";
    case DecodeError::incomplete_field_element:
        return "incomplete_field_element";
    case DecodeError::non_canonical_field_element:
        return "non_canonical_field_element";
    case DecodeError::zero_group_order:
        return "zero_group_order";
    case DecodeError::incomplete_extension_degree:
        return "incomplete_extension_degree";
    case DecodeError::unexpected_extension_degree:
        return "unexpected_extension_degree";
    case DecodeError::zero_non_residue:
        return "zero_non_residue";
    case DecodeError::non_residue_is_residue:
        return "non_residue_is_residue";
    case DecodeError::frobenius_coeffs_unavailable:
        return "frobenius_coeffs_unavailable";
    case DecodeError::incomplete_x:
        return "incomplete_x";
    case DecodeError::invalid_x:
        return "invalid_x";
    case DecodeError::incomplete_y:
        return "incomplete_y";
    case DecodeError::invalid_y:
        return "invalid_y";
    case DecodeError::incomplete_scalar:
        return "incomplete_scalar";
    case DecodeError::scalar_out_of_range:
        return "scalar_out_of_range";
    }
    return "<unknown>";
}

std::string_view get_error_kind_name(ErrorKind kind) noexcept
{
    switch (kind)
    {
    case ErrorKind::truncated_input:
        return "truncated_input";
    case ErrorKind::unexpected_zero:
        return "unexpected_zero";
    case ErrorKind::input_error:
        return "input_error";
    case ErrorKind::unknown_parameter:
        return "unknown_parameter";
    case ErrorKind::residue_violation:
        return "residue_violation";
    case ErrorKind::scalar_out_of_range:
        return "scalar_out_of_range";
    }
    return "<unknown>";
}

std::ostream& operator<<(std::ostream& os, DecodeError err) noexcept
{
    os << get_error_message(err);
    return os;
}

std::ostream& operator<<(std::ostream& os, ErrorKind kind) noexcept
{
    os << get_error_kind_name(kind);
    return os;
}
}  // namespace ecparams
