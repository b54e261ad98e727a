// ecparams: Pairing curve parameters decoding
// Copyright 2026 The ecparams Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <cstdint>
#include <iosfwd>
#include <string_view>
#include <variant>

namespace ecparams
{
using bytes_view = std::basic_string_view<uint8_t>;

enum class DecodeError
{
    missing_length_prefix,
    incomplete_blob,
    zero_modulus,
    unsupported_modulus,
    incomplete_field_element,
    non_canonical_field_element,
    zero_group_order,
    incomplete_extension_degree,
    unexpected_extension_degree,
    zero_non_residue,
    non_residue_is_residue,
    frobenius_coeffs_unavailable,
    incomplete_x,
    invalid_x,
    incomplete_y,
    invalid_y,
    incomplete_scalar,
    scalar_out_of_range,
};

/// The coarse classes of decoding failures. All of them are terminal for the request.
enum class ErrorKind
{
    /// A declared length exceeds the remaining input.
    truncated_input,
    /// The modulus, the group order or a non-residue is zero.
    unexpected_zero,
    /// The input is malformed, e.g. a field element is not canonical.
    input_error,
    /// An extension degree tag mismatch or Frobenius coefficients cannot be derived.
    unknown_parameter,
    /// The supplied quadratic non-residue is a residue.
    residue_violation,
    /// A scalar is not less than the group order.
    scalar_out_of_range,
};

/// A successfully decoded value and the input bytes following its encoding.
///
/// The rest is a view into the decoded input, so the input must outlive it.
template <typename T>
struct Decoded
{
    T value;
    bytes_view rest;
};

template <typename T>
using DecodeResult = std::variant<Decoded<T>, DecodeError>;

/// Returns the class of the error.
[[nodiscard]] ErrorKind get_error_kind(DecodeError err) noexcept;

/// Returns the error message corresponding to an error code.
[[nodiscard]] std::string_view get_error_message(DecodeError err) noexcept;

/// Returns the name of the error class.
[[nodiscard]] std::string_view get_error_kind_name(ErrorKind kind) noexcept;

std::ostream& operator<<(std::ostream& os, DecodeError err) noexcept;

std::ostream& operator<<(std::ostream& os, ErrorKind kind) noexcept;
}  // namespace ecparams
