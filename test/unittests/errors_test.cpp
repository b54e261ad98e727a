// ecparams: Pairing curve parameters decoding
// Copyright 2026 The ecparams Authors.
// SPDX-License-Identifier: Apache-2.0

#include <ecparams/errors.hpp>
#include <gtest/gtest.h>
#include <sstream>

using namespace ecparams;

TEST(errors, kinds)
{
    EXPECT_EQ(get_error_kind(DecodeError::missing_length_prefix), ErrorKind::truncated_input);
    EXPECT_EQ(get_error_kind(DecodeError::incomplete_blob), ErrorKind::truncated_input);
    EXPECT_EQ(get_error_kind(DecodeError::incomplete_field_element), ErrorKind::truncated_input);
    EXPECT_EQ(get_error_kind(DecodeError::incomplete_extension_degree), ErrorKind::truncated_input);
    EXPECT_EQ(get_error_kind(DecodeError::incomplete_y), ErrorKind::truncated_input);
    EXPECT_EQ(get_error_kind(DecodeError::incomplete_scalar), ErrorKind::truncated_input);

    EXPECT_EQ(get_error_kind(DecodeError::zero_modulus), ErrorKind::unexpected_zero);
    EXPECT_EQ(get_error_kind(DecodeError::zero_group_order), ErrorKind::unexpected_zero);
    EXPECT_EQ(get_error_kind(DecodeError::zero_non_residue), ErrorKind::unexpected_zero);

    EXPECT_EQ(get_error_kind(DecodeError::unsupported_modulus), ErrorKind::input_error);
    EXPECT_EQ(get_error_kind(DecodeError::non_canonical_field_element), ErrorKind::input_error);
    EXPECT_EQ(get_error_kind(DecodeError::invalid_x), ErrorKind::input_error);
}

TEST(errors, messages)
{
    EXPECT_EQ(get_error_message(DecodeError::zero_modulus), "zero_modulus");
    EXPECT_EQ(get_error_message(DecodeError::unexpected_extension_degree),
        "unexpected_extension_degree");
    EXPECT_EQ(get_error_kind_name(ErrorKind::residue_violation), "residue_violation");
}

TEST(errors, output_operator)
{
    std::ostringstream os;
    os << DecodeError::non_residue_is_residue << ' '
       << get_error_kind(DecodeError::non_residue_is_residue);
    EXPECT_EQ(os.str(), "non_residue_is_residue residue_violation");
}
