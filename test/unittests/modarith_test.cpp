// ecparams: Pairing curve parameters decoding
// Copyright 2026 The ecparams Authors.
// SPDX-License-Identifier: Apache-2.0

#include <ecparams/modarith.hpp>
#include <gtest/gtest.h>
#include <array>

using namespace intx;
using namespace ecparams;

constexpr auto P23 = 23_u256;
constexpr auto BN254Mod = 0x30644e72e131a029b85045b68181585d97816a916871ca8d3c208c16d87cfd47_u256;
constexpr auto Secp256k1Mod =
    0xfffffffffffffffffffffffffffffffffffffffffffffffffffffffefffffc2f_u256;
constexpr auto M256 = 0xffffffffffffffffffffffffffffffffffffffffffffffffffffffffffffffff_u256;
constexpr auto BLS12384Mod =
    0x1a0111ea397fe69a4b1ba7b6434bacd764774b84f38512bf6730d2a0f6b0f6241eabfffeb153ffffb9feffffffffaaab_u384;
constexpr auto M512 = ~uint512{0};
constexpr auto M1024 = ~intx::uint<1024>{0};

template <typename UintT, const UintT& Mod, bool Prime>
struct ModA : ModArith<UintT>
{
    using uint = UintT;
    static constexpr bool is_prime = Prime;
    ModA() : ModArith<UintT>{Mod} {}
};

template <typename>
class modarith_test : public testing::Test
{};

using test_types = testing::Types<ModA<uint256, P23, true>, ModA<uint256, BN254Mod, true>,
    ModA<uint256, Secp256k1Mod, true>, ModA<uint256, M256, false>,
    ModA<uint384, BLS12384Mod, true>, ModA<uint512, M512, false>,
    ModA<intx::uint<1024>, M1024, false>>;
TYPED_TEST_SUITE(modarith_test, test_types);

template <typename Mod>
static auto get_test_values(const Mod& m) noexcept
{
    using Uint = typename Mod::uint;
    return std::array{
        m.mod - 1,
        m.mod - 2,
        m.mod / 2 + 1,
        m.mod / 2,
        m.mod / 2 - 1,
        Uint{2},
        Uint{1},
        Uint{0},
    };
}

TYPED_TEST(modarith_test, to_from_mont)
{
    const TypeParam m;
    for (const auto& v : get_test_values(m))
        EXPECT_EQ(m.from_mont(m.to_mont(v)), v);

    EXPECT_EQ(m.to_mont(0), 0);
    EXPECT_EQ(m.from_mont(m.one()), 1);
}

TYPED_TEST(modarith_test, add)
{
    const TypeParam m;
    const auto values = get_test_values(m);

    for (const auto& x : values)
    {
        for (const auto& y : values)
        {
            const auto expected =
                udivrem(intx::uint<TypeParam::uint::num_bits + 64>{x} + y, m.mod).rem;
            EXPECT_EQ(m.from_mont(m.add(m.to_mont(x), m.to_mont(y))), expected);
            EXPECT_EQ(m.add(x, y), expected);
        }
    }
}

TYPED_TEST(modarith_test, sub)
{
    const TypeParam m;
    const auto values = get_test_values(m);

    for (const auto& x : values)
    {
        for (const auto& y : values)
        {
            const auto expected =
                udivrem(intx::uint<TypeParam::uint::num_bits + 64>{x} + m.mod - y, m.mod).rem;
            EXPECT_EQ(m.from_mont(m.sub(m.to_mont(x), m.to_mont(y))), expected);
            EXPECT_EQ(m.sub(x, y), expected);
        }
    }
}

TYPED_TEST(modarith_test, mul)
{
    const TypeParam m;
    const auto values = get_test_values(m);

    for (const auto& x : values)
    {
        const auto xm = m.to_mont(x);
        for (const auto& y : values)
        {
            const auto expected = udivrem(umul(x, y), m.mod).rem;
            EXPECT_EQ(m.from_mont(m.mul(xm, m.to_mont(y))), expected);
        }
    }
}

TYPED_TEST(modarith_test, pow)
{
    const TypeParam m;
    for (const auto& x : get_test_values(m))
    {
        const auto xm = m.to_mont(x);
        EXPECT_EQ(m.pow(xm, uint256{0}), m.one());
        EXPECT_EQ(m.pow(xm, uint256{1}), xm);
        EXPECT_EQ(m.pow(xm, uint256{3}), m.mul(m.mul(xm, xm), xm));

        // The exponent may be wider than the modulus.
        EXPECT_EQ(m.pow(xm, intx::uint<2048>{2}), m.mul(xm, xm));

        if constexpr (TypeParam::is_prime)
        {
            // Fermat's little theorem.
            if (x != 0)
            {
                EXPECT_EQ(m.pow(xm, m.mod - 1), m.one());
            }
        }
    }
}

TYPED_TEST(modarith_test, inv)
{
    const TypeParam m;
    for (const auto& x : get_test_values(m))
    {
        const auto xm = m.to_mont(x);
        const auto xm_inv = m.inv(xm);
        if (xm_inv == 0)  // not invertible
        {
            if constexpr (TypeParam::is_prime)
            {
                EXPECT_EQ(x, 0);
            }
            continue;
        }
        EXPECT_EQ(m.from_mont(m.mul(xm, xm_inv)), 1);
    }
}
