// ecparams: Pairing curve parameters decoding
// Copyright 2026 The ecparams Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <intx/intx.hpp>
#include <cassert>
#include <tuple>
#include <utility>

namespace ecparams
{
/// Montgomery modular arithmetic over a modulus known only at run time.
///
/// The modulus must be odd and at least 3. Values passed to mul() must be in Montgomery form,
/// add() and sub() work for both representations as long as the inputs are reduced.
template <typename UintT>
class ModArith
{
public:
    const UintT mod;  ///< The modulus.

private:
    const UintT m_r_squared;  ///< R² % mod.

    /// The modulus inversion, i.e. the number N' such that mod⋅N' = 2⁶⁴-1.
    const uint64_t m_mod_inv;

    const UintT m_one;  ///< R % mod, i.e. 1 in Montgomery form.

    /// Computes N' such that mod⋅N' = 2⁶⁴-1.
    ///
    /// Only the lowest word of the modulus matters because the inversion is modulo 2⁶⁴.
    /// The loop accumulates (-mod)^(2⁶⁴-1), which is (-mod)⁻¹ for odd mod because the
    /// multiplicative group modulo 2⁶⁴ has exponent 2⁶².
    static constexpr uint64_t compute_mod_inv(uint64_t mod0) noexcept
    {
        uint64_t base = 0 - mod0;
        uint64_t result = 1;
        for (auto i = 0; i < 64; ++i)
        {
            result *= base;
            base *= base;
        }
        return result;
    }

    /// Computes R² % mod, where R = 2^num_bits.
    ///
    /// The value R² itself does not fit UintT: it needs 2*num_bits+1 bits, which is rounded
    /// up to 2*num_bits+64 to keep a whole number of words for the division.
    static constexpr UintT compute_r_squared(const UintT& mod) noexcept
    {
        constexpr auto r2 = intx::uint<UintT::num_bits * 2 + 64>{1} << (UintT::num_bits * 2);
        return intx::udivrem(r2, mod).rem;
    }

    /// Computes t + a*b + c as a two-word result {hi, lo}. Never overflows because
    /// (2⁶⁴-1)² + 2(2⁶⁴-1) = 2¹²⁸-1.
    static constexpr std::pair<uint64_t, uint64_t> addmul(
        uint64_t t, uint64_t a, uint64_t b, uint64_t c) noexcept
    {
        const auto p = intx::umul(a, b) + t + c;
        return {p[1], p[0]};
    }

public:
    explicit ModArith(const UintT& modulus) noexcept
      : mod{modulus},
        m_r_squared{compute_r_squared(modulus)},
        m_mod_inv{compute_mod_inv(modulus[0])},
        m_one{mul(m_r_squared, 1)}
    {
        assert((modulus & 1) == 1);
    }

    /// Returns 1 in Montgomery form.
    const UintT& one() const noexcept { return m_one; }

    /// Converts a reduced value to Montgomery form: mul(x, R²) = xR² R⁻¹ = xR.
    UintT to_mont(const UintT& x) const noexcept { return mul(x, m_r_squared); }

    /// Converts a value in Montgomery form back to its canonical value: mul(xR, 1) = x.
    UintT from_mont(const UintT& x) const noexcept { return mul(x, 1); }

    /// Performs a Montgomery modular multiplication, i.e. computes xyR⁻¹ % mod.
    ///
    /// Both inputs must be in Montgomery form and reduced, the result is then also in
    /// Montgomery form. Uses the Coarsely Integrated Operand Scanning (CIOS) method, see
    /// section 2.3.2 of "High-Speed Algorithms & Architectures For Number-Theoretic
    /// Cryptosystems" by T. Acar
    /// (https://www.microsoft.com/en-us/research/wp-content/uploads/1998/06/97Acar.pdf).
    UintT mul(const UintT& x, const UintT& y) const noexcept
    {
        constexpr auto S = UintT::num_words;

        // The accumulator needs one word above the modulus width for the intermediate carries.
        intx::uint<UintT::num_bits + 64> t;
        for (size_t i = 0; i != S; ++i)
        {
            // Multiplication step: t += x * y[i].
            uint64_t c = 0;
            for (size_t j = 0; j != S; ++j)
                std::tie(c, t[j]) = addmul(t[j], x[j], y[i], c);
            auto tmp = intx::addc(t[S], c);
            t[S] = tmp.value;
            const auto d = tmp.carry;

            // Reduction step: add m * mod so that the lowest word becomes zero, then shift
            // the accumulator down by one word.
            const auto m = t[0] * m_mod_inv;
            std::tie(c, std::ignore) = addmul(t[0], m, mod[0], 0);
            for (size_t j = 1; j != S; ++j)
                std::tie(c, t[j - 1]) = addmul(t[j], m, mod[j], c);
            tmp = intx::addc(t[S], c);
            t[S - 1] = tmp.value;
            // The carry is 0 when the highest word of the modulus has spare bits.
            t[S] = d + tmp.carry;
        }

        // At this point t < 2⋅mod so a single subtraction reduces it.
        if (t >= mod)
            t -= mod;

        return static_cast<UintT>(t);
    }

    /// Computes x + y % mod. Requires x, y < mod, in either representation.
    UintT add(const UintT& x, const UintT& y) const noexcept
    {
        const auto s = intx::addc(x, y);
        const auto d = intx::subc(s.value, mod);
        return (!s.carry && d.carry) ? s.value : d.value;
    }

    /// Computes x - y % mod. Requires x, y < mod, in either representation.
    UintT sub(const UintT& x, const UintT& y) const noexcept
    {
        const auto d = intx::subc(x, y);
        const auto s = d.value + mod;
        return (d.carry) ? s : d.value;
    }

    /// Computes x^e for x in Montgomery form by left-to-right square-and-multiply.
    /// The exponent may be of any intx width. The result is in Montgomery form.
    template <unsigned N>
    UintT pow(const UintT& x, const intx::uint<N>& e) const noexcept
    {
        auto ret = m_one;
        const auto bit_width = N - intx::clz(e);
        for (auto i = bit_width; i != 0; --i)
        {
            ret = mul(ret, ret);
            if (((e[(i - 1) / 64] >> ((i - 1) % 64)) & 1) != 0)
                ret = mul(ret, x);
        }
        return ret;
    }

    /// Computes the inversion of x in Montgomery form with the extended binary Euclidean
    /// algorithm (https://eprint.iacr.org/2020/972.pdf#algorithm.1).
    /// The result is in Montgomery form. Returns 0 if x is not invertible.
    UintT inv(const UintT& x) const noexcept
    {
        // Precompute ½ % mod. For odd mod = 2k+1 this is k+1 = ⌊mod / 2⌋ + 1, because
        // 2(k+1) = mod + 1 ≡ 1.
        const auto inv2 = (mod >> 1) + 1;

        UintT a = x;
        UintT b = mod;

        // Starting u from R² instead of 1 turns the X⁻¹R⁻¹ the algorithm computes for the
        // input XR into the expected X⁻¹R.
        UintT u = m_r_squared;
        UintT v = 0;

        while (a != 0)
        {
            if ((a & 1) != 0)
            {
                // a is odd, replace it with a - b. When a < b the difference is negated
                // instead, b takes the old a and u, v swap along with them.
                if (const auto [d, less] = intx::subc(a, b); less)
                {
                    b = a;
                    a = -d;
                    std::swap(u, v);
                }
                else
                {
                    a = d;
                }
                u = sub(u, v);
            }

            // a is even here, so the halving is exact.
            a >>= 1;

            // Halve u modulo mod: an odd u is made even by adding mod first, which is the
            // same as adding ½ after the shift.
            const auto u_odd = (u & 1) != 0;
            u >>= 1;
            if (u_odd)
                u += inv2;
        }

        // b holds the gcd. Anything other than 1 means x shares a factor with mod.
        if (b != 1)
            return 0;
        return v;
    }
};
}  // namespace ecparams
