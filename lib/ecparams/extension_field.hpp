// ecparams: Pairing curve parameters decoding
// Copyright 2026 The ecparams Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "field.hpp"
#include <algorithm>
#include <array>

namespace ecparams
{
template <typename ExtT>
class ExtFieldElem;

/// Quadratic extension Fp[u]/(u² - β) of a prime field, where β is a quadratic non-residue.
template <typename UintT>
class Extension2
{
public:
    using uint_type = UintT;
    using element_type = ExtFieldElem<Extension2>;
    static constexpr size_t DEGREE = 2;

private:
    const PrimeField<UintT>* m_base;
    Fp<UintT> m_non_residue;

    /// β^((p^i - 1) / 2) for i in [0, 2).
    std::array<Fp<UintT>, DEGREE> m_frobenius_coeffs_c1;

public:
    explicit Extension2(const Fp<UintT>& non_residue) noexcept
      : m_base{&non_residue.field()},
        m_non_residue{non_residue},
        m_frobenius_coeffs_c1{Fp<UintT>::one(*m_base), Fp<UintT>::one(*m_base)}
    {}

    Extension2(const Extension2&) = delete;
    Extension2& operator=(const Extension2&) = delete;

    /// Computes the Frobenius coefficients from the base field modulus.
    /// Returns false if (p - 1) is not divisible by the extension degree.
    [[nodiscard]] bool calculate_frobenius_coeffs() noexcept
    {
        const auto& p = m_base->modulus();
        const auto [exp, rem] = intx::udivrem(p - 1, UintT{DEGREE});
        if (rem != 0)
            return false;

        m_frobenius_coeffs_c1[0] = Fp<UintT>::one(*m_base);
        m_frobenius_coeffs_c1[1] = m_non_residue.pow(exp);
        return true;
    }

    const PrimeField<UintT>& base_field() const noexcept { return *m_base; }

    const Fp<UintT>& non_residue() const noexcept { return m_non_residue; }

    const auto& frobenius_coeffs_c1() const noexcept { return m_frobenius_coeffs_c1; }
};

/// Cubic extension Fp[u]/(u³ - β) of a prime field.
template <typename UintT>
class Extension3
{
public:
    using uint_type = UintT;
    using element_type = ExtFieldElem<Extension3>;
    static constexpr size_t DEGREE = 3;

private:
    const PrimeField<UintT>* m_base;
    Fp<UintT> m_non_residue;

    /// β^((p^i - 1) / 3) for i in [0, 3).
    std::array<Fp<UintT>, DEGREE> m_frobenius_coeffs_c1;

    /// β^(2(p^i - 1) / 3) for i in [0, 3).
    std::array<Fp<UintT>, DEGREE> m_frobenius_coeffs_c2;

public:
    explicit Extension3(const Fp<UintT>& non_residue) noexcept
      : m_base{&non_residue.field()}, m_non_residue{non_residue}
    {
        m_frobenius_coeffs_c1.fill(Fp<UintT>::one(*m_base));
        m_frobenius_coeffs_c2.fill(Fp<UintT>::one(*m_base));
    }

    Extension3(const Extension3&) = delete;
    Extension3& operator=(const Extension3&) = delete;

    /// Computes the Frobenius coefficients from the base field modulus.
    /// Returns false if (p - 1) is not divisible by 3.
    [[nodiscard]] bool calculate_frobenius_coeffs() noexcept
    {
        using WideT = intx::uint<UintT::num_bits * 2>;

        const auto& p = m_base->modulus();
        const auto [exp1, rem1] = intx::udivrem(p - 1, UintT{DEGREE});
        if (rem1 != 0)
            return false;

        // p² - 1 = (p - 1)(p + 1) so it is divisible by 3 too.
        const auto exp2 = (intx::umul(p, p) - 1) / WideT{DEGREE};

        const auto one = Fp<UintT>::one(*m_base);
        m_frobenius_coeffs_c1 = {one, m_non_residue.pow(exp1), m_non_residue.pow(exp2)};
        for (size_t i = 0; i < DEGREE; ++i)
            m_frobenius_coeffs_c2[i] = m_frobenius_coeffs_c1[i].square();
        return true;
    }

    const PrimeField<UintT>& base_field() const noexcept { return *m_base; }

    const Fp<UintT>& non_residue() const noexcept { return m_non_residue; }

    const auto& frobenius_coeffs_c1() const noexcept { return m_frobenius_coeffs_c1; }

    const auto& frobenius_coeffs_c2() const noexcept { return m_frobenius_coeffs_c2; }
};

/// Element of a quadratic or cubic extension: c0 + c1⋅u (+ c2⋅u²).
template <typename ExtT>
class ExtFieldElem
{
public:
    using field_type = ExtT;
    using Base = Fp<typename ExtT::uint_type>;
    static constexpr auto DEGREE = ExtT::DEGREE;
    using CoeffArrT = std::array<Base, DEGREE>;

private:
    const ExtT* m_ext = nullptr;
    CoeffArrT m_coeffs = {};

public:
    ExtFieldElem() noexcept = default;

    ExtFieldElem(const ExtT& ext, const CoeffArrT& cs) noexcept : m_ext{&ext}, m_coeffs{cs} {}

    static ExtFieldElem zero(const ExtT& ext) noexcept
    {
        CoeffArrT cs;
        cs.fill(Base::zero(ext.base_field()));
        return {ext, cs};
    }

    static ExtFieldElem one(const ExtT& ext) noexcept
    {
        auto res = zero(ext);
        res.m_coeffs[0] = Base::one(ext.base_field());
        return res;
    }

    const ExtT& field() const noexcept { return *m_ext; }

    const CoeffArrT& coeffs() const noexcept { return m_coeffs; }

    const Base& operator[](size_t i) const noexcept { return m_coeffs[i]; }

    bool is_zero() const noexcept
    {
        return std::ranges::all_of(m_coeffs, [](const Base& c) { return c.is_zero(); });
    }

    ExtFieldElem square() const noexcept { return *this * *this; }

    template <unsigned N>
    ExtFieldElem pow(const intx::uint<N>& e) const noexcept
    {
        auto ret = one(*m_ext);
        const auto bit_width = N - intx::clz(e);
        for (auto i = bit_width; i != 0; --i)
        {
            ret = ret.square();
            if (((e[(i - 1) / 64] >> ((i - 1) % 64)) & 1) != 0)
                ret = ret * *this;
        }
        return ret;
    }

    friend ExtFieldElem operator+(const ExtFieldElem& a, const ExtFieldElem& b) noexcept
    {
        auto res = a.m_coeffs;
        for (size_t i = 0; i < DEGREE; ++i)
            res[i] = res[i] + b.m_coeffs[i];
        return {*a.m_ext, res};
    }

    friend ExtFieldElem operator-(const ExtFieldElem& a, const ExtFieldElem& b) noexcept
    {
        auto res = a.m_coeffs;
        for (size_t i = 0; i < DEGREE; ++i)
            res[i] = res[i] - b.m_coeffs[i];
        return {*a.m_ext, res};
    }

    friend ExtFieldElem operator-(const ExtFieldElem& a) noexcept
    {
        CoeffArrT res;
        for (size_t i = 0; i < DEGREE; ++i)
            res[i] = -a.m_coeffs[i];
        return {*a.m_ext, res};
    }

    friend ExtFieldElem operator*(const ExtFieldElem& a, const ExtFieldElem& b) noexcept
    {
        return multiply(a, b);
    }

    friend ExtFieldElem operator*(const ExtFieldElem& a, const Base& s) noexcept
    {
        auto res = a.m_coeffs;
        for (auto& c : res)
            c = c * s;
        return {*a.m_ext, res};
    }

    friend bool operator==(const ExtFieldElem& a, const ExtFieldElem& b) noexcept = default;
};

template <typename UintT>
using Fp2 = ExtFieldElem<Extension2<UintT>>;

template <typename UintT>
using Fp3 = ExtFieldElem<Extension3<UintT>>;

/// Multiplies two Fp2 elements using u² = β.
template <typename UintT>
Fp2<UintT> multiply(const Fp2<UintT>& a, const Fp2<UintT>& b) noexcept
{
    const auto& beta = a.field().non_residue();
    const auto t0 = a[0] * b[0];
    const auto t1 = a[1] * b[1];

    return {a.field(), {t0 + t1 * beta, (a[0] + a[1]) * (b[0] + b[1]) - t0 - t1}};
}

/// Multiplies two Fp3 elements using u³ = β.
template <typename UintT>
Fp3<UintT> multiply(const Fp3<UintT>& a, const Fp3<UintT>& b) noexcept
{
    const auto& beta = a.field().non_residue();
    const auto t0 = a[0] * b[0];
    const auto t1 = a[1] * b[1];
    const auto t2 = a[2] * b[2];

    const auto c0 = ((a[1] + a[2]) * (b[1] + b[2]) - t1 - t2) * beta + t0;
    const auto c1 = (a[0] + a[1]) * (b[0] + b[1]) - t0 - t1 + t2 * beta;
    const auto c2 = (a[0] + a[2]) * (b[0] + b[2]) - t0 - t2 + t1;

    return {a.field(), {c0, c1, c2}};
}

/// Computes x^(p^power) using the precomputed Frobenius coefficients.
template <typename UintT>
Fp2<UintT> frobenius_map(const Fp2<UintT>& x, size_t power) noexcept
{
    const auto& c1 = x.field().frobenius_coeffs_c1();
    return {x.field(), {x[0], x[1] * c1[power % 2]}};
}

/// Computes x^(p^power) using the precomputed Frobenius coefficients.
template <typename UintT>
Fp3<UintT> frobenius_map(const Fp3<UintT>& x, size_t power) noexcept
{
    const auto& c1 = x.field().frobenius_coeffs_c1();
    const auto& c2 = x.field().frobenius_coeffs_c2();
    return {x.field(), {x[0], x[1] * c1[power % 3], x[2] * c2[power % 3]}};
}
}  // namespace ecparams
