// ecparams: Pairing curve parameters decoding
// Copyright 2026 The ecparams Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "encoding.hpp"
#include <ecparams/modarith.hpp>
#include <optional>

namespace ecparams
{
template <typename UintT>
class Fp;

/// Prime field defined by a modulus parsed at run time.
///
/// Immutable after construction. Elements keep a pointer to the field, so the field must not
/// be moved or destroyed while any element derived from it is alive.
template <typename UintT>
class PrimeField
{
    ModArith<UintT> m_arith;
    size_t m_num_limbs;

    /// (p-1)/2, the exponent of the Euler's criterion.
    UintT m_legendre_exp;

public:
    using uint_type = UintT;
    using element_type = Fp<UintT>;

    explicit PrimeField(const UintT& modulus) noexcept
      : m_arith{modulus}, m_num_limbs{num_limbs(modulus)}, m_legendre_exp{(modulus - 1) >> 1}
    {}

    PrimeField(const PrimeField&) = delete;
    PrimeField& operator=(const PrimeField&) = delete;

    const ModArith<UintT>& arith() const noexcept { return m_arith; }

    const UintT& modulus() const noexcept { return m_arith.mod; }

    /// The number of 64-bit limbs actually used by the modulus.
    size_t modulus_limbs() const noexcept { return m_num_limbs; }

    const UintT& legendre_exponent() const noexcept { return m_legendre_exp; }
};

/// Element of a PrimeField, kept in Montgomery form.
template <typename UintT>
class Fp
{
    const PrimeField<UintT>* m_field = nullptr;
    UintT m_value = 0;

    Fp(const PrimeField<UintT>& field, const UintT& mont_value) noexcept
      : m_field{&field}, m_value{mont_value}
    {}

public:
    using field_type = PrimeField<UintT>;

    /// Placeholder without a field. Must be assigned before use.
    Fp() noexcept = default;

    static Fp zero(const PrimeField<UintT>& field) noexcept { return Fp{field, 0}; }

    static Fp one(const PrimeField<UintT>& field) noexcept
    {
        return Fp{field, field.arith().one()};
    }

    /// Creates an element from its canonical value. Returns std::nullopt if v >= modulus.
    static std::optional<Fp> from_int(const PrimeField<UintT>& field, const UintT& v) noexcept
    {
        if (v >= field.modulus())
            return std::nullopt;
        return Fp{field, field.arith().to_mont(v)};
    }

    const PrimeField<UintT>& field() const noexcept { return *m_field; }

    /// Returns the canonical value, i.e. not in Montgomery form.
    UintT value() const noexcept { return m_field->arith().from_mont(m_value); }

    bool is_zero() const noexcept { return m_value == 0; }

    Fp square() const noexcept { return *this * *this; }

    template <unsigned N>
    Fp pow(const intx::uint<N>& e) const noexcept
    {
        return Fp{*m_field, m_field->arith().pow(m_value, e)};
    }

    /// Returns the multiplicative inverse, or zero for zero.
    Fp inv() const noexcept { return Fp{*m_field, m_field->arith().inv(m_value)}; }

    friend Fp operator+(const Fp& a, const Fp& b) noexcept
    {
        return Fp{*a.m_field, a.m_field->arith().add(a.m_value, b.m_value)};
    }

    friend Fp operator-(const Fp& a, const Fp& b) noexcept
    {
        return Fp{*a.m_field, a.m_field->arith().sub(a.m_value, b.m_value)};
    }

    friend Fp operator*(const Fp& a, const Fp& b) noexcept
    {
        return Fp{*a.m_field, a.m_field->arith().mul(a.m_value, b.m_value)};
    }

    friend Fp operator-(const Fp& a) noexcept
    {
        return Fp{*a.m_field, a.m_field->arith().sub(UintT{0}, a.m_value)};
    }

    friend bool operator==(const Fp& a, const Fp& b) noexcept = default;
};

enum class LegendreSymbol
{
    zero,
    quadratic_residue,
    quadratic_non_residue,
};

/// Computes the Legendre symbol of x as x^((p-1)/2) (Euler's criterion).
template <typename UintT>
LegendreSymbol legendre_symbol(const Fp<UintT>& x) noexcept
{
    const auto s = x.pow(x.field().legendre_exponent());
    if (s.is_zero())
        return LegendreSymbol::zero;
    if (s == Fp<UintT>::one(x.field()))
        return LegendreSymbol::quadratic_residue;
    return LegendreSymbol::quadratic_non_residue;
}
}  // namespace ecparams
