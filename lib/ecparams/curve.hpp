// ecparams: Pairing curve parameters decoding
// Copyright 2026 The ecparams Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <utility>

namespace ecparams
{
/// Short Weierstrass curve y² = x³ + a⋅x + b over Fp, Fp2 or Fp3.
///
/// Points keep a pointer to the curve, so the curve must outlive them.
template <typename ElemT>
class WeierstrassCurve
{
    ElemT m_a;
    ElemT m_b;

public:
    using field_type = typename ElemT::field_type;

    WeierstrassCurve(const ElemT& a, const ElemT& b) noexcept : m_a{a}, m_b{b} {}

    WeierstrassCurve(const WeierstrassCurve&) = delete;
    WeierstrassCurve& operator=(const WeierstrassCurve&) = delete;

    const field_type& field() const noexcept { return m_a.field(); }

    const ElemT& a() const noexcept { return m_a; }

    const ElemT& b() const noexcept { return m_b; }
};

/// The affine point on a WeierstrassCurve. The (0, 0) pair encodes the point at infinity.
template <typename ElemT>
class CurvePoint
{
    const WeierstrassCurve<ElemT>* m_curve;
    ElemT m_x;
    ElemT m_y;

    CurvePoint(const WeierstrassCurve<ElemT>& curve, const ElemT& x, const ElemT& y) noexcept
      : m_curve{&curve}, m_x{x}, m_y{y}
    {}

public:
    /// Creates a point without checking that it is on the curve.
    static CurvePoint point_from_xy(
        const WeierstrassCurve<ElemT>& curve, const ElemT& x, const ElemT& y) noexcept
    {
        return {curve, x, y};
    }

    const WeierstrassCurve<ElemT>& curve() const noexcept { return *m_curve; }

    const ElemT& x() const noexcept { return m_x; }

    const ElemT& y() const noexcept { return m_y; }

    std::pair<ElemT, ElemT> into_xy() const noexcept { return {m_x, m_y}; }

    /// Checks if the point represents the special "infinity" value.
    [[nodiscard]] bool is_zero() const noexcept { return m_x.is_zero() && m_y.is_zero(); }

    /// Checks the curve equation. The point at infinity is on every curve.
    [[nodiscard]] bool is_on_curve() const noexcept
    {
        if (is_zero())
            return true;

        const auto rhs = m_x.square() * m_x + m_curve->a() * m_x + m_curve->b();
        return m_y.square() == rhs;
    }

    friend bool operator==(const CurvePoint& p, const CurvePoint& q) noexcept = default;
};
}  // namespace ecparams
