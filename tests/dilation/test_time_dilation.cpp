#include <gtest/gtest.h>
#include "ssz/dilation.hpp"
#include "ssz/constants.hpp"
#include "ssz/redshift.hpp"
#include "ssz/segment_density.hpp"
#include <cmath>

using namespace ssz;
using namespace ssz::dilation;
using namespace ssz::constants;

namespace {

const RunConfig CFG{};

} // namespace

// ─── D_SSZ ────────────────────────────────────────────────────────────────────

TEST(TimeDilationSSZ, FromXi_Zero_IsOne) {
    EXPECT_DOUBLE_EQ(TimeDilation::from_xi(0.0), 1.0);
}

TEST(TimeDilationSSZ, AtHorizon_0p555) {
    auto d = TimeDilation::ssz(1.0, 1.0, XiMode::Auto, CFG);
    ASSERT_TRUE(d.has_value());
    EXPECT_NEAR(*d, D_SSZ_AT_HORIZON, FLOAT_EPSILON);
    EXPECT_NEAR(*d, 0.555, 1e-3);
}

TEST(TimeDilationSSZ, FiniteAndPositiveInsideHorizon) {
    for (double x : {1e-4, 0.1, 0.5, 0.99}) {
        auto d = TimeDilation::ssz(x, 1.0, XiMode::Auto, CFG);
        ASSERT_TRUE(d.has_value());
        EXPECT_TRUE(std::isfinite(*d));
        EXPECT_GT(*d, 0.0) << "at x=" << x;
        EXPECT_LE(*d, 1.0) << "at x=" << x;
    }
}

TEST(TimeDilationSSZ, IdentityWithXi) {
    for (XiMode mode : {XiMode::Auto, XiMode::Weak, XiMode::Strong}) {
        for (double x : {0.3, 1.0, 1.9, 2.05, 5.0, 1e3}) {
            auto d  = TimeDilation::ssz(x, 1.0, mode, CFG);
            auto xi = density::SegmentDensity::evaluate(x, 1.0, mode, CFG);
            ASSERT_TRUE(d && xi);
            EXPECT_NEAR(*d * (1.0 + *xi), 1.0, FLOAT_EPSILON)
                << "mode=" << to_string(mode) << " x=" << x;
        }
    }
}

TEST(TimeDilationSSZ, InvalidGeometry_Nullopt) {
    EXPECT_FALSE(TimeDilation::ssz(1.0, 0.0, XiMode::Auto, CFG).has_value());
    EXPECT_FALSE(TimeDilation::ssz(-1.0, 1.0, XiMode::Auto, CFG).has_value());
}

// ─── D_GR ─────────────────────────────────────────────────────────────────────

TEST(TimeDilationGR, AtHorizon_Zero) {
    auto d = TimeDilation::gr(1.0, 1.0);
    ASSERT_TRUE(d.has_value());
    EXPECT_DOUBLE_EQ(*d, 0.0);
}

TEST(TimeDilationGR, InsideHorizon_Zero) {
    auto d = TimeDilation::gr(0.5, 1.0);
    ASSERT_TRUE(d.has_value());
    EXPECT_DOUBLE_EQ(*d, 0.0);
}

TEST(TimeDilationGR, FourRs_ExactValue) {
    auto d = TimeDilation::gr(4.0, 1.0);
    ASSERT_TRUE(d.has_value());
    EXPECT_NEAR(*d, std::sqrt(0.75), FLOAT_EPSILON);
}

TEST(TimeDilationGR, JustOutsideHorizon_ClampedPositive) {
    auto d = TimeDilation::gr(1.0 + 1e-12, 1.0);
    ASSERT_TRUE(d.has_value());
    EXPECT_GT(*d, 0.0);
    EXPECT_NEAR(*d, std::sqrt(1.0 - GR_RATIO_CLAMP), 1e-9);
}

TEST(TimeDilationGR, InvalidGeometry_Nullopt) {
    EXPECT_FALSE(TimeDilation::gr(1.0, 0.0).has_value());
    EXPECT_FALSE(TimeDilation::gr(0.0, 1.0).has_value());
}

// ─── Comparison ───────────────────────────────────────────────────────────────

TEST(TimeDilationCompare, DeltaIsDifference) {
    auto c = TimeDilation::compare(5.0, 1.0, XiMode::Auto, CFG);
    ASSERT_TRUE(c.has_value());
    EXPECT_NEAR(c->delta, c->d_ssz - c->d_gr, FLOAT_EPSILON);
    EXPECT_NEAR(c->delta_pct, 100.0 * c->delta / c->d_gr, 1e-9);
}

TEST(TimeDilationCompare, AtHorizon_PercentIsNaN) {
    auto c = TimeDilation::compare(1.0, 1.0, XiMode::Auto, CFG);
    ASSERT_TRUE(c.has_value());
    EXPECT_DOUBLE_EQ(c->d_gr, 0.0);
    EXPECT_GT(c->d_ssz, 0.0);
    EXPECT_TRUE(std::isnan(c->delta_pct));
}

TEST(TimeDilationCompare, WeakField_Agrees) {
    // Far from the mass D_SSZ and D_GR agree to O((r_s/r)²).
    auto c = TimeDilation::compare(1e6, 1.0, XiMode::Auto, CFG);
    ASSERT_TRUE(c.has_value());
    EXPECT_NEAR(c->d_ssz, c->d_gr, 1e-11);
}

// ─── Dual Velocity ────────────────────────────────────────────────────────────

TEST(DualVelocity, ProductIsCSquared) {
    for (double x : {2.0, 5.0, 10.0, 100.0}) {
        auto dv = TimeDilation::dual_velocity(x * 2953.34, 2953.34, C);
        ASSERT_TRUE(dv.has_value());
        EXPECT_NEAR(dv->product / (C * C), 1.0, 1e-12) << "at x=" << x;
    }
}

TEST(DualVelocity, AtHorizon_EscapeIsC) {
    auto dv = TimeDilation::dual_velocity(1.0, 1.0, C);
    ASSERT_TRUE(dv.has_value());
    EXPECT_NEAR(dv->v_esc, C, 1e-6);
    EXPECT_NEAR(dv->v_fall, C, 1e-6);
}

TEST(DualVelocity, FourRs_EscapeIsHalfC) {
    auto dv = TimeDilation::dual_velocity(4.0, 1.0, C);
    ASSERT_TRUE(dv.has_value());
    EXPECT_NEAR(dv->v_esc / C, 0.5, FLOAT_EPSILON);
    EXPECT_NEAR(dv->v_fall / C, 2.0, FLOAT_EPSILON);
}

TEST(DualVelocity, InvalidInput_Nullopt) {
    EXPECT_FALSE(TimeDilation::dual_velocity(0.0, 1.0, C).has_value());
    EXPECT_FALSE(TimeDilation::dual_velocity(1.0, 1.0, 0.0).has_value());
}

// ─── Universal Intersection ───────────────────────────────────────────────────

TEST(UniversalIntersection, CurvesCrossAtRStar) {
    for (double m_msun : {1.0, 10.0, 4.297e6, 6.5e9}) {
        auto p = TimeDilation::universal_intersection(m_msun * M_SUN, CFG);
        ASSERT_TRUE(p.has_value());
        EXPECT_NEAR(p->r_star / p->r_s, INTERSECTION_R_OVER_RS, 1e-12);
        EXPECT_NEAR(p->d_ssz, p->d_gr, 1e-5) << "M=" << m_msun;
        EXPECT_NEAR(p->d_ssz, INTERSECTION_D_STAR, 1e-5) << "M=" << m_msun;
    }
}

TEST(UniversalIntersection, MassIndependentDStar) {
    auto a = TimeDilation::universal_intersection(M_SUN, CFG);
    auto b = TimeDilation::universal_intersection(1e9 * M_SUN, CFG);
    ASSERT_TRUE(a && b);
    EXPECT_NEAR(a->d_ssz, b->d_ssz, 1e-12);
    EXPECT_NEAR(b->r_s / a->r_s, 1e9, 1e-3);
}

TEST(UniversalIntersection, NonPositiveMass_Nullopt) {
    EXPECT_FALSE(TimeDilation::universal_intersection(0.0, CFG).has_value());
    EXPECT_FALSE(TimeDilation::universal_intersection(-M_SUN, CFG).has_value());
}
