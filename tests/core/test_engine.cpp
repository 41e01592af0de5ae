#include <gtest/gtest.h>
#include "ssz/engine.hpp"
#include "ssz/constants.hpp"
#include <cmath>
#include <limits>
#include <string>
#include <vector>

using namespace ssz;
using namespace ssz::core;
using namespace ssz::constants;

namespace {

constexpr double NaN = std::numeric_limits<double>::quiet_NaN();
constexpr double RS_SUN = 2953.3393820668784;

CelestialObject neutron_star() {
    return CelestialObject{
        .name         = "NS_1.4",
        .mass_msun    = 1.4,
        .radius_m     = 12e3,
        .velocity_mps = 0.0,
        .z_obs        = std::nullopt,
    };
}

std::vector<CelestialObject> mixed_batch() {
    std::vector<CelestialObject> v;
    for (int i = 0; i < 40; ++i) {
        CelestialObject o{
            .name         = "obj_" + std::to_string(i),
            .mass_msun    = 1.0 + i,
            .radius_m     = (1.5 + 0.3 * i) * RS_SUN * (1.0 + i),
            .velocity_mps = 1e3 * i,
            .z_obs        = 0.1 + 0.01 * i,
        };
        if (i % 7 == 3) o.mass_msun = -1.0;   // rejected rows interleaved
        if (i % 11 == 5) o.name.clear();
        v.push_back(o);
    }
    return v;
}

} // namespace

// ─── Validation ───────────────────────────────────────────────────────────────

TEST(EngineValidate, ValidObject_NoError) {
    EXPECT_FALSE(Engine::validate(neutron_star(), PhysicalConstants{}).has_value());
}

TEST(EngineValidate, EmptyName_Rejected) {
    auto o = neutron_star();
    o.name.clear();
    auto err = Engine::validate(o, PhysicalConstants{});
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->kind, InputErrorKind::EmptyName);
}

TEST(EngineValidate, NonPositiveMass_Rejected) {
    for (double m : {0.0, -1.0, NaN}) {
        auto o = neutron_star();
        o.mass_msun = m;
        auto err = Engine::validate(o, PhysicalConstants{});
        ASSERT_TRUE(err.has_value()) << "mass=" << m;
        EXPECT_EQ(err->kind, InputErrorKind::NonPositiveMass);
        EXPECT_NE(err->message.find("NS_1.4"), std::string::npos);
    }
}

TEST(EngineValidate, MassOverflowingKg_Rejected) {
    auto o = neutron_star();
    o.mass_msun = 1e300;
    auto err = Engine::validate(o, PhysicalConstants{});
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->kind, InputErrorKind::NonPositiveMass);
}

TEST(EngineValidate, NonPositiveRadius_Rejected) {
    for (double r : {0.0, -10.0, std::numeric_limits<double>::infinity()}) {
        auto o = neutron_star();
        o.radius_m = r;
        auto err = Engine::validate(o, PhysicalConstants{});
        ASSERT_TRUE(err.has_value()) << "radius=" << r;
        EXPECT_EQ(err->kind, InputErrorKind::NonPositiveRadius);
    }
}

TEST(EngineValidate, SuperluminalVelocity_Rejected) {
    for (double v : {C, -C, 2.0 * C}) {
        auto o = neutron_star();
        o.velocity_mps = v;
        auto err = Engine::validate(o, PhysicalConstants{});
        ASSERT_TRUE(err.has_value()) << "v=" << v;
        EXPECT_EQ(err->kind, InputErrorKind::SuperluminalVelocity);
    }
}

TEST(EngineValidate, NaNVelocity_Accepted) {
    auto o = neutron_star();
    o.velocity_mps = NaN;
    EXPECT_FALSE(Engine::validate(o, PhysicalConstants{}).has_value());
}

TEST(EngineValidate, NonFiniteObservation_Rejected) {
    auto o = neutron_star();
    o.z_obs = NaN;
    auto err = Engine::validate(o, PhysicalConstants{});
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->kind, InputErrorKind::NonFiniteObservation);
}

// ─── Single Object ────────────────────────────────────────────────────────────

TEST(EngineCompute, NeutronStar_AllFields) {
    const Engine engine;
    auto r = engine.compute(neutron_star());
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r->name, "NS_1.4");
    EXPECT_EQ(r->regime, Regime::PhotonSphere);
    EXPECT_NEAR(r->mass_kg, 1.4 * M_SUN, 1e15);
    EXPECT_NEAR(r->r_s, 1.4 * RS_SUN, 1e-6);
    EXPECT_NEAR(r->x, 2.902283640, 1e-8);
    EXPECT_NEAR(r->xi, 0.5 / r->x, FLOAT_EPSILON);
    EXPECT_NEAR(r->d_ssz * (1.0 + r->xi), 1.0, FLOAT_EPSILON);
    EXPECT_NEAR(r->d_gr, std::sqrt(1.0 - 1.0 / r->x), 1e-12);
    EXPECT_NEAR(r->z_gr, 0.235185800, 1e-8);
    EXPECT_DOUBLE_EQ(r->z_sr, 0.0);
    EXPECT_NEAR(r->delta_m_pct, 1.252234634, 1e-8);
    EXPECT_NEAR(r->z_ssz_total, 0.238130879, 1e-8);
    EXPECT_FALSE(r->observation.has_value());
}

TEST(EngineCompute, Observation_ResidualsAndWinner) {
    const Engine engine;
    auto o  = neutron_star();
    o.z_obs = 0.2381;
    auto r = engine.compute(o);
    ASSERT_TRUE(r.has_value());
    ASSERT_TRUE(r->observation.has_value());
    EXPECT_NEAR(r->observation->residual_ssz, r->z_ssz_total - 0.2381, FLOAT_EPSILON);
    EXPECT_NEAR(r->observation->residual_gr, r->z_grsr - 0.2381, FLOAT_EPSILON);
    EXPECT_EQ(r->observation->winner, Winner::SSZ);
}

TEST(EngineCompute, InsideHorizon_NotAnError) {
    const Engine engine;
    CelestialObject o{.name = "inside", .mass_msun = 1.0, .radius_m = 0.5 * RS_SUN};
    auto r = engine.compute(o);
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r->regime, Regime::VeryClose);
    EXPECT_TRUE(std::isnan(r->z_gr));
    EXPECT_DOUBLE_EQ(r->d_gr, 0.0);
    EXPECT_TRUE(std::isfinite(r->d_ssz));
    EXPECT_GT(r->d_ssz, 0.0);
}

TEST(EngineCompute, InsideHorizonWithObservation_BothNaN_Tie) {
    const Engine engine;
    CelestialObject o{.name = "inside", .mass_msun = 1.0, .radius_m = 0.5 * RS_SUN,
                      .velocity_mps = 0.0, .z_obs = 0.5};
    auto r = engine.compute(o);
    ASSERT_TRUE(r.has_value());
    ASSERT_TRUE(r->observation.has_value());
    EXPECT_EQ(r->observation->winner, Winner::Tie);
}

TEST(EngineCompute, WeakField_SSZEqualsGR) {
    const Engine engine;
    CelestialObject sun{.name = "Sun", .mass_msun = 1.0, .radius_m = R_SUN,
                        .velocity_mps = 2e3, .z_obs = 2.2e-6};
    auto r = engine.compute(sun);
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r->regime, Regime::Weak);
    EXPECT_DOUBLE_EQ(r->delta_m_pct, 0.0);
    EXPECT_DOUBLE_EQ(r->z_ssz_total, r->z_grsr);
    ASSERT_TRUE(r->observation.has_value());
    EXPECT_EQ(r->observation->winner, Winner::Tie);
}

TEST(EngineCompute, NaNVelocity_TreatedAsZero) {
    const Engine engine;
    auto a = neutron_star();
    auto b = neutron_star();
    b.velocity_mps = NaN;
    auto ra = engine.compute(a);
    auto rb = engine.compute(b);
    ASSERT_TRUE(ra && rb);
    EXPECT_DOUBLE_EQ(rb->z_sr, 0.0);
    EXPECT_DOUBLE_EQ(ra->z_ssz_total, rb->z_ssz_total);
}

TEST(EngineCompute, InvalidInput_Nullopt) {
    const Engine engine;
    auto o = neutron_star();
    o.radius_m = -1.0;
    EXPECT_FALSE(engine.compute(o).has_value());
}

TEST(EngineCompute, Deterministic) {
    const Engine engine;
    auto o  = neutron_star();
    o.z_obs = 0.24;
    auto a = engine.compute(o);
    auto b = engine.compute(o);
    ASSERT_TRUE(a && b);
    EXPECT_EQ(a->z_ssz_total, b->z_ssz_total);
    EXPECT_EQ(a->xi, b->xi);
    EXPECT_EQ(a->observation->winner, b->observation->winner);
}

TEST(EngineCompute, ToString_ContainsNameAndRegime) {
    const Engine engine;
    auto o  = neutron_star();
    o.z_obs = 0.24;
    auto r = engine.compute(o);
    ASSERT_TRUE(r.has_value());
    const std::string s = r->to_string();
    EXPECT_NE(s.find("NS_1.4"), std::string::npos);
    EXPECT_NE(s.find("photon_sphere"), std::string::npos);
    EXPECT_NE(s.find("winner="), std::string::npos);
}

// ─── Configuration ────────────────────────────────────────────────────────────

TEST(EngineConfig, InvalidConfig_RejectedAsConfiguration) {
    RunConfig cfg;
    cfg.params.blend_upper = cfg.params.blend_lower;
    const Engine engine{cfg};
    auto out = engine.compute_checked(neutron_star());
    EXPECT_FALSE(out.ok());
    ASSERT_TRUE(out.error.has_value());
    EXPECT_EQ(out.error->kind, InputErrorKind::InvalidConfiguration);
    EXPECT_FALSE(engine.compute(neutron_star()).has_value());
}

TEST(EngineConfig, DefaultVersionTag) {
    const Engine engine;
    EXPECT_EQ(engine.config().version, "ssz-core/1.0");
    EXPECT_TRUE(engine.config().is_valid());
}

TEST(EngineConfig, StrongMode_ChangesXiOnly) {
    RunConfig cfg;
    cfg.xi_mode = XiMode::Strong;
    const Engine strong{cfg};
    const Engine automatic;
    auto a = automatic.compute(neutron_star());
    auto s = strong.compute(neutron_star());
    ASSERT_TRUE(a && s);
    EXPECT_NE(a->xi, s->xi);
    EXPECT_DOUBLE_EQ(a->z_ssz_total, s->z_ssz_total);
}

// ─── Winner ───────────────────────────────────────────────────────────────────

TEST(EngineWinner, SmallerAbsoluteResidualWins) {
    EXPECT_EQ(Engine::decide_winner(0.01, 0.02), Winner::SSZ);
    EXPECT_EQ(Engine::decide_winner(-0.01, 0.02), Winner::SSZ);
    EXPECT_EQ(Engine::decide_winner(0.03, -0.02), Winner::GR);
}

TEST(EngineWinner, EqualMagnitude_Tie) {
    EXPECT_EQ(Engine::decide_winner(0.01, -0.01), Winner::Tie);
    EXPECT_EQ(Engine::decide_winner(0.0, 0.0), Winner::Tie);
}

TEST(EngineWinner, WithinRelativeEpsilon_Tie) {
    EXPECT_EQ(Engine::decide_winner(1.0, 1.0 + 1e-13), Winner::Tie);
    EXPECT_EQ(Engine::decide_winner(1.0, 1.0 + 1e-9), Winner::SSZ);
}

TEST(EngineWinner, NonFiniteLoses) {
    EXPECT_EQ(Engine::decide_winner(NaN, 0.5), Winner::GR);
    EXPECT_EQ(Engine::decide_winner(0.5, NaN), Winner::SSZ);
    EXPECT_EQ(Engine::decide_winner(NaN, NaN), Winner::Tie);
}

TEST(EngineWinner, Symmetric) {
    EXPECT_EQ(Engine::decide_winner(0.1, 0.2), Winner::SSZ);
    EXPECT_EQ(Engine::decide_winner(0.2, 0.1), Winner::GR);
}

TEST(EngineWinner, ObservationMidpoint_Tie) {
    // z_obs exactly halfway between the two predictions.
    const auto obs = Engine::observe(0.3, 0.1, 0.2);
    EXPECT_EQ(obs.winner, Winner::Tie);
    EXPECT_NEAR(obs.residual_ssz, 0.1, FLOAT_EPSILON);
    EXPECT_NEAR(obs.residual_gr, -0.1, FLOAT_EPSILON);
}

// ─── Batch ────────────────────────────────────────────────────────────────────

TEST(EngineBatch, PreservesOrderAndRejections) {
    const Engine engine;
    const auto objects  = mixed_batch();
    const auto outcomes = engine.compute_batch(objects);
    ASSERT_EQ(outcomes.size(), objects.size());
    for (std::size_t i = 0; i < objects.size(); ++i) {
        EXPECT_EQ(outcomes[i].name, objects[i].name);
        const bool should_fail = objects[i].name.empty() || objects[i].mass_msun <= 0.0;
        EXPECT_EQ(outcomes[i].ok(), !should_fail) << "row " << i;
        EXPECT_EQ(outcomes[i].error.has_value(), should_fail) << "row " << i;
    }
}

TEST(EngineBatch, EmptyInput_EmptyOutput) {
    const Engine engine;
    EXPECT_TRUE(engine.compute_batch({}).empty());
    EXPECT_TRUE(engine.compute_batch_parallel({}, 4).empty());
}

TEST(EngineBatch, ParallelMatchesSequential) {
    const Engine engine;
    const auto objects = mixed_batch();
    const auto seq = engine.compute_batch(objects);
    for (unsigned threads : {0u, 1u, 3u, 8u, 64u}) {
        const auto par = engine.compute_batch_parallel(objects, threads);
        ASSERT_EQ(par.size(), seq.size()) << "threads=" << threads;
        for (std::size_t i = 0; i < seq.size(); ++i) {
            EXPECT_EQ(par[i].name, seq[i].name);
            ASSERT_EQ(par[i].ok(), seq[i].ok()) << "row " << i;
            if (seq[i].ok()) {
                EXPECT_EQ(par[i].result->z_ssz_total, seq[i].result->z_ssz_total);
                EXPECT_EQ(par[i].result->observation->winner,
                          seq[i].result->observation->winner);
            } else {
                EXPECT_EQ(par[i].error->kind, seq[i].error->kind);
            }
        }
    }
}

// ─── Labels ───────────────────────────────────────────────────────────────────

TEST(WinnerLabel, ParseAcceptsLegacyAlias) {
    EXPECT_EQ(parse_winner("SEG"), Winner::SSZ);
    EXPECT_EQ(parse_winner("SSZ"), Winner::SSZ);
    EXPECT_EQ(parse_winner("GR"), Winner::GR);
    EXPECT_EQ(parse_winner("TIE"), Winner::Tie);
    EXPECT_FALSE(parse_winner("gr").has_value());
}

TEST(WinnerLabel, ToString) {
    EXPECT_STREQ(to_string(Winner::SSZ), "SSZ");
    EXPECT_STREQ(to_string(Winner::GR), "GR");
    EXPECT_STREQ(to_string(Winner::Tie), "TIE");
}
