// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <cmath>
#include <vector>

#include "losses/loss.h"
#include "utilities/utils.h"

using Catch::Approx;
using namespace losses;

namespace {

LossInputs paired_inputs(std::vector<float> pc, std::vector<float> pr, std::vector<float> rc, std::vector<float> rr) {
    LossInputs in;
    in.PolicyChosen = std::move(pc);
    in.PolicyRejected = std::move(pr);
    in.ReferenceChosen = std::move(rc);
    in.ReferenceRejected = std::move(rr);
    return in;
}

// central finite difference of the loss w.r.t. one policy input
float numeric_grad(const LossStrategy& loss, LossInputs in, bool chosen, std::size_t i) {
    const float eps = 1e-2f;
    auto& v = chosen ? in.PolicyChosen : in.PolicyRejected;
    v[i] += eps;
    float plus = compute_loss(loss, in).Loss;
    v[i] -= 2 * eps;
    float minus = compute_loss(loss, in).Loss;
    return (plus - minus) / (2 * eps);
}

} // namespace

TEST_CASE("losses: registry resolves names and rejects unknown ones", "[losses]") {
    CHECK(registered_losses() == std::vector<std::string>{"sft", "dpo", "slic", "kto", "simple-kto", "kto-zero"});
    CHECK(loss_traits("dpo").Shape == ELossShape::PAIRED);
    CHECK(loss_traits("kto").UsesKLCompanions);
    CHECK_FALSE(loss_traits("slic").RequiresReference);
    CHECK(loss_traits(make_loss("kto-zero", {})).Name == "kto-zero");
    CHECK_THROWS_AS(make_loss("ppo", {}), ConfigError);
}

TEST_CASE("losses: sft is the mean negative log-likelihood", "[losses]") {
    LossInputs in;
    in.PolicyChosen = {-2.f, -4.f};
    LossResult r = compute_loss(make_loss("sft", {}), in);
    CHECK(r.Loss == Approx(3.f));
    REQUIRE(r.GradChosen.size() == 2);
    CHECK(r.GradChosen[0] == Approx(-0.5f));
    CHECK(r.ChosenRewards.empty());
}

TEST_CASE("losses: sft ignores reference log-probabilities", "[losses]") {
    LossInputs plain;
    plain.PolicyChosen = {-1.f, -3.f};
    LossInputs with_ref = plain;
    with_ref.ReferenceChosen = std::vector<float>{-10.f, 5.f};
    auto loss = make_loss("sft", {});
    CHECK(compute_loss(loss, plain).Loss == compute_loss(loss, with_ref).Loss);
}

TEST_CASE("losses: dpo at zero margin is log 2", "[losses]") {
    auto loss = make_loss("dpo", {.Beta = 0.5f});
    LossResult r = compute_loss(loss, paired_inputs({-3.f}, {-5.f}, {-3.f}, {-5.f}));
    CHECK(r.Loss == Approx(std::log(2.f)));
    CHECK(r.ChosenRewards[0] == Approx(0.f));
}

TEST_CASE("losses: dpo swaps sign when chosen and rejected are swapped", "[losses]") {
    auto loss = make_loss("dpo", {.Beta = 0.1f});
    LossResult a = compute_loss(loss, paired_inputs({-1.f}, {-4.f}, {-2.f}, {-3.f}));
    LossResult b = compute_loss(loss, paired_inputs({-4.f}, {-1.f}, {-3.f}, {-2.f}));
    // margin z in a, -z in b: softplus(-z) - softplus(z) = -z
    float z = 0.1f * ((-1.f + 2.f) - (-4.f + 3.f));
    CHECK(a.Loss - b.Loss == Approx(-z));
    CHECK(a.Loss < b.Loss);
}

TEST_CASE("losses: analytic gradients match finite differences", "[losses]") {
    // simple-kto reference points move with the policy; its gradient treats them as constants
    auto name = GENERATE("dpo", "slic", "kto-zero", "kto");
    auto loss = make_loss(name, {.Beta = 0.3f, .DesirableWeight = 1.5f, .UndesirableWeight = 0.7f, .LambdaCoef = 0.2f});
    LossInputs in = paired_inputs({-2.f, -1.5f}, {-1.f, -3.f}, {-2.5f, -1.f}, {-1.5f, -2.f});
    in.KL = 0.25f;
    LossResult r = compute_loss(loss, in);
    for (std::size_t i = 0; i < 2; ++i) {
        INFO(name << " item " << i);
        CHECK(r.GradChosen[i] == Approx(numeric_grad(loss, in, true, i)).margin(2e-3));
        CHECK(r.GradRejected[i] == Approx(numeric_grad(loss, in, false, i)).margin(2e-3));
    }
}

TEST_CASE("losses: slic hinge switches off once the margin exceeds beta", "[losses]") {
    auto loss = make_loss("slic", {.Beta = 1.f, .LambdaCoef = 0.f});
    LossInputs in;
    in.PolicyChosen = {-1.f};
    in.PolicyRejected = {-5.f};
    LossResult r = compute_loss(loss, in);
    CHECK(r.Loss == Approx(0.f));
    CHECK(r.GradRejected[0] == 0.f);
}

TEST_CASE("losses: unpaired losses reject a batch without one of the classes", "[losses]") {
    auto name = GENERATE("kto", "simple-kto", "kto-zero");
    LossInputs in;
    in.PolicyChosen = {-1.f, -2.f};
    in.ReferenceChosen = std::vector<float>{-1.f, -2.f};
    in.ReferenceRejected = std::vector<float>{};
    in.KL = 0.f;
    CHECK_THROWS_AS(compute_loss(make_loss(name, {}), in), DataError);
}

TEST_CASE("losses: kto clamps the KL reference point and reports it", "[losses]") {
    auto loss = make_loss("kto", {.Beta = 1.f});
    LossInputs in = paired_inputs({-1.f}, {-1.f}, {-1.f}, {-1.f});
    in.KL = -3.f;
    LossResult r = compute_loss(loss, in);
    REQUIRE(r.KLEstimate);
    CHECK(*r.KLEstimate == 0.f);
    // both log-ratios are zero: each loss is 1 - sigmoid(0)
    CHECK(r.Loss == Approx(0.5f));
}

TEST_CASE("losses: kto without a KL reference point is a programming error", "[losses]") {
    LossInputs in = paired_inputs({-1.f}, {-1.f}, {-1.f}, {-1.f});
    CHECK_THROWS_AS(compute_loss(make_loss("kto", {}), in), std::logic_error);
}

TEST_CASE("losses: kl estimate is the mean policy-reference difference", "[losses]") {
    CHECK(kl_local_estimate({-1.f, -2.f}, {-2.f, -4.f}) == Approx(1.5f));
}
