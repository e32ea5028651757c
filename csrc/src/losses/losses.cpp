// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "loss.h"

#include <algorithm>
#include <array>
#include <numeric>
#include <stdexcept>

#include <fmt/core.h>

#include "utilities/utils.h"

namespace losses {

namespace {

constexpr std::array<LossTraits, 6> kRegistry = {{
    {"sft",        ELossShape::SFT,      false, false, "SFTTrainer",       "SFTDataLoader"},
    {"dpo",        ELossShape::PAIRED,   true,  false, "DPOTrainer",       "PairedPreferenceDataLoader"},
    {"slic",       ELossShape::PAIRED,   false, false, "SLiCTrainer",      "PairedPreferenceDataLoader"},
    {"kto",        ELossShape::UNPAIRED, true,  true,  "KTOTrainer",       "UnpairedPreferenceDataLoader"},
    {"simple-kto", ELossShape::UNPAIRED, true,  false, "SimpleKTOTrainer", "UnpairedPreferenceDataLoader"},
    {"kto-zero",   ELossShape::UNPAIRED, true,  false, "KTOZeroTrainer",   "UnpairedPreferenceDataLoader"},
}};

// index into kRegistry, in the order of the LossStrategy alternatives
template<class T> constexpr std::size_t registry_index = 0;
template<> constexpr std::size_t registry_index<SFTLoss> = 0;
template<> constexpr std::size_t registry_index<DPOLoss> = 1;
template<> constexpr std::size_t registry_index<SLiCLoss> = 2;
template<> constexpr std::size_t registry_index<KTOLoss> = 3;
template<> constexpr std::size_t registry_index<SimpleKTOLoss> = 4;
template<> constexpr std::size_t registry_index<KTOZeroLoss> = 5;

float mean(const std::vector<float>& values) {
    if (values.empty()) return 0.f;
    return std::accumulate(values.begin(), values.end(), 0.f) / static_cast<float>(values.size());
}

const std::vector<float>& require_reference(const std::optional<std::vector<float>>& ref, const std::vector<float>& policy,
                                            std::string_view loss) {
    if (!ref) {
        throw std::logic_error(fmt::format("{}: reference log-probabilities are required", loss));
    }
    if (ref->size() != policy.size()) {
        throw std::logic_error(fmt::format("{}: {} policy but {} reference log-probabilities", loss, policy.size(), ref->size()));
    }
    return *ref;
}

void require_both_classes(const LossInputs& in, std::string_view loss) {
    if (in.PolicyChosen.empty() || in.PolicyRejected.empty()) {
        throw DataError(fmt::format("{}: micro-batch has {} desirable and {} undesirable examples; both classes are required",
                                    loss, in.PolicyChosen.size(), in.PolicyRejected.size()));
    }
}

void require_pairs(const LossInputs& in, std::string_view loss) {
    if (in.PolicyChosen.size() != in.PolicyRejected.size()) {
        throw DataError(fmt::format("{}: {} chosen but {} rejected responses", loss, in.PolicyChosen.size(), in.PolicyRejected.size()));
    }
    if (in.PolicyChosen.empty()) {
        throw DataError(fmt::format("{}: empty micro-batch", loss));
    }
}

std::vector<float> log_ratios(const std::vector<float>& policy, const std::vector<float>& reference) {
    std::vector<float> result(policy.size());
    for (std::size_t i = 0; i < policy.size(); ++i) {
        result[i] = policy[i] - reference[i];
    }
    return result;
}

std::vector<float> scaled(const std::vector<float>& values, float scale) {
    std::vector<float> result(values.size());
    std::transform(values.begin(), values.end(), result.begin(), [scale](float v) { return scale * v; });
    return result;
}

/**
 * @brief Shared body of the Kahneman-Tversky family.
 *
 * Desirable:   w_d * (1 - sigmoid(beta * (ratio - ref_desirable)))
 * Undesirable: w_u * (1 - sigmoid(beta * (ref_undesirable - ratio)))
 * The reference points are constants for the gradient.
 */
LossResult kt_losses(const LossInputs& in, const LossParams& p, float ref_desirable, float ref_undesirable,
                     float w_d, float w_u) {
    const auto& chosen_ratio = log_ratios(in.PolicyChosen, *in.ReferenceChosen);
    const auto& rejected_ratio = log_ratios(in.PolicyRejected, *in.ReferenceRejected);
    const float n = static_cast<float>(chosen_ratio.size() + rejected_ratio.size());

    LossResult result;
    result.GradChosen.resize(chosen_ratio.size());
    result.GradRejected.resize(rejected_ratio.size());
    for (std::size_t i = 0; i < chosen_ratio.size(); ++i) {
        float s = sigmoid(p.Beta * (chosen_ratio[i] - ref_desirable));
        result.Losses.push_back(w_d * (1.f - s));
        result.GradChosen[i] = -w_d * s * (1.f - s) * p.Beta / n;
    }
    for (std::size_t i = 0; i < rejected_ratio.size(); ++i) {
        float s = sigmoid(p.Beta * (ref_undesirable - rejected_ratio[i]));
        result.Losses.push_back(w_u * (1.f - s));
        result.GradRejected[i] = w_u * s * (1.f - s) * p.Beta / n;
    }
    result.Loss = mean(result.Losses);
    result.ChosenRewards = scaled(chosen_ratio, p.Beta);
    result.RejectedRewards = scaled(rejected_ratio, p.Beta);
    return result;
}

} // namespace

/**
 * @brief Negative log-likelihood of the target responses.
 */
LossResult SFTLoss::compute(const LossInputs& in) const {
    if (in.PolicyChosen.empty()) {
        throw DataError("sft: empty micro-batch");
    }
    LossResult result;
    const float n = static_cast<float>(in.PolicyChosen.size());
    result.Losses = scaled(in.PolicyChosen, -1.f);
    result.Loss = mean(result.Losses);
    result.GradChosen.assign(in.PolicyChosen.size(), -1.f / n);
    result.GradRejected.assign(in.PolicyRejected.size(), 0.f);
    return result;
}

/**
 * @brief Direct preference optimization: -log sigmoid(beta * (chosen log-ratio - rejected log-ratio)).
 */
LossResult DPOLoss::compute(const LossInputs& in) const {
    require_pairs(in, "dpo");
    const auto& ref_c = require_reference(in.ReferenceChosen, in.PolicyChosen, "dpo");
    const auto& ref_r = require_reference(in.ReferenceRejected, in.PolicyRejected, "dpo");

    const auto chosen_ratio = log_ratios(in.PolicyChosen, ref_c);
    const auto rejected_ratio = log_ratios(in.PolicyRejected, ref_r);
    const float n = static_cast<float>(chosen_ratio.size());

    LossResult result;
    result.GradChosen.resize(chosen_ratio.size());
    result.GradRejected.resize(rejected_ratio.size());
    for (std::size_t i = 0; i < chosen_ratio.size(); ++i) {
        float z = Params.Beta * (chosen_ratio[i] - rejected_ratio[i]);
        result.Losses.push_back(-log_sigmoid(z));
        // d/dz -log sigmoid(z) = -sigmoid(-z)
        float dz = -sigmoid(-z) * Params.Beta / n;
        result.GradChosen[i] = dz;
        result.GradRejected[i] = -dz;
    }
    result.Loss = mean(result.Losses);
    result.ChosenRewards = scaled(chosen_ratio, Params.Beta);
    result.RejectedRewards = scaled(rejected_ratio, Params.Beta);
    return result;
}

/**
 * @brief Sequence likelihood calibration: hinge on the policy margin plus a likelihood regularizer.
 */
LossResult SLiCLoss::compute(const LossInputs& in) const {
    require_pairs(in, "slic");
    const float n = static_cast<float>(in.PolicyChosen.size());

    LossResult result;
    result.GradChosen.resize(in.PolicyChosen.size());
    result.GradRejected.resize(in.PolicyRejected.size());
    for (std::size_t i = 0; i < in.PolicyChosen.size(); ++i) {
        float hinge = Params.Beta - in.PolicyChosen[i] + in.PolicyRejected[i];
        bool active = hinge > 0.f;
        result.Losses.push_back(std::max(0.f, hinge) + Params.LambdaCoef * (-in.PolicyChosen[i]));
        result.GradChosen[i] = ((active ? -1.f : 0.f) - Params.LambdaCoef) / n;
        result.GradRejected[i] = (active ? 1.f : 0.f) / n;
    }
    result.Loss = mean(result.Losses);
    result.ChosenRewards = in.PolicyChosen;
    result.RejectedRewards = in.PolicyRejected;
    return result;
}

/**
 * @brief Kahneman-Tversky optimization with a batch-wide KL reference point.
 *
 * The reference point is estimated from mismatched prompt/response pairs and
 * handed in through LossInputs::KL; it is not differentiated.
 */
LossResult KTOLoss::compute(const LossInputs& in) const {
    require_both_classes(in, "kto");
    require_reference(in.ReferenceChosen, in.PolicyChosen, "kto");
    require_reference(in.ReferenceRejected, in.PolicyRejected, "kto");
    if (!in.KL) {
        throw std::logic_error("kto: KL reference point is missing");
    }
    float kl = std::max(0.f, *in.KL);
    LossResult result = kt_losses(in, Params, kl, kl, Params.DesirableWeight, Params.UndesirableWeight);
    result.KLEstimate = kl;
    return result;
}

/**
 * @brief KTO variant whose reference point for each class is the mean log-ratio of the other class.
 */
LossResult SimpleKTOLoss::compute(const LossInputs& in) const {
    require_both_classes(in, "simple-kto");
    const auto& ref_c = require_reference(in.ReferenceChosen, in.PolicyChosen, "simple-kto");
    const auto& ref_r = require_reference(in.ReferenceRejected, in.PolicyRejected, "simple-kto");

    float chosen_kl = std::max(0.f, mean(log_ratios(in.PolicyChosen, ref_c)));
    float rejected_kl = std::max(0.f, mean(log_ratios(in.PolicyRejected, ref_r)));
    return kt_losses(in, Params, rejected_kl, chosen_kl, 1.f, 1.f);
}

/**
 * @brief KTO with the reference point fixed at zero.
 */
LossResult KTOZeroLoss::compute(const LossInputs& in) const {
    require_both_classes(in, "kto-zero");
    require_reference(in.ReferenceChosen, in.PolicyChosen, "kto-zero");
    require_reference(in.ReferenceRejected, in.PolicyRejected, "kto-zero");
    return kt_losses(in, Params, 0.f, 0.f, 1.f, 1.f);
}

const LossTraits& loss_traits(std::string_view name) {
    for (const auto& traits : kRegistry) {
        if (traits.Name == name) {
            return traits;
        }
    }
    throw ConfigError(fmt::format("Unknown loss `{}`", name));
}

const LossTraits& loss_traits(const LossStrategy& loss) {
    return std::visit([](const auto& l) -> const LossTraits& {
        return kRegistry[registry_index<std::decay_t<decltype(l)>>];
    }, loss);
}

std::vector<std::string> registered_losses() {
    std::vector<std::string> names;
    for (const auto& traits : kRegistry) {
        names.emplace_back(traits.Name);
    }
    return names;
}

LossStrategy make_loss(std::string_view name, const LossParams& params) {
    const LossTraits& traits = loss_traits(name);
    if (traits.Name == "sft") return SFTLoss{};
    if (traits.Name == "dpo") return DPOLoss{params};
    if (traits.Name == "slic") return SLiCLoss{params};
    if (traits.Name == "kto") return KTOLoss{params};
    if (traits.Name == "simple-kto") return SimpleKTOLoss{params};
    return KTOZeroLoss{params};
}

LossResult compute_loss(const LossStrategy& loss, const LossInputs& inputs) {
    return std::visit([&](const auto& l) { return l.compute(inputs); }, loss);
}

float kl_local_estimate(const std::vector<float>& policy_kl, const std::vector<float>& reference_kl) {
    if (policy_kl.size() != reference_kl.size()) {
        throw std::logic_error(fmt::format("KL estimate: {} policy but {} reference log-probabilities",
                                           policy_kl.size(), reference_kl.size()));
    }
    return mean(log_ratios(policy_kl, reference_kl));
}

} // namespace losses
