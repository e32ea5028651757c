// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#ifndef HALO_SRC_LOSSES_LOSS_H
#define HALO_SRC_LOSSES_LOSS_H

#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace losses {

//! How examples are shaped for a loss, and therefore which data source and batch layout it needs.
enum class ELossShape {
    SFT,        // one desirable response per example
    PAIRED,     // chosen + rejected response for the same prompt
    UNPAIRED    // one response with a desirable/undesirable label
};

//! Static properties of a registered loss.
struct LossTraits {
    std::string_view Name;
    ELossShape Shape;
    bool RequiresReference;
    bool UsesKLCompanions;
    std::string_view TrainerTag;
    std::string_view DataloaderTag;
};

//! Hyper-parameters shared by the loss family; each loss reads the ones it needs.
struct LossParams {
    float Beta = 0.1f;
    float DesirableWeight = 1.0f;
    float UndesirableWeight = 1.0f;
    float LambdaCoef = 0.1f;
};

/**
 * @brief Per-example log-probabilities of one micro-batch.
 *
 * "Chosen" means chosen (paired), desirable (unpaired) or the target (sft).
 * Reference values are absent when the run has no reference model.
 */
struct LossInputs {
    std::vector<float> PolicyChosen;
    std::vector<float> PolicyRejected;
    std::optional<std::vector<float>> ReferenceChosen;
    std::optional<std::vector<float>> ReferenceRejected;
    //! detached KL reference point, already averaged over workers and clamped (kto only)
    std::optional<float> KL;
};

struct LossResult {
    //! one loss per pair (paired), per example (sft) or chosen losses followed by rejected losses (unpaired)
    std::vector<float> Losses;
    std::vector<float> ChosenRewards;
    std::vector<float> RejectedRewards;
    float Loss = 0.f;
    //! d Loss / d PolicyChosen and d Loss / d PolicyRejected
    std::vector<float> GradChosen;
    std::vector<float> GradRejected;
    std::optional<float> KLEstimate;
};

struct SFTLoss {
    LossResult compute(const LossInputs& in) const;
};

struct DPOLoss {
    LossParams Params;
    LossResult compute(const LossInputs& in) const;
};

struct SLiCLoss {
    LossParams Params;
    LossResult compute(const LossInputs& in) const;
};

struct KTOLoss {
    LossParams Params;
    LossResult compute(const LossInputs& in) const;
};

struct SimpleKTOLoss {
    LossParams Params;
    LossResult compute(const LossInputs& in) const;
};

struct KTOZeroLoss {
    LossParams Params;
    LossResult compute(const LossInputs& in) const;
};

using LossStrategy = std::variant<SFTLoss, DPOLoss, SLiCLoss, KTOLoss, SimpleKTOLoss, KTOZeroLoss>;

//! Traits of the loss registered under `name`. @throws ConfigError for unknown names.
const LossTraits& loss_traits(std::string_view name);
const LossTraits& loss_traits(const LossStrategy& loss);
std::vector<std::string> registered_losses();

//! Builds the loss registered under `name`. @throws ConfigError for unknown names.
LossStrategy make_loss(std::string_view name, const LossParams& params);

LossResult compute_loss(const LossStrategy& loss, const LossInputs& inputs);

//! Local part of the KL reference point: mean(policy - reference) over the mismatched companions.
float kl_local_estimate(const std::vector<float>& policy_kl, const std::vector<float>& reference_kl);

} // namespace losses

#endif //HALO_SRC_LOSSES_LOSS_H
