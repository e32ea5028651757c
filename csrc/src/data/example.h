// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#ifndef HALO_SRC_DATA_EXAMPLE_H
#define HALO_SRC_DATA_EXAMPLE_H

#include <string>

//! Shape of the examples produced by a source.
enum class EExampleShape {
    SFT,        // prompt + one target response
    PAIRED,     // prompt + chosen + rejected
    UNPAIRED    // prompt + one response labelled desirable or undesirable
};

const char* example_shape_to_str(EExampleShape shape);

/**
 * @brief One raw training unit, as read from a dataset record.
 *
 * `Chosen` holds the target (sft), the chosen response (paired) or the single
 * response (unpaired, with `Desirable` giving its label).
 */
struct Example {
    std::string Id;
    //! stable key linking the two halves of a paired record that was split into unpaired examples
    std::string PairKey;
    std::string Dataset;
    std::string Prompt;
    std::string Chosen;
    std::string Rejected;
    bool Desirable = true;
};

#endif //HALO_SRC_DATA_EXAMPLE_H
