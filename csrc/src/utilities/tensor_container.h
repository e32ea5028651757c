// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#ifndef HALO_SRC_UTILS_TENSOR_CONTAINER_H
#define HALO_SRC_UTILS_TENSOR_CONTAINER_H

#include <functional>
#include <string>

class TensorShard;

//! \brief Anything that exposes a set of named tensors, e.g. for (de)serialization.
class ITensorContainer {
public:
    virtual ~ITensorContainer() = default;
    virtual void iterate_tensors(const std::function<void(std::string, const TensorShard&)>& callback) = 0;
};

#endif //HALO_SRC_UTILS_TENSOR_CONTAINER_H
