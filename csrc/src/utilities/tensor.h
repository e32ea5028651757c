// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// Copyright (c) 2025, IST Austria, developed by Erik Schultheis
// SPDX-License-Identifier: Apache-2.0
//

#ifndef HALO_SRC_UTILS_TENSOR_H
#define HALO_SRC_UTILS_TENSOR_H

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

#include "dtype.h"
#include "utils.h"

constexpr int MAX_TENSOR_DIM = 4;

//! \brief The Tensor class represents a contiguous view on host memory that is associated
//! with a specific data type and shape. It never owns its memory.
struct Tensor {
    ETensorDType DType = ETensorDType::FP32;
    std::array<long, MAX_TENSOR_DIM> Sizes{};
    std::byte* Data = nullptr;
    int Rank = 0;

    [[nodiscard]] std::size_t bytes() const {
        return nelem() * get_dtype_size(DType);
    }

    [[nodiscard]] constexpr std::size_t nelem() const {
        std::size_t sz = 1;
        for(int i = 0; i < Rank; ++i) {
            sz *= Sizes[i];
        }
        return sz;
    }

    [[nodiscard]] bool is_null() const { return Data == nullptr; }

    template<class TargetType>
    [[nodiscard]] const TargetType* get() const {
        if(dtype_from_type<TargetType> != DType) {
            throw std::logic_error(std::string("DType mismatch: expected ") +
                dtype_to_str(dtype_from_type<TargetType>) + ", got " + dtype_to_str(DType));
        }

        return reinterpret_cast<const TargetType*>(Data);
    }

    template<typename TargetType>
    [[nodiscard]] TargetType* get() {
        if(dtype_from_type<TargetType> != DType) {
            throw std::logic_error(std::string("DType mismatch: expected ") +
                dtype_to_str(dtype_from_type<TargetType>) + ", got " + dtype_to_str(DType));
        }

        return reinterpret_cast<TargetType*>(Data);
    }

    template<typename Container>
    static Tensor from_pointer(std::byte* ptr, ETensorDType dtype, const Container& shape)
    {
        if(shape.size() > MAX_TENSOR_DIM) {
            throw std::runtime_error("Tensor rank too large");
        }

        int rank = narrow<int>(shape.size());
        std::array<long, MAX_TENSOR_DIM> sizes{};
        std::copy(shape.begin(), shape.end(), sizes.begin());
        std::fill(sizes.begin() + shape.size(), sizes.end(), 1);

        return Tensor{dtype, sizes, ptr, rank};
    }

    //! View of a float vector as a 1D tensor.
    static Tensor from_vector(std::vector<float>& values) {
        return from_pointer(reinterpret_cast<std::byte*>(values.data()), ETensorDType::FP32,
                            std::array<long, 1>{static_cast<long>(values.size())});
    }
};

//! A worker's part of a tensor that is split evenly along dimension 0.
class TensorShard : public Tensor {
public:
    TensorShard() = default;
    TensorShard(const Tensor& src);   // implicit

    template<typename Container>
    TensorShard(const Tensor& src, int idx, int num, const Container& global_shape)
        : Tensor(src), GlobalShape{}, ShardIndex(idx), NumShards(num) {
        std::copy(global_shape.begin(), global_shape.end(), GlobalShape.begin());
        std::fill(GlobalShape.begin() + global_shape.size(), GlobalShape.end(), 1);

        if(global_nelem() != src.nelem() * NumShards) {
            throw std::logic_error("Invalid global shape");
        }
    }

    [[nodiscard]] std::size_t global_nelem() const;

    std::array<long, MAX_TENSOR_DIM> GlobalShape{};
    int ShardIndex = 0;
    int NumShards = 1;
};

TensorShard shard_view(const Tensor& src, int idx, int num);

#endif //HALO_SRC_UTILS_TENSOR_H
