// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// Copyright (c) 2025, IST Austria, developed by Erik Schultheis
// SPDX-License-Identifier: Apache-2.0
//

#ifndef HALO_SRC_UTILS_COMM_H
#define HALO_SRC_UTILS_COMM_H

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <functional>
#include <memory>
#include <type_traits>
#include <vector>

struct Tensor;
class TensorShard;
class Communicator;

class CommunicatorThreadsPack {
public:
    virtual ~CommunicatorThreadsPack() = default;
    virtual void join() = 0;
    virtual bool has_exception() const = 0;
};

//! \brief Collective operations between the workers of one training run.
//! \details Every collective is a synchronization point: all workers must call the same
//! sequence of collectives. If a worker leaves the group with an exception, all pending and
//! future collectives of the remaining workers throw `CommunicationError`.
class Communicator {
public:
    Communicator(int rank, int world);
    virtual ~Communicator() = default;

    virtual void barrier() = 0;

    //! Element-wise sum over all ranks, in place. Summation runs in rank order,
    //! so every rank receives a bit-identical result.
    virtual void all_reduce_sum(float* values, std::size_t n) = 0;

    //! Fills `tgt` (global tensor) with the shards of all ranks. All shards have `src.bytes()` bytes.
    virtual void all_gather(const TensorShard& src, Tensor& tgt) = 0;

    //! Averages `full` over all ranks and writes (or adds, if `accumulate`) this rank's shard of the result into `shard`.
    virtual void reduce_scatter_avg(const Tensor& full, TensorShard& shard, bool accumulate) = 0;

    float all_reduce_sum(float value);
    float all_reduce_mean(float value);
    int all_reduce_max(int value);

    [[nodiscard]] int rank() const { return mRank; }
    [[nodiscard]] int world_size() const { return mWorld; }

    template<typename T>
    std::vector<T> host_all_gather(const T& object) {
        static_assert(std::is_trivially_copyable_v<T>, "Cannot communicate type with non-trivial copy operator");
        std::vector<T> result(world_size());
        all_gather_bytes_host(reinterpret_cast<std::byte*>(result.data()), reinterpret_cast<const std::byte*>(&object), sizeof(T));
        return result;
    }

    //! Concatenation (in rank order) of the vectors of all ranks; lengths may differ.
    template<typename T>
    std::vector<T> host_all_gather_vector(const std::vector<T>& values) {
        static_assert(std::is_trivially_copyable_v<T>, "Cannot communicate type with non-trivial copy operator");
        std::vector<std::byte> bytes = all_gather_variable_bytes_host(reinterpret_cast<const std::byte*>(values.data()),
                                                                      values.size() * sizeof(T));
        std::vector<T> result(bytes.size() / sizeof(T));
        if (!result.empty()) {
            std::memcpy(result.data(), bytes.data(), bytes.size());
        }
        return result;
    }

    /**
     * @brief Run distributed training with one worker thread per simulated device (blocking).
     *
     * @param nworkers Number of workers.
     * @param work Callable invoked once per worker with that worker's communicator.
     * @throws The exception of the first failing worker (root cause preferred over
     *         the CommunicationError of workers that were aborted because of it).
     */
    static void run_communicators(int nworkers, std::function<void(Communicator& comm)> work);

    /**
     * @brief Launch communicator threads and return a joinable pack (non-blocking).
     */
    static std::unique_ptr<CommunicatorThreadsPack> launch_communicators(int nworkers, std::function<void(Communicator& comm)> work);

protected:
    virtual void all_gather_bytes_host(std::byte* recv, const std::byte* object, std::size_t size) = 0;
    virtual std::vector<std::byte> all_gather_variable_bytes_host(const std::byte* object, std::size_t size) = 0;

private:
    int mRank;
    int mWorld;
};

#endif //HALO_SRC_UTILS_COMM_H
