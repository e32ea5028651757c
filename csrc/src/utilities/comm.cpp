// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// Copyright (c) 2025, IST Austria, developed by Erik Schultheis
// SPDX-License-Identifier: Apache-2.0
//

#include "comm.h"

#include <algorithm>
#include <atomic>
#include <barrier>
#include <cstdio>
#include <exception>
#include <mutex>
#include <thread>

#include <fmt/core.h>

#include "tensor.h"
#include "utils.h"

Communicator::Communicator(int rank, int world) : mRank(rank), mWorld(world) {
}

float Communicator::all_reduce_sum(float value) {
    all_reduce_sum(&value, 1);
    return value;
}

float Communicator::all_reduce_mean(float value) {
    return all_reduce_sum(value) / static_cast<float>(world_size());
}

int Communicator::all_reduce_max(int value) {
    int result = value;
    for (int v : host_all_gather(value)) {
        result = std::max(result, v);
    }
    return result;
}

/**
 * @brief Communicator between worker threads of a single process.
 *
 * Uses std::barrier for synchronization and shared pointers for data exchange: each collective
 * publishes a pointer per rank, waits at the barrier, reads the peers' data, and waits again
 * before any rank may reuse its buffer.
 *
 * A worker that is destroyed while an exception is propagating marks the group as aborted
 * before dropping out of the barrier, so that peers blocked in a collective wake up and fail
 * with CommunicationError instead of waiting forever.
 */
class ThreadsCommunicatorImpl : public Communicator {
public:
    struct SharedState {
        std::unique_ptr<std::barrier<>> Barrier;
        std::vector<const std::byte*> Buffer;     // one pointer per thread
        std::vector<std::size_t> Sizes;
        std::vector<std::exception_ptr> Exceptions;
        std::mutex Mutex;
        std::atomic<bool> Aborted = false;
    };

    ThreadsCommunicatorImpl(int rank, int world, std::shared_ptr<SharedState> state);

    /**
     * @brief Drops out of the shared barrier on destruction; aborts the group when unwinding.
     */
    ~ThreadsCommunicatorImpl() override;

    void barrier() override;
    void all_reduce_sum(float* values, std::size_t n) override;
    void all_gather(const TensorShard& src, Tensor& tgt) override;
    void reduce_scatter_avg(const Tensor& full, TensorShard& shard, bool accumulate) override;

    using Communicator::all_reduce_sum;

protected:
    void all_gather_bytes_host(std::byte* recv, const std::byte* object, std::size_t size) override;
    std::vector<std::byte> all_gather_variable_bytes_host(const std::byte* object, std::size_t size) override;

private:
    void local_barrier();

    std::shared_ptr<SharedState> mShare;
    int mUncaughtAtConstruction;
};

ThreadsCommunicatorImpl::ThreadsCommunicatorImpl(int rank, int world, std::shared_ptr<SharedState> state)
    : Communicator(rank, world), mShare(std::move(state)), mUncaughtAtConstruction(std::uncaught_exceptions()) {
}

ThreadsCommunicatorImpl::~ThreadsCommunicatorImpl() {
    if(mShare && mShare->Barrier) {
        if (std::uncaught_exceptions() > mUncaughtAtConstruction) {
            mShare->Aborted = true;
        }
        mShare->Barrier->arrive_and_drop();
    }
}

void ThreadsCommunicatorImpl::local_barrier() {
    if (mShare->Aborted) {
        throw CommunicationError(fmt::format("rank {}: worker group aborted", rank()));
    }
    mShare->Barrier->arrive_and_wait();
    if (mShare->Aborted) {
        throw CommunicationError(fmt::format("rank {}: a peer failed before reaching the collective", rank()));
    }
}

void ThreadsCommunicatorImpl::barrier() {
    local_barrier();
}

void ThreadsCommunicatorImpl::all_reduce_sum(float* values, std::size_t n) {
    mShare->Buffer[rank()] = reinterpret_cast<const std::byte*>(values);
    mShare->Sizes[rank()] = n;
    local_barrier();
    for (int r = 0; r < world_size(); ++r) {
        if (mShare->Sizes[r] != n) {
            throw CommunicationError(fmt::format("all_reduce_sum: rank {} contributes {} values, rank {} expects {}",
                                                 r, mShare->Sizes[r], rank(), n));
        }
    }

    std::vector<float> result(n, 0.f);
    for (int r = 0; r < world_size(); ++r) {
        const float* peer = reinterpret_cast<const float*>(mShare->Buffer[r]);
        for (std::size_t i = 0; i < n; ++i) {
            result[i] += peer[i];
        }
    }
    // nobody may overwrite its input while a peer is still reading it
    local_barrier();
    std::copy(result.begin(), result.end(), values);
}

void ThreadsCommunicatorImpl::all_gather(const TensorShard& src, Tensor& tgt) {
    const std::size_t size = src.bytes();
    if (tgt.bytes() != size * world_size()) {
        throw std::logic_error(fmt::format("all_gather: target has {} bytes, expected {} x {}", tgt.bytes(), world_size(), size));
    }
    mShare->Buffer[rank()] = src.Data;
    local_barrier();
    for (int r = 0; r < world_size(); ++r) {
        std::memcpy(tgt.Data + r * size, mShare->Buffer[r], size);
    }
    local_barrier();
}

void ThreadsCommunicatorImpl::reduce_scatter_avg(const Tensor& full, TensorShard& shard, bool accumulate) {
    const std::size_t shard_n = shard.nelem();
    if (full.nelem() != shard_n * world_size()) {
        throw std::logic_error(fmt::format("reduce_scatter_avg: {} elements cannot be split into {} shards of {}",
                                           full.nelem(), world_size(), shard_n));
    }
    mShare->Buffer[rank()] = full.Data;
    local_barrier();

    float* dst = shard.get<float>();
    const std::size_t offset = static_cast<std::size_t>(rank()) * shard_n;
    const float scale = 1.f / static_cast<float>(world_size());
    for (std::size_t i = 0; i < shard_n; ++i) {
        float sum = 0.f;
        for (int r = 0; r < world_size(); ++r) {
            sum += reinterpret_cast<const float*>(mShare->Buffer[r])[offset + i];
        }
        dst[i] = accumulate ? dst[i] + sum * scale : sum * scale;
    }
    local_barrier();
}

void ThreadsCommunicatorImpl::all_gather_bytes_host(std::byte* recv, const std::byte* object, std::size_t size) {
    mShare->Buffer[rank()] = object;
    local_barrier();
    for (int r = 0; r < world_size(); ++r) {
        std::memcpy(recv + r * size, mShare->Buffer[r], size);
    }
    local_barrier();
}

std::vector<std::byte> ThreadsCommunicatorImpl::all_gather_variable_bytes_host(const std::byte* object, std::size_t size) {
    mShare->Buffer[rank()] = object;
    mShare->Sizes[rank()] = size;
    local_barrier();
    std::vector<std::byte> result;
    for (int r = 0; r < world_size(); ++r) {
        result.insert(result.end(), mShare->Buffer[r], mShare->Buffer[r] + mShare->Sizes[r]);
    }
    local_barrier();
    return result;
}

// ============================================================================
// Thread Pack for managing worker threads
// ============================================================================

class CommunicatorThreadsPackImpl : public CommunicatorThreadsPack {
public:
    CommunicatorThreadsPackImpl(std::vector<std::jthread> threads,
                                std::shared_ptr<ThreadsCommunicatorImpl::SharedState> state)
        : mThreads(std::move(threads)), mState(std::move(state)) {}

    // jthread joins on destruction; errors are only reported through join()
    ~CommunicatorThreadsPackImpl() override = default;

    void join() override {
        for (auto& t : mThreads) {
            if (t.joinable()) {
                t.join();
            }
        }
        check_exceptions();
    }

    bool has_exception() const override {
        std::lock_guard<std::mutex> lock(mState->Mutex);
        for (size_t t = 0; t < mThreads.size(); ++t) {
            if (mState->Exceptions[t]) {
                return true;
            }
        }
        return false;
    }

private:
    //! Rethrows the root cause: the first error that is not a CommunicationError caused by a failing peer.
    void check_exceptions() {
        std::lock_guard<std::mutex> lock(mState->Mutex);
        std::exception_ptr first;
        std::exception_ptr root;
        for (size_t t = 0; t < mThreads.size(); ++t) {
            auto error = mState->Exceptions[t];
            if (!error) {
                continue;
            }
            fprintf(stderr, "Thread %zu exited with uncaught exception\n", t);
            fflush(stderr);
            mState->Exceptions[t] = nullptr;
            if (!first) {
                first = error;
            }
            if (!root) {
                try {
                    std::rethrow_exception(error);
                } catch (const CommunicationError&) {
                    // consequence of another worker's failure
                } catch (...) {
                    root = error;
                }
            }
        }
        if (root) {
            std::rethrow_exception(root);
        }
        if (first) {
            std::rethrow_exception(first);
        }
    }

    std::vector<std::jthread> mThreads;
    std::shared_ptr<ThreadsCommunicatorImpl::SharedState> mState;
};

// ============================================================================
// Main Entry Points
// ============================================================================

namespace {

std::unique_ptr<CommunicatorThreadsPackImpl>
launch_communicators_impl(int nworkers, std::function<void(Communicator& comm)> work) {
    if (nworkers <= 0) {
        throw std::runtime_error(fmt::format("Invalid number of workers: {}", nworkers));
    }

    auto shared_state = std::make_shared<ThreadsCommunicatorImpl::SharedState>();
    shared_state->Barrier = std::make_unique<std::barrier<>>(nworkers);
    shared_state->Buffer.resize(nworkers);
    shared_state->Sizes.resize(nworkers);
    shared_state->Exceptions.resize(nworkers);

    // the pack owns the callable; threads only reference it
    auto shared_work = std::make_shared<std::function<void(Communicator& comm)>>(std::move(work));

    std::vector<std::jthread> threads;
    threads.reserve(nworkers);

    for (int rank = 0; rank < nworkers; ++rank) {
        threads.emplace_back([=]() {
            try {
                ThreadsCommunicatorImpl comm(rank, nworkers, shared_state);
                (*shared_work)(comm);
                comm.barrier();
            } catch (...) {
                std::lock_guard<std::mutex> lock(shared_state->Mutex);
                shared_state->Exceptions[rank] = std::current_exception();
            }
        });
    }

    return std::make_unique<CommunicatorThreadsPackImpl>(std::move(threads), shared_state);
}

} // anonymous namespace

void Communicator::run_communicators(int nworkers, std::function<void(Communicator& comm)> work) {
    auto pack = launch_communicators_impl(nworkers, std::move(work));
    pack->join();
}

std::unique_ptr<CommunicatorThreadsPack> Communicator::launch_communicators(int nworkers, std::function<void(Communicator& comm)> work) {
    return launch_communicators_impl(nworkers, std::move(work));
}
