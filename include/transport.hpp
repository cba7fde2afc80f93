#pragma once

#include "reached_targets.hpp"
#include "worker.hpp"
#include <cstdint>
#include <vector>

// Collective operations between supersteps. A process hosts one or more workers;
// every call is made by every process in the same order.
class Transport {
public:
    virtual ~Transport() = default;

    virtual bool is_root() const = 0;

    // Deliver every hosted worker's outbox to the owning workers
    virtual void exchange_messages(const std::vector<Worker*>& workers) = 0;

    // Set union of every worker's submitted replica
    virtual ReachedTargets merge_reached(const std::vector<ReachedTargets>& submissions) = 0;

    // Sum across processes
    virtual int64_t sum(int64_t local) = 0;

    // Payloads of every process, collected on the root; empty elsewhere
    virtual std::vector<std::vector<char>> gather_to_root(const std::vector<char>& local) = 0;
};

// All workers live in this process; used for single-process runs and tests
class LocalTransport : public Transport {
public:
    bool is_root() const override { return true; }
    void exchange_messages(const std::vector<Worker*>& workers) override;
    ReachedTargets merge_reached(const std::vector<ReachedTargets>& submissions) override;
    int64_t sum(int64_t local) override { return local; }
    std::vector<std::vector<char>> gather_to_root(const std::vector<char>& local) override;
};
