#pragma once

#include "transport.hpp"
#include <mpi.h>

// One worker per MPI rank
class MpiTransport : public Transport {
public:
    explicit MpiTransport(MPI_Comm comm = MPI_COMM_WORLD);

    int rank() const { return rank_; }
    int size() const { return size_; }

    bool is_root() const override { return rank_ == 0; }

    // Alltoall byte counts, then Alltoallv payloads
    void exchange_messages(const std::vector<Worker*>& workers) override;

    // Allgatherv of encoded replicas, unioned on every rank
    ReachedTargets merge_reached(const std::vector<ReachedTargets>& submissions) override;

    int64_t sum(int64_t local) override;

    std::vector<std::vector<char>> gather_to_root(const std::vector<char>& local) override;

    // Broadcast a buffer from rank 0, resizing it on the receivers
    void broadcast(std::vector<int32_t>& values);

private:
    MPI_Comm comm_;
    int rank_;
    int size_;
};
