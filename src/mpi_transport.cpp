#include "mpi_transport.hpp"
#include "wire_codec.hpp"
#include <climits>
#include <stdexcept>
#include <string>

static int checked_count(size_t bytes) {
    if (bytes > static_cast<size_t>(INT_MAX)) {
        throw std::runtime_error("MPI payload of " + std::to_string(bytes) + " bytes is too large");
    }
    return static_cast<int>(bytes);
}

// Exclusive prefix sums for *v collectives
static std::vector<int> displacements(const std::vector<int>& counts) {
    std::vector<int> displs(counts.size(), 0);
    size_t total = 0;
    for (size_t i = 0; i < counts.size(); ++i) {
        displs[i] = checked_count(total);
        total += static_cast<size_t>(counts[i]);
    }
    checked_count(total);
    return displs;
}

MpiTransport::MpiTransport(MPI_Comm comm)
    : comm_(comm) {
    MPI_Comm_rank(comm_, &rank_);
    MPI_Comm_size(comm_, &size_);
}

void MpiTransport::exchange_messages(const std::vector<Worker*>& workers) {
    if (workers.size() != 1) {
        throw std::invalid_argument("MpiTransport hosts exactly one worker per rank");
    }
    Worker& worker = *workers[0];

    std::vector<std::vector<char>> payloads = worker.take_outgoing();
    if (static_cast<int>(payloads.size()) != size_) {
        throw std::runtime_error("Outbox addressed to " + std::to_string(payloads.size()) +
                                 " ranks, communicator has " + std::to_string(size_));
    }

    std::vector<int> send_counts(size_);
    std::vector<char> send_buffer;
    for (int r = 0; r < size_; ++r) {
        send_counts[r] = checked_count(payloads[r].size());
        send_buffer.insert(send_buffer.end(), payloads[r].begin(), payloads[r].end());
    }
    std::vector<int> send_displs = displacements(send_counts);

    // Exchange counts
    std::vector<int> recv_counts(size_);
    MPI_Alltoall(send_counts.data(), 1, MPI_INT, recv_counts.data(), 1, MPI_INT, comm_);
    std::vector<int> recv_displs = displacements(recv_counts);

    size_t recv_total = static_cast<size_t>(recv_displs.back()) +
                        static_cast<size_t>(recv_counts.back());
    std::vector<char> recv_buffer(recv_total);
    MPI_Alltoallv(send_buffer.data(), send_counts.data(), send_displs.data(), MPI_BYTE,
                  recv_buffer.data(), recv_counts.data(), recv_displs.data(), MPI_BYTE, comm_);

    for (int r = 0; r < size_; ++r) {
        if (recv_counts[r] > 0) {
            worker.receive_payload(recv_buffer.data() + recv_displs[r], recv_counts[r]);
        }
    }
}

ReachedTargets MpiTransport::merge_reached(const std::vector<ReachedTargets>& submissions) {
    ReachedTargets local;
    for (const auto& submission : submissions) {
        local.merge(submission);
    }

    std::vector<char> payload;
    ByteWriter writer(payload);
    encode_reached(writer, local);

    int send_count = checked_count(payload.size());
    std::vector<int> recv_counts(size_);
    MPI_Allgather(&send_count, 1, MPI_INT, recv_counts.data(), 1, MPI_INT, comm_);
    std::vector<int> recv_displs = displacements(recv_counts);

    std::vector<char> recv_buffer(static_cast<size_t>(recv_displs.back()) +
                                  static_cast<size_t>(recv_counts.back()));
    MPI_Allgatherv(payload.data(), send_count, MPI_BYTE,
                   recv_buffer.data(), recv_counts.data(), recv_displs.data(), MPI_BYTE, comm_);

    // Every rank computes the same union
    ReachedTargets merged;
    for (int r = 0; r < size_; ++r) {
        ByteReader reader(recv_buffer.data() + recv_displs[r], recv_counts[r]);
        merged.merge(decode_reached(reader));
    }
    return merged;
}

int64_t MpiTransport::sum(int64_t local) {
    int64_t global = 0;
    MPI_Allreduce(&local, &global, 1, MPI_INT64_T, MPI_SUM, comm_);
    return global;
}

std::vector<std::vector<char>> MpiTransport::gather_to_root(const std::vector<char>& local) {
    int send_count = checked_count(local.size());
    std::vector<int> recv_counts(size_);
    MPI_Gather(&send_count, 1, MPI_INT, recv_counts.data(), 1, MPI_INT, 0, comm_);

    std::vector<int> recv_displs;
    std::vector<char> recv_buffer;
    if (rank_ == 0) {
        recv_displs = displacements(recv_counts);
        recv_buffer.resize(static_cast<size_t>(recv_displs.back()) +
                           static_cast<size_t>(recv_counts.back()));
    }
    MPI_Gatherv(local.data(), send_count, MPI_BYTE,
                recv_buffer.data(), recv_counts.data(),
                rank_ == 0 ? recv_displs.data() : nullptr, MPI_BYTE, 0, comm_);

    std::vector<std::vector<char>> gathered;
    if (rank_ == 0) {
        gathered.reserve(size_);
        for (int r = 0; r < size_; ++r) {
            auto begin = recv_buffer.begin() + recv_displs[r];
            gathered.emplace_back(begin, begin + recv_counts[r]);
        }
    }
    return gathered;
}

void MpiTransport::broadcast(std::vector<int32_t>& values) {
    int64_t count = static_cast<int64_t>(values.size());
    MPI_Bcast(&count, 1, MPI_INT64_T, 0, comm_);
    if (rank_ != 0) {
        values.resize(static_cast<size_t>(count));
    }
    checked_count(static_cast<size_t>(count));
    MPI_Bcast(values.data(), static_cast<int>(count), MPI_INT32_T, 0, comm_);
}
