#include "transport.hpp"
#include <stdexcept>
#include <string>

void LocalTransport::exchange_messages(const std::vector<Worker*>& workers) {
    // Take every outbox before delivering anything
    std::vector<std::vector<std::vector<char>>> outgoing;
    outgoing.reserve(workers.size());
    for (Worker* worker : workers) {
        outgoing.push_back(worker->take_outgoing());
    }

    for (const auto& payloads : outgoing) {
        if (payloads.size() != workers.size()) {
            throw std::runtime_error("Outbox addressed to " + std::to_string(payloads.size()) +
                                     " workers, cluster has " + std::to_string(workers.size()));
        }
        for (size_t r = 0; r < payloads.size(); ++r) {
            if (!payloads[r].empty()) {
                workers[r]->receive_payload(payloads[r].data(), payloads[r].size());
            }
        }
    }
}

ReachedTargets LocalTransport::merge_reached(const std::vector<ReachedTargets>& submissions) {
    ReachedTargets merged;
    for (const auto& submission : submissions) {
        merged.merge(submission);
    }
    return merged;
}

std::vector<std::vector<char>> LocalTransport::gather_to_root(const std::vector<char>& local) {
    return std::vector<std::vector<char>>(1, local);
}
