#include "bsp_runner.hpp"
#include "wire_codec.hpp"
#include <iostream>
#include <stdexcept>
#include <utility>

BspRunner::BspRunner(std::vector<Worker*> workers, Transport& transport,
                     const ShortestPathOptions& options, int log_rank)
    : workers_(std::move(workers)),
      transport_(transport),
      options_(options),
      log_rank_(log_rank) {
    if (workers_.empty()) {
        throw std::invalid_argument("BspRunner needs at least one worker");
    }
}

JobStats BspRunner::run() {
    JobStats stats;
    ReachedTargetAggregator master(options_.target_spec);

    for (int superstep = 0; ; ++superstep) {
        if (superstep >= options_.max_supersteps) {
            if (transport_.is_root()) {
                std::cout << "Rank " << log_rank_ << ": WARNING - Reached max supersteps "
                          << options_.max_supersteps << " before convergence" << std::endl;
            }
            break;
        }

        stats.start();

        int64_t local_active = 0;
        int64_t local_sent = 0;
        for (Worker* worker : workers_) {
            worker->before_superstep(global_reached_);
            worker->compute_superstep(superstep);
            local_active += worker->active_vertices();
            local_sent += worker->messages_sent();
        }

        transport_.exchange_messages(workers_);

        std::vector<ReachedTargets> submissions;
        submissions.reserve(workers_.size());
        for (Worker* worker : workers_) {
            submissions.push_back(worker->after_superstep());
        }
        global_reached_ = transport_.merge_reached(submissions);

        int64_t active = transport_.sum(local_active);
        int64_t sent = transport_.sum(local_sent);
        stats.stop(superstep, active, sent, static_cast<int64_t>(global_reached_.size()));

        if (options_.verbose && transport_.is_root()) {
            std::cout << "Rank " << log_rank_ << ": Superstep " << superstep
                      << " active=" << active << " sent=" << sent
                      << " reached=" << global_reached_.size() << std::endl;
        }

        if (sent == 0) {
            stats.set_converged(true);
            break;
        }

        master.before_superstep(global_reached_);
        if (options_.halt_on_targets_reached && master.all_targets_reached()) {
            if (transport_.is_root()) {
                std::cout << "Rank " << log_rank_ << ": All " << global_reached_.size()
                          << " targets reached, halting after superstep " << superstep << std::endl;
            }
            stats.set_converged(true);
            break;
        }
    }
    return stats;
}

std::map<int32_t, PathValue> BspRunner::collect_results() {
    std::vector<char> local;
    for (Worker* worker : workers_) {
        std::vector<char> encoded = worker->encode_results();
        local.insert(local.end(), encoded.begin(), encoded.end());
    }

    std::map<int32_t, PathValue> results;
    for (const auto& payload : transport_.gather_to_root(local)) {
        ByteReader reader(payload.data(), payload.size());
        while (!reader.at_end()) {
            int32_t vertex = -1;
            PathValue value = decode_result(reader, vertex);
            results.emplace(vertex, std::move(value));
        }
    }
    return results;
}
