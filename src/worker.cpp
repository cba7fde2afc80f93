#include "worker.hpp"
#include "combiner.hpp"
#include "wire_codec.hpp"
#include <exception>
#include <stdexcept>
#include <string>
#include <utility>

Worker::Worker(const Graph& graph, const ShortestPathOptions& options, int rank, int num_workers)
    : graph_(graph),
      rank_(rank),
      num_workers_(num_workers),
      computation_(graph, options.target_spec, options.weight, options.verbose),
      aggregator_(options.target_spec),
      values_(graph.get_num_local_vertices()),
      inbox_(graph.get_num_local_vertices()),
      outbox_(num_workers),
      messages_sent_(0),
      active_vertices_(0) {
    if (graph.get_rank() != rank) {
        throw std::invalid_argument("Graph mappings belong to rank " +
                                    std::to_string(graph.get_rank()) +
                                    ", worker is rank " + std::to_string(rank));
    }
}

void Worker::before_superstep(const ReachedTargets& global) {
    aggregator_.before_superstep(global);
}

void Worker::compute_superstep(int superstep) {
    // Collect active vertices
    std::vector<int32_t> active;
    std::vector<RelaxationMessage> inbound;
    if (superstep == 0) {
        active.reserve(values_.size());
        for (int32_t i = 0; i < static_cast<int32_t>(values_.size()); ++i) {
            active.push_back(i);
        }
    } else {
        for (int32_t i = 0; i < static_cast<int32_t>(inbox_.size()); ++i) {
            if (inbox_[i]) {
                active.push_back(i);
                inbound.push_back(std::move(*inbox_[i]));
                inbox_[i].reset();
            }
        }
    }

    std::vector<StepResult> results(active.size());
    std::exception_ptr error;

    #pragma omp parallel for schedule(dynamic, 64)
    for (int64_t i = 0; i < static_cast<int64_t>(active.size()); ++i) {
        try {
            int32_t local_v = active[i];
            int32_t global_v = graph_.local_to_global(local_v);
            if (superstep == 0) {
                results[i] = computation_.compute0(global_v);
            } else {
                std::vector<RelaxationMessage> messages(1, std::move(inbound[i]));
                results[i] = computation_.compute(global_v, std::move(values_[local_v]),
                                                  messages, aggregator_);
            }
        } catch (...) {
            #pragma omp critical
            {
                if (!error) {
                    error = std::current_exception();
                }
            }
        }
    }

    if (error) {
        std::rethrow_exception(error);
    }

    messages_sent_ = 0;
    active_vertices_ = static_cast<int64_t>(active.size());
    for (size_t i = 0; i < active.size(); ++i) {
        apply_result(active[i], std::move(results[i]));
    }
}

void Worker::apply_result(int32_t local_vertex, StepResult&& result) {
    values_[local_vertex] = std::move(result.value);
    if (result.reached_target) {
        aggregator_.record(graph_.vertex_id(graph_.local_to_global(local_vertex)));
    }

    // Sender-side combine, one message per target per superstep
    for (auto& outbound : result.messages) {
        auto& bucket = outbox_[graph_.get_vertex_owner(outbound.target)];
        auto it = bucket.find(outbound.target);
        if (it == bucket.end()) {
            bucket.emplace(outbound.target, std::move(outbound.message));
        } else {
            combine_into(it->second, std::move(outbound.message));
        }
        ++messages_sent_;
    }
}

ReachedTargets Worker::after_superstep() const {
    return aggregator_.after_superstep();
}

std::vector<std::vector<char>> Worker::take_outgoing() {
    std::vector<std::vector<char>> payloads(num_workers_);
    for (int r = 0; r < num_workers_; ++r) {
        ByteWriter writer(payloads[r]);
        for (const auto& [target, message] : outbox_[r]) {
            encode_message(writer, target, message);
        }
        outbox_[r].clear();
    }
    return payloads;
}

void Worker::receive_payload(const char* data, size_t size) {
    ByteReader reader(data, size);
    while (!reader.at_end()) {
        int32_t target = -1;
        RelaxationMessage message = decode_message(reader, target);
        receive(target, std::move(message));
    }
}

void Worker::receive(int32_t global_vertex, RelaxationMessage&& message) {
    int32_t local_v = graph_.global_to_local(global_vertex);
    if (local_v < 0) {
        throw std::runtime_error("Rank " + std::to_string(rank_) + " received a message for vertex " +
                                 graph_.vertex_id(global_vertex).to_string() +
                                 " owned by rank " +
                                 std::to_string(graph_.get_vertex_owner(global_vertex)));
    }

    auto& slot = inbox_[local_v];
    if (!slot) {
        slot = std::move(message);
    } else {
        combine_into(*slot, std::move(message));
    }
}

int64_t Worker::pending_messages() const {
    int64_t pending = 0;
    for (const auto& slot : inbox_) {
        if (slot) {
            ++pending;
        }
    }
    return pending;
}

std::vector<char> Worker::encode_results() const {
    std::vector<char> payload;
    ByteWriter writer(payload);
    for (int32_t local_v = 0; local_v < static_cast<int32_t>(values_.size()); ++local_v) {
        encode_result(writer, graph_.local_to_global(local_v), values_[local_v]);
    }
    return payload;
}

const PathValue& Worker::get_value(int32_t global_vertex) const {
    int32_t local_v = graph_.global_to_local(global_vertex);
    if (local_v < 0) {
        throw std::invalid_argument("Vertex " + graph_.vertex_id(global_vertex).to_string() +
                                    " is not owned by rank " + std::to_string(rank_));
    }
    return values_[local_v];
}
