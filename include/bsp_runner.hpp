#pragma once

#include "job_stats.hpp"
#include "options.hpp"
#include "path_value.hpp"
#include "reached_targets.hpp"
#include "transport.hpp"
#include "worker.hpp"
#include <cstdint>
#include <map>
#include <vector>

// Superstep loop over the workers hosted by this process
class BspRunner {
public:
    BspRunner(std::vector<Worker*> workers, Transport& transport, const ShortestPathOptions& options,
              int log_rank = 0);

    // Run until no message is sent in a superstep, until every target is in the
    // merged reached set (halt_on_targets_reached), or until max_supersteps
    JobStats run();

    // Every vertex's final value keyed by global index; empty on non-root processes
    std::map<int32_t, PathValue> collect_results();

    // Merged reached-target set after the last superstep
    const ReachedTargets& reached_targets() const { return global_reached_; }

private:
    std::vector<Worker*> workers_;
    Transport& transport_;
    const ShortestPathOptions& options_;
    int log_rank_;
    ReachedTargets global_reached_;
};
