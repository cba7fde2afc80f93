#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

// Statistics structure for one superstep
struct SuperstepStats {
    int superstep;
    int64_t active_vertices;
    int64_t messages_sent;
    int64_t reached_targets;
    double elapsed_ms;
};

class JobStats {
public:
    JobStats() = default;
    ~JobStats() = default;

    // Start timing a superstep
    void start();

    // Stop timing and record the superstep
    void stop(int superstep, int64_t active_vertices, int64_t messages_sent, int64_t reached_targets);

    void set_converged(bool converged) { converged_ = converged; }
    bool converged() const { return converged_; }

    int get_num_supersteps() const { return static_cast<int>(supersteps_.size()); }
    int64_t get_total_messages() const;
    double get_total_time_ms() const;
    const std::vector<SuperstepStats>& get_supersteps() const { return supersteps_; }

    // Write per-superstep rows to a CSV file
    void write_csv(const std::string& filename) const;

    // Print summary to console
    void print_summary(int rank) const;

private:
    std::chrono::high_resolution_clock::time_point start_time_;
    std::vector<SuperstepStats> supersteps_;
    bool converged_ = false;
};
