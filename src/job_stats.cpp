#include "job_stats.hpp"
#include <fstream>
#include <iomanip>
#include <iostream>
#include <stdexcept>

void JobStats::start() {
    start_time_ = std::chrono::high_resolution_clock::now();
}

void JobStats::stop(int superstep, int64_t active_vertices, int64_t messages_sent,
                    int64_t reached_targets) {
    auto end = std::chrono::high_resolution_clock::now();
    std::chrono::duration<double, std::milli> elapsed = end - start_time_;
    supersteps_.push_back(SuperstepStats{superstep, active_vertices, messages_sent,
                                         reached_targets, elapsed.count()});
}

int64_t JobStats::get_total_messages() const {
    int64_t total = 0;
    for (const auto& stats : supersteps_) {
        total += stats.messages_sent;
    }
    return total;
}

double JobStats::get_total_time_ms() const {
    double total = 0.0;
    for (const auto& stats : supersteps_) {
        total += stats.elapsed_ms;
    }
    return total;
}

void JobStats::write_csv(const std::string& filename) const {
    std::ofstream file(filename);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file for writing: " + filename);
    }

    file << "superstep,active_vertices,messages_sent,reached_targets,elapsed_ms\n";
    for (const auto& stats : supersteps_) {
        file << stats.superstep << ","
             << stats.active_vertices << ","
             << stats.messages_sent << ","
             << stats.reached_targets << ","
             << std::fixed << std::setprecision(3) << stats.elapsed_ms << "\n";
    }
}

void JobStats::print_summary(int rank) const {
    std::cout << "Rank " << rank << ": " << (converged_ ? "Converged" : "Stopped")
              << " after " << get_num_supersteps() << " supersteps" << std::endl
              << "  Messages sent: " << get_total_messages() << std::endl
              << "  Execution time: " << std::fixed << std::setprecision(3)
              << get_total_time_ms() << " ms" << std::endl;
}
