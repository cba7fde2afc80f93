#include "config.hpp"
#include "shortest_path_job.hpp"
#include <mpi.h>
#include <exception>
#include <iostream>
#include <string>
#include <vector>

static void print_usage(const char* program) {
    std::cerr << "Usage: " << program << " source_id=<id> target_id=<id[,id...]|*> input=<file>"
              << " [weight_property=<name>] [default_weight=<w>] [output=<file>]"
              << " [edge_direction=out|both] [partitioner=metis|hash] [max_supersteps=<n>]"
              << " [halt_on_targets_reached=true|false] [omp_threads=<n>] [stats_output=<file>]"
              << " [verbose=true|false] [config=<file>]" << std::endl;
}

int main(int argc, char** argv) {
    MPI_Init(&argc, &argv);

    int rank;
    MPI_Comm_rank(MPI_COMM_WORLD, &rank);

    std::vector<std::string> args(argv + 1, argv + argc);
    if (args.empty()) {
        if (rank == 0) {
            print_usage(argv[0]);
        }
        MPI_Finalize();
        return 1;
    }

    try {
        Config config = Config::from_args(args);
        run_shortest_path_job(config, MPI_COMM_WORLD);
    } catch (const std::exception& e) {
        std::cerr << "Rank " << rank << ": Error: " << e.what() << std::endl;
        MPI_Abort(MPI_COMM_WORLD, 1);
    }

    MPI_Finalize();
    return 0;
}
