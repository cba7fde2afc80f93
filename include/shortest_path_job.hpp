#pragma once

#include "config.hpp"
#include <mpi.h>

// Validate options, load and partition the graph, run the supersteps and write
// the results on rank 0. Every failure is thrown; the caller aborts the job.
void run_shortest_path_job(const Config& config, MPI_Comm comm = MPI_COMM_WORLD);
