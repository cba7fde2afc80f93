#include "shortest_path_job.hpp"
#include "bsp_runner.hpp"
#include "errors.hpp"
#include "graph_loader.hpp"
#include "graph_partitioner.hpp"
#include "mpi_transport.hpp"
#include "options.hpp"
#include "result_writer.hpp"
#include "worker.hpp"
#include <iostream>
#include <map>
#include <omp.h>
#include <string>
#include <vector>

void run_shortest_path_job(const Config& config, MPI_Comm comm) {
    MpiTransport transport(comm);
    int rank = transport.rank();
    int size = transport.size();

    // Fail fast before superstep 0
    ShortestPathOptions options = ShortestPathOptions::from_config(config);
    if (options.input.empty()) {
        throw ConfigError(std::string("The param '") + OPTION_INPUT + "' must not be blank");
    }
    if (options.omp_threads > 0) {
        omp_set_num_threads(options.omp_threads);
    }

    if (rank == 0) {
        std::cout << "Running " << SingleSourceShortestPath::name() << " with:" << std::endl
                  << "  Source: " << options.target_spec.source_id.to_string() << std::endl
                  << "  Targets: " << quantity_name(options.target_spec.quantity)
                  << " (" << options.target_spec.target_ids.size() << ")" << std::endl
                  << "  Weight property: "
                  << (options.weight.property_name.empty() ? "<none>" : options.weight.property_name)
                  << ", default weight: " << options.weight.default_weight << std::endl
                  << "  MPI Processes: " << size << std::endl
                  << "  OpenMP Threads: " << omp_get_max_threads() << std::endl;
    }

    // Every rank loads the same file, so global indexes agree
    Graph graph = load_graph_file(options.input, options.both_directions);
    if (rank == 0) {
        std::cout << "Rank " << rank << ": Loaded " << graph.get_num_vertices() << " vertices and "
                  << graph.get_num_edges() << " edges from " << options.input << std::endl;
        if (graph.index_of(options.target_spec.source_id) < 0) {
            std::cout << "Rank " << rank << ": WARNING - Source vertex "
                      << options.target_spec.source_id.to_string()
                      << " is not in the graph, every vertex stays unreachable" << std::endl;
        }
    }

    std::vector<int32_t> assignments;
    if (rank == 0) {
        GraphPartitioner partitioner(graph);
        assignments = partitioner.partition(size, options.partitioner);
    }
    transport.broadcast(assignments);
    graph.setup_vertex_mappings(assignments, rank);
    if (options.verbose) {
        std::cout << "Rank " << rank << ": Assigned " << graph.get_num_local_vertices()
                  << " local vertices" << std::endl;
    }

    Worker worker(graph, options, rank, size);
    BspRunner runner({&worker}, transport, options, rank);
    JobStats stats = runner.run();
    std::map<int32_t, PathValue> results = runner.collect_results();

    if (rank == 0) {
        stats.print_summary(rank);
        if (options.target_spec.quantity != QuantityType::ALL) {
            std::cout << "Rank " << rank << ": Reached " << runner.reached_targets().size() << " of "
                      << options.target_spec.target_ids.size() << " targets" << std::endl;
        }

        export_results_json(options.output, graph, options.target_spec, results);
        std::cout << "Rank " << rank << ": Shortest paths exported to " << options.output << std::endl;

        if (!options.stats_output.empty()) {
            stats.write_csv(options.stats_output);
            std::cout << "Rank " << rank << ": Superstep statistics exported to "
                      << options.stats_output << std::endl;
        }
    }
}
