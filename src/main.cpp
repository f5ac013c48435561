#include "Checkpoint.hpp"
#include "Errors.hpp"
#include "Experiment.hpp"
#include "Model.hpp"
#include "Network.hpp"
#include "Params.hpp"
#include "Types.hpp"
#include "Utils.hpp"

#include <algorithm>
#include <filesystem>
#include <iostream>
#include <numeric>
#include <string>
#include <vector>

namespace {

void printUsage(const char* program) {
    std::cerr << "Usage: " << program
              << " <num_nodes> <adjacency_matrix_index|complete> <replications> [seed] [max_steps]"
              << std::endl;
}

Network loadNetwork(int numNodes, const std::string& which) {
    if (which == "complete") {
        return Network::complete(static_cast<size_t>(numNodes));
    }

    int adjIndex = std::stoi(which);
    auto allMatrices = readAdjacencyMatrices("../data/adj_mat_" + std::to_string(numNodes) + ".csv");
    if (adjIndex < 0 || static_cast<size_t>(adjIndex) >= allMatrices.size()) {
        throw ConfigurationError("Adjacency matrix index " + which + " out of range");
    }
    const auto& matrix = allMatrices[adjIndex];
    if (matrix.size() != static_cast<size_t>(numNodes)) {
        throw ConfigurationError("Adjacency matrix " + which + " has " +
                                 std::to_string(matrix.size()) + " nodes, expected " +
                                 std::to_string(numNodes));
    }
    return Network::fromAdjacencyMatrix(matrix);
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 4 || argc > 6) {
        printUsage(argv[0]);
        return 1;
    }

    try {
        int numNodes = std::stoi(argv[1]);
        std::string which = argv[2];
        int replications = std::stoi(argv[3]);
        uint64_t seed = argc > 4 ? std::stoull(argv[4]) : 0;
        size_t maxSteps = argc > 5 ? std::stoul(argv[5]) : 10000;
        if (numNodes <= 0 || replications <= 0) {
            printUsage(argv[0]);
            return 1;
        }

        Network network = loadNetwork(numNodes, which);
        std::string runName = std::to_string(numNodes) + "_" + which;

        // Seed roughly a tenth of the population, at least one agent
        std::vector<size_t> seeds(std::max<size_t>(1, network.size() / 10));
        std::iota(seeds.begin(), seeds.end(), 0);

        ModelFactory factory = [&network, &seeds](const ParamCombination& comb) {
            ModelConfig config;
            config.network = network;
            config.strategy = stringParam(comb, "strategy");
            config.adoptionRate = numericParam(comb, "adoption_rate");
            config.dropRate = numericParam(comb, "drop_rate");
            config.payoff = {"fixed", {1.0, numericParam(comb, "adaptive_fitness")}};
            config.initialAdopters = seeds;
            return buildModel(config);
        };

        std::string outputDir = "../output";
        std::filesystem::create_directories(outputDir);
        Checkpoint checkpoint(outputDir + "/checkpoint_" + runName + ".gz");

        RunnerOptions options;
        options.replicates = static_cast<size_t>(replications);
        options.maxSteps = maxSteps;
        options.seed = seed;
        options.checkpointEvery = 10;
        options.verbose = true;

        ParameterGrid grid = makeDefaultGrid();
        ExperimentRunner runner(factory, grid, options, &checkpoint);
        std::vector<ExperimentRecord> records = runner.run();

        size_t failures = static_cast<size_t>(std::count_if(records.begin(), records.end(), [](const ExperimentRecord& r) {
            return r.terminal == TerminalState::Failed;
        }));
        if (failures > 0) {
            std::cerr << failures << " trials failed, first error: "
                      << std::find_if(records.begin(), records.end(), [](const ExperimentRecord& r) {
                             return r.terminal == TerminalState::Failed;
                         })->error
                      << '\n';
        }

        std::vector<std::string> groupBy = {"strategy", "adoption_rate", "drop_rate", "adaptive_fitness"};
        std::vector<SummaryRow> summary = summarize(records, groupBy);
        writeAndCompressCSV(outputDir + "/summary_" + runName + ".csv", summaryToCsv(summary, groupBy));
        std::cout << "Wrote " << summary.size() << " summary rows for " << records.size() << " trials." << '\n';
    } catch (const ConfigurationError& e) {
        std::cerr << "Configuration error: " << e.what() << '\n';
        printUsage(argv[0]);
        return 1;
    } catch (const CheckpointError& e) {
        std::cerr << "Checkpoint error: " << e.what() << '\n'
                  << "Remove or repair the checkpoint file to start the sweep afresh." << '\n';
        return 1;
    } catch (const std::runtime_error& e) {
        std::cerr << "Error: " << e.what() << '\n';
        return 1;
    } catch (const std::logic_error& e) {
        // std::stoi and friends
        std::cerr << "Invalid argument: " << e.what() << '\n';
        printUsage(argv[0]);
        return 1;
    }
    return 0;
}
