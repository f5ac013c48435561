#ifndef EXPERIMENT_HPP
#define EXPERIMENT_HPP

#include "Checkpoint.hpp"
#include "Model.hpp"
#include "Params.hpp"
#include "Trial.hpp"
#include "Types.hpp"

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

// Builds a fresh model for one parameter combination
using ModelFactory = std::function<AgentBasedModel(const ParamCombination&)>;

struct RunnerOptions {
    size_t replicates = 1;
    size_t maxSteps = 1000;
    uint64_t seed = 0;
    size_t checkpointEvery = 1; // completed trials between checkpoint writes
    bool parallel = true;
    bool verbose = false;
    StopPredicate stop;
    CheckpointPolicy onCorruptCheckpoint = CheckpointPolicy::Abort;
};

// Runs every combination of the grid replicates times. Each trial gets its own
// random stream derived from (seed, combination, replicate), so results do not
// depend on scheduling. Trials already in the checkpoint are not run again.
class ExperimentRunner {
public:
    ExperimentRunner(ModelFactory factory, const ParameterGrid& grid, RunnerOptions options,
                     Checkpoint* checkpoint = nullptr);

    // Records for the whole grid, sorted by (combination, replicate)
    std::vector<ExperimentRecord> run();

    const std::vector<ParamCombination>& combinations() const { return combos; }
    size_t trialsRun() const { return executed; }

private:
    ExperimentRecord runOne(size_t combination, size_t replicate) const;
    void loadCheckpoint();

    ModelFactory factory;
    std::vector<ParamCombination> combos;
    RunnerOptions options;
    Checkpoint* checkpoint;
    size_t executed = 0;
};

Rng makeTrialRng(uint64_t seed, size_t combination, size_t replicate);

// One row per distinct value tuple of the groupBy columns
std::vector<SummaryRow> summarize(const std::vector<ExperimentRecord>& records,
                                  const std::vector<std::string>& groupBy);

#endif // EXPERIMENT_HPP
