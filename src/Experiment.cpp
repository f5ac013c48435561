#include "Experiment.hpp"
#include "Errors.hpp"

#include <algorithm>
#include <exception>
#include <iostream>
#include <limits>
#include <map>
#include <utility>

Rng makeTrialRng(uint64_t seed, size_t combination, size_t replicate) {
    std::seed_seq seq{
        static_cast<uint32_t>(seed),
        static_cast<uint32_t>(seed >> 32),
        static_cast<uint32_t>(combination),
        static_cast<uint32_t>(replicate)
    };
    return Rng(seq);
}

ExperimentRunner::ExperimentRunner(ModelFactory factory, const ParameterGrid& grid,
                                   RunnerOptions options, Checkpoint* checkpoint)
    : factory(std::move(factory)), combos(makeCombinations(grid)), options(std::move(options)),
      checkpoint(checkpoint)
{
    if (!this->factory) {
        throw ConfigurationError("Experiment runner needs a model factory");
    }
    if (this->options.replicates == 0) {
        throw ConfigurationError("Experiment runner needs at least one replicate");
    }
    if (this->options.maxSteps == 0) {
        throw ConfigurationError("Experiment runner needs a positive step bound");
    }
    if (this->options.checkpointEvery == 0) {
        throw ConfigurationError("Checkpoint interval must be positive");
    }
}

ExperimentRecord ExperimentRunner::runOne(size_t combination, size_t replicate) const {
    ExperimentRecord record;
    record.params = combos[combination];
    record.combination = combination;
    record.replicate = replicate;

    // A bad combination fails its own trial, never the sweep
    try {
        Rng gen = makeTrialRng(options.seed, combination, replicate);
        Trial trial(factory(record.params), options.maxSteps, options.stop);
        const TrialResult& result = trial.run(gen);
        record.terminal = result.terminal;
        record.steps = result.steps;
        record.error = result.error;
        record.adaptive = result.series.back().counts[Behavior::Adaptive];
        record.population = trial.model().size();
    } catch (const std::exception& e) {
        record.terminal = TerminalState::Failed;
        record.error = e.what();
    }
    return record;
}

void ExperimentRunner::loadCheckpoint() {
    try {
        checkpoint->load();
    } catch (const CheckpointError& e) {
        if (options.onCorruptCheckpoint == CheckpointPolicy::Abort) {
            throw;
        }
        std::cerr << "Ignoring unusable checkpoint, starting fresh: " << e.what() << '\n';
        checkpoint->discard();
    }
}

std::vector<ExperimentRecord> ExperimentRunner::run() {
    executed = 0;
    std::vector<ExperimentRecord> results;

    std::vector<std::string> keys(combos.size());
    std::map<std::string, size_t> comboByKey;
    for (size_t c = 0; c < combos.size(); ++c) {
        keys[c] = combinationKey(combos[c]);
        comboByKey[keys[c]] = c;
    }

    if (checkpoint != nullptr) {
        loadCheckpoint();
        // Records of other sweeps sharing the file stay in the checkpoint but are not returned
        for (const auto& stored : checkpoint->records()) {
            auto it = comboByKey.find(combinationKey(stored.params));
            if (it == comboByKey.end() || stored.replicate >= options.replicates) {
                continue;
            }
            ExperimentRecord restored = stored;
            restored.combination = it->second;
            results.push_back(std::move(restored));
        }
    }

    std::vector<std::pair<size_t, size_t>> pending;
    for (size_t c = 0; c < combos.size(); ++c) {
        for (size_t r = 0; r < options.replicates; ++r) {
            if (checkpoint == nullptr || !checkpoint->contains(keys[c], r)) {
                pending.emplace_back(c, r);
            }
        }
    }

    if (options.verbose) {
        std::cout << "Number of combinations: " << combos.size() << '\n';
        std::cout << "Trials restored from checkpoint: " << results.size() << ", to run: "
                  << pending.size() << '\n';
    }

    size_t sinceFlush = 0;
    std::exception_ptr writeError;

    #pragma omp parallel for schedule(dynamic) if (options.parallel)
    for (size_t k = 0; k < pending.size(); ++k) {
        ExperimentRecord record = runOne(pending[k].first, pending[k].second);

        // Single writer for the record set and the checkpoint file
        #pragma omp critical(cascade_records)
        {
            ++executed;
            if (checkpoint != nullptr && !writeError) {
                checkpoint->add(record);
                if (++sinceFlush >= options.checkpointEvery) {
                    try {
                        checkpoint->flush();
                        sinceFlush = 0;
                    } catch (const CheckpointError&) {
                        writeError = std::current_exception();
                    }
                }
            }
            if (options.verbose) {
                std::cout << "Completed trial " << executed << " of " << pending.size()
                          << " (combination " << record.combination + 1 << ", replicate "
                          << record.replicate + 1 << ": " << terminalToString(record.terminal)
                          << " after " << record.steps << " steps)" << '\n';
            }
            results.push_back(std::move(record));
        }
    }

    if (writeError) {
        std::rethrow_exception(writeError);
    }
    if (checkpoint != nullptr && checkpoint->hasPendingWrites()) {
        checkpoint->flush();
    }

    std::sort(results.begin(), results.end(),
              [](const ExperimentRecord& a, const ExperimentRecord& b) {
                  return std::make_pair(a.combination, a.replicate) <
                         std::make_pair(b.combination, b.replicate);
              });
    return results;
}

std::vector<SummaryRow> summarize(const std::vector<ExperimentRecord>& records,
                                  const std::vector<std::string>& groupBy) {
    struct Accumulator {
        size_t replicates = 0;
        size_t failures = 0;
        size_t adaptive = 0;
        size_t legacy = 0;
        size_t timeouts = 0;
        size_t completed = 0;
        double fixationSteps = 0.0;
        double steps = 0.0;
    };

    std::map<ParamCombination, Accumulator> groups;
    for (const auto& record : records) {
        ParamCombination key;
        for (const auto& column : groupBy) {
            auto it = record.params.find(column);
            if (it == record.params.end()) {
                throw ConfigurationError("Unknown column '" + column + "'");
            }
            key[column] = it->second;
        }

        Accumulator& acc = groups[key];
        acc.replicates++;
        switch (record.terminal) {
            case TerminalState::FixatedAdaptive:
                acc.adaptive++;
                acc.fixationSteps += record.steps;
                break;
            case TerminalState::FixatedLegacy:
                acc.legacy++;
                break;
            case TerminalState::TimedOut:
                acc.timeouts++;
                break;
            case TerminalState::Failed:
                acc.failures++;
                break;
            default:
                break;
        }
        if (record.terminal != TerminalState::Failed) {
            acc.completed++;
            acc.steps += record.steps;
        }
    }

    const double nan = std::numeric_limits<double>::quiet_NaN();
    std::vector<SummaryRow> rows;
    rows.reserve(groups.size());
    for (const auto& [key, acc] : groups) {
        SummaryRow row;
        row.key = key;
        row.replicates = acc.replicates;
        row.failures = acc.failures;
        row.successRate = static_cast<double>(acc.adaptive) / acc.replicates;
        row.legacyRate = static_cast<double>(acc.legacy) / acc.replicates;
        row.timeoutRate = static_cast<double>(acc.timeouts) / acc.replicates;
        row.meanTimeToFixation = acc.adaptive > 0 ? acc.fixationSteps / acc.adaptive : nan;
        row.meanSteps = acc.completed > 0 ? acc.steps / acc.completed : nan;
        rows.push_back(std::move(row));
    }
    return rows;
}
