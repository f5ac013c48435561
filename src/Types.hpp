#ifndef TYPES_HPP
#define TYPES_HPP

#include <array>
#include <cstddef>
#include <map>
#include <random>
#include <string>
#include <variant>
#include <vector>

enum Behavior { Legacy, Adaptive };
constexpr size_t kNumBehaviors = 2;

enum Strategy { SuccessBiased, FrequencyBiased, Contagion };
enum UpdateMode { Synchronous, Sequential }; // Synchronous updates read a start-of-step snapshot
enum InteractionMode { RandomPartner, AllNeighbors }; // How dyadic payoffs pick partners each step
enum TerminalState { Running, FixatedAdaptive, FixatedLegacy, TimedOut, Stopped, Failed };
enum CheckpointPolicy { Abort, StartFresh }; // What the runner does with a corrupt checkpoint

using Rng = std::mt19937;
using BehaviorCounts = std::array<size_t, kNumBehaviors>;

// Agents are owned by their model; neighbors are looked up by id in the model's network
struct Agent {
    size_t id = 0;
    Behavior behavior = Behavior::Legacy;
    double fitness = 0.0;
};

struct StepRecord {
    size_t step = 0;
    BehaviorCounts counts{};

    bool operator==(const StepRecord&) const = default;
};

struct TrialResult {
    std::vector<StepRecord> series; // series[0] is the initial configuration
    TerminalState terminal = TerminalState::Running;
    size_t steps = 0;
    std::string error;
};

using ParamValue = std::variant<double, std::string>;
using ParamCombination = std::map<std::string, ParamValue>;

struct ExperimentRecord {
    ParamCombination params;
    size_t combination = 0;
    size_t replicate = 0;
    TerminalState terminal = TerminalState::Running;
    size_t steps = 0;
    size_t adaptive = 0;
    size_t population = 0;
    std::string error;

    bool success() const { return terminal == TerminalState::FixatedAdaptive; }
    bool operator==(const ExperimentRecord&) const = default;
};

struct SummaryRow {
    ParamCombination key;
    size_t replicates = 0;
    size_t failures = 0;
    double successRate = 0.0;
    double legacyRate = 0.0;
    double timeoutRate = 0.0;
    double meanTimeToFixation = 0.0; // over replicates that fixated on Adaptive, NaN if none did
    double meanSteps = 0.0;
};

#endif // TYPES_HPP
