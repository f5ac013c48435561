#include "Trial.hpp"
#include "Errors.hpp"

#include <utility>

Trial::Trial(AgentBasedModel model, size_t maxSteps, StopPredicate stop)
    : abm(std::move(model)), maxSteps(maxSteps), stop(std::move(stop))
{
    if (maxSteps == 0) {
        throw ConfigurationError("A trial needs a positive step bound");
    }
    result.series.push_back({abm.step(), abm.counts()});
}

TerminalState Trial::evaluate() const {
    BehaviorCounts counts = abm.counts();
    if (counts[Behavior::Adaptive] == abm.size()) {
        return TerminalState::FixatedAdaptive;
    }
    if (counts[Behavior::Legacy] == abm.size()) {
        return TerminalState::FixatedLegacy;
    }
    if (stop && stop(abm)) {
        return TerminalState::Stopped;
    }
    if (result.steps >= maxSteps) {
        return TerminalState::TimedOut;
    }
    return TerminalState::Running;
}

const TrialResult& Trial::run(Rng& gen) {
    // Terminal states have no outgoing transitions
    try {
        while (result.terminal == TerminalState::Running) {
            StepRecord record = abm.advanceOneStep(gen);
            result.series.push_back(record);
            result.steps = record.step - result.series.front().step;
            result.terminal = evaluate();
        }
    } catch (const std::exception& e) {
        result.terminal = TerminalState::Failed;
        result.error = e.what();
    }
    return result;
}

std::string terminalToString(TerminalState state) {
    switch (state) {
        case Running:
            return "Running";
        case FixatedAdaptive:
            return "FixatedAdaptive";
        case FixatedLegacy:
            return "FixatedLegacy";
        case TimedOut:
            return "TimedOut";
        case Stopped:
            return "Stopped";
        case Failed:
            return "Failed";
        default:
            throw std::invalid_argument("Unknown terminal state");
    }
}

TerminalState terminalFromString(const std::string& text) {
    for (TerminalState state : {Running, FixatedAdaptive, FixatedLegacy, TimedOut, Stopped, Failed}) {
        if (terminalToString(state) == text) {
            return state;
        }
    }
    throw std::invalid_argument("Unknown terminal state '" + text + "'");
}
