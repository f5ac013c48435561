#ifndef TRIAL_HPP
#define TRIAL_HPP

#include "Model.hpp"
#include "Types.hpp"

#include <functional>
#include <string>

// Extra stopping condition checked after each step, on top of fixation and the step bound
using StopPredicate = std::function<bool(const AgentBasedModel&)>;

// Drives one model until it fixates, the stop predicate holds, or maxSteps is reached.
// Steps are counted from the model's step at construction, so a model may be handed over mid-run.
// Any error raised while stepping ends the trial in the Failed state.
class Trial {
public:
    Trial(AgentBasedModel model, size_t maxSteps, StopPredicate stop = nullptr);

    const TrialResult& run(Rng& gen);

    TerminalState state() const { return result.terminal; }
    const TrialResult& outcome() const { return result; }
    const AgentBasedModel& model() const { return abm; }

private:
    TerminalState evaluate() const;

    AgentBasedModel abm;
    size_t maxSteps;
    StopPredicate stop;
    TrialResult result;
};

std::string terminalToString(TerminalState state);
TerminalState terminalFromString(const std::string& text);

#endif // TRIAL_HPP
