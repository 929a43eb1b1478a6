/**
 * Tactics Battle Engine - Presentation Sink
 *
 * Observer interface the engine reports to after every step, at turn
 * end and when a choice is required. Calls are fire-and-forget: a sink
 * cannot change the outcome of what it is told about.
 */

#pragma once

#include "battle_state.hpp"

namespace tactics {

class PresentationSink {
public:
    virtual ~PresentationSink() = default;

    virtual void on_step(const BattleState& state, const StepReport& report) = 0;
    virtual void on_turn_end(const BattleState& state, const TurnEndReport& report) = 0;
    virtual void on_choice_required(const BattleState& state, const PendingChoice& choice) = 0;
};

/**
 * NullSink - Ignores everything.
 */
class NullSink : public PresentationSink {
public:
    void on_step(const BattleState&, const StepReport&) override {}
    void on_turn_end(const BattleState&, const TurnEndReport&) override {}
    void on_choice_required(const BattleState&, const PendingChoice&) override {}
};

} // namespace tactics
