/**
 * Tactics Battle Engine - Battle Logger
 *
 * Full battle trace for debugging. Writes one block per resolved step
 * (events, both sides' hp/block/tokens, remaining queue), turn-end ether
 * summaries and the final result to a timestamped file.
 */

#pragma once

#include "presentation_sink.hpp"
#include <fstream>
#include <string>

namespace tactics {

/**
 * BattleLogger - PresentationSink that writes a linear state trace.
 */
class BattleLogger : public PresentationSink {
public:
    /**
     * Constructor - creates <output_dir>/battle_YYYYmmdd_HHMMSS.log.
     *
     * Disables itself if the file cannot be opened.
     */
    explicit BattleLogger(const std::string& output_dir = "logs");

    ~BattleLogger() override;

    void on_step(const BattleState& state, const StepReport& report) override;
    void on_turn_end(const BattleState& state, const TurnEndReport& report) override;
    void on_choice_required(const BattleState& state, const PendingChoice& choice) override;

    /**
     * Log the battle result.
     */
    void log_battle_end(const BattleState& state);

    /**
     * Get the log file path.
     */
    const std::string& get_log_path() const { return log_path_; }

    bool is_enabled() const { return enabled_; }
    void set_enabled(bool enabled) { enabled_ = enabled && log_file_.is_open(); }

private:
    std::string log_path_;
    std::ofstream log_file_;
    bool enabled_ = true;

    /**
     * "HP: 40/50 | Block: 3 | Tokens: [...]" plus one line per unit.
     */
    void write_actor(const ActorState& actor, const std::string& label);

    void write_queue(const BattleState& state);

    /**
     * Format card as "Name (instance_id)".
     */
    static std::string fmt_card(const CardInstance& card);
};

} // namespace tactics
