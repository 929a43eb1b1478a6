/**
 * Tactics Battle Engine - Battle Logger Implementation
 */

#include "battle_logger.hpp"
#include <chrono>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace tactics {

BattleLogger::BattleLogger(const std::string& output_dir) {
    std::error_code ec;
    std::filesystem::create_directories(output_dir, ec);
    if (ec) {
        std::cerr << "[Battle Logger] Cannot create directory " << output_dir
                  << ": " << ec.message() << std::endl;
    }

    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    std::tm tm = *std::localtime(&time_t);

    std::ostringstream filename;
    filename << output_dir << "/battle_"
             << std::put_time(&tm, "%Y%m%d_%H%M%S") << ".log";
    log_path_ = filename.str();

    log_file_.open(log_path_);
    if (!log_file_.is_open()) {
        std::cerr << "[Battle Logger] Failed to open log file: " << log_path_ << std::endl;
        enabled_ = false;
        return;
    }

    log_file_ << std::string(80, '=') << "\n";
    log_file_ << "BATTLE LOG - LINEAR TIMELINE TRACE\n";

    std::ostringstream timestamp;
    timestamp << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
    log_file_ << "Started: " << timestamp.str() << "\n";
    log_file_ << std::string(80, '=') << "\n\n";

    std::cout << "[Battle Logger] Logging to: " << log_path_ << std::endl;
}

BattleLogger::~BattleLogger() {
    if (log_file_.is_open()) {
        log_file_.close();
    }
}

std::string BattleLogger::fmt_card(const CardInstance& card) {
    std::string label = card.name().empty() ? card.card_id() : card.name();
    if (card.is_ghost) {
        label += "*";
    }
    return label + " (" + card.id + ")";
}

void BattleLogger::write_actor(const ActorState& actor, const std::string& label) {
    log_file_ << label << ": HP " << actor.hp << "/" << actor.max_hp
              << " | Block: " << actor.block
              << " | Ether: " << actor.ether_pts
              << " | Tokens: [" << actor.tokens.describe() << "]\n";
    for (const auto& unit : actor.units) {
        log_file_ << "  UNIT " << unit.unit_id << " " << unit.name
                  << ": HP " << unit.hp << "/" << unit.max_hp
                  << " | Block: " << unit.block;
        if (!unit.tokens.empty()) {
            log_file_ << " | Tokens: [" << unit.tokens.describe() << "]";
        }
        log_file_ << "\n";
    }
}

void BattleLogger::write_queue(const BattleState& state) {
    const auto& queue = state.scheduler.queue();
    const int cursor = state.scheduler.cursor();
    log_file_ << "QUEUE (" << queue.size() << "):\n";
    for (size_t i = 0; i < queue.size(); ++i) {
        const QueueItem& item = queue[i];
        const char* marker = static_cast<int>(i) == cursor ? ">" : (static_cast<int>(i) < cursor ? " " : "-");
        log_file_ << "  " << marker << " [" << std::setw(2) << item.sp << "] "
                  << (item.actor == Actor::PLAYER ? "P " : "E ") << fmt_card(item.card);
        if (item.has_crossed) {
            log_file_ << " (crossed)";
        }
        log_file_ << "\n";
    }
}

void BattleLogger::on_step(const BattleState& state, const StepReport& report) {
    if (!enabled_ || !log_file_.is_open()) return;

    log_file_ << std::string(80, '#') << "\n";
    log_file_ << "[TURN " << state.turn;
    if (report.item) {
        log_file_ << " | SP " << report.item->sp << " | "
                  << (report.item->actor == Actor::PLAYER ? "PLAYER" : "ENEMY")
                  << "] PLAY: " << fmt_card(report.item->card) << "\n";
    } else {
        log_file_ << "] (no action)\n";
    }
    log_file_ << std::string(80, '#') << "\n";

    for (const auto& event : report.events) {
        log_file_ << "  <" << to_string(event.type) << "> " << event.message << "\n";
    }
    log_file_ << "\n";

    write_actor(state.player, "PLAYER");
    write_actor(state.enemy, "ENEMY");
    write_queue(state);
    log_file_ << "Phase: " << to_string(state.phase) << "\n\n";

    log_file_.flush();
}

void BattleLogger::on_turn_end(const BattleState& state, const TurnEndReport& report) {
    if (!enabled_ || !log_file_.is_open()) return;

    log_file_ << std::string(80, '=') << "\n";
    log_file_ << "[TURN " << report.turn << " END]\n";
    log_file_ << "Player combo: " << report.player_ether.combo.name
              << " | ether " << report.player_ether.final_ether
              << " (applied " << report.player_ether.applied_ether << ")\n";
    log_file_ << "Enemy combo:  " << report.enemy_ether.combo.name
              << " | ether " << report.enemy_ether.final_ether
              << " (applied " << report.enemy_ether.applied_ether << ")\n";
    log_file_ << "Transfer: net " << report.transfer.net
              << " | moved " << report.transfer.moved
              << " | forfeited " << report.transfer.forfeited << "\n";
    for (const auto& line : report.logs) {
        log_file_ << "  " << line << "\n";
    }
    write_actor(state.player, "PLAYER");
    write_actor(state.enemy, "ENEMY");
    log_file_ << std::string(80, '=') << "\n\n";

    if (report.result != BattleResult::ONGOING) {
        log_battle_end(state);
    }
    log_file_.flush();
}

void BattleLogger::on_choice_required(const BattleState& state, const PendingChoice& choice) {
    if (!enabled_ || !log_file_.is_open()) return;

    log_file_ << "[TURN " << state.turn << "] CHOICE (" << to_string(choice.kind)
              << " from " << choice.source_name << ", insert at sp " << choice.insert_sp
              << ", " << choice.remaining_rounds() << " round(s) left): [";
    const auto& offers = choice.offers();
    for (size_t i = 0; i < offers.size(); ++i) {
        if (i > 0) log_file_ << ", ";
        log_file_ << offers[i];
    }
    log_file_ << "]\n\n";
    log_file_.flush();
}

void BattleLogger::log_battle_end(const BattleState& state) {
    if (!enabled_ || !log_file_.is_open()) return;

    log_file_ << std::string(80, '*') << "\n";
    log_file_ << "BATTLE OVER: " << to_string(state.result)
              << " after " << state.turn << " turn(s)\n";
    log_file_ << std::string(80, '*') << "\n";
    log_file_.flush();
}

} // namespace tactics
