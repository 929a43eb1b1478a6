/**
 * Tactics Battle Engine - Core Type Definitions
 *
 * This file defines all enums, identifiers and shared constants used
 * throughout the engine.
 */

#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <optional>

namespace tactics {

// ============================================================================
// IDENTIFIERS
// ============================================================================

using CardDefID = std::string;   // Catalog card id, e.g. "lunge"
using CardID = std::string;      // Queued instance id, unique within a battle
using TokenID = std::string;     // Token id, e.g. "roulette"
using UnitID = int;              // Unit id inside a composite enemy

// ============================================================================
// CONSTANTS
// ============================================================================

constexpr int MAX_SPEED = 30;
constexpr int BASE_PLAYER_ENERGY = 6;
constexpr int MAX_SUBMIT_CARDS = 5;

constexpr int STUN_RANGE = 5;
constexpr int DEFAULT_PARRY_RANGE = 5;
constexpr int DEFAULT_PARRY_PUSH = 3;

constexpr int DEFAULT_ADVANCE_AMOUNT = 4;
constexpr int DEFAULT_PUSH_AMOUNT = 5;
constexpr int DEFAULT_BEAT_ADVANCE = 1;
constexpr int DEFAULT_BEAT_PUSH = 2;
constexpr int DEFAULT_PUSH_LAST_AMOUNT = 9;
constexpr int DEFAULT_CHAIN_ADVANCE = 3;

constexpr int MAX_FLECHE_CHAIN = 2;
constexpr int CREATION_CHOICE_SIZE = 3;
constexpr int BREACH_SP_OFFSET = 3;
constexpr int CREATION_SP_OFFSET = 1;

constexpr double JAM_CHANCE_PER_STACK = 0.05;
constexpr double BASE_CRIT_CHANCE = 0.05;
constexpr double CRIT_MULTIPLIER = 2.0;

constexpr int VIOLENT_MORT_THRESHOLD = 30;       // Execute at or below this hp
constexpr bool ENEMY_OVERDRIVE_ENABLED = false;  // Locked until enemy patterns exist

// ============================================================================
// ENUMS
// ============================================================================

enum class Actor : uint8_t {
    PLAYER,
    ENEMY
};

enum class CardType : uint8_t {
    ATTACK,
    DEFENSE,
    GENERAL,
    SPECIAL
};

enum class CardCategory : uint8_t {
    GENERAL,
    FENCING,
    GUN,
    SPECIAL
};

enum class Rarity : uint8_t {
    COMMON,
    RARE,
    SPECIAL,
    LEGENDARY
};

enum class TokenLifetime : uint8_t {
    USAGE,      // Consumed by count when referenced
    TURN,       // Cleared at turn end
    PERMANENT   // Never auto-expires
};

enum class TokenCategory : uint8_t {
    POSITIVE,
    NEGATIVE,
    NEUTRAL
};

enum class TokenEffectType : uint8_t {
    ATTACK_BOOST,
    DEFENSE_BOOST,
    DODGE,
    COUNTER,
    LIFESTEAL,
    REVIVE,
    IMMUNITY,
    ENERGY_BOOST,
    STRENGTH,
    AGILITY,
    DAMAGE_TAKEN,
    ATTACK_PENALTY,
    DEFENSE_PENALTY,
    ENERGY_PENALTY,
    CRIT_BOOST,
    BURN,
    HALF_ETHER,
    ROULETTE,
    GUN_JAM,
    JAM_IMMUNITY,
    FINESSE,
    NONE
};

enum class AiMode : uint8_t {
    AGGRO,
    TURTLE,
    BALANCED
};

enum class EventType : uint8_t {
    DAMAGE,
    BLOCK,
    HEAL,
    TOKEN,
    DODGE,
    COUNTER,
    CRITICAL,
    JAM,
    TIMELINE,
    PARRY,
    STUN,
    OUT,
    DESTROY,
    CREATE,
    BURN,
    BREACH,
    REVIVE,
    EXECUTE,
    SELF_DAMAGE,
    DEFEAT,
    INFO
};

enum class BattlePhase : uint8_t {
    SELECT,           // Waiting for the player's committed hand
    RESOLVE,          // Queue is being stepped
    AWAITING_CHOICE,  // Breach/creation selection pending
    TURN_END,         // Queue exhausted, finish_turn() not yet called
    FINISHED
};

enum class BattleResult : uint8_t {
    ONGOING,
    PLAYER_WIN,
    ENEMY_WIN
};

// ============================================================================
// SMALL VALUE TYPES
// ============================================================================

inline Actor opponent_of(Actor actor) {
    return actor == Actor::PLAYER ? Actor::ENEMY : Actor::PLAYER;
}

/**
 * Timeline point at which a token was granted.
 */
struct GrantedAt {
    int turn = 0;
    int sp = 0;
};

/**
 * Structured outcome record handed to the presentation layer.
 */
struct BattleEvent {
    EventType type = EventType::INFO;
    Actor actor = Actor::PLAYER;
    int amount = 0;
    std::string card;
    std::string message;
};

// ============================================================================
// STRING HELPERS
// ============================================================================

inline const char* to_string(Actor actor) {
    return actor == Actor::PLAYER ? "player" : "enemy";
}

inline const char* to_string(CardType type) {
    switch (type) {
        case CardType::ATTACK: return "attack";
        case CardType::DEFENSE: return "defense";
        case CardType::GENERAL: return "general";
        case CardType::SPECIAL: return "special";
    }
    return "general";
}

inline const char* to_string(CardCategory category) {
    switch (category) {
        case CardCategory::GENERAL: return "general";
        case CardCategory::FENCING: return "fencing";
        case CardCategory::GUN: return "gun";
        case CardCategory::SPECIAL: return "special";
    }
    return "general";
}

inline const char* to_string(Rarity rarity) {
    switch (rarity) {
        case Rarity::COMMON: return "common";
        case Rarity::RARE: return "rare";
        case Rarity::SPECIAL: return "special";
        case Rarity::LEGENDARY: return "legendary";
    }
    return "common";
}

inline const char* to_string(TokenLifetime lifetime) {
    switch (lifetime) {
        case TokenLifetime::USAGE: return "usage";
        case TokenLifetime::TURN: return "turn";
        case TokenLifetime::PERMANENT: return "permanent";
    }
    return "usage";
}

inline const char* to_string(AiMode mode) {
    switch (mode) {
        case AiMode::AGGRO: return "aggro";
        case AiMode::TURTLE: return "turtle";
        case AiMode::BALANCED: return "balanced";
    }
    return "balanced";
}

inline const char* to_string(EventType type) {
    switch (type) {
        case EventType::DAMAGE: return "damage";
        case EventType::BLOCK: return "block";
        case EventType::HEAL: return "heal";
        case EventType::TOKEN: return "token";
        case EventType::DODGE: return "dodge";
        case EventType::COUNTER: return "counter";
        case EventType::CRITICAL: return "critical";
        case EventType::JAM: return "jam";
        case EventType::TIMELINE: return "timeline";
        case EventType::PARRY: return "parry";
        case EventType::STUN: return "stun";
        case EventType::OUT: return "out";
        case EventType::DESTROY: return "destroy";
        case EventType::CREATE: return "create";
        case EventType::BURN: return "burn";
        case EventType::BREACH: return "breach";
        case EventType::REVIVE: return "revive";
        case EventType::EXECUTE: return "execute";
        case EventType::SELF_DAMAGE: return "self_damage";
        case EventType::DEFEAT: return "defeat";
        case EventType::INFO: return "info";
    }
    return "info";
}

inline const char* to_string(BattlePhase phase) {
    switch (phase) {
        case BattlePhase::SELECT: return "SELECT";
        case BattlePhase::RESOLVE: return "RESOLVE";
        case BattlePhase::AWAITING_CHOICE: return "AWAITING_CHOICE";
        case BattlePhase::TURN_END: return "TURN_END";
        case BattlePhase::FINISHED: return "FINISHED";
    }
    return "SELECT";
}

inline const char* to_string(BattleResult result) {
    switch (result) {
        case BattleResult::ONGOING: return "ONGOING";
        case BattleResult::PLAYER_WIN: return "PLAYER_WIN";
        case BattleResult::ENEMY_WIN: return "ENEMY_WIN";
    }
    return "ONGOING";
}

} // namespace tactics
