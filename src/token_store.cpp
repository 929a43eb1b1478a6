/**
 * Tactics Battle Engine - Token Store Implementation
 */

#include "token_store.hpp"
#include <algorithm>
#include <iostream>
#include <sstream>
#include <unordered_map>

namespace tactics {

// ============================================================================
// TOKEN TABLE
// ============================================================================

namespace {

using L = TokenLifetime;
using C = TokenCategory;
using E = TokenEffectType;

const std::vector<TokenDef> g_token_defs = {
    // Attack boosts
    {"offense",        "Offense",         L::USAGE,     C::POSITIVE, {E::ATTACK_BOOST, 0.5}, 0},
    {"offensePlus",    "Offense+",        L::USAGE,     C::POSITIVE, {E::ATTACK_BOOST, 1.0}, 0},
    {"attack",         "Attack",          L::TURN,      C::POSITIVE, {E::ATTACK_BOOST, 0.5}, 0},
    {"attackPlus",     "Attack+",         L::TURN,      C::POSITIVE, {E::ATTACK_BOOST, 1.0}, 0},

    // Defense boosts
    {"guard",          "Guard",           L::USAGE,     C::POSITIVE, {E::DEFENSE_BOOST, 0.5}, 0},
    {"guardPlus",      "Guard+",          L::USAGE,     C::POSITIVE, {E::DEFENSE_BOOST, 1.0}, 0},
    {"defense",        "Defense",         L::TURN,      C::POSITIVE, {E::DEFENSE_BOOST, 0.5}, 0},
    {"defensePlus",    "Defense+",        L::TURN,      C::POSITIVE, {E::DEFENSE_BOOST, 1.0}, 0},

    // Dodge
    {"blur",           "Blur",            L::USAGE,     C::POSITIVE, {E::DODGE, 0.5}, 0},
    {"blurPlus",       "Blur+",           L::USAGE,     C::POSITIVE, {E::DODGE, 0.75}, 0},
    {"dodge",          "Dodge",           L::TURN,      C::POSITIVE, {E::DODGE, 0.5}, 0},
    {"dodgePlus",      "Dodge+",          L::TURN,      C::POSITIVE, {E::DODGE, 0.75}, 0},

    // Other positives
    {"counter",        "Counter",         L::USAGE,     C::POSITIVE, {E::COUNTER, 5}, 5},
    {"absorb",         "Absorb",          L::USAGE,     C::POSITIVE, {E::LIFESTEAL, 0.5}, 0},
    {"revive",         "Revive",          L::USAGE,     C::POSITIVE, {E::REVIVE, 0.5}, 0},
    {"immunity",       "Immunity",        L::USAGE,     C::POSITIVE, {E::IMMUNITY, 1}, 0},
    {"warmedUp",       "Warmed Up",       L::TURN,      C::POSITIVE, {E::ENERGY_BOOST, 2}, 0},
    {"crit_boost",     "Crit Focus",      L::TURN,      C::POSITIVE, {E::CRIT_BOOST, 0.05}, 0},
    {"finesse",        "Finesse",         L::PERMANENT, C::POSITIVE, {E::FINESSE, 1}, 10},
    {"loaded",         "Loaded",          L::USAGE,     C::POSITIVE, {E::NONE, 0}, 0},
    {"jam_immunity",   "Jam Immunity",    L::USAGE,     C::POSITIVE, {E::JAM_IMMUNITY, 1}, 0},

    // Neutral
    {"strength",       "Strength",        L::PERMANENT, C::NEUTRAL,  {E::STRENGTH, 1}, 99},
    {"agility",        "Agility",         L::PERMANENT, C::NEUTRAL,  {E::AGILITY, 1}, 10},
    {"roulette",       "Roulette",        L::PERMANENT, C::NEUTRAL,  {E::ROULETTE, 0.05}, 20},

    // Damage taken
    {"vulnerable",     "Vulnerable",      L::TURN,      C::NEGATIVE, {E::DAMAGE_TAKEN, 0.5}, 0},
    {"vulnerablePlus", "Vulnerable+",     L::TURN,      C::NEGATIVE, {E::DAMAGE_TAKEN, 1.0}, 0},
    {"pain",           "Pain",            L::USAGE,     C::NEGATIVE, {E::DAMAGE_TAKEN, 0.5}, 0},
    {"painPlus",       "Pain+",           L::USAGE,     C::NEGATIVE, {E::DAMAGE_TAKEN, 1.0}, 0},

    // Penalties
    {"dullness",       "Dullness",        L::TURN,      C::NEGATIVE, {E::ATTACK_PENALTY, 0.5}, 0},
    {"dullnessPlus",   "Dullness+",       L::TURN,      C::NEGATIVE, {E::ATTACK_PENALTY, 1.0}, 0},
    {"shaken",         "Shaken",          L::USAGE,     C::NEGATIVE, {E::DEFENSE_PENALTY, 0.5}, 0},
    {"shakenPlus",     "Shaken+",         L::USAGE,     C::NEGATIVE, {E::DEFENSE_PENALTY, 1.0}, 0},
    {"exposed",        "Exposed",         L::TURN,      C::NEGATIVE, {E::DEFENSE_PENALTY, 0.5}, 0},
    {"exposedPlus",    "Exposed+",        L::TURN,      C::NEGATIVE, {E::DEFENSE_PENALTY, 1.0}, 0},
    {"dizzy",          "Dizzy",           L::TURN,      C::NEGATIVE, {E::ENERGY_PENALTY, 2}, 0},
    {"half_ether",     "Half Ether",      L::TURN,      C::NEGATIVE, {E::HALF_ETHER, 0.5}, 0},
    {"burn",           "Burn",            L::TURN,      C::NEGATIVE, {E::BURN, 3}, 10},
    {"gun_jam",        "Gun Jam",         L::PERMANENT, C::NEGATIVE, {E::GUN_JAM, 1}, 1},
};

const std::unordered_map<TokenID, TokenID> g_cancellation_map = {
    {"offense", "dullness"},
    {"offensePlus", "dullness"},
    {"attack", "dullness"},
    {"attackPlus", "dullness"},
    {"dullness", "attack"},
    {"dullnessPlus", "attack"},

    {"guard", "exposed"},
    {"guardPlus", "exposed"},
    {"defense", "exposed"},
    {"defensePlus", "exposed"},
    {"exposed", "defense"},
    {"exposedPlus", "defense"},
    {"shaken", "defense"},
    {"shakenPlus", "defense"},

    {"warmedUp", "dizzy"},
    {"dizzy", "warmedUp"},

    {"loaded", "gun_jam"},
    {"gun_jam", "loaded"},
};

const std::unordered_map<TokenID, const TokenDef*>& token_index() {
    static const std::unordered_map<TokenID, const TokenDef*> index = [] {
        std::unordered_map<TokenID, const TokenDef*> m;
        for (const auto& def : g_token_defs) {
            m[def.id] = &def;
        }
        return m;
    }();
    return index;
}

const std::string& display_name(const TokenID& id) {
    const TokenDef* def = find_token_def(id);
    return def ? def->name : id;
}

} // anonymous namespace

const TokenDef* find_token_def(const TokenID& id) {
    const auto& index = token_index();
    auto it = index.find(id);
    return it != index.end() ? it->second : nullptr;
}

const TokenID* cancelling_token(const TokenID& id) {
    auto it = g_cancellation_map.find(id);
    return it != g_cancellation_map.end() ? &it->second : nullptr;
}

std::vector<TokenID> all_token_ids() {
    std::vector<TokenID> ids;
    ids.reserve(g_token_defs.size());
    for (const auto& def : g_token_defs) {
        ids.push_back(def.id);
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

// ============================================================================
// BUCKETS
// ============================================================================

std::vector<TokenInstance>& TokenStore::bucket(TokenLifetime lifetime) {
    switch (lifetime) {
        case TokenLifetime::USAGE: return usage_;
        case TokenLifetime::TURN: return turn_;
        case TokenLifetime::PERMANENT: return permanent_;
    }
    return usage_;
}

const std::vector<TokenInstance>& TokenStore::bucket(TokenLifetime lifetime) const {
    switch (lifetime) {
        case TokenLifetime::USAGE: return usage_;
        case TokenLifetime::TURN: return turn_;
        case TokenLifetime::PERMANENT: return permanent_;
    }
    return usage_;
}

const std::vector<TokenInstance>& TokenStore::tokens(TokenLifetime lifetime) const {
    return bucket(lifetime);
}

// ============================================================================
// MUTATION
// ============================================================================

TokenResult TokenStore::add(const TokenID& id, int stacks,
                            std::optional<GrantedAt> granted_at) {
    TokenResult result;
    if (stacks <= 0) {
        return result;
    }

    const TokenDef* def = find_token_def(id);
    if (!def) {
        std::cerr << "[TokenStore] Unknown token: " << id << std::endl;
        return result;
    }

    // Immunity absorbs one negative token
    if (def->category == TokenCategory::NEGATIVE && has("immunity")) {
        result.logs.push_back("Immunity blocked " + def->name + "!");
        result.append(remove("immunity", TokenLifetime::USAGE, 1));
        result.changed = true;
        return result;
    }

    if (id == "gun_jam" && has("gun_jam")) {
        result.logs.push_back("Already jammed");
        return result;
    }

    if (id == "roulette" && has("gun_jam")) {
        result.logs.push_back("Roulette cannot build while jammed");
        return result;
    }

    if (const TokenID* opposite = cancelling_token(id)) {
        int cancelled = cancel_opposite(*opposite, stacks);
        if (cancelled > 0) {
            result.changed = true;
            std::ostringstream msg;
            msg << def->name << " cancelled " << display_name(*opposite)
                << " (" << cancelled << " stacks)";
            result.logs.push_back(msg.str());
            stacks -= cancelled;
        }

        // Loading only clears a jam
        if (id == "loaded") {
            if (cancelled == 0) {
                result.logs.push_back("No jam to clear, loading has no effect");
            }
            return result;
        }

        if (stacks <= 0) {
            return result;
        }
    }

    auto& list = bucket(def->lifetime);
    auto it = std::find_if(list.begin(), list.end(),
                           [&id](const TokenInstance& t) { return t.id == id; });

    int before = (it != list.end()) ? it->stacks : 0;
    int after = before + stacks;
    if (def->max_stacks > 0) {
        after = std::min(after, def->max_stacks);
    }
    if (after == before) {
        return result;
    }

    if (it != list.end()) {
        it->stacks = after;
        if (def->lifetime == TokenLifetime::TURN && granted_at) {
            it->granted_at = granted_at;
        }
    } else {
        TokenInstance token;
        token.id = id;
        token.stacks = after;
        if (def->lifetime == TokenLifetime::TURN) {
            token.granted_at = granted_at;
        }
        list.push_back(token);
    }

    result.changed = true;
    std::ostringstream msg;
    msg << "Gained " << def->name << " x" << (after - before);
    result.logs.push_back(msg.str());
    return result;
}

int TokenStore::cancel_opposite(const TokenID& opposite_id, int stacks) {
    for (TokenLifetime lifetime : {TokenLifetime::USAGE, TokenLifetime::TURN,
                                   TokenLifetime::PERMANENT}) {
        auto& list = bucket(lifetime);
        auto it = std::find_if(list.begin(), list.end(),
                               [&opposite_id](const TokenInstance& t) {
                                   return t.id == opposite_id;
                               });
        if (it == list.end() || it->stacks <= 0) {
            continue;
        }

        int cancelled = std::min(stacks, it->stacks);
        it->stacks -= cancelled;
        if (it->stacks <= 0) {
            list.erase(it);
        }
        return cancelled;
    }
    return 0;
}

TokenResult TokenStore::remove(const TokenID& id, TokenLifetime lifetime, int stacks) {
    TokenResult result;
    if (stacks <= 0) {
        return result;
    }

    auto& list = bucket(lifetime);
    auto it = std::find_if(list.begin(), list.end(),
                           [&id](const TokenInstance& t) { return t.id == id; });
    if (it == list.end()) {
        return result;
    }

    result.changed = true;
    const std::string name = display_name(id);
    if (it->stacks - stacks <= 0) {
        list.erase(it);
        result.logs.push_back(name + " consumed");
    } else {
        it->stacks -= stacks;
        std::ostringstream msg;
        msg << name << " -" << stacks << " (" << it->stacks << " left)";
        result.logs.push_back(msg.str());
    }
    return result;
}

TokenResult TokenStore::remove(const TokenID& id, int stacks) {
    for (TokenLifetime lifetime : {TokenLifetime::USAGE, TokenLifetime::TURN,
                                   TokenLifetime::PERMANENT}) {
        const auto& list = bucket(lifetime);
        bool present = std::any_of(list.begin(), list.end(),
                                   [&id](const TokenInstance& t) { return t.id == id; });
        if (present) {
            return remove(id, lifetime, stacks);
        }
    }
    return TokenResult{};
}

TokenResult TokenStore::set_stacks(const TokenID& id, TokenLifetime lifetime, int n) {
    TokenResult result;
    auto& list = bucket(lifetime);
    auto it = std::find_if(list.begin(), list.end(),
                           [&id](const TokenInstance& t) { return t.id == id; });

    if (it == list.end()) {
        if (n > 0) {
            TokenInstance token;
            token.id = id;
            token.stacks = n;
            list.push_back(token);
            result.changed = true;
            std::ostringstream msg;
            msg << display_name(id) << " set to " << n;
            result.logs.push_back(msg.str());
        }
        return result;
    }

    result.changed = true;
    if (n <= 0) {
        const std::string name = display_name(id);
        list.erase(it);
        result.logs.push_back(name + " reset");
    } else {
        std::ostringstream msg;
        msg << display_name(id) << " reset (" << it->stacks << " -> " << n << ")";
        it->stacks = n;
        result.logs.push_back(msg.str());
    }
    return result;
}

TokenResult TokenStore::clear_turn_tokens() {
    TokenResult result;
    std::vector<TokenInstance> remaining;

    for (const auto& token : turn_) {
        if (token.granted_at) {
            remaining.push_back(token);
            continue;
        }
        std::ostringstream msg;
        msg << display_name(token.id) << " x" << token.stacks << " expired (turn end)";
        result.logs.push_back(msg.str());
        result.changed = true;
    }

    turn_ = std::move(remaining);
    return result;
}

TokenResult TokenStore::expire_turn_tokens_by_timeline(int turn, int sp) {
    TokenResult result;
    std::vector<TokenInstance> remaining;

    for (const auto& token : turn_) {
        if (!token.granted_at) {
            remaining.push_back(token);
            continue;
        }

        bool expired = turn > token.granted_at->turn && sp >= token.granted_at->sp;
        if (expired) {
            std::ostringstream msg;
            msg << display_name(token.id) << " x" << token.stacks
                << " expired (sp " << token.granted_at->sp << " reached)";
            result.logs.push_back(msg.str());
            result.changed = true;
        } else {
            remaining.push_back(token);
        }
    }

    turn_ = std::move(remaining);
    return result;
}

void TokenStore::clear() {
    usage_.clear();
    turn_.clear();
    permanent_.clear();
}

// ============================================================================
// QUERIES
// ============================================================================

int TokenStore::stacks(const TokenID& id) const {
    for (const auto* list : {&usage_, &turn_, &permanent_}) {
        for (const auto& token : *list) {
            if (token.id == id) {
                return token.stacks;
            }
        }
    }
    return 0;
}

std::vector<TokenInstance> TokenStore::all() const {
    std::vector<TokenInstance> result;
    result.reserve(usage_.size() + turn_.size() + permanent_.size());
    result.insert(result.end(), permanent_.begin(), permanent_.end());
    result.insert(result.end(), usage_.begin(), usage_.end());
    result.insert(result.end(), turn_.begin(), turn_.end());
    return result;
}

std::string TokenStore::describe() const {
    std::ostringstream out;
    bool first = true;
    for (const auto& token : all()) {
        if (!first) out << ", ";
        out << token.id << "x" << token.stacks;
        first = false;
    }
    return out.str();
}

} // namespace tactics
