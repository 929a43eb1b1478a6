/**
 * Tactics Battle Engine - Python Bindings
 *
 * pybind11 wrapper for the C++ engine.
 * Lets Python simulations and balance scripts drive battles.
 */

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/functional.h>

#include "tactics_engine.hpp"

namespace py = pybind11;

PYBIND11_MODULE(tactics_engine_cpp, m) {
    m.doc() = "Timeline-based tactical battle engine";

    // ========================================================================
    // ENUMS
    // ========================================================================

    py::enum_<tactics::Actor>(m, "Actor")
        .value("PLAYER", tactics::Actor::PLAYER)
        .value("ENEMY", tactics::Actor::ENEMY)
        .export_values();

    py::enum_<tactics::CardType>(m, "CardType")
        .value("ATTACK", tactics::CardType::ATTACK)
        .value("DEFENSE", tactics::CardType::DEFENSE)
        .value("GENERAL", tactics::CardType::GENERAL)
        .value("SPECIAL", tactics::CardType::SPECIAL)
        .export_values();

    py::enum_<tactics::CardCategory>(m, "CardCategory")
        .value("GENERAL", tactics::CardCategory::GENERAL)
        .value("FENCING", tactics::CardCategory::FENCING)
        .value("GUN", tactics::CardCategory::GUN)
        .value("SPECIAL", tactics::CardCategory::SPECIAL);

    py::enum_<tactics::Rarity>(m, "Rarity")
        .value("COMMON", tactics::Rarity::COMMON)
        .value("RARE", tactics::Rarity::RARE)
        .value("SPECIAL", tactics::Rarity::SPECIAL)
        .value("LEGENDARY", tactics::Rarity::LEGENDARY);

    py::enum_<tactics::AiMode>(m, "AiMode")
        .value("AGGRO", tactics::AiMode::AGGRO)
        .value("TURTLE", tactics::AiMode::TURTLE)
        .value("BALANCED", tactics::AiMode::BALANCED)
        .export_values();

    py::enum_<tactics::EventType>(m, "EventType")
        .value("DAMAGE", tactics::EventType::DAMAGE)
        .value("BLOCK", tactics::EventType::BLOCK)
        .value("HEAL", tactics::EventType::HEAL)
        .value("TOKEN", tactics::EventType::TOKEN)
        .value("DODGE", tactics::EventType::DODGE)
        .value("COUNTER", tactics::EventType::COUNTER)
        .value("CRITICAL", tactics::EventType::CRITICAL)
        .value("JAM", tactics::EventType::JAM)
        .value("TIMELINE", tactics::EventType::TIMELINE)
        .value("PARRY", tactics::EventType::PARRY)
        .value("STUN", tactics::EventType::STUN)
        .value("OUT", tactics::EventType::OUT)
        .value("DESTROY", tactics::EventType::DESTROY)
        .value("CREATE", tactics::EventType::CREATE)
        .value("BURN", tactics::EventType::BURN)
        .value("BREACH", tactics::EventType::BREACH)
        .value("REVIVE", tactics::EventType::REVIVE)
        .value("EXECUTE", tactics::EventType::EXECUTE)
        .value("SELF_DAMAGE", tactics::EventType::SELF_DAMAGE)
        .value("DEFEAT", tactics::EventType::DEFEAT)
        .value("INFO", tactics::EventType::INFO);

    py::enum_<tactics::BattlePhase>(m, "BattlePhase")
        .value("SELECT", tactics::BattlePhase::SELECT)
        .value("RESOLVE", tactics::BattlePhase::RESOLVE)
        .value("AWAITING_CHOICE", tactics::BattlePhase::AWAITING_CHOICE)
        .value("TURN_END", tactics::BattlePhase::TURN_END)
        .value("FINISHED", tactics::BattlePhase::FINISHED)
        .export_values();

    py::enum_<tactics::BattleResult>(m, "BattleResult")
        .value("ONGOING", tactics::BattleResult::ONGOING)
        .value("PLAYER_WIN", tactics::BattleResult::PLAYER_WIN)
        .value("ENEMY_WIN", tactics::BattleResult::ENEMY_WIN)
        .export_values();

    // ========================================================================
    // CARDS
    // ========================================================================

    py::class_<tactics::TokenGrant>(m, "TokenGrant")
        .def(py::init<>())
        .def_readwrite("id", &tactics::TokenGrant::id)
        .def_readwrite("stacks", &tactics::TokenGrant::stacks)
        .def_readwrite("target_self", &tactics::TokenGrant::target_self);

    py::class_<tactics::CardDef>(m, "CardDef")
        .def(py::init<>())
        .def_readwrite("card_id", &tactics::CardDef::card_id)
        .def_readwrite("name", &tactics::CardDef::name)
        .def_readwrite("type", &tactics::CardDef::type)
        .def_readwrite("category", &tactics::CardDef::category)
        .def_readwrite("rarity", &tactics::CardDef::rarity)
        .def_readwrite("damage", &tactics::CardDef::damage)
        .def_readwrite("block", &tactics::CardDef::block)
        .def_readwrite("hits", &tactics::CardDef::hits)
        .def_readwrite("speed_cost", &tactics::CardDef::speed_cost)
        .def_readwrite("action_cost", &tactics::CardDef::action_cost)
        .def_readwrite("traits", &tactics::CardDef::traits)
        .def_readwrite("specials", &tactics::CardDef::specials)
        .def_readwrite("required_tokens", &tactics::CardDef::required_tokens)
        .def_readwrite("applied_tokens", &tactics::CardDef::applied_tokens)
        .def("is_attack", &tactics::CardDef::is_attack)
        .def("has_trait", &tactics::CardDef::has_trait)
        .def("has_special", &tactics::CardDef::has_special);

    py::class_<tactics::CardCatalog>(m, "CardCatalog")
        .def(py::init<>())
        .def("load_from_json", &tactics::CardCatalog::load_from_json)
        .def("add_card", &tactics::CardCatalog::add_card,
             py::arg("card"), py::arg("enemy_pool") = false)
        .def("get_card", &tactics::CardCatalog::get_card, py::return_value_policy::reference)
        .def("has_card", &tactics::CardCatalog::has_card)
        .def("player_card_ids", &tactics::CardCatalog::player_card_ids)
        .def("enemy_card_ids", &tactics::CardCatalog::enemy_card_ids)
        .def("card_count", &tactics::CardCatalog::card_count);

    py::class_<tactics::CardInstance>(m, "CardInstance")
        .def_readonly("id", &tactics::CardInstance::id)
        .def_readonly("def_", &tactics::CardInstance::def)
        .def_readonly("is_ghost", &tactics::CardInstance::is_ghost)
        .def_readonly("created_by", &tactics::CardInstance::created_by)
        .def_readonly("fleche_chain_count", &tactics::CardInstance::fleche_chain_count)
        .def_readonly("is_aoe", &tactics::CardInstance::is_aoe)
        .def("card_id", &tactics::CardInstance::card_id)
        .def("name", &tactics::CardInstance::name);

    // ========================================================================
    // ACTORS
    // ========================================================================

    py::class_<tactics::TokenStore>(m, "TokenStore")
        .def(py::init<>())
        .def("add", [](tactics::TokenStore& store, const tactics::TokenID& id, int stacks) {
            return store.add(id, stacks).logs;
        }, py::arg("id"), py::arg("stacks") = 1)
        .def("remove", [](tactics::TokenStore& store, const tactics::TokenID& id, int stacks) {
            return store.remove(id, stacks).logs;
        }, py::arg("id"), py::arg("stacks") = 1)
        .def("stacks", &tactics::TokenStore::stacks)
        .def("has", &tactics::TokenStore::has)
        .def("describe", &tactics::TokenStore::describe);

    py::class_<tactics::Unit>(m, "Unit")
        .def(py::init<>())
        .def_readwrite("unit_id", &tactics::Unit::unit_id)
        .def_readwrite("name", &tactics::Unit::name)
        .def_readwrite("hp", &tactics::Unit::hp)
        .def_readwrite("max_hp", &tactics::Unit::max_hp)
        .def_readwrite("block", &tactics::Unit::block)
        .def_readwrite("tokens", &tactics::Unit::tokens)
        .def("is_alive", &tactics::Unit::is_alive);

    py::class_<tactics::ActorState>(m, "ActorState")
        .def(py::init<>())
        .def(py::init<tactics::Actor, std::string, int>())
        .def_readwrite("side", &tactics::ActorState::side)
        .def_readwrite("name", &tactics::ActorState::name)
        .def_readwrite("hp", &tactics::ActorState::hp)
        .def_readwrite("max_hp", &tactics::ActorState::max_hp)
        .def_readwrite("block", &tactics::ActorState::block)
        .def_readwrite("strength", &tactics::ActorState::strength)
        .def_readwrite("agility", &tactics::ActorState::agility)
        .def_readwrite("counter", &tactics::ActorState::counter)
        .def_readwrite("energy", &tactics::ActorState::energy)
        .def_readwrite("max_energy", &tactics::ActorState::max_energy)
        .def_readwrite("max_speed", &tactics::ActorState::max_speed)
        .def_readwrite("ether_pts", &tactics::ActorState::ether_pts)
        .def_readwrite("ether_ban", &tactics::ActorState::ether_ban)
        .def_readwrite("ether_slots", &tactics::ActorState::ether_slots)
        .def_readwrite("tokens", &tactics::ActorState::tokens)
        .def_readwrite("units", &tactics::ActorState::units)
        .def_readwrite("deck", &tactics::ActorState::deck)
        .def_readwrite("min_cards", &tactics::ActorState::min_cards)
        .def_readwrite("max_cards", &tactics::ActorState::max_cards)
        .def_readwrite("enemy_kind", &tactics::ActorState::enemy_kind)
        .def_readonly("combo_usage", &tactics::ActorState::combo_usage)
        .def("is_defeated", &tactics::ActorState::is_defeated);

    // ========================================================================
    // BATTLE STATE
    // ========================================================================

    py::class_<tactics::BattleEvent>(m, "BattleEvent")
        .def_readonly("type", &tactics::BattleEvent::type)
        .def_readonly("actor", &tactics::BattleEvent::actor)
        .def_readonly("amount", &tactics::BattleEvent::amount)
        .def_readonly("card", &tactics::BattleEvent::card)
        .def_readonly("message", &tactics::BattleEvent::message);

    py::class_<tactics::HitResult>(m, "HitResult")
        .def_readonly("damage", &tactics::HitResult::damage)
        .def_readonly("damage_taken", &tactics::HitResult::damage_taken)
        .def_readonly("block_destroyed", &tactics::HitResult::block_destroyed)
        .def_readonly("is_critical", &tactics::HitResult::is_critical)
        .def_readonly("dodged", &tactics::HitResult::dodged)
        .def_readonly("fully_blocked", &tactics::HitResult::fully_blocked);

    py::class_<tactics::QueueItem>(m, "QueueItem")
        .def_readonly("actor", &tactics::QueueItem::actor)
        .def_readonly("card", &tactics::QueueItem::card)
        .def_readonly("sp", &tactics::QueueItem::sp)
        .def_readonly("has_crossed", &tactics::QueueItem::has_crossed);

    py::class_<tactics::PendingChoice>(m, "PendingChoice")
        .def_readonly("actor", &tactics::PendingChoice::actor)
        .def_readonly("source_card", &tactics::PendingChoice::source_card)
        .def_readonly("insert_sp", &tactics::PendingChoice::insert_sp)
        .def("offers", &tactics::PendingChoice::offers)
        .def("remaining_rounds", &tactics::PendingChoice::remaining_rounds);

    py::class_<tactics::BattleState>(m, "BattleState")
        .def_readonly("player", &tactics::BattleState::player)
        .def_readonly("enemy", &tactics::BattleState::enemy)
        .def_readonly("turn", &tactics::BattleState::turn)
        .def_readonly("phase", &tactics::BattleState::phase)
        .def_readonly("result", &tactics::BattleState::result)
        .def_readonly("pending_choice", &tactics::BattleState::pending_choice)
        .def_readonly("enemy_mode", &tactics::BattleState::enemy_mode)
        .def_readonly("enemy_overdrive", &tactics::BattleState::enemy_overdrive)
        .def_readonly("vanished_cards", &tactics::BattleState::vanished_cards)
        .def("queue", [](const tactics::BattleState& state) {
            return state.scheduler.queue();
        })
        .def("cursor", [](const tactics::BattleState& state) {
            return state.scheduler.cursor();
        })
        .def("is_over", &tactics::BattleState::is_over);

    py::class_<tactics::StepReport>(m, "StepReport")
        .def_readonly("resolved", &tactics::StepReport::resolved)
        .def_readonly("item", &tactics::StepReport::item)
        .def_readonly("events", &tactics::StepReport::events)
        .def_readonly("logs", &tactics::StepReport::logs)
        .def_readonly("dealt", &tactics::StepReport::dealt)
        .def_readonly("choice_required", &tactics::StepReport::choice_required)
        .def_readonly("turn_complete", &tactics::StepReport::turn_complete)
        .def_readonly("battle_over", &tactics::StepReport::battle_over);

    py::class_<tactics::TurnEndReport>(m, "TurnEndReport")
        .def_readonly("valid", &tactics::TurnEndReport::valid)
        .def_readonly("turn", &tactics::TurnEndReport::turn)
        .def_readonly("result", &tactics::TurnEndReport::result)
        .def_readonly("logs", &tactics::TurnEndReport::logs)
        .def_property_readonly("player_combo", [](const tactics::TurnEndReport& r) {
            return r.player_ether.combo.name;
        })
        .def_property_readonly("enemy_combo", [](const tactics::TurnEndReport& r) {
            return r.enemy_ether.combo.name;
        })
        .def_property_readonly("player_ether", [](const tactics::TurnEndReport& r) {
            return r.player_ether.final_ether;
        })
        .def_property_readonly("enemy_ether", [](const tactics::TurnEndReport& r) {
            return r.enemy_ether.final_ether;
        })
        .def_property_readonly("moved", [](const tactics::TurnEndReport& r) {
            return r.transfer.moved;
        });

    // ========================================================================
    // CONFIG / RNG
    // ========================================================================

    py::class_<tactics::EngineConfig>(m, "EngineConfig")
        .def(py::init<>())
        .def_readwrite("max_speed", &tactics::EngineConfig::max_speed)
        .def_readwrite("base_player_energy", &tactics::EngineConfig::base_player_energy)
        .def_readwrite("max_submit_cards", &tactics::EngineConfig::max_submit_cards)
        .def_readwrite("stun_range", &tactics::EngineConfig::stun_range)
        .def_readwrite("parry_range", &tactics::EngineConfig::parry_range)
        .def_readwrite("parry_push", &tactics::EngineConfig::parry_push)
        .def_readwrite("fleche_chain_cap", &tactics::EngineConfig::fleche_chain_cap)
        .def_readwrite("jam_chance_per_stack", &tactics::EngineConfig::jam_chance_per_stack)
        .def_readwrite("base_crit_chance", &tactics::EngineConfig::base_crit_chance)
        .def_readwrite("crit_multiplier", &tactics::EngineConfig::crit_multiplier)
        .def_readwrite("enemy_max_cards", &tactics::EngineConfig::enemy_max_cards)
        .def_readwrite("logging_enabled", &tactics::EngineConfig::logging_enabled)
        .def_readwrite("log_dir", &tactics::EngineConfig::log_dir)
        .def("load_from_json", &tactics::EngineConfig::load_from_json);

    py::class_<tactics::Rng>(m, "Rng");

    py::class_<tactics::MersenneRng, tactics::Rng>(m, "MersenneRng")
        .def(py::init<uint32_t>(), py::arg("seed"))
        .def("next_double", &tactics::MersenneRng::next_double)
        .def("next_int", &tactics::MersenneRng::next_int);

    // ========================================================================
    // ENGINE
    // ========================================================================

    py::class_<tactics::BattleEngine>(m, "BattleEngine")
        .def(py::init([](const tactics::CardCatalog& catalog,
                         const tactics::EngineConfig& config,
                         tactics::Rng& rng) {
            return new tactics::BattleEngine(catalog, config, rng);
        }), py::keep_alive<1, 2>(), py::keep_alive<1, 3>(), py::keep_alive<1, 4>())
        .def("create_battle", &tactics::BattleEngine::create_battle)
        .def("commit_turn", &tactics::BattleEngine::commit_turn,
             py::arg("state"), py::arg("card_ids"), py::arg("selected_target") = py::none())
        .def("step", &tactics::BattleEngine::step)
        .def("run_until_blocked", &tactics::BattleEngine::run_until_blocked)
        .def("resume_with_choice", &tactics::BattleEngine::resume_with_choice)
        .def("finish_turn", &tactics::BattleEngine::finish_turn)
        .def("turn_energy", &tactics::BattleEngine::turn_energy)
        .def("set_hit_callback", &tactics::BattleEngine::set_hit_callback);

    // ========================================================================
    // MODULE INFO
    // ========================================================================

    m.def("get_version", &tactics::get_version);
    m.attr("VERSION") = tactics::get_version();
    m.attr("__version__") = tactics::get_version();
}
