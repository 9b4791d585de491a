/**
 * @file SoulConfig.cpp
 * @brief Chargement, validation et résumé de la configuration
 * @version 1.0
 * @date 2026-10-19
 */

#include "SoulConfig.hpp"
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace soul {

using json = nlohmann::json;

namespace {

void requireUnit(const char* name, double value) {
    if (!(value >= 0.0 && value <= 1.0)) {
        std::ostringstream oss;
        oss << "Paramètre '" << name << "' hors domaine [0, 1]: " << value;
        throw std::invalid_argument(oss.str());
    }
}

void requirePositive(const char* name, double value) {
    if (!(value > 0.0)) {
        std::ostringstream oss;
        oss << "Paramètre '" << name << "' doit être > 0: " << value;
        throw std::invalid_argument(oss.str());
    }
}

void requireAtLeast(const char* name, long long value, long long minimum) {
    if (value < minimum) {
        std::ostringstream oss;
        oss << "Paramètre '" << name << "' doit être >= " << minimum << ": " << value;
        throw std::invalid_argument(oss.str());
    }
}

void requireAtMost(const char* name, long long value, long long maximum) {
    if (value > maximum) {
        std::ostringstream oss;
        oss << "Paramètre '" << name << "' doit être <= " << maximum << ": " << value;
        throw std::invalid_argument(oss.str());
    }
}

// Lecture d'un entier non négatif (évite le repli silencieux d'un négatif en size_t)
size_t readCount(const json& section, const char* key, size_t fallback) {
    if (!section.contains(key)) {
        return fallback;
    }
    long long raw = section.at(key).get<long long>();
    requireAtLeast(key, raw, 0);
    return static_cast<size_t>(raw);
}

const json& sectionOf(const json& j, const char* name) {
    static const json empty = json::object();
    if (j.contains(name) && j.at(name).is_object()) {
        return j.at(name);
    }
    return empty;
}

} // namespace

// ═══════════════════════════════════════════════════════════════════════════
// VALIDATION
// ═══════════════════════════════════════════════════════════════════════════

void SoulConfig::validate() const {
    requireAtLeast("max_life_cycles", life_cycles.max_life_cycles, 1);
    requireAtLeast("min_cycle_duration", life_cycles.min_cycle_duration, 1);
    requireAtMost("min_cycle_duration", life_cycles.min_cycle_duration, MAX_MIN_CYCLE_DURATION);
    requireAtLeast("max_cycle_duration", life_cycles.max_cycle_duration,
                   life_cycles.min_cycle_duration);

    requireUnit("storage_threshold", memory.storage_threshold);
    requireUnit("prune_threshold", memory.prune_threshold);
    requireUnit("inheritance_fraction", memory.inheritance_fraction);
    requireUnit("inheritance_strength", memory.inheritance_strength);
    requireUnit("recall_threshold", memory.recall_threshold);
    if (memory.storage_path.empty()) {
        throw std::invalid_argument("Paramètre 'storage_path' vide");
    }

    requirePositive("decay_rate", emotion.decay_rate);
    requireUnit("decay_rate", emotion.decay_rate);
    requireUnit("persistence_floor", emotion.persistence_floor);

    requireUnit("growth_rate", consciousness.growth_rate);
    requireUnit("novelty_bonus", consciousness.novelty_bonus);
    requireUnit("familiar_bonus", consciousness.familiar_bonus);
    requireUnit("initial_level", consciousness.initial_level);
    requireUnit("bloom_threshold", consciousness.bloom_threshold);
    requireAtLeast("bloom_window", static_cast<long long>(consciousness.bloom_window), 1);
    if (consciousness.bloom_min_existential > consciousness.bloom_window) {
        throw std::invalid_argument(
            "Paramètre 'bloom_min_existential' supérieur à 'bloom_window'");
    }
    requireUnit("empathy_maturity_floor", consciousness.empathy_maturity_floor);
    requireUnit("harmony_maturity_floor", consciousness.harmony_maturity_floor);
    requireUnit("empathy_bloom_floor", consciousness.empathy_bloom_floor);
    requireUnit("harmony_bloom_floor", consciousness.harmony_bloom_floor);
    requireUnit("empathy_delta", consciousness.empathy_delta);
    requireUnit("harmony_delta", consciousness.harmony_delta);
    requireUnit("self_preservation_delta", consciousness.self_preservation_delta);

    requireUnit("mutation_probability", personality.mutation_probability);
    requireUnit("mutation_amplitude", personality.mutation_amplitude);
    requireUnit("dominant_threshold", personality.dominant_threshold);
    requireUnit("ethical_ratio_threshold", personality.ethical_ratio_threshold);
    requireUnit("consciousness_factor", personality.consciousness_factor);

    requireUnit("novelty_threshold", environment.novelty_threshold);
    requireUnit("significance_noise", environment.significance_noise);
    requireUnit("min_significance", environment.min_significance);
    requireUnit("recent_penalty", environment.recent_penalty);
    requirePositive("growth_bonus", environment.growth_bonus);

    requireUnit("rebirth_threshold", rebirth_threshold);
}

void SoulConfig::adjustDifficulty(double level) {
    if (!(level >= 0.0 && level <= 1.0)) {
        std::ostringstream oss;
        oss << "Niveau de difficulté hors domaine [0, 1]: " << level;
        throw std::invalid_argument(oss.str());
    }

    SoulConfig candidate = *this;
    candidate.life_cycles.max_life_cycles = static_cast<int>(5 + level * 15);
    candidate.consciousness.growth_rate = 0.005 + level * 0.015;
    candidate.consciousness.bloom_threshold = 0.9 - level * 0.1;
    candidate.personality.mutation_probability = 0.05 + level * 0.1;
    candidate.validate();

    *this = candidate;
}

// ═══════════════════════════════════════════════════════════════════════════
// SÉRIALISATION
// ═══════════════════════════════════════════════════════════════════════════

SoulConfig SoulConfig::fromJson(const json& j) {
    if (!j.is_object()) {
        throw std::invalid_argument("Configuration JSON: objet attendu à la racine");
    }

    SoulConfig cfg;

    const auto& lc = sectionOf(j, "life_cycles");
    cfg.life_cycles.max_life_cycles = lc.value("max", cfg.life_cycles.max_life_cycles);
    cfg.life_cycles.min_cycle_duration = lc.value("min_duration", cfg.life_cycles.min_cycle_duration);
    cfg.life_cycles.max_cycle_duration = lc.value("max_duration", cfg.life_cycles.max_cycle_duration);

    const auto& m = sectionOf(j, "memory");
    cfg.memory.storage_threshold = m.value("storage_threshold", cfg.memory.storage_threshold);
    cfg.memory.prune_threshold = m.value("prune_threshold", cfg.memory.prune_threshold);
    cfg.memory.inheritance_fraction = m.value("inheritance_fraction", cfg.memory.inheritance_fraction);
    cfg.memory.inheritance_strength = m.value("inheritance_strength", cfg.memory.inheritance_strength);
    cfg.memory.recall_threshold = m.value("recall_threshold", cfg.memory.recall_threshold);
    cfg.memory.significant_limit = readCount(m, "significant_limit", cfg.memory.significant_limit);
    cfg.memory.storage_path = m.value("storage_path", cfg.memory.storage_path);

    const auto& e = sectionOf(j, "emotion");
    cfg.emotion.decay_rate = e.value("decay_rate", cfg.emotion.decay_rate);
    cfg.emotion.persistence_floor = e.value("persistence_floor", cfg.emotion.persistence_floor);

    const auto& c = sectionOf(j, "consciousness");
    cfg.consciousness.growth_rate = c.value("growth_rate", cfg.consciousness.growth_rate);
    cfg.consciousness.novelty_bonus = c.value("novelty_bonus", cfg.consciousness.novelty_bonus);
    cfg.consciousness.familiar_bonus = c.value("familiar_bonus", cfg.consciousness.familiar_bonus);
    cfg.consciousness.initial_level = c.value("initial_level", cfg.consciousness.initial_level);
    cfg.consciousness.bloom_threshold = c.value("silent_bloom_threshold", cfg.consciousness.bloom_threshold);
    cfg.consciousness.bloom_min_thoughts = readCount(c, "bloom_min_thoughts", cfg.consciousness.bloom_min_thoughts);
    cfg.consciousness.bloom_window = readCount(c, "bloom_window", cfg.consciousness.bloom_window);
    cfg.consciousness.bloom_min_existential =
        readCount(c, "bloom_min_existential", cfg.consciousness.bloom_min_existential);
    cfg.consciousness.empathy_maturity_floor =
        c.value("empathy_maturity_floor", cfg.consciousness.empathy_maturity_floor);
    cfg.consciousness.harmony_maturity_floor =
        c.value("harmony_maturity_floor", cfg.consciousness.harmony_maturity_floor);
    cfg.consciousness.empathy_bloom_floor = c.value("empathy_bloom_floor", cfg.consciousness.empathy_bloom_floor);
    cfg.consciousness.harmony_bloom_floor = c.value("harmony_bloom_floor", cfg.consciousness.harmony_bloom_floor);
    cfg.consciousness.empathy_delta = c.value("empathy_delta", cfg.consciousness.empathy_delta);
    cfg.consciousness.harmony_delta = c.value("harmony_delta", cfg.consciousness.harmony_delta);
    cfg.consciousness.self_preservation_delta =
        c.value("self_preservation_delta", cfg.consciousness.self_preservation_delta);

    const auto& p = sectionOf(j, "personality");
    cfg.personality.mutation_probability = p.value("mutation_rate", cfg.personality.mutation_probability);
    cfg.personality.mutation_amplitude = p.value("mutation_amplitude", cfg.personality.mutation_amplitude);
    cfg.personality.dominant_threshold = p.value("dominant_threshold", cfg.personality.dominant_threshold);
    cfg.personality.ethical_ratio_threshold =
        p.value("ethical_ratio_threshold", cfg.personality.ethical_ratio_threshold);
    cfg.personality.consciousness_factor = p.value("consciousness_factor", cfg.personality.consciousness_factor);

    const auto& env = sectionOf(j, "environment");
    cfg.environment.novelty_threshold = env.value("novelty_threshold", cfg.environment.novelty_threshold);
    cfg.environment.significance_noise = env.value("significance_noise", cfg.environment.significance_noise);
    cfg.environment.min_significance = env.value("min_significance", cfg.environment.min_significance);
    cfg.environment.recent_window = readCount(env, "recent_window", cfg.environment.recent_window);
    cfg.environment.recent_penalty = env.value("recent_penalty", cfg.environment.recent_penalty);
    cfg.environment.growth_bonus = env.value("growth_bonus", cfg.environment.growth_bonus);

    const auto& f = sectionOf(j, "features");
    cfg.features.inner_dialogue = f.value("inner_dialogue", cfg.features.inner_dialogue);
    cfg.features.ethical_learning = f.value("ethical_learning", cfg.features.ethical_learning);

    const auto& r = sectionOf(j, "rebirth");
    cfg.rebirth_threshold = r.value("threshold", cfg.rebirth_threshold);

    const auto& s = sectionOf(j, "simulation");
    if (s.contains("seed")) {
        cfg.seed = toSeed(s.at("seed").get<long long>());
    }
    if (s.contains("difficulty")) {
        cfg.adjustDifficulty(s.at("difficulty").get<double>());
    }

    cfg.validate();
    return cfg;
}

uint32_t SoulConfig::toSeed(long long value) {
    requireAtLeast("seed", value, 0);
    requireAtMost("seed", value, static_cast<long long>(UINT32_MAX));
    return static_cast<uint32_t>(value);
}

SoulConfig SoulConfig::loadFromFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        std::cout << "[SoulConfig] Fichier " << path
                  << " non trouvé, utilisation des valeurs par défaut\n";
        SoulConfig cfg;
        cfg.validate();
        return cfg;
    }

    json j;
    try {
        file >> j;
    } catch (const json::parse_error& e) {
        throw std::invalid_argument("Configuration JSON invalide (" + path + "): " + e.what());
    }

    try {
        return fromJson(j);
    } catch (const json::exception& e) {
        throw std::invalid_argument("Configuration JSON mal typée (" + path + "): " + e.what());
    }
}

json SoulConfig::toJson() const {
    json j;
    j["life_cycles"] = {
        {"max", life_cycles.max_life_cycles},
        {"min_duration", life_cycles.min_cycle_duration},
        {"max_duration", life_cycles.max_cycle_duration}
    };
    j["memory"] = {
        {"storage_threshold", memory.storage_threshold},
        {"prune_threshold", memory.prune_threshold},
        {"inheritance_fraction", memory.inheritance_fraction},
        {"inheritance_strength", memory.inheritance_strength},
        {"recall_threshold", memory.recall_threshold},
        {"significant_limit", memory.significant_limit},
        {"storage_path", memory.storage_path}
    };
    j["emotion"] = {
        {"decay_rate", emotion.decay_rate},
        {"persistence_floor", emotion.persistence_floor}
    };
    j["consciousness"] = {
        {"growth_rate", consciousness.growth_rate},
        {"novelty_bonus", consciousness.novelty_bonus},
        {"familiar_bonus", consciousness.familiar_bonus},
        {"initial_level", consciousness.initial_level},
        {"silent_bloom_threshold", consciousness.bloom_threshold},
        {"bloom_min_thoughts", consciousness.bloom_min_thoughts},
        {"bloom_window", consciousness.bloom_window},
        {"bloom_min_existential", consciousness.bloom_min_existential},
        {"empathy_maturity_floor", consciousness.empathy_maturity_floor},
        {"harmony_maturity_floor", consciousness.harmony_maturity_floor},
        {"empathy_bloom_floor", consciousness.empathy_bloom_floor},
        {"harmony_bloom_floor", consciousness.harmony_bloom_floor},
        {"empathy_delta", consciousness.empathy_delta},
        {"harmony_delta", consciousness.harmony_delta},
        {"self_preservation_delta", consciousness.self_preservation_delta}
    };
    j["personality"] = {
        {"mutation_rate", personality.mutation_probability},
        {"mutation_amplitude", personality.mutation_amplitude},
        {"dominant_threshold", personality.dominant_threshold},
        {"ethical_ratio_threshold", personality.ethical_ratio_threshold},
        {"consciousness_factor", personality.consciousness_factor}
    };
    j["environment"] = {
        {"novelty_threshold", environment.novelty_threshold},
        {"significance_noise", environment.significance_noise},
        {"min_significance", environment.min_significance},
        {"recent_window", environment.recent_window},
        {"recent_penalty", environment.recent_penalty},
        {"growth_bonus", environment.growth_bonus}
    };
    j["features"] = {
        {"inner_dialogue", features.inner_dialogue},
        {"ethical_learning", features.ethical_learning}
    };
    j["rebirth"] = {{"threshold", rebirth_threshold}};
    j["simulation"] = {{"seed", seed}};
    return j;
}

} // namespace soul
