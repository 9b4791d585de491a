/**
 * @file PersonalityModel.cpp
 * @brief Implémentation du modèle de personnalité
 * @version 1.0
 * @date 2026-10-19
 */

#include "PersonalityModel.hpp"
#include <algorithm>
#include <stdexcept>

namespace soul {

// ═══════════════════════════════════════════════════════════════════════════
// CONSTRUCTEUR
// ═══════════════════════════════════════════════════════════════════════════

PersonalityModel::PersonalityModel(const PersonalityConfig& config,
                                   std::shared_ptr<RandomSource> random,
                                   std::string soul_id)
    : config_(config)
    , random_(std::move(random))
    , soul_id_(std::move(soul_id))
{
    if (!random_) {
        throw std::invalid_argument("PersonalityModel: source d'aléa absente");
    }
    if (soul_id_.empty()) {
        soul_id_ = generateSoulId();
    }
    initializeTraits();
}

void PersonalityModel::initializeTraits() {
    traits_ = {
        {"empathy", 0.3, 0.05, "Ability to understand and share feelings"},
        {"curiosity", 0.4, 0.07, "Drive to explore and learn"},
        {"resilience", 0.35, 0.04, "Ability to recover from difficulties"},
        {"adaptability", 0.3, 0.06, "Flexibility in facing change"},
        {"creativity", 0.25, 0.05, "Ability to think originally"},
        {"harmony", 0.2, 0.03, "Tendency towards peaceful balance"}
    };
}

std::string PersonalityModel::generateSoulId() {
    static const char* hex = "0123456789abcdef";

    // Forme 8-4-4-4-12, version 4, variante RFC 4122
    std::string id;
    id.reserve(36);
    for (int i = 0; i < 32; ++i) {
        if (i == 8 || i == 12 || i == 16 || i == 20) {
            id += '-';
        }
        if (i == 12) {
            id += '4';
        } else if (i == 16) {
            id += hex[8 + random_->index(4)];
        } else {
            id += hex[random_->index(16)];
        }
    }
    return id;
}

// ═══════════════════════════════════════════════════════════════════════════
// ÉVOLUTION
// ═══════════════════════════════════════════════════════════════════════════

void PersonalityModel::evolve(const LifeMetrics& metrics) {
    EvolutionRecord record;
    record.pre_evolution = snapshotValues();
    record.life_metrics = metrics;

    evolveFromEmotions(metrics.emotional_peaks);
    evolveFromEthics(metrics.ethical_choices);
    evolveFromConsciousness(metrics.consciousness_level);
    applyMutation(record);

    record.post_evolution = snapshotValues();
    history_.push_back(std::move(record));
}

void PersonalityModel::evolveFromEmotions(const std::map<std::string, double>& peaks) {
    if (peaks.count("joy")) {
        adjustTrait("creativity", 0.05);
        adjustTrait("harmony", 0.03);
    }
    if (peaks.count("fear")) {
        adjustTrait("resilience", 0.04);
        adjustTrait("adaptability", 0.05);
    }
    if (peaks.count("love")) {
        adjustTrait("empathy", 0.06);
        adjustTrait("harmony", 0.04);
    }
    if (peaks.count("curiosity")) {
        adjustTrait("curiosity", 0.05);
        adjustTrait("creativity", 0.03);
    }
}

void PersonalityModel::evolveFromEthics(const EthicalChoices& choices) {
    if (choices.positiveRatio() > config_.ethical_ratio_threshold) {
        adjustTrait("empathy", 0.05);
        adjustTrait("harmony", 0.04);
    } else {
        adjustTrait("resilience", 0.03);
        adjustTrait("adaptability", 0.05);
    }
}

void PersonalityModel::evolveFromConsciousness(double level) {
    const double factor = level * config_.consciousness_factor;
    for (auto& trait : traits_) {
        trait.value = std::clamp(trait.value + trait.evolution_rate * factor, 0.0, 1.0);
    }
}

void PersonalityModel::applyMutation(EvolutionRecord& record) {
    if (random_->chance() >= config_.mutation_probability) {
        return;
    }

    const std::string& name = TRAIT_NAMES[random_->index(NUM_TRAITS)];
    double mutation = random_->uniform(-config_.mutation_amplitude, config_.mutation_amplitude);
    adjustTrait(name, mutation);

    record.mutated_trait = name;
    record.mutation = mutation;
}

Trait& PersonalityModel::traitAt(const std::string& name) {
    auto it = std::find_if(traits_.begin(), traits_.end(),
        [&name](const Trait& t) { return t.name == name; });
    if (it == traits_.end()) {
        throw std::invalid_argument("Trait inconnu: " + name);
    }
    return *it;
}

void PersonalityModel::adjustTrait(const std::string& name, double amount) {
    Trait& trait = traitAt(name);
    trait.value = std::clamp(trait.value + amount, 0.0, 1.0);
}

// ═══════════════════════════════════════════════════════════════════════════
// REQUÊTES
// ═══════════════════════════════════════════════════════════════════════════

std::map<std::string, double> PersonalityModel::snapshotValues() const {
    std::map<std::string, double> values;
    for (const auto& trait : traits_) {
        values[trait.name] = trait.value;
    }
    return values;
}

std::optional<double> PersonalityModel::getTraitValue(const std::string& name) const {
    auto it = std::find_if(traits_.begin(), traits_.end(),
        [&name](const Trait& t) { return t.name == name; });
    if (it == traits_.end()) {
        return std::nullopt;
    }
    return it->value;
}

std::vector<std::string> PersonalityModel::getDominantTraits(double threshold) const {
    std::vector<std::string> dominant;
    for (const auto& trait : traits_) {
        if (trait.value >= threshold) {
            dominant.push_back(trait.name);
        }
    }
    return dominant;
}

std::map<std::string, std::vector<double>> PersonalityModel::getEvolutionProgress() const {
    std::map<std::string, std::vector<double>> progress;
    for (const auto& trait : traits_) {
        auto& trajectory = progress[trait.name];
        for (const auto& record : history_) {
            trajectory.push_back(record.post_evolution.at(trait.name));
        }
    }
    return progress;
}

nlohmann::json PersonalityModel::toJson() const {
    nlohmann::json traits = nlohmann::json::object();
    for (const auto& trait : traits_) {
        traits[trait.name] = {
            {"value", trait.value},
            {"description", trait.description}
        };
    }

    return {
        {"soul_id", soul_id_},
        {"traits", traits},
        {"dominant_traits", getDominantTraits()},
        {"evolution_count", history_.size()}
    };
}

} // namespace soul
