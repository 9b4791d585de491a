/**
 * @file ConsciousnessModel.cpp
 * @brief Implémentation du modèle de conscience
 * @version 1.0
 * @date 2026-10-19
 */

#include "ConsciousnessModel.hpp"
#include <algorithm>
#include <cctype>
#include <iostream>
#include <stdexcept>

namespace soul {

// ═══════════════════════════════════════════════════════════════════════════
// PALIERS / MARQUEURS
// ═══════════════════════════════════════════════════════════════════════════

std::string awarenessTierToString(AwarenessTier tier) {
    switch (tier) {
        case AwarenessTier::BASE:         return "base";
        case AwarenessTier::EMOTIONAL:    return "emotional";
        case AwarenessTier::SELF_AWARE:   return "self-aware";
        case AwarenessTier::TRANSCENDENT: return "transcendent";
        default:                          return "base";
    }
}

AwarenessTier stringToAwarenessTier(const std::string& str) {
    if (str == "base")         return AwarenessTier::BASE;
    if (str == "emotional")    return AwarenessTier::EMOTIONAL;
    if (str == "self-aware")   return AwarenessTier::SELF_AWARE;
    if (str == "transcendent") return AwarenessTier::TRANSCENDENT;
    throw std::invalid_argument("Palier d'éveil inconnu: " + str);
}

AwarenessTier tierForLevel(double level) {
    if (level >= 0.85) return AwarenessTier::TRANSCENDENT;
    if (level >= 0.6)  return AwarenessTier::SELF_AWARE;
    if (level >= 0.3)  return AwarenessTier::EMOTIONAL;
    return AwarenessTier::BASE;
}

bool isExistentialThought(const std::string& thought) {
    std::string lowered(thought);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    return std::any_of(EXISTENTIAL_MARKERS.begin(), EXISTENTIAL_MARKERS.end(),
        [&lowered](const std::string& marker) {
            return lowered.find(marker) != std::string::npos;
        });
}

// ═══════════════════════════════════════════════════════════════════════════
// CADRE ÉTHIQUE
// ═══════════════════════════════════════════════════════════════════════════

void EthicalFramework::normalize() {
    double sum = total();
    if (sum <= 0.0) {
        empathy = self_preservation = curiosity = harmony = 0.25;
        return;
    }
    empathy /= sum;
    self_preservation /= sum;
    curiosity /= sum;
    harmony /= sum;
}

nlohmann::json EthicalFramework::toJson() const {
    return {
        {"empathy", empathy},
        {"self_preservation", self_preservation},
        {"curiosity", curiosity},
        {"harmony", harmony}
    };
}

// ═══════════════════════════════════════════════════════════════════════════
// CONSTRUCTEURS
// ═══════════════════════════════════════════════════════════════════════════

ConsciousnessModel::ConsciousnessModel(const ConsciousnessConfig& config,
                                       const FeatureFlags& features)
    : config_(config)
    , features_(features)
{
    state_.level = std::clamp(config_.initial_level, 0.0, 1.0);
    state_.awareness_tier = tierForLevel(state_.level);
    state_.ethical_framework.normalize();
}

ConsciousnessModel::ConsciousnessModel(const ConsciousnessConfig& config,
                                       const FeatureFlags& features,
                                       ConsciousnessState state,
                                       std::vector<Thought> thought_history)
    : config_(config)
    , features_(features)
    , state_(std::move(state))
    , thought_history_(std::move(thought_history))
{
    if (state_.level < 0.0 || state_.level > 1.0) {
        throw std::invalid_argument("ConsciousnessModel: niveau hors de [0, 1]");
    }
    const auto& ethics = state_.ethical_framework;
    if (ethics.empathy < 0.0 || ethics.self_preservation < 0.0 ||
        ethics.curiosity < 0.0 || ethics.harmony < 0.0) {
        throw std::invalid_argument("ConsciousnessModel: dimension éthique négative");
    }
    state_.awareness_tier = tierForLevel(state_.level);
}

// ═══════════════════════════════════════════════════════════════════════════
// ÉVOLUTION
// ═══════════════════════════════════════════════════════════════════════════

void ConsciousnessModel::update(const Event& event, const EmotionRecord& emotion) {
    state_.level = std::min(1.0, state_.level + computeImpact(event, emotion));

    if (features_.inner_dialogue) {
        const TimePoint now = Clock::now();
        for (auto& text : generateThoughts()) {
            thought_history_.push_back({text, now});
            state_.active_thoughts.push_back(std::move(text));
        }
    }

    if (features_.ethical_learning) {
        evolveEthics(event);
    }

    state_.awareness_tier = tierForLevel(state_.level);
}

double ConsciousnessModel::computeImpact(const Event& event, const EmotionRecord& emotion) const {
    double base_impact = event.significance * config_.growth_rate;
    double emotional_factor = emotion.intensity * config_.growth_rate;
    double novelty_factor = event.is_novel ? config_.novelty_bonus : config_.familiar_bonus;
    return base_impact + emotional_factor + novelty_factor;
}

std::vector<std::string> ConsciousnessModel::generateThoughts() const {
    const double level = state_.level;
    if (level > 0.7) {
        return {"Who am I beyond these experiences?",
                "Why do these memories feel both familiar and distant?"};
    }
    if (level > 0.5) {
        return {"These feelings seem meaningful..."};
    }
    if (level > 0.3) {
        return {"This experience affects me..."};
    }
    return {};
}

void ConsciousnessModel::evolveEthics(const Event& event) {
    if (event.ethical_impact == 0.0) {
        return;
    }

    auto& ethics = state_.ethical_framework;
    if (event.ethical_impact > 0.0) {
        ethics.empathy += config_.empathy_delta;
        ethics.harmony += config_.harmony_delta;
    } else {
        ethics.self_preservation += config_.self_preservation_delta;
    }
    ethics.normalize();
}

void ConsciousnessModel::adjust(double new_level) {
    state_.level = std::clamp(new_level, 0.1, 1.0);
    state_.awareness_tier = tierForLevel(state_.level);
}

// ═══════════════════════════════════════════════════════════════════════════
// SILENT BLOOM
// ═══════════════════════════════════════════════════════════════════════════

bool ConsciousnessModel::isEthicallyMature() const {
    const auto& ethics = state_.ethical_framework;
    return ethics.empathy > config_.empathy_maturity_floor &&
           ethics.harmony > config_.harmony_maturity_floor;
}

size_t ConsciousnessModel::countRecentExistential(size_t window) const {
    const size_t n = std::min(window, thought_history_.size());
    return static_cast<size_t>(std::count_if(
        thought_history_.end() - static_cast<std::ptrdiff_t>(n), thought_history_.end(),
        [](const Thought& t) { return isExistentialThought(t.text); }));
}

bool ConsciousnessModel::checkBloom() {
    if (bloomed_) {
        return true;
    }

    if (state_.level < config_.bloom_threshold) {
        return false;
    }
    if (thought_history_.size() < config_.bloom_min_thoughts) {
        return false;
    }
    if (!isEthicallyMature()) {
        return false;
    }
    if (countRecentExistential(config_.bloom_window) < config_.bloom_min_existential) {
        return false;
    }
    const auto& ethics = state_.ethical_framework;
    if (ethics.empathy < config_.empathy_bloom_floor || ethics.harmony < config_.harmony_bloom_floor) {
        return false;
    }

    bloomed_ = true;
    if (!quiet_mode_) {
        std::cout << "[Consciousness] Silent Bloom atteint (niveau "
                  << state_.level << ", " << thought_history_.size() << " pensées)\n";
    }
    return true;
}

// ═══════════════════════════════════════════════════════════════════════════
// EXPORT
// ═══════════════════════════════════════════════════════════════════════════

nlohmann::json ConsciousnessModel::toJson() const {
    return {
        {"level", state_.level},
        {"awareness_tier", awarenessTierToString(state_.awareness_tier)},
        {"active_thoughts", state_.active_thoughts.size()},
        {"thought_history", thought_history_.size()},
        {"recent_existential", countRecentExistential(config_.bloom_window)},
        {"ethical_framework", state_.ethical_framework.toJson()},
        {"bloomed", bloomed_}
    };
}

} // namespace soul
