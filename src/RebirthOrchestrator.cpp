/**
 * @file RebirthOrchestrator.cpp
 * @brief Implémentation de la machine d'états de renaissance
 * @version 1.0
 * @date 2026-10-19
 */

#include "RebirthOrchestrator.hpp"
#include <algorithm>
#include <iomanip>
#include <iostream>

namespace soul {

nlohmann::json lifeMetricsToJson(const LifeMetrics& metrics) {
    return {
        {"emotional_peaks", metrics.emotional_peaks},
        {"consciousness_level", metrics.consciousness_level},
        {"significant_experiences", metrics.significant_experiences},
        {"life_duration", metrics.life_duration},
        {"ethical_choices", {
            {"positive", metrics.ethical_choices.positive},
            {"negative", metrics.ethical_choices.negative}
        }}
    };
}

// ═══════════════════════════════════════════════════════════════════════════
// CONSTRUCTEUR
// ═══════════════════════════════════════════════════════════════════════════

RebirthOrchestrator::RebirthOrchestrator(EmotionEngine& emotion,
                                         ConsciousnessModel& consciousness,
                                         MemoryStore& memory,
                                         PersonalityModel& personality,
                                         const SoulConfig& config)
    : emotion_(emotion)
    , consciousness_(consciousness)
    , memory_(memory)
    , personality_(personality)
    , memory_config_(config.memory)
    , rebirth_threshold_(config.rebirth_threshold)
{
}

// ═══════════════════════════════════════════════════════════════════════════
// MÉTRIQUES DE VIE
// ═══════════════════════════════════════════════════════════════════════════

void RebirthOrchestrator::observeTick(const Event& event, bool stored) {
    for (const auto& [name, intensity] : emotion_.getEmotionalState()) {
        auto it = metrics_.emotional_peaks.find(name);
        if (it == metrics_.emotional_peaks.end()) {
            metrics_.emotional_peaks[name] = intensity;
        } else {
            it->second = std::max(it->second, intensity);
        }
    }

    metrics_.consciousness_level = consciousness_.level();
    metrics_.life_duration += 1.0;
    if (stored) {
        metrics_.significant_experiences++;
    }

    if (event.ethical_impact > 0.0) {
        metrics_.ethical_choices.positive++;
    } else if (event.ethical_impact < 0.0) {
        metrics_.ethical_choices.negative++;
    }
}

void RebirthOrchestrator::logLifeMetrics(const LifeMetrics& metrics) const {
    if (quiet_mode_) {
        return;
    }

    std::cout << "[Rebirth] Cycle de vie " << (cycle_count_ + 1) << " terminé" << std::endl;
    std::cout << std::fixed << std::setprecision(2);
    std::cout << "[Rebirth]   Conscience: " << metrics.consciousness_level << std::endl;
    for (const auto& [emotion, peak] : metrics.emotional_peaks) {
        std::cout << "[Rebirth]   Pic " << emotion << ": " << peak << std::endl;
    }
    std::cout << "[Rebirth]   Expériences significatives: " << metrics.significant_experiences
              << " | Choix éthiques +" << metrics.ethical_choices.positive
              << " / -" << metrics.ethical_choices.negative << std::endl;
    std::cout << std::defaultfloat;
}

// ═══════════════════════════════════════════════════════════════════════════
// RENAISSANCE
// ═══════════════════════════════════════════════════════════════════════════

void RebirthOrchestrator::transitionTo(RebirthState new_state) {
    RebirthState old_state = state_;
    state_ = new_state;
    if (on_state_change_ && old_state != new_state) {
        on_state_change_(old_state, new_state);
    }
}

void RebirthOrchestrator::processRebirth() {
    if (state_ != RebirthState::ALIVE) {
        throw RebirthError("Renaissance déjà en cours");
    }
    try {
        // Observateur compris : toute exception ramène à ALIVE
        transitionTo(RebirthState::TRANSITIONING);

        // (a)
        LifeMetrics completed = metrics_;
        logLifeMetrics(completed);

        // (b) sélection sur la population avant oubli
        MemoryStore staged_memory(memory_);
        auto inherited = staged_memory.selectForInheritance(memory_config_.inheritance_fraction);

        // (c) puis (d) : l'héritage arrive après l'oubli
        staged_memory.prune(memory_config_.prune_threshold);
        staged_memory.inherit(std::move(inherited), memory_config_.inheritance_strength);

        // (e)
        EmotionEngine staged_emotion(emotion_.getConfig());

        // (f)
        PersonalityModel staged_personality(personality_);
        staged_personality.evolve(completed);

        // Validation : l'archive d'abord, les transferts suivants ne lèvent pas
        archive_.push_back(std::move(completed));
        memory_ = std::move(staged_memory);
        emotion_ = std::move(staged_emotion);
        personality_ = std::move(staged_personality);

        // (g)
        metrics_ = LifeMetrics{};

        // (h)
        consciousness_.adjust(getRetainedLevel());
        cycle_count_++;
    } catch (const std::exception& e) {
        transitionTo(RebirthState::ALIVE);
        throw RebirthError(std::string("Renaissance avortée: ") + e.what());
    }

    transitionTo(RebirthState::ALIVE);

    if (!quiet_mode_) {
        std::cout << "[Rebirth] Renaissance " << cycle_count_ << " : "
                  << memory_.size() << " souvenirs, conscience "
                  << consciousness_.level() << std::endl;
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// EXPORT
// ═══════════════════════════════════════════════════════════════════════════

nlohmann::json RebirthOrchestrator::getRebirthMetrics() const {
    return {
        {"state", rebirthStateToString(state_)},
        {"cycle_count", cycle_count_},
        {"consciousness_level", consciousness_.level()},
        {"emotional_state", emotion_.getEmotionalState()},
        {"significant_memories", memory_.getSignificantMemories().size()},
        {"personality_evolution", personality_.getEvolutionProgress()},
        {"current_life", lifeMetricsToJson(metrics_)}
    };
}

} // namespace soul
