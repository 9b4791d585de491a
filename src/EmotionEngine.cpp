/**
 * @file EmotionEngine.cpp
 * @brief Implémentation du moteur émotionnel
 * @version 1.0
 * @date 2026-10-19
 */

#include "EmotionEngine.hpp"
#include <algorithm>

namespace soul {

EmotionEngine::EmotionEngine(const EmotionConfig& config)
    : config_(config)
{
}

EmotionRecord EmotionEngine::process(const Event& event) {
    EmotionRecord record;
    record.type = emotionForKind(event.kind);
    record.intensity = computeIntensity(event);
    record.trigger = event.kind;
    record.decay_rate = config_.decay_rate;
    record.timestamp = Clock::now();

    auto it = std::find_if(current_.begin(), current_.end(),
        [&record](const EmotionRecord& r) { return r.type == record.type; });
    if (it != current_.end()) {
        *it = record;
    } else {
        current_.push_back(record);
    }
    history_.push_back(record);

    return record;
}

double EmotionEngine::computeIntensity(const Event& event) const {
    // L'état émotionnel antérieur n'intervient pas encore
    return std::clamp(event.significance, 0.0, 1.0);
}

void EmotionEngine::decay() {
    for (auto& record : current_) {
        record.intensity *= (1.0 - record.decay_rate);
    }

    current_.erase(
        std::remove_if(current_.begin(), current_.end(),
            [this](const EmotionRecord& r) { return r.intensity <= config_.persistence_floor; }),
        current_.end());
}

std::pair<std::string, double> EmotionEngine::getDominant() const {
    if (current_.empty()) {
        return {NEUTRAL_EMOTION, 0.0};
    }

    const EmotionRecord* dominant = &current_.front();
    for (const auto& record : current_) {
        if (record.intensity > dominant->intensity) {
            dominant = &record;
        }
    }
    return {dominant->type, dominant->intensity};
}

std::map<std::string, double> EmotionEngine::getEmotionalState() const {
    std::map<std::string, double> state;
    for (const auto& record : current_) {
        state[record.type] = record.intensity;
    }
    return state;
}

std::optional<EmotionRecord> EmotionEngine::getCurrent(const std::string& name) const {
    auto it = std::find_if(current_.begin(), current_.end(),
        [&name](const EmotionRecord& r) { return r.type == name; });
    if (it == current_.end()) {
        return std::nullopt;
    }
    return *it;
}

} // namespace soul
