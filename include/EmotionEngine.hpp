/**
 * @file EmotionEngine.hpp
 * @brief Génération, décroissance et état des émotions de l'âme
 * @version 1.0
 * @date 2026-10-19
 *
 * Intensité = min(1.0, significance de l'événement).
 * Décroissance par tick : I(t+1) = I(t) × (1 - decay_rate), l'émotion quitte
 * l'état courant dès que I(t+1) <= plancher de persistance (0.1).
 */

#ifndef SOUL_EMOTION_ENGINE_HPP
#define SOUL_EMOTION_ENGINE_HPP

#include "Types.hpp"
#include "SoulConfig.hpp"
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace soul {

/// Sentinelle retournée par getDominant() quand aucune émotion n'est active
inline const std::string NEUTRAL_EMOTION = "neutral";

/**
 * @brief Table catégorie -> émotion (fonction totale, repli "wonder")
 */
inline std::string emotionForKind(EventKind kind) {
    switch (kind) {
        case EventKind::ACHIEVEMENT: return "joy";
        case EventKind::THREAT:      return "fear";
        case EventKind::LOSS:        return "sadness";
        case EventKind::INJUSTICE:   return "anger";
        case EventKind::CONNECTION:  return "love";
        case EventKind::DISCOVERY:   return "curiosity";
        default:                     return "wonder";
    }
}

/**
 * @brief Émotion nommée avec intensité et contexte
 */
struct EmotionRecord {
    std::string type;
    double intensity = 0.0;      // [0.0, 1.0]
    EventKind trigger = EventKind::REFLECTION;
    double decay_rate = 0.1;
    TimePoint timestamp = Clock::now();

    /**
     * @brief Instantané plat conservé dans un souvenir
     */
    [[nodiscard]] EmotionTags snapshot() const {
        EmotionTags tags;
        tags.type = type;
        tags.intensity = intensity;
        tags.trigger = eventKindToString(trigger);
        tags.timestamp = toIsoString(timestamp);
        tags.decay_rate = decay_rate;
        return tags;
    }
};

/**
 * @class EmotionEngine
 * @brief Maintient l'état émotionnel courant et l'historique complet
 *
 * Au plus un enregistrement courant par nom d'émotion (le dernier écrase le
 * précédent). L'historique est en ajout seul et n'est jamais modifié par la
 * décroissance.
 */
class EmotionEngine {
public:
    explicit EmotionEngine(const EmotionConfig& config = EmotionConfig{});

    /**
     * @brief Produit la réponse émotionnelle à un événement
     * @param event Événement vécu
     * @return Enregistrement devenu courant pour ce nom d'émotion
     */
    EmotionRecord process(const Event& event);

    /**
     * @brief Une passe complète de décroissance (une fois par tick)
     */
    void decay();

    /**
     * @brief Émotion courante d'intensité maximale
     * @return ("neutral", 0.0) si aucune émotion courante ; à égalité, la
     *         première vue l'emporte
     */
    [[nodiscard]] std::pair<std::string, double> getDominant() const;

    /**
     * @brief Intensités courantes par nom d'émotion
     */
    [[nodiscard]] std::map<std::string, double> getEmotionalState() const;

    [[nodiscard]] std::optional<EmotionRecord> getCurrent(const std::string& name) const;
    [[nodiscard]] const std::vector<EmotionRecord>& getCurrentRecords() const { return current_; }
    [[nodiscard]] const std::vector<EmotionRecord>& getHistory() const { return history_; }
    [[nodiscard]] const EmotionConfig& getConfig() const { return config_; }

private:
    EmotionConfig config_;

    // Ordre d'insertion conservé pour le départage de getDominant()
    std::vector<EmotionRecord> current_;
    std::vector<EmotionRecord> history_;

    [[nodiscard]] double computeIntensity(const Event& event) const;
};

} // namespace soul

#endif // SOUL_EMOTION_ENGINE_HPP
