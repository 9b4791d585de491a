/**
 * @file Types.hpp
 * @brief Types et structures de données partagés par SoulGenesis
 * @version 1.0
 * @date 2026-10-19
 */

#ifndef SOUL_TYPES_HPP
#define SOUL_TYPES_HPP

#include <array>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <map>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace soul {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

// Constantes du système
constexpr size_t NUM_GENERATED_KINDS = 6;

/**
 * @brief Catégories d'événements de vie
 *
 * Les six premières sont produites par l'EventSource, les trois dernières
 * ne sont connues que de la table émotionnelle (événements injectés).
 */
enum class EventKind {
    CHALLENGE,
    DISCOVERY,
    CONNECTION,
    LOSS,
    GROWTH,
    REFLECTION,
    ACHIEVEMENT,
    THREAT,
    INJUSTICE
};

/**
 * @brief Catégories produites par le générateur d'événements
 */
inline const std::array<EventKind, NUM_GENERATED_KINDS> GENERATED_KINDS = {
    EventKind::CHALLENGE, EventKind::DISCOVERY, EventKind::CONNECTION,
    EventKind::LOSS, EventKind::GROWTH, EventKind::REFLECTION
};

/**
 * @brief Convertit une catégorie en chaîne
 */
inline std::string eventKindToString(EventKind kind) {
    switch (kind) {
        case EventKind::CHALLENGE:   return "challenge";
        case EventKind::DISCOVERY:   return "discovery";
        case EventKind::CONNECTION:  return "connection";
        case EventKind::LOSS:        return "loss";
        case EventKind::GROWTH:      return "growth";
        case EventKind::REFLECTION:  return "reflection";
        case EventKind::ACHIEVEMENT: return "achievement";
        case EventKind::THREAT:      return "threat";
        case EventKind::INJUSTICE:   return "injustice";
        default:                     return "unknown";
    }
}

/**
 * @brief Catégories favorisant la croissance (poids ×1.2 à la sélection)
 */
inline bool isGrowthEnabling(EventKind kind) {
    return kind == EventKind::CHALLENGE ||
           kind == EventKind::DISCOVERY ||
           kind == EventKind::REFLECTION;
}

/**
 * @brief Événement de vie simulé (immuable une fois créé)
 */
struct Event {
    EventKind kind = EventKind::REFLECTION;
    std::string description;
    double significance = 0.0;               // [0.0, 1.0]
    std::vector<std::string> emotional_tags; // Émotions associées à la catégorie
    bool is_novel = false;
    double ethical_impact = 0.0;             // [-1.0, 1.0]
    TimePoint timestamp = Clock::now();
};

/**
 * @brief Instantané plat d'un EmotionRecord, tel que conservé dans un souvenir
 */
struct EmotionTags {
    std::string type;
    double intensity = 0.0;
    std::string trigger;
    std::string timestamp;
    double decay_rate = 0.1;

    /**
     * @brief Vrai si l'instantané porte l'émotion demandée avec une intensité suffisante
     */
    [[nodiscard]] bool matches(const std::string& emotion, double threshold) const {
        return type == emotion && intensity >= threshold;
    }

    bool operator==(const EmotionTags& other) const {
        return type == other.type && intensity == other.intensity &&
               trigger == other.trigger && timestamp == other.timestamp &&
               decay_rate == other.decay_rate;
    }
    bool operator!=(const EmotionTags& other) const { return !(*this == other); }
};

/**
 * @brief Souvenir persisté
 */
struct Memory {
    std::string content;
    EmotionTags emotional_tags;
    double significance = 0.0;
    std::string timestamp;
    int recall_count = 0;
};

/**
 * @brief Choix éthiques comptabilisés sur une vie
 */
struct EthicalChoices {
    int positive = 0;
    int negative = 0;

    /**
     * @brief Ratio positif, dénominateur ramené à 1 si aucun choix
     */
    [[nodiscard]] double positiveRatio() const {
        int total = positive + negative;
        return static_cast<double>(positive) / (total == 0 ? 1 : total);
    }
};

/**
 * @brief Accumulateur de métriques pour un cycle de vie
 */
struct LifeMetrics {
    std::map<std::string, double> emotional_peaks;  // émotion -> intensité max
    double consciousness_level = 0.0;                // dernière valeur observée
    int significant_experiences = 0;
    double life_duration = 0.0;                      // en ticks
    EthicalChoices ethical_choices;
};

// ═══════════════════════════════════════════════════════════════════════════
// HORODATAGE
// ═══════════════════════════════════════════════════════════════════════════

/**
 * @brief Format ISO-8601 local avec microsecondes (ex: 2026-10-19T08:15:02.123456)
 */
inline std::string toIsoString(TimePoint tp) {
    auto secs = std::chrono::time_point_cast<std::chrono::seconds>(tp);
    auto micros = std::chrono::duration_cast<std::chrono::microseconds>(tp - secs).count();
    if (micros < 0) {
        micros += 1000000;
        secs -= std::chrono::seconds(1);
    }

    std::time_t t = Clock::to_time_t(secs);
    std::tm tm_buf{};
    localtime_r(&t, &tm_buf);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setw(6) << std::setfill('0') << micros;
    return oss.str();
}

} // namespace soul

#endif // SOUL_TYPES_HPP
