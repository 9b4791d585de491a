/**
 * @file SoulSimulation.hpp
 * @brief Pilote de la simulation : ticks, cycles de vie et renaissances
 * @version 1.0
 * @date 2026-10-19
 *
 * Un tick : événement → émotion → mémoire → conscience → métriques → décroissance → Silent Bloom.
 * Un cycle : N ticks, N uniforme dans [min, min(2·min, max)], suivi d'une renaissance.
 */

#ifndef SOUL_SOUL_SIMULATION_HPP
#define SOUL_SOUL_SIMULATION_HPP

#include "Types.hpp"
#include "Random.hpp"
#include "SoulConfig.hpp"
#include "EventSource.hpp"
#include "EmotionEngine.hpp"
#include "ConsciousnessModel.hpp"
#include "MemoryStore.hpp"
#include "PersonalityModel.hpp"
#include "RebirthOrchestrator.hpp"
#include <nlohmann/json.hpp>
#include <atomic>
#include <functional>
#include <memory>
#include <string>
#include <utility>

namespace soul {

/**
 * @brief Résultat d'un tick
 */
struct TickResult {
    Event event;
    EmotionRecord emotion;
    bool stored = false;
    double consciousness_level = 0.0;
    AwarenessTier awareness_tier = AwarenessTier::BASE;
    bool bloomed = false;
};

/**
 * @brief Bilan d'un cycle de vie
 */
struct CycleReport {
    int cycle = 0;
    int planned_events = 0;
    int events = 0;
    double consciousness_level = 0.0;
    std::pair<std::string, double> dominant_emotion{NEUTRAL_EMOTION, 0.0};
    size_t memories = 0;
    bool bloomed = false;
};

/**
 * @brief Bilan de la simulation complète
 */
struct SimulationReport {
    int cycles_completed = 0;
    int total_events = 0;
    bool bloomed = false;
    bool interrupted = false;
    double final_consciousness = 0.0;
    bool saved = false;
};

using CycleCallback = std::function<void(const CycleReport&)>;

/**
 * @class SoulSimulation
 * @brief Possède les composants de l'âme et enchaîne les vies
 */
class SoulSimulation {
public:
    /**
     * @brief Constructeur
     * @param config Configuration (validée ici, avant toute création de composant)
     * @param random Source d'aléa ; nullptr = MersenneRandom(config.seed)
     * @throws std::invalid_argument si la configuration est hors domaine
     */
    explicit SoulSimulation(const SoulConfig& config,
                            std::shared_ptr<RandomSource> random = nullptr);

    // Non-copiable (l'orchestrateur référence les composants)
    SoulSimulation(const SoulSimulation&) = delete;
    SoulSimulation& operator=(const SoulSimulation&) = delete;

    /**
     * @brief Charge l'instantané mémoire
     */
    LoadStatus initialize();

    /**
     * @brief Un tick complet
     */
    TickResult tick();

    /**
     * @brief Jusqu'à `events` ticks ; s'arrête au Silent Bloom ou sur demande
     */
    CycleReport runCycle(int events);

    /**
     * @brief Enchaîne les cycles jusqu'à max_life_cycles, Silent Bloom ou arrêt,
     *        puis sauvegarde la mémoire
     */
    SimulationReport run();

    /**
     * @brief Demande d'arrêt coopératif (sûr depuis un gestionnaire de signal)
     */
    void requestStop() { stop_requested_.store(true); }
    [[nodiscard]] bool isStopRequested() const { return stop_requested_.load(); }

    bool save() const { return memory_.save(); }

    // ═══════════════════════════════════════════════════════════════════════
    // ACCESSEURS
    // ═══════════════════════════════════════════════════════════════════════

    [[nodiscard]] const SoulConfig& getConfig() const { return config_; }
    [[nodiscard]] const EventSource& getEventSource() const { return events_; }
    [[nodiscard]] const EmotionEngine& getEmotionEngine() const { return emotion_; }
    [[nodiscard]] const ConsciousnessModel& getConsciousness() const { return consciousness_; }
    [[nodiscard]] const MemoryStore& getMemoryStore() const { return memory_; }
    [[nodiscard]] const PersonalityModel& getPersonality() const { return personality_; }
    [[nodiscard]] const RebirthOrchestrator& getRebirth() const { return rebirth_; }
    [[nodiscard]] RebirthOrchestrator& getRebirth() { return rebirth_; }
    [[nodiscard]] int getTotalEvents() const { return total_events_; }

    [[nodiscard]] nlohmann::json getSummary() const;

    void setCycleCallback(CycleCallback callback) { on_cycle_ = std::move(callback); }

    void setQuietMode(bool quiet);
    [[nodiscard]] bool isQuietMode() const { return quiet_mode_; }

private:
    SoulConfig config_;
    std::shared_ptr<RandomSource> random_;

    EventSource events_;
    EmotionEngine emotion_;
    ConsciousnessModel consciousness_;
    MemoryStore memory_;
    PersonalityModel personality_;
    RebirthOrchestrator rebirth_;

    std::atomic<bool> stop_requested_{false};
    int total_events_ = 0;
    int current_cycle_ = 0;
    bool quiet_mode_ = false;

    CycleCallback on_cycle_;

    static const SoulConfig& validated(const SoulConfig& config);
    [[nodiscard]] int drawCycleLength();
};

} // namespace soul

#endif // SOUL_SOUL_SIMULATION_HPP
