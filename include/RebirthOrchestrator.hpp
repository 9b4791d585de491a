/**
 * @file RebirthOrchestrator.hpp
 * @brief Machine d'états de la renaissance de l'âme
 * @version 1.0
 * @date 2026-10-19
 *
 * ALIVE : les ticks alimentent les métriques de la vie courante.
 * TRANSITIONING : processRebirth() en cours.
 *
 * Séquence de renaissance :
 *   (a) bilan de la vie      (e) moteur émotionnel neuf
 *   (b) sélection héritage   (f) évolution de la personnalité
 *   (c) oubli (prune)        (g) métriques remises à zéro
 *   (d) héritage appliqué    (h) niveau de conscience = seuil × 0.5
 *
 * Toutes les étapes sont préparées sur des copies puis validées ensemble :
 * un échec laisse chaque composant intact.
 */

#ifndef SOUL_REBIRTH_ORCHESTRATOR_HPP
#define SOUL_REBIRTH_ORCHESTRATOR_HPP

#include "Types.hpp"
#include "SoulConfig.hpp"
#include "EmotionEngine.hpp"
#include "ConsciousnessModel.hpp"
#include "MemoryStore.hpp"
#include "PersonalityModel.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <functional>
#include <stdexcept>
#include <string>
#include <vector>

namespace soul {

/**
 * @brief États de l'orchestrateur
 */
enum class RebirthState : uint8_t {
    ALIVE,
    TRANSITIONING
};

inline std::string rebirthStateToString(RebirthState state) {
    switch (state) {
        case RebirthState::ALIVE:         return "ALIVE";
        case RebirthState::TRANSITIONING: return "TRANSITIONING";
        default:                          return "UNKNOWN";
    }
}

/**
 * @brief Échec d'une renaissance (aucun composant n'a été modifié)
 */
class RebirthError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

using RebirthStateCallback = std::function<void(RebirthState oldState, RebirthState newState)>;

nlohmann::json lifeMetricsToJson(const LifeMetrics& metrics);

/**
 * @class RebirthOrchestrator
 * @brief Pilote la transition atomique entre deux vies
 *
 * Les composants sont détenus par l'appelant ; l'orchestrateur les modifie
 * par référence, si bien qu'un moteur émotionnel réinitialisé reste le même
 * objet pour le pilote.
 */
class RebirthOrchestrator {
public:
    RebirthOrchestrator(EmotionEngine& emotion,
                        ConsciousnessModel& consciousness,
                        MemoryStore& memory,
                        PersonalityModel& personality,
                        const SoulConfig& config);

    // Non-copiable
    RebirthOrchestrator(const RebirthOrchestrator&) = delete;
    RebirthOrchestrator& operator=(const RebirthOrchestrator&) = delete;

    /**
     * @brief Accumule un tick dans les métriques de la vie courante
     * @param event Événement du tick
     * @param stored Vrai si l'expérience a produit un souvenir
     */
    void observeTick(const Event& event, bool stored);

    /**
     * @brief Exécute la renaissance complète
     * @throws RebirthError si une étape échoue ou si une renaissance est déjà en cours
     */
    void processRebirth();

    // ═══════════════════════════════════════════════════════════════════════
    // ACCESSEURS
    // ═══════════════════════════════════════════════════════════════════════

    [[nodiscard]] RebirthState getState() const { return state_; }
    [[nodiscard]] const LifeMetrics& getCurrentMetrics() const { return metrics_; }
    [[nodiscard]] const std::vector<LifeMetrics>& getLifeArchive() const { return archive_; }
    [[nodiscard]] int getCycleCount() const { return cycle_count_; }
    [[nodiscard]] double getRetainedLevel() const { return rebirth_threshold_ * 0.5; }

    /**
     * @brief Indicateurs courants influençant la renaissance
     */
    [[nodiscard]] nlohmann::json getRebirthMetrics() const;

    void setStateCallback(RebirthStateCallback callback) { on_state_change_ = std::move(callback); }

    void setQuietMode(bool quiet) { quiet_mode_ = quiet; }
    [[nodiscard]] bool isQuietMode() const { return quiet_mode_; }

private:
    EmotionEngine& emotion_;
    ConsciousnessModel& consciousness_;
    MemoryStore& memory_;
    PersonalityModel& personality_;

    MemoryConfig memory_config_;
    double rebirth_threshold_;

    RebirthState state_ = RebirthState::ALIVE;
    LifeMetrics metrics_;
    std::vector<LifeMetrics> archive_;
    int cycle_count_ = 0;
    bool quiet_mode_ = false;

    RebirthStateCallback on_state_change_;

    void transitionTo(RebirthState new_state);
    void logLifeMetrics(const LifeMetrics& metrics) const;
};

} // namespace soul

#endif // SOUL_REBIRTH_ORCHESTRATOR_HPP
