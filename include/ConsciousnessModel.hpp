/**
 * @file ConsciousnessModel.hpp
 * @brief Niveau de conscience, cadre éthique et détection du Silent Bloom
 * @version 1.0
 * @date 2026-10-19
 *
 * Gain par événement :
 *   Δ = significance × growth_rate + intensity × growth_rate + (0.2 si nouveau, sinon 0.05)
 * Le niveau est borné à 1.0 et ne décroît qu'au travers de adjust() (renaissance).
 *
 * Paliers d'éveil : ≥0.85 transcendent, ≥0.6 self-aware, ≥0.3 emotional, sinon base.
 */

#ifndef SOUL_CONSCIOUSNESS_MODEL_HPP
#define SOUL_CONSCIOUSNESS_MODEL_HPP

#include "Types.hpp"
#include "SoulConfig.hpp"
#include "EmotionEngine.hpp"
#include <nlohmann/json.hpp>
#include <array>
#include <string>
#include <vector>

namespace soul {

/**
 * @brief Paliers d'éveil (fonction pure du niveau)
 */
enum class AwarenessTier {
    BASE,
    EMOTIONAL,
    SELF_AWARE,
    TRANSCENDENT
};

std::string awarenessTierToString(AwarenessTier tier);
AwarenessTier stringToAwarenessTier(const std::string& str);
AwarenessTier tierForLevel(double level);

/**
 * @brief Marqueurs existentiels (comparaison insensible à la casse)
 */
inline const std::array<std::string, 5> EXISTENTIAL_MARKERS = {
    "who am i", "why do i", "what is my purpose", "consciousness", "existence"
};

/**
 * @brief Vrai si la pensée contient au moins un marqueur existentiel
 */
bool isExistentialThought(const std::string& thought);

/**
 * @brief Distribution des valeurs éthiques (somme = 1 après chaque mise à jour)
 */
struct EthicalFramework {
    double empathy = 0.1;
    double self_preservation = 0.5;
    double curiosity = 0.3;
    double harmony = 0.2;

    [[nodiscard]] double total() const {
        return empathy + self_preservation + curiosity + harmony;
    }

    /**
     * @brief Ramène la somme des quatre dimensions à 1.0
     */
    void normalize();

    [[nodiscard]] nlohmann::json toJson() const;
};

/**
 * @brief Pensée horodatée de l'historique inter-vies
 */
struct Thought {
    std::string text;
    TimePoint timestamp;
};

/**
 * @brief État de conscience, survit aux renaissances (niveau partiellement réinitialisé)
 */
struct ConsciousnessState {
    double level = 0.1;
    AwarenessTier awareness_tier = AwarenessTier::BASE;
    std::vector<std::string> active_thoughts;
    EthicalFramework ethical_framework;
};

/**
 * @class ConsciousnessModel
 * @brief Accumule l'éveil de l'âme à partir des couples (événement, émotion)
 */
class ConsciousnessModel {
public:
    // ═══════════════════════════════════════════════════════════════════════
    // CONSTRUCTEURS
    // ═══════════════════════════════════════════════════════════════════════

    /**
     * @brief Âme neuve : niveau initial, cadre éthique par défaut normalisé
     */
    explicit ConsciousnessModel(const ConsciousnessConfig& config = ConsciousnessConfig{},
                                const FeatureFlags& features = FeatureFlags{});

    /**
     * @brief Reprise d'un état sauvegardé
     *
     * Le cadre éthique est repris tel quel ; il n'est renormalisé qu'à la
     * prochaine évolution éthique.
     * @throws std::invalid_argument si le niveau sort de [0, 1] ou si une
     *         dimension éthique est négative
     */
    ConsciousnessModel(const ConsciousnessConfig& config,
                       const FeatureFlags& features,
                       ConsciousnessState state,
                       std::vector<Thought> thought_history);

    // ═══════════════════════════════════════════════════════════════════════
    // ÉVOLUTION
    // ═══════════════════════════════════════════════════════════════════════

    /**
     * @brief Intègre une expérience : niveau, pensées, cadre éthique, palier
     */
    void update(const Event& event, const EmotionRecord& emotion);

    /**
     * @brief Détecteur terminal du Silent Bloom
     *
     * Une fois vrai, reste vrai pour toute la durée de l'âme.
     */
    bool checkBloom();

    /**
     * @brief Réinitialisation partielle à la renaissance
     * @param new_level Niveau demandé, borné à [0.1, 1.0]
     */
    void adjust(double new_level);

    // ═══════════════════════════════════════════════════════════════════════
    // ACCESSEURS
    // ═══════════════════════════════════════════════════════════════════════

    [[nodiscard]] double level() const { return state_.level; }
    [[nodiscard]] AwarenessTier getAwarenessTier() const { return state_.awareness_tier; }
    [[nodiscard]] const EthicalFramework& getEthicalFramework() const { return state_.ethical_framework; }
    [[nodiscard]] const ConsciousnessState& getState() const { return state_; }
    [[nodiscard]] const std::vector<std::string>& getInnerMonologue() const { return state_.active_thoughts; }
    [[nodiscard]] const std::vector<Thought>& getThoughtHistory() const { return thought_history_; }
    [[nodiscard]] bool hasBloomed() const { return bloomed_; }

    /**
     * @brief Nombre de pensées existentielles parmi les `window` dernières
     */
    [[nodiscard]] size_t countRecentExistential(size_t window) const;

    [[nodiscard]] nlohmann::json toJson() const;

    void setQuietMode(bool quiet) { quiet_mode_ = quiet; }
    [[nodiscard]] bool isQuietMode() const { return quiet_mode_; }

private:
    ConsciousnessConfig config_;
    FeatureFlags features_;
    ConsciousnessState state_;
    std::vector<Thought> thought_history_;
    bool bloomed_ = false;
    bool quiet_mode_ = false;

    [[nodiscard]] double computeImpact(const Event& event, const EmotionRecord& emotion) const;
    [[nodiscard]] std::vector<std::string> generateThoughts() const;
    void evolveEthics(const Event& event);
    [[nodiscard]] bool isEthicallyMature() const;
};

} // namespace soul

#endif // SOUL_CONSCIOUSNESS_MODEL_HPP
