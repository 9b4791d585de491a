/**
 * @file PersonalityModel.hpp
 * @brief Identité stable de l'âme et évolution de ses six traits
 * @version 1.0
 * @date 2026-10-19
 *
 * Évolution (une fois par renaissance) :
 *   1. pics émotionnels (joy, fear, love, curiosity)
 *   2. ratio éthique positif (> 0.6 ou non)
 *   3. influence de la conscience : evolution_rate × niveau × 0.1 sur chaque trait
 *   4. mutation aléatoire éventuelle d'un trait dans [-0.05, +0.05]
 * Chaque trait reste borné à [0, 1].
 */

#ifndef SOUL_PERSONALITY_MODEL_HPP
#define SOUL_PERSONALITY_MODEL_HPP

#include "Types.hpp"
#include "Random.hpp"
#include "SoulConfig.hpp"
#include <nlohmann/json.hpp>
#include <array>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace soul {

constexpr size_t NUM_TRAITS = 6;

/**
 * @brief Noms des traits, dans l'ordre de tirage des mutations
 */
inline const std::array<std::string, NUM_TRAITS> TRAIT_NAMES = {
    "empathy", "curiosity", "resilience", "adaptability", "creativity", "harmony"
};

/**
 * @brief Dimension de personnalité
 */
struct Trait {
    std::string name;
    double value = 0.0;            // [0.0, 1.0]
    double evolution_rate = 0.0;   // Fixé à la création de l'âme
    std::string description;
};

/**
 * @brief Trace d'un appel à evolve()
 */
struct EvolutionRecord {
    std::map<std::string, double> pre_evolution;
    std::map<std::string, double> post_evolution;
    LifeMetrics life_metrics;
    std::optional<std::string> mutated_trait;
    double mutation = 0.0;
};

/**
 * @class PersonalityModel
 * @brief Traits de personnalité d'une âme, persistants d'une vie à l'autre
 */
class PersonalityModel {
public:
    /**
     * @brief Constructeur
     * @param config Paramètres d'évolution
     * @param random Source d'aléa partagée (mutation, identifiant)
     * @param soul_id Identifiant à reprendre ; vide = nouvel identifiant UUID v4
     */
    PersonalityModel(const PersonalityConfig& config,
                     std::shared_ptr<RandomSource> random,
                     std::string soul_id = "");

    /**
     * @brief Fait évoluer les traits à partir des métriques d'une vie
     */
    void evolve(const LifeMetrics& metrics);

    // ═══════════════════════════════════════════════════════════════════════
    // REQUÊTES
    // ═══════════════════════════════════════════════════════════════════════

    [[nodiscard]] const std::string& getSoulId() const { return soul_id_; }
    [[nodiscard]] const std::vector<Trait>& getTraits() const { return traits_; }

    /**
     * @brief Valeur d'un trait, std::nullopt si le nom est inconnu
     */
    [[nodiscard]] std::optional<double> getTraitValue(const std::string& name) const;

    /**
     * @brief Traits dont la valeur atteint le seuil, dans l'ordre canonique
     */
    [[nodiscard]] std::vector<std::string> getDominantTraits(double threshold) const;
    [[nodiscard]] std::vector<std::string> getDominantTraits() const {
        return getDominantTraits(config_.dominant_threshold);
    }

    /**
     * @brief Trajectoire post-évolution de chaque trait
     */
    [[nodiscard]] std::map<std::string, std::vector<double>> getEvolutionProgress() const;
    [[nodiscard]] const std::vector<EvolutionRecord>& getEvolutionHistory() const { return history_; }

    [[nodiscard]] nlohmann::json toJson() const;

private:
    PersonalityConfig config_;
    std::shared_ptr<RandomSource> random_;
    std::string soul_id_;
    std::vector<Trait> traits_;
    std::vector<EvolutionRecord> history_;

    void initializeTraits();
    [[nodiscard]] std::string generateSoulId();
    [[nodiscard]] std::map<std::string, double> snapshotValues() const;

    Trait& traitAt(const std::string& name);
    void adjustTrait(const std::string& name, double amount);

    void evolveFromEmotions(const std::map<std::string, double>& peaks);
    void evolveFromEthics(const EthicalChoices& choices);
    void evolveFromConsciousness(double level);
    void applyMutation(EvolutionRecord& record);
};

} // namespace soul

#endif // SOUL_PERSONALITY_MODEL_HPP
