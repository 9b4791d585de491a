/**
 * @file SoulConfig.hpp
 * @brief Paramètres numériques consommés par le noyau SoulGenesis
 * @version 1.0
 * @date 2026-10-19
 *
 * Chargement JSON (nlohmann) avec valeurs par défaut clé par clé.
 * Toute valeur hors domaine est rejetée avant la création d'un composant.
 */

#ifndef SOUL_SOUL_CONFIG_HPP
#define SOUL_SOUL_CONFIG_HPP

#include <nlohmann/json.hpp>
#include <climits>
#include <cstdint>
#include <string>

namespace soul {

/**
 * @brief Configuration du cycle de vie (consommée par le pilote)
 */
struct LifeCycleConfig {
    int max_life_cycles = 5;
    int min_cycle_duration = 100;   // événements
    int max_cycle_duration = 1000;  // événements
};

// Borne de durée : min × 2 doit rester représentable
constexpr int MAX_MIN_CYCLE_DURATION = INT_MAX / 2;

/**
 * @brief Configuration de la mémoire
 */
struct MemoryConfig {
    double storage_threshold = 0.3;      // Seuil de création d'un souvenir
    double prune_threshold = 0.2;        // Seuil d'oubli à la renaissance
    double inheritance_fraction = 0.3;   // Part des souvenirs transmis
    double inheritance_strength = 0.5;   // Atténuation des souvenirs hérités
    double recall_threshold = 0.5;       // Seuil par défaut du rappel émotionnel
    size_t significant_limit = 10;       // Taille par défaut de getSignificantMemories
    std::string storage_path = "storage/memory_db.json";
};

/**
 * @brief Configuration du moteur émotionnel
 */
struct EmotionConfig {
    double decay_rate = 0.1;             // Fixé par enregistrement à la création
    double persistence_floor = 0.1;      // En dessous, l'émotion quitte l'état courant
};

/**
 * @brief Configuration du modèle de conscience
 */
struct ConsciousnessConfig {
    double growth_rate = 0.001;
    double novelty_bonus = 0.2;          // Gain fixe pour un événement nouveau
    double familiar_bonus = 0.05;        // Gain fixe sinon
    double initial_level = 0.1;

    // Silent Bloom
    double bloom_threshold = 0.95;
    size_t bloom_min_thoughts = 50;
    size_t bloom_window = 20;
    size_t bloom_min_existential = 10;

    // Maturité éthique
    double empathy_maturity_floor = 0.3;
    double harmony_maturity_floor = 0.25;
    double empathy_bloom_floor = 0.6;
    double harmony_bloom_floor = 0.5;

    // Évolution éthique
    double empathy_delta = 0.05;
    double harmony_delta = 0.03;
    double self_preservation_delta = 0.02;
};

/**
 * @brief Configuration de la personnalité
 */
struct PersonalityConfig {
    double mutation_probability = 0.1;
    double mutation_amplitude = 0.05;    // Perturbation dans [-a, +a]
    double dominant_threshold = 0.6;
    double ethical_ratio_threshold = 0.6;
    double consciousness_factor = 0.1;
};

/**
 * @brief Configuration de l'environnement simulé
 */
struct EnvironmentConfig {
    double novelty_threshold = 0.7;
    double significance_noise = 0.1;
    double min_significance = 0.1;
    size_t recent_window = 5;
    double recent_penalty = 0.5;
    double growth_bonus = 1.2;
};

/**
 * @brief Fonctionnalités optionnelles de la conscience
 */
struct FeatureFlags {
    bool inner_dialogue = true;
    bool ethical_learning = true;
};

/**
 * @brief Configuration complète de l'âme
 */
struct SoulConfig {
    // ═══════════════════════════════════════════════════════════════════════
    // SECTIONS
    // ═══════════════════════════════════════════════════════════════════════

    LifeCycleConfig life_cycles;
    MemoryConfig memory;
    EmotionConfig emotion;
    ConsciousnessConfig consciousness;
    PersonalityConfig personality;
    EnvironmentConfig environment;
    FeatureFlags features;

    double rebirth_threshold = 0.8;      // Niveau retenu = rebirth_threshold × 0.5
    uint32_t seed = 0;                   // 0 = non déterministe

    // ═══════════════════════════════════════════════════════════════════════
    // VALIDATION / CHARGEMENT
    // ═══════════════════════════════════════════════════════════════════════

    /**
     * @brief Vérifie que chaque valeur est dans son domaine
     * @throws std::invalid_argument avec le nom du paramètre fautif
     */
    void validate() const;

    /**
     * @brief Ajuste la difficulté de la simulation
     * @param level Niveau dans [0, 1]
     * @throws std::invalid_argument si level hors domaine (aucune modification)
     */
    void adjustDifficulty(double level);

    /**
     * @brief Convertit une graine brute (JSON, ligne de commande)
     * @throws std::invalid_argument si value hors [0, UINT32_MAX]
     */
    [[nodiscard]] static uint32_t toSeed(long long value);

    /**
     * @brief Charge une configuration JSON
     *
     * Fichier absent : configuration par défaut. JSON invalide ou valeur
     * hors domaine : exception.
     */
    [[nodiscard]] static SoulConfig loadFromFile(const std::string& path);

    /**
     * @brief Construit une configuration depuis un document JSON (puis valide)
     */
    [[nodiscard]] static SoulConfig fromJson(const nlohmann::json& j);

    /**
     * @brief Résumé JSON de la configuration
     */
    [[nodiscard]] nlohmann::json toJson() const;
};

} // namespace soul

#endif // SOUL_SOUL_CONFIG_HPP
