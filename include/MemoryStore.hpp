/**
 * @file MemoryStore.hpp
 * @brief Stockage, rappel et héritage des souvenirs de l'âme
 * @version 1.0
 * @date 2026-10-19
 *
 * Un souvenir n'est créé que si (significance + intensité) / 2 ≥ seuil.
 * Persistance : tableau JSON plat de souvenirs (nlohmann/json).
 */

#ifndef SOUL_MEMORY_STORE_HPP
#define SOUL_MEMORY_STORE_HPP

#include "Types.hpp"
#include "SoulConfig.hpp"
#include "EmotionEngine.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace soul {

/**
 * @brief Issue du chargement de l'instantané
 */
enum class LoadStatus {
    LOADED,   // Instantané lu
    CREATED,  // Fichier absent, instantané vide créé
    CORRUPT   // Illisible ou malformé, magasin laissé vide
};

std::string loadStatusToString(LoadStatus status);

nlohmann::json memoryToJson(const Memory& memory);

/**
 * @brief Lit un souvenir ; toutes les clés sont obligatoires
 * @throws nlohmann::json::exception si une clé manque ou a un mauvais type
 */
Memory memoryFromJson(const nlohmann::json& j);

/**
 * @class MemoryStore
 * @brief Collection ordonnée de souvenirs, filtrée à l'entrée
 */
class MemoryStore {
public:
    explicit MemoryStore(const MemoryConfig& config = MemoryConfig{});

    // ═══════════════════════════════════════════════════════════════════════
    // STOCKAGE / RAPPEL
    // ═══════════════════════════════════════════════════════════════════════

    /**
     * @brief Filtre une expérience vers la mémoire
     * @return true si un souvenir a été créé
     */
    bool store(const Event& event, const EmotionRecord& emotion);

    /**
     * @brief Souvenirs portant l'émotion demandée avec intensité ≥ threshold
     *
     * Triés par significance décroissante ; recall_count de chaque souvenir
     * retourné est incrémenté une fois par appel.
     */
    std::vector<Memory> recall(const std::string& emotion, double threshold);
    std::vector<Memory> recall(const std::string& emotion) {
        return recall(emotion, config_.recall_threshold);
    }

    /**
     * @brief Oubli définitif des souvenirs de significance < threshold
     */
    void prune(double threshold);

    /**
     * @brief Les floor(total × fraction) souvenirs les plus significatifs (copies)
     */
    [[nodiscard]] std::vector<Memory> selectForInheritance(double fraction) const;

    /**
     * @brief Ajoute des souvenirs hérités, significance × strength
     */
    void inherit(std::vector<Memory> memories, double strength);

    [[nodiscard]] std::vector<Memory> getSignificantMemories(size_t limit) const;
    [[nodiscard]] std::vector<Memory> getSignificantMemories() const {
        return getSignificantMemories(config_.significant_limit);
    }

    [[nodiscard]] const std::vector<Memory>& getMemories() const { return memories_; }
    [[nodiscard]] size_t size() const { return memories_.size(); }
    [[nodiscard]] bool empty() const { return memories_.empty(); }

    // ═══════════════════════════════════════════════════════════════════════
    // PERSISTANCE
    // ═══════════════════════════════════════════════════════════════════════

    /**
     * @brief Charge l'instantané depuis storage_path
     *
     * Ne lève jamais : un instantané malformé laisse le magasin vide et
     * renseigne getLastDiagnostic().
     */
    LoadStatus load();

    /**
     * @brief Écrit l'ensemble des souvenirs dans storage_path
     * @return false en cas d'échec d'écriture (diagnostic renseigné)
     */
    bool save() const;

    [[nodiscard]] const std::string& getLastDiagnostic() const { return last_diagnostic_; }
    [[nodiscard]] const std::string& getStoragePath() const { return config_.storage_path; }

    [[nodiscard]] nlohmann::json toJson() const;

    void setQuietMode(bool quiet) { quiet_mode_ = quiet; }
    [[nodiscard]] bool isQuietMode() const { return quiet_mode_; }

private:
    MemoryConfig config_;
    std::vector<Memory> memories_;
    mutable std::string last_diagnostic_;
    bool quiet_mode_ = false;

    static void requireUnit(double value, const char* name);
    [[nodiscard]] std::vector<Memory> sortedBySignificance() const;
    bool createEmptySnapshot();
};

} // namespace soul

#endif // SOUL_MEMORY_STORE_HPP
