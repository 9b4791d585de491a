/**
 * @file EventSource.hpp
 * @brief Générateur d'événements de vie pour l'âme simulée
 * @version 1.0
 * @date 2026-10-19
 *
 * Sélection pondérée de la catégorie :
 * - la catégorie précédente est exclue
 * - poids ×0.5 si la catégorie figure dans les 5 derniers événements
 * - poids ×1.2 pour les catégories de croissance (challenge, discovery, reflection)
 *
 * Signification = base du modèle + bruit uniforme [-0.1, +0.1], bornée à [0.1, 1.0]
 */

#ifndef SOUL_EVENT_SOURCE_HPP
#define SOUL_EVENT_SOURCE_HPP

#include "Types.hpp"
#include "Random.hpp"
#include "SoulConfig.hpp"
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace soul {

/**
 * @brief Modèle d'événement pour une catégorie générée
 */
struct EventTemplate {
    EventKind kind;
    double base_significance;
    std::vector<std::string> emotional_tags;
    std::vector<std::string> descriptions;
};

/**
 * @brief Résumé de l'historique des événements
 */
struct EventSummary {
    size_t total_events = 0;
    std::map<std::string, size_t> event_types;
    double average_significance = 0.0;
    size_t novel_experiences = 0;
};

/**
 * @class EventSource
 * @brief Produit le flux d'événements discrets consommés à chaque tick
 */
class EventSource {
public:
    /**
     * @brief Constructeur
     * @param config Paramètres d'environnement (seuil de nouveauté, bruit...)
     * @param random Source d'aléa partagée
     */
    EventSource(const EnvironmentConfig& config, std::shared_ptr<RandomSource> random);

    /**
     * @brief Génère un nouvel événement et l'ajoute à l'historique
     */
    Event generateEvent();

    /**
     * @brief Poids de sélection des catégories candidates pour le prochain tirage
     *
     * Vide avant le premier événement (tirage uniforme dans ce cas).
     */
    [[nodiscard]] std::vector<std::pair<EventKind, double>> computeTypeWeights() const;

    /**
     * @brief Retourne le modèle d'une catégorie générée
     * @throws std::invalid_argument si la catégorie n'a pas de modèle
     */
    [[nodiscard]] const EventTemplate& getTemplate(EventKind kind) const;

    [[nodiscard]] const std::vector<Event>& getHistory() const { return history_; }
    [[nodiscard]] EventSummary getSummary() const;

    /**
     * @brief Événements les plus significatifs de l'historique
     * @param threshold Signification minimale
     * @param limit Nombre maximum de résultats
     */
    [[nodiscard]] std::vector<Event> getSignificantEvents(double threshold = 0.7,
                                                          size_t limit = 5) const;

private:
    EnvironmentConfig config_;
    std::shared_ptr<RandomSource> random_;
    std::vector<EventTemplate> templates_;
    std::vector<Event> history_;

    void initializeTemplates();
    EventKind selectEventKind();
    [[nodiscard]] double computeSignificance(double base_significance);
};

} // namespace soul

#endif // SOUL_EVENT_SOURCE_HPP
