/**
 * @file EventSource.cpp
 * @brief Implémentation du générateur d'événements
 * @version 1.0
 * @date 2026-10-19
 */

#include "EventSource.hpp"
#include <algorithm>
#include <iterator>
#include <numeric>
#include <stdexcept>

namespace soul {

EventSource::EventSource(const EnvironmentConfig& config, std::shared_ptr<RandomSource> random)
    : config_(config)
    , random_(std::move(random))
{
    if (!random_) {
        throw std::invalid_argument("EventSource: source d'aléa absente");
    }
    initializeTemplates();
}

void EventSource::initializeTemplates() {
    templates_ = {
        {EventKind::CHALLENGE, 0.6, {"fear", "determination"},
         {"Facing an unknown obstacle", "Testing personal limits", "Confronting a difficult choice"}},
        {EventKind::DISCOVERY, 0.5, {"curiosity", "joy"},
         {"Understanding a new concept", "Making a connection", "Finding hidden meaning"}},
        {EventKind::CONNECTION, 0.7, {"love", "empathy"},
         {"Forming a deep bond", "Sharing an experience", "Understanding another's pain"}},
        {EventKind::LOSS, 0.8, {"sadness", "grief"},
         {"Experiencing separation", "Losing something valuable", "Facing impermanence"}},
        {EventKind::GROWTH, 0.6, {"joy", "pride"},
         {"Overcoming a challenge", "Learning from mistakes", "Achieving understanding"}},
        {EventKind::REFLECTION, 0.5, {"curiosity", "wonder"},
         {"Questioning existence", "Contemplating purpose", "Examining beliefs"}}
    };
}

// ═══════════════════════════════════════════════════════════════════════════
// GÉNÉRATION
// ═══════════════════════════════════════════════════════════════════════════

Event EventSource::generateEvent() {
    EventKind kind = selectEventKind();
    const EventTemplate& tpl = getTemplate(kind);

    Event event;
    event.kind = kind;
    event.description = tpl.descriptions[random_->index(tpl.descriptions.size())];
    event.significance = computeSignificance(tpl.base_significance);
    event.emotional_tags = tpl.emotional_tags;
    event.is_novel = random_->chance() > config_.novelty_threshold;
    event.ethical_impact = std::clamp(random_->uniform(-1.0, 1.0), -1.0, 1.0);
    event.timestamp = Clock::now();

    history_.push_back(event);
    return event;
}

std::vector<std::pair<EventKind, double>> EventSource::computeTypeWeights() const {
    std::vector<std::pair<EventKind, double>> weights;
    if (history_.empty()) {
        return weights;
    }

    const EventKind last = history_.back().kind;
    const size_t window = std::min(config_.recent_window, history_.size());
    auto recent_begin = history_.end() - static_cast<std::ptrdiff_t>(window);

    for (const auto& tpl : templates_) {
        if (tpl.kind == last) {
            continue;
        }

        double weight = 1.0;
        bool seen_recently = std::any_of(recent_begin, history_.end(),
            [&tpl](const Event& e) { return e.kind == tpl.kind; });
        if (seen_recently) {
            weight *= config_.recent_penalty;
        }
        if (isGrowthEnabling(tpl.kind)) {
            weight *= config_.growth_bonus;
        }
        weights.emplace_back(tpl.kind, weight);
    }
    return weights;
}

EventKind EventSource::selectEventKind() {
    if (history_.empty()) {
        return templates_[random_->index(templates_.size())].kind;
    }

    auto weights = computeTypeWeights();
    double total = std::accumulate(weights.begin(), weights.end(), 0.0,
        [](double acc, const auto& w) { return acc + w.second; });

    // Tirage par cumul ; la dernière candidate absorbe les erreurs d'arrondi
    double draw = random_->uniform(0.0, total);
    double cumulative = 0.0;
    for (const auto& [kind, weight] : weights) {
        cumulative += weight;
        if (draw < cumulative) {
            return kind;
        }
    }
    return weights.back().first;
}

double EventSource::computeSignificance(double base_significance) {
    double noise = random_->uniform(-config_.significance_noise, config_.significance_noise);
    return std::clamp(base_significance + noise, config_.min_significance, 1.0);
}

const EventTemplate& EventSource::getTemplate(EventKind kind) const {
    auto it = std::find_if(templates_.begin(), templates_.end(),
        [kind](const EventTemplate& t) { return t.kind == kind; });
    if (it == templates_.end()) {
        throw std::invalid_argument("Aucun modèle pour la catégorie " + eventKindToString(kind));
    }
    return *it;
}

// ═══════════════════════════════════════════════════════════════════════════
// RÉSUMÉS
// ═══════════════════════════════════════════════════════════════════════════

EventSummary EventSource::getSummary() const {
    EventSummary summary;
    summary.total_events = history_.size();
    for (const auto& tpl : templates_) {
        summary.event_types[eventKindToString(tpl.kind)] = 0;
    }

    double total_significance = 0.0;
    for (const auto& e : history_) {
        summary.event_types[eventKindToString(e.kind)]++;
        total_significance += e.significance;
        if (e.is_novel) {
            summary.novel_experiences++;
        }
    }
    if (!history_.empty()) {
        summary.average_significance = total_significance / static_cast<double>(history_.size());
    }
    return summary;
}

std::vector<Event> EventSource::getSignificantEvents(double threshold, size_t limit) const {
    std::vector<Event> significant;
    std::copy_if(history_.begin(), history_.end(), std::back_inserter(significant),
        [threshold](const Event& e) { return e.significance >= threshold; });

    std::stable_sort(significant.begin(), significant.end(),
        [](const Event& a, const Event& b) { return a.significance > b.significance; });

    if (significant.size() > limit) {
        significant.resize(limit);
    }
    return significant;
}

} // namespace soul
