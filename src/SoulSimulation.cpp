/**
 * @file SoulSimulation.cpp
 * @brief Implémentation du pilote de simulation
 * @version 1.0
 * @date 2026-10-19
 */

#include "SoulSimulation.hpp"
#include <algorithm>
#include <iomanip>
#include <iostream>

namespace soul {

// ═══════════════════════════════════════════════════════════════════════════
// CONSTRUCTEUR
// ═══════════════════════════════════════════════════════════════════════════

const SoulConfig& SoulSimulation::validated(const SoulConfig& config) {
    config.validate();
    return config;
}

SoulSimulation::SoulSimulation(const SoulConfig& config, std::shared_ptr<RandomSource> random)
    : config_(validated(config))
    , random_(random ? std::move(random) : std::make_shared<MersenneRandom>(config.seed))
    , events_(config_.environment, random_)
    , emotion_(config_.emotion)
    , consciousness_(config_.consciousness, config_.features)
    , memory_(config_.memory)
    , personality_(config_.personality, random_)
    , rebirth_(emotion_, consciousness_, memory_, personality_, config_)
{
}

void SoulSimulation::setQuietMode(bool quiet) {
    quiet_mode_ = quiet;
    consciousness_.setQuietMode(quiet);
    memory_.setQuietMode(quiet);
    rebirth_.setQuietMode(quiet);
}

LoadStatus SoulSimulation::initialize() {
    LoadStatus status = memory_.load();
    if (!quiet_mode_) {
        std::cout << "[Simulation] Âme " << personality_.getSoulId()
                  << " initialisée (mémoire: " << loadStatusToString(status)
                  << ", " << memory_.size() << " souvenirs)" << std::endl;
    }
    return status;
}

// ═══════════════════════════════════════════════════════════════════════════
// TICK / CYCLE
// ═══════════════════════════════════════════════════════════════════════════

TickResult SoulSimulation::tick() {
    TickResult result;
    result.event = events_.generateEvent();
    result.emotion = emotion_.process(result.event);
    result.stored = memory_.store(result.event, result.emotion);

    consciousness_.update(result.event, result.emotion);
    rebirth_.observeTick(result.event, result.stored);
    emotion_.decay();

    result.consciousness_level = consciousness_.level();
    result.awareness_tier = consciousness_.getAwarenessTier();
    result.bloomed = consciousness_.checkBloom();

    total_events_++;
    return result;
}

CycleReport SoulSimulation::runCycle(int events) {
    CycleReport report;
    report.cycle = current_cycle_;
    report.planned_events = events;

    for (int i = 0; i < events && !isStopRequested(); ++i) {
        TickResult result = tick();
        report.events++;
        if (result.bloomed) {
            report.bloomed = true;
            break;
        }
    }

    report.consciousness_level = consciousness_.level();
    report.dominant_emotion = emotion_.getDominant();
    report.memories = memory_.size();
    return report;
}

int SoulSimulation::drawCycleLength() {
    const long long lo = config_.life_cycles.min_cycle_duration;
    const long long hi = std::min<long long>(lo * 2, config_.life_cycles.max_cycle_duration);
    return static_cast<int>(lo + static_cast<long long>(random_->index(static_cast<size_t>(hi - lo + 1))));
}

SimulationReport SoulSimulation::run() {
    SimulationReport report;
    const int max_cycles = config_.life_cycles.max_life_cycles;

    if (!quiet_mode_) {
        std::cout << "[Simulation] " << max_cycles << " cycles de vie, "
                  << config_.life_cycles.min_cycle_duration << " - "
                  << config_.life_cycles.max_cycle_duration << " événements par cycle" << std::endl;
    }

    for (current_cycle_ = 1; current_cycle_ <= max_cycles; ++current_cycle_) {
        if (isStopRequested()) {
            break;
        }

        CycleReport cycle = runCycle(drawCycleLength());

        if (!quiet_mode_) {
            std::cout << std::fixed << std::setprecision(2)
                      << "[Simulation] Cycle " << cycle.cycle << "/" << max_cycles
                      << " : " << cycle.events << " événements, conscience "
                      << cycle.consciousness_level << ", émotion dominante "
                      << cycle.dominant_emotion.first << " (" << cycle.dominant_emotion.second << ")"
                      << std::defaultfloat << std::endl;
        }
        if (on_cycle_) {
            on_cycle_(cycle);
        }

        if (cycle.bloomed) {
            report.bloomed = true;
            if (!quiet_mode_) {
                std::cout << "[Simulation] Silent Bloom pendant le cycle " << cycle.cycle
                          << " après " << total_events_ << " événements" << std::endl;
            }
            break;
        }
        if (isStopRequested()) {
            break;
        }

        rebirth_.processRebirth();
        report.cycles_completed++;
    }

    report.interrupted = isStopRequested();
    report.total_events = total_events_;
    report.final_consciousness = consciousness_.level();
    report.saved = memory_.save();
    return report;
}

// ═══════════════════════════════════════════════════════════════════════════
// EXPORT
// ═══════════════════════════════════════════════════════════════════════════

nlohmann::json SoulSimulation::getSummary() const {
    const auto summary = events_.getSummary();
    return {
        {"soul_id", personality_.getSoulId()},
        {"total_events", total_events_},
        {"events", {
            {"event_types", summary.event_types},
            {"average_significance", summary.average_significance},
            {"novel_experiences", summary.novel_experiences}
        }},
        {"consciousness", consciousness_.toJson()},
        {"memory", memory_.toJson()},
        {"personality", personality_.toJson()},
        {"rebirth", rebirth_.getRebirthMetrics()}
    };
}

} // namespace soul
