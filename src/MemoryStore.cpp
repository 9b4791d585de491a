/**
 * @file MemoryStore.cpp
 * @brief Implémentation du magasin de souvenirs
 * @version 1.0
 * @date 2026-10-19
 */

#include "MemoryStore.hpp"
#include <algorithm>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace soul {

std::string loadStatusToString(LoadStatus status) {
    switch (status) {
        case LoadStatus::LOADED:  return "LOADED";
        case LoadStatus::CREATED: return "CREATED";
        case LoadStatus::CORRUPT: return "CORRUPT";
        default:                  return "UNKNOWN";
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// SÉRIALISATION
// ═══════════════════════════════════════════════════════════════════════════

nlohmann::json memoryToJson(const Memory& memory) {
    const auto& tags = memory.emotional_tags;
    return {
        {"content", memory.content},
        {"emotional_tags", {
            {"type", tags.type},
            {"intensity", tags.intensity},
            {"trigger", tags.trigger},
            {"timestamp", tags.timestamp},
            {"decay_rate", tags.decay_rate}
        }},
        {"significance", memory.significance},
        {"timestamp", memory.timestamp},
        {"recall_count", memory.recall_count}
    };
}

Memory memoryFromJson(const nlohmann::json& j) {
    Memory memory;
    memory.content = j.at("content").get<std::string>();
    memory.significance = j.at("significance").get<double>();
    memory.timestamp = j.at("timestamp").get<std::string>();
    memory.recall_count = j.at("recall_count").get<int>();

    const auto& tags = j.at("emotional_tags");
    memory.emotional_tags.type = tags.at("type").get<std::string>();
    memory.emotional_tags.intensity = tags.at("intensity").get<double>();
    memory.emotional_tags.trigger = tags.at("trigger").get<std::string>();
    memory.emotional_tags.timestamp = tags.at("timestamp").get<std::string>();
    memory.emotional_tags.decay_rate = tags.at("decay_rate").get<double>();
    return memory;
}

// ═══════════════════════════════════════════════════════════════════════════
// CONSTRUCTEUR
// ═══════════════════════════════════════════════════════════════════════════

MemoryStore::MemoryStore(const MemoryConfig& config)
    : config_(config)
{
}

void MemoryStore::requireUnit(double value, const char* name) {
    if (!(value >= 0.0 && value <= 1.0)) {
        throw std::invalid_argument(std::string("MemoryStore: ") + name + " hors de [0, 1]");
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// STOCKAGE / RAPPEL
// ═══════════════════════════════════════════════════════════════════════════

bool MemoryStore::store(const Event& event, const EmotionRecord& emotion) {
    double significance = (event.significance + emotion.intensity) / 2.0;
    if (significance < config_.storage_threshold) {
        return false;
    }

    Memory memory;
    memory.content = event.description;
    memory.emotional_tags = emotion.snapshot();
    memory.significance = significance;
    memory.timestamp = toIsoString(Clock::now());
    memory.recall_count = 0;
    memories_.push_back(std::move(memory));
    return true;
}

std::vector<Memory> MemoryStore::recall(const std::string& emotion, double threshold) {
    std::vector<Memory> recalled;
    for (auto& memory : memories_) {
        if (memory.emotional_tags.matches(emotion, threshold)) {
            memory.recall_count++;
            recalled.push_back(memory);
        }
    }

    std::stable_sort(recalled.begin(), recalled.end(),
        [](const Memory& a, const Memory& b) { return a.significance > b.significance; });
    return recalled;
}

void MemoryStore::prune(double threshold) {
    memories_.erase(
        std::remove_if(memories_.begin(), memories_.end(),
            [threshold](const Memory& m) { return m.significance < threshold; }),
        memories_.end());
}

std::vector<Memory> MemoryStore::sortedBySignificance() const {
    std::vector<Memory> sorted(memories_);
    std::stable_sort(sorted.begin(), sorted.end(),
        [](const Memory& a, const Memory& b) { return a.significance > b.significance; });
    return sorted;
}

std::vector<Memory> MemoryStore::selectForInheritance(double fraction) const {
    requireUnit(fraction, "fraction d'héritage");

    auto count = static_cast<size_t>(
        std::floor(static_cast<double>(memories_.size()) * fraction));
    auto selected = sortedBySignificance();
    selected.resize(std::min(count, selected.size()));
    return selected;
}

void MemoryStore::inherit(std::vector<Memory> memories, double strength) {
    requireUnit(strength, "force d'héritage");

    for (auto& memory : memories) {
        memory.significance *= strength;
        memories_.push_back(std::move(memory));
    }
}

std::vector<Memory> MemoryStore::getSignificantMemories(size_t limit) const {
    auto sorted = sortedBySignificance();
    if (sorted.size() > limit) {
        sorted.resize(limit);
    }
    return sorted;
}

// ═══════════════════════════════════════════════════════════════════════════
// PERSISTANCE
// ═══════════════════════════════════════════════════════════════════════════

bool MemoryStore::createEmptySnapshot() {
    std::error_code ec;
    fs::path path(config_.storage_path);
    if (path.has_parent_path()) {
        fs::create_directories(path.parent_path(), ec);
        if (ec) {
            last_diagnostic_ = "Impossible de créer " + path.parent_path().string() + ": " + ec.message();
            return false;
        }
    }

    std::ofstream file(path);
    if (!file.is_open()) {
        last_diagnostic_ = "Impossible de créer l'instantané " + config_.storage_path;
        return false;
    }
    file << nlohmann::json::array() << std::endl;
    return true;
}

LoadStatus MemoryStore::load() {
    last_diagnostic_.clear();

    std::error_code ec;
    if (!fs::exists(config_.storage_path, ec)) {
        memories_.clear();
        if (!createEmptySnapshot()) {
            std::cerr << "[MemoryStore] " << last_diagnostic_ << std::endl;
            return LoadStatus::CORRUPT;
        }
        if (!quiet_mode_) {
            std::cout << "[MemoryStore] Instantané vide créé: " << config_.storage_path << std::endl;
        }
        return LoadStatus::CREATED;
    }

    try {
        std::ifstream file(config_.storage_path);
        if (!file.is_open()) {
            throw std::runtime_error("fichier illisible");
        }

        nlohmann::json j;
        file >> j;
        if (!j.is_array()) {
            throw std::runtime_error("un tableau de souvenirs est attendu");
        }

        std::vector<Memory> loaded;
        loaded.reserve(j.size());
        for (const auto& item : j) {
            Memory memory = memoryFromJson(item);
            if (memory.recall_count < 0) {
                throw std::runtime_error("recall_count négatif");
            }
            loaded.push_back(std::move(memory));
        }
        memories_ = std::move(loaded);
    } catch (const std::exception& e) {
        memories_.clear();
        last_diagnostic_ = "Instantané corrompu (" + config_.storage_path + "): " + e.what();
        std::cerr << "[MemoryStore] " << last_diagnostic_ << ", démarrage avec une mémoire vide" << std::endl;
        return LoadStatus::CORRUPT;
    }

    if (!quiet_mode_) {
        std::cout << "[MemoryStore] " << memories_.size() << " souvenirs chargés depuis "
                  << config_.storage_path << std::endl;
    }
    return LoadStatus::LOADED;
}

bool MemoryStore::save() const {
    try {
        fs::path path(config_.storage_path);
        if (path.has_parent_path()) {
            fs::create_directories(path.parent_path());
        }

        std::ofstream file(path);
        if (!file.is_open()) {
            throw std::runtime_error("ouverture en écriture impossible");
        }

        nlohmann::json j = nlohmann::json::array();
        for (const auto& memory : memories_) {
            j.push_back(memoryToJson(memory));
        }
        file << std::setw(2) << j << std::endl;
        if (!file) {
            throw std::runtime_error("écriture incomplète");
        }
    } catch (const std::exception& e) {
        last_diagnostic_ = "Sauvegarde impossible (" + config_.storage_path + "): " + e.what();
        std::cerr << "[MemoryStore] " << last_diagnostic_ << std::endl;
        return false;
    }

    if (!quiet_mode_) {
        std::cout << "[MemoryStore] " << memories_.size() << " souvenirs sauvegardés dans "
                  << config_.storage_path << std::endl;
    }
    return true;
}

nlohmann::json MemoryStore::toJson() const {
    nlohmann::json top = nlohmann::json::array();
    for (const auto& memory : getSignificantMemories(config_.significant_limit)) {
        top.push_back({{"content", memory.content}, {"significance", memory.significance}});
    }
    return {
        {"total_memories", memories_.size()},
        {"storage_path", config_.storage_path},
        {"significant_memories", top}
    };
}

} // namespace soul
