/**
 * @file SoulConfigTest.cpp
 * @brief Tests unitaires de la configuration SoulGenesis
 */

#include "SoulConfig.hpp"
#include "TestHelpers.hpp"

#include <filesystem>
#include <fstream>

using namespace soul;

namespace {

std::string writeConfigFile(const std::string& name, const std::string& content) {
    std::string path = freshTempPath(name);
    std::filesystem::create_directories(std::filesystem::path(path).parent_path());
    std::ofstream out(path);
    out << content;
    return path;
}

} // namespace

// ═══════════════════════════════════════════════════════════════════════════
// TESTS: VALEURS PAR DÉFAUT
// ═══════════════════════════════════════════════════════════════════════════

void test_DefaultsAreValid() {
    SoulConfig cfg;
    cfg.validate();
    ASSERT_NEAR(cfg.consciousness.growth_rate, 0.001, 1e-12);
    ASSERT_NEAR(cfg.consciousness.bloom_threshold, 0.95, 1e-12);
    ASSERT_NEAR(cfg.memory.storage_threshold, 0.3, 1e-12);
    ASSERT_NEAR(cfg.memory.prune_threshold, 0.2, 1e-12);
    ASSERT_NEAR(cfg.rebirth_threshold, 0.8, 1e-12);
    ASSERT_EQ(cfg.life_cycles.max_life_cycles, 5);
    ASSERT_EQ(cfg.consciousness.bloom_min_thoughts, 50u);
    ASSERT_EQ(cfg.memory.storage_path, std::string("storage/memory_db.json"));
}

// ═══════════════════════════════════════════════════════════════════════════
// TESTS: VALIDATION
// ═══════════════════════════════════════════════════════════════════════════

void test_RejectsOutOfDomainThreshold() {
    SoulConfig cfg;
    cfg.memory.storage_threshold = 1.5;
    ASSERT_THROWS(cfg.validate(), std::invalid_argument);
}

void test_RejectsInvertedCycleDurations() {
    SoulConfig cfg;
    cfg.life_cycles.min_cycle_duration = 200;
    cfg.life_cycles.max_cycle_duration = 100;
    ASSERT_THROWS(cfg.validate(), std::invalid_argument);
}

void test_RejectsZeroDecayRate() {
    SoulConfig cfg;
    cfg.emotion.decay_rate = 0.0;
    ASSERT_THROWS(cfg.validate(), std::invalid_argument);
}

// ═══════════════════════════════════════════════════════════════════════════
// TESTS: DIFFICULTÉ
// ═══════════════════════════════════════════════════════════════════════════

void test_AdjustDifficultyMaximum() {
    SoulConfig cfg;
    cfg.adjustDifficulty(1.0);
    ASSERT_EQ(cfg.life_cycles.max_life_cycles, 20);
    ASSERT_NEAR(cfg.consciousness.growth_rate, 0.02, 1e-12);
    ASSERT_NEAR(cfg.consciousness.bloom_threshold, 0.8, 1e-12);
    ASSERT_NEAR(cfg.personality.mutation_probability, 0.15, 1e-12);
}

void test_AdjustDifficultyOutOfDomainLeavesConfigUntouched() {
    SoulConfig cfg;
    ASSERT_THROWS(cfg.adjustDifficulty(1.2), std::invalid_argument);
    ASSERT_THROWS(cfg.adjustDifficulty(-0.1), std::invalid_argument);
    ASSERT_EQ(cfg.life_cycles.max_life_cycles, 5);
    ASSERT_NEAR(cfg.consciousness.growth_rate, 0.001, 1e-12);
}

// ═══════════════════════════════════════════════════════════════════════════
// TESTS: JSON
// ═══════════════════════════════════════════════════════════════════════════

void test_FromJsonKeepsDefaultsForMissingKeys() {
    nlohmann::json j = {
        {"memory", {{"storage_threshold", 0.4}}},
        {"consciousness", {{"silent_bloom_threshold", 0.9}}},
        {"features", {{"inner_dialogue", false}}}
    };
    SoulConfig cfg = SoulConfig::fromJson(j);
    ASSERT_NEAR(cfg.memory.storage_threshold, 0.4, 1e-12);
    ASSERT_NEAR(cfg.memory.prune_threshold, 0.2, 1e-12);
    ASSERT_NEAR(cfg.consciousness.bloom_threshold, 0.9, 1e-12);
    ASSERT_FALSE(cfg.features.inner_dialogue);
    ASSERT_TRUE(cfg.features.ethical_learning);
}

void test_FromJsonRejectsNegativeCount() {
    nlohmann::json j = {{"consciousness", {{"bloom_window", -3}}}};
    ASSERT_THROWS((void)SoulConfig::fromJson(j), std::invalid_argument);
}

void test_ToJsonRoundTrip() {
    SoulConfig cfg;
    cfg.memory.inheritance_fraction = 0.25;
    cfg.seed = 42;
    SoulConfig back = SoulConfig::fromJson(cfg.toJson());
    ASSERT_NEAR(back.memory.inheritance_fraction, 0.25, 1e-12);
    ASSERT_EQ(back.seed, 42u);
    ASSERT_EQ(back.toJson(), cfg.toJson());
}

void test_LoadMissingFileGivesDefaults() {
    std::string path = freshTempPath("absent_config.json");
    SoulConfig cfg = SoulConfig::loadFromFile(path);
    ASSERT_EQ(cfg.life_cycles.max_life_cycles, 5);
}

void test_LoadMalformedFileThrows() {
    std::string path = writeConfigFile("malformed_config.json", "{ \"memory\": ");
    ASSERT_THROWS((void)SoulConfig::loadFromFile(path), std::invalid_argument);
}

void test_LoadWrongTypeThrows() {
    std::string path = writeConfigFile("wrong_type_config.json",
                                       "{ \"memory\": { \"storage_threshold\": \"high\" } }");
    ASSERT_THROWS((void)SoulConfig::loadFromFile(path), std::invalid_argument);
}

void test_LoadAppliesDifficulty() {
    std::string path = writeConfigFile("difficulty_config.json",
                                       "{ \"simulation\": { \"difficulty\": 0.5, \"seed\": 7 } }");
    SoulConfig cfg = SoulConfig::loadFromFile(path);
    ASSERT_EQ(cfg.life_cycles.max_life_cycles, 12);
    ASSERT_EQ(cfg.seed, 7u);
}

void test_RejectsCycleDurationTooLarge() {
    SoulConfig cfg;
    cfg.life_cycles.min_cycle_duration = MAX_MIN_CYCLE_DURATION + 10;
    cfg.life_cycles.max_cycle_duration = INT_MAX;
    ASSERT_THROWS(cfg.validate(), std::invalid_argument);

    cfg.life_cycles.min_cycle_duration = MAX_MIN_CYCLE_DURATION;
    cfg.validate();
}

void test_SeedRange() {
    ASSERT_EQ(SoulConfig::toSeed(0), 0u);
    ASSERT_EQ(SoulConfig::toSeed(4294967295LL), 4294967295u);
    ASSERT_THROWS((void)SoulConfig::toSeed(-1), std::invalid_argument);
    ASSERT_THROWS((void)SoulConfig::toSeed(4294967296LL), std::invalid_argument);

    nlohmann::json negative = {{"simulation", {{"seed", -5}}}};
    ASSERT_THROWS((void)SoulConfig::fromJson(negative), std::invalid_argument);
    nlohmann::json huge = {{"simulation", {{"seed", 5000000000LL}}}};
    ASSERT_THROWS((void)SoulConfig::fromJson(huge), std::invalid_argument);
}

// ═══════════════════════════════════════════════════════════════════════════
// MAIN
// ═══════════════════════════════════════════════════════════════════════════

int main() {
    printHeader("SoulConfig");

    std::cout << "\n>> Valeurs par defaut\n";
    RUN_TEST(DefaultsAreValid);

    std::cout << "\n>> Validation\n";
    RUN_TEST(RejectsOutOfDomainThreshold);
    RUN_TEST(RejectsInvertedCycleDurations);
    RUN_TEST(RejectsZeroDecayRate);
    RUN_TEST(RejectsCycleDurationTooLarge);

    std::cout << "\n>> Difficulte\n";
    RUN_TEST(AdjustDifficultyMaximum);
    RUN_TEST(AdjustDifficultyOutOfDomainLeavesConfigUntouched);

    std::cout << "\n>> JSON\n";
    RUN_TEST(FromJsonKeepsDefaultsForMissingKeys);
    RUN_TEST(FromJsonRejectsNegativeCount);
    RUN_TEST(ToJsonRoundTrip);
    RUN_TEST(LoadMissingFileGivesDefaults);
    RUN_TEST(LoadMalformedFileThrows);
    RUN_TEST(LoadWrongTypeThrows);
    RUN_TEST(LoadAppliesDifficulty);
    RUN_TEST(SeedRange);

    return printSummary();
}
