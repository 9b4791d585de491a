/**
 * @file MemoryStoreTest.cpp
 * @brief Tests unitaires du magasin de souvenirs
 */

#include "MemoryStore.hpp"
#include "TestHelpers.hpp"

#include <filesystem>
#include <fstream>

using namespace soul;

namespace {

MemoryConfig configAt(const std::string& path) {
    MemoryConfig cfg;
    cfg.storage_path = path;
    return cfg;
}

// Souvenir de significance exacte (événement et émotion identiques)
void storeAt(MemoryStore& store, const std::string& content, double significance,
             const std::string& emotion = "wonder") {
    Event e = createTestEvent(EventKind::REFLECTION, significance, false, 0.0, content);
    if (!store.store(e, createTestEmotion(emotion, significance))) {
        throw std::runtime_error("storeAt: souvenir refusé");
    }
}

} // namespace

// ═══════════════════════════════════════════════════════════════════════════
// TESTS: STOCKAGE
// ═══════════════════════════════════════════════════════════════════════════

void test_StorageThresholdBoundary() {
    MemoryStore store;
    ASSERT_FALSE(store.store(createTestEvent(EventKind::LOSS, 0.29),
                             createTestEmotion("sadness", 0.29)));
    ASSERT_TRUE(store.empty());

    ASSERT_TRUE(store.store(createTestEvent(EventKind::LOSS, 0.31),
                            createTestEmotion("sadness", 0.31)));
    ASSERT_EQ(store.size(), 1u);
    ASSERT_NEAR(store.getMemories()[0].significance, 0.31, 1e-12);
}

void test_StoredMemoryCarriesSnapshot() {
    MemoryStore store;
    Event e = createTestEvent(EventKind::CONNECTION, 0.6, false, 0.0, "Finding kinship");
    ASSERT_TRUE(store.store(e, createTestEmotion("love", 0.8, EventKind::CONNECTION)));

    const Memory& m = store.getMemories()[0];
    ASSERT_EQ(m.content, std::string("Finding kinship"));
    ASSERT_NEAR(m.significance, 0.7, 1e-12);
    ASSERT_EQ(m.emotional_tags.type, std::string("love"));
    ASSERT_EQ(m.emotional_tags.trigger, std::string("connection"));
    ASSERT_EQ(m.recall_count, 0);
    ASSERT_FALSE(m.timestamp.empty());
}

// ═══════════════════════════════════════════════════════════════════════════
// TESTS: RAPPEL
// ═══════════════════════════════════════════════════════════════════════════

void test_RecallFiltersAndSorts() {
    MemoryStore store;
    storeAt(store, "a", 0.5, "joy");
    storeAt(store, "b", 0.9, "joy");
    storeAt(store, "c", 0.7, "fear");
    storeAt(store, "d", 0.4, "joy");

    auto recalled = store.recall("joy", 0.45);
    ASSERT_EQ(recalled.size(), 2u);
    ASSERT_EQ(recalled[0].content, std::string("b"));
    ASSERT_EQ(recalled[1].content, std::string("a"));
}

void test_RecallIncrementsCountOncePerCall() {
    MemoryStore store;
    storeAt(store, "a", 0.6, "joy");
    storeAt(store, "b", 0.6, "fear");

    (void)store.recall("joy", 0.5);
    auto second = store.recall("joy", 0.5);
    ASSERT_EQ(second[0].recall_count, 2);
    ASSERT_EQ(store.getMemories()[0].recall_count, 2);
    ASSERT_EQ(store.getMemories()[1].recall_count, 0);
}

void test_RecallWithNoMatch() {
    MemoryStore store;
    storeAt(store, "a", 0.6, "joy");
    ASSERT_TRUE(store.recall("anger", 0.1).empty());
    ASSERT_TRUE(store.recall("joy", 0.9).empty());
}

void test_RecallUsesConfiguredThreshold() {
    MemoryConfig cfg;
    cfg.recall_threshold = 0.65;
    MemoryStore store(cfg);
    storeAt(store, "faint", 0.6, "joy");
    storeAt(store, "vivid", 0.8, "joy");

    auto recalled = store.recall("joy");
    ASSERT_EQ(recalled.size(), 1u);
    ASSERT_EQ(recalled[0].content, std::string("vivid"));
    ASSERT_EQ(store.getMemories()[0].recall_count, 0);
    ASSERT_EQ(store.getMemories()[1].recall_count, 1);
}

// ═══════════════════════════════════════════════════════════════════════════
// TESTS: OUBLI / HÉRITAGE
// ═══════════════════════════════════════════════════════════════════════════

void test_PruneRemovesBelowThreshold() {
    MemoryStore store;
    storeAt(store, "weak", 0.35);
    storeAt(store, "strong", 0.8);
    storeAt(store, "edge", 0.5);

    store.prune(0.5);
    ASSERT_EQ(store.size(), 2u);
    ASSERT_EQ(store.getMemories()[0].content, std::string("strong"));
    ASSERT_EQ(store.getMemories()[1].content, std::string("edge"));
}

void test_SelectForInheritanceTakesFloor() {
    MemoryStore store;
    storeAt(store, "m1", 0.4);
    storeAt(store, "m2", 0.9);
    storeAt(store, "m3", 0.6);
    storeAt(store, "m4", 0.8);
    storeAt(store, "m5", 0.5);
    storeAt(store, "m6", 0.7);
    storeAt(store, "m7", 0.3);

    // floor(7 × 0.3) = 2
    auto selected = store.selectForInheritance(0.3);
    ASSERT_EQ(selected.size(), 2u);
    ASSERT_EQ(selected[0].content, std::string("m2"));
    ASSERT_EQ(selected[1].content, std::string("m4"));
    ASSERT_EQ(store.size(), 7u);

    ASSERT_TRUE(store.selectForInheritance(0.0).empty());
    ASSERT_EQ(store.selectForInheritance(1.0).size(), 7u);
}

void test_SelectForInheritanceRejectsBadFraction() {
    MemoryStore store;
    ASSERT_THROWS((void)store.selectForInheritance(1.5), std::invalid_argument);
    ASSERT_THROWS((void)store.selectForInheritance(-0.1), std::invalid_argument);
}

void test_InheritScalesSignificance() {
    MemoryStore parent;
    storeAt(parent, "legacy", 0.8);
    storeAt(parent, "echo", 0.6);

    MemoryStore child;
    storeAt(child, "own", 0.5);
    child.inherit(parent.selectForInheritance(1.0), 0.5);

    ASSERT_EQ(child.size(), 3u);
    ASSERT_EQ(child.getMemories()[1].content, std::string("legacy"));
    ASSERT_NEAR(child.getMemories()[1].significance, 0.4, 1e-12);
    ASSERT_NEAR(child.getMemories()[2].significance, 0.3, 1e-12);
    ASSERT_NEAR(parent.getMemories()[0].significance, 0.8, 1e-12);
}

void test_InheritRejectsBadStrength() {
    MemoryStore store;
    ASSERT_THROWS(store.inherit({}, 1.2), std::invalid_argument);
}

void test_SignificantMemoriesLimit() {
    MemoryConfig cfg;
    cfg.significant_limit = 3;
    MemoryStore store(cfg);
    for (int i = 0; i < 6; ++i) {
        storeAt(store, "m" + std::to_string(i), 0.4 + 0.1 * i);
    }

    auto top = store.getSignificantMemories();
    ASSERT_EQ(top.size(), 3u);
    ASSERT_EQ(top[0].content, std::string("m5"));
    ASSERT_EQ(store.getSignificantMemories(10).size(), 6u);
}

// ═══════════════════════════════════════════════════════════════════════════
// TESTS: PERSISTANCE
// ═══════════════════════════════════════════════════════════════════════════

void test_SaveLoadRoundTrip() {
    std::string path = freshTempPath("roundtrip/memory_db.json");
    MemoryStore store(configAt(path));
    store.setQuietMode(true);
    storeAt(store, "Facing adversity", 0.7, "fear");
    storeAt(store, "Finding kinship", 0.55, "love");
    (void)store.recall("fear", 0.5);
    ASSERT_TRUE(store.save());

    MemoryStore reloaded(configAt(path));
    reloaded.setQuietMode(true);
    ASSERT_EQ(reloaded.load(), LoadStatus::LOADED);
    ASSERT_EQ(reloaded.size(), 2u);

    const Memory& first = reloaded.getMemories()[0];
    ASSERT_EQ(first.content, std::string("Facing adversity"));
    ASSERT_EQ(first.significance, store.getMemories()[0].significance);
    ASSERT_EQ(reloaded.getMemories()[1].significance, store.getMemories()[1].significance);
    ASSERT_EQ(first.recall_count, 1);
    ASSERT_TRUE(first.emotional_tags == store.getMemories()[0].emotional_tags);
    ASSERT_EQ(reloaded.getMemories()[1].emotional_tags.type, std::string("love"));
}

void test_LoadMissingFileCreatesSnapshot() {
    std::string path = freshTempPath("fresh/nested/memory_db.json");
    MemoryStore store(configAt(path));
    store.setQuietMode(true);

    ASSERT_EQ(store.load(), LoadStatus::CREATED);
    ASSERT_TRUE(store.empty());
    ASSERT_TRUE(std::filesystem::exists(path));

    std::ifstream in(path);
    nlohmann::json j;
    in >> j;
    ASSERT_TRUE(j.is_array());
    ASSERT_TRUE(j.empty());
}

void test_LoadMalformedFileIsCorrupt() {
    std::string path = freshTempPath("corrupt_memory_db.json");
    std::filesystem::create_directories(std::filesystem::path(path).parent_path());
    {
        std::ofstream out(path);
        out << "[ { \"content\": \"broken\" ";
    }

    MemoryStore store(configAt(path));
    storeAt(store, "before", 0.6);
    ASSERT_EQ(store.load(), LoadStatus::CORRUPT);
    ASSERT_TRUE(store.empty());
    ASSERT_FALSE(store.getLastDiagnostic().empty());
}

void test_LoadMissingKeyIsCorrupt() {
    std::string path = freshTempPath("missing_key_memory_db.json");
    std::filesystem::create_directories(std::filesystem::path(path).parent_path());
    {
        std::ofstream out(path);
        out << "[ { \"content\": \"partial\", \"significance\": 0.5 } ]";
    }

    MemoryStore store(configAt(path));
    ASSERT_EQ(store.load(), LoadStatus::CORRUPT);
    ASSERT_TRUE(store.empty());
}

void test_LoadStatusNames() {
    ASSERT_EQ(loadStatusToString(LoadStatus::LOADED), std::string("LOADED"));
    ASSERT_EQ(loadStatusToString(LoadStatus::CREATED), std::string("CREATED"));
    ASSERT_EQ(loadStatusToString(LoadStatus::CORRUPT), std::string("CORRUPT"));
}

// ═══════════════════════════════════════════════════════════════════════════
// MAIN
// ═══════════════════════════════════════════════════════════════════════════

int main() {
    printHeader("MemoryStore");

    std::cout << "\n>> Stockage\n";
    RUN_TEST(StorageThresholdBoundary);
    RUN_TEST(StoredMemoryCarriesSnapshot);

    std::cout << "\n>> Rappel\n";
    RUN_TEST(RecallFiltersAndSorts);
    RUN_TEST(RecallIncrementsCountOncePerCall);
    RUN_TEST(RecallWithNoMatch);
    RUN_TEST(RecallUsesConfiguredThreshold);

    std::cout << "\n>> Oubli et heritage\n";
    RUN_TEST(PruneRemovesBelowThreshold);
    RUN_TEST(SelectForInheritanceTakesFloor);
    RUN_TEST(SelectForInheritanceRejectsBadFraction);
    RUN_TEST(InheritScalesSignificance);
    RUN_TEST(InheritRejectsBadStrength);
    RUN_TEST(SignificantMemoriesLimit);

    std::cout << "\n>> Persistance\n";
    RUN_TEST(SaveLoadRoundTrip);
    RUN_TEST(LoadMissingFileCreatesSnapshot);
    RUN_TEST(LoadMalformedFileIsCorrupt);
    RUN_TEST(LoadMissingKeyIsCorrupt);
    RUN_TEST(LoadStatusNames);

    return printSummary();
}
