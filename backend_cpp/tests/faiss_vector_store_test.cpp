#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include "faiss_vector_store.hpp"
#include "test_doubles.hpp"

using concierge::FaissVectorStore;
using concierge::fakes::make_amenity;
namespace fs = std::filesystem;

class FaissVectorStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        store_.add_records({
            make_amenity(1, "Coffee Bar", {1.0f, 0.0f, 0.0f}),
            make_amenity(2, "Espresso Cart", {0.9f, 0.1f, 0.0f}),
            make_amenity(3, "Tea House", {0.8f, 0.6f, 0.0f}),
            make_amenity(4, "Duty Free", {0.0f, 1.0f, 0.0f}),
        });
    }

    FaissVectorStore store_{3};
};

TEST_F(FaissVectorStoreTest, ReturnsOnlyMatchesAboveThresholdMostSimilarFirst) {
    auto results = store_.semantic_similarity_search({2.0f, 0.0f, 0.0f}, 0.7f, 10);

    ASSERT_EQ(results.size(), 3u);
    EXPECT_EQ(results[0].record.name, "Coffee Bar");
    EXPECT_EQ(results[1].record.name, "Espresso Cart");
    EXPECT_EQ(results[2].record.name, "Tea House");
    EXPECT_NEAR(results[0].similarity, 1.0f, 1e-4);
    EXPECT_NEAR(results[2].similarity, 0.8f, 1e-4);
    for (size_t i = 1; i < results.size(); ++i) {
        EXPECT_GE(results[i - 1].similarity, results[i].similarity);
        EXPECT_GE(results[i].similarity, 0.7f);
    }
}

TEST_F(FaissVectorStoreTest, LimitCapsTheResultCount) {
    auto results = store_.semantic_similarity_search({1.0f, 0.0f, 0.0f}, 0.7f, 1);
    ASSERT_EQ(results.size(), 1u);
    EXPECT_EQ(results[0].record.id, 1);
}

TEST_F(FaissVectorStoreTest, NothingCloseEnoughGivesEmptyResult) {
    EXPECT_TRUE(store_.semantic_similarity_search({0.0f, 0.0f, 1.0f}, 0.7f, 5).empty());
}

TEST_F(FaissVectorStoreTest, WrongQueryDimensionThrows) {
    EXPECT_THROW(store_.semantic_similarity_search({1.0f, 0.0f}, 0.7f, 5), std::invalid_argument);
}

TEST_F(FaissVectorStoreTest, RecordsWithWrongDimensionAreSkipped) {
    store_.add_records({make_amenity(9, "Broken", {1.0f}), make_amenity(10, "Unembedded")});
    EXPECT_EQ(store_.size(), 4u);
}

TEST(FaissVectorStore, RejectsNonPositiveDimension) {
    EXPECT_THROW(FaissVectorStore(0), std::invalid_argument);
}

TEST_F(FaissVectorStoreTest, SaveThenLoadKeepsRecordsAndScores) {
    fs::path dir = fs::temp_directory_path() / "concierge_store_roundtrip";
    fs::remove_all(dir);
    store_.save(dir.string());
    ASSERT_TRUE(fs::exists(dir / "faiss.index"));
    ASSERT_TRUE(fs::exists(dir / "metadata.json"));

    FaissVectorStore reloaded(3);
    reloaded.load(dir.string());
    EXPECT_EQ(reloaded.size(), 4u);

    auto results = reloaded.semantic_similarity_search({1.0f, 0.0f, 0.0f}, 0.7f, 2);
    ASSERT_EQ(results.size(), 2u);
    EXPECT_EQ(results[0].record.name, "Coffee Bar");
    EXPECT_EQ(results[1].record.name, "Espresso Cart");
    EXPECT_EQ(results[1].record.embedding, std::vector<float>({0.9f, 0.1f, 0.0f}));
    fs::remove_all(dir);
}

TEST(FaissVectorStore, LoadsDatasetWithMixedEmbeddingForms) {
    fs::path path = fs::temp_directory_path() / "concierge_amenities.json";
    {
        std::ofstream out(path);
        out << R"({"amenities": [
            {"id": 1, "name": "Gate Cafe", "embedding": [1.0, 0.0]},
            {"id": 2, "name": "Book Shop", "embedding": "[0.0, 1.0]"}
        ]})";
    }

    FaissVectorStore store(2);
    EXPECT_EQ(store.load_dataset(path.string()), 2u);

    auto results = store.semantic_similarity_search({0.0f, 1.0f}, 0.7f, 5);
    ASSERT_EQ(results.size(), 1u);
    EXPECT_EQ(results[0].record.name, "Book Shop");
    fs::remove(path);
}

TEST(FaissVectorStore, MissingDatasetThrows) {
    FaissVectorStore store(2);
    EXPECT_THROW(store.load_dataset("/nonexistent/amenities.json"), std::runtime_error);
}
