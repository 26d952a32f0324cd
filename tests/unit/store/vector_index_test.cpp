#include <gtest/gtest.h>

#include <faiss/IndexFlat.h>
#include <faiss/index_io.h>

#include <fstream>

#include "docqa_core/store/vector_index.hpp"
#include "../../common/utilities_test.hpp"

namespace docqa_tests {

using namespace docqa_core;

class VectorIndexTest : public TempDirTestBase {
 protected:
  static constexpr std::size_t kDim = 4;

  void SetUp() override {
    TempDirTestBase::SetUp();
    index_path_ = temp_dir_ / "store" / "vector_store.faiss";
  }

  static RecordMetadata metadata_for(const std::string& text, const std::string& document) {
    Chunk chunk(text);
    chunk.assign_document(document);
    return chunk.metadata();
  }

  // Three records at one-hot positions 0, 1 and 2
  void populate(VectorIndex& index) {
    index.add_embeddings(
        {"alpha", "bravo", "charlie"},
        {TestUtilities::create_one_hot_vector(0, kDim), TestUtilities::create_one_hot_vector(1, kDim),
         TestUtilities::create_one_hot_vector(2, kDim)},
        {metadata_for("alpha", "/docs/a.txt"), metadata_for("bravo", "/docs/b.txt"),
         metadata_for("charlie", "/docs/c.md")});
  }

  std::filesystem::path index_path_;
};

TEST_F(VectorIndexTest, RejectsZeroDimension) {
  EXPECT_THROW(VectorIndex(0, index_path_), VectorIndexError);
}

TEST_F(VectorIndexTest, StartsEmptyWhenNothingPersisted) {
  VectorIndex index(kDim, index_path_);

  EXPECT_EQ(index.size(), 0u);
  EXPECT_EQ(index.dimension(), kDim);
  EXPECT_TRUE(index.similarity_search(TestUtilities::create_one_hot_vector(0, kDim), 3).empty());
}

TEST_F(VectorIndexTest, AddEmbeddingsAssignsConsecutivePositions) {
  VectorIndex index(kDim, index_path_);

  RecordRange first = index.add_embeddings({"a", "b"},
                                           {TestUtilities::create_test_vector("a", kDim),
                                            TestUtilities::create_test_vector("b", kDim)},
                                           {metadata_for("a", "/a.txt"), metadata_for("b", "/a.txt")});
  RecordRange second = index.add_embeddings({"c"}, {TestUtilities::create_test_vector("c", kDim)},
                                            {metadata_for("c", "/c.txt")});

  EXPECT_EQ(first.first, 0u);
  EXPECT_EQ(first.count, 2u);
  EXPECT_EQ(second.first, 2u);
  EXPECT_EQ(second.count, 1u);
  EXPECT_EQ(index.size(), 3u);
  EXPECT_EQ(index.get_document(2)->index, 2u);
  EXPECT_EQ(index.get_document(2)->text, "c");
}

TEST_F(VectorIndexTest, EmptyBatchIsNoOp) {
  VectorIndex index(kDim, index_path_);

  RecordRange range = index.add_embeddings({}, {}, {});

  EXPECT_TRUE(range.empty());
  EXPECT_EQ(index.size(), 0u);
}

TEST_F(VectorIndexTest, SearchReturnsNearestFirstWithScores) {
  VectorIndex index(kDim, index_path_);
  populate(index);

  std::vector<float> query = {0.9f, 0.1f, 0.0f, 0.0f};
  auto results = index.similarity_search(query, 2);

  ASSERT_EQ(results.size(), 2u);
  EXPECT_EQ(results[0].text, "alpha");
  EXPECT_EQ(results[0].metadata.document.document_name, "a.txt");
  EXPECT_EQ(results[1].text, "bravo");
  EXPECT_NEAR(results[0].score, 0.02f, 1e-5);
  EXPECT_NEAR(results[1].score, 1.62f, 1e-5);
}

TEST_F(VectorIndexTest, SearchResultsSortedAndBoundedByK) {
  VectorIndex index(kDim, index_path_);
  populate(index);

  auto results = index.similarity_search(TestUtilities::create_test_vector("query", kDim), 10);

  ASSERT_EQ(results.size(), 3u);
  for (size_t i = 1; i < results.size(); ++i) {
    EXPECT_LE(results[i - 1].score, results[i].score);
  }
  EXPECT_TRUE(index.similarity_search(TestUtilities::create_test_vector("query", kDim), 0).empty());
}

TEST_F(VectorIndexTest, QueryOfWrongDimensionThrows) {
  VectorIndex index(kDim, index_path_);
  populate(index);

  EXPECT_THROW(index.similarity_search(std::vector<float>(kDim + 1, 0.0f), 1), DimensionMismatchError);
}

TEST_F(VectorIndexTest, DimensionMismatchLeavesIndexUnchanged) {
  VectorIndex index(kDim, index_path_);
  populate(index);

  try {
    index.add_embeddings({"ok", "bad"},
                         {TestUtilities::create_one_hot_vector(3, kDim), std::vector<float>(kDim - 1, 1.0f)},
                         {metadata_for("ok", "/d.txt"), metadata_for("bad", "/d.txt")});
    FAIL() << "Expected DimensionMismatchError";
  } catch (const DimensionMismatchError& e) {
    EXPECT_EQ(e.expected(), kDim);
    EXPECT_EQ(e.actual(), kDim - 1);
  }

  EXPECT_EQ(index.size(), 3u);
  auto results = index.similarity_search(TestUtilities::create_one_hot_vector(3, kDim), 10);
  EXPECT_EQ(results.size(), 3u);
}

TEST_F(VectorIndexTest, MismatchedSequenceLengthsThrow) {
  VectorIndex index(kDim, index_path_);

  EXPECT_THROW(index.add_embeddings({"a", "b"}, {TestUtilities::create_test_vector("a", kDim)},
                                    {metadata_for("a", "/a.txt"), metadata_for("b", "/a.txt")}),
               std::invalid_argument);
  EXPECT_EQ(index.size(), 0u);
}

TEST_F(VectorIndexTest, AddChunksCopiesChunkMetadata) {
  VectorIndex index(kDim, index_path_);
  Chunk chunk("chunk body");
  chunk.assign_document("/docs/guide.md");

  index.add_chunks({chunk}, {TestUtilities::create_test_vector("chunk", kDim)});

  auto record = index.get_document(0);
  ASSERT_TRUE(record.has_value());
  EXPECT_EQ(record->text, "chunk body");
  EXPECT_EQ(record->metadata, chunk.metadata());
}

TEST_F(VectorIndexTest, DocumentAccessorsReturnAbsenceForOutOfRange) {
  VectorIndex index(kDim, index_path_);
  populate(index);

  EXPECT_FALSE(index.get_document(3).has_value());
  auto documents = index.get_documents({2, 7, 0});
  ASSERT_EQ(documents.size(), 3u);
  EXPECT_EQ(documents[0]->text, "charlie");
  EXPECT_FALSE(documents[1].has_value());
  EXPECT_EQ(documents[2]->text, "alpha");
  EXPECT_EQ(index.get_all_documents().size(), 3u);
}

TEST_F(VectorIndexTest, SaveThenReloadRoundTrips) {
  std::vector<float> query = TestUtilities::create_test_vector("round trip", kDim);
  std::vector<VectorRecord> saved_records;
  std::vector<QueryResult> saved_results;
  {
    VectorIndex index(kDim, index_path_);
    populate(index);
    index.save();
    saved_records = index.get_all_documents();
    saved_results = index.similarity_search(query, 3);
  }

  ASSERT_TRUE(std::filesystem::exists(index_path_));
  VectorIndex reloaded(kDim, index_path_);
  ASSERT_TRUE(std::filesystem::exists(reloaded.metadata_path()));

  EXPECT_EQ(reloaded.size(), 3u);
  EXPECT_EQ(reloaded.get_all_documents(), saved_records);
  auto results = reloaded.similarity_search(query, 3);
  ASSERT_EQ(results.size(), saved_results.size());
  for (size_t i = 0; i < results.size(); ++i) {
    EXPECT_EQ(results[i].index, saved_results[i].index);
    EXPECT_FLOAT_EQ(results[i].score, saved_results[i].score);
  }
}

TEST_F(VectorIndexTest, CorruptMetadataResetsToEmpty) {
  {
    VectorIndex index(kDim, index_path_);
    populate(index);
    index.save();
  }
  {
    std::ofstream out(index_path_.string() + ".json", std::ios::trunc);
    out << "{ not json";
  }

  VectorIndex reloaded(kDim, index_path_);

  EXPECT_EQ(reloaded.size(), 0u);
  EXPECT_TRUE(reloaded.similarity_search(TestUtilities::create_one_hot_vector(0, kDim), 3).empty());
}

TEST_F(VectorIndexTest, MissingMetadataResetsToEmpty) {
  {
    VectorIndex index(kDim, index_path_);
    populate(index);
    index.save();
  }
  std::filesystem::remove(index_path_.string() + ".json");

  VectorIndex reloaded(kDim, index_path_);

  EXPECT_EQ(reloaded.size(), 0u);
}

TEST_F(VectorIndexTest, MetadataCountMismatchResetsToEmpty) {
  {
    VectorIndex index(kDim, index_path_);
    populate(index);
    index.save();
  }
  {
    std::ofstream out(index_path_.string() + ".json", std::ios::trunc);
    out << R"([{"text": "only one", "index": 0}])";
  }

  VectorIndex reloaded(kDim, index_path_);

  EXPECT_EQ(reloaded.size(), 0u);
}

TEST_F(VectorIndexTest, PersistedDimensionMismatchResetsToEmpty) {
  {
    VectorIndex index(kDim, index_path_);
    populate(index);
    index.save();
  }

  VectorIndex reloaded(kDim * 2, index_path_);

  EXPECT_EQ(reloaded.size(), 0u);
  EXPECT_EQ(reloaded.dimension(), kDim * 2);
}

TEST_F(VectorIndexTest, PersistedInnerProductIndexResetsToEmpty) {
  {
    VectorIndex index(kDim, index_path_);
    populate(index);
    index.save();
  }
  // Same dimension and count as the metadata, but the wrong metric.
  faiss::IndexFlatIP inner_product(kDim);
  std::vector<float> vectors;
  for (std::size_t i = 0; i < 3; ++i) {
    auto one_hot = TestUtilities::create_one_hot_vector(i, kDim);
    vectors.insert(vectors.end(), one_hot.begin(), one_hot.end());
  }
  inner_product.add(3, vectors.data());
  faiss::write_index(&inner_product, index_path_.c_str());

  VectorIndex reloaded(kDim, index_path_);

  EXPECT_EQ(reloaded.size(), 0u);
}

TEST_F(VectorIndexTest, ClearEmptiesIndexAndSearch) {
  VectorIndex index(kDim, index_path_);
  populate(index);

  index.clear();

  EXPECT_EQ(index.size(), 0u);
  EXPECT_TRUE(index.similarity_search(TestUtilities::create_one_hot_vector(1, kDim), 5).empty());
  EXPECT_FALSE(index.get_document(0).has_value());
}

TEST_F(VectorIndexTest, ClearIsDurableOnlyAfterSave) {
  {
    VectorIndex index(kDim, index_path_);
    populate(index);
    index.save();
    index.clear();
  }
  {
    VectorIndex reloaded(kDim, index_path_);
    EXPECT_EQ(reloaded.size(), 3u);
    reloaded.clear();
    reloaded.save();
  }

  VectorIndex emptied(kDim, index_path_);
  EXPECT_EQ(emptied.size(), 0u);
}

TEST_F(VectorIndexTest, LoadsRecordsWithoutProvenanceFields) {
  {
    VectorIndex index(kDim, index_path_);
    populate(index);
    index.save();
  }
  {
    std::ofstream out(index_path_.string() + ".json", std::ios::trunc);
    out << R"([{"text": "a", "index": 0}, {"text": "b", "index": 1}, {"text": "c", "index": 2}])";
  }

  VectorIndex reloaded(kDim, index_path_);

  ASSERT_EQ(reloaded.size(), 3u);
  EXPECT_EQ(reloaded.get_document(1)->text, "b");
  EXPECT_TRUE(reloaded.get_document(1)->metadata.document.document_name.empty());
}

}  // namespace docqa_tests
