#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <memory>

#include "docqa_core/chunking/chunking_strategy.hpp"
#include "docqa_core/documents/document_processor.hpp"
#include "docqa_core/services/service_provider.hpp"
#include "docqa_core/store/vector_index.hpp"
#include "../../common/mocks_test.hpp"
#include "../../common/utilities_test.hpp"

namespace docqa_tests {

using namespace docqa_core;
using ::testing::StrictMock;

class ServiceProviderTest : public TempDirTestBase {
 protected:
  void SetUp() override {
    TempDirTestBase::SetUp();

    index_ = std::make_shared<VectorIndex>(8, temp_dir_ / "index.faiss");
    mock_embedder_ = std::make_shared<StrictMock<MockEmbedder>>();
    mock_generator_ = std::make_shared<StrictMock<MockGenerator>>();
    processor_ = std::make_shared<DocumentProcessor>(
        make_chunking_strategy(kSentenceStrategy, 200, 20));
  }

  std::shared_ptr<VectorIndex> index_;
  std::shared_ptr<StrictMock<MockEmbedder>> mock_embedder_;
  std::shared_ptr<StrictMock<MockGenerator>> mock_generator_;
  std::shared_ptr<DocumentProcessor> processor_;
};

TEST_F(ServiceProviderTest, GettersReturnTheHeldComponents) {
  ServiceProvider provider(index_, mock_embedder_, mock_generator_, processor_);

  EXPECT_EQ(&provider.get_vector_index(), index_.get());
  EXPECT_EQ(&provider.get_embedder(), mock_embedder_.get());
  EXPECT_EQ(&provider.get_generator(), mock_generator_.get());
  EXPECT_EQ(&provider.get_document_processor(), processor_.get());
}

TEST_F(ServiceProviderTest, SharesOwnershipOfComponents) {
  std::weak_ptr<VectorIndex> weak_index = index_;
  auto provider = std::make_unique<ServiceProvider>(index_, mock_embedder_, mock_generator_, processor_);

  index_.reset();
  EXPECT_FALSE(weak_index.expired());
  EXPECT_EQ(provider->get_vector_index().dimension(), 8u);

  provider.reset();
  EXPECT_TRUE(weak_index.expired());
}

TEST_F(ServiceProviderTest, RejectsMissingComponents) {
  EXPECT_THROW(ServiceProvider(nullptr, mock_embedder_, mock_generator_, processor_),
               std::invalid_argument);
  EXPECT_THROW(ServiceProvider(index_, nullptr, mock_generator_, processor_), std::invalid_argument);
  EXPECT_THROW(ServiceProvider(index_, mock_embedder_, nullptr, processor_), std::invalid_argument);
  EXPECT_THROW(ServiceProvider(index_, mock_embedder_, mock_generator_, nullptr),
               std::invalid_argument);
}

}  // namespace docqa_tests
