#include "docqa_core/services/service_provider.hpp"

#include <stdexcept>

#include "docqa_core/documents/document_processor.hpp"
#include "docqa_core/llm/embedder.hpp"
#include "docqa_core/llm/generator.hpp"
#include "docqa_core/store/vector_index.hpp"

namespace docqa_core {

ServiceProvider::ServiceProvider(std::shared_ptr<VectorIndex> index,
                                 std::shared_ptr<Embedder> embedder,
                                 std::shared_ptr<Generator> generator,
                                 std::shared_ptr<DocumentProcessor> processor)
    : index_(std::move(index)),
      embedder_(std::move(embedder)),
      generator_(std::move(generator)),
      processor_(std::move(processor)) {
  if (!index_ || !embedder_ || !generator_ || !processor_) {
    throw std::invalid_argument("ServiceProvider requires every component to be set");
  }
}

}  // namespace docqa_core
