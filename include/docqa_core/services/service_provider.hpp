#pragma once

#include <memory>

namespace docqa_core {
class VectorIndex;
class Embedder;
class Generator;
class DocumentProcessor;
}

namespace docqa_core {

// Live component handles, built once at startup and handed to the services.
class ServiceProvider {
 public:
  ServiceProvider(std::shared_ptr<VectorIndex> index,
                  std::shared_ptr<Embedder> embedder,
                  std::shared_ptr<Generator> generator,
                  std::shared_ptr<DocumentProcessor> processor);

  // Public getters for each service
  VectorIndex &get_vector_index() {
    return *index_;
  }
  Embedder &get_embedder() {
    return *embedder_;
  }
  Generator &get_generator() {
    return *generator_;
  }
  DocumentProcessor &get_document_processor() {
    return *processor_;
  }

 private:
  std::shared_ptr<VectorIndex> index_;
  std::shared_ptr<Embedder> embedder_;
  std::shared_ptr<Generator> generator_;
  std::shared_ptr<DocumentProcessor> processor_;
};

}  // namespace docqa_core
