#include "docqa_core/types/vector_record.hpp"

namespace docqa_core {

void to_json(nlohmann::json &j, const VectorRecord &record) {
  j = nlohmann::json{{"text", record.text},
                     {"chunk_id", record.metadata.chunk_id},
                     {"length", record.metadata.length},
                     {"document_id", record.metadata.document.document_id},
                     {"document_path", record.metadata.document.document_path},
                     {"document_name", record.metadata.document.document_name},
                     {"index", record.index}};
}

void from_json(const nlohmann::json &j, VectorRecord &record) {
  j.at("text").get_to(record.text);
  j.at("index").get_to(record.index);
  // Provenance fields are optional so records written without a source file still load.
  record.metadata.chunk_id = j.value("chunk_id", std::string());
  record.metadata.length = j.value("length", static_cast<std::size_t>(0));
  record.metadata.document.document_id = j.value("document_id", std::string());
  record.metadata.document.document_path = j.value("document_path", std::string());
  record.metadata.document.document_name = j.value("document_name", std::string());
}

}  // namespace docqa_core
