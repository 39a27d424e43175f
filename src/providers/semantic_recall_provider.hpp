#pragma once

#include "append_log.hpp"
#include "embedding_client.hpp"
#include "providers/context_provider.hpp"

namespace continuity {

struct SemanticRecallConfig {
  int default_limit = 5;
  double default_min_relevance = 0.6;
};

// "adaptive": ranks flushed embeddings by cosine similarity to the embedded
// query and returns the linked chunk text. An embedding links to a chunk via
// its chunk_id field, or carries its own content/text.
class SemanticRecallProvider : public IContextProvider {
 public:
  SemanticRecallProvider(AppendLog* log, IEmbeddingBackend* backend, SemanticRecallConfig cfg = {});

  std::string Name() const override;
  std::vector<ContextItem> Provide(const std::string& query, const ProviderOptions& options) override;

 private:
  AppendLog* log_;
  IEmbeddingBackend* backend_;
  SemanticRecallConfig cfg_;
};

}  // namespace continuity
