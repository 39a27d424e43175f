#pragma once

#include "config.hpp"

#include <optional>
#include <string>
#include <vector>

namespace continuity {

// embed(text) -> vector. Implementations never throw; a failed call returns
// std::nullopt with *err set.
class IEmbeddingBackend {
 public:
  virtual ~IEmbeddingBackend() = default;
  virtual std::string Name() const = 0;
  virtual std::optional<std::vector<double>> Embed(const std::string& text, std::string* err) = 0;
};

// Talks to an Ollama (/api/embeddings) or OpenAI-compatible (/v1/embeddings)
// endpoint, one request per call, no retry.
class HttpEmbeddingBackend : public IEmbeddingBackend {
 public:
  explicit HttpEmbeddingBackend(EmbeddingConfig cfg);

  std::string Name() const override;
  std::optional<std::vector<double>> Embed(const std::string& text, std::string* err) override;

 private:
  std::optional<std::vector<double>> EmbedOllama(const std::string& text, std::string* err);
  std::optional<std::vector<double>> EmbedOpenAi(const std::string& text, std::string* err);

  EmbeddingConfig cfg_;
};

double CosineSimilarity(const std::vector<double>& a, const std::vector<double>& b);

}  // namespace continuity
