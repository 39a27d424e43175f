#include "embedding_client.hpp"

#include <httplib.h>
#include <nlohmann/json.hpp>

#include <cmath>
#include <memory>
#include <utility>

namespace continuity {
namespace {

static std::unique_ptr<httplib::Client> MakeClient(const EmbeddingConfig& cfg) {
  auto cli = std::make_unique<httplib::Client>(cfg.endpoint.host, cfg.endpoint.port);
  cli->set_connection_timeout(cfg.connect_timeout_seconds);
  cli->set_read_timeout(cfg.read_timeout_seconds);
  cli->set_write_timeout(cfg.read_timeout_seconds);
  return cli;
}

static std::string JoinPath(const std::string& base, const std::string& path) {
  if (base.empty()) return path;
  if (base.back() == '/' && !path.empty() && path.front() == '/') return base + path.substr(1);
  if (base.back() != '/' && !path.empty() && path.front() != '/') return base + "/" + path;
  return base + path;
}

static std::vector<double> NumbersOf(const nlohmann::json& arr) {
  std::vector<double> vec;
  vec.reserve(arr.size());
  for (const auto& v : arr) {
    if (v.is_number_float() || v.is_number_integer()) vec.push_back(v.get<double>());
  }
  return vec;
}

}  // namespace

HttpEmbeddingBackend::HttpEmbeddingBackend(EmbeddingConfig cfg) : cfg_(std::move(cfg)) {}

std::string HttpEmbeddingBackend::Name() const {
  return cfg_.api + ":" + cfg_.model;
}

std::optional<std::vector<double>> HttpEmbeddingBackend::Embed(const std::string& text, std::string* err) {
  if (cfg_.api == "openai") return EmbedOpenAi(text, err);
  return EmbedOllama(text, err);
}

std::optional<std::vector<double>> HttpEmbeddingBackend::EmbedOllama(const std::string& text, std::string* err) {
  auto cli = MakeClient(cfg_);
  nlohmann::json j;
  j["model"] = cfg_.model;
  j["prompt"] = text;
  auto res = cli->Post(JoinPath(cfg_.endpoint.base_path, "/api/embeddings"), j.dump(), "application/json");
  if (!res) {
    if (err) *err = "ollama: failed to connect";
    return std::nullopt;
  }
  if (res->status < 200 || res->status >= 300) {
    if (err) *err = "ollama: /api/embeddings http " + std::to_string(res->status);
    return std::nullopt;
  }
  auto jr = nlohmann::json::parse(res->body, nullptr, false);
  if (jr.is_discarded() || !jr.contains("embedding") || !jr["embedding"].is_array()) {
    if (err) *err = "ollama: invalid json from /api/embeddings";
    return std::nullopt;
  }
  return NumbersOf(jr["embedding"]);
}

std::optional<std::vector<double>> HttpEmbeddingBackend::EmbedOpenAi(const std::string& text, std::string* err) {
  auto cli = MakeClient(cfg_);
  nlohmann::json j;
  j["model"] = cfg_.model;
  j["input"] = text;
  auto res = cli->Post(JoinPath(cfg_.endpoint.base_path, "/v1/embeddings"), j.dump(), "application/json");
  if (!res) {
    if (err) *err = "openai: failed to connect";
    return std::nullopt;
  }
  if (res->status < 200 || res->status >= 300) {
    if (err) *err = "openai: /v1/embeddings http " + std::to_string(res->status);
    return std::nullopt;
  }
  auto jr = nlohmann::json::parse(res->body, nullptr, false);
  if (jr.is_discarded() || !jr.contains("data") || !jr["data"].is_array() || jr["data"].empty() ||
      !jr["data"][0].is_object() || !jr["data"][0].contains("embedding") || !jr["data"][0]["embedding"].is_array()) {
    if (err) *err = "openai: invalid json from /v1/embeddings";
    return std::nullopt;
  }
  return NumbersOf(jr["data"][0]["embedding"]);
}

double CosineSimilarity(const std::vector<double>& a, const std::vector<double>& b) {
  if (a.empty() || a.size() != b.size()) return 0.0;
  double dot = 0.0;
  double na = 0.0;
  double nb = 0.0;
  for (size_t i = 0; i < a.size(); i++) {
    dot += a[i] * b[i];
    na += a[i] * a[i];
    nb += b[i] * b[i];
  }
  if (na == 0.0 || nb == 0.0) return 0.0;
  return dot / (std::sqrt(na) * std::sqrt(nb));
}

}  // namespace continuity
