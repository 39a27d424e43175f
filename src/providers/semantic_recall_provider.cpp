#include "providers/semantic_recall_provider.hpp"

#include "errors.hpp"

#include <algorithm>
#include <initializer_list>
#include <iostream>
#include <unordered_map>

namespace continuity {
namespace {

struct Scored {
  double relevance = 0.0;
  const nlohmann::json* embedding = nullptr;
  const nlohmann::json* chunk = nullptr;
};

static std::string StringField(const nlohmann::json* j, std::initializer_list<const char*> keys) {
  if (!j || !j->is_object()) return "";
  for (const char* k : keys) {
    auto it = j->find(k);
    if (it != j->end() && it->is_string() && !it->get<std::string>().empty()) return it->get<std::string>();
  }
  return "";
}

static std::vector<double> VectorOf(const nlohmann::json& j) {
  std::vector<double> v;
  auto it = j.find("vector");
  if (it == j.end() || !it->is_array()) return v;
  v.reserve(it->size());
  for (const auto& x : *it) {
    if (!x.is_number()) return {};
    v.push_back(x.get<double>());
  }
  return v;
}

}  // namespace

SemanticRecallProvider::SemanticRecallProvider(AppendLog* log, IEmbeddingBackend* backend, SemanticRecallConfig cfg)
    : log_(log), backend_(backend), cfg_(cfg) {
  if (!log_) throw ConfigurationError("SemanticRecallProvider requires an AppendLog");
  if (!backend_) throw ConfigurationError("SemanticRecallProvider requires an embedding backend");
}

std::string SemanticRecallProvider::Name() const {
  return "adaptive";
}

std::vector<ContextItem> SemanticRecallProvider::Provide(const std::string& query, const ProviderOptions& options) {
  if (query.empty()) return {};
  const int limit = options.limit.value_or(cfg_.default_limit);
  const double min_relevance = options.min_relevance.value_or(cfg_.default_min_relevance);
  if (limit <= 0) return {};

  std::string err;
  auto q = backend_->Embed(query, &err);
  if (!q || q->empty()) {
    std::cout << "[provider.adaptive] warn embedding unavailable error=" << err << "\n";
    return {};
  }

  std::string read_err;
  const auto embeddings = log_->ReadEmbeddings(&read_err);
  if (!read_err.empty()) std::cout << "[provider.adaptive] warn reading embeddings error=" << read_err << "\n";
  if (embeddings.empty()) return {};
  const auto chunks = log_->ReadChunks(&read_err);

  std::unordered_map<std::string, const nlohmann::json*> by_chunk_id;
  for (const auto& c : chunks) {
    auto id = StringField(&c, {"chunk_id"});
    if (!id.empty()) by_chunk_id[id] = &c;
  }

  std::vector<Scored> scored;
  for (const auto& e : embeddings) {
    const auto v = VectorOf(e);
    if (v.size() != q->size()) continue;
    Scored s;
    s.relevance = CosineSimilarity(*q, v);
    if (s.relevance < min_relevance) continue;
    s.embedding = &e;
    auto link = by_chunk_id.find(StringField(&e, {"chunk_id"}));
    if (link != by_chunk_id.end()) s.chunk = link->second;
    if (StringField(s.chunk, {"content", "text"}).empty() && StringField(&e, {"content", "text"}).empty()) continue;
    scored.push_back(s);
  }
  std::stable_sort(scored.begin(), scored.end(),
                   [](const Scored& a, const Scored& b) { return a.relevance > b.relevance; });
  if (scored.size() > static_cast<size_t>(limit)) scored.resize(static_cast<size_t>(limit));

  std::vector<ContextItem> out;
  out.reserve(scored.size());
  for (const auto& s : scored) {
    ContextItem item;
    item.type = "adaptive";
    auto id = StringField(s.chunk, {"chunk_id"});
    if (id.empty()) id = StringField(s.embedding, {"id"});
    item.id = "adaptive-" + id;
    item.title = StringField(s.chunk, {"title", "file", "path"});
    if (item.title.empty()) item.title = StringField(s.embedding, {"title", "file", "path"});
    if (item.title.empty()) item.title = "Recalled Context";
    item.content = StringField(s.chunk, {"content", "text"});
    if (item.content.empty()) item.content = StringField(s.embedding, {"content", "text"});
    item.priority = std::clamp(s.relevance, 0.0, 1.0);
    out.push_back(std::move(item));
  }
  std::cout << "[provider.adaptive] candidates=" << embeddings.size() << " selected=" << out.size() << "\n";
  return out;
}

}  // namespace continuity
