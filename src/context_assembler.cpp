#include "context_assembler.hpp"

#include "errors.hpp"
#include "file_util.hpp"

#include <algorithm>
#include <filesystem>
#include <iostream>
#include <system_error>
#include <utility>

namespace continuity {
namespace {

static void Boost(std::vector<ContextItem>* items, double delta) {
  for (auto& item : *items) item.priority = std::min(item.priority.value_or(0.0) + delta, 1.0);
}

static void Append(std::vector<ContextItem>* out, std::vector<ContextItem> items) {
  for (auto& item : items) out->push_back(std::move(item));
}

static void AppendFirst(std::vector<ContextItem>* out, std::vector<ContextItem> items) {
  if (!items.empty()) out->push_back(std::move(items.front()));
}

static void SortByPriority(std::vector<ContextItem>* items) {
  std::stable_sort(items->begin(), items->end(), [](const ContextItem& a, const ContextItem& b) {
    return a.priority.value_or(0.0) > b.priority.value_or(0.0);
  });
}

}  // namespace

const char* ToString(Strategy strategy) {
  switch (strategy) {
    case Strategy::kStandard:
      return "standard";
    case Strategy::kMinimal:
      return "minimal";
    case Strategy::kBoundary:
      return "boundary";
    case Strategy::kComprehensive:
      return "comprehensive";
    case Strategy::kVisionFocused:
      return "vision-focused";
    case Strategy::kMetacognitiveFocused:
      return "metacognitive-focused";
    case Strategy::kDevelopmentFlow:
      return "development-flow";
  }
  return "standard";
}

const std::vector<Strategy>& AllStrategies() {
  static const std::vector<Strategy> all = {
      Strategy::kStandard,      Strategy::kMinimal,       Strategy::kBoundary,
      Strategy::kComprehensive, Strategy::kVisionFocused, Strategy::kMetacognitiveFocused,
      Strategy::kDevelopmentFlow,
  };
  return all;
}

std::optional<Strategy> StrategyFromString(const std::string& name) {
  for (auto s : AllStrategies()) {
    if (name == ToString(s)) return s;
  }
  return std::nullopt;
}

nlohmann::json ToJson(const GeneratedContext& g) {
  nlohmann::json j;
  j["success"] = g.success;
  j["timestamp"] = g.timestamp_ms;
  j["query"] = g.query;
  j["strategy"] = ToString(g.strategy);
  j["fromCache"] = g.from_cache;
  j["fallback"] = g.fallback;
  j["contextItems"] = nlohmann::json::array();
  for (const auto& item : g.items) j["contextItems"].push_back(ToJson(item));
  if (!g.error.empty()) j["error"] = g.error;
  return j;
}

nlohmann::json ToJson(const InjectionResult& r) {
  nlohmann::json j;
  j["success"] = r.success;
  j["timestamp"] = r.timestamp_ms;
  j["query"] = r.query;
  j["sessionId"] = r.session_id;
  if (r.boundary_info) j["boundaryInfo"] = *r.boundary_info;
  j["strategy"] = ToString(r.strategy);
  j["format"] = ToString(r.format);
  j["contextCount"] = r.context_count;
  j["formattedContext"] = r.formatted_context;
  if (!r.error.empty()) j["error"] = r.error;
  return j;
}

ContextAssembler::ContextAssembler(AssemblerConfig cfg,
                                   SessionDataStore* store,
                                   IEmbeddingBackend* backend,
                                   const Clock* clock)
    : cfg_(std::move(cfg)),
      store_(store),
      backend_(backend),
      clock_(clock ? clock : DefaultClock()),
      init_("context-assembler"),
      cache_(cfg_.cache_ttl_ms, clock_) {
  if (!store_) throw ConfigurationError("ContextAssembler requires a SessionDataStore");
  auto s = StrategyFromString(cfg_.default_strategy);
  if (!s) {
    std::cout << "[context-assembler] warn unknown default strategy=" << cfg_.default_strategy << " using standard\n";
    s = Strategy::kStandard;
  }
  default_strategy_ = *s;
  render_.validation_enabled = cfg_.validation_enabled;
  render_.compression_enabled = cfg_.compression_enabled;
  render_.compression_threshold = cfg_.compression_threshold;
}

InitResult ContextAssembler::Initialize() {
  return init_.Run([this](std::string* err) {
    if (!cfg_.context_dir.empty() && !EnsureDirectory(cfg_.context_dir, err)) return false;
    std::cout << "[context-assembler] providers=" << registry_.size() << " default_strategy=" << ToString(default_strategy_)
              << " cache=" << (cfg_.cache_enabled ? 1 : 0) << " ttl_ms=" << cfg_.cache_ttl_ms << "\n";
    return true;
  });
}

bool ContextAssembler::EnsureInitialized() {
  if (init_.initialized()) return true;
  return Initialize().success;
}

void ContextAssembler::RegisterProvider(std::unique_ptr<IContextProvider> provider) {
  if (!provider) return;
  std::cout << "[context-assembler] registered provider=" << provider->Name() << "\n";
  registry_.Register(std::move(provider));
}

std::string ContextAssembler::CacheKey(Strategy strategy, const std::string& query, const ProviderOptions& options) {
  nlohmann::json k = nlohmann::json::object();
  if (options.limit) k["limit"] = *options.limit;
  if (options.min_relevance) k["minRelevance"] = *options.min_relevance;
  if (options.boundary_info && options.boundary_info->is_object() && options.boundary_info->contains("id")) {
    k["boundaryId"] = (*options.boundary_info)["id"];
  }
  if (!options.session_id.empty()) k["sessionId"] = options.session_id;
  return std::string(ToString(strategy)) + ":" + query + ":" + k.dump();
}

Strategy ContextAssembler::ResolveStrategy(const std::string& name) const {
  if (name.empty()) return default_strategy_;
  auto s = StrategyFromString(name);
  if (!s) {
    std::cout << "[context-assembler] warn unknown strategy=" << name << " using " << ToString(default_strategy_) << "\n";
    return default_strategy_;
  }
  return *s;
}

std::vector<ContextItem> ContextAssembler::Collect(const std::string& provider,
                                                   const std::string& query,
                                                   const ProviderOptions& options) {
  auto* p = registry_.Get(provider);
  if (!p) return {};
  try {
    return p->Provide(query, options);
  } catch (const InvariantViolation&) {
    throw;
  } catch (const std::exception& e) {
    std::cout << "[context-assembler] error provider=" << provider << " error=" << e.what() << "\n";
    return {};
  } catch (...) {
    std::cout << "[context-assembler] error provider=" << provider << " error=non-standard exception\n";
    return {};
  }
}

std::vector<ContextItem> ContextAssembler::RunStrategy(Strategy strategy,
                                                       const std::string& query,
                                                       const ProviderOptions& options) {
  std::vector<ContextItem> items;
  switch (strategy) {
    case Strategy::kStandard:
      Append(&items, Collect("drift_awareness", query, options));
      Append(&items, Collect("vision", query, options));
      Append(&items, Collect("metacognitive", query, options));
      Append(&items, Collect("recent_changes", query, options));
      Append(&items, Collect("session", query, options));
      Append(&items, Collect("adaptive", query, options));
      break;
    case Strategy::kMinimal: {
      AppendFirst(&items, Collect("vision", query, options));
      AppendFirst(&items, Collect("session", query, options));
      auto adaptive = options;
      adaptive.limit = 2;
      adaptive.min_relevance = 0.8;
      Append(&items, Collect("adaptive", query, adaptive));
      break;
    }
    case Strategy::kBoundary: {
      if (options.boundary_info) {
        const auto& info = *options.boundary_info;
        ContextItem b;
        b.type = "boundary";
        if (info.is_object() && info.contains("id") && info["id"].is_string()) {
          b.id = "boundary-" + info["id"].get<std::string>();
        } else {
          b.id = "boundary-" + std::to_string(clock_->WallMs());
        }
        b.title = "Token Boundary";
        b.content = "Crossing token boundary: " + info.dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
        b.priority = 0.95;
        items.push_back(std::move(b));
      }
      Append(&items, Collect("vision", query, options));
      Append(&items, Collect("session", query, options));
      Append(&items, Collect("metacognitive", query, options));
      auto adaptive = options;
      adaptive.limit = 5;
      adaptive.min_relevance = 0.75;
      Append(&items, Collect("adaptive", query, adaptive));
      break;
    }
    case Strategy::kComprehensive:
      for (auto* p : registry_.List()) Append(&items, Collect(p->Name(), query, options));
      break;
    case Strategy::kVisionFocused: {
      auto vision = Collect("vision", query, options);
      Boost(&vision, 0.2);
      Append(&items, std::move(vision));
      auto adaptive = options;
      adaptive.limit = 3;
      Append(&items, Collect("adaptive", query, adaptive));
      break;
    }
    case Strategy::kMetacognitiveFocused: {
      auto meta = Collect("metacognitive", query, options);
      Boost(&meta, 0.2);
      Append(&items, std::move(meta));
      AppendFirst(&items, Collect("vision", query, options));
      auto adaptive = options;
      adaptive.limit = 3;
      Append(&items, Collect("adaptive", query, adaptive));
      break;
    }
    case Strategy::kDevelopmentFlow: {
      Append(&items, Collect("drift_awareness", query, options));
      auto changes = Collect("recent_changes", query, options);
      Boost(&changes, 0.1);
      Append(&items, std::move(changes));

      auto principles = options;
      principles.limit = 2;
      auto vision = Collect("vision", query, principles);
      if (!vision.empty()) {
        ContextItem guidance = std::move(vision.front());
        guidance.type = "vision_guidance";
        guidance.id = "drift_prevention_guidance";
        guidance.priority = 0.9;
        items.push_back(std::move(guidance));
      }
      auto insights = Collect("metacognitive", query, principles);
      if (!insights.empty()) {
        ContextItem code;
        code.type = "code_insights";
        code.id = "code_pattern_insights";
        code.title = "Code Pattern Insights";
        for (size_t i = 0; i < insights.size() && i < 2; i++) {
          if (i > 0) code.content += "\n\n";
          code.content += insights[i].content;
        }
        code.priority = 0.85;
        items.push_back(std::move(code));
      }

      auto adaptive = options;
      adaptive.limit = 3;
      adaptive.min_relevance = 0.7;
      Append(&items, Collect("adaptive", query, adaptive));
      break;
    }
  }
  SortByPriority(&items);
  return items;
}

std::optional<ContextItem> ContextAssembler::SemanticFallback(const std::string& query) {
  if (!backend_ || query.empty()) return std::nullopt;
  std::string err;
  auto v = backend_->Embed(query, &err);
  if (!v || v->empty()) {
    std::cout << "[context-assembler] warn semantic fallback failed error=" << err << "\n";
    return std::nullopt;
  }
  ContextItem item;
  item.type = "semantic";
  item.id = "semantic-context-" + std::to_string(clock_->WallMs());
  item.title = "Semantic Context";
  item.content = "Query embedding generated with " + std::to_string(v->size()) +
                 " dimensions. No stored context matched the query; semantic recall will use this embedding "
                 "once related content is recorded.";
  item.priority = 0.85;
  return item;
}

GeneratedContext ContextAssembler::GenerateContext(const std::string& query, const ContextRequest& request) {
  auto out = Assemble(query, request);
  if (!init_.initialized()) return out;

  nlohmann::json record;
  record["timestamp"] = out.timestamp_ms;
  record["query"] = query;
  record["strategy"] = ToString(out.strategy);
  record["contextCount"] = out.items.size();
  if (!store_->StoreKey(kLastInjectionKey, record)) {
    std::cout << "[context-assembler] warn could not record context generation\n";
  }
  return out;
}

GeneratedContext ContextAssembler::Assemble(const std::string& query, const ContextRequest& request) {
  GeneratedContext out;
  out.timestamp_ms = clock_->WallMs();
  out.query = query;
  out.strategy = ResolveStrategy(request.strategy);
  if (!EnsureInitialized()) {
    out.error = "initialization failed: " + init_.last_error();
    return out;
  }

  ProviderOptions options;
  options.limit = request.limit;
  options.min_relevance = request.min_relevance;
  options.boundary_info = request.boundary_info;
  options.session_id = request.session_id;

  const auto key = CacheKey(out.strategy, query, options);
  std::optional<std::vector<ContextItem>> cached;
  if (cfg_.cache_enabled) cached = cache_.Get(key);
  if (cached) {
    out.items = std::move(*cached);
    out.from_cache = true;
  } else {
    out.items = RunStrategy(out.strategy, query, options);
    if (cfg_.cache_enabled && !out.items.empty()) cache_.Put(key, out.items);
  }

  if (out.items.empty()) {
    auto fb = SemanticFallback(query);
    if (fb) {
      out.items.push_back(std::move(*fb));
      out.fallback = true;
    }
  }
  out.success = !out.items.empty();
  if (!out.success) out.error = "no context available";

  std::cout << "[context-assembler] generated strategy=" << ToString(out.strategy) << " items=" << out.items.size()
            << " cache=" << (out.from_cache ? "hit" : "miss") << (out.fallback ? " fallback=1" : "") << "\n";
  return out;
}

std::string ContextAssembler::Render(const GeneratedContext& context, RenderFormat format) const {
  nlohmann::json envelope;
  envelope["timestamp"] = context.timestamp_ms;
  envelope["query"] = context.query;
  envelope["strategy"] = ToString(context.strategy);
  return RenderContext(context.items, format, render_, envelope);
}

InjectionResult ContextAssembler::InjectContext(const std::string& query, const ContextRequest& request) {
  InjectionResult r;
  r.timestamp_ms = clock_->WallMs();
  r.query = query.empty() ? kBoundaryQuery : query;
  r.boundary_info = request.boundary_info;
  bool known_format = true;
  r.format = RenderFormatFromString(request.format, &known_format);
  if (!known_format) std::cout << "[context-assembler] warn unknown format=" << request.format << " using markdown\n";
  if (!EnsureInitialized()) {
    r.error = "initialization failed: " + init_.last_error();
    return r;
  }

  ContextRequest req = request;
  if (req.session_id.empty()) {
    auto state = store_->GetSessionState();
    req.session_id = state.success ? state.session_id : "unknown-session";
  }
  r.session_id = req.session_id;

  auto generated = Assemble(query, req);
  r.strategy = generated.strategy;
  r.success = generated.success;
  r.error = generated.error;
  r.context_count = generated.items.size();
  r.formatted_context = Render(generated, r.format);
  r.items = std::move(generated.items);

  PersistInjection(r);

  nlohmann::json record;
  record["timestamp"] = r.timestamp_ms;
  record["query"] = query;
  record["strategy"] = ToString(r.strategy);
  record["contextCount"] = r.context_count;
  record["format"] = ToString(r.format);
  if (!store_->StoreKey(kLastInjectionKey, record)) {
    std::cout << "[context-assembler] warn could not record context injection\n";
  }
  return r;
}

InjectionResult ContextAssembler::InjectContextAtBoundary(const nlohmann::json& boundary_info,
                                                          const ContextRequest& request) {
  ContextRequest req = request;
  if (req.strategy.empty()) req.strategy = ToString(Strategy::kBoundary);
  req.boundary_info = boundary_info;

  auto state = store_->GetSessionState();
  if (state.success) {
    if (req.session_id.empty()) req.session_id = state.session_id;
    nlohmann::json data;
    data["source"] = "context-assembler";
    if (boundary_info.is_object() && boundary_info.contains("id")) {
      data["boundaryId"] = boundary_info["id"];
    } else {
      data["boundaryId"] = "boundary-" + std::to_string(clock_->WallMs());
    }
    data["boundaryData"] = boundary_info;
    auto marker = store_->CreateSessionBoundary("token_boundary", data);
    if (!marker.success) std::cout << "[context-assembler] warn boundary not recorded error=" << marker.error << "\n";
  } else {
    std::cout << "[context-assembler] warn session state unavailable error=" << state.error << "\n";
  }
  return InjectContext("", req);
}

std::string ContextAssembler::CurrentContextPath() const {
  return (std::filesystem::path(cfg_.context_dir) / "current-context.json").string();
}

std::string ContextAssembler::ContextHistoryPath() const {
  return (std::filesystem::path(cfg_.context_dir) / "context-history.json").string();
}

std::string ContextAssembler::LlmAccessDir() const {
  return (std::filesystem::path(cfg_.context_dir) / "llm-access").string();
}

std::string ContextAssembler::LatestContextPath() const {
  return (std::filesystem::path(LlmAccessDir()) / "latest-context.md").string();
}

// Writes llm-access/context-<ts>.md and .json and points latest-context.md at
// the markdown file. Returns the markdown path, or "" when it was not written.
std::string ContextAssembler::WriteLlmAccessFiles(const InjectionResult& result) {
  namespace fs = std::filesystem;
  const std::string iso = FormatIso8601(result.timestamp_ms);
  std::string stamp = iso;
  std::replace(stamp.begin(), stamp.end(), ':', '-');
  std::replace(stamp.begin(), stamp.end(), '.', '-');
  const fs::path dir(LlmAccessDir());
  const auto md_path = (dir / ("context-" + stamp + ".md")).string();
  const auto json_path = (dir / ("context-" + stamp + ".json")).string();

  const std::string query = result.query.empty() ? "No query provided" : result.query;
  const std::string session = result.session_id.empty() ? "unknown" : result.session_id;
  std::string md;
  md += "# Continuity Context\n\n";
  md += "## Metadata\n";
  md += "- Timestamp: " + iso + "\n";
  md += "- Query: " + query + "\n";
  md += "- Strategy: " + std::string(ToString(result.strategy)) + "\n";
  md += "- Context Items: " + std::to_string(result.context_count) + "\n";
  md += "- Session ID: " + session + "\n\n";
  md += "<!-- CONTINUITY CONTEXT START -->\n\n";
  md += result.formatted_context;
  md += "\n\n<!-- CONTINUITY CONTEXT END -->\n\n";
  md += "## Usage\n\n";
  md += "Acknowledge this context and carry it across token boundaries: project structure, current\n"
        "implementation details, recent decisions and user objectives.\n";

  std::string err;
  if (!WriteFileAtomic(md_path, md, "", &err)) {
    std::cout << "[context-assembler] error writing llm context error=" << err << "\n";
    return "";
  }

  nlohmann::json doc;
  doc["metadata"] = {{"timestamp", iso},
                     {"query", query},
                     {"strategy", ToString(result.strategy)},
                     {"contextCount", result.context_count},
                     {"sessionId", session}};
  doc["context"] = result.formatted_context;
  doc["rawContext"] = nlohmann::json::array();
  for (const auto& item : result.items) doc["rawContext"].push_back(ToJson(item));
  if (!WriteJsonFileAtomic(json_path, doc, &err)) {
    std::cout << "[context-assembler] error writing llm context json error=" << err << "\n";
  }

  const fs::path latest(LatestContextPath());
  std::error_code ec;
  fs::remove(latest, ec);
  fs::create_symlink(fs::path(md_path).filename(), latest, ec);
  if (ec) {
    std::cout << "[context-assembler] warn latest-context symlink failed error=" << ec.message() << " copying\n";
    ec.clear();
    fs::copy_file(md_path, latest, fs::copy_options::overwrite_existing, ec);
    if (ec) std::cout << "[context-assembler] error copying latest context error=" << ec.message() << "\n";
  }
  return md_path;
}

void ContextAssembler::PersistInjection(const InjectionResult& result) {
  if (cfg_.context_dir.empty()) return;
  std::lock_guard<std::mutex> lock(files_mu_);

  std::string err;
  if (!WriteJsonFileAtomic(CurrentContextPath(), ToJson(result), &err)) {
    std::cout << "[context-assembler] error writing current context error=" << err << "\n";
    return;
  }

  const auto file_path = WriteLlmAccessFiles(result);

  nlohmann::json history = nlohmann::json::array();
  std::string read_err;
  auto existing = ReadJsonFile(ContextHistoryPath(), &read_err);
  if (existing && existing->is_array()) {
    history = std::move(*existing);
  } else if (!read_err.empty()) {
    std::cout << "[context-assembler] warn context history unreadable error=" << read_err << "\n";
  }

  nlohmann::json entry;
  entry["timestamp"] = result.timestamp_ms;
  entry["query"] = result.query;
  entry["strategy"] = ToString(result.strategy);
  entry["contextCount"] = result.context_count;
  entry["format"] = ToString(result.format);
  entry["sessionId"] = result.session_id;
  if (!file_path.empty()) entry["filePath"] = file_path;
  history.insert(history.begin(), std::move(entry));
  while (history.size() > cfg_.max_history_items) history.erase(history.size() - 1);

  if (!WriteJsonFileAtomic(ContextHistoryPath(), history, &err)) {
    std::cout << "[context-assembler] error writing context history error=" << err << "\n";
  }
}

nlohmann::json ContextAssembler::GetStatus() const {
  nlohmann::json j;
  j["initialized"] = init_.initialized();
  j["cacheEnabled"] = cfg_.cache_enabled;
  j["cacheSize"] = cache_.size();
  auto swept = cache_.last_sweep_wall_ms();
  if (swept) j["lastCacheCleanup"] = *swept; else j["lastCacheCleanup"] = nullptr;
  j["compressionEnabled"] = cfg_.compression_enabled;
  j["validationEnabled"] = cfg_.validation_enabled;
  j["providerCount"] = registry_.size();
  j["strategyCount"] = AllStrategies().size();
  j["defaultStrategy"] = ToString(default_strategy_);
  auto last_error = init_.last_error();
  if (last_error.empty()) j["lastError"] = nullptr; else j["lastError"] = last_error;
  j["timestamp"] = clock_->WallMs();
  return j;
}

}  // namespace continuity
