#pragma once

#include "clock.hpp"
#include "config.hpp"
#include "context_cache.hpp"
#include "context_render.hpp"
#include "embedding_client.hpp"
#include "init_retry.hpp"
#include "providers/registry.hpp"
#include "session_data_store.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace continuity {

enum class Strategy {
  kStandard,
  kMinimal,
  kBoundary,
  kComprehensive,
  kVisionFocused,
  kMetacognitiveFocused,
  kDevelopmentFlow,
};

const char* ToString(Strategy strategy);
std::optional<Strategy> StrategyFromString(const std::string& name);
const std::vector<Strategy>& AllStrategies();

struct ContextRequest {
  // Empty selects the configured default; unknown names fall back to it.
  std::string strategy;
  std::optional<int> limit;
  std::optional<double> min_relevance;
  std::optional<nlohmann::json> boundary_info;
  std::string session_id;
  std::string format = "markdown";
};

struct GeneratedContext {
  bool success = false;
  bool from_cache = false;
  bool fallback = false;
  int64_t timestamp_ms = 0;
  std::string query;
  Strategy strategy = Strategy::kStandard;
  std::vector<ContextItem> items;
  std::string error;
};

nlohmann::json ToJson(const GeneratedContext& g);

struct InjectionResult {
  bool success = false;
  int64_t timestamp_ms = 0;
  std::string query;
  std::string session_id;
  std::optional<nlohmann::json> boundary_info;
  Strategy strategy = Strategy::kStandard;
  RenderFormat format = RenderFormat::kMarkdown;
  size_t context_count = 0;
  std::string formatted_context;
  std::vector<ContextItem> items;
  std::string error;
};

nlohmann::json ToJson(const InjectionResult& r);

// Builds ranked context bundles from the registered providers. Providers are
// owned by the assembler's registry; the data store and embedding backend are
// borrowed and must outlive it.
class ContextAssembler {
 public:
  static constexpr const char* kLastInjectionKey = "last_context_injection";
  static constexpr const char* kBoundaryQuery = "[automatic boundary context]";

  // Throws ConfigurationError when store is null. backend may be null, which
  // disables the semantic fallback.
  ContextAssembler(AssemblerConfig cfg,
                   SessionDataStore* store,
                   IEmbeddingBackend* backend,
                   const Clock* clock = DefaultClock());

  InitResult Initialize();

  ContextProviderRegistry& registry() { return registry_; }
  void RegisterProvider(std::unique_ptr<IContextProvider> provider);

  GeneratedContext GenerateContext(const std::string& query, const ContextRequest& request = {});
  InjectionResult InjectContext(const std::string& query, const ContextRequest& request = {});
  InjectionResult InjectContextAtBoundary(const nlohmann::json& boundary_info, const ContextRequest& request = {});

  std::string Render(const GeneratedContext& context, RenderFormat format) const;

  nlohmann::json GetStatus() const;
  Strategy default_strategy() const { return default_strategy_; }
  std::string CurrentContextPath() const;
  std::string ContextHistoryPath() const;
  std::string LlmAccessDir() const;
  std::string LatestContextPath() const;

  static std::string CacheKey(Strategy strategy, const std::string& query, const ProviderOptions& options);

 private:
  bool EnsureInitialized();
  Strategy ResolveStrategy(const std::string& name) const;
  GeneratedContext Assemble(const std::string& query, const ContextRequest& request);
  std::vector<ContextItem> RunStrategy(Strategy strategy, const std::string& query, const ProviderOptions& options);
  std::vector<ContextItem> Collect(const std::string& provider, const std::string& query, const ProviderOptions& options);
  std::optional<ContextItem> SemanticFallback(const std::string& query);
  void PersistInjection(const InjectionResult& result);
  std::string WriteLlmAccessFiles(const InjectionResult& result);

  AssemblerConfig cfg_;
  SessionDataStore* store_;
  IEmbeddingBackend* backend_;
  const Clock* clock_;
  InitRetryPolicy init_;
  Strategy default_strategy_ = Strategy::kStandard;
  RenderSettings render_;
  ContextProviderRegistry registry_;
  ContextCache cache_;
  std::mutex files_mu_;
};

}  // namespace continuity
