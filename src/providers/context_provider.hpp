#pragma once

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

namespace continuity {

struct ContextItem {
  std::string type;
  std::string id;
  std::string title;
  std::string content;
  std::optional<double> priority;
};

nlohmann::json ToJson(const ContextItem& item);

struct ProviderOptions {
  std::optional<int> limit;
  std::optional<double> min_relevance;
  std::optional<nlohmann::json> boundary_info;
  std::string session_id;
};

// A source of context items. Implementations should not throw; the assembler
// treats an exception as an empty contribution.
class IContextProvider {
 public:
  virtual ~IContextProvider() = default;

  virtual std::string Name() const = 0;
  virtual std::vector<ContextItem> Provide(const std::string& query, const ProviderOptions& options) = 0;
};

}  // namespace continuity
