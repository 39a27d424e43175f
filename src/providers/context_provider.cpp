#include "providers/context_provider.hpp"

namespace continuity {

nlohmann::json ToJson(const ContextItem& item) {
  nlohmann::json j;
  j["type"] = item.type;
  j["id"] = item.id;
  j["title"] = item.title;
  j["content"] = item.content;
  if (item.priority.has_value()) j["priority"] = *item.priority;
  return j;
}

}  // namespace continuity
