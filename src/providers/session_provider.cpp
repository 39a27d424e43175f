#include "providers/session_provider.hpp"

#include "errors.hpp"

namespace continuity {

SessionContextProvider::SessionContextProvider(SessionDataStore* store) : store_(store) {
  if (!store_) throw ConfigurationError("SessionContextProvider requires a SessionDataStore");
}

std::string SessionContextProvider::Name() const {
  return "session";
}

std::vector<ContextItem> SessionContextProvider::Provide(const std::string&, const ProviderOptions&) {
  auto state = store_->GetSessionState();
  if (!state.success) return {};

  ContextItem item;
  item.type = "session";
  item.id = "session_state";
  item.title = "Session State";
  item.content = "Session ID: " + state.session_id + "\nPrevious Session: " +
                 state.previous_session_id.value_or("None") + "\nSession Start: " +
                 FormatIso8601(state.start_time_ms);
  item.priority = 0.7;
  return {item};
}

}  // namespace continuity
