#pragma once

#include "providers/context_provider.hpp"
#include "session_data_store.hpp"

namespace continuity {

// Describes the active session: id, predecessor and start time.
class SessionContextProvider : public IContextProvider {
 public:
  explicit SessionContextProvider(SessionDataStore* store);

  std::string Name() const override;
  std::vector<ContextItem> Provide(const std::string& query, const ProviderOptions& options) override;

 private:
  SessionDataStore* store_;
};

}  // namespace continuity
