#pragma once

#include "clock.hpp"
#include "init_retry.hpp"
#include "session_tracker.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace continuity {

struct AssertionRecord {
  std::string name;
  bool passed = false;
  std::string message;
  int64_t timestamp_ms = 0;
  std::string error;
};

nlohmann::json ToJson(const AssertionRecord& a);

struct SessionBoundaryMarker {
  bool success = false;
  std::string id;
  std::string session_id;
  int64_t timestamp_ms = 0;
  std::string type;
  nlohmann::json data = nlohmann::json::object();
  std::string error;
};

struct SessionState {
  bool success = false;
  std::string error;
  std::string session_id;
  std::optional<std::string> previous_session_id;
  int64_t start_time_ms = 0;
  int64_t last_update_ms = 0;
  std::optional<BoundaryProximity> proximity;
  double continuity_score = 1.0;
  std::vector<std::string> data_keys;
};

nlohmann::json ToJson(const SessionState& s);

// Per-session durable key-value storage. Each session owns one JSON object
// file "<sessions_dir>/<session_id>.json" mapping "namespace:key" to a value.
// Operations act on the tracker's active session; failures are logged and
// reported through the return value, never thrown.
class SessionDataStore {
 public:
  static constexpr const char* kAssertionsKey = "assertions";
  static constexpr const char* kTestSummaryKey = "testSummary";

  // Throws ConfigurationError when tracker is null.
  explicit SessionDataStore(SessionTracker* tracker,
                            const Clock* clock = DefaultClock(),
                            std::string results_dir = "");

  InitResult Initialize();

  bool Store(const std::string& ns, const std::string& key, const nlohmann::json& value);
  bool StoreKey(const std::string& key, const nlohmann::json& value);
  std::optional<nlohmann::json> Get(const std::string& ns, const std::string& key);
  std::optional<nlohmann::json> GetKey(const std::string& key);
  bool Has(const std::string& key);
  bool Delete(const std::string& key);
  bool Clear();

  // Session ids with a data file, in directory enumeration order.
  std::vector<std::string> ListSessions();

  // Active session first, then every other session file in enumeration order;
  // the first hit wins.
  std::optional<nlohmann::json> RetrieveAcrossSessions(const std::string& ns, const std::string& key);
  std::optional<nlohmann::json> RetrieveKeyAcrossSessions(const std::string& key);
  std::optional<nlohmann::json> GetPreviousSessionData(const std::string& session_id, const std::string& key);

  AssertionRecord Assert(const std::string& name, bool condition, const std::string& message = "");
  nlohmann::json CompleteTest();

  SessionBoundaryMarker CreateSessionBoundary(const std::string& type,
                                              const nlohmann::json& data = nlohmann::json::object());

  SessionState GetSessionState();
  std::string CurrentSessionId();

  static std::string MakeKey(const std::string& ns, const std::string& key);

 private:
  bool EnsureInitialized();
  // Follows the tracker onto its active session, reloading the cached data.
  void SyncSessionLocked();
  void LoadLocked();
  bool SaveLocked(std::string* err);
  std::string SessionFilePath(const std::string& session_id) const;
  std::optional<nlohmann::json> ReadSessionFile(const std::string& session_id);

  SessionTracker* tracker_;
  const Clock* clock_;
  std::string results_dir_;
  InitRetryPolicy init_;
  std::mutex mu_;
  std::string current_session_id_;
  nlohmann::json data_ = nlohmann::json::object();
};

}  // namespace continuity
