#pragma once

#include "clock.hpp"
#include "init_retry.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace continuity {

enum class SessionStatus { kActive, kCompleted };

enum class BoundaryProximity { kFar, kMedium, kClose, kImminent };

const char* ToString(SessionStatus status);
const char* ToString(BoundaryProximity proximity);

struct TokenBoundary {
  std::string id;
  int64_t timestamp_ms = 0;
  std::string session_id;
  std::string type;
  nlohmann::json metadata = nlohmann::json::object();
};

struct SessionRecord {
  std::string id;
  int64_t start_time_ms = 0;
  int64_t last_activity_ms = 0;
  std::optional<int64_t> end_time_ms;
  SessionStatus status = SessionStatus::kActive;
  std::vector<TokenBoundary> token_boundaries;
  std::optional<std::string> previous_session_id;
};

nlohmann::json ToJson(const TokenBoundary& b);
nlohmann::json ToJson(const SessionRecord& r);
std::optional<SessionRecord> SessionRecordFromJson(const nlohmann::json& j);

struct BoundaryData {
  std::string id;
  std::string type = "generic";
  nlohmann::json metadata = nlohmann::json::object();
};

struct BoundaryRecordResult {
  bool success = false;
  std::string boundary_id;
  std::string session_id;
  int64_t timestamp_ms = 0;
  std::string error;
};

struct BoundaryInfo {
  bool success = false;
  std::string error;
  std::string session_id;
  int64_t start_time_ms = 0;
  int64_t last_activity_ms = 0;
  std::vector<TokenBoundary> token_boundaries;
  BoundaryProximity proximity = BoundaryProximity::kFar;
  double continuity_score = 1.0;
  std::optional<std::string> previous_session_id;
};

nlohmann::json ToJson(const BoundaryInfo& info);

// Quartiles of elapsed/timeout: far, medium, close, imminent.
BoundaryProximity ProximityFromElapsed(int64_t elapsed_ms, int64_t timeout_ms);

// max(0, 1 - min(0.5, 0.05 * boundaries) - min(0.5, elapsed / timeout * 0.5))
double ComputeContinuityScore(size_t boundary_count, int64_t elapsed_ms, int64_t timeout_ms);

struct SessionTrackerConfig {
  std::string sessions_dir = "data/sessions";
  int64_t timeout_ms = 30 * 60 * 1000;
};

// Owns the session index and the single active session of this process.
class SessionTracker {
 public:
  explicit SessionTracker(SessionTrackerConfig cfg, const Clock* clock = DefaultClock());

  InitResult Initialize();

  // Rolls over to a new session when the active one has been idle longer than
  // the timeout; otherwise touches it. Never throws.
  std::string GetCurrentSessionId();

  BoundaryRecordResult RecordTokenBoundary(const BoundaryData& data);
  BoundaryInfo GetBoundaryInfo(const std::string& session_id);

  bool CompleteCurrentSession();
  bool ClearSessionState();

  std::vector<TokenBoundary> GetTokenBoundaries(const std::string& session_id = "");
  std::optional<SessionRecord> GetSessionInfo(const std::string& session_id = "");
  std::vector<SessionRecord> GetRecentSessions(size_t limit = 5);
  std::optional<TokenBoundary> GetBoundaryById(const std::string& session_id = "",
                                               const std::string& boundary_id = "");

  // Current id without touching activity or checking the timeout.
  std::string PeekCurrentSessionId() const;

  std::string IndexPath() const;
  const std::string& SessionsDir() const { return cfg_.sessions_dir; }
  int64_t timeout_ms() const { return cfg_.timeout_ms; }

 private:
  bool EnsureInitialized();
  bool DoInitialize(std::string* err);
  void LoadIndexLocked();
  bool SaveIndexLocked(std::string* err);
  std::string CreateSessionLocked(const std::optional<std::string>& previous_session_id);
  SessionRecord* FindLocked(const std::string& session_id);
  int64_t ElapsedLocked(const SessionRecord& record) const;
  std::string FallbackSessionId() const;

  SessionTrackerConfig cfg_;
  const Clock* clock_;
  InitRetryPolicy init_;
  mutable std::mutex mu_;
  std::vector<SessionRecord> records_;
  std::string current_session_id_;
  int64_t current_activity_steady_ms_ = 0;
};

}  // namespace continuity
