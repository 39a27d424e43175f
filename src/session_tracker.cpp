#include "session_tracker.hpp"

#include "file_util.hpp"

#include <algorithm>
#include <filesystem>
#include <iostream>
#include <utility>

namespace continuity {
namespace {

static std::string GetString(const nlohmann::json& j, const char* key) {
  if (j.contains(key) && j[key].is_string()) return j[key].get<std::string>();
  return {};
}

static int64_t GetInt64(const nlohmann::json& j, const char* key) {
  if (j.contains(key) && j[key].is_number()) return j[key].get<int64_t>();
  return 0;
}

static std::optional<TokenBoundary> TokenBoundaryFromJson(const nlohmann::json& j) {
  if (!j.is_object()) return std::nullopt;
  TokenBoundary b;
  b.id = GetString(j, "id");
  if (b.id.empty()) return std::nullopt;
  b.timestamp_ms = GetInt64(j, "timestamp");
  b.session_id = GetString(j, "sessionId");
  b.type = GetString(j, "type");
  if (j.contains("metadata") && j["metadata"].is_object()) b.metadata = j["metadata"];
  return b;
}

}  // namespace

const char* ToString(SessionStatus status) {
  return status == SessionStatus::kActive ? "active" : "completed";
}

const char* ToString(BoundaryProximity proximity) {
  switch (proximity) {
    case BoundaryProximity::kFar:
      return "far";
    case BoundaryProximity::kMedium:
      return "medium";
    case BoundaryProximity::kClose:
      return "close";
    case BoundaryProximity::kImminent:
      return "imminent";
  }
  return "far";
}

nlohmann::json ToJson(const TokenBoundary& b) {
  nlohmann::json j;
  j["id"] = b.id;
  j["timestamp"] = b.timestamp_ms;
  j["sessionId"] = b.session_id;
  j["type"] = b.type;
  j["metadata"] = b.metadata.is_object() ? b.metadata : nlohmann::json::object();
  return j;
}

nlohmann::json ToJson(const SessionRecord& r) {
  nlohmann::json j;
  j["id"] = r.id;
  j["startTime"] = r.start_time_ms;
  j["lastActivity"] = r.last_activity_ms;
  if (r.end_time_ms.has_value()) j["endTime"] = *r.end_time_ms;
  j["status"] = ToString(r.status);
  j["tokenBoundaries"] = nlohmann::json::array();
  for (const auto& b : r.token_boundaries) j["tokenBoundaries"].push_back(ToJson(b));
  if (r.previous_session_id.has_value()) j["previousSessionId"] = *r.previous_session_id; else j["previousSessionId"] = nullptr;
  return j;
}

std::optional<SessionRecord> SessionRecordFromJson(const nlohmann::json& j) {
  if (!j.is_object()) return std::nullopt;
  SessionRecord r;
  r.id = GetString(j, "id");
  if (r.id.empty()) return std::nullopt;
  r.start_time_ms = GetInt64(j, "startTime");
  r.last_activity_ms = GetInt64(j, "lastActivity");
  if (j.contains("endTime") && j["endTime"].is_number()) r.end_time_ms = j["endTime"].get<int64_t>();
  r.status = GetString(j, "status") == "completed" ? SessionStatus::kCompleted : SessionStatus::kActive;
  if (j.contains("tokenBoundaries") && j["tokenBoundaries"].is_array()) {
    for (const auto& bj : j["tokenBoundaries"]) {
      auto b = TokenBoundaryFromJson(bj);
      if (b) r.token_boundaries.push_back(std::move(*b));
    }
  }
  auto prev = GetString(j, "previousSessionId");
  if (!prev.empty()) r.previous_session_id = prev;
  return r;
}

nlohmann::json ToJson(const BoundaryInfo& info) {
  nlohmann::json j;
  j["success"] = info.success;
  j["sessionId"] = info.session_id;
  if (!info.success) {
    j["error"] = info.error;
    return j;
  }
  j["startTime"] = info.start_time_ms;
  j["lastActivity"] = info.last_activity_ms;
  j["tokenBoundaries"] = nlohmann::json::array();
  for (const auto& b : info.token_boundaries) j["tokenBoundaries"].push_back(ToJson(b));
  j["proximity"] = ToString(info.proximity);
  j["continuityScore"] = info.continuity_score;
  if (info.previous_session_id.has_value()) j["previousSessionId"] = *info.previous_session_id; else j["previousSessionId"] = nullptr;
  return j;
}

BoundaryProximity ProximityFromElapsed(int64_t elapsed_ms, int64_t timeout_ms) {
  if (timeout_ms <= 0) return BoundaryProximity::kImminent;
  double pct = std::min(100.0, static_cast<double>(elapsed_ms) / static_cast<double>(timeout_ms) * 100.0);
  if (pct < 25) return BoundaryProximity::kFar;
  if (pct < 50) return BoundaryProximity::kMedium;
  if (pct < 75) return BoundaryProximity::kClose;
  return BoundaryProximity::kImminent;
}

double ComputeContinuityScore(size_t boundary_count, int64_t elapsed_ms, int64_t timeout_ms) {
  double score = 1.0;
  if (boundary_count > 0) score -= std::min(0.5, static_cast<double>(boundary_count) * 0.05);
  double ratio = timeout_ms > 0 ? static_cast<double>(std::max<int64_t>(0, elapsed_ms)) / static_cast<double>(timeout_ms)
                                : 1.0;
  score -= std::min(0.5, ratio * 0.5);
  return std::max(0.0, score);
}

SessionTracker::SessionTracker(SessionTrackerConfig cfg, const Clock* clock)
    : cfg_(std::move(cfg)), clock_(clock ? clock : DefaultClock()), init_("session-tracker") {}

InitResult SessionTracker::Initialize() {
  return init_.Run([this](std::string* err) { return DoInitialize(err); });
}

bool SessionTracker::EnsureInitialized() {
  if (init_.initialized()) return true;
  return Initialize().success;
}

bool SessionTracker::DoInitialize(std::string* err) {
  if (!EnsureDirectory(cfg_.sessions_dir, err)) return false;
  std::lock_guard<std::mutex> lock(mu_);
  LoadIndexLocked();

  // Sessions left active by a previous process end where their activity ended.
  for (auto& r : records_) {
    if (r.status == SessionStatus::kActive) {
      r.status = SessionStatus::kCompleted;
      r.end_time_ms = r.last_activity_ms;
    }
  }
  std::optional<std::string> previous;
  if (!records_.empty()) {
    auto latest = std::max_element(records_.begin(), records_.end(), [](const SessionRecord& a, const SessionRecord& b) {
      return a.start_time_ms < b.start_time_ms;
    });
    previous = latest->id;
  }
  current_session_id_ = CreateSessionLocked(previous);
  std::string save_err;
  if (!SaveIndexLocked(&save_err)) {
    if (err) *err = save_err;
    return false;
  }
  std::cout << "[session-tracker] loaded sessions=" << records_.size() << " current=" << current_session_id_ << "\n";
  return true;
}

std::string SessionTracker::IndexPath() const {
  return (std::filesystem::path(cfg_.sessions_dir) / "index.json").string();
}

void SessionTracker::LoadIndexLocked() {
  records_.clear();
  std::string err;
  auto j = ReadJsonFile(IndexPath(), &err);
  if (!j) {
    if (!err.empty()) std::cout << "[session-tracker] warn load index error=" << err << "\n";
    return;
  }
  if (!j->is_array()) {
    std::cout << "[session-tracker] warn index is not an array, starting empty\n";
    return;
  }
  for (const auto& rj : *j) {
    auto r = SessionRecordFromJson(rj);
    if (r) records_.push_back(std::move(*r));
  }
}

bool SessionTracker::SaveIndexLocked(std::string* err) {
  nlohmann::json arr = nlohmann::json::array();
  for (const auto& r : records_) arr.push_back(ToJson(r));
  std::string e;
  if (!WriteJsonFileAtomic(IndexPath(), arr, &e)) {
    std::cout << "[session-tracker] error save index error=" << e << "\n";
    if (err) *err = e;
    return false;
  }
  return true;
}

std::string SessionTracker::CreateSessionLocked(const std::optional<std::string>& previous_session_id) {
  const int64_t now = clock_->WallMs();
  SessionRecord r;
  r.id = "session-" + std::to_string(now) + "-" + RandomHex(4);
  r.start_time_ms = now;
  r.last_activity_ms = now;
  r.status = SessionStatus::kActive;
  r.previous_session_id = previous_session_id;
  records_.push_back(r);
  current_activity_steady_ms_ = clock_->SteadyMs();
  std::cout << "[session-tracker] created session_id=" << r.id
            << " previous=" << (previous_session_id ? *previous_session_id : "-") << "\n";
  return r.id;
}

SessionRecord* SessionTracker::FindLocked(const std::string& session_id) {
  for (auto& r : records_) {
    if (r.id == session_id) return &r;
  }
  return nullptr;
}

int64_t SessionTracker::ElapsedLocked(const SessionRecord& record) const {
  if (record.id == current_session_id_ && record.status == SessionStatus::kActive) {
    return std::max<int64_t>(0, clock_->SteadyMs() - current_activity_steady_ms_);
  }
  return std::max<int64_t>(0, clock_->WallMs() - record.last_activity_ms);
}

std::string SessionTracker::FallbackSessionId() const {
  return "fallback-session-" + std::to_string(clock_->WallMs());
}

std::string SessionTracker::GetCurrentSessionId() {
  if (!EnsureInitialized()) {
    std::cout << "[session-tracker] error current session unavailable: " << init_.last_error() << "\n";
    return FallbackSessionId();
  }

  std::lock_guard<std::mutex> lock(mu_);
  auto* current = current_session_id_.empty() ? nullptr : FindLocked(current_session_id_);
  if (!current) {
    std::cout << "[session-tracker] warn current session " << (current_session_id_.empty() ? "-" : current_session_id_)
              << " not found, creating a new session\n";
    std::optional<std::string> previous;
    if (!current_session_id_.empty()) previous = current_session_id_;
    current_session_id_ = CreateSessionLocked(previous);
    SaveIndexLocked(nullptr);
    return current_session_id_;
  }

  const int64_t elapsed = ElapsedLocked(*current);
  const int64_t now = clock_->WallMs();
  if (elapsed > cfg_.timeout_ms) {
    std::cout << "[session-tracker] timeout session_id=" << current->id << " idle_ms=" << elapsed << "\n";
    current->status = SessionStatus::kCompleted;
    current->end_time_ms = now;
    const std::string previous = current->id;
    current_session_id_ = CreateSessionLocked(previous);
  } else {
    current->last_activity_ms = now;
    current_activity_steady_ms_ = clock_->SteadyMs();
  }
  SaveIndexLocked(nullptr);
  return current_session_id_;
}

std::string SessionTracker::PeekCurrentSessionId() const {
  std::lock_guard<std::mutex> lock(mu_);
  return current_session_id_;
}

BoundaryRecordResult SessionTracker::RecordTokenBoundary(const BoundaryData& data) {
  BoundaryRecordResult out;
  if (!EnsureInitialized()) {
    out.error = "initialization failed: " + init_.last_error();
    return out;
  }

  std::lock_guard<std::mutex> lock(mu_);
  auto* current = current_session_id_.empty() ? nullptr : FindLocked(current_session_id_);
  if (!current) {
    std::cout << "[session-tracker] warn no active session, creating one for boundary\n";
    current_session_id_ = CreateSessionLocked(std::nullopt);
    current = FindLocked(current_session_id_);
  }

  const int64_t now = clock_->WallMs();
  TokenBoundary b;
  b.id = data.id.empty() ? "boundary-" + std::to_string(now) + "-" + RandomHex(3) : data.id;
  b.timestamp_ms = now;
  b.session_id = current_session_id_;
  b.type = data.type.empty() ? "generic" : data.type;
  b.metadata = data.metadata.is_object() ? data.metadata : nlohmann::json::object();

  const int64_t prev_activity = current->last_activity_ms;
  const int64_t prev_steady = current_activity_steady_ms_;
  current->token_boundaries.push_back(b);
  current->last_activity_ms = now;
  current_activity_steady_ms_ = clock_->SteadyMs();

  std::string err;
  if (!SaveIndexLocked(&err)) {
    current->token_boundaries.pop_back();
    current->last_activity_ms = prev_activity;
    current_activity_steady_ms_ = prev_steady;
    out.session_id = current_session_id_;
    out.error = err;
    return out;
  }

  std::cout << "[session-tracker] boundary id=" << b.id << " type=" << b.type << " session_id=" << current_session_id_
            << "\n";
  out.success = true;
  out.boundary_id = b.id;
  out.session_id = current_session_id_;
  out.timestamp_ms = now;
  return out;
}

BoundaryInfo SessionTracker::GetBoundaryInfo(const std::string& session_id) {
  BoundaryInfo info;
  info.session_id = session_id;
  if (!EnsureInitialized()) {
    info.error = "initialization failed: " + init_.last_error();
    return info;
  }

  std::lock_guard<std::mutex> lock(mu_);
  const auto* record = FindLocked(session_id);
  if (!record) {
    std::cout << "[session-tracker] warn boundary info: session not found session_id=" << session_id << "\n";
    info.error = "session record not found";
    return info;
  }

  const int64_t elapsed = ElapsedLocked(*record);
  info.success = true;
  info.start_time_ms = record->start_time_ms;
  info.last_activity_ms = record->last_activity_ms;
  info.token_boundaries = record->token_boundaries;
  info.previous_session_id = record->previous_session_id;
  info.proximity = ProximityFromElapsed(elapsed, cfg_.timeout_ms);
  info.continuity_score = ComputeContinuityScore(record->token_boundaries.size(), elapsed, cfg_.timeout_ms);
  return info;
}

bool SessionTracker::CompleteCurrentSession() {
  if (!EnsureInitialized()) return false;
  std::lock_guard<std::mutex> lock(mu_);
  auto* current = FindLocked(current_session_id_);
  if (!current) {
    std::cout << "[session-tracker] warn complete: current session not found\n";
    return false;
  }
  const int64_t now = clock_->WallMs();
  current->status = SessionStatus::kCompleted;
  current->end_time_ms = now;
  current->last_activity_ms = now;
  const std::string completed = current->id;
  current_session_id_ = CreateSessionLocked(completed);
  if (!SaveIndexLocked(nullptr)) return false;
  std::cout << "[session-tracker] completed session_id=" << completed << "\n";
  return true;
}

bool SessionTracker::ClearSessionState() {
  if (!EnsureInitialized()) return false;
  std::lock_guard<std::mutex> lock(mu_);
  if (auto* current = FindLocked(current_session_id_)) {
    current->status = SessionStatus::kCompleted;
    current->end_time_ms = clock_->WallMs();
  }
  current_session_id_ = CreateSessionLocked(std::nullopt);
  if (!SaveIndexLocked(nullptr)) return false;
  std::cout << "[session-tracker] cleared state current=" << current_session_id_ << "\n";
  return true;
}

std::vector<TokenBoundary> SessionTracker::GetTokenBoundaries(const std::string& session_id) {
  if (!EnsureInitialized()) return {};
  std::lock_guard<std::mutex> lock(mu_);
  const auto* r = FindLocked(session_id.empty() ? current_session_id_ : session_id);
  if (!r) return {};
  return r->token_boundaries;
}

std::optional<SessionRecord> SessionTracker::GetSessionInfo(const std::string& session_id) {
  if (!EnsureInitialized()) return std::nullopt;
  std::lock_guard<std::mutex> lock(mu_);
  const auto* r = FindLocked(session_id.empty() ? current_session_id_ : session_id);
  if (!r) return std::nullopt;
  return *r;
}

std::vector<SessionRecord> SessionTracker::GetRecentSessions(size_t limit) {
  if (!EnsureInitialized()) return {};
  std::vector<SessionRecord> out;
  {
    std::lock_guard<std::mutex> lock(mu_);
    out = records_;
  }
  std::stable_sort(out.begin(), out.end(), [](const SessionRecord& a, const SessionRecord& b) {
    return a.start_time_ms > b.start_time_ms;
  });
  if (out.size() > limit) out.resize(limit);
  return out;
}

std::optional<TokenBoundary> SessionTracker::GetBoundaryById(const std::string& session_id,
                                                             const std::string& boundary_id) {
  if (!EnsureInitialized()) return std::nullopt;
  std::lock_guard<std::mutex> lock(mu_);
  const auto* r = FindLocked(session_id.empty() ? current_session_id_ : session_id);
  if (!r) return std::nullopt;
  if (boundary_id.empty()) {
    if (r->token_boundaries.empty()) return std::nullopt;
    return r->token_boundaries.back();
  }
  for (const auto& b : r->token_boundaries) {
    if (b.id == boundary_id) return b;
  }
  return std::nullopt;
}

}  // namespace continuity
