#include "session_data_store.hpp"

#include "errors.hpp"
#include "file_util.hpp"

#include <filesystem>
#include <iostream>
#include <memory>
#include <unordered_map>
#include <utility>

namespace continuity {
namespace {

namespace fs = std::filesystem;

// One writer per session file across every store instance in the process.
static std::mutex& SessionFileMutex(const std::string& path) {
  static std::mutex registry_mu;
  static std::unordered_map<std::string, std::unique_ptr<std::mutex>> registry;
  std::lock_guard<std::mutex> lock(registry_mu);
  auto& slot = registry[path];
  if (!slot) slot = std::make_unique<std::mutex>();
  return *slot;
}

}  // namespace

nlohmann::json ToJson(const AssertionRecord& a) {
  nlohmann::json j;
  j["name"] = a.name;
  j["passed"] = a.passed;
  j["message"] = a.message;
  j["timestamp"] = a.timestamp_ms;
  if (!a.error.empty()) j["error"] = a.error;
  return j;
}

nlohmann::json ToJson(const SessionState& s) {
  nlohmann::json j;
  j["success"] = s.success;
  j["sessionId"] = s.session_id;
  if (!s.success) {
    j["error"] = s.error;
    return j;
  }
  if (s.previous_session_id.has_value()) j["previousSessionId"] = *s.previous_session_id; else j["previousSessionId"] = nullptr;
  j["startTime"] = s.start_time_ms;
  j["lastUpdateTime"] = s.last_update_ms;
  j["boundaryProximity"] = s.proximity.has_value() ? ToString(*s.proximity) : "unknown";
  j["continuityScore"] = s.continuity_score;
  j["dataKeys"] = s.data_keys;
  j["dataSize"] = s.data_keys.size();
  return j;
}

SessionDataStore::SessionDataStore(SessionTracker* tracker, const Clock* clock, std::string results_dir)
    : tracker_(tracker),
      clock_(clock ? clock : DefaultClock()),
      results_dir_(std::move(results_dir)),
      init_("session-data-store") {
  if (!tracker_) throw ConfigurationError("SessionDataStore requires a SessionTracker");
  if (results_dir_.empty()) {
    results_dir_ = (fs::path(tracker_->SessionsDir()).parent_path() / "test-results").string();
  }
}

std::string SessionDataStore::MakeKey(const std::string& ns, const std::string& key) {
  return ns + ":" + key;
}

InitResult SessionDataStore::Initialize() {
  return init_.Run([this](std::string* err) {
    if (!EnsureDirectory(tracker_->SessionsDir(), err)) return false;
    std::lock_guard<std::mutex> lock(mu_);
    SyncSessionLocked();
    std::cout << "[session-data-store] session_id=" << current_session_id_ << " items=" << data_.size() << "\n";
    return true;
  });
}

bool SessionDataStore::EnsureInitialized() {
  if (init_.initialized()) return true;
  return Initialize().success;
}

std::string SessionDataStore::SessionFilePath(const std::string& session_id) const {
  return (fs::path(tracker_->SessionsDir()) / (session_id + ".json")).string();
}

void SessionDataStore::SyncSessionLocked() {
  auto id = tracker_->GetCurrentSessionId();
  if (id == current_session_id_) return;
  if (!current_session_id_.empty()) {
    std::cout << "[session-data-store] switching session from=" << current_session_id_ << " to=" << id << "\n";
  }
  current_session_id_ = std::move(id);
  LoadLocked();
}

void SessionDataStore::LoadLocked() {
  data_ = nlohmann::json::object();
  std::string err;
  auto j = ReadJsonFile(SessionFilePath(current_session_id_), &err);
  if (!j) {
    if (!err.empty()) std::cout << "[session-data-store] warn load error=" << err << "\n";
    return;
  }
  if (!j->is_object()) {
    std::cout << "[session-data-store] warn session file is not an object session_id=" << current_session_id_ << "\n";
    return;
  }
  data_ = std::move(*j);
}

bool SessionDataStore::SaveLocked(std::string* err) {
  const auto path = SessionFilePath(current_session_id_);
  std::lock_guard<std::mutex> file_lock(SessionFileMutex(path));
  return WriteJsonFileAtomic(path, data_, err);
}

bool SessionDataStore::Store(const std::string& ns, const std::string& key, const nlohmann::json& value) {
  return StoreKey(MakeKey(ns, key), value);
}

bool SessionDataStore::StoreKey(const std::string& key, const nlohmann::json& value) {
  if (!EnsureInitialized()) return false;
  std::lock_guard<std::mutex> lock(mu_);
  SyncSessionLocked();
  auto previous = data_.contains(key) ? std::optional<nlohmann::json>(data_[key]) : std::nullopt;
  data_[key] = value;
  std::string err;
  if (!SaveLocked(&err)) {
    if (previous) data_[key] = *previous; else data_.erase(key);
    std::cout << "[session-data-store] error store key=" << key << " error=" << err << "\n";
    return false;
  }
  std::cout << "[session-data-store] stored key=" << key << " session_id=" << current_session_id_ << "\n";
  return true;
}

std::optional<nlohmann::json> SessionDataStore::Get(const std::string& ns, const std::string& key) {
  return GetKey(MakeKey(ns, key));
}

std::optional<nlohmann::json> SessionDataStore::GetKey(const std::string& key) {
  if (!EnsureInitialized()) return std::nullopt;
  std::lock_guard<std::mutex> lock(mu_);
  SyncSessionLocked();
  auto it = data_.find(key);
  if (it == data_.end()) return std::nullopt;
  return *it;
}

bool SessionDataStore::Has(const std::string& key) {
  return GetKey(key).has_value();
}

bool SessionDataStore::Delete(const std::string& key) {
  if (!EnsureInitialized()) return false;
  std::lock_guard<std::mutex> lock(mu_);
  SyncSessionLocked();
  auto it = data_.find(key);
  if (it == data_.end()) return false;
  auto removed = *it;
  data_.erase(it);
  std::string err;
  if (!SaveLocked(&err)) {
    data_[key] = std::move(removed);
    std::cout << "[session-data-store] error delete key=" << key << " error=" << err << "\n";
    return false;
  }
  std::cout << "[session-data-store] deleted key=" << key << "\n";
  return true;
}

bool SessionDataStore::Clear() {
  if (!EnsureInitialized()) return false;
  std::lock_guard<std::mutex> lock(mu_);
  SyncSessionLocked();
  auto previous = std::move(data_);
  data_ = nlohmann::json::object();
  std::string err;
  if (!SaveLocked(&err)) {
    data_ = std::move(previous);
    std::cout << "[session-data-store] error clear error=" << err << "\n";
    return false;
  }
  std::cout << "[session-data-store] cleared session_id=" << current_session_id_ << "\n";
  return true;
}

std::vector<std::string> SessionDataStore::ListSessions() {
  std::vector<std::string> out;
  if (!EnsureInitialized()) return out;
  std::error_code ec;
  fs::directory_iterator it(tracker_->SessionsDir(), ec);
  if (ec) {
    std::cout << "[session-data-store] error list sessions error=" << ec.message() << "\n";
    return out;
  }
  for (const auto& entry : it) {
    const auto& p = entry.path();
    if (p.extension() != ".json") continue;
    auto stem = p.stem().string();
    if (stem == "index") continue;
    out.push_back(std::move(stem));
  }
  return out;
}

std::optional<nlohmann::json> SessionDataStore::ReadSessionFile(const std::string& session_id) {
  std::string err;
  auto j = ReadJsonFile(SessionFilePath(session_id), &err);
  if (!j) {
    if (!err.empty()) std::cout << "[session-data-store] warn reading session " << session_id << ": " << err << "\n";
    return std::nullopt;
  }
  if (!j->is_object()) return std::nullopt;
  return j;
}

std::optional<nlohmann::json> SessionDataStore::RetrieveAcrossSessions(const std::string& ns, const std::string& key) {
  return RetrieveKeyAcrossSessions(MakeKey(ns, key));
}

std::optional<nlohmann::json> SessionDataStore::RetrieveKeyAcrossSessions(const std::string& key) {
  if (!EnsureInitialized()) return std::nullopt;
  std::string active;
  {
    std::lock_guard<std::mutex> lock(mu_);
    SyncSessionLocked();
    active = current_session_id_;
    auto it = data_.find(key);
    if (it != data_.end()) return *it;
  }

  for (const auto& session_id : ListSessions()) {
    if (session_id == active) continue;
    auto data = ReadSessionFile(session_id);
    if (!data) continue;
    auto it = data->find(key);
    if (it != data->end()) {
      std::cout << "[session-data-store] retrieved key=" << key << " from session_id=" << session_id << "\n";
      return *it;
    }
  }
  std::cout << "[session-data-store] warn key not found in any session key=" << key << "\n";
  return std::nullopt;
}

std::optional<nlohmann::json> SessionDataStore::GetPreviousSessionData(const std::string& session_id,
                                                                       const std::string& key) {
  if (!EnsureInitialized()) return std::nullopt;
  auto data = ReadSessionFile(session_id);
  if (!data) return std::nullopt;
  auto it = data->find(key);
  if (it == data->end()) return std::nullopt;
  return *it;
}

AssertionRecord SessionDataStore::Assert(const std::string& name, bool condition, const std::string& message) {
  AssertionRecord a;
  a.name = name;
  a.passed = condition;
  a.message = message.empty() ? std::string("Assertion ") + (condition ? "passed" : "failed") + ": " + name : message;
  a.timestamp_ms = clock_->WallMs();

  if (!EnsureInitialized()) {
    a.passed = false;
    a.error = "initialization failed: " + init_.last_error();
    a.message = "Assertion failed due to error: " + a.error;
    return a;
  }

  std::lock_guard<std::mutex> lock(mu_);
  SyncSessionLocked();
  auto previous = data_.contains(kAssertionsKey) ? std::optional<nlohmann::json>(data_[kAssertionsKey]) : std::nullopt;
  if (!data_.contains(kAssertionsKey) || !data_[kAssertionsKey].is_array()) {
    data_[kAssertionsKey] = nlohmann::json::array();
  }
  data_[kAssertionsKey].push_back(ToJson(a));
  std::string err;
  if (!SaveLocked(&err)) {
    if (previous) data_[kAssertionsKey] = *previous; else data_.erase(kAssertionsKey);
    a.passed = false;
    a.error = err;
    a.message = "Assertion failed due to error: " + err;
    return a;
  }
  std::cout << "[session-data-store] assertion name=" << name << " passed=" << (a.passed ? 1 : 0) << "\n";
  return a;
}

nlohmann::json SessionDataStore::CompleteTest() {
  if (!EnsureInitialized()) return {{"success", false}, {"error", init_.last_error()}};

  nlohmann::json summary;
  {
    std::lock_guard<std::mutex> lock(mu_);
    SyncSessionLocked();
    nlohmann::json assertions = nlohmann::json::array();
    if (data_.contains(kAssertionsKey) && data_[kAssertionsKey].is_array()) assertions = data_[kAssertionsKey];
    size_t passed = 0;
    for (const auto& a : assertions) {
      if (a.is_object() && a.contains("passed") && a["passed"].is_boolean() && a["passed"].get<bool>()) passed++;
    }
    const size_t total = assertions.size();
    auto string_or = [&](const char* key, const char* fallback) {
      if (data_.contains(key) && data_[key].is_string()) return data_[key].get<std::string>();
      return std::string(fallback);
    };
    const int64_t now = clock_->WallMs();
    int64_t start = now;
    if (data_.contains("startTime") && data_["startTime"].is_number()) start = data_["startTime"].get<int64_t>();

    summary["testId"] = string_or("testId", "unknown");
    summary["testName"] = string_or("testName", "Unnamed Test");
    summary["description"] = string_or("description", "");
    summary["startTime"] = start;
    summary["endTime"] = now;
    summary["duration"] = now - start;
    summary["totalAssertions"] = total;
    summary["passedAssertions"] = passed;
    summary["successRate"] = total > 0 ? static_cast<double>(passed) / static_cast<double>(total) * 100.0 : 0.0;
    summary["assertions"] = assertions;

    data_[kTestSummaryKey] = summary;
    std::string err;
    if (!SaveLocked(&err)) {
      std::cout << "[session-data-store] error saving test summary error=" << err << "\n";
      return {{"success", false}, {"error", err}};
    }
  }

  std::string stem = summary["testId"].get<std::string>();
  if (!IsSafeFileName(stem)) {
    std::cout << "[session-data-store] warn unsafe test id for report name testId=" << summary["testId"].dump() << "\n";
    stem = "unknown";
  }
  const auto report = (fs::path(results_dir_) / (stem + "-report.json")).string();
  std::string err;
  if (!WriteJsonFileAtomic(report, summary, &err)) {
    std::cout << "[session-data-store] error writing report error=" << err << "\n";
    return {{"success", false}, {"error", err}};
  }
  std::cout << "[session-data-store] test completed success_rate=" << summary["successRate"].get<double>()
            << " report=" << report << "\n";
  return summary;
}

SessionBoundaryMarker SessionDataStore::CreateSessionBoundary(const std::string& type, const nlohmann::json& data) {
  SessionBoundaryMarker marker;
  marker.type = type.empty() ? "generic" : type;
  marker.data = data.is_object() ? data : nlohmann::json::object();
  if (!EnsureInitialized()) {
    marker.error = "initialization failed: " + init_.last_error();
    return marker;
  }

  marker.timestamp_ms = clock_->WallMs();
  marker.id = "boundary-" + std::to_string(marker.timestamp_ms) + "-" + RandomHex(3);
  marker.session_id = CurrentSessionId();

  nlohmann::json mj;
  mj["id"] = marker.id;
  mj["timestamp"] = marker.timestamp_ms;
  mj["sessionId"] = marker.session_id;
  mj["type"] = marker.type;
  mj["data"] = marker.data;
  if (!StoreKey("boundary-" + marker.id, mj)) {
    marker.error = "failed to store boundary marker";
    return marker;
  }

  BoundaryData bd;
  bd.id = marker.id;
  bd.type = "session_boundary";
  bd.metadata = {{"source", "session-data-store"}, {"boundaryType", marker.type}, {"data", marker.data}};
  auto recorded = tracker_->RecordTokenBoundary(bd);
  if (!recorded.success) {
    std::cout << "[session-data-store] warn tracker did not record boundary id=" << marker.id
              << " error=" << recorded.error << "\n";
  }

  marker.success = true;
  std::cout << "[session-data-store] boundary marker id=" << marker.id << " type=" << marker.type << "\n";
  return marker;
}

SessionState SessionDataStore::GetSessionState() {
  SessionState state;
  if (!EnsureInitialized()) {
    state.error = "initialization failed: " + init_.last_error();
    state.session_id = "fallback-session-" + std::to_string(clock_->WallMs());
    return state;
  }

  {
    std::lock_guard<std::mutex> lock(mu_);
    SyncSessionLocked();
    state.session_id = current_session_id_;
    for (auto it = data_.begin(); it != data_.end(); ++it) state.data_keys.push_back(it.key());
  }

  const int64_t now = clock_->WallMs();
  auto info = tracker_->GetBoundaryInfo(state.session_id);
  if (info.success) {
    state.previous_session_id = info.previous_session_id;
    state.start_time_ms = info.start_time_ms;
    state.last_update_ms = info.last_activity_ms;
    state.proximity = info.proximity;
    state.continuity_score = info.continuity_score;
  } else {
    std::cout << "[session-data-store] warn boundary info unavailable error=" << info.error << "\n";
    state.start_time_ms = now;
    state.last_update_ms = now;
  }
  state.success = true;
  return state;
}

std::string SessionDataStore::CurrentSessionId() {
  if (!EnsureInitialized()) return tracker_->GetCurrentSessionId();
  std::lock_guard<std::mutex> lock(mu_);
  SyncSessionLocked();
  return current_session_id_;
}

}  // namespace continuity
