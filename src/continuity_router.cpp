#include "continuity_router.hpp"

#include "errors.hpp"

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <iostream>
#include <string>

namespace continuity {
namespace {

static nlohmann::json MakeError(const std::string& message, const std::string& type) {
  nlohmann::json j;
  j["error"] = {{"message", message}, {"type", type}};
  return j;
}

static void SendJson(httplib::Response* res, int status, const nlohmann::json& body) {
  res->status = status;
  res->set_content(body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace), "application/json");
}

static nlohmann::json ParseJsonBody(const httplib::Request& req) {
  return nlohmann::json::parse(req.body, nullptr, false);
}

static void LogRequest(const httplib::Request& req) {
  std::cout << "[http] " << req.method << " " << req.path << " body_bytes=" << req.body.size() << "\n";
}

static std::string OptionalString(const nlohmann::json& j, const char* key) {
  if (!j.is_object()) return {};
  auto it = j.find(key);
  if (it == j.end() || !it->is_string()) return {};
  return it->get<std::string>();
}

static bool ParseContextRequest(const nlohmann::json& j, ContextRequest* out, std::string* err) {
  out->strategy = OptionalString(j, "strategy");
  out->session_id = OptionalString(j, "session_id");
  auto format = OptionalString(j, "format");
  if (!format.empty()) out->format = format;
  if (j.contains("limit") && !j["limit"].is_null()) {
    if (!j["limit"].is_number_integer()) {
      *err = "limit must be an integer";
      return false;
    }
    out->limit = j["limit"].get<int>();
  }
  if (j.contains("min_relevance") && !j["min_relevance"].is_null()) {
    if (!j["min_relevance"].is_number()) {
      *err = "min_relevance must be a number";
      return false;
    }
    out->min_relevance = j["min_relevance"].get<double>();
  }
  if (j.contains("boundary_info") && j["boundary_info"].is_object()) out->boundary_info = j["boundary_info"];
  return true;
}

static nlohmann::json InjectionJson(const InjectionResult& r) {
  auto out = ToJson(r);
  out["contextItems"] = nlohmann::json::array();
  for (const auto& item : r.items) out["contextItems"].push_back(ToJson(item));
  return out;
}

// Accepts {"<field>": [...]}, a bare array, or a single object.
static nlohmann::json RecordsFromBody(const nlohmann::json& j, const char* field) {
  if (j.is_array()) return j;
  if (j.is_object() && j.contains(field) && j[field].is_array()) return j[field];
  if (j.is_object()) return nlohmann::json::array({j});
  return nlohmann::json::array();
}

static std::string DataKey(const httplib::Request& req, const nlohmann::json& body) {
  std::string ns = req.has_param("namespace") ? req.get_param_value("namespace") : OptionalString(body, "namespace");
  std::string key = req.has_param("key") ? req.get_param_value("key") : OptionalString(body, "key");
  if (key.empty()) return {};
  return ns.empty() ? key : SessionDataStore::MakeKey(ns, key);
}

}  // namespace

ContinuityRouter::ContinuityRouter(SessionTracker* tracker,
                                   SessionDataStore* store,
                                   ContextAssembler* assembler,
                                   AppendLog* log,
                                   size_t max_batch_size)
    : tracker_(tracker), store_(store), assembler_(assembler), log_(log), max_batch_size_(max_batch_size) {
  if (!tracker_ || !store_ || !assembler_ || !log_) {
    throw ConfigurationError("ContinuityRouter requires tracker, data store, assembler and append log");
  }
  if (max_batch_size_ == 0) max_batch_size_ = 1;
}

void ContinuityRouter::Register(httplib::Server* server) {
  server->Get("/v1/session", [this](const httplib::Request& req, httplib::Response& res) {
    LogRequest(req);
    SendJson(&res, 200, ToJson(store_->GetSessionState()));
  });

  server->Post("/v1/session/boundary", [this](const httplib::Request& req, httplib::Response& res) {
    LogRequest(req);
    auto j = req.body.empty() ? nlohmann::json::object() : ParseJsonBody(req);
    if (j.is_discarded() || !j.is_object()) return SendJson(&res, 400, MakeError("invalid json body", "invalid_request_error"));
    auto data = j.contains("data") && j["data"].is_object() ? j["data"] : nlohmann::json::object();
    auto marker = store_->CreateSessionBoundary(OptionalString(j, "type"), data);
    if (!marker.success) return SendJson(&res, 500, MakeError(marker.error, "storage_error"));
    nlohmann::json out;
    out["success"] = true;
    out["id"] = marker.id;
    out["sessionId"] = marker.session_id;
    out["timestamp"] = marker.timestamp_ms;
    out["type"] = marker.type;
    SendJson(&res, 200, out);
  });

  server->Post("/v1/session/complete", [this](const httplib::Request& req, httplib::Response& res) {
    LogRequest(req);
    const bool ok = tracker_->CompleteCurrentSession();
    SendJson(&res, ok ? 200 : 500, {{"success", ok}});
  });

  server->Get("/v1/session/boundary_info", [this](const httplib::Request& req, httplib::Response& res) {
    LogRequest(req);
    auto session_id = req.has_param("session_id") ? req.get_param_value("session_id") : tracker_->PeekCurrentSessionId();
    auto info = tracker_->GetBoundaryInfo(session_id);
    SendJson(&res, info.success ? 200 : 404, ToJson(info));
  });

  server->Get("/v1/session/recent", [this](const httplib::Request& req, httplib::Response& res) {
    LogRequest(req);
    size_t limit = 5;
    if (req.has_param("limit")) {
      const auto v = std::atoi(req.get_param_value("limit").c_str());
      if (v <= 0) return SendJson(&res, 400, MakeError("limit must be positive", "invalid_request_error"));
      limit = static_cast<size_t>(v);
    }
    nlohmann::json out = nlohmann::json::array();
    for (const auto& r : tracker_->GetRecentSessions(limit)) out.push_back(ToJson(r));
    SendJson(&res, 200, {{"sessions", out}});
  });

  server->Get("/v1/sessions", [this](const httplib::Request& req, httplib::Response& res) {
    LogRequest(req);
    SendJson(&res, 200, {{"sessions", store_->ListSessions()}});
  });

  server->Post("/v1/data", [this](const httplib::Request& req, httplib::Response& res) {
    LogRequest(req);
    auto j = ParseJsonBody(req);
    if (j.is_discarded() || !j.is_object()) return SendJson(&res, 400, MakeError("invalid json body", "invalid_request_error"));
    const auto key = DataKey(req, j);
    if (key.empty()) return SendJson(&res, 400, MakeError("missing field: key", "invalid_request_error"));
    if (!j.contains("value")) return SendJson(&res, 400, MakeError("missing field: value", "invalid_request_error"));
    const bool ok = store_->StoreKey(key, j["value"]);
    SendJson(&res, ok ? 200 : 500, {{"success", ok}, {"key", key}});
  });

  server->Get("/v1/data", [this](const httplib::Request& req, httplib::Response& res) {
    LogRequest(req);
    const auto key = DataKey(req, nlohmann::json::object());
    if (key.empty()) return SendJson(&res, 400, MakeError("missing parameter: key", "invalid_request_error"));
    auto v = store_->GetKey(key);
    if (!v) return SendJson(&res, 404, MakeError("key not found", "not_found_error"));
    SendJson(&res, 200, {{"key", key}, {"value", *v}});
  });

  server->Delete("/v1/data", [this](const httplib::Request& req, httplib::Response& res) {
    LogRequest(req);
    const auto key = DataKey(req, nlohmann::json::object());
    if (key.empty()) {
      const bool ok = store_->Clear();
      return SendJson(&res, ok ? 200 : 500, {{"success", ok}, {"cleared", ok}});
    }
    const bool ok = store_->Delete(key);
    SendJson(&res, ok ? 200 : 404, {{"success", ok}, {"key", key}});
  });

  server->Get("/v1/data/across_sessions", [this](const httplib::Request& req, httplib::Response& res) {
    LogRequest(req);
    const auto key = DataKey(req, nlohmann::json::object());
    if (key.empty()) return SendJson(&res, 400, MakeError("missing parameter: key", "invalid_request_error"));
    auto v = store_->RetrieveKeyAcrossSessions(key);
    if (!v) return SendJson(&res, 404, MakeError("key not found in any session", "not_found_error"));
    SendJson(&res, 200, {{"key", key}, {"value", *v}});
  });

  server->Post("/v1/data/assert", [this](const httplib::Request& req, httplib::Response& res) {
    LogRequest(req);
    auto j = ParseJsonBody(req);
    if (j.is_discarded() || !j.is_object()) return SendJson(&res, 400, MakeError("invalid json body", "invalid_request_error"));
    const auto name = OptionalString(j, "name");
    if (name.empty()) return SendJson(&res, 400, MakeError("missing field: name", "invalid_request_error"));
    if (!j.contains("passed") || !j["passed"].is_boolean()) {
      return SendJson(&res, 400, MakeError("missing field: passed", "invalid_request_error"));
    }
    auto a = store_->Assert(name, j["passed"].get<bool>(), OptionalString(j, "message"));
    SendJson(&res, a.error.empty() ? 200 : 500, ToJson(a));
  });

  server->Post("/v1/data/complete_test", [this](const httplib::Request& req, httplib::Response& res) {
    LogRequest(req);
    auto summary = store_->CompleteTest();
    const bool failed = summary.contains("success") && summary["success"].is_boolean() && !summary["success"].get<bool>();
    SendJson(&res, failed ? 500 : 200, summary);
  });

  server->Post("/v1/context", [this](const httplib::Request& req, httplib::Response& res) {
    LogRequest(req);
    auto j = ParseJsonBody(req);
    if (j.is_discarded() || !j.is_object()) return SendJson(&res, 400, MakeError("invalid json body", "invalid_request_error"));
    ContextRequest cr;
    std::string err;
    if (!ParseContextRequest(j, &cr, &err)) return SendJson(&res, 400, MakeError(err, "invalid_request_error"));
    auto r = assembler_->InjectContext(OptionalString(j, "query"), cr);
    SendJson(&res, 200, InjectionJson(r));
  });

  server->Post("/v1/context/boundary", [this](const httplib::Request& req, httplib::Response& res) {
    LogRequest(req);
    auto j = req.body.empty() ? nlohmann::json::object() : ParseJsonBody(req);
    if (j.is_discarded() || !j.is_object()) return SendJson(&res, 400, MakeError("invalid json body", "invalid_request_error"));
    ContextRequest cr;
    std::string err;
    if (!ParseContextRequest(j, &cr, &err)) return SendJson(&res, 400, MakeError(err, "invalid_request_error"));
    auto boundary = j.contains("boundary") && j["boundary"].is_object() ? j["boundary"] : nlohmann::json::object();
    auto r = assembler_->InjectContextAtBoundary(boundary, cr);
    SendJson(&res, 200, InjectionJson(r));
  });

  server->Post("/v1/log/chunks", [this](const httplib::Request& req, httplib::Response& res) {
    LogRequest(req);
    auto j = ParseJsonBody(req);
    if (j.is_discarded()) return SendJson(&res, 400, MakeError("invalid json body", "invalid_request_error"));
    auto chunks = RecordsFromBody(j, "chunks");
    if (chunks.size() > max_batch_size_) {
      return SendJson(&res, 413, MakeError("batch exceeds max size " + std::to_string(max_batch_size_), "invalid_request_error"));
    }
    size_t accepted = 0;
    for (auto& c : chunks) {
      if (log_->AddChunk(std::move(c))) accepted++;
    }
    SendJson(&res, 200, {{"accepted", accepted}, {"rejected", chunks.size() - accepted}});
  });

  server->Post("/v1/log/embeddings", [this](const httplib::Request& req, httplib::Response& res) {
    LogRequest(req);
    auto j = ParseJsonBody(req);
    if (j.is_discarded()) return SendJson(&res, 400, MakeError("invalid json body", "invalid_request_error"));
    auto embeddings = RecordsFromBody(j, "embeddings");
    if (embeddings.size() > max_batch_size_) {
      return SendJson(&res, 413, MakeError("batch exceeds max size " + std::to_string(max_batch_size_), "invalid_request_error"));
    }
    size_t accepted = 0;
    for (auto& e : embeddings) {
      if (log_->AddEmbedding(std::move(e))) accepted++;
    }
    SendJson(&res, 200, {{"accepted", accepted}, {"rejected", embeddings.size() - accepted}});
  });

  server->Post("/v1/log/flush", [this](const httplib::Request& req, httplib::Response& res) {
    LogRequest(req);
    const bool ok = log_->Flush();
    auto out = ToJson(log_->Stats());
    out["success"] = ok;
    SendJson(&res, 200, out);
  });

  server->Get("/v1/status", [this](const httplib::Request& req, httplib::Response& res) {
    LogRequest(req);
    nlohmann::json out;
    out["sessionId"] = tracker_->PeekCurrentSessionId();
    out["assembler"] = assembler_->GetStatus();
    out["log"] = ToJson(log_->Stats());
    SendJson(&res, 200, out);
  });
}

}  // namespace continuity
