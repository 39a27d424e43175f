#include "append_log.hpp"
#include "config.hpp"
#include "context_assembler.hpp"
#include "continuity_router.hpp"
#include "embedding_client.hpp"
#include "errors.hpp"
#include "providers/document_provider.hpp"
#include "providers/semantic_recall_provider.hpp"
#include "providers/session_provider.hpp"
#include "session_data_store.hpp"
#include "session_tracker.hpp"

#include <httplib.h>
#include <nlohmann/json.hpp>

#include <chrono>
#include <exception>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>

namespace {

static void LogInit(const char* component, const continuity::InitResult& r) {
  if (r.success) return;
  std::cout << "[runtime] warn " << component << " not initialized, running degraded error=" << r.error << "\n";
}

static int Run(const continuity::ContinuityConfig& cfg) {
  std::cout << "[runtime] data_dir=" << cfg.data_dir << " sessions_dir=" << cfg.sessions_dir
            << " session_timeout_ms=" << cfg.session_timeout_ms << "\n";
  std::cout << "[provider] embedding api=" << cfg.embedding.api << " endpoint=" << cfg.embedding.endpoint.scheme << "://"
            << cfg.embedding.endpoint.host << ":" << cfg.embedding.endpoint.port << cfg.embedding.endpoint.base_path
            << " model=" << cfg.embedding.model << "\n";

  continuity::SessionTrackerConfig tracker_cfg;
  tracker_cfg.sessions_dir = cfg.sessions_dir;
  tracker_cfg.timeout_ms = cfg.session_timeout_ms;
  continuity::SessionTracker tracker(tracker_cfg);
  LogInit("session-tracker", tracker.Initialize());

  continuity::SessionDataStore store(&tracker, continuity::DefaultClock(),
                                     (std::filesystem::path(cfg.data_dir) / "test-results").string());
  LogInit("session-data-store", store.Initialize());

  continuity::AppendLog log(cfg.log);
  LogInit("append-log", log.Initialize());

  continuity::HttpEmbeddingBackend embedder(cfg.embedding);

  continuity::ContextAssembler assembler(cfg.assembler, &store, &embedder);
  assembler.RegisterProvider(std::make_unique<continuity::DocumentContextProvider>(
      continuity::VisionDocumentConfig(cfg.vision_file)));
  assembler.RegisterProvider(std::make_unique<continuity::DocumentContextProvider>(
      continuity::MetacognitiveDocumentConfig(cfg.metacognitive_file)));
  assembler.RegisterProvider(std::make_unique<continuity::SessionContextProvider>(&store));
  assembler.RegisterProvider(std::make_unique<continuity::SemanticRecallProvider>(&log, &embedder));
  LogInit("context-assembler", assembler.Initialize());

  continuity::ContinuityRouter router(&tracker, &store, &assembler, &log,
                                      static_cast<size_t>(cfg.log.max_batch_size));

  httplib::Server server;
  router.Register(&server);

  server.set_exception_handler([](const httplib::Request& req, httplib::Response& res, std::exception_ptr ep) {
    std::string message = "unknown exception";
    std::string type = "server_error";
    if (ep) {
      try {
        std::rethrow_exception(ep);
      } catch (const continuity::InvariantViolation& e) {
        message = e.what();
        type = "invariant_violation";
      } catch (const std::exception& e) {
        message = e.what();
      }
    }
    std::cout << "[http] error " << req.method << " " << req.path << " type=" << type << " message=" << message << "\n";
    nlohmann::json j;
    j["error"] = {{"message", message}, {"type", type}};
    res.status = 500;
    res.set_content(j.dump(), "application/json");
  });

  server.set_error_handler([](const httplib::Request&, httplib::Response& res) {
    if (!res.body.empty()) return;
    std::string message;
    std::string type = "invalid_request_error";
    if (res.status == 404) {
      message = "not found";
    } else if (res.status >= 500) {
      message = "internal error";
      type = "server_error";
    } else {
      message = "bad request";
    }
    nlohmann::json j;
    j["error"] = {{"message", message}, {"type", type}};
    res.set_content(j.dump(), "application/json");
  });

  server.set_keep_alive_timeout(5);
  server.set_read_timeout(60);
  server.set_write_timeout(60);

  server.Get("/health", [&](const httplib::Request&, httplib::Response& res) {
    nlohmann::json j;
    j["ok"] = true;
    j["session_id"] = tracker.PeekCurrentSessionId();
    j["unix_seconds"] =
        std::chrono::duration_cast<std::chrono::seconds>(std::chrono::system_clock::now().time_since_epoch()).count();
    res.status = 200;
    res.set_content(j.dump(), "application/json");
  });

  std::cout << "[http] listen host=" << cfg.listen.host << " port=" << cfg.listen.port << "\n";
  const bool ok = server.listen(cfg.listen.host, cfg.listen.port);
  std::cout << "[http] listen returned ok=" << (ok ? 1 : 0) << "\n";
  const bool flushed = log.Shutdown();
  return ok && flushed ? 0 : 1;
}

}  // namespace

int main() {
  std::cout.setf(std::ios::unitbuf);
  auto cfg = continuity::LoadConfigFromEnv();
  try {
    return Run(cfg);
  } catch (const continuity::ConfigurationError& e) {
    std::cout << "[runtime] fatal configuration error: " << e.what() << "\n";
    return 2;
  }
}
