#include "config.hpp"

#include <cstdlib>
#include <filesystem>
#include <string>

namespace continuity {
namespace {

static bool StartsWith(const std::string& s, const std::string& prefix) {
  return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

static std::string GetEnvStr(const char* name) {
  const char* v = std::getenv(name);
  return v ? std::string(v) : std::string();
}

static std::string ToLower(std::string s) {
  for (auto& c : s) {
    if (c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a');
  }
  return s;
}

static bool TryParseBool(const std::string& s, bool* out) {
  if (!out) return false;
  const std::string v = ToLower(s);
  if (v == "1" || v == "true" || v == "yes" || v == "y" || v == "on") {
    *out = true;
    return true;
  }
  if (v == "0" || v == "false" || v == "no" || v == "n" || v == "off") {
    *out = false;
    return true;
  }
  return false;
}

static bool TryParseInt64(const std::string& s, int64_t* out) {
  if (!out || s.empty()) return false;
  char* end = nullptr;
  long long n = std::strtoll(s.c_str(), &end, 10);
  if (end == s.c_str() || *end != '\0') return false;
  *out = static_cast<int64_t>(n);
  return true;
}

static void ReadPositiveInt64(const char* name, int64_t* out) {
  int64_t v = 0;
  if (TryParseInt64(GetEnvStr(name), &v) && v > 0) *out = v;
}

static std::string JoinData(const std::string& dir, const std::string& name) {
  return (std::filesystem::path(dir) / name).string();
}

}  // namespace

HttpEndpoint ParseHttpEndpoint(const std::string& url, int default_port) {
  HttpEndpoint ep;
  ep.port = 0;
  std::string s = url;
  if (StartsWith(s, "http://")) {
    ep.scheme = "http";
    s = s.substr(7);
  } else if (StartsWith(s, "https://")) {
    ep.scheme = "https";
    s = s.substr(8);
  }

  auto slash_pos = s.find('/');
  if (slash_pos != std::string::npos) {
    ep.base_path = s.substr(slash_pos);
    s = s.substr(0, slash_pos);
  }

  auto colon_pos = s.rfind(':');
  if (colon_pos != std::string::npos) {
    ep.host = s.substr(0, colon_pos);
    ep.port = std::atoi(s.substr(colon_pos + 1).c_str());
  } else if (!s.empty()) {
    ep.host = s;
  }
  if (ep.port == 0) ep.port = default_port;
  if (ep.host.empty()) ep.host = "127.0.0.1";
  return ep;
}

void ResolveDataPaths(ContinuityConfig* cfg) {
  if (!cfg) return;
  if (cfg->data_dir.empty()) cfg->data_dir = "data";
  if (cfg->sessions_dir.empty()) cfg->sessions_dir = JoinData(cfg->data_dir, "sessions");
  if (cfg->log.embeddings_file.empty()) cfg->log.embeddings_file = JoinData(cfg->data_dir, "embeddings.jsonl");
  if (cfg->log.chunks_file.empty()) cfg->log.chunks_file = JoinData(cfg->data_dir, "chunks.jsonl");
  if (cfg->log.binary_embeddings_dir.empty()) {
    cfg->log.binary_embeddings_dir = JoinData(cfg->data_dir, "binary-embeddings");
  }
  if (cfg->log.scratch_dir.empty()) {
    std::error_code ec;
    auto tmp = std::filesystem::temp_directory_path(ec);
    cfg->log.scratch_dir = ec ? JoinData(cfg->data_dir, "tmp") : (tmp / "continuity-append-log").string();
  }
  if (cfg->assembler.context_dir.empty()) cfg->assembler.context_dir = JoinData(cfg->data_dir, "context");
  if (cfg->vision_file.empty()) cfg->vision_file = JoinData(cfg->data_dir, "vision.json");
  if (cfg->metacognitive_file.empty()) cfg->metacognitive_file = JoinData(cfg->data_dir, "metacognitive.json");
}

ContinuityConfig LoadConfigFromEnv() {
  ContinuityConfig cfg;

  if (auto host = GetEnvStr("CONTINUITY_LISTEN_HOST"); !host.empty()) cfg.listen.host = host;
  if (auto port = GetEnvStr("CONTINUITY_LISTEN_PORT"); !port.empty()) cfg.listen.port = std::atoi(port.c_str());

  if (auto dir = GetEnvStr("CONTINUITY_DATA_DIR"); !dir.empty()) cfg.data_dir = dir;
  if (auto dir = GetEnvStr("CONTINUITY_SESSIONS_DIR"); !dir.empty()) cfg.sessions_dir = dir;
  ReadPositiveInt64("CONTINUITY_SESSION_TIMEOUT_MS", &cfg.session_timeout_ms);

  if (auto f = GetEnvStr("CONTINUITY_EMBEDDINGS_FILE"); !f.empty()) cfg.log.embeddings_file = f;
  if (auto f = GetEnvStr("CONTINUITY_CHUNKS_FILE"); !f.empty()) cfg.log.chunks_file = f;
  if (auto d = GetEnvStr("CONTINUITY_BINARY_EMBEDDINGS_DIR"); !d.empty()) cfg.log.binary_embeddings_dir = d;
  if (auto d = GetEnvStr("CONTINUITY_SCRATCH_DIR"); !d.empty()) cfg.log.scratch_dir = d;
  if (auto b = GetEnvStr("CONTINUITY_ENABLE_BINARY_STORAGE"); !b.empty()) {
    bool v = false;
    if (TryParseBool(b, &v)) cfg.log.enable_binary_storage = v;
  }
  int64_t n = 0;
  if (TryParseInt64(GetEnvStr("CONTINUITY_MAX_BATCH_SIZE"), &n) && n > 0) cfg.log.max_batch_size = static_cast<int>(n);
  ReadPositiveInt64("CONTINUITY_WRITE_BUFFER_INTERVAL_MS", &cfg.log.flush_interval_ms);
  if (TryParseInt64(GetEnvStr("CONTINUITY_WRITE_BUFFER_MAX_SIZE"), &n) && n > 0) {
    cfg.log.buffer_max_size = static_cast<size_t>(n);
  }

  ReadPositiveInt64("CONTINUITY_CACHE_TTL_MS", &cfg.assembler.cache_ttl_ms);
  if (auto b = GetEnvStr("CONTINUITY_CACHE_ENABLED"); !b.empty()) {
    bool v = true;
    if (TryParseBool(b, &v)) cfg.assembler.cache_enabled = v;
  }
  if (TryParseInt64(GetEnvStr("CONTINUITY_COMPRESSION_THRESHOLD"), &n) && n >= 0) {
    cfg.assembler.compression_threshold = static_cast<size_t>(n);
  }
  if (auto b = GetEnvStr("CONTINUITY_COMPRESSION_ENABLED"); !b.empty()) {
    bool v = true;
    if (TryParseBool(b, &v)) cfg.assembler.compression_enabled = v;
  }
  if (auto s = GetEnvStr("CONTINUITY_DEFAULT_STRATEGY"); !s.empty()) cfg.assembler.default_strategy = ToLower(s);
  if (auto d = GetEnvStr("CONTINUITY_CONTEXT_DIR"); !d.empty()) cfg.assembler.context_dir = d;

  if (auto host = GetEnvStr("CONTINUITY_EMBED_HOST"); !host.empty()) {
    cfg.embedding.endpoint = ParseHttpEndpoint(host, 11434);
  }
  if (auto api = GetEnvStr("CONTINUITY_EMBED_API"); !api.empty()) cfg.embedding.api = ToLower(api);
  if (auto model = GetEnvStr("CONTINUITY_EMBED_MODEL"); !model.empty()) cfg.embedding.model = model;

  if (auto f = GetEnvStr("CONTINUITY_VISION_FILE"); !f.empty()) cfg.vision_file = f;
  if (auto f = GetEnvStr("CONTINUITY_METACOGNITIVE_FILE"); !f.empty()) cfg.metacognitive_file = f;

  ResolveDataPaths(&cfg);
  return cfg;
}

}  // namespace continuity
