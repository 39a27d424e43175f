#pragma once

#include <cstdint>
#include <string>

namespace continuity {

struct HttpListenConfig {
  std::string host = "0.0.0.0";
  int port = 8080;
};

struct HttpEndpoint {
  std::string scheme = "http";
  std::string host = "127.0.0.1";
  int port = 11434;
  std::string base_path;
};

struct AppendLogConfig {
  std::string embeddings_file;
  std::string chunks_file;
  std::string binary_embeddings_dir;
  std::string scratch_dir;
  bool enable_binary_storage = false;
  int max_batch_size = 100;
  int64_t flush_interval_ms = 5000;
  size_t buffer_max_size = 1000;
};

struct AssemblerConfig {
  std::string context_dir;
  std::string default_strategy = "standard";
  bool cache_enabled = true;
  int64_t cache_ttl_ms = 5 * 60 * 1000;
  bool compression_enabled = true;
  size_t compression_threshold = 1000;
  bool validation_enabled = true;
  size_t max_history_items = 20;
};

struct EmbeddingConfig {
  HttpEndpoint endpoint;
  // "openai" posts to /v1/embeddings, "ollama" posts to /api/embeddings.
  std::string api = "ollama";
  std::string model = "nomic-embed-text";
  int connect_timeout_seconds = 5;
  int read_timeout_seconds = 10;
};

struct ContinuityConfig {
  HttpListenConfig listen;
  std::string data_dir = "data";
  std::string sessions_dir;
  int64_t session_timeout_ms = 30 * 60 * 1000;
  AppendLogConfig log;
  AssemblerConfig assembler;
  EmbeddingConfig embedding;
  std::string vision_file;
  std::string metacognitive_file;
};

// Fills derived paths (sessions dir, log files, context dir, documents) from data_dir
// where they were left empty.
void ResolveDataPaths(ContinuityConfig* cfg);

ContinuityConfig LoadConfigFromEnv();

HttpEndpoint ParseHttpEndpoint(const std::string& url, int default_port);

}  // namespace continuity
