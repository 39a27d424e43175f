#pragma once

#include "clock.hpp"
#include "config.hpp"
#include "init_retry.hpp"

#include <nlohmann/json.hpp>

#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace continuity {

struct AppendLogStats {
  uint64_t flush_count = 0;
  uint64_t failed_flushes = 0;
  uint64_t skipped_flushes = 0;
  uint64_t chunks_written = 0;
  uint64_t embeddings_written = 0;
  uint64_t records_dropped = 0;
  size_t pending_chunks = 0;
  size_t pending_embeddings = 0;
};

nlohmann::json ToJson(const AppendLogStats& s);

// Buffered JSONL store for chunk and embedding records. Each flush rewrites a
// file as (existing content + new lines) through a temp file and rename, with
// a timestamped backup restored on failure, so readers never see a torn line.
class AppendLog {
 public:
  explicit AppendLog(AppendLogConfig cfg, const Clock* clock = DefaultClock());
  ~AppendLog();

  AppendLog(const AppendLog&) = delete;
  AppendLog& operator=(const AppendLog&) = delete;

  // Creates directories and starts the periodic flush thread.
  InitResult Initialize();

  // Records must be JSON objects. Missing chunk_id / id and timestamp are
  // filled in. Embeddings without a "vector" array are rejected. Throws
  // InvariantViolation after Shutdown().
  bool AddChunk(nlohmann::json chunk);
  bool AddEmbedding(nlohmann::json embedding);
  // {"chunks": [...], "embeddings": [...]}
  bool AddBatch(const nlohmann::json& batch);

  // Returns false when nothing could be written or another flush is running.
  bool Flush();

  // Stops the timer and flushes what is left. Idempotent.
  bool Shutdown();

  std::vector<nlohmann::json> ReadChunks(std::string* err = nullptr) const;
  // Records stored with vector_ref get their vector loaded from the sidecar.
  std::vector<nlohmann::json> ReadEmbeddings(std::string* err = nullptr) const;
  std::optional<std::vector<float>> LoadVector(const std::string& id) const;

  AppendLogStats Stats() const;
  const AppendLogConfig& config() const { return cfg_; }

 private:
  bool AddChunkLocked(nlohmann::json chunk);
  bool AddEmbeddingLocked(nlohmann::json embedding);
  bool BufferFullLocked() const;
  void CheckOpen() const;
  bool FlushImpl(bool wait);

  bool AppendJsonl(const std::string& path,
                   const std::vector<nlohmann::json>& records,
                   size_t* written,
                   std::string* err);
  // Moves each vector into <binary dir>/<id>.bin and leaves a vector_ref.
  size_t WriteBinaryVectors(std::vector<nlohmann::json>* records);
  void RestoreLatestBackup(const std::string& path);
  std::vector<nlohmann::json> ReadJsonl(const std::string& path, std::string* err) const;
  void TimerLoop();

  AppendLogConfig cfg_;
  const Clock* clock_;
  InitRetryPolicy init_;

  mutable std::mutex buffer_mu_;
  std::vector<nlohmann::json> chunks_;
  std::vector<nlohmann::json> embeddings_;
  bool shut_down_ = false;

  // Held for the duration of a flush; taken with try_lock.
  std::mutex flush_mu_;

  mutable std::mutex stats_mu_;
  AppendLogStats stats_;

  std::mutex timer_mu_;
  std::condition_variable timer_cv_;
  bool stop_timer_ = false;
  std::thread timer_;
};

}  // namespace continuity
