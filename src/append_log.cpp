#include "append_log.hpp"

#include "errors.hpp"
#include "file_util.hpp"

#include <algorithm>
#include <chrono>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>
#include <utility>

namespace continuity {
namespace {

namespace fs = std::filesystem;

static std::string ParentDir(const std::string& path) {
  return fs::path(path).parent_path().string();
}

static std::optional<std::vector<float>> ReadVectorFile(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) return std::nullopt;
  std::vector<char> bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  if (bytes.size() % sizeof(float) != 0) return std::nullopt;
  std::vector<float> out(bytes.size() / sizeof(float));
  if (!out.empty()) std::memcpy(out.data(), bytes.data(), bytes.size());
  return out;
}

static bool WriteVectorFile(const std::string& path, const std::vector<float>& v, std::string* err) {
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out) {
    if (err) *err = "open " + path + " failed";
    return false;
  }
  out.write(reinterpret_cast<const char*>(v.data()), static_cast<std::streamsize>(v.size() * sizeof(float)));
  out.flush();
  if (!out) {
    if (err) *err = "write " + path + " failed";
    return false;
  }
  return true;
}

static bool HasVectorArray(const nlohmann::json& j) {
  return j.contains("vector") && j["vector"].is_array();
}

}  // namespace

nlohmann::json ToJson(const AppendLogStats& s) {
  nlohmann::json j;
  j["flush_count"] = s.flush_count;
  j["failed_flushes"] = s.failed_flushes;
  j["skipped_flushes"] = s.skipped_flushes;
  j["chunks_written"] = s.chunks_written;
  j["embeddings_written"] = s.embeddings_written;
  j["records_dropped"] = s.records_dropped;
  j["pending_chunks"] = s.pending_chunks;
  j["pending_embeddings"] = s.pending_embeddings;
  return j;
}

AppendLog::AppendLog(AppendLogConfig cfg, const Clock* clock)
    : cfg_(std::move(cfg)), clock_(clock ? clock : DefaultClock()), init_("append-log") {
  if (cfg_.chunks_file.empty() || cfg_.embeddings_file.empty()) {
    throw ConfigurationError("AppendLog requires chunks_file and embeddings_file");
  }
  if (cfg_.enable_binary_storage && cfg_.binary_embeddings_dir.empty()) {
    throw ConfigurationError("AppendLog binary storage requires binary_embeddings_dir");
  }
  if (cfg_.buffer_max_size == 0) cfg_.buffer_max_size = 1;
}

AppendLog::~AppendLog() {
  Shutdown();
}

InitResult AppendLog::Initialize() {
  return init_.Run([this](std::string* err) {
    if (!EnsureDirectory(ParentDir(cfg_.chunks_file), err)) return false;
    if (!EnsureDirectory(ParentDir(cfg_.embeddings_file), err)) return false;
    if (cfg_.enable_binary_storage && !EnsureDirectory(cfg_.binary_embeddings_dir, err)) return false;
    if (!cfg_.scratch_dir.empty() && !EnsureDirectory(cfg_.scratch_dir, err)) return false;

    if (cfg_.flush_interval_ms > 0 && !timer_.joinable()) {
      std::lock_guard<std::mutex> lock(timer_mu_);
      stop_timer_ = false;
      timer_ = std::thread([this]() { TimerLoop(); });
    }
    std::cout << "[append-log] chunks=" << cfg_.chunks_file << " embeddings=" << cfg_.embeddings_file
              << " binary=" << (cfg_.enable_binary_storage ? 1 : 0) << " interval_ms=" << cfg_.flush_interval_ms
              << " buffer_max=" << cfg_.buffer_max_size << "\n";
    return true;
  });
}

void AppendLog::CheckOpen() const {
  if (shut_down_) throw InvariantViolation("AppendLog used after Shutdown()");
}

bool AppendLog::AddChunkLocked(nlohmann::json chunk) {
  if (!chunk.is_object()) {
    std::cout << "[append-log] warn chunk is not an object\n";
    return false;
  }
  if (!chunk.contains("chunk_id") || chunk["chunk_id"].is_null() ||
      (chunk["chunk_id"].is_string() && chunk["chunk_id"].get<std::string>().empty())) {
    chunk["chunk_id"] = RandomHex(16);
  }
  if (!chunk.contains("timestamp") || chunk["timestamp"].is_null()) chunk["timestamp"] = clock_->WallMs();
  chunks_.push_back(std::move(chunk));
  return true;
}

bool AppendLog::AddEmbeddingLocked(nlohmann::json embedding) {
  if (!embedding.is_object()) {
    std::cout << "[append-log] warn embedding is not an object\n";
    return false;
  }
  if (!HasVectorArray(embedding)) {
    std::cout << "[append-log] warn embedding must have a vector array\n";
    return false;
  }
  if (!embedding.contains("id") || embedding["id"].is_null() ||
      (embedding["id"].is_string() && embedding["id"].get<std::string>().empty())) {
    embedding["id"] = RandomHex(16);
  }
  if (!embedding.contains("timestamp") || embedding["timestamp"].is_null()) embedding["timestamp"] = clock_->WallMs();
  embeddings_.push_back(std::move(embedding));
  return true;
}

bool AppendLog::BufferFullLocked() const {
  return chunks_.size() >= cfg_.buffer_max_size || embeddings_.size() >= cfg_.buffer_max_size;
}

bool AppendLog::AddChunk(nlohmann::json chunk) {
  bool full = false;
  {
    std::lock_guard<std::mutex> lock(buffer_mu_);
    CheckOpen();
    if (!AddChunkLocked(std::move(chunk))) return false;
    full = BufferFullLocked();
  }
  if (full) FlushImpl(false);
  return true;
}

bool AppendLog::AddEmbedding(nlohmann::json embedding) {
  bool full = false;
  {
    std::lock_guard<std::mutex> lock(buffer_mu_);
    CheckOpen();
    if (!AddEmbeddingLocked(std::move(embedding))) return false;
    full = BufferFullLocked();
  }
  if (full) FlushImpl(false);
  return true;
}

bool AppendLog::AddBatch(const nlohmann::json& batch) {
  if (!batch.is_object()) return false;
  bool full = false;
  {
    std::lock_guard<std::mutex> lock(buffer_mu_);
    CheckOpen();
    auto chunks = batch.find("chunks");
    if (chunks != batch.end() && chunks->is_array()) {
      for (const auto& c : *chunks) AddChunkLocked(c);
    }
    auto embeddings = batch.find("embeddings");
    if (embeddings != batch.end() && embeddings->is_array()) {
      for (const auto& e : *embeddings) AddEmbeddingLocked(e);
    }
    full = BufferFullLocked();
  }
  if (full) FlushImpl(false);
  return true;
}

bool AppendLog::Flush() {
  {
    std::lock_guard<std::mutex> lock(buffer_mu_);
    CheckOpen();
  }
  return FlushImpl(false);
}

bool AppendLog::FlushImpl(bool wait) {
  std::unique_lock<std::mutex> guard(flush_mu_, std::defer_lock);
  if (wait) {
    guard.lock();
  } else if (!guard.try_lock()) {
    std::lock_guard<std::mutex> lock(stats_mu_);
    stats_.skipped_flushes++;
    return false;
  }

  std::vector<nlohmann::json> chunks;
  std::vector<nlohmann::json> embeddings;
  {
    std::lock_guard<std::mutex> lock(buffer_mu_);
    chunks.swap(chunks_);
    embeddings.swap(embeddings_);
  }
  if (chunks.empty() && embeddings.empty()) return true;

  bool ok = true;
  size_t chunks_written = 0;
  size_t embeddings_written = 0;
  size_t dropped = 0;

  if (!chunks.empty()) {
    std::string err;
    if (AppendJsonl(cfg_.chunks_file, chunks, &chunks_written, &err)) {
      std::cout << "[append-log] wrote chunks=" << chunks_written << " file=" << cfg_.chunks_file << "\n";
    } else {
      ok = false;
      std::cout << "[append-log] error flushing chunks error=" << err << "\n";
    }
    dropped += chunks.size() - chunks_written;
  }

  if (!embeddings.empty()) {
    const size_t total = embeddings.size();
    if (cfg_.enable_binary_storage) WriteBinaryVectors(&embeddings);
    std::string err;
    if (AppendJsonl(cfg_.embeddings_file, embeddings, &embeddings_written, &err)) {
      std::cout << "[append-log] wrote embeddings=" << embeddings_written << " file=" << cfg_.embeddings_file
                << (cfg_.enable_binary_storage ? " binary=1" : "") << "\n";
    } else {
      ok = false;
      std::cout << "[append-log] error flushing embeddings error=" << err << "\n";
    }
    dropped += total - embeddings_written;
  }

  std::lock_guard<std::mutex> lock(stats_mu_);
  stats_.flush_count++;
  if (!ok) stats_.failed_flushes++;
  stats_.chunks_written += chunks_written;
  stats_.embeddings_written += embeddings_written;
  stats_.records_dropped += dropped;
  return ok;
}

bool AppendLog::AppendJsonl(const std::string& path,
                            const std::vector<nlohmann::json>& records,
                            size_t* written,
                            std::string* err) {
  *written = 0;
  std::string lines;
  size_t valid = 0;
  for (const auto& r : records) {
    try {
      lines += r.dump();
    } catch (const nlohmann::json::type_error& e) {
      std::cout << "[append-log] warn invalid record skipped error=" << e.what() << "\n";
      continue;
    }
    lines += "\n";
    valid++;
  }
  if (valid == 0) return true;

  std::string dir_err;
  if (!EnsureDirectory(ParentDir(path), &dir_err)) {
    if (err) *err = dir_err;
    return false;
  }

  std::string read_err;
  auto existing = ReadFileToString(path, &read_err);
  if (!existing && !read_err.empty()) {
    if (err) *err = read_err;
    RestoreLatestBackup(path);
    return false;
  }

  std::error_code ec;
  std::string backup;
  if (existing) {
    backup = path + "." + std::to_string(clock_->WallMs()) + ".bak";
    fs::copy_file(path, backup, fs::copy_options::overwrite_existing, ec);
    if (ec) {
      if (err) *err = "backup " + backup + ": " + ec.message();
      RestoreLatestBackup(path);
      return false;
    }
  }

  std::string content = existing ? std::move(*existing) : std::string();
  content += lines;
  if (!WriteFileAtomic(path, content, cfg_.scratch_dir, err)) {
    RestoreLatestBackup(path);
    return false;
  }

  if (!backup.empty()) fs::remove(backup, ec);
  *written = valid;
  return true;
}

size_t AppendLog::WriteBinaryVectors(std::vector<nlohmann::json>* records) {
  std::string err;
  if (!EnsureDirectory(cfg_.binary_embeddings_dir, &err)) {
    std::cout << "[append-log] error binary dir error=" << err << "\n";
    records->clear();
    return 0;
  }

  std::vector<nlohmann::json> kept;
  kept.reserve(records->size());
  for (auto& r : *records) {
    std::vector<float> v;
    bool numeric = true;
    for (const auto& x : r["vector"]) {
      if (!x.is_number()) {
        numeric = false;
        break;
      }
      v.push_back(x.get<float>());
    }
    if (!numeric) {
      std::cout << "[append-log] warn skipping embedding with non-numeric vector id=" << r["id"].dump() << "\n";
      continue;
    }
    const std::string id = r["id"].is_string() ? r["id"].get<std::string>() : r["id"].dump();
    if (!IsSafeFileName(id)) {
      std::cout << "[append-log] warn skipping embedding with unsafe id=" << r["id"].dump() << "\n";
      continue;
    }
    const auto bin = (fs::path(cfg_.binary_embeddings_dir) / (id + ".bin")).string();
    if (!WriteVectorFile(bin, v, &err)) {
      std::cout << "[append-log] error writing vector error=" << err << "\n";
      continue;
    }
    r.erase("vector");
    r["vector_ref"] = bin;
    kept.push_back(std::move(r));
  }
  records->swap(kept);
  return records->size();
}

void AppendLog::RestoreLatestBackup(const std::string& path) {
  const fs::path target(path);
  const auto prefix = target.filename().string() + ".";
  auto dir = target.parent_path();
  if (dir.empty()) dir = ".";

  std::error_code ec;
  std::vector<std::string> backups;
  for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
    const auto name = it->path().filename().string();
    if (name.size() > prefix.size() + 4 && name.compare(0, prefix.size(), prefix) == 0 &&
        name.compare(name.size() - 4, 4, ".bak") == 0) {
      backups.push_back(name);
    }
  }
  if (backups.empty()) {
    std::cout << "[append-log] warn no backup to recover file=" << path << "\n";
    return;
  }
  const auto latest = (dir / *std::max_element(backups.begin(), backups.end())).string();
  std::cout << "[append-log] recovering file=" << path << " from=" << latest << "\n";
  fs::copy_file(latest, target, fs::copy_options::overwrite_existing, ec);
  if (ec) std::cout << "[append-log] error recovery failed error=" << ec.message() << "\n";
}

bool AppendLog::Shutdown() {
  {
    std::lock_guard<std::mutex> lock(buffer_mu_);
    if (shut_down_) return true;
    shut_down_ = true;
  }
  {
    std::lock_guard<std::mutex> lock(timer_mu_);
    stop_timer_ = true;
  }
  timer_cv_.notify_all();
  if (timer_.joinable()) timer_.join();

  bool ok = FlushImpl(true);
  std::cout << "[append-log] shutdown ok=" << (ok ? 1 : 0) << "\n";
  return ok;
}

void AppendLog::TimerLoop() {
  std::unique_lock<std::mutex> lock(timer_mu_);
  while (!stop_timer_) {
    timer_cv_.wait_for(lock, std::chrono::milliseconds(cfg_.flush_interval_ms), [this]() { return stop_timer_; });
    if (stop_timer_) break;
    lock.unlock();
    FlushImpl(false);
    lock.lock();
  }
}

std::vector<nlohmann::json> AppendLog::ReadJsonl(const std::string& path, std::string* err) const {
  std::vector<nlohmann::json> out;
  auto content = ReadFileToString(path, err);
  if (!content) return out;
  std::istringstream in(*content);
  std::string line;
  size_t bad = 0;
  while (std::getline(in, line)) {
    if (line.empty()) continue;
    auto j = nlohmann::json::parse(line, nullptr, false);
    if (j.is_discarded()) {
      bad++;
      continue;
    }
    out.push_back(std::move(j));
  }
  if (bad > 0) std::cout << "[append-log] warn skipped unparsable lines=" << bad << " file=" << path << "\n";
  return out;
}

std::vector<nlohmann::json> AppendLog::ReadChunks(std::string* err) const {
  return ReadJsonl(cfg_.chunks_file, err);
}

std::vector<nlohmann::json> AppendLog::ReadEmbeddings(std::string* err) const {
  auto records = ReadJsonl(cfg_.embeddings_file, err);
  for (auto& r : records) {
    if (!r.is_object() || HasVectorArray(r)) continue;
    auto ref = r.find("vector_ref");
    if (ref == r.end() || !ref->is_string()) continue;
    auto v = ReadVectorFile(ref->get<std::string>());
    if (v) r["vector"] = *v;
  }
  return records;
}

std::optional<std::vector<float>> AppendLog::LoadVector(const std::string& id) const {
  if (cfg_.binary_embeddings_dir.empty() || !IsSafeFileName(id)) return std::nullopt;
  return ReadVectorFile((fs::path(cfg_.binary_embeddings_dir) / (id + ".bin")).string());
}

AppendLogStats AppendLog::Stats() const {
  AppendLogStats s;
  {
    std::lock_guard<std::mutex> lock(stats_mu_);
    s = stats_;
  }
  std::lock_guard<std::mutex> lock(buffer_mu_);
  s.pending_chunks = chunks_.size();
  s.pending_embeddings = embeddings_.size();
  return s;
}

}  // namespace continuity
