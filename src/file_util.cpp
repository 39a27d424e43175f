#include "file_util.hpp"

#include <filesystem>
#include <fstream>
#include <random>
#include <sstream>
#include <system_error>

namespace continuity {
namespace {

namespace fs = std::filesystem;

static uint64_t Rand64() {
  static thread_local std::mt19937_64 rng(std::random_device{}());
  return rng();
}

static bool WriteWhole(const fs::path& p, const std::string& content, std::string* err) {
  std::ofstream out(p, std::ios::binary | std::ios::trunc);
  if (!out) {
    if (err) *err = "cannot open " + p.string() + " for writing";
    return false;
  }
  out.write(content.data(), static_cast<std::streamsize>(content.size()));
  out.flush();
  if (!out) {
    if (err) *err = "short write to " + p.string();
    return false;
  }
  return true;
}

}  // namespace

bool IsSafeFileName(const std::string& name) {
  if (name.empty()) return false;
  if (name.find_first_of(std::string("/\\\0", 3)) != std::string::npos) return false;
  return name.find("..") == std::string::npos;
}

std::string RandomHex(size_t bytes) {
  static const char* kDigits = "0123456789abcdef";
  std::string out;
  out.reserve(bytes * 2);
  uint64_t pool = 0;
  for (size_t i = 0; i < bytes; i++) {
    if (i % 8 == 0) pool = Rand64();
    auto b = static_cast<unsigned>(pool & 0xff);
    pool >>= 8;
    out.push_back(kDigits[b >> 4]);
    out.push_back(kDigits[b & 0xf]);
  }
  return out;
}

bool EnsureDirectory(const std::string& dir, std::string* err) {
  if (dir.empty()) return true;
  std::error_code ec;
  fs::create_directories(dir, ec);
  if (ec) {
    if (err) *err = "create_directories " + dir + ": " + ec.message();
    return false;
  }
  return true;
}

std::optional<std::string> ReadFileToString(const std::string& path, std::string* err) {
  std::error_code ec;
  if (!fs::exists(path, ec)) return std::nullopt;
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    if (err) *err = "cannot open " + path;
    return std::nullopt;
  }
  std::ostringstream oss;
  oss << in.rdbuf();
  return oss.str();
}

std::optional<nlohmann::json> ReadJsonFile(const std::string& path, std::string* err) {
  auto text = ReadFileToString(path, err);
  if (!text) return std::nullopt;
  auto j = nlohmann::json::parse(*text, nullptr, false);
  if (j.is_discarded()) {
    if (err) *err = "invalid json in " + path;
    return std::nullopt;
  }
  return j;
}

bool WriteFileAtomic(const std::string& path,
                     const std::string& content,
                     const std::string& scratch_dir,
                     std::string* err) {
  fs::path target(path);
  std::error_code ec;
  auto dir = target.parent_path();
  if (!dir.empty()) {
    fs::create_directories(dir, ec);
    if (ec) {
      if (err) *err = "create_directories " + dir.string() + ": " + ec.message();
      return false;
    }
  }

  std::optional<fs::perms> original_perms;
  if (fs::exists(target, ec)) {
    original_perms = fs::status(target, ec).permissions();
    if (ec) original_perms.reset();
  }

  fs::path tmp_dir = scratch_dir.empty() ? dir : fs::path(scratch_dir);
  if (!tmp_dir.empty()) {
    fs::create_directories(tmp_dir, ec);
    if (ec) {
      if (err) *err = "create_directories " + tmp_dir.string() + ": " + ec.message();
      return false;
    }
  }
  fs::path tmp = tmp_dir / (target.filename().string() + "." + RandomHex(8) + ".tmp");
  if (!WriteWhole(tmp, content, err)) {
    fs::remove(tmp, ec);
    return false;
  }

  auto written = fs::file_size(tmp, ec);
  if (ec || written < content.size()) {
    if (err) *err = "temp file verification failed for " + tmp.string();
    fs::remove(tmp, ec);
    return false;
  }

  fs::rename(tmp, target, ec);
  if (ec) {
    // Scratch dir on another filesystem: stage a sibling copy and rename that.
    fs::path sibling = target;
    sibling += "." + RandomHex(8) + ".tmp";
    std::error_code copy_ec;
    fs::copy_file(tmp, sibling, fs::copy_options::overwrite_existing, copy_ec);
    fs::remove(tmp, ec);
    if (copy_ec) {
      if (err) *err = "stage " + sibling.string() + ": " + copy_ec.message();
      return false;
    }
    fs::rename(sibling, target, ec);
    if (ec) {
      if (err) *err = "rename " + sibling.string() + ": " + ec.message();
      fs::remove(sibling, ec);
      return false;
    }
  }

  if (original_perms) {
    fs::permissions(target, *original_perms, fs::perm_options::replace, ec);
  }
  return true;
}

bool WriteJsonFileAtomic(const std::string& path, const nlohmann::json& j, std::string* err) {
  return WriteFileAtomic(path, j.dump(2), "", err);
}

}  // namespace continuity
