#include "util/atomic_file.hpp"

#include <atomic>
#include <chrono>
#include <fstream>
#include <sstream>
#include <system_error>

namespace x1memo::util {

namespace {

std::atomic<std::uint64_t> g_temp_counter{0};

std::filesystem::path TempPathFor(const std::filesystem::path& target) {
  const auto nonce = g_temp_counter.fetch_add(1, std::memory_order_relaxed);
  const auto now = std::chrono::steady_clock::now().time_since_epoch().count();
  return target.parent_path() /
         (target.filename().string() + ".tmp." + std::to_string(now) + "." +
          std::to_string(nonce));
}

bool Fail(std::string* error, std::string message) {
  if (error) *error = std::move(message);
  return false;
}

}  // namespace

bool AtomicWriteText(const std::filesystem::path& path, std::string_view contents,
                     std::string* error) {
  std::error_code ec;
  const auto parent = path.parent_path();
  if (!parent.empty()) {
    std::filesystem::create_directories(parent, ec);
    if (ec) {
      return Fail(error, "create_directories failed for " + parent.string() + ": " + ec.message());
    }
  }

  const auto tmp_path = TempPathFor(path);
  {
    std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
      return Fail(error, "failed to open " + tmp_path.string() + " for write");
    }
    out.write(contents.data(), static_cast<std::streamsize>(contents.size()));
    out.flush();
    if (!out.good()) {
      out.close();
      std::filesystem::remove(tmp_path, ec);
      return Fail(error, "failed to write " + tmp_path.string());
    }
  }

  std::filesystem::rename(tmp_path, path, ec);
  if (ec) {
    // Some platforms refuse to rename over an existing file.
    std::filesystem::remove(path, ec);
    ec.clear();
    std::filesystem::rename(tmp_path, path, ec);
  }
  if (ec) {
    std::error_code cleanup;
    std::filesystem::remove(tmp_path, cleanup);
    return Fail(error, "rename to " + path.string() + " failed: " + ec.message());
  }
  return true;
}

bool ReadTextFile(const std::filesystem::path& path, std::string* contents, std::string* error) {
  std::ifstream in(path, std::ios::binary);
  if (!in.is_open()) {
    return Fail(error, "failed to open " + path.string());
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();
  if (in.bad()) {
    return Fail(error, "failed to read " + path.string());
  }
  *contents = buffer.str();
  return true;
}

}  // namespace x1memo::util
