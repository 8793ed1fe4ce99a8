#include "bsk/movement_log.h"

#include "bsk/log.h"

#include <fstream>
#include <mutex>

namespace bsk::movement_log {

namespace {
std::mutex g_mutex;
std::ofstream g_file;
} // namespace

void open(const std::filesystem::path& path) {
  std::lock_guard<std::mutex> lock(g_mutex);
  if (g_file.is_open()) {
    g_file.close();
  }
  if (path.has_parent_path()) {
    std::error_code ec;
    std::filesystem::create_directories(path.parent_path(), ec);
  }
  g_file.open(path, std::ios::out | std::ios::trunc);
  if (!g_file.is_open()) {
    log::warn(std::string("movement log open failed: ") + path.string());
    return;
  }
  log::info(std::string("movement log: ") + path.string());
}

void close() {
  std::lock_guard<std::mutex> lock(g_mutex);
  if (g_file.is_open()) {
    g_file.close();
  }
}

bool enabled() {
  std::lock_guard<std::mutex> lock(g_mutex);
  return g_file.is_open();
}

void write(std::string_view line) {
  std::lock_guard<std::mutex> lock(g_mutex);
  if (!g_file.is_open()) return;
  g_file << line << "\n";
}

} // namespace bsk::movement_log
