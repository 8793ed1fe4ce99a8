#include "bsk/log.h"

#include <array>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace bsk::log {

namespace {
constexpr size_t kRecentCapacity = 200;

struct LogState {
  std::mutex mutex;
  std::ofstream file;
  std::string app = "bsk";
  Console console = Console::Stdout;
  Level min_level = Level::Info;
  std::array<std::string, kRecentCapacity> recent;
  size_t recent_next = 0;
  size_t recent_count = 0;
};

LogState& state() {
  static LogState s;
  return s;
}

const char* level_name(Level level) {
  switch (level) {
    case Level::Info:
      return "INFO";
    case Level::Warn:
      return "WARN";
    case Level::Error:
      return "ERROR";
  }
  return "INFO";
}

bool parse_level(std::string_view text, Level& out) {
  if (text == "info") {
    out = Level::Info;
  } else if (text == "warn") {
    out = Level::Warn;
  } else if (text == "error") {
    out = Level::Error;
  } else {
    return false;
  }
  return true;
}

std::string format_time(const char* pattern) {
  const auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
  std::tm tm{};
  localtime_r(&now, &tm);
  std::ostringstream oss;
  oss << std::put_time(&tm, pattern);
  return oss.str();
}

void emit(Level level, std::string_view msg) {
  LogState& s = state();
  std::lock_guard<std::mutex> lock(s.mutex);
  if (static_cast<int>(level) < static_cast<int>(s.min_level)) return;

  std::string line;
  line.reserve(msg.size() + 48);
  line += format_time("%H:%M:%S");
  line += ' ';
  line += s.app;
  line += ' ';
  line += level_name(level);
  line += ": ";
  line += msg;

  if (s.console == Console::Stdout) {
    std::cout << line << '\n';
  } else if (s.console == Console::Stderr) {
    std::cerr << line << '\n';
  }
  if (s.file.is_open()) {
    s.file << line << '\n';
    s.file.flush();
  }
  s.recent[s.recent_next] = std::move(line);
  s.recent_next = (s.recent_next + 1) % kRecentCapacity;
  if (s.recent_count < kRecentCapacity) ++s.recent_count;
}

void on_crash_signal(int sig) {
  emit(Level::Error, "fatal signal " + std::to_string(sig));
  std::_Exit(128 + sig);
}
} // namespace

void init(const std::string& app_name, const std::filesystem::path& root) {
  const std::filesystem::path dir = root / "build" / "logs";
  std::error_code ec;
  std::filesystem::create_directories(dir, ec);
  bool bad_level = false;
  {
    LogState& s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    s.app = app_name;
    if (const char* env = std::getenv("BSK_LOG_LEVEL")) {
      bad_level = !parse_level(env, s.min_level);
    }
    if (s.file.is_open()) s.file.close();
    if (!ec) {
      s.file.open(dir / (app_name + "_" + format_time("%Y%m%d_%H%M%S") + ".log"), std::ios::app);
    }
  }
  if (ec) {
    warn("log directory unavailable, console only: " + dir.string());
  }
  if (bad_level) {
    warn("BSK_LOG_LEVEL not one of info, warn, error; keeping info");
  }
  info("log started in " + root.string());
}

void shutdown() {
  info("log closed");
  LogState& s = state();
  std::lock_guard<std::mutex> lock(s.mutex);
  s.file.close();
}

void set_console(Console console) {
  LogState& s = state();
  std::lock_guard<std::mutex> lock(s.mutex);
  s.console = console;
}

void set_level(Level level) {
  LogState& s = state();
  std::lock_guard<std::mutex> lock(s.mutex);
  s.min_level = level;
}

Level level() {
  LogState& s = state();
  std::lock_guard<std::mutex> lock(s.mutex);
  return s.min_level;
}

void info(std::string_view msg) {
  emit(Level::Info, msg);
}

void warn(std::string_view msg) {
  emit(Level::Warn, msg);
}

void error(std::string_view msg) {
  emit(Level::Error, msg);
}

std::vector<std::string> recent(size_t max_entries) {
  LogState& s = state();
  std::lock_guard<std::mutex> lock(s.mutex);
  const size_t count = max_entries < s.recent_count ? max_entries : s.recent_count;
  std::vector<std::string> out;
  out.reserve(count);
  const size_t first = (s.recent_next + kRecentCapacity - count) % kRecentCapacity;
  for (size_t i = 0; i < count; ++i) {
    out.push_back(s.recent[(first + i) % kRecentCapacity]);
  }
  return out;
}

void install_crash_handlers() {
  for (int sig : {SIGSEGV, SIGABRT, SIGFPE, SIGILL}) {
    std::signal(sig, on_crash_signal);
  }
}

} // namespace bsk::log
