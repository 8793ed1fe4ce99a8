#pragma once

#include <chrono>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace bsk::platform {

struct FileChange {
  enum class Type { Added, Modified, Removed };
  std::filesystem::path path;
  Type type = Type::Modified;
};

// Reports file changes under a directory tree. Uses inotify on Linux and
// mtime polling elsewhere or when inotify is unavailable. Bursts of events
// for one path are merged and only reported once the path has been quiet
// for the debounce interval.
class FileWatcher {
 public:
  using Clock = std::chrono::steady_clock;

  FileWatcher();
  ~FileWatcher();
  FileWatcher(const FileWatcher&) = delete;
  FileWatcher& operator=(const FileWatcher&) = delete;

  bool start(const std::filesystem::path& root);
  void poll(std::vector<FileChange>& out_changes);
  void stop();
  std::string backend_name() const;
  void set_debounce(std::chrono::milliseconds debounce) { debounce_ = debounce; }

  struct Backend;

 private:
  struct Pending {
    FileChange::Type type = FileChange::Type::Modified;
    Clock::time_point last_seen;
  };

  void merge(const FileChange& change, Clock::time_point now);

  Backend* backend_ = nullptr;
  std::chrono::milliseconds debounce_{150};
  std::map<std::filesystem::path, Pending> pending_;
};

} // namespace bsk::platform
