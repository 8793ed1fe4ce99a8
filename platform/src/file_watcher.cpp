#include "bsk_platform/file_watcher.h"

#include "bsk/log.h"

#include <cstdint>
#include <unordered_map>

#if defined(__linux__)
#include <sys/inotify.h>
#include <unistd.h>
#endif

namespace bsk::platform {

struct FileWatcher::Backend {
  virtual ~Backend() = default;
  virtual bool open(const std::filesystem::path& root) = 0;
  // Appends raw, unmerged events.
  virtual void read(std::vector<FileChange>& out) = 0;
  virtual void close() = 0;
  virtual const char* name() const = 0;
};

namespace {

using Snapshot = std::unordered_map<std::string, std::filesystem::file_time_type>;

Snapshot take_snapshot(const std::filesystem::path& root) {
  Snapshot snap;
  std::error_code ec;
  std::filesystem::recursive_directory_iterator it(root, ec);
  for (; !ec && it != std::filesystem::recursive_directory_iterator(); it.increment(ec)) {
    if (!it->is_regular_file(ec)) continue;
    const auto mtime = std::filesystem::last_write_time(it->path(), ec);
    if (!ec) snap[it->path().string()] = mtime;
  }
  return snap;
}

class PollingBackend final : public FileWatcher::Backend {
 public:
  bool open(const std::filesystem::path& root) override {
    root_ = root;
    std::error_code ec;
    if (!std::filesystem::is_directory(root_, ec)) return false;
    files_ = take_snapshot(root_);
    return true;
  }

  void read(std::vector<FileChange>& out) override {
    Snapshot now = take_snapshot(root_);
    for (const auto& [path, mtime] : now) {
      const auto prev = files_.find(path);
      if (prev == files_.end()) {
        out.push_back({path, FileChange::Type::Added});
      } else if (prev->second != mtime) {
        out.push_back({path, FileChange::Type::Modified});
      }
    }
    for (const auto& entry : files_) {
      if (now.count(entry.first) == 0) {
        out.push_back({entry.first, FileChange::Type::Removed});
      }
    }
    files_ = std::move(now);
  }

  void close() override { files_.clear(); }

  const char* name() const override { return "polling"; }

 private:
  std::filesystem::path root_;
  Snapshot files_;
};

#if defined(__linux__)
class InotifyBackend final : public FileWatcher::Backend {
 public:
  ~InotifyBackend() override { close(); }

  bool open(const std::filesystem::path& root) override {
    close();
    fd_ = inotify_init1(IN_NONBLOCK | IN_CLOEXEC);
    if (fd_ < 0) {
      bsk::log::warn("inotify unavailable; falling back to polling");
      return false;
    }
    watch_tree(root);
    return !dirs_.empty();
  }

  void read(std::vector<FileChange>& out) override {
    if (fd_ < 0) return;
    alignas(inotify_event) char buf[8192];
    for (;;) {
      const ssize_t n = ::read(fd_, buf, sizeof(buf));
      if (n <= 0) break;
      for (ssize_t off = 0; off < n;) {
        const auto* ev = reinterpret_cast<const inotify_event*>(buf + off);
        off += static_cast<ssize_t>(sizeof(inotify_event) + ev->len);
        const auto dir = dirs_.find(ev->wd);
        if (dir == dirs_.end() || ev->len == 0) continue;
        const std::filesystem::path path = dir->second / ev->name;
        if ((ev->mask & IN_ISDIR) && (ev->mask & (IN_CREATE | IN_MOVED_TO))) {
          watch_tree(path);
          continue;
        }
        // Atomic saves (write temp, rename over) arrive as IN_MOVED_TO.
        if (ev->mask & (IN_CREATE | IN_MOVED_TO)) {
          out.push_back({path, FileChange::Type::Added});
        } else if (ev->mask & (IN_DELETE | IN_MOVED_FROM)) {
          out.push_back({path, FileChange::Type::Removed});
        } else if (ev->mask & (IN_MODIFY | IN_CLOSE_WRITE)) {
          out.push_back({path, FileChange::Type::Modified});
        }
      }
    }
  }

  void close() override {
    if (fd_ >= 0) {
      ::close(fd_);
      fd_ = -1;
    }
    dirs_.clear();
  }

  const char* name() const override { return "inotify"; }

 private:
  void watch_tree(const std::filesystem::path& dir) {
    constexpr uint32_t kMask = IN_CREATE | IN_MODIFY | IN_CLOSE_WRITE | IN_DELETE | IN_MOVED_FROM | IN_MOVED_TO;
    std::error_code ec;
    if (!std::filesystem::is_directory(dir, ec)) return;
    const int wd = inotify_add_watch(fd_, dir.c_str(), kMask);
    if (wd < 0) {
      bsk::log::warn("inotify_add_watch failed: " + dir.string());
      return;
    }
    dirs_[wd] = dir;
    std::filesystem::directory_iterator it(dir, ec);
    for (; !ec && it != std::filesystem::directory_iterator(); it.increment(ec)) {
      if (it->is_directory(ec)) watch_tree(it->path());
    }
  }

  int fd_ = -1;
  std::unordered_map<int, std::filesystem::path> dirs_;
};
#endif

} // namespace

FileWatcher::FileWatcher() {
#if defined(__linux__)
  backend_ = new InotifyBackend();
#else
  backend_ = new PollingBackend();
#endif
}

FileWatcher::~FileWatcher() {
  stop();
  delete backend_;
}

bool FileWatcher::start(const std::filesystem::path& root) {
  pending_.clear();
  if (backend_->open(root)) return true;
  backend_->close();
  if (std::string(backend_->name()) == "polling") return false;
  delete backend_;
  backend_ = new PollingBackend();
  return backend_->open(root);
}

void FileWatcher::merge(const FileChange& change, Clock::time_point now) {
  auto [it, inserted] = pending_.try_emplace(change.path);
  Pending& p = it->second;
  if (inserted) {
    p.type = change.type;
  } else if (change.type == FileChange::Type::Removed) {
    p.type = FileChange::Type::Removed;
  } else if (p.type == FileChange::Type::Removed) {
    // Deleted then recreated within one burst reads as a rewrite.
    p.type = FileChange::Type::Modified;
  }
  p.last_seen = now;
}

void FileWatcher::poll(std::vector<FileChange>& out_changes) {
  std::vector<FileChange> raw;
  backend_->read(raw);
  const Clock::time_point now = Clock::now();
  for (const auto& change : raw) {
    merge(change, now);
  }
  for (auto it = pending_.begin(); it != pending_.end();) {
    if (now - it->second.last_seen >= debounce_) {
      out_changes.push_back({it->first, it->second.type});
      it = pending_.erase(it);
    } else {
      ++it;
    }
  }
}

void FileWatcher::stop() {
  if (backend_) backend_->close();
  pending_.clear();
}

std::string FileWatcher::backend_name() const {
  return backend_ ? backend_->name() : "none";
}

} // namespace bsk::platform
