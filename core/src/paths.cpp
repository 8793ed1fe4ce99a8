#include "bsk/paths.h"

#include "bsk/log.h"

#include <cstdlib>
#include <string>

#include <unistd.h>

namespace bsk {

namespace {
std::filesystem::path executable_dir(const char* argv0) {
#if defined(__linux__)
  char buffer[4096];
  const ssize_t len = readlink("/proc/self/exe", buffer, sizeof(buffer) - 1);
  if (len > 0) {
    buffer[len] = '\0';
    return std::filesystem::path(buffer).parent_path();
  }
#endif
  if (argv0) {
    return std::filesystem::absolute(argv0).parent_path();
  }
  return std::filesystem::current_path();
}

std::filesystem::path find_root_from(const std::filesystem::path& start) {
  std::filesystem::path cur = start;
  for (int i = 0; i < 6; ++i) {
    std::error_code ec;
    if (std::filesystem::is_directory(cur / "config", ec)) {
      return cur;
    }
    if (cur.has_parent_path() && cur.parent_path() != cur) {
      cur = cur.parent_path();
    } else {
      break;
    }
  }
  return std::filesystem::current_path();
}

std::filesystem::path default_config_in(const std::filesystem::path& config_dir) {
  const std::filesystem::path yaml = config_dir / "creature.yaml";
  const std::filesystem::path json = config_dir / "creature.json";
  std::error_code ec;
  if (std::filesystem::exists(yaml, ec)) return yaml;
  if (std::filesystem::exists(json, ec)) return json;
  return yaml;
}

std::filesystem::path from_cwd(const std::filesystem::path& p) {
  return p.is_absolute() ? p : std::filesystem::current_path() / p;
}
} // namespace

ResolvedPaths resolve_paths(const char* argv0,
                            const std::optional<std::filesystem::path>& config_override) {
  ResolvedPaths out;
  if (const char* env_root = std::getenv("BSK_ROOT")) {
    out.root = std::filesystem::path(env_root);
  } else {
    out.root = find_root_from(executable_dir(argv0));
  }

  out.config_dir = out.root / "config";
  out.logs_dir = out.root / "build" / "logs";
  out.traces_dir = out.root / "build" / "traces";

  if (config_override.has_value()) {
    out.creature_config = from_cwd(config_override.value());
  } else if (const char* env_config = std::getenv("BSK_CONFIG")) {
    out.creature_config = from_cwd(std::filesystem::path(env_config));
  } else {
    out.creature_config = default_config_in(out.config_dir);
  }

  std::error_code ec;
  if (!std::filesystem::exists(out.creature_config, ec)) {
    log::warn(std::string("creature config not found: ") + out.creature_config.string());
  }

  return out;
}

} // namespace bsk
