#pragma once

#include <filesystem>
#include <optional>

namespace bsk {

struct ResolvedPaths {
  std::filesystem::path root;
  std::filesystem::path config_dir;
  std::filesystem::path creature_config;
  std::filesystem::path logs_dir;
  std::filesystem::path traces_dir;
};

// Root is BSK_ROOT when set, else the first ancestor of the executable that
// holds a config/ directory.
ResolvedPaths resolve_paths(const char* argv0,
                            const std::optional<std::filesystem::path>& config_override);

} // namespace bsk
