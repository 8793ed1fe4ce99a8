#pragma once

#include <filesystem>
#include <string_view>

namespace bsk::movement_log {

// Per-creature trace: one "step start"/"step land" line per swing and a core
// sample every 0.1 s. Off until open() is called; writes are dropped then.
// open() truncates an existing file.
void open(const std::filesystem::path& path);
void close();
bool enabled();
// One trace line; the newline is added here.
void write(std::string_view line);

} // namespace bsk::movement_log
