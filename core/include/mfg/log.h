#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace mfg::log {

enum class Level { Debug = 0, Info, Warn, Error };

void init();
void init(const std::string& app_name, const std::filesystem::path& log_dir);
void shutdown();

void set_console_level(Level level);

void debug(std::string_view msg);
void info(std::string_view msg);
void warn(std::string_view msg);
void error(std::string_view msg);

std::vector<std::string> recent(size_t max_entries = 200);
void clear_recent();

} // namespace mfg::log
