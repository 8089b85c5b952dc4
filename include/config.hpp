#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <istream>

namespace config
{

enum class LogLevel {
	QUIET = 0,
	INFO = 1,
	DEBUG = 2,
};

/**
 * @brief Tunables of a download, every field can be set in configs.conf
 */
struct Settings {
	size_t max_peers = 30;
	size_t pipeline_depth = 5;
	std::chrono::milliseconds request_timeout{ 30000 };
	std::chrono::milliseconds handshake_timeout{ 20000 };
	std::chrono::milliseconds idle_timeout{ 120000 };
	std::chrono::milliseconds keepalive_interval{ 90000 };
	size_t endgame_threshold = 4;
	size_t max_endgame_holders = 2;
	size_t max_hash_failures = 3;
	std::chrono::milliseconds stall_timeout{ 300000 };
	std::chrono::milliseconds discovery_interval{ 60000 };
	LogLevel log_level = LogLevel::INFO;
};

/**
 * @brief Parses key=value lines, blank lines and lines starting with '#' are skipped
 *
 * Durations are given in milliseconds. Unknown keys are reported and ignored.
 * @throws std::invalid_argument if a value is not a non-negative number
 */
[[nodiscard]] Settings parse_settings(std::istream &input);

/**
 * @brief Loads configs.conf located next to the executable, if there is one
 *
 * @throws std::invalid_argument if the file has malformed values
 */
void load_configs();

[[nodiscard]] const Settings &settings();

// located in root dir of executable
void create_downloads_dir();

[[nodiscard]] std::filesystem::path get_path_to_downloads_dir();

} // namespace config
