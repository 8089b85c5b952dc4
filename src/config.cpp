#include "config.hpp"

#include <cctype>
#include <charconv>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <map>
#include <sstream>
#include <stdexcept>
#include <string>
#include <system_error>

namespace config
{

static std::filesystem::path g_path_to_app_root;
static std::filesystem::path g_path_to_downloads_dir;

static Settings g_settings;

static size_t parse_number(const std::string &key, const std::string &value)
{
	size_t ret = 0;
	const char *end = value.data() + value.size();
	const auto [ptr, ec] = std::from_chars(value.data(), end, ret);
	if (value.empty() || ec != std::errc() || ptr != end)
	{
		throw std::invalid_argument("config: bad value \"" + value + "\" for " + key);
	}
	return ret;
}

static size_t parse_positive(const std::string &key, const std::string &value)
{
	const size_t ret = parse_number(key, value);
	if (ret == 0)
	{
		throw std::invalid_argument("config: " + key + " must be at least 1");
	}
	return ret;
}

Settings parse_settings(std::istream &input)
{
	using std::chrono::milliseconds;

	Settings ret;
	// these must be at least 1, a zero leaves the download waiting forever
	const std::map<std::string, std::function<void(size_t)>> positive_setters = {
		{ "max_peers", [&](size_t v) { ret.max_peers = v; } },
		{ "pipeline_depth", [&](size_t v) { ret.pipeline_depth = v; } },
		{ "max_endgame_holders", [&](size_t v) { ret.max_endgame_holders = v; } },
	};
	const std::map<std::string, std::function<void(size_t)>> setters = {
		{ "request_timeout", [&](size_t v) { ret.request_timeout = milliseconds(v); } },
		{ "handshake_timeout", [&](size_t v) { ret.handshake_timeout = milliseconds(v); } },
		{ "idle_timeout", [&](size_t v) { ret.idle_timeout = milliseconds(v); } },
		{ "keepalive_interval", [&](size_t v) { ret.keepalive_interval = milliseconds(v); } },
		{ "endgame_threshold", [&](size_t v) { ret.endgame_threshold = v; } },
		{ "max_hash_failures", [&](size_t v) { ret.max_hash_failures = v; } },
		{ "stall_timeout", [&](size_t v) { ret.stall_timeout = milliseconds(v); } },
		{ "discovery_interval", [&](size_t v) { ret.discovery_interval = milliseconds(v); } },
		{ "log_level",
		  [&](size_t v) {
			  if (v > static_cast<size_t>(LogLevel::DEBUG))
			  {
				  throw std::invalid_argument("config: log_level must be 0, 1 or 2");
			  }
			  ret.log_level = static_cast<LogLevel>(v);
		  } },
	};

	for (std::string line; std::getline(input, line);)
	{
		std::istringstream line_stream(line);
		std::string key;
		std::string value;

		char ch = 0;
		while (line_stream.get(ch) && ch != '=')
		{
			if (isblank(ch) == 0)
			{
				key += ch;
			}
		}
		if (key.empty() || key.front() == '#')
		{
			continue;
		}
		if (ch != '=')
		{
			std::cerr << "config: line without '=' ignored: " << line << '\n';
			continue;
		}
		line_stream >> value;

		if (const auto setter = positive_setters.find(key); setter != positive_setters.end())
		{
			setter->second(parse_positive(key, value));
			continue;
		}
		const auto setter = setters.find(key);
		if (setter == setters.end())
		{
			std::cerr << "config: unknown key \"" << key << "\" ignored" << '\n';
			continue;
		}
		setter->second(parse_number(key, value));
	}
	return ret;
}

void load_configs()
{
	g_path_to_app_root = std::filesystem::canonical("/proc/self/exe");
	g_path_to_app_root.remove_filename();

	std::filesystem::path path_to_config = g_path_to_app_root / "configs.conf";
	if (!std::filesystem::exists(path_to_config))
	{
		return;
	}

	std::ifstream file(path_to_config);
	g_settings = parse_settings(file);
}

const Settings &settings()
{
	return g_settings;
}

void create_downloads_dir()
{
	g_path_to_downloads_dir = g_path_to_app_root / "downloads";
	std::filesystem::create_directory(g_path_to_downloads_dir);
}

std::filesystem::path get_path_to_downloads_dir()
{
	return g_path_to_downloads_dir;
}

} // namespace config
