#include <djson/json.hpp>
#include <lapis/config.hpp>
#include <lapis/defines.hpp>
#include <lapis/io/file.hpp>
#include <algorithm>

namespace lapis {
namespace fs = std::filesystem;

namespace {
auto const g_log{Logger{"Config"}};

std::string default_user_agent() { return fmt::format("lapis/{}", version_v); }

template <typename T>
T clamped(dj::Json const& json, std::string_view const key, T const fallback, T const lo, T const hi) {
	auto const& value = json[key];
	if (!value) { return fallback; }
	if (!value.is_number()) {
		g_log.warn("'{}' is not a number, using {}", key, fallback);
		return fallback;
	}
	auto const in = value.as<std::int64_t>(static_cast<std::int64_t>(fallback));
	auto const ret = std::clamp(in, static_cast<std::int64_t>(lo), static_cast<std::int64_t>(hi));
	if (ret != in) { g_log.warn("'{}' out of range ({}), clamped to {}", key, in, ret); }
	return static_cast<T>(ret);
}
} // namespace

void from_json(dj::Json const& json, Config& out) {
	out.debounce_ms = clamped<std::uint32_t>(json, "debounce_ms", out.debounce_ms, 10, 10'000);
	out.max_concurrent_downloads = clamped<std::uint32_t>(json, "max_concurrent_downloads", out.max_concurrent_downloads, 1, Config::max_downloads_limit_v);
	if (json["worker_threads"]) { out.worker_threads = clamped<std::uint32_t>(json, "worker_threads", 1, 1, 256); }
	if (auto const level = json["log_level"].as_string(); !level.empty()) {
		auto const parsed = Logger::parse_level(level, Logger::Level::eCOUNT_);
		if (parsed == Logger::Level::eCOUNT_) {
			g_log.warn("Unknown log_level '{}'", level);
		} else {
			out.log_level = parsed;
		}
	}
	if (json["link_copy_fallback"]) { out.link_copy_fallback = json["link_copy_fallback"].as<bool>(); }
	out.default_game_version = json["default_game_version"].as<std::string>(out.default_game_version);
	out.user_agent = json["user_agent"].as<std::string>(out.user_agent);
}

void to_json(dj::Json& out, Config const& config) {
	out["debounce_ms"] = config.debounce_ms;
	out["max_concurrent_downloads"] = config.max_concurrent_downloads;
	if (config.worker_threads) { out["worker_threads"] = *config.worker_threads; }
	out["log_level"] = std::string{Logger::level_names_v[config.log_level]};
	out["link_copy_fallback"] = config.link_copy_fallback;
	out["default_game_version"] = config.default_game_version;
	out["user_agent"] = config.user_agent;
}

Config Config::load(fs::path const& path) {
	auto ret = Config{.user_agent = default_user_agent()};
	auto ec = std::error_code{};
	if (!fs::is_regular_file(path, ec)) {
		g_log.info("No config at [{}], writing defaults", path.generic_string());
		if (!ret.save(path)) { g_log.warn("Failed to write [{}]", path.generic_string()); }
		return ret;
	}
	auto const json = dj::Json::from_file(path.string().c_str());
	if (!json || !json.is_object()) {
		g_log.warn("Invalid config [{}], using defaults", path.generic_string());
		return ret;
	}
	from_json(json, ret);
	if (ret.user_agent.empty()) { ret.user_agent = default_user_agent(); }
	return ret;
}

bool Config::save(fs::path const& path) const {
	auto json = dj::Json{};
	to_json(json, *this);
	return file::write_text(path, dj::to_string(json));
}
} // namespace lapis
