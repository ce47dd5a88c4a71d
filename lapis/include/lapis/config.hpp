#pragma once
#include <lapis/util/logger.hpp>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace dj {
class Json;
}

namespace lapis {
///
/// \brief User-tunable settings stored in <launcher>/config.json.
///
struct Config {
	static constexpr std::string_view file_name_v{"config.json"};
	static constexpr std::uint32_t max_downloads_limit_v{64};

	std::uint32_t debounce_ms{250};
	std::uint32_t max_concurrent_downloads{8};
	///
	/// \brief Loader worker count; hardware concurrency if unset.
	///
	std::optional<std::uint32_t> worker_threads{};
	Logger::Level log_level{Logger::Level::eInfo};
	bool link_copy_fallback{true};
	std::string default_game_version{"1.21.1"};
	std::string user_agent{};

	std::chrono::milliseconds debounce() const { return std::chrono::milliseconds{debounce_ms}; }

	///
	/// \brief Read path, falling back to defaults for missing / invalid values.
	///
	/// A missing file is created with the defaults.
	///
	static Config load(std::filesystem::path const& path);
	bool save(std::filesystem::path const& path) const;
};

void from_json(dj::Json const& json, Config& out);
void to_json(dj::Json& out, Config const& config);
} // namespace lapis
