#include <fmt/chrono.h>
#include <lapis/io/file.hpp>
#include <lapis/io/nbt.hpp>
#include <lapis/instance/world_loader.hpp>
#include <lapis/util/logger.hpp>
#include <algorithm>
#include <chrono>
#include <ctime>

namespace lapis {
namespace {
namespace fs = std::filesystem;

auto const g_log{Logger{"Worlds"}};

std::string make_subtitle(std::string_view const folder, std::int64_t const last_played) {
	if (last_played <= 0) { return std::string{folder}; }
	auto const time = static_cast<std::time_t>(last_played / 1000);
	auto tm = std::tm{};
	if (!localtime_r(&time, &tm)) { return std::string{folder}; }
	return fmt::format("{} ({:%d/%m/%Y %H:%M})", folder, tm);
}
} // namespace

std::optional<WorldSummary> worlds::load_summary(fs::path const& level_path) {
	auto root = nbt::read_file(level_path / "level.dat");
	if (!root) { return {}; }
	auto const* compound = root->tag.as_compound();
	auto const* data = compound ? compound->find_compound("Data") : nullptr;
	if (!data) {
		g_log.warn("[{}] level.dat has no Data compound", level_path.generic_string());
		return {};
	}
	auto const last_played = data->find_integer("LastPlayed");
	if (!last_played) {
		g_log.warn("[{}] level.dat has no LastPlayed", level_path.generic_string());
		return {};
	}
	auto ret = WorldSummary{};
	auto const folder = level_path.filename().string();
	ret.level_path = level_path;
	ret.last_played = *last_played;
	auto const* level_name = data->find_string("LevelName");
	ret.title = level_name && !level_name->empty() ? *level_name : folder;
	ret.subtitle = make_subtitle(folder, ret.last_played);
	if (auto icon = file::read_bytes(level_path / "icon.png")) { ret.png_icon = std::move(*icon); }
	return ret;
}

std::vector<WorldSummary> worlds::scan(fs::path const& saves_path, LoadFunc const& load) {
	auto ret = std::vector<WorldSummary>{};
	auto ec = std::error_code{};
	auto count = std::size_t{};
	for (auto const& entry : fs::directory_iterator{saves_path, ec}) {
		if (!entry.is_directory(ec)) { continue; }
		if (count++ >= max_worlds_v) { break; }
		if (auto summary = load(entry.path())) { ret.push_back(std::move(*summary)); }
	}
	if (ec) { g_log.debug("Failed to read [{}]: {}", saves_path.generic_string(), ec.message()); }
	sort_and_cap(ret);
	return ret;
}

std::vector<WorldSummary> worlds::merge(PathSet const& dirty, std::span<WorldSummary const> previous, LoadFunc const& load) {
	auto ret = std::vector<WorldSummary>{};
	auto count = std::size_t{};
	for (auto const& path : dirty) {
		auto ec = std::error_code{};
		if (!fs::is_directory(path, ec)) { continue; }
		if (count++ >= max_worlds_v) { break; }
		if (auto summary = load(path)) { ret.push_back(std::move(*summary)); }
	}
	for (auto const& old : previous) {
		auto ec = std::error_code{};
		if (dirty.contains(old.level_path) || !fs::exists(old.level_path, ec)) { continue; }
		ret.push_back(old);
	}
	sort_and_cap(ret);
	return ret;
}

void worlds::sort_and_cap(std::vector<WorldSummary>& out) {
	std::stable_sort(out.begin(), out.end(), [](WorldSummary const& a, WorldSummary const& b) { return a.last_played > b.last_played; });
	if (out.size() > max_worlds_v) { out.resize(max_worlds_v); }
}
} // namespace lapis
