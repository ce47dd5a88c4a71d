#include <lapis/instance/mod_loader.hpp>
#include <lapis/util/logger.hpp>
#include <algorithm>

namespace lapis {
namespace {
namespace fs = std::filesystem;

auto const g_log{Logger{"Mods"}};
} // namespace

std::optional<bool> mods::is_enabled_mod_file(fs::path const& path) {
	auto const filename = path.filename().string();
	if (filename.ends_with(".jar.disabled")) { return false; }
	if (filename.ends_with(".jar")) { return true; }
	return {};
}

std::optional<InstanceModSummary> mods::load_entry(fs::path const& path, ModMetadataManager& metadata) {
	auto const enabled = is_enabled_mod_file(path);
	if (!enabled) { return {}; }
	auto ec = std::error_code{};
	if (!fs::is_regular_file(path, ec)) { return {}; }
	auto summary = metadata.get_path(path);
	if (!summary) { return {}; }
	return InstanceModSummary{
		.mod = std::move(summary),
		.filename = path.filename().string(),
		.path = path,
		.enabled = *enabled,
	};
}

std::vector<InstanceModSummary> mods::scan(fs::path const& mods_path, ModMetadataManager& metadata) {
	auto ret = std::vector<InstanceModSummary>{};
	auto ec = std::error_code{};
	for (auto const& entry : fs::directory_iterator{mods_path, ec}) {
		if (auto summary = load_entry(entry.path(), metadata)) { ret.push_back(std::move(*summary)); }
	}
	if (ec) { g_log.debug("Failed to read [{}]: {}", mods_path.generic_string(), ec.message()); }
	sort(ret);
	return ret;
}

std::vector<InstanceModSummary> mods::merge(PathSet const& dirty, std::span<InstanceModSummary const> previous, ModMetadataManager& metadata) {
	auto ret = std::vector<InstanceModSummary>{};
	for (auto const& path : dirty) {
		if (auto summary = load_entry(path, metadata)) { ret.push_back(std::move(*summary)); }
	}
	for (auto const& old : previous) {
		auto ec = std::error_code{};
		if (dirty.contains(old.path) || !fs::exists(old.path, ec)) { continue; }
		ret.push_back(old);
	}
	sort(ret);
	return ret;
}

void mods::sort(std::vector<InstanceModSummary>& out) {
	std::sort(out.begin(), out.end(), [](InstanceModSummary const& a, InstanceModSummary const& b) {
		if (a.mod->id != b.mod->id) { return a.mod->id < b.mod->id; }
		return a.filename < b.filename;
	});
}
} // namespace lapis
