#include <djson/json.hpp>
#include <lapis/instance/instance.hpp>
#include <lapis/instance/mod_loader.hpp>
#include <lapis/instance/server_loader.hpp>
#include <lapis/io/file.hpp>
#include <lapis/util/logger.hpp>
#include <utility>

namespace lapis {
namespace {
namespace fs = std::filesystem;

auto const g_log{Logger{"Instance"}};
} // namespace

std::optional<InstanceInfo> InstanceInfo::read(fs::path const& path) {
	auto ec = std::error_code{};
	if (!fs::is_regular_file(path, ec)) { return {}; }
	auto const json = dj::Json::from_file(path.string().c_str());
	if (!json || !json.is_object()) {
		g_log.warn("Invalid instance info [{}]", path.generic_string());
		return {};
	}
	auto ret = InstanceInfo{};
	ret.minecraft_version = json["minecraft_version"].as<std::string>();
	if (ret.minecraft_version.empty()) {
		g_log.warn("[{}] is missing minecraft_version", path.generic_string());
		return {};
	}
	auto const in_loader = json["loader"].as_string();
	if (auto const loader = parse_loader_kind(in_loader)) {
		ret.loader = *loader;
	} else if (!in_loader.empty()) {
		g_log.warn("Unknown loader '{}' in [{}], using vanilla", in_loader, path.generic_string());
	}
	return ret;
}

bool InstanceInfo::write(fs::path const& path) const {
	auto json = dj::Json{};
	json["minecraft_version"] = minecraft_version;
	json["loader"] = std::string{to_string(loader)};
	return file::write_text(path, dj::to_string(json));
}

std::optional<Instance> Instance::load_from_folder(fs::path const& path) {
	auto ec = std::error_code{};
	if (!fs::is_directory(path, ec)) {
		g_log.debug("Not a directory: [{}]", path.generic_string());
		return {};
	}
	auto info = InstanceInfo::read(path / InstanceInfo::file_name_v);
	if (!info) { return {}; }
	auto ret = Instance{};
	ret.set_root(path);
	ret.version = std::move(info->minecraft_version);
	ret.loader = info->loader;
	return ret;
}

void Instance::copy_basic_attributes_from(Instance const& other) {
	set_root(other.root_path);
	version = other.version;
	loader = other.loader;
}

void Instance::relocate(fs::path const& root) {
	set_root(root);
	invalidate_worlds();
	invalidate_mods();
	servers.invalidate();
	dirty_servers = false;
}

void Instance::set_root(fs::path const& root) {
	root_path = root;
	name = root.filename().string();
	dot_minecraft_path = root / ".minecraft";
	saves_path = dot_minecraft_path / "saves";
	mods_path = dot_minecraft_path / "mods";
	servers_file_path = dot_minecraft_path / "servers.dat";
}

StartLoad Instance::start_load_worlds(LoadContext const& context) {
	if (worlds.is_loading()) { return StartLoad::eNone; }
	if (auto const& previous = worlds.snapshot(); previous && worlds.state() != LoadState::eUnloaded) {
		if (dirty_worlds.empty()) { return StartLoad::eNone; }
		auto dirty = std::exchange(dirty_worlds, {});
		worlds.spawn(*context.pool, context.wake, [dirty = std::move(dirty), previous] { return worlds::merge(dirty, *previous); });
		return StartLoad::eReload;
	}
	dirty_worlds.clear();
	worlds.spawn(*context.pool, context.wake, [saves = saves_path] { return worlds::scan(saves); });
	return StartLoad::eInitial;
}

StartLoad Instance::start_load_servers(LoadContext const& context) {
	if (servers.is_loading()) { return StartLoad::eNone; }
	auto ret = StartLoad::eInitial;
	if (servers.snapshot() && servers.state() != LoadState::eUnloaded) {
		if (!dirty_servers) { return StartLoad::eNone; }
		ret = StartLoad::eReload;
	}
	dirty_servers = false;
	servers.spawn(*context.pool, context.wake, [path = servers_file_path] { return servers::load(path); });
	return ret;
}

StartLoad Instance::start_load_mods(LoadContext const& context) {
	if (mods.is_loading()) { return StartLoad::eNone; }
	auto metadata = context.metadata;
	if (auto const& previous = mods.snapshot(); previous && mods.state() != LoadState::eUnloaded) {
		if (dirty_mods.empty()) { return StartLoad::eNone; }
		auto dirty = std::exchange(dirty_mods, {});
		mods.spawn(*context.pool, context.wake, [dirty = std::move(dirty), previous, metadata] { return mods::merge(dirty, *previous, *metadata); });
		return StartLoad::eReload;
	}
	dirty_mods.clear();
	mods.spawn(*context.pool, context.wake, [path = mods_path, metadata] { return mods::scan(path, *metadata); });
	return StartLoad::eInitial;
}

std::optional<Instance::Worlds> Instance::finish_load_worlds() {
	auto result = worlds.finish();
	if (!result) { return {}; }
	worlds.publish(std::move(*result));
	return worlds.snapshot();
}

std::optional<Instance::Servers> Instance::finish_load_servers() {
	auto result = servers.finish();
	if (!result) { return {}; }
	servers.publish(std::move(*result));
	return servers.snapshot();
}

std::optional<Instance::Mods> Instance::finish_load_mods() {
	auto result = mods.finish();
	if (!result) { return {}; }
	++m_mod_generation;
	for (std::uint32_t index = 0; index < result->size(); ++index) { (*result)[index].id = ModID{index, m_mod_generation}; }
	mods.publish(std::move(*result));
	return mods.snapshot();
}

Ptr<InstanceModSummary const> Instance::find_mod(ModID const id) const {
	auto const& snapshot = mods.snapshot();
	if (!snapshot || id.is_null() || id.generation != m_mod_generation || id.index >= snapshot->size()) { return {}; }
	return &(*snapshot)[id.index];
}

void Instance::invalidate_worlds() {
	worlds.invalidate();
	dirty_worlds.clear();
}

void Instance::invalidate_mods() {
	mods.invalidate();
	dirty_mods.clear();
}
} // namespace lapis
