#include <lapis/util/logger.hpp>
#include <lapis/util/visitor.hpp>
#include <lapis/watch/watch_registry.hpp>
#include <algorithm>

namespace lapis {
namespace {
namespace fs = std::filesystem;

auto const g_log{Logger{"Watch"}};

bool is_under(fs::path const& path, fs::path const& root) {
	auto const [root_end, _] = std::mismatch(root.begin(), root.end(), path.begin(), path.end());
	return root_end == root.end() && path != root;
}
} // namespace

std::string_view to_string(WatchTarget const& target) {
	auto const visitor = Visitor{
		[](watch::InstancesRoot) { return std::string_view{"InstancesRoot"}; },
		[](watch::InstanceDir) { return std::string_view{"InstanceDir"}; },
		[](watch::InvalidInstanceDir) { return std::string_view{"InvalidInstanceDir"}; },
		[](watch::InstanceLevelDir) { return std::string_view{"InstanceLevelDir"}; },
		[](watch::InstanceSavesDir) { return std::string_view{"InstanceSavesDir"}; },
		[](watch::InstanceModsDir) { return std::string_view{"InstanceModsDir"}; },
		[](watch::ServersFile) { return std::string_view{"ServersFile"}; },
	};
	return std::visit(visitor, target);
}

std::optional<InstanceID> owner_of(WatchTarget const& target) {
	auto const visitor = Visitor{
		[](watch::InstancesRoot) { return std::optional<InstanceID>{}; },
		[](watch::InvalidInstanceDir) { return std::optional<InstanceID>{}; },
		[](auto const& t) { return std::optional<InstanceID>{t.id}; },
	};
	return std::visit(visitor, target);
}

bool WatchRegistry::watch(fs::path const& path, WatchTarget target) {
	if (!m_watcher->watch(path, RecursiveMode::eNonRecursive)) {
		g_log.debug("Failed to watch [{}] as {}", path.generic_string(), to_string(target));
		return false;
	}
	g_log.debug("Watching [{}] as {}", path.generic_string(), to_string(target));
	m_targets.insert_or_assign(path, std::move(target));
	return true;
}

std::optional<WatchTarget> WatchRegistry::unwatch(fs::path const& path) {
	auto ret = forget(path);
	if (ret) { m_watcher->unwatch(path); }
	return ret;
}

std::optional<WatchTarget> WatchRegistry::forget(fs::path const& path) {
	auto const it = m_targets.find(path);
	if (it == m_targets.end()) { return {}; }
	auto ret = std::move(it->second);
	m_targets.erase(it);
	return ret;
}

Ptr<WatchTarget const> WatchRegistry::find(fs::path const& path) const {
	if (auto const it = m_targets.find(path); it != m_targets.end()) { return &it->second; }
	return {};
}

bool WatchRegistry::parent_is_instances_root(fs::path const& path) const {
	auto const* target = find(path.parent_path());
	return target && std::holds_alternative<watch::InstancesRoot>(*target);
}

void WatchRegistry::rebase(fs::path const& from, fs::path const& to) {
	auto const nested = paths_if([&from](fs::path const& path, WatchTarget const&) { return is_under(path, from); });
	for (auto const& old_path : nested) {
		auto target = forget(old_path);
		if (!target) { continue; }
		auto const new_path = to / old_path.lexically_relative(from);
		if (!watch(new_path, std::move(*target))) { g_log.warn("Failed to re-watch [{}] after rename", new_path.generic_string()); }
	}
}

void WatchRegistry::unwatch_owned(InstanceID const id) {
	auto const owned = paths_if([id](fs::path const&, WatchTarget const& target) { return owner_of(target) == id; });
	for (auto const& path : owned) { unwatch(path); }
}

void WatchRegistry::unwatch_nested(fs::path const& root) {
	auto const nested = paths_if([&root](fs::path const& path, WatchTarget const&) { return is_under(path, root); });
	for (auto const& path : nested) { unwatch(path); }
}

std::vector<fs::path> WatchRegistry::paths_if(std::function<bool(fs::path const&, WatchTarget const&)> const& pred) const {
	auto ret = std::vector<fs::path>{};
	for (auto const& [path, target] : m_targets) {
		if (pred(path, target)) { ret.push_back(path); }
	}
	return ret;
}
} // namespace lapis
