#include <lapis/backend.hpp>
#include <lapis/util/logger.hpp>
#include <lapis/util/visitor.hpp>

namespace lapis {
namespace fs = std::filesystem;

namespace {
auto const g_log{Logger{"Router"}};

constexpr std::string_view instances_removed_v{"Instances folder has been removed!"};

bool is_info_file(fs::path const& path) { return path.filename() == InstanceInfo::file_name_v; }
} // namespace

void Backend::route(FsEvent const& event, PostBatch& post) {
	auto const visitor = Visitor{
		[&](fs_event::Changed const& changed) { on_changed(changed, post); },
		[&](fs_event::Remove const& remove) { on_remove(remove, post); },
		[&](fs_event::Rename const& rename) { on_rename(rename, post); },
	};
	std::visit(visitor, event);
}

void Backend::on_changed(fs_event::Changed const& event, PostBatch& post) {
	if (auto const* target = m_registry.find(event.path)) {
		if (auto const* servers = std::get_if<watch::ServersFile>(target)) {
			mark_servers_dirty(servers->id);
			return;
		}
	}

	auto const parent = event.path.parent_path();
	auto const* found = m_registry.find(parent);
	if (!found) { return; }
	// copied: handlers below may re-key the registry
	auto const parent_target = *found;

	auto const visitor = Visitor{
		[&](watch::InstancesRoot) {
			if (!event.maybe_folder) { return; }
			if (load_instance_from_path(event.path)) { return; }
			auto ec = std::error_code{};
			if (!m_registry.contains(event.path) && fs::is_directory(event.path, ec)) { m_registry.watch(event.path, watch::InvalidInstanceDir{}); }
		},
		[&](watch::InstanceDir) {
			if (event.maybe_file && is_info_file(event.path)) { load_instance_from_path(parent); }
		},
		[&](watch::InvalidInstanceDir) {
			if (event.maybe_file && is_info_file(event.path)) { load_instance_from_path(parent); }
		},
		[&](watch::InstanceLevelDir const& level) { mark_world_dirty(level.id, parent); },
		[&](watch::InstanceSavesDir const& saves) { mark_world_dirty(saves.id, event.path); },
		[&](watch::InstanceModsDir const& mods) { mark_mod_dirty(mods.id, event.path, post); },
		[](watch::ServersFile) {},
	};
	std::visit(visitor, parent_target);
}

void Backend::on_remove(fs_event::Remove const& event, PostBatch& post) {
	if (auto target = m_registry.unwatch(event.path)) {
		auto const visitor = Visitor{
			[&](watch::InstancesRoot) {
				g_log.error("Instances folder [{}] was removed", event.path.generic_string());
				m_notifications.error(std::string{instances_removed_v});
			},
			[&](watch::InstanceDir const& dir) { remove_instance(dir.id); },
			[](watch::InvalidInstanceDir) {},
			[&](watch::InstanceLevelDir const& level) { mark_world_dirty(level.id, event.path); },
			[&](watch::InstanceSavesDir const& saves) { drop_saves(saves.id, event.path); },
			[&](watch::InstanceModsDir const& mods) { drop_mods(mods.id); },
			[&](watch::ServersFile const& servers) {
				mark_servers_dirty(servers.id);
				// servers.dat is replaced by moving a temporary over it: listen again right away
				m_registry.watch(event.path, servers);
			},
		};
		std::visit(visitor, *target);
		return;
	}

	auto const parent = event.path.parent_path();
	auto const* found = m_registry.find(parent);
	if (!found) { return; }
	auto const parent_target = *found;

	auto const visitor = Visitor{
		[&](watch::InstanceDir const& dir) {
			if (!is_info_file(event.path)) { return; }
			remove_instance(dir.id);
			m_registry.watch(parent, watch::InvalidInstanceDir{});
		},
		[&](watch::InstanceLevelDir const& level) { mark_world_dirty(level.id, parent); },
		[&](watch::InstanceSavesDir const& saves) { mark_world_dirty(saves.id, event.path); },
		[&](watch::InstanceModsDir const& mods) { mark_mod_dirty(mods.id, event.path, post); },
		[](auto const&) {},
	};
	std::visit(visitor, parent_target);
}

void Backend::on_rename(fs_event::Rename const& event, PostBatch& post) {
	if (auto target = m_registry.unwatch(event.from)) {
		auto const visitor = Visitor{
			[&](watch::InstancesRoot) {
				g_log.error("Instances folder [{}] was moved to [{}]", event.from.generic_string(), event.to.generic_string());
				m_notifications.error(std::string{instances_removed_v});
			},
			[&](watch::InstanceDir const& dir) {
				auto* instance = find(dir.id);
				if (!instance) { return; }
				if (!m_registry.parent_is_instances_root(event.to)) {
					remove_instance(dir.id);
					return;
				}
				auto const old_name = instance->name;
				instance->relocate(event.to);
				m_registry.watch(event.to, dir);
				m_registry.rebase(event.from, event.to);
				g_log.info("Instance '{}' renamed to '{}'", old_name, instance->name);
				m_notifications.info(fmt::format("Instance '{}' renamed to '{}'", old_name, instance->name));
				m_notifications.instance_modified(info_message(*instance));
			},
			[&](watch::InvalidInstanceDir) {
				if (m_registry.parent_is_instances_root(event.to) && !m_registry.contains(event.to)) {
					m_registry.watch(event.to, watch::InvalidInstanceDir{});
				}
			},
			[&](watch::InstanceLevelDir const& level) {
				mark_world_dirty(level.id, event.from);
				if (event.to.parent_path() == event.from.parent_path()) { mark_world_dirty(level.id, event.to); }
			},
			[&](watch::InstanceSavesDir const& saves) { drop_saves(saves.id, event.from); },
			[&](watch::InstanceModsDir const& mods) { drop_mods(mods.id); },
			[&](watch::ServersFile const& servers) {
				mark_servers_dirty(servers.id);
				m_registry.watch(event.from, servers);
			},
		};
		std::visit(visitor, *target);
		return;
	}

	// neither endpoint is watched itself: look at both parents
	for (auto const* path : {&event.from, &event.to}) {
		auto const* found = m_registry.find(path->parent_path());
		if (!found) { continue; }
		auto const parent_target = *found;
		auto const visitor = Visitor{
			[&](watch::InstanceModsDir const& mods) { mark_mod_dirty(mods.id, *path, post); },
			[&](watch::InstanceSavesDir const& saves) { mark_world_dirty(saves.id, *path); },
			[&](watch::InstanceLevelDir const& level) { mark_world_dirty(level.id, path->parent_path()); },
			[](auto const&) {},
		};
		std::visit(visitor, parent_target);
	}
}

void Backend::mark_world_dirty(InstanceID const id, fs::path const& path) {
	auto* instance = find(id);
	if (!instance) { return; }
	if (instance->dirty_worlds.insert(path).second) { instance->mark_worlds_dirty(); }
}

void Backend::mark_mod_dirty(InstanceID const id, fs::path const& path, PostBatch& post) {
	auto* instance = find(id);
	if (!instance) { return; }
	if (!instance->dirty_mods.insert(path).second) { return; }
	instance->mark_mods_dirty();
	if (m_reload_mods.erase(id) > 0) { post.reload_mods.insert(id); }
}

void Backend::mark_servers_dirty(InstanceID const id) {
	auto* instance = find(id);
	if (!instance) { return; }
	instance->dirty_servers = true;
	instance->mark_servers_dirty();
}

void Backend::drop_saves(InstanceID const id, fs::path const& saves) {
	m_registry.unwatch_nested(saves);
	auto* instance = find(id);
	if (!instance) { return; }
	g_log.info("Saves folder of '{}' is gone", instance->name);
	instance->invalidate_worlds();
	m_notifications.worlds_updated(id, std::make_shared<std::vector<WorldSummary> const>());
}

void Backend::drop_mods(InstanceID const id) {
	auto* instance = find(id);
	if (!instance) { return; }
	g_log.info("Mods folder of '{}' is gone", instance->name);
	instance->invalidate_mods();
	m_notifications.mods_updated(id, std::make_shared<std::vector<InstanceModSummary> const>());
}
} // namespace lapis
