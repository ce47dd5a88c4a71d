#include <daemon.hpp>
#include <lapis/util/logger.hpp>

namespace lapisd {
namespace {
auto const g_log{lapis::Logger{"lapisd"}};

std::string describe(lapis::InstanceID const id) { return fmt::format("#{}.{}", id.index, id.generation); }
} // namespace

Daemon::Daemon(lapis::Backend& backend, lapis::InotifyWatcher& watcher) : m_backend(&backend), m_watcher(&watcher) {
	auto& notifications = backend.notifications();
	m_on_added = notifications.instance_added.connect([this](lapis::InstanceInfoMessage const& info) {
		g_log.info("+ instance {} '{}' ({} {})", describe(info.id), info.name, lapis::to_string(info.loader), info.version);
		request_all(info.id);
	});
	m_on_modified = notifications.instance_modified.connect([this](lapis::InstanceInfoMessage const& info) {
		g_log.info("~ instance {} '{}' ({} {})", describe(info.id), info.name, lapis::to_string(info.loader), info.version);
		request_all(info.id);
	});
	m_on_removed = notifications.instance_removed.connect([](lapis::InstanceID const& id) { g_log.info("- instance {}", describe(id)); });
	m_on_state = notifications.load_state_changed.connect([this](lapis::LoadStateMessage const& message) {
		g_log.debug("instance {} {}: {}", describe(message.id), lapis::resource_names_v[message.resource], lapis::load_state_names_v[message.state]);
		if (message.state == lapis::LoadState::eLoadedDirty) { m_requests.push_back(Request{message.id, message.resource}); }
	});
	m_on_worlds = notifications.worlds_updated.connect([](lapis::InstanceID const& id, lapis::Instance::Worlds const& worlds) {
		g_log.info("instance {}: {} world(s)", describe(id), worlds->size());
		for (auto const& world : *worlds) { g_log.debug("  {} | {}", world.title, world.subtitle); }
	});
	m_on_servers = notifications.servers_updated.connect([](lapis::InstanceID const& id, lapis::Instance::Servers const& servers) {
		g_log.info("instance {}: {} server(s)", describe(id), servers->size());
		for (auto const& server : *servers) { g_log.debug("  {} ({})", server.name, server.ip); }
	});
	m_on_mods = notifications.mods_updated.connect([](lapis::InstanceID const& id, lapis::Instance::Mods const& mods) {
		g_log.info("instance {}: {} mod(s)", describe(id), mods->size());
		for (auto const& mod : *mods) {
			auto const& name = mod.mod ? mod.mod->name : mod.filename;
			g_log.debug("  {} {}{}", name, mod.mod ? mod.mod->version : std::string{}, mod.enabled ? "" : " (disabled)");
		}
	});
	m_on_info = notifications.info.connect([](std::string const& text) { g_log.info("{}", text); });
	m_on_error = notifications.error.connect([](std::string const& text) { g_log.error("{}", text); });
}

void Daemon::run(std::atomic<bool> const& stop) {
	g_log.info("Watching [{}]", m_backend->directories().instances.generic_string());
	while (!stop.load()) { step(); }
	g_log.info("Stopping");
}

bool Daemon::install(lapis::InstallRequest request, std::atomic<bool> const& stop) {
	auto const action = m_backend->install_content(std::move(request));
	while (!stop.load() && !action->is_done()) { step(); }
	if (!action->is_done()) {
		g_log.warn("Install interrupted");
		return false;
	}
	for (auto const& tracker : action->trackers()) {
		auto const snapshot = tracker->snapshot();
		auto const status = snapshot.error ? "failed" : (snapshot.finish == lapis::ProgressTracker::Finish::eFast ? "cached" : "done");
		g_log.info("{}: {} ({}/{})", snapshot.title, status, snapshot.count, snapshot.total);
	}
	if (auto const error = action->error()) {
		g_log.error("Install failed: {}", *error);
		return false;
	}
	// let the router observe the linked files before exiting
	for (int i = 0; i < 5 && !stop.load(); ++i) { step(); }
	return true;
}

void Daemon::step() {
	m_backend->wait(tick_v);
	if (auto batch = m_watcher->poll_batch()) { m_backend->handle_batch(*batch); }
	m_backend->tick();
	flush_requests();
}

void Daemon::request_all(lapis::InstanceID const id) {
	for (auto const resource : {lapis::Resource::eWorlds, lapis::Resource::eServers, lapis::Resource::eMods}) { m_requests.push_back(Request{id, resource}); }
}

void Daemon::flush_requests() {
	// requests issue notifications of their own: swap first
	while (!m_requests.empty()) {
		auto requests = std::exchange(m_requests, {});
		for (auto const& request : requests) {
			switch (request.resource) {
			case lapis::Resource::eWorlds: m_backend->request_worlds(request.id); break;
			case lapis::Resource::eServers: m_backend->request_servers(request.id); break;
			case lapis::Resource::eMods: m_backend->request_mods(request.id); break;
			default: break;
			}
		}
	}
}
} // namespace lapisd
