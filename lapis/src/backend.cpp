#include <lapis/backend.hpp>
#include <lapis/content/install_error.hpp>
#include <lapis/util/error.hpp>
#include <lapis/util/logger.hpp>
#include <lapis/util/visitor.hpp>
#include <algorithm>

namespace lapis {
namespace fs = std::filesystem;

namespace {
auto const g_log{Logger{"Backend"}};

std::string sanitize_instance_name(std::string_view const name) {
	static constexpr std::string_view invalid_v{"/\\?<>:*|\""};
	auto ret = std::string{};
	ret.reserve(name.size());
	for (auto const ch : name) {
		auto const byte = static_cast<unsigned char>(ch);
		ret += (byte < 0x20 || byte == 0x7f || invalid_v.find(ch) != std::string_view::npos) ? '_' : ch;
	}
	while (!ret.empty() && (ret.back() == '.' || ret.back() == ' ')) { ret.pop_back(); }
	while (!ret.empty() && ret.front() == ' ') { ret.erase(0, 1); }
	if (ret.empty()) { return "New Instance"; }
	if (!is_safe_component(ret)) { ret.insert(0, 1, '_'); }
	return ret;
}

fs::path unique_child(fs::path const& parent, std::string const& name) {
	auto ec = std::error_code{};
	auto ret = parent / name;
	for (int suffix = 1; fs::exists(ret, ec); ++suffix) { ret = parent / fmt::format("{} ({})", name, suffix); }
	return ret;
}
} // namespace

Backend::Backend(Directories directories, Config config, FsWatcher& watcher, HttpClient& http, OnProgress on_progress)
	: m_directories(std::move(directories)), m_config(std::move(config)), m_on_progress(std::move(on_progress)),
	  m_metadata(std::make_shared<ModMetadataManager>(m_directories.sources_file)), m_pool(m_config.worker_threads),
	  m_installer(ContentLibrary{m_directories.content_library}, http, m_metadata, m_config.max_concurrent_downloads), m_registry(watcher) {
	m_directories.create_all();
	g_log.info("Launcher directory: [{}], {} loader threads, {} download slots", m_directories.root.generic_string(), m_pool.thread_count(),
			   m_installer.max_concurrent());
}

Backend::~Backend() {
	// each pending install joins its download thread on destruction
	m_installs.clear();
}

void Backend::start() {
	if (!m_registry.watch(m_directories.instances, watch::InstancesRoot{})) {
		throw InitError{fmt::format("Failed to watch instances folder [{}]", m_directories.instances.generic_string())};
	}
	auto folders = std::vector<fs::path>{};
	auto ec = std::error_code{};
	for (auto const& entry : fs::directory_iterator{m_directories.instances, ec}) {
		if (entry.is_directory(ec)) { folders.push_back(entry.path()); }
	}
	std::sort(folders.begin(), folders.end());
	for (auto const& folder : folders) {
		if (load_instance_from_path(folder)) { continue; }
		m_registry.watch(folder, watch::InvalidInstanceDir{});
	}
	g_log.info("Loaded {} instance(s)", m_instances.size());
}

void Backend::handle_batch(RawBatch const& batch) {
	if (batch.failed()) {
		g_log.error("Watch error: {}", batch.error);
		m_notifications.error("An error occurred while watching the filesystem! The launcher might be out-of-sync with your files!");
		return;
	}
	handle_events(batch.events);
}

std::size_t Backend::handle_events(std::span<RawEvent const> events) {
	auto post = PostBatch{};
	auto const ret = for_each_coalesced(events, [this, &post](FsEvent const& event) { route(event, post); });
	for (auto const id : post.reload_mods) {
		auto* instance = find(id);
		if (!instance) { continue; }
		g_log.debug("Reloading mods of '{}' immediately", instance->name);
		instance->start_load_mods(load_context());
	}
	report_states();
	return ret;
}

void Backend::tick() {
	poll_loads();
	poll_installs();
	report_states();
}

StartLoad Backend::request_worlds(InstanceID const id) {
	auto* instance = find(id);
	if (!instance) { return StartLoad::eNone; }
	auto ec = std::error_code{};
	fs::create_directories(instance->saves_path, ec);
	if (!m_registry.contains(instance->saves_path)) { m_registry.watch(instance->saves_path, watch::InstanceSavesDir{id}); }
	auto const ret = instance->start_load_worlds(load_context());
	report_states();
	return ret;
}

StartLoad Backend::request_servers(InstanceID const id) {
	auto* instance = find(id);
	if (!instance) { return StartLoad::eNone; }
	auto ec = std::error_code{};
	if (!m_registry.contains(instance->servers_file_path) && fs::is_regular_file(instance->servers_file_path, ec)) {
		m_registry.watch(instance->servers_file_path, watch::ServersFile{id});
	}
	auto const ret = instance->start_load_servers(load_context());
	report_states();
	return ret;
}

StartLoad Backend::request_mods(InstanceID const id) {
	auto* instance = find(id);
	if (!instance) { return StartLoad::eNone; }
	auto ec = std::error_code{};
	fs::create_directories(instance->mods_path, ec);
	if (!m_registry.contains(instance->mods_path)) { m_registry.watch(instance->mods_path, watch::InstanceModsDir{id}); }
	auto const ret = instance->start_load_mods(load_context());
	report_states();
	return ret;
}

void Backend::reload_mods_immediately(InstanceID const id) {
	if (!m_instances.contains(id)) { return; }
	m_reload_mods.insert(id);
}

std::optional<InstanceID> Backend::create_instance(std::string_view const name, LoaderKind const loader, std::string version) {
	auto const path = unique_child(m_directories.instances, sanitize_instance_name(name));
	auto ec = std::error_code{};
	fs::create_directories(path / ".minecraft", ec);
	if (ec) {
		g_log.error("Failed to create instance folder [{}]: {}", path.generic_string(), ec.message());
		return {};
	}
	auto const info = InstanceInfo{.minecraft_version = std::move(version), .loader = loader};
	if (!info.write(path / InstanceInfo::file_name_v)) {
		g_log.error("Failed to write [{}]", (path / InstanceInfo::file_name_v).generic_string());
		return {};
	}
	g_log.info("Created instance [{}] ({} {})", path.filename().generic_string(), to_string(loader), info.minecraft_version);
	return load_instance_from_path(path);
}

std::shared_ptr<InstallAction> Backend::install_content(InstallRequest request) {
	auto ret = std::make_shared<InstallAction>(m_on_progress);
	auto files = std::make_shared<std::vector<install::File> const>(request.files);
	auto finished = std::make_shared<std::atomic<bool>>(false);
	auto future = std::async(std::launch::async, [installer = &m_installer, files, action = ret, finished, wake = m_wake] {
		struct OnExit {
			std::atomic<bool>& finished;
			WakeSignal& wake;
			~OnExit() {
				finished.store(true);
				wake.notify();
			}
		};
		auto const on_exit = OnExit{*finished, *wake};
		return installer->fetch(*files, *action);
	});
	g_log.info("Installing {} file(s)", request.files.size());
	m_installs.push_back(PendingInstall{
		.request = std::move(request),
		.action = ret,
		.finished = std::move(finished),
		.future = std::move(future),
	});
	return ret;
}

Ptr<InstanceModSummary const> Backend::find_mod(InstanceID const id, ModID const mod) const {
	auto const* instance = m_instances.find(id);
	if (!instance) { return {}; }
	return instance->find_mod(mod);
}

std::optional<InstanceID> Backend::load_instance_from_path(fs::path const& path) {
	auto loaded = Instance::load_from_folder(path);
	if (!loaded) { return {}; }
	if (auto const* target = m_registry.find(path)) {
		if (auto const* dir = std::get_if<watch::InstanceDir>(target)) {
			if (auto* existing = find(dir->id)) {
				existing->copy_basic_attributes_from(*loaded);
				g_log.info("Reloaded instance '{}'", existing->name);
				m_notifications.instance_modified(info_message(*existing));
				return existing->id;
			}
		}
	}
	auto [id, instance] = m_instances.insert(std::move(*loaded));
	instance.id = id;
	if (!m_registry.watch(path, watch::InstanceDir{id})) { g_log.warn("Failed to watch instance folder [{}]", path.generic_string()); }
	g_log.info("Loaded instance '{}' ({} {})", instance.name, to_string(instance.loader), instance.version);
	m_notifications.instance_added(info_message(instance));
	return id;
}

void Backend::remove_instance(InstanceID const id) {
	m_registry.unwatch_owned(id);
	m_reload_mods.erase(id);
	m_reported_states.erase(id);
	auto removed = m_instances.remove(id);
	if (!removed) { return; }
	g_log.info("Removed instance '{}'", removed->name);
	m_notifications.instance_removed(id);
}

void Backend::poll_loads() {
	// signals are dispatched after iterating: observers may call request_* which watches more paths
	auto worlds = std::vector<std::pair<InstanceID, Instance::Worlds>>{};
	auto servers = std::vector<std::pair<InstanceID, Instance::Servers>>{};
	auto mods = std::vector<std::pair<InstanceID, Instance::Mods>>{};
	m_instances.for_each([&](InstanceID const id, Instance& instance) {
		if (auto snapshot = instance.finish_load_worlds()) {
			for (auto const& world : **snapshot) {
				if (!m_registry.contains(world.level_path)) { m_registry.watch(world.level_path, watch::InstanceLevelDir{id}); }
			}
			worlds.emplace_back(id, std::move(*snapshot));
		}
		if (auto snapshot = instance.finish_load_servers()) {
			auto ec = std::error_code{};
			if (!m_registry.contains(instance.servers_file_path) && fs::is_regular_file(instance.servers_file_path, ec)) {
				m_registry.watch(instance.servers_file_path, watch::ServersFile{id});
			}
			servers.emplace_back(id, std::move(*snapshot));
		}
		if (auto snapshot = instance.finish_load_mods()) { mods.emplace_back(id, std::move(*snapshot)); }
	});
	for (auto const& [id, snapshot] : worlds) { m_notifications.worlds_updated(id, snapshot); }
	for (auto const& [id, snapshot] : servers) { m_notifications.servers_updated(id, snapshot); }
	for (auto const& [id, snapshot] : mods) { m_notifications.mods_updated(id, snapshot); }
}

void Backend::poll_installs() {
	auto done = std::vector<PendingInstall>{};
	std::erase_if(m_installs, [&done](PendingInstall& install) {
		if (!install.finished->load()) { return false; }
		done.push_back(std::move(install));
		return true;
	});
	for (auto& install : done) {
		try {
			complete_install(install, install.future.get());
		} catch (std::exception const& e) {
			g_log.error("Install failed: {}", e.what());
			install.action->set_error(e.what());
		}
		install.action->set_done();
	}
}

void Backend::complete_install(PendingInstall& install, std::vector<ContentInstaller::LibraryFile> files) {
	auto destination = std::optional<fs::path>{};
	auto mods_owner = Ptr<Instance>{};
	auto const visitor = Visitor{
		[&](install::TargetInstance const& target) {
			auto* instance = find(target.id);
			if (!instance) {
				g_log.warn("Install target instance no longer exists");
				return;
			}
			destination = instance->dot_minecraft_path;
			mods_owner = instance;
		},
		[](install::TargetLibrary const&) {},
		[&](install::TargetNewInstance const& target) {
			auto version = target.game_version.value_or(m_config.default_game_version);
			auto const id = create_instance(target.name, target.loader, std::move(version));
			if (!id) {
				install.action->set_error(fmt::format("Failed to create instance '{}'", target.name));
				return;
			}
			destination = find(*id)->dot_minecraft_path;
		},
	};
	std::visit(visitor, install.request.target);

	auto sources = std::vector<std::pair<Sha1Digest, ContentSource>>{};
	for (auto const& file : files) {
		if (file.file.source != ContentSource::eManual) { sources.emplace_back(file.hash, file.file.source); }
	}
	if (!sources.empty()) { m_metadata->set_content_sources(sources); }

	if (!destination) {
		g_log.info("Installed {} file(s) into the library", files.size());
		return;
	}
	auto linked = std::size_t{};
	auto linked_mod = false;
	for (auto const& file : files) {
		auto const path = resolve(file.file.path, *destination);
		if (!link_file(file, path)) { continue; }
		++linked;
		if (mods_owner && path.parent_path() == mods_owner->mods_path) { linked_mod = true; }
	}
	// the watcher reports the new mods on a later batch: have that batch reload them right away
	if (linked_mod) { reload_mods_immediately(mods_owner->id); }
	g_log.info("Installed {}/{} file(s) into [{}]", linked, files.size(), destination->generic_string());
}

bool Backend::link_file(ContentInstaller::LibraryFile const& file, fs::path const& destination) const {
	auto ec = std::error_code{};
	fs::create_directories(destination.parent_path(), ec);
	if (file.replace) { fs::remove(*file.replace, ec); }
	if (fs::exists(destination, ec)) {
		g_log.warn("[{}] already exists, not replacing", destination.generic_string());
		return false;
	}
	fs::create_hard_link(file.from, destination, ec);
	if (!ec) { return true; }
	auto const cross_device = ec == std::errc::cross_device_link || ec == std::errc::operation_not_supported || ec == std::errc::operation_not_permitted;
	if (cross_device && m_config.link_copy_fallback) {
		g_log.debug("Hard link failed ({}), copying [{}]", ec.message(), destination.generic_string());
		ec.clear();
		fs::copy_file(file.from, destination, ec);
		if (!ec) { return true; }
	}
	g_log.error("Failed to link [{}]: {}", destination.generic_string(), ec.message());
	return false;
}

void Backend::report_states() {
	auto changes = std::vector<LoadStateMessage>{};
	m_instances.for_each([&](InstanceID const id, Instance const& instance) {
		auto& reported = m_reported_states[id];
		auto const current = States{instance.worlds.state(), instance.servers.state(), instance.mods.state()};
		for (auto const resource : {Resource::eWorlds, Resource::eServers, Resource::eMods}) {
			if (reported[resource] == current[resource]) { continue; }
			reported[resource] = current[resource];
			changes.push_back(LoadStateMessage{.id = id, .resource = resource, .state = current[resource]});
		}
	});
	for (auto const& change : changes) { m_notifications.load_state_changed(change); }
}

InstanceInfoMessage Backend::info_message(Instance const& instance) const {
	return InstanceInfoMessage{
		.id = instance.id,
		.name = instance.name,
		.version = instance.version,
		.loader = instance.loader,
		.root = instance.root_path,
	};
}
} // namespace lapis
