#pragma once
#include <lapis/config.hpp>
#include <lapis/content/content_installer.hpp>
#include <lapis/directories.hpp>
#include <lapis/instance/instance.hpp>
#include <lapis/notifications.hpp>
#include <lapis/util/enum_array.hpp>
#include <lapis/util/pinned.hpp>
#include <lapis/watch/fs_event.hpp>
#include <lapis/watch/watch_registry.hpp>
#include <chrono>
#include <future>
#include <memory>
#include <optional>
#include <span>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace lapis {
///
/// \brief Owns the instance store, the watch registry and the content installer.
///
/// All public member functions must be called from a single (control) thread. Background
/// loads and installs report completion through the wake signal; tick() publishes their
/// results.
///
class Backend : public Pinned {
  public:
	using OnProgress = ProgressTracker::OnUpdate;

	///
	/// \throws InitError if the launcher directories cannot be created
	///
	Backend(Directories directories, Config config, FsWatcher& watcher, HttpClient& http, OnProgress on_progress = {});
	~Backend();

	///
	/// \brief Watch the instances folder and load every instance in it.
	/// \throws InitError if the instances folder cannot be watched
	///
	void start();

	///
	/// \brief Route one debounced watcher delivery.
	///
	void handle_batch(RawBatch const& batch);
	///
	/// \brief Classify, coalesce and route raw events, then start promoted mod reloads.
	/// \returns Number of routed events
	///
	std::size_t handle_events(std::span<RawEvent const> events);

	///
	/// \brief Publish completed loads and installs.
	///
	void tick();

	///
	/// \brief Sleep until a background task completes or timeout elapses.
	///
	bool wait(std::chrono::milliseconds timeout) { return m_wake->wait_for(timeout); }
	std::shared_ptr<WakeSignal> const& wake_signal() const { return m_wake; }

	StartLoad request_worlds(InstanceID id);
	StartLoad request_servers(InstanceID id);
	StartLoad request_mods(InstanceID id);

	///
	/// \brief Arm the one-shot marker: the next mods-folder change of id reloads mods within the same batch.
	///
	void reload_mods_immediately(InstanceID id);

	///
	/// \brief Create <instances>/<name> with an info.json and load it.
	/// \returns Id of the new instance, or std::nullopt on failure (logged)
	///
	std::optional<InstanceID> create_instance(std::string_view name, LoaderKind loader, std::string version);

	///
	/// \brief Start installing request on a background thread.
	///
	/// Target resolution and linking happen in a later tick().
	///
	std::shared_ptr<InstallAction> install_content(InstallRequest request);
	bool installs_pending() const { return !m_installs.empty(); }

	Ptr<Instance const> find_instance(InstanceID id) const { return m_instances.find(id); }
	Ptr<InstanceModSummary const> find_mod(InstanceID id, ModID mod) const;
	std::vector<InstanceID> instance_ids() const { return m_instances.ids(); }
	std::size_t instance_count() const { return m_instances.size(); }

	Notifications& notifications() { return m_notifications; }
	WatchRegistry const& watch_registry() const { return m_registry; }
	ContentInstaller const& installer() const { return m_installer; }
	ModMetadataManager& metadata() const { return *m_metadata; }
	Directories const& directories() const { return m_directories; }
	Config const& config() const { return m_config; }

  private:
	using InstanceSet = std::unordered_set<InstanceID, InstanceID::Hasher>;
	using States = EnumArray<Resource, LoadState>;

	struct PostBatch {
		InstanceSet reload_mods{};
	};

	struct PendingInstall {
		InstallRequest request{};
		std::shared_ptr<InstallAction> action{};
		std::shared_ptr<std::atomic<bool>> finished{};
		std::future<std::vector<ContentInstaller::LibraryFile>> future{};
	};

	// router (router.cpp)
	void route(FsEvent const& event, PostBatch& post);
	void on_changed(fs_event::Changed const& event, PostBatch& post);
	void on_remove(fs_event::Remove const& event, PostBatch& post);
	void on_rename(fs_event::Rename const& event, PostBatch& post);
	void mark_world_dirty(InstanceID id, std::filesystem::path const& path);
	void mark_mod_dirty(InstanceID id, std::filesystem::path const& path, PostBatch& post);
	void mark_servers_dirty(InstanceID id);
	void drop_saves(InstanceID id, std::filesystem::path const& saves);
	void drop_mods(InstanceID id);

	std::optional<InstanceID> load_instance_from_path(std::filesystem::path const& path);
	void remove_instance(InstanceID id);

	void poll_loads();
	void poll_installs();
	void complete_install(PendingInstall& install, std::vector<ContentInstaller::LibraryFile> files);
	bool link_file(ContentInstaller::LibraryFile const& file, std::filesystem::path const& destination) const;
	void report_states();

	Ptr<Instance> find(InstanceID const id) { return m_instances.find(id); }
	LoadContext load_context() { return LoadContext{.pool = &m_pool, .wake = m_wake, .metadata = m_metadata}; }
	InstanceInfoMessage info_message(Instance const& instance) const;

	Directories m_directories;
	Config m_config;
	Notifications m_notifications{};
	OnProgress m_on_progress{};

	std::shared_ptr<WakeSignal> m_wake{std::make_shared<WakeSignal>()};
	std::shared_ptr<ModMetadataManager> m_metadata{};
	ThreadPool m_pool;
	ContentInstaller m_installer;

	WatchRegistry m_registry;
	GenerationalArena<Instance, InstanceID> m_instances{};
	InstanceSet m_reload_mods{};
	std::unordered_map<InstanceID, States, InstanceID::Hasher> m_reported_states{};

	std::vector<PendingInstall> m_installs{};
};
} // namespace lapis
