#include <fmt/format.h>
#include <gtest/gtest.h>
#include <lapis/backend.hpp>
#include <lapis/util/error.hpp>
#include <test_util.hpp>
#include <algorithm>
#include <stdexcept>

namespace lapis {
namespace fs = std::filesystem;

namespace {
using namespace std::chrono_literals;

RawEvent created(fs::path path, raw::CreateKind kind) { return RawEvent{.kind = raw::Create{kind}, .paths = {std::move(path)}}; }
RawEvent removed(fs::path path) { return RawEvent{.kind = raw::Remove{raw::RemoveKind::eAny}, .paths = {std::move(path)}}; }
RawEvent renamed(fs::path from, fs::path to) { return RawEvent{.kind = raw::ModifyName{raw::RenameMode::eBoth}, .paths = {std::move(from), std::move(to)}}; }
RawEvent modified(fs::path path) { return RawEvent{.kind = raw::ModifyData{raw::DataChange::eContent}, .paths = {std::move(path)}}; }

std::vector<std::byte> fabric_jar(std::string_view const id) { return test::make_zip({{"fabric.mod.json", test::fabric_mod_json(id, id, "1")}}); }

struct RouterTest : ::testing::Test {
	test::TempDir dir{};
	test::FakeWatcher watcher{};
	test::FakeHttpClient http{};
	Directories directories{Directories::make(dir / "launcher")};
	std::unique_ptr<Backend> backend{};

	std::vector<InstanceInfoMessage> added{};
	std::vector<InstanceInfoMessage> modified{};
	std::vector<InstanceID> removed_ids{};
	std::vector<LoadStateMessage> states{};
	std::vector<std::string> infos{};
	std::vector<std::string> errors{};
	std::vector<Instance::Worlds> worlds{};
	std::vector<Instance::Mods> mods{};

	Signal<InstanceInfoMessage>::Listener on_added{};
	Signal<InstanceInfoMessage>::Listener on_modified{};
	Signal<InstanceID>::Listener on_removed{};
	Signal<LoadStateMessage>::Listener on_state{};
	Signal<std::string>::Listener on_info{};
	Signal<std::string>::Listener on_error{};
	Signal<InstanceID, Instance::Worlds>::Listener on_worlds{};
	Signal<InstanceID, Instance::Mods>::Listener on_mods{};

	void SetUp() override {
		auto config = Config{.debounce_ms = 10, .worker_threads = 2};
		backend = std::make_unique<Backend>(directories, std::move(config), watcher, http);
		auto& notifications = backend->notifications();
		on_added = notifications.instance_added.connect([this](InstanceInfoMessage const& m) { added.push_back(m); });
		on_modified = notifications.instance_modified.connect([this](InstanceInfoMessage const& m) { modified.push_back(m); });
		on_removed = notifications.instance_removed.connect([this](InstanceID const& id) { removed_ids.push_back(id); });
		on_state = notifications.load_state_changed.connect([this](LoadStateMessage const& m) { states.push_back(m); });
		on_info = notifications.info.connect([this](std::string const& m) { infos.push_back(m); });
		on_error = notifications.error.connect([this](std::string const& m) { errors.push_back(m); });
		on_worlds = notifications.worlds_updated.connect([this](InstanceID const&, Instance::Worlds const& w) { worlds.push_back(w); });
		on_mods = notifications.mods_updated.connect([this](InstanceID const&, Instance::Mods const& m) { mods.push_back(m); });
	}

	void TearDown() override { backend.reset(); }

	fs::path instance_path(std::string_view const name) const { return directories.instances / name; }

	WatchTarget const* target_of(fs::path const& path) const { return backend->watch_registry().find(path); }

	std::size_t route(std::vector<RawEvent> const& events) { return backend->handle_events(events); }

	template <typename Pred>
	bool pump(Pred pred) {
		for (int i = 0; i < 500; ++i) {
			backend->tick();
			if (pred()) { return true; }
			backend->wait(10ms);
		}
		return false;
	}

	LoadState state_of(InstanceID const id, Resource const resource) const {
		auto const* instance = backend->find_instance(id);
		if (!instance) { return LoadState::eUnloaded; }
		switch (resource) {
		case Resource::eWorlds: return instance->worlds.state();
		case Resource::eServers: return instance->servers.state();
		default: return instance->mods.state();
		}
	}

	Instance const& instance(InstanceID const id) const {
		auto const* ret = backend->find_instance(id);
		if (!ret) { throw std::runtime_error{"instance not found"}; }
		return *ret;
	}

	std::shared_ptr<InstallAction> install_into(InstanceID const id, std::string_view const path, std::vector<std::byte> const& body) {
		auto const url = fmt::format("https://cdn.example/{}", path);
		http.serve(url, body);
		auto request = InstallRequest{.target = install::TargetInstance{id}};
		request.files.push_back(install::File{
			.path = *SafePath::make(path),
			.download = install::RemoteDownload{.url = url, .sha1 = to_hex(sha1_of(body)), .size = body.size()},
		});
		auto ret = backend->install_content(std::move(request));
		EXPECT_TRUE(pump([&] { return ret->is_done(); }));
		return ret;
	}

	InstanceID start_with(std::string_view const name) {
		test::write_instance(instance_path(name));
		backend->start();
		EXPECT_EQ(backend->instance_count(), 1u);
		return backend->instance_ids().front();
	}
};
} // namespace

TEST_F(RouterTest, StartDiscoversInstances) {
	test::write_instance(instance_path("Beta"), "1.19.2", "quilt");
	test::write_instance(instance_path("Alpha"));
	fs::create_directories(instance_path("Broken"));
	backend->start();

	ASSERT_EQ(added.size(), 2u);
	EXPECT_EQ(added[0].name, "Alpha");
	EXPECT_EQ(added[1].name, "Beta");
	EXPECT_EQ(added[1].loader, LoaderKind::eQuilt);
	ASSERT_TRUE(target_of(directories.instances));
	EXPECT_TRUE(std::holds_alternative<watch::InstancesRoot>(*target_of(directories.instances)));
	ASSERT_TRUE(target_of(instance_path("Broken")));
	EXPECT_TRUE(std::holds_alternative<watch::InvalidInstanceDir>(*target_of(instance_path("Broken"))));
	ASSERT_TRUE(target_of(instance_path("Alpha")));
	EXPECT_EQ(*target_of(instance_path("Alpha")), WatchTarget{watch::InstanceDir{added[0].id}});
}

TEST_F(RouterTest, StartFailsWithoutRootWatch) {
	watcher.refuse.push_back(directories.instances);
	EXPECT_THROW(backend->start(), InitError);
}

TEST_F(RouterTest, NewFolderBecomesInstance) {
	backend->start();
	test::write_instance(instance_path("Fresh"));
	fs::create_directories(instance_path("Empty"));
	route({created(instance_path("Fresh"), raw::CreateKind::eFolder), created(instance_path("Empty"), raw::CreateKind::eFolder)});
	ASSERT_EQ(added.size(), 1u);
	EXPECT_EQ(added[0].name, "Fresh");
	ASSERT_TRUE(target_of(instance_path("Empty")));
	EXPECT_TRUE(std::holds_alternative<watch::InvalidInstanceDir>(*target_of(instance_path("Empty"))));

	// a file in the root is not an instance
	test::write_file(directories.instances / "notes.txt", "x");
	route({created(directories.instances / "notes.txt", raw::CreateKind::eFile)});
	EXPECT_FALSE(target_of(directories.instances / "notes.txt"));
}

TEST_F(RouterTest, InfoFileRemovedAndRestored) {
	auto const id = start_with("Modded");
	auto const info = instance_path("Modded") / "info.json";
	fs::remove(info);
	route({removed(info)});

	ASSERT_EQ(removed_ids.size(), 1u);
	EXPECT_EQ(removed_ids[0], id);
	EXPECT_EQ(backend->instance_count(), 0u);
	ASSERT_TRUE(target_of(instance_path("Modded")));
	EXPECT_TRUE(std::holds_alternative<watch::InvalidInstanceDir>(*target_of(instance_path("Modded"))));

	test::write_instance(instance_path("Modded"));
	route({created(info, raw::CreateKind::eFile)});
	ASSERT_EQ(added.size(), 2u);
	EXPECT_EQ(backend->instance_count(), 1u);
	EXPECT_NE(added[1].id, id);
	EXPECT_FALSE(backend->find_instance(id));
	EXPECT_EQ(*target_of(instance_path("Modded")), WatchTarget{watch::InstanceDir{added[1].id}});
}

TEST_F(RouterTest, InfoFileEditReloadsAttributes) {
	auto const id = start_with("Edited");
	test::write_instance(instance_path("Edited"), "1.16.5", "forge");
	route({RawEvent{.kind = raw::ModifyData{raw::DataChange::eContent}, .paths = {instance_path("Edited") / "info.json"}}});
	ASSERT_EQ(modified.size(), 1u);
	EXPECT_EQ(modified[0].id, id);
	EXPECT_EQ(modified[0].version, "1.16.5");
	EXPECT_EQ(backend->find_instance(id)->loader, LoaderKind::eForge);
	EXPECT_EQ(added.size(), 1u);
}

TEST_F(RouterTest, ServersFileReplacedIsRewatched) {
	auto const id = start_with("Multiplayer");
	auto const servers_file = instance_path("Multiplayer") / ".minecraft" / "servers.dat";
	auto writer = test::NbtWriter{};
	writer.begin_compound("").begin_compound_list("servers", 1).begin_element().string("name", "Hub").string("ip", "hub.example").end_compound().end_compound();
	test::write_file(servers_file, writer.bytes());

	ASSERT_EQ(backend->request_servers(id), StartLoad::eInitial);
	ASSERT_TRUE(pump([&] { return state_of(id, Resource::eServers) == LoadState::eLoaded; }));
	ASSERT_EQ(watcher.watch_count(servers_file), 1u);

	states.clear();
	route({removed(servers_file)});
	EXPECT_EQ(watcher.watch_count(servers_file), 2u);
	ASSERT_TRUE(target_of(servers_file));
	EXPECT_EQ(*target_of(servers_file), WatchTarget{watch::ServersFile{id}});
	auto const server_states = std::count_if(states.begin(), states.end(), [](LoadStateMessage const& m) { return m.resource == Resource::eServers; });
	EXPECT_EQ(server_states, 1);
	EXPECT_EQ(state_of(id, Resource::eServers), LoadState::eLoadedDirty);

	ASSERT_EQ(backend->request_servers(id), StartLoad::eReload);
	ASSERT_TRUE(pump([&] { return state_of(id, Resource::eServers) == LoadState::eLoaded; }));
}

TEST_F(RouterTest, RenameOutsideDestroysInstance) {
	auto const id = start_with("Leaving");
	backend->request_mods(id);
	auto const outside = dir / "elsewhere" / "Leaving";
	fs::create_directories(outside.parent_path());
	fs::rename(instance_path("Leaving"), outside);
	route({renamed(instance_path("Leaving"), outside)});

	ASSERT_EQ(removed_ids.size(), 1u);
	EXPECT_EQ(removed_ids[0], id);
	EXPECT_TRUE(infos.empty());
	EXPECT_EQ(backend->instance_count(), 0u);
	EXPECT_FALSE(target_of(instance_path("Leaving")));
	EXPECT_FALSE(target_of(outside));
	EXPECT_FALSE(target_of(instance_path("Leaving") / ".minecraft" / "mods"));
	EXPECT_EQ(backend->watch_registry().size(), 1u);
}

TEST_F(RouterTest, RenameInsideRelocates) {
	auto const id = start_with("Before");
	backend->request_mods(id);
	fs::rename(instance_path("Before"), instance_path("After"));
	route({renamed(instance_path("Before"), instance_path("After"))});

	ASSERT_EQ(infos.size(), 1u);
	EXPECT_EQ(infos[0], "Instance 'Before' renamed to 'After'");
	ASSERT_EQ(modified.size(), 1u);
	EXPECT_EQ(modified[0].name, "After");
	EXPECT_TRUE(removed_ids.empty());
	auto const* instance = backend->find_instance(id);
	ASSERT_TRUE(instance);
	EXPECT_EQ(instance->root_path, instance_path("After"));
	EXPECT_FALSE(target_of(instance_path("Before")));
	EXPECT_EQ(*target_of(instance_path("After")), WatchTarget{watch::InstanceDir{id}});
	EXPECT_TRUE(target_of(instance_path("After") / ".minecraft" / "mods"));
	EXPECT_FALSE(target_of(instance_path("Before") / ".minecraft" / "mods"));
}

TEST_F(RouterTest, InstanceFolderRemoved) {
	auto const id = start_with("Doomed");
	fs::remove_all(instance_path("Doomed"));
	route({removed(instance_path("Doomed"))});
	ASSERT_EQ(removed_ids.size(), 1u);
	EXPECT_EQ(removed_ids[0], id);
	EXPECT_EQ(backend->watch_registry().size(), 1u);
}

TEST_F(RouterTest, RootRemovalAndWatchErrors) {
	backend->start();
	route({removed(directories.instances)});
	ASSERT_EQ(errors.size(), 1u);
	EXPECT_EQ(errors[0], "Instances folder has been removed!");

	backend->handle_batch(RawBatch{.error = "inotify queue overflow"});
	ASSERT_EQ(errors.size(), 2u);
	EXPECT_EQ(errors[1], "An error occurred while watching the filesystem! The launcher might be out-of-sync with your files!");
}

TEST_F(RouterTest, NewWorldMarksWorldsDirty) {
	auto const id = start_with("Survival");
	ASSERT_EQ(backend->request_worlds(id), StartLoad::eInitial);
	ASSERT_TRUE(pump([&] { return state_of(id, Resource::eWorlds) == LoadState::eLoaded; }));
	ASSERT_EQ(worlds.size(), 1u);
	EXPECT_TRUE(worlds[0]->empty());

	auto const saves = instance_path("Survival") / ".minecraft" / "saves";
	test::write_level(saves / "Castle", "Castle", 5);
	route({created(saves / "Castle", raw::CreateKind::eFolder)});
	EXPECT_EQ(state_of(id, Resource::eWorlds), LoadState::eLoadedDirty);

	ASSERT_EQ(backend->request_worlds(id), StartLoad::eReload);
	ASSERT_TRUE(pump([&] { return worlds.size() == 2u; }));
	ASSERT_EQ(worlds[1]->size(), 1u);
	EXPECT_EQ((*worlds[1])[0].title, "Castle");
	ASSERT_TRUE(target_of(saves / "Castle"));
	EXPECT_EQ(*target_of(saves / "Castle"), WatchTarget{watch::InstanceLevelDir{id}});

	// removing the saves folder empties the world list
	fs::remove_all(saves);
	route({removed(saves)});
	ASSERT_EQ(worlds.size(), 3u);
	EXPECT_TRUE(worlds[2]->empty());
	EXPECT_FALSE(target_of(saves / "Castle"));
	EXPECT_EQ(state_of(id, Resource::eWorlds), LoadState::eUnloaded);
}

TEST_F(RouterTest, ArmedModReloadStartsWithinBatch) {
	auto const id = start_with("Mods");
	ASSERT_EQ(backend->request_mods(id), StartLoad::eInitial);
	ASSERT_TRUE(pump([&] { return state_of(id, Resource::eMods) == LoadState::eLoaded; }));

	auto const mods_dir = instance_path("Mods") / ".minecraft" / "mods";
	test::write_file(mods_dir / "first.jar", test::make_zip({{"fabric.mod.json", test::fabric_mod_json("first", "First", "1")}}));
	route({created(mods_dir / "first.jar", raw::CreateKind::eFile)});
	EXPECT_EQ(state_of(id, Resource::eMods), LoadState::eLoadedDirty);

	ASSERT_EQ(backend->request_mods(id), StartLoad::eReload);
	ASSERT_TRUE(pump([&] { return mods.size() == 2u; }));

	backend->reload_mods_immediately(id);
	test::write_file(mods_dir / "second.jar", test::make_zip({{"fabric.mod.json", test::fabric_mod_json("second", "Second", "1")}}));
	route({created(mods_dir / "second.jar", raw::CreateKind::eFile)});
	EXPECT_EQ(state_of(id, Resource::eMods), LoadState::eLoading);
	ASSERT_TRUE(pump([&] { return mods.size() == 3u; }));
	ASSERT_EQ(mods[2]->size(), 2u);
	auto const mod_id = (*mods[2])[1].id;
	ASSERT_TRUE(backend->find_mod(id, mod_id));
	EXPECT_EQ(backend->find_mod(id, mod_id)->mod->id, "second");

	// the marker is one-shot
	test::write_file(mods_dir / "third.jar", test::make_zip({{"fabric.mod.json", test::fabric_mod_json("third", "Third", "1")}}));
	route({created(mods_dir / "third.jar", raw::CreateKind::eFile)});
	EXPECT_EQ(state_of(id, Resource::eMods), LoadState::eLoadedDirty);
}

TEST_F(RouterTest, InstallIntoInstanceLinksFiles) {
	auto const id = start_with("Target");
	auto const body = test::make_zip({{"fabric.mod.json", test::fabric_mod_json("sodium", "Sodium", "1")}});
	http.serve("https://cdn.example/sodium.jar", body);

	auto request = InstallRequest{.target = install::TargetInstance{id}};
	request.files.push_back(install::File{
		.path = *SafePath::make("mods/sodium.jar"),
		.download = install::RemoteDownload{.url = "https://cdn.example/sodium.jar", .sha1 = to_hex(sha1_of(body)), .size = body.size()},
		.source = ContentSource::eModrinth,
	});
	auto const action = backend->install_content(std::move(request));
	ASSERT_TRUE(pump([&] { return action->is_done(); }));
	EXPECT_FALSE(action->error());
	EXPECT_FALSE(backend->installs_pending());

	auto const linked = instance_path("Target") / ".minecraft" / "mods" / "sodium.jar";
	ASSERT_TRUE(fs::is_regular_file(linked));
	EXPECT_EQ(fs::file_size(linked), body.size());
	EXPECT_EQ(backend->metadata().content_source(sha1_of(body)), ContentSource::eModrinth);
}

TEST_F(RouterTest, InstallIntoNewInstance) {
	backend->start();
	auto const body = test::to_bytes("options");
	http.serve("https://cdn.example/options.txt", body);
	auto request = InstallRequest{.target = install::TargetNewInstance{.name = "My: Pack", .loader = LoaderKind::eFabric}};
	request.files.push_back(install::File{
		.path = *SafePath::make("options.txt"),
		.download = install::RemoteDownload{.url = "https://cdn.example/options.txt", .sha1 = to_hex(sha1_of(body)), .size = body.size()},
	});
	auto const action = backend->install_content(std::move(request));
	ASSERT_TRUE(pump([&] { return action->is_done(); }));
	EXPECT_FALSE(action->error());

	ASSERT_EQ(added.size(), 1u);
	EXPECT_EQ(added[0].name, "My_ Pack");
	EXPECT_EQ(added[0].version, backend->config().default_game_version);
	EXPECT_EQ(added[0].loader, LoaderKind::eFabric);
	EXPECT_TRUE(fs::is_regular_file(instance_path("My_ Pack") / ".minecraft" / "options.txt"));
}

TEST_F(RouterTest, ModRenamedToDisabledReloadsUnderNewName) {
	auto const id = start_with("Toggle");
	auto const mods_dir = instance_path("Toggle") / ".minecraft" / "mods";
	test::write_file(mods_dir / "x.jar", fabric_jar("x"));
	ASSERT_EQ(backend->request_mods(id), StartLoad::eInitial);
	ASSERT_TRUE(pump([&] { return mods.size() == 1u; }));
	ASSERT_EQ(mods[0]->size(), 1u);
	EXPECT_TRUE((*mods[0])[0].enabled);
	auto const old_mod = (*mods[0])[0].id;

	fs::rename(mods_dir / "x.jar", mods_dir / "x.jar.disabled");
	route({renamed(mods_dir / "x.jar", mods_dir / "x.jar.disabled")});
	auto const& dirty = instance(id).dirty_mods;
	EXPECT_EQ(dirty.size(), 2u);
	EXPECT_TRUE(dirty.contains(mods_dir / "x.jar"));
	EXPECT_TRUE(dirty.contains(mods_dir / "x.jar.disabled"));
	EXPECT_EQ(state_of(id, Resource::eMods), LoadState::eLoadedDirty);

	ASSERT_EQ(backend->request_mods(id), StartLoad::eReload);
	ASSERT_TRUE(pump([&] { return mods.size() == 2u; }));
	ASSERT_EQ(mods[1]->size(), 1u);
	auto const& disabled = (*mods[1])[0];
	EXPECT_FALSE(disabled.enabled);
	EXPECT_EQ(disabled.filename, "x.jar.disabled");
	EXPECT_EQ(disabled.mod->id, "x");
	EXPECT_FALSE(backend->find_mod(id, old_mod));

	// armed: renaming it back reloads within the same batch
	backend->reload_mods_immediately(id);
	fs::rename(mods_dir / "x.jar.disabled", mods_dir / "x.jar");
	route({renamed(mods_dir / "x.jar.disabled", mods_dir / "x.jar")});
	EXPECT_EQ(state_of(id, Resource::eMods), LoadState::eLoading);
	EXPECT_TRUE(instance(id).dirty_mods.empty());
	ASSERT_TRUE(pump([&] { return mods.size() == 3u; }));
	ASSERT_EQ(mods[2]->size(), 1u);
	EXPECT_TRUE((*mods[2])[0].enabled);
	EXPECT_EQ((*mods[2])[0].filename, "x.jar");
}

TEST_F(RouterTest, ModFileRemovedMarksModsDirty) {
	auto const id = start_with("Shrinking");
	auto const mods_dir = instance_path("Shrinking") / ".minecraft" / "mods";
	test::write_file(mods_dir / "first.jar", fabric_jar("first"));
	ASSERT_EQ(backend->request_mods(id), StartLoad::eInitial);
	ASSERT_TRUE(pump([&] { return mods.size() == 1u; }));
	ASSERT_EQ(mods[0]->size(), 1u);

	fs::remove(mods_dir / "first.jar");
	route({removed(mods_dir / "first.jar")});
	EXPECT_EQ(instance(id).dirty_mods, (PathSet{mods_dir / "first.jar"}));
	EXPECT_EQ(state_of(id, Resource::eMods), LoadState::eLoadedDirty);
	// the mods folder itself is still watched
	EXPECT_EQ(*target_of(mods_dir), WatchTarget{watch::InstanceModsDir{id}});

	ASSERT_EQ(backend->request_mods(id), StartLoad::eReload);
	ASSERT_TRUE(pump([&] { return mods.size() == 2u; }));
	EXPECT_TRUE(mods[1]->empty());
}

TEST_F(RouterTest, InvalidInstanceDirRenamed) {
	fs::create_directories(instance_path("Broken"));
	fs::create_directories(instance_path("Stray"));
	backend->start();
	ASSERT_TRUE(target_of(instance_path("Broken")));

	fs::rename(instance_path("Broken"), instance_path("Renamed"));
	route({renamed(instance_path("Broken"), instance_path("Renamed"))});
	EXPECT_FALSE(target_of(instance_path("Broken")));
	ASSERT_TRUE(target_of(instance_path("Renamed")));
	EXPECT_TRUE(std::holds_alternative<watch::InvalidInstanceDir>(*target_of(instance_path("Renamed"))));
	EXPECT_TRUE(added.empty());

	// still picked up once it gains an info file
	test::write_instance(instance_path("Renamed"));
	route({created(instance_path("Renamed") / "info.json", raw::CreateKind::eFile)});
	ASSERT_EQ(added.size(), 1u);
	EXPECT_EQ(added[0].name, "Renamed");

	// moved out of the instances folder: forgotten
	auto const outside = dir / "elsewhere" / "Stray";
	fs::create_directories(outside.parent_path());
	fs::rename(instance_path("Stray"), outside);
	route({renamed(instance_path("Stray"), outside)});
	EXPECT_FALSE(target_of(instance_path("Stray")));
	EXPECT_FALSE(target_of(outside));
}

TEST_F(RouterTest, LevelDirRenamedWithinSaves) {
	auto const id = start_with("Worlds");
	auto const saves = instance_path("Worlds") / ".minecraft" / "saves";
	test::write_level(saves / "Castle", "Castle", 5);
	ASSERT_EQ(backend->request_worlds(id), StartLoad::eInitial);
	ASSERT_TRUE(pump([&] { return worlds.size() == 1u; }));
	ASSERT_EQ(worlds[0]->size(), 1u);
	ASSERT_TRUE(target_of(saves / "Castle"));

	fs::rename(saves / "Castle", saves / "Keep");
	route({renamed(saves / "Castle", saves / "Keep")});
	EXPECT_FALSE(target_of(saves / "Castle"));
	auto const& dirty = instance(id).dirty_worlds;
	EXPECT_EQ(dirty.size(), 2u);
	EXPECT_TRUE(dirty.contains(saves / "Castle"));
	EXPECT_TRUE(dirty.contains(saves / "Keep"));
	EXPECT_EQ(state_of(id, Resource::eWorlds), LoadState::eLoadedDirty);

	ASSERT_EQ(backend->request_worlds(id), StartLoad::eReload);
	ASSERT_TRUE(pump([&] { return worlds.size() == 2u; }));
	ASSERT_EQ(worlds[1]->size(), 1u);
	EXPECT_EQ((*worlds[1])[0].level_path, saves / "Keep");
	EXPECT_EQ((*worlds[1])[0].title, "Castle");
	ASSERT_TRUE(target_of(saves / "Keep"));
	EXPECT_EQ(*target_of(saves / "Keep"), WatchTarget{watch::InstanceLevelDir{id}});
}

TEST_F(RouterTest, ChangeInsideLevelDirMarksThatWorld) {
	auto const id = start_with("Worlds");
	auto const saves = instance_path("Worlds") / ".minecraft" / "saves";
	test::write_level(saves / "Castle", "Castle", 5);
	test::write_level(saves / "Farm", "Farm", 3);
	ASSERT_EQ(backend->request_worlds(id), StartLoad::eInitial);
	ASSERT_TRUE(pump([&] { return worlds.size() == 1u; }));
	ASSERT_EQ(worlds[0]->size(), 2u);

	test::write_level(saves / "Castle", "Castle Rebuilt", 10);
	route({lapis::modified(saves / "Castle" / "level.dat"), created(saves / "Castle" / "session.lock", raw::CreateKind::eFile)});
	EXPECT_EQ(instance(id).dirty_worlds, (PathSet{saves / "Castle"}));
	EXPECT_EQ(state_of(id, Resource::eWorlds), LoadState::eLoadedDirty);

	ASSERT_EQ(backend->request_worlds(id), StartLoad::eReload);
	ASSERT_TRUE(pump([&] { return worlds.size() == 2u; }));
	ASSERT_EQ(worlds[1]->size(), 2u);
	EXPECT_EQ((*worlds[1])[0].title, "Castle Rebuilt");
	EXPECT_EQ((*worlds[1])[1].title, "Farm");
}

TEST_F(RouterTest, InstallArmsReloadOnlyForLinkedMods) {
	auto const id = start_with("Target");
	ASSERT_EQ(backend->request_mods(id), StartLoad::eInitial);
	ASSERT_TRUE(pump([&] { return state_of(id, Resource::eMods) == LoadState::eLoaded; }));
	auto const mods_dir = instance_path("Target") / ".minecraft" / "mods";

	// nothing lands in mods: a later unrelated mods event only marks dirty
	EXPECT_FALSE(install_into(id, "config/sodium.properties", test::to_bytes("quality=high"))->error());
	test::write_file(mods_dir / "a.jar", fabric_jar("a"));
	route({created(mods_dir / "a.jar", raw::CreateKind::eFile)});
	EXPECT_EQ(state_of(id, Resource::eMods), LoadState::eLoadedDirty);

	// destination already taken: not linked, not armed
	test::write_file(mods_dir / "dup.jar", fabric_jar("dup"));
	EXPECT_FALSE(install_into(id, "mods/dup.jar", fabric_jar("other"))->error());
	route({created(mods_dir / "dup.jar", raw::CreateKind::eFile)});
	EXPECT_EQ(state_of(id, Resource::eMods), LoadState::eLoadedDirty);

	EXPECT_FALSE(install_into(id, "mods/sodium.jar", fabric_jar("sodium"))->error());
	ASSERT_TRUE(fs::is_regular_file(mods_dir / "sodium.jar"));
	route({created(mods_dir / "sodium.jar", raw::CreateKind::eFile)});
	EXPECT_EQ(state_of(id, Resource::eMods), LoadState::eLoading);
}

TEST_F(RouterTest, FailedInstallReportsError) {
	auto const id = start_with("Target");
	auto request = InstallRequest{.target = install::TargetInstance{id}};
	request.files.push_back(install::File{
		.path = *SafePath::make("mods/missing.jar"),
		.download = install::RemoteDownload{.url = "https://cdn.example/missing.jar", .sha1 = std::string(40, 'a'), .size = 1},
	});
	auto const action = backend->install_content(std::move(request));
	ASSERT_TRUE(pump([&] { return action->is_done(); }));
	ASSERT_TRUE(action->error());
	EXPECT_FALSE(fs::exists(instance_path("Target") / ".minecraft" / "mods" / "missing.jar"));
}

TEST_F(RouterTest, CreateInstanceNamesAreUnique) {
	backend->start();
	auto const first = backend->create_instance("Vanilla", LoaderKind::eVanilla, "1.21.1");
	auto const second = backend->create_instance("Vanilla", LoaderKind::eVanilla, "1.21.1");
	ASSERT_TRUE(first && second);
	EXPECT_EQ(backend->find_instance(*first)->name, "Vanilla");
	EXPECT_EQ(backend->find_instance(*second)->name, "Vanilla (1)");
	EXPECT_EQ(backend->instance_count(), 2u);
}
} // namespace lapis
