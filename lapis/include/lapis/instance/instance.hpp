#pragma once
#include <lapis/content/mod_metadata.hpp>
#include <lapis/instance/load_pipeline.hpp>
#include <lapis/instance/loader_kind.hpp>
#include <lapis/instance/summaries.hpp>
#include <lapis/instance/world_loader.hpp>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

namespace lapis {
///
/// \brief Contents of an instance's info.json.
///
struct InstanceInfo {
	static constexpr std::string_view file_name_v{"info.json"};

	std::string minecraft_version{};
	LoaderKind loader{LoaderKind::eVanilla};

	static std::optional<InstanceInfo> read(std::filesystem::path const& path);
	bool write(std::filesystem::path const& path) const;
};

///
/// \brief Services shared by every instance's background loads.
///
struct LoadContext {
	Ptr<ThreadPool> pool{};
	std::shared_ptr<WakeSignal> wake{};
	std::shared_ptr<ModMetadataManager> metadata{};
};

class Instance {
  public:
	using Worlds = LoadPipeline<WorldSummary>::Snapshot;
	using Servers = LoadPipeline<ServerSummary>::Snapshot;
	using Mods = LoadPipeline<InstanceModSummary>::Snapshot;

	///
	/// \brief Read info.json from an instance folder.
	/// \returns std::nullopt (and logs) if path is not a directory or info.json is missing / invalid
	///
	static std::optional<Instance> load_from_folder(std::filesystem::path const& path);

	///
	/// \brief Take folder, name, version and loader from other; pipelines and identity are kept.
	///
	void copy_basic_attributes_from(Instance const& other);

	///
	/// \brief Point the instance at a new root folder; cached summaries refer to old paths and are dropped.
	///
	void relocate(std::filesystem::path const& root);

	StartLoad start_load_worlds(LoadContext const& context);
	StartLoad start_load_servers(LoadContext const& context);
	StartLoad start_load_mods(LoadContext const& context);

	///
	/// \brief Publish a completed world load.
	/// \returns The new snapshot, if a load completed
	///
	std::optional<Worlds> finish_load_worlds();
	std::optional<Servers> finish_load_servers();
	std::optional<Mods> finish_load_mods();

	///
	/// \brief Look up a mod by id; ids from an older mod generation resolve to nothing.
	///
	Ptr<InstanceModSummary const> find_mod(ModID id) const;
	std::uint32_t mod_generation() const { return m_mod_generation; }

	bool mark_worlds_dirty() { return worlds.mark_dirty(); }
	bool mark_servers_dirty() { return servers.mark_dirty(); }
	bool mark_mods_dirty() { return mods.mark_dirty(); }

	void invalidate_worlds();
	void invalidate_mods();

	InstanceID id{};
	std::filesystem::path root_path{};
	std::filesystem::path dot_minecraft_path{};
	std::filesystem::path saves_path{};
	std::filesystem::path mods_path{};
	std::filesystem::path servers_file_path{};
	std::string name{};
	std::string version{};
	LoaderKind loader{};

	LoadPipeline<WorldSummary> worlds{};
	PathSet dirty_worlds{};
	LoadPipeline<ServerSummary> servers{};
	bool dirty_servers{};
	LoadPipeline<InstanceModSummary> mods{};
	PathSet dirty_mods{};

  private:
	void set_root(std::filesystem::path const& root);

	std::uint32_t m_mod_generation{};
};
} // namespace lapis
