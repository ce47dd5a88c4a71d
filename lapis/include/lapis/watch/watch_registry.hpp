#pragma once
#include <lapis/util/ptr.hpp>
#include <lapis/watch/fs_watcher.hpp>
#include <lapis/watch/watch_target.hpp>
#include <filesystem>
#include <functional>
#include <optional>
#include <unordered_map>
#include <vector>

namespace lapis {
///
/// \brief Map of absolute path to WatchTarget, kept in step with the OS subscriptions.
///
/// Each path maps to exactly one target; a path only enters the map once the OS accepted the watch.
///
class WatchRegistry {
  public:
	explicit WatchRegistry(FsWatcher& watcher) : m_watcher(&watcher) {}

	///
	/// \brief Subscribe path and map it to target (replacing any previous target).
	/// \returns false if the OS subscription failed; the map is left unchanged
	///
	bool watch(std::filesystem::path const& path, WatchTarget target);

	///
	/// \brief Drop path from the map and the OS subscription.
	/// \returns The previous target, if any
	///
	std::optional<WatchTarget> unwatch(std::filesystem::path const& path);

	///
	/// \brief Drop path from the map only (the OS already dropped it).
	///
	std::optional<WatchTarget> forget(std::filesystem::path const& path);

	Ptr<WatchTarget const> find(std::filesystem::path const& path) const;
	bool contains(std::filesystem::path const& path) const { return m_targets.contains(path); }

	bool parent_is_instances_root(std::filesystem::path const& path) const;

	///
	/// \brief Re-key every target strictly under from onto the same relative path under to.
	///
	void rebase(std::filesystem::path const& from, std::filesystem::path const& to);

	///
	/// \brief Unwatch every target owned by id.
	///
	void unwatch_owned(InstanceID id);
	///
	/// \brief Unwatch every target strictly under root.
	///
	void unwatch_nested(std::filesystem::path const& root);

	std::size_t size() const { return m_targets.size(); }

	template <typename Func>
	void for_each(Func&& func) const {
		for (auto const& [path, target] : m_targets) { func(path, target); }
	}

  private:
	std::vector<std::filesystem::path> paths_if(std::function<bool(std::filesystem::path const&, WatchTarget const&)> const& pred) const;

	Ptr<FsWatcher> m_watcher;
	std::unordered_map<std::filesystem::path, WatchTarget, PathHasher> m_targets{};
};
} // namespace lapis
