#pragma once
#include <lapis/instance/summaries.hpp>
#include <lapis/watch/fs_watcher.hpp>
#include <filesystem>
#include <functional>
#include <optional>
#include <span>
#include <unordered_set>
#include <vector>

namespace lapis {
using PathSet = std::unordered_set<std::filesystem::path, PathHasher>;
} // namespace lapis

namespace lapis::worlds {
inline constexpr std::size_t max_worlds_v{64};

///
/// \brief Read level.dat (and icon.png) of a world folder.
/// \returns std::nullopt (and logs) if level.dat is missing or malformed
///
std::optional<WorldSummary> load_summary(std::filesystem::path const& level_path);

using LoadFunc = std::function<std::optional<WorldSummary>(std::filesystem::path const&)>;

///
/// \brief Full scan of a saves folder.
///
std::vector<WorldSummary> scan(std::filesystem::path const& saves_path, LoadFunc const& load = load_summary);

///
/// \brief Incremental rescan: reload dirty folders, carry over untouched entries that still exist.
///
std::vector<WorldSummary> merge(PathSet const& dirty, std::span<WorldSummary const> previous, LoadFunc const& load = load_summary);

///
/// \brief Sort by last played (most recent first) and cap at max_worlds_v.
///
void sort_and_cap(std::vector<WorldSummary>& out);
} // namespace lapis::worlds
