#pragma once
#include <lapis/content/mod_metadata.hpp>
#include <lapis/instance/summaries.hpp>
#include <lapis/instance/world_loader.hpp>
#include <optional>
#include <span>

namespace lapis::mods {
///
/// \brief Classify a mods folder entry by name.
/// \returns true for *.jar, false for *.jar.disabled, std::nullopt otherwise
///
std::optional<bool> is_enabled_mod_file(std::filesystem::path const& path);

///
/// \brief Read one mod file; ModID is left unassigned.
///
std::optional<InstanceModSummary> load_entry(std::filesystem::path const& path, ModMetadataManager& metadata);

std::vector<InstanceModSummary> scan(std::filesystem::path const& mods_path, ModMetadataManager& metadata);

///
/// \brief Incremental rescan: reload dirty files, carry over untouched entries that still exist.
///
std::vector<InstanceModSummary> merge(PathSet const& dirty, std::span<InstanceModSummary const> previous, ModMetadataManager& metadata);

///
/// \brief Sort by mod id, then file name.
///
void sort(std::vector<InstanceModSummary>& out);
} // namespace lapis::mods
