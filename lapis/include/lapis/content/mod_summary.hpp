#pragma once
#include <lapis/io/sha1.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace lapis {
///
/// \brief One file of a modpack manifest.
///
struct ModpackFile {
	std::string path{};
	std::vector<std::string> urls{};
	std::string sha1{};
	std::uint64_t size{};
};

struct ModpackManifest {
	std::string game_version{};
	std::vector<ModpackFile> files{};
};

///
/// \brief Parsed metadata of a mod archive, shared across instances by content hash.
///
struct ModSummary {
	std::string id{};
	std::string name{};
	std::string version{};
	std::string authors{};
	Sha1Digest sha1{};
	std::optional<ModpackManifest> modpack{};
};
} // namespace lapis
