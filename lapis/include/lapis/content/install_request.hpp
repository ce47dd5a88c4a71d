#pragma once
#include <lapis/content/content_source.hpp>
#include <lapis/content/safe_path.hpp>
#include <lapis/instance/instance_id.hpp>
#include <lapis/instance/loader_kind.hpp>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace lapis {
namespace install {
struct TargetInstance {
	InstanceID id{};
};

struct TargetLibrary {};

struct TargetNewInstance {
	std::string name{};
	LoaderKind loader{LoaderKind::eVanilla};
	std::optional<std::string> game_version{};
};

using Target = std::variant<TargetInstance, TargetLibrary, TargetNewInstance>;

struct RemoteDownload {
	std::string url{};
	std::string sha1{};
	std::uint64_t size{};
};

struct LocalFile {
	std::filesystem::path path{};
};

using Download = std::variant<RemoteDownload, LocalFile>;

///
/// \brief Destination relative to the target's .minecraft folder: trusted raw path or SafePath.
///
using Path = std::variant<std::filesystem::path, SafePath>;

struct File {
	std::optional<std::filesystem::path> replace_old{};
	Path path{};
	Download download{};
	ContentSource source{ContentSource::eManual};
};
} // namespace install

struct InstallRequest {
	install::Target target{install::TargetLibrary{}};
	std::vector<install::File> files{};
};

///
/// \brief File name component of an install path.
///
std::string file_name_of(install::Path const& path);
///
/// \brief Extension (without dot) of an install path.
///
std::string extension_of(install::Path const& path);
std::filesystem::path resolve(install::Path const& path, std::filesystem::path const& base);
} // namespace lapis
