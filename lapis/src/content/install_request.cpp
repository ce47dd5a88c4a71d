#include <lapis/content/install_error.hpp>
#include <lapis/content/install_request.hpp>
#include <lapis/util/visitor.hpp>
#include <fmt/format.h>

namespace lapis {
namespace {
std::string make_message(InstallError::Kind const kind, std::string const& detail, long const status) {
	switch (kind) {
	case InstallError::Kind::eWrongHash: return fmt::format("Downloaded file has the wrong hash: {}", detail);
	case InstallError::Kind::eWrongFilesize: return fmt::format("Downloaded file has the wrong size: {}", detail);
	case InstallError::Kind::eNotOk: return fmt::format("Server returned status {}: {}", status, detail);
	case InstallError::Kind::eInvalidHash: return fmt::format("Invalid sha1 hash: {}", detail);
	case InstallError::Kind::eIoError: return fmt::format("IO error: {}", detail);
	case InstallError::Kind::eRequestFailed: return fmt::format("Request failed: {}", detail);
	case InstallError::Kind::eInvalidPath: return fmt::format("Invalid path: {}", detail);
	default: break;
	}
	return detail;
}
} // namespace

InstallError::InstallError(Kind const kind, std::string const& detail, long const status)
	: Error(make_message(kind, detail, status)), kind(kind), status(status) {}

std::string file_name_of(install::Path const& path) {
	auto const visitor = Visitor{
		[](std::filesystem::path const& p) { return p.filename().string(); },
		[](SafePath const& p) { return std::string{p.file_name()}; },
	};
	return std::visit(visitor, path);
}

std::string extension_of(install::Path const& path) {
	auto const visitor = Visitor{
		[](std::filesystem::path const& p) {
			auto ret = p.extension().string();
			if (!ret.empty()) { ret.erase(0, 1); }
			return ret;
		},
		[](SafePath const& p) { return std::string{p.extension()}; },
	};
	return std::visit(visitor, path);
}

std::filesystem::path resolve(install::Path const& path, std::filesystem::path const& base) {
	auto const visitor = Visitor{
		[&base](std::filesystem::path const& p) { return base / p; },
		[&base](SafePath const& p) { return p.to_path(base); },
	};
	return std::visit(visitor, path);
}
} // namespace lapis
