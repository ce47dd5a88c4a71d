#include <fmt/format.h>
#include <lapis/directories.hpp>
#include <lapis/util/error.hpp>
#include <system_error>

namespace lapis {
namespace fs = std::filesystem;

Directories Directories::make(fs::path root) {
	auto ec = std::error_code{};
	if (auto absolute = fs::absolute(root, ec); !ec) { root = std::move(absolute); }
	auto ret = Directories{};
	ret.instances = root / "instances";
	ret.content_library = root / "contentlibrary";
	ret.content_meta = root / "contentmeta";
	ret.sources_file = ret.content_meta / "sources.json";
	ret.config_file = root / "config.json";
	ret.log_file = root / "lapis.log";
	ret.root = std::move(root);
	return ret;
}

void Directories::create_all() const {
	for (auto const* dir : {&root, &instances, &content_library, &content_meta}) {
		auto ec = std::error_code{};
		fs::create_directories(*dir, ec);
		if (!fs::is_directory(*dir)) { throw InitError{fmt::format("Failed to create directory [{}]: {}", dir->generic_string(), ec.message())}; }
	}
}
} // namespace lapis
