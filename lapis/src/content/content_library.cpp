#include <lapis/content/content_library.hpp>
#include <system_error>

namespace lapis {
namespace fs = std::filesystem;

fs::path ContentLibrary::path_for(Sha1Digest const& hash, std::string_view const extension) const {
	auto const hex = to_hex(hash);
	auto file_name = hex;
	if (!extension.empty()) {
		file_name += '.';
		file_name += extension;
	}
	return m_root / hex.substr(0, 2) / file_name;
}

bool ContentLibrary::ensure_folder(Sha1Digest const& hash) const {
	auto const folder = m_root / to_hex(hash).substr(0, 2);
	auto ec = std::error_code{};
	fs::create_directories(folder, ec);
	return fs::is_directory(folder, ec);
}
} // namespace lapis
