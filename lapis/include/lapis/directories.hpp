#pragma once
#include <filesystem>

namespace lapis {
///
/// \brief Fixed layout of a launcher directory.
///
struct Directories {
	std::filesystem::path root{};
	std::filesystem::path instances{};
	std::filesystem::path content_library{};
	std::filesystem::path content_meta{};
	std::filesystem::path sources_file{};
	std::filesystem::path config_file{};
	std::filesystem::path log_file{};

	static Directories make(std::filesystem::path root);

	///
	/// \brief Create every folder of the layout.
	/// \throws InitError if a folder cannot be created
	///
	void create_all() const;
};
} // namespace lapis
