#pragma once
#include <lapis/io/sha1.hpp>
#include <filesystem>
#include <string_view>

namespace lapis {
///
/// \brief Content-addressed file store: <root>/<hex[0:2]>/<hex>[.ext].
///
/// Writes are idempotent; concurrent creation of the same bucket folder is tolerated.
///
class ContentLibrary {
  public:
	explicit ContentLibrary(std::filesystem::path root) : m_root(std::move(root)) {}

	std::filesystem::path const& root() const { return m_root; }

	///
	/// \brief Physical path for a digest.
	/// \param extension Extension without the leading dot; empty for none
	///
	std::filesystem::path path_for(Sha1Digest const& hash, std::string_view extension = {}) const;

	///
	/// \brief Create the bucket folder for hash.
	/// \returns false if the folder does not exist afterwards
	///
	bool ensure_folder(Sha1Digest const& hash) const;

	///
	/// \brief Check whether the file at path exists and has digest hash.
	///
	static bool verify(std::filesystem::path const& path, Sha1Digest const& hash) { return verify_sha1_file(path, hash); }

  private:
	std::filesystem::path m_root{};
};
} // namespace lapis
