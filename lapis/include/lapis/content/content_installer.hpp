#pragma once
#include <lapis/content/content_library.hpp>
#include <lapis/content/http_client.hpp>
#include <lapis/content/install_request.hpp>
#include <lapis/content/mod_metadata.hpp>
#include <lapis/content/progress_tracker.hpp>
#include <lapis/util/ptr.hpp>
#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <semaphore>
#include <span>
#include <vector>

namespace lapis {
///
/// \brief Downloads / ingests install files into the ContentLibrary with bounded concurrency.
///
/// Every file install holds one permit of a shared counting semaphore for its whole
/// download-plus-verify lifetime. Modpack children are installed through the same semaphore
/// after the parent has released its permit.
///
class ContentInstaller {
  public:
	static constexpr std::uint32_t max_permits_v{64};

	///
	/// \brief A file resolved into the library, ready to be linked into its destination.
	///
	struct LibraryFile {
		std::filesystem::path from{};
		std::optional<std::filesystem::path> replace{};
		Sha1Digest hash{};
		install::File file{};
		std::shared_ptr<ModSummary const> summary{};
	};

	ContentInstaller(ContentLibrary library, HttpClient& http, std::shared_ptr<ModMetadataManager> metadata, std::uint32_t max_concurrent = 8);

	ContentInstaller(ContentInstaller const&) = delete;
	ContentInstaller& operator=(ContentInstaller const&) = delete;

	///
	/// \brief Install all files into the library (blocking).
	/// \returns One LibraryFile per input, in order
	/// \throws InstallError The first failure in submission order (other files still complete)
	///
	std::vector<LibraryFile> fetch(std::span<install::File const> files, InstallAction& action);

	ContentLibrary const& library() const { return m_library; }
	std::uint32_t max_concurrent() const { return m_max_concurrent; }
	///
	/// \brief Highest number of permits held at once since construction.
	///
	std::uint32_t peak_in_flight() const { return m_peak.load(); }

  private:
	class Permit;

	struct Fetched {
		std::filesystem::path path{};
		Sha1Digest hash{};
		std::shared_ptr<ModSummary const> summary{};
	};

	Permit acquire();
	void on_acquired();
	void on_released();

	LibraryFile fetch_one(install::File const& file, Permit permit, InstallAction& action);
	LibraryFile fetch_remote(install::File const& file, install::RemoteDownload const& remote, Permit permit, InstallAction& action);
	LibraryFile fetch_local(install::File const& file, install::LocalFile const& local, InstallAction& action);
	Fetched download(std::string_view file_name, std::string_view extension, install::RemoteDownload const& remote, InstallAction& action);
	void fetch_children(ModpackManifest const& manifest, InstallAction& action);

	ContentLibrary m_library;
	Ptr<HttpClient> m_http{};
	std::shared_ptr<ModMetadataManager> m_metadata{};
	std::uint32_t m_max_concurrent{};
	std::counting_semaphore<max_permits_v> m_semaphore;
	std::atomic<std::uint32_t> m_in_flight{};
	std::atomic<std::uint32_t> m_peak{};
};
} // namespace lapis
