#include <lapis/content/content_installer.hpp>
#include <lapis/content/install_error.hpp>
#include <lapis/io/file.hpp>
#include <lapis/util/logger.hpp>
#include <lapis/util/thread_pool.hpp>
#include <lapis/util/visitor.hpp>
#include <algorithm>
#include <fstream>
#include <future>
#include <utility>

namespace lapis {
namespace fs = std::filesystem;

namespace {
auto const g_log{Logger{"Install"}};

constexpr long http_ok_v{200};

///
/// \brief Streams a response body into a file while hashing and counting it.
///
struct FileReceiver : HttpClient::Receiver {
	fs::path path{};
	Ptr<ProgressTracker> tracker{};

	std::ofstream file{};
	Sha1 hasher{};
	std::uint64_t total{};
	long status{};
	bool failed{};

	FileReceiver(fs::path path, Ptr<ProgressTracker> tracker) : path(std::move(path)), tracker(tracker) {}

	bool on_status(long const value) final {
		status = value;
		if (status != http_ok_v) { return false; }
		file.open(path, std::ios::binary | std::ios::trunc);
		if (!file) {
			failed = true;
			return false;
		}
		return true;
	}

	bool on_data(std::span<std::byte const> bytes) final {
		if (!file.write(reinterpret_cast<char const*>(bytes.data()), static_cast<std::streamsize>(bytes.size()))) {
			failed = true;
			return false;
		}
		hasher.update(bytes);
		total += bytes.size();
		tracker->add_count(bytes.size());
		return true;
	}

	void close() {
		if (!file.is_open()) { return; }
		file.close();
		if (!file) { failed = true; }
	}
};

void remove_quietly(fs::path const& path) {
	auto ec = std::error_code{};
	fs::remove(path, ec);
}

std::string display_name(std::string_view const file_name) { return file_name.empty() ? std::string{"???"} : std::string{file_name}; }
} // namespace

class ContentInstaller::Permit {
  public:
	Permit() = default;
	explicit Permit(ContentInstaller& installer) : m_installer(&installer) {}

	Permit(Permit&& rhs) noexcept : m_installer(std::exchange(rhs.m_installer, nullptr)) {}
	Permit& operator=(Permit&& rhs) noexcept {
		if (&rhs != this) {
			release();
			m_installer = std::exchange(rhs.m_installer, nullptr);
		}
		return *this;
	}

	Permit(Permit const&) = delete;
	Permit& operator=(Permit const&) = delete;

	~Permit() { release(); }

	void release() {
		if (!m_installer) { return; }
		std::exchange(m_installer, nullptr)->on_released();
	}

  private:
	Ptr<ContentInstaller> m_installer{};
};

ContentInstaller::ContentInstaller(ContentLibrary library, HttpClient& http, std::shared_ptr<ModMetadataManager> metadata, std::uint32_t const max_concurrent)
	: m_library(std::move(library)), m_http(&http), m_metadata(std::move(metadata)), m_max_concurrent(std::clamp(max_concurrent, 1u, max_permits_v)),
	  m_semaphore(static_cast<std::ptrdiff_t>(m_max_concurrent)) {
	if (!m_metadata) { m_metadata = std::make_shared<ModMetadataManager>(); }
}

auto ContentInstaller::acquire() -> Permit {
	m_semaphore.acquire();
	on_acquired();
	return Permit{*this};
}

void ContentInstaller::on_acquired() {
	auto const now = ++m_in_flight;
	auto peak = m_peak.load();
	while (peak < now && !m_peak.compare_exchange_weak(peak, now)) {}
}

void ContentInstaller::on_released() {
	--m_in_flight;
	m_semaphore.release();
}

auto ContentInstaller::fetch(std::span<install::File const> files, InstallAction& action) -> std::vector<LibraryFile> {
	auto futures = std::vector<ScopedFuture<LibraryFile>>{};
	futures.reserve(files.size());
	for (auto const& file : files) {
		// acquired here so no more than max_concurrent threads exist at once
		auto permit = acquire();
		futures.emplace_back(std::async(std::launch::async, [this, &file, &action, p = std::move(permit)]() mutable { return fetch_one(file, std::move(p), action); }));
	}
	auto ret = std::vector<LibraryFile>{};
	ret.reserve(futures.size());
	for (auto& future : futures) { ret.push_back(future.get()); }
	return ret;
}

auto ContentInstaller::fetch_one(install::File const& file, Permit permit, InstallAction& action) -> LibraryFile {
	try {
		auto const visitor = Visitor{
			[&](install::RemoteDownload const& remote) { return fetch_remote(file, remote, std::move(permit), action); },
			[&](install::LocalFile const& local) { return fetch_local(file, local, action); },
		};
		return std::visit(visitor, file.download);
	} catch (fs::filesystem_error const& e) { throw InstallError{InstallError::Kind::eIoError, e.what()}; }
}

auto ContentInstaller::fetch_remote(install::File const& file, install::RemoteDownload const& remote, Permit permit, InstallAction& action) -> LibraryFile {
	auto fetched = download(file_name_of(file.path), extension_of(file.path), remote, action);
	permit.release();
	if (fetched.summary && fetched.summary->modpack) { fetch_children(*fetched.summary->modpack, action); }
	return LibraryFile{
		.from = std::move(fetched.path),
		.replace = file.replace_old,
		.hash = fetched.hash,
		.file = file,
		.summary = std::move(fetched.summary),
	};
}

auto ContentInstaller::fetch_local(install::File const& file, install::LocalFile const& local, InstallAction& action) -> LibraryFile {
	auto tracker = action.add_tracker(fmt::format("Copying {}", display_name(local.path.filename().string())));
	tracker->set_total(3);
	try {
		auto const bytes = file::read_bytes(local.path);
		if (!bytes) { throw InstallError{InstallError::Kind::eIoError, fmt::format("failed to read {}", local.path.generic_string())}; }
		tracker->set_count(1);

		auto const hash = sha1_of(*bytes);
		if (!m_library.ensure_folder(hash)) { throw InstallError{InstallError::Kind::eIoError, "failed to create library folder"}; }
		auto path = m_library.path_for(hash, extension_of(file.path));
		auto const valid_on_disk = ContentLibrary::verify(path, hash);
		tracker->set_count(2);

		if (!valid_on_disk && !file::write_bytes(path, *bytes)) {
			throw InstallError{InstallError::Kind::eIoError, fmt::format("failed to write {}", path.generic_string())};
		}
		tracker->set_count(3);
		tracker->finish(valid_on_disk ? ProgressTracker::Finish::eFast : ProgressTracker::Finish::eSlow);

		return LibraryFile{
			.from = std::move(path),
			.replace = file.replace_old,
			.hash = hash,
			.file = file,
			.summary = m_metadata->get_bytes(*bytes, hash),
		};
	} catch (std::exception const&) {
		tracker->set_error();
		throw;
	}
}

auto ContentInstaller::download(std::string_view const file_name, std::string_view const extension, install::RemoteDownload const& remote, InstallAction& action)
	-> Fetched {
	auto const hash = parse_sha1_hex(remote.sha1);
	if (!hash) {
		g_log.warn("invalid sha1 for {}: '{}'", file_name, remote.sha1);
		throw InstallError{InstallError::Kind::eInvalidHash, remote.sha1};
	}
	if (!m_library.ensure_folder(*hash)) { throw InstallError{InstallError::Kind::eIoError, "failed to create library folder"}; }
	auto path = m_library.path_for(*hash, extension);

	auto tracker = action.add_tracker(fmt::format("Downloading {}", display_name(file_name)));
	tracker->set_total(remote.size);

	try {
		if (ContentLibrary::verify(path, *hash)) {
			g_log.debug("cache hit: {}", path.generic_string());
			tracker->set_count(remote.size);
			tracker->finish(ProgressTracker::Finish::eFast);
			return Fetched{.path = path, .hash = *hash, .summary = m_metadata->get_path(path)};
		}

		auto receiver = FileReceiver{path, tracker.get()};
		auto status = long{};
		try {
			status = m_http->get(remote.url, receiver);
		} catch (std::exception const&) {
			// a transfer that died part way leaves a truncated file at the hash path
			receiver.close();
			remove_quietly(path);
			throw;
		}
		receiver.close();
		if (status != http_ok_v) {
			remove_quietly(path);
			throw InstallError{InstallError::Kind::eNotOk, remote.url, status};
		}
		if (receiver.failed) {
			remove_quietly(path);
			throw InstallError{InstallError::Kind::eIoError, fmt::format("failed to write {}", path.generic_string())};
		}
		if (receiver.hasher.finish() != *hash) {
			remove_quietly(path);
			throw InstallError{InstallError::Kind::eWrongHash, remote.url};
		}
		if (receiver.total != remote.size) {
			remove_quietly(path);
			throw InstallError{InstallError::Kind::eWrongFilesize, fmt::format("{} ({} bytes, expected {})", remote.url, receiver.total, remote.size)};
		}

		tracker->finish(ProgressTracker::Finish::eSlow);
		g_log.info("downloaded {} ({} bytes)", display_name(file_name), receiver.total);
		return Fetched{.path = path, .hash = *hash, .summary = m_metadata->get_path(path)};
	} catch (std::exception const&) {
		tracker->set_error();
		throw;
	}
}

void ContentInstaller::fetch_children(ModpackManifest const& manifest, InstallAction& action) {
	auto futures = std::vector<ScopedFuture<Fetched>>{};
	futures.reserve(manifest.files.size());
	for (auto const& child : manifest.files) {
		auto const path = SafePath::make(child.path);
		if (!path) {
			g_log.warn("skipping modpack file with unsafe path: '{}'", child.path);
			continue;
		}
		if (child.urls.empty()) {
			g_log.warn("skipping modpack file without downloads: '{}'", child.path);
			continue;
		}
		auto permit = acquire();
		auto remote = install::RemoteDownload{.url = child.urls.front(), .sha1 = child.sha1, .size = child.size};
		futures.emplace_back(std::async(std::launch::async, [this, &action, safe = *path, remote = std::move(remote), p = std::move(permit)]() mutable {
			auto ret = download(safe.file_name(), safe.extension(), remote, action);
			p.release();
			return ret;
		}));
	}
	for (auto& future : futures) {
		try {
			future.get();
		} catch (std::exception const& e) { g_log.warn("modpack file failed: {}", e.what()); }
	}
}
} // namespace lapis
