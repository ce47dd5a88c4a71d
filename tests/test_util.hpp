#pragma once
#include <lapis/content/http_client.hpp>
#include <lapis/watch/fs_watcher.hpp>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace lapis::test {
///
/// \brief Unique temporary directory, removed on destruction.
///
class TempDir {
  public:
	TempDir();
	~TempDir();

	TempDir(TempDir const&) = delete;
	TempDir& operator=(TempDir const&) = delete;

	std::filesystem::path const& path() const { return m_path; }
	std::filesystem::path operator/(std::filesystem::path const& rhs) const { return m_path / rhs; }

  private:
	std::filesystem::path m_path{};
};

///
/// \brief FsWatcher that records calls; paths in refuse are rejected.
///
struct FakeWatcher : FsWatcher {
	std::vector<std::filesystem::path> watched{};
	std::vector<std::filesystem::path> unwatched{};
	std::vector<std::filesystem::path> refuse{};

	bool watch(std::filesystem::path const& path, RecursiveMode mode) override;
	bool unwatch(std::filesystem::path const& path) override;

	std::size_t watch_count(std::filesystem::path const& path) const;
};

///
/// \brief HttpClient serving canned responses and counting transfers.
///
class FakeHttpClient : public HttpClient {
  public:
	struct Response {
		long status{200};
		std::vector<std::byte> body{};
		///
		/// \brief If set, throw InstallError (eRequestFailed) after delivering this many bytes.
		///
		std::optional<std::size_t> fail_after{};
	};

	void serve(std::string url, Response response);
	void serve(std::string url, std::span<std::byte const> body) { serve(std::move(url), Response{.body = {body.begin(), body.end()}}); }

	long get(std::string const& url, Receiver& receiver) override;

	int requests() const { return m_requests.load(); }
	int requests_for(std::string const& url) const;

	///
	/// \brief Sleep this long inside every transfer (to overlap concurrent downloads).
	///
	std::chrono::milliseconds delay{};

  private:
	std::map<std::string, Response> m_responses{};
	std::map<std::string, int> m_counts{};
	std::atomic<int> m_requests{};
	mutable std::mutex m_mutex{};
};

std::vector<std::byte> to_bytes(std::string_view text);
std::string to_string(std::span<std::byte const> bytes);

void write_file(std::filesystem::path const& path, std::span<std::byte const> bytes);
void write_file(std::filesystem::path const& path, std::string_view text);

///
/// \brief Build a zip archive of stored (uncompressed) entries.
///
std::vector<std::byte> make_zip(std::vector<std::pair<std::string, std::string>> const& entries);

std::vector<std::byte> gzip(std::span<std::byte const> bytes);

///
/// \brief Minimal big-endian NBT writer.
///
class NbtWriter {
  public:
	NbtWriter& begin_compound(std::string_view name);
	NbtWriter& end_compound();
	///
	/// \brief Begin a named list of compounds; each element is written with begin_element / end_compound.
	///
	NbtWriter& begin_compound_list(std::string_view name, std::int32_t count);
	NbtWriter& begin_element();
	NbtWriter& string(std::string_view name, std::string_view value);
	NbtWriter& byte(std::string_view name, std::int8_t value);
	NbtWriter& integer(std::string_view name, std::int32_t value);
	NbtWriter& long_integer(std::string_view name, std::int64_t value);

	std::vector<std::byte> const& bytes() const { return m_bytes; }

  private:
	void put(std::uint8_t value);
	void put_be(std::uint64_t value, std::size_t size);
	void put_name(std::uint8_t type, std::string_view name);
	void put_string(std::string_view text);

	std::vector<std::byte> m_bytes{};
};

///
/// \brief Write a level.dat (gzip NBT) for a world folder.
///
void write_level(std::filesystem::path const& level_path, std::string_view level_name, std::int64_t last_played);

void write_instance(std::filesystem::path const& root, std::string_view version = "1.20.1", std::string_view loader = "fabric");

std::string fabric_mod_json(std::string_view id, std::string_view name, std::string_view version);
} // namespace lapis::test
