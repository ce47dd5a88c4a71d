#pragma once
#include <lapis/util/ptr.hpp>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace lapis {
///
/// \brief Read-only view of an in-memory zip archive (jar / mrpack).
///
/// Supports stored and deflated entries; the viewed bytes must outlive the archive.
///
class ZipArchive {
  public:
	enum class Method : std::uint16_t { eStored = 0, eDeflate = 8 };

	struct Entry {
		std::string name{};
		std::uint16_t method{};
		std::uint32_t compressed_size{};
		std::uint32_t size{};
		std::uint32_t local_offset{};
	};

	///
	/// \brief Parse the central directory.
	/// \returns std::nullopt if bytes is not a zip archive
	///
	static std::optional<ZipArchive> open(std::span<std::byte const> bytes);

	Ptr<Entry const> find(std::string_view name) const;
	std::span<Entry const> entries() const { return m_entries; }

	///
	/// \brief Extract an entry.
	/// \param max_size Entries larger than this are rejected
	///
	std::optional<std::vector<std::byte>> read(Entry const& entry, std::size_t max_size = 16 * 1024 * 1024) const;
	std::optional<std::string> read_text(std::string_view name, std::size_t max_size = 16 * 1024 * 1024) const;

  private:
	ZipArchive(std::span<std::byte const> bytes) : m_bytes(bytes) {}

	std::span<std::byte const> m_bytes{};
	std::vector<Entry> m_entries{};
};
} // namespace lapis
