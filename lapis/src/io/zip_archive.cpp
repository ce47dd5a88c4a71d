#include <lapis/io/compression.hpp>
#include <lapis/io/zip_archive.hpp>
#include <lapis/util/logger.hpp>
#include <algorithm>

namespace lapis {
namespace {
auto const g_log{Logger{"Zip"}};

constexpr std::uint32_t eocd_signature_v{0x06054b50};
constexpr std::uint32_t central_signature_v{0x02014b50};
constexpr std::uint32_t local_signature_v{0x04034b50};
constexpr std::size_t eocd_size_v{22};

// little-endian cursor over a byte span; reads past the end set failed
struct Cursor {
	std::span<std::byte const> bytes{};
	std::size_t offset{};
	bool failed{};

	std::uint16_t u16() {
		if (offset + 2 > bytes.size()) { return fail<std::uint16_t>(); }
		auto const ret = static_cast<std::uint16_t>(std::to_integer<std::uint16_t>(bytes[offset]) | (std::to_integer<std::uint16_t>(bytes[offset + 1]) << 8));
		offset += 2;
		return ret;
	}

	std::uint32_t u32() {
		auto const lo = u16();
		auto const hi = u16();
		return static_cast<std::uint32_t>(lo) | (static_cast<std::uint32_t>(hi) << 16);
	}

	std::string_view text(std::size_t const length) {
		if (offset + length > bytes.size()) { return fail<std::string_view>(); }
		auto const ret = std::string_view{reinterpret_cast<char const*>(bytes.data()) + offset, length};
		offset += length;
		return ret;
	}

	void skip(std::size_t const count) {
		if (offset + count > bytes.size()) {
			failed = true;
			return;
		}
		offset += count;
	}

	template <typename Type>
	Type fail() {
		failed = true;
		offset = bytes.size();
		return {};
	}
};

std::optional<std::size_t> find_eocd(std::span<std::byte const> bytes) {
	if (bytes.size() < eocd_size_v) { return {}; }
	// the trailing comment is at most 64KiB
	auto const last = bytes.size() - eocd_size_v;
	auto const first = last > 0xffff ? last - 0xffff : std::size_t{};
	for (auto pos = last + 1; pos-- > first;) {
		auto cursor = Cursor{bytes, pos};
		if (cursor.u32() == eocd_signature_v) { return pos; }
	}
	return {};
}
} // namespace

std::optional<ZipArchive> ZipArchive::open(std::span<std::byte const> bytes) {
	auto const eocd = find_eocd(bytes);
	if (!eocd) { return {}; }
	auto cursor = Cursor{bytes, *eocd + 10};
	auto const count = cursor.u16();
	cursor.skip(4);
	auto const directory_offset = cursor.u32();
	if (cursor.failed) { return {}; }

	auto ret = ZipArchive{bytes};
	ret.m_entries.reserve(count);
	cursor = Cursor{bytes, directory_offset};
	for (std::uint16_t i = 0; i < count; ++i) {
		if (cursor.u32() != central_signature_v) {
			g_log.debug("Bad central directory signature at entry {}", i);
			return {};
		}
		cursor.skip(6);
		auto entry = Entry{};
		entry.method = cursor.u16();
		cursor.skip(8);
		entry.compressed_size = cursor.u32();
		entry.size = cursor.u32();
		auto const name_length = cursor.u16();
		auto const extra_length = cursor.u16();
		auto const comment_length = cursor.u16();
		cursor.skip(8);
		entry.local_offset = cursor.u32();
		entry.name = std::string{cursor.text(name_length)};
		cursor.skip(static_cast<std::size_t>(extra_length) + comment_length);
		if (cursor.failed) { return {}; }
		ret.m_entries.push_back(std::move(entry));
	}
	return ret;
}

Ptr<ZipArchive::Entry const> ZipArchive::find(std::string_view const name) const {
	auto const it = std::find_if(m_entries.begin(), m_entries.end(), [name](Entry const& e) { return e.name == name; });
	if (it == m_entries.end()) { return {}; }
	return &*it;
}

std::optional<std::vector<std::byte>> ZipArchive::read(Entry const& entry, std::size_t const max_size) const {
	if (entry.size > max_size) { return {}; }
	auto cursor = Cursor{m_bytes, entry.local_offset};
	if (cursor.u32() != local_signature_v) { return {}; }
	cursor.skip(22);
	auto const name_length = cursor.u16();
	auto const extra_length = cursor.u16();
	cursor.skip(static_cast<std::size_t>(name_length) + extra_length);
	if (cursor.failed || cursor.offset + entry.compressed_size > m_bytes.size()) { return {}; }
	auto const data = m_bytes.subspan(cursor.offset, entry.compressed_size);
	switch (static_cast<Method>(entry.method)) {
	case Method::eStored: return std::vector<std::byte>{data.begin(), data.end()};
	case Method::eDeflate: return compression::inflate_raw(data, entry.size, max_size);
	default: break;
	}
	g_log.debug("Unsupported compression method {} for [{}]", entry.method, entry.name);
	return {};
}

std::optional<std::string> ZipArchive::read_text(std::string_view const name, std::size_t const max_size) const {
	auto const* entry = find(name);
	if (!entry) { return {}; }
	auto bytes = read(*entry, max_size);
	if (!bytes) { return {}; }
	return std::string{reinterpret_cast<char const*>(bytes->data()), bytes->size()};
}
} // namespace lapis
