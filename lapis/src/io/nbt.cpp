#include <lapis/io/compression.hpp>
#include <lapis/io/nbt.hpp>
#include <lapis/util/error.hpp>
#include <lapis/util/logger.hpp>
#include <algorithm>
#include <array>
#include <bit>
#include <cstring>
#include <fstream>
#include <iterator>
#include <type_traits>

namespace lapis {
namespace {
auto const g_log{Logger{"NBT"}};

constexpr std::size_t max_depth_v{512};

class Reader {
  public:
	explicit Reader(std::span<std::byte const> bytes) : m_bytes(bytes) {}

	nbt::NamedTag root() {
		auto const type = read_type();
		if (type == nbt::TagType::eEnd) { throw ParseError{"NBT root is an End tag"}; }
		auto ret = nbt::NamedTag{};
		ret.name = read_string();
		ret.tag = read_payload(type, 0);
		return ret;
	}

  private:
	std::span<std::byte const> take(std::size_t const count) {
		if (count > m_bytes.size()) { throw ParseError{"Unexpected end of NBT data"}; }
		auto ret = m_bytes.first(count);
		m_bytes = m_bytes.subspan(count);
		return ret;
	}

	template <typename Type>
	Type read_be() {
		auto const bytes = take(sizeof(Type));
		auto raw = std::array<std::byte, sizeof(Type)>{};
		std::copy(bytes.begin(), bytes.end(), raw.begin());
		if constexpr (std::endian::native == std::endian::little) { std::reverse(raw.begin(), raw.end()); }
		auto ret = Type{};
		std::memcpy(&ret, raw.data(), sizeof(Type));
		return ret;
	}

	nbt::TagType read_type() {
		auto const value = read_be<std::uint8_t>();
		if (value > static_cast<std::uint8_t>(nbt::TagType::eLongArray)) { throw ParseError{"Unknown NBT tag type"}; }
		return static_cast<nbt::TagType>(value);
	}

	std::size_t read_length() {
		auto const length = read_be<std::int32_t>();
		if (length < 0) { throw ParseError{"Negative NBT length"}; }
		auto const ret = static_cast<std::size_t>(length);
		// every element occupies at least one byte
		if (ret > m_bytes.size()) { throw ParseError{"NBT length exceeds data"}; }
		return ret;
	}

	std::string read_string() {
		auto const length = read_be<std::uint16_t>();
		auto const bytes = take(length);
		return std::string{reinterpret_cast<char const*>(bytes.data()), bytes.size()};
	}

	template <typename Type>
	std::vector<Type> read_array() {
		auto const length = read_length();
		auto ret = std::vector<Type>{};
		ret.reserve(length);
		for (std::size_t i = 0; i < length; ++i) { ret.push_back(read_be<Type>()); }
		return ret;
	}

	nbt::Tag read_payload(nbt::TagType const type, std::size_t const depth) {
		if (depth > max_depth_v) { throw ParseError{"NBT nesting too deep"}; }
		switch (type) {
		case nbt::TagType::eByte: return {read_be<std::int8_t>()};
		case nbt::TagType::eShort: return {read_be<std::int16_t>()};
		case nbt::TagType::eInt: return {read_be<std::int32_t>()};
		case nbt::TagType::eLong: return {read_be<std::int64_t>()};
		case nbt::TagType::eFloat: return {std::bit_cast<float>(read_be<std::uint32_t>())};
		case nbt::TagType::eDouble: return {std::bit_cast<double>(read_be<std::uint64_t>())};
		case nbt::TagType::eByteArray: return {read_array<std::int8_t>()};
		case nbt::TagType::eString: return {read_string()};
		case nbt::TagType::eList: {
			auto ret = nbt::List{};
			ret.element_type = read_type();
			auto const length = read_length();
			if (ret.element_type == nbt::TagType::eEnd && length > 0) { throw ParseError{"NBT list of End tags"}; }
			ret.items.reserve(length);
			for (std::size_t i = 0; i < length; ++i) { ret.items.push_back(read_payload(ret.element_type, depth + 1)); }
			return {std::move(ret)};
		}
		case nbt::TagType::eCompound: {
			auto ret = nbt::Compound{};
			for (auto child = read_type(); child != nbt::TagType::eEnd; child = read_type()) {
				auto name = read_string();
				ret.entries.push_back(nbt::NamedTag{std::move(name), read_payload(child, depth + 1)});
			}
			return {std::move(ret)};
		}
		case nbt::TagType::eIntArray: return {read_array<std::int32_t>()};
		case nbt::TagType::eLongArray: return {read_array<std::int64_t>()};
		default: break;
		}
		throw ParseError{"Unexpected NBT End tag"};
	}

	std::span<std::byte const> m_bytes;
};
} // namespace

std::optional<std::int64_t> nbt::Tag::as_integer() const {
	auto const visitor = [](auto const& value) -> std::optional<std::int64_t> {
		using Type = std::decay_t<decltype(value)>;
		if constexpr (std::is_integral_v<Type>) {
			return static_cast<std::int64_t>(value);
		} else {
			return {};
		}
	};
	return std::visit(visitor, value);
}

Ptr<nbt::Tag const> nbt::Compound::find(std::string_view const name) const {
	auto const it = std::find_if(entries.begin(), entries.end(), [name](NamedTag const& e) { return e.name == name; });
	if (it == entries.end()) { return {}; }
	return &it->tag;
}

Ptr<nbt::Compound const> nbt::Compound::find_compound(std::string_view const name) const {
	if (auto const* tag = find(name)) { return tag->as_compound(); }
	return {};
}

Ptr<nbt::List const> nbt::Compound::find_list(std::string_view const name) const {
	if (auto const* tag = find(name)) { return tag->as_list(); }
	return {};
}

Ptr<std::string const> nbt::Compound::find_string(std::string_view const name) const {
	if (auto const* tag = find(name)) { return tag->as_string(); }
	return {};
}

std::optional<std::int64_t> nbt::Compound::find_integer(std::string_view const name) const {
	if (auto const* tag = find(name)) { return tag->as_integer(); }
	return {};
}

nbt::NamedTag nbt::parse(std::span<std::byte const> bytes) { return Reader{bytes}.root(); }

std::optional<nbt::NamedTag> nbt::read_file(std::filesystem::path const& path) {
	auto file = std::ifstream{path, std::ios::binary};
	if (!file) {
		g_log.debug("Failed to open [{}]", path.generic_string());
		return {};
	}
	auto bytes = std::vector<std::byte>{};
	auto const text = std::vector<char>{std::istreambuf_iterator<char>{file}, std::istreambuf_iterator<char>{}};
	bytes.resize(text.size());
	std::memcpy(bytes.data(), text.data(), text.size());
	// gzip magic
	if (bytes.size() >= 2 && bytes[0] == std::byte{0x1f} && bytes[1] == std::byte{0x8b}) {
		auto inflated = compression::gunzip(bytes);
		if (!inflated) {
			g_log.warn("Failed to decompress [{}]", path.generic_string());
			return {};
		}
		bytes = std::move(*inflated);
	}
	try {
		return parse(bytes);
	} catch (ParseError const& e) {
		g_log.warn("Failed to parse [{}]: {}", path.generic_string(), e.what());
		return {};
	}
}
} // namespace lapis
