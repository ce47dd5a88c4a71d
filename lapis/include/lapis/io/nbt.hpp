#pragma once
#include <lapis/util/ptr.hpp>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

///
/// \brief Read-only Named Binary Tag (big-endian, Java edition) documents.
///
namespace lapis::nbt {
enum class TagType : std::uint8_t {
	eEnd,
	eByte,
	eShort,
	eInt,
	eLong,
	eFloat,
	eDouble,
	eByteArray,
	eString,
	eList,
	eCompound,
	eIntArray,
	eLongArray,
};

struct Tag;
struct NamedTag;

struct List {
	TagType element_type{TagType::eEnd};
	std::vector<Tag> items{};
};

struct Compound {
	std::vector<NamedTag> entries{};

	Ptr<Tag const> find(std::string_view name) const;
	Ptr<Compound const> find_compound(std::string_view name) const;
	Ptr<List const> find_list(std::string_view name) const;
	Ptr<std::string const> find_string(std::string_view name) const;
	///
	/// \brief Find an integral tag (byte / short / int / long) and widen it.
	///
	std::optional<std::int64_t> find_integer(std::string_view name) const;
};

struct Tag {
	// alternative index + 1 == TagType
	using Value = std::variant<std::int8_t, std::int16_t, std::int32_t, std::int64_t, float, double, std::vector<std::int8_t>, std::string, List, Compound,
							   std::vector<std::int32_t>, std::vector<std::int64_t>>;

	Value value{};

	TagType type() const { return static_cast<TagType>(value.index() + 1); }

	Ptr<Compound const> as_compound() const { return std::get_if<Compound>(&value); }
	Ptr<List const> as_list() const { return std::get_if<List>(&value); }
	Ptr<std::string const> as_string() const { return std::get_if<std::string>(&value); }
	std::optional<std::int64_t> as_integer() const;
};

struct NamedTag {
	std::string name{};
	Tag tag{};
};

///
/// \brief Parse an uncompressed NBT document (a single named root tag).
/// \throws ParseError on malformed or truncated input
///
NamedTag parse(std::span<std::byte const> bytes);

///
/// \brief Parse a possibly gzip-compressed NBT file.
/// \returns std::nullopt (and logs) on IO or parse failure
///
std::optional<NamedTag> read_file(std::filesystem::path const& path);
} // namespace lapis::nbt
