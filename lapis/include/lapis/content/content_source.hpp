#pragma once
#include <lapis/util/enum_array.hpp>
#include <optional>
#include <string_view>

namespace lapis {
///
/// \brief Provenance of an installed file.
///
enum class ContentSource : std::uint8_t { eManual, eModrinth, eCurseForge, eCOUNT_ };

inline constexpr EnumArray<ContentSource, std::string_view> content_source_names_v{"manual", "modrinth", "curseforge"};

constexpr std::string_view to_string(ContentSource const source) { return content_source_names_v[source]; }

constexpr std::optional<ContentSource> parse_content_source(std::string_view const text) {
	for (std::size_t i = 0; i < content_source_names_v.size(); ++i) {
		if (content_source_names_v.t[i] == text) { return static_cast<ContentSource>(i); }
	}
	return {};
}
} // namespace lapis
