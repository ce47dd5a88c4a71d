#pragma once
#include <lapis/util/enum_array.hpp>
#include <optional>
#include <string_view>

namespace lapis {
enum class LoaderKind : std::uint8_t { eVanilla, eFabric, eForge, eNeoForge, eQuilt, eCOUNT_ };

inline constexpr EnumArray<LoaderKind, std::string_view> loader_kind_names_v{"vanilla", "fabric", "forge", "neoforge", "quilt"};

constexpr std::string_view to_string(LoaderKind const kind) { return loader_kind_names_v[kind]; }

constexpr std::optional<LoaderKind> parse_loader_kind(std::string_view const text) {
	for (std::size_t i = 0; i < loader_kind_names_v.size(); ++i) {
		if (loader_kind_names_v.t[i] == text) { return static_cast<LoaderKind>(i); }
	}
	return {};
}
} // namespace lapis
