#pragma once
#include <string_view>

namespace lapis {
constexpr bool debug_v =
#if defined(LAPIS_DEBUG)
	true;
#else
	false;
#endif

constexpr std::string_view version_v =
#if defined(LAPIS_VERSION)
	LAPIS_VERSION;
#else
	"0.0.0";
#endif
} // namespace lapis
