#pragma once
#include <cstdint>
#include <filesystem>
#include <string>
#include <variant>
#include <vector>

namespace lapis {
///
/// \brief Raw filesystem notification kinds, as reported by a watcher backend.
///
namespace raw {
enum class CreateKind : std::uint8_t { eAny, eFile, eFolder, eOther };
enum class DataChange : std::uint8_t { eAny, eSize, eContent, eOther };
enum class RenameMode : std::uint8_t { eAny, eTo, eFrom, eBoth, eOther };
enum class RemoveKind : std::uint8_t { eAny, eFile, eFolder, eOther };

struct Any {};
struct Access {};
struct Other {};
struct Create {
	CreateKind kind{};
};
struct ModifyAny {};
struct ModifyData {
	DataChange change{};
};
struct ModifyMetadata {};
struct ModifyName {
	RenameMode mode{};
};
struct ModifyOther {};
struct Remove {
	RemoveKind kind{};
};

using Kind = std::variant<Any, Access, Create, ModifyAny, ModifyData, ModifyMetadata, ModifyName, ModifyOther, Remove, Other>;
} // namespace raw

struct RawEvent {
	raw::Kind kind{};
	///
	/// \brief Affected paths: one for most kinds, [from, to] for ModifyName{eBoth}.
	///
	std::vector<std::filesystem::path> paths{};
};

///
/// \brief One debounced delivery: either events or an error.
///
struct RawBatch {
	std::vector<RawEvent> events{};
	std::string error{};

	bool failed() const { return !error.empty(); }
};
} // namespace lapis
