#pragma once
#include <lapis/instance/instance_id.hpp>
#include <optional>
#include <string_view>
#include <variant>

namespace lapis {
///
/// \brief What a watched path means to the launcher.
///
namespace watch {
struct InstancesRoot {
	bool operator==(InstancesRoot const&) const = default;
};
struct InstanceDir {
	InstanceID id{};
	bool operator==(InstanceDir const&) const = default;
};
struct InvalidInstanceDir {
	bool operator==(InvalidInstanceDir const&) const = default;
};
struct InstanceLevelDir {
	InstanceID id{};
	bool operator==(InstanceLevelDir const&) const = default;
};
struct InstanceSavesDir {
	InstanceID id{};
	bool operator==(InstanceSavesDir const&) const = default;
};
struct InstanceModsDir {
	InstanceID id{};
	bool operator==(InstanceModsDir const&) const = default;
};
struct ServersFile {
	InstanceID id{};
	bool operator==(ServersFile const&) const = default;
};
} // namespace watch

using WatchTarget = std::variant<watch::InstancesRoot, watch::InstanceDir, watch::InvalidInstanceDir, watch::InstanceLevelDir, watch::InstanceSavesDir,
								 watch::InstanceModsDir, watch::ServersFile>;

std::string_view to_string(WatchTarget const& target);

///
/// \brief Owning instance of a target, if any.
///
std::optional<InstanceID> owner_of(WatchTarget const& target);
} // namespace lapis
