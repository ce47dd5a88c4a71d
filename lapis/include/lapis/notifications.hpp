#pragma once
#include <lapis/instance/instance.hpp>
#include <lapis/util/signal.hpp>
#include <string>

namespace lapis {
enum class Resource : std::uint8_t { eWorlds, eServers, eMods, eCOUNT_ };

inline constexpr EnumArray<Resource, std::string_view> resource_names_v{"worlds", "servers", "mods"};

///
/// \brief Identity and basic attributes of an instance, as sent to observers.
///
struct InstanceInfoMessage {
	InstanceID id{};
	std::string name{};
	std::string version{};
	LoaderKind loader{};
	std::filesystem::path root{};
};

struct LoadStateMessage {
	InstanceID id{};
	Resource resource{};
	LoadState state{};
};

///
/// \brief Outbound state changes of the backend.
///
/// Dispatched on the control thread (from handle_batch / tick / request_*).
///
struct Notifications {
	Signal<InstanceInfoMessage> instance_added{};
	Signal<InstanceInfoMessage> instance_modified{};
	Signal<InstanceID> instance_removed{};
	Signal<LoadStateMessage> load_state_changed{};
	Signal<InstanceID, Instance::Worlds> worlds_updated{};
	Signal<InstanceID, Instance::Servers> servers_updated{};
	Signal<InstanceID, Instance::Mods> mods_updated{};
	Signal<std::string> info{};
	Signal<std::string> error{};
};
} // namespace lapis
