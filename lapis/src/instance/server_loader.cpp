#include <lapis/instance/server_loader.hpp>
#include <lapis/io/compression.hpp>
#include <lapis/io/file.hpp>
#include <lapis/io/nbt.hpp>
#include <lapis/util/error.hpp>
#include <lapis/util/logger.hpp>

namespace lapis {
namespace {
namespace fs = std::filesystem;

auto const g_log{Logger{"Servers"}};

constexpr std::string_view unnamed_v{"<unnamed>"};
} // namespace

std::vector<ServerSummary> servers::parse(std::span<std::byte const> bytes) {
	auto ret = std::vector<ServerSummary>{};
	auto const root = nbt::parse(bytes);
	auto const* compound = root.tag.as_compound();
	auto const* list = compound ? compound->find_list("servers") : nullptr;
	if (!list) { return ret; }
	for (auto const& item : list->items) {
		auto const* server = item.as_compound();
		if (!server) { continue; }
		if (server->find_integer("hidden").value_or(0) != 0) { continue; }
		auto const* ip = server->find_string("ip");
		if (!ip) { continue; }
		auto summary = ServerSummary{};
		auto const* name = server->find_string("name");
		summary.name = name ? *name : std::string{unnamed_v};
		summary.ip = *ip;
		if (auto const* icon = server->find_string("icon")) {
			if (auto png = compression::decode_base64(*icon)) {
				summary.png_icon = std::move(*png);
			} else {
				g_log.debug("Invalid icon for server '{}'", summary.name);
			}
		}
		ret.push_back(std::move(summary));
	}
	return ret;
}

std::vector<ServerSummary> servers::load(fs::path const& servers_file) {
	auto ec = std::error_code{};
	if (!fs::is_regular_file(servers_file, ec)) { return {}; }
	auto bytes = file::read_bytes(servers_file);
	if (!bytes) {
		g_log.warn("Failed to read [{}]", servers_file.generic_string());
		return {};
	}
	try {
		return parse(*bytes);
	} catch (ParseError const& e) {
		g_log.warn("Failed to parse [{}]: {}", servers_file.generic_string(), e.what());
		return {};
	}
}
} // namespace lapis
