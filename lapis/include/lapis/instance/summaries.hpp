#pragma once
#include <lapis/content/mod_summary.hpp>
#include <lapis/instance/instance_id.hpp>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace lapis {
struct WorldSummary {
	std::string title{};
	std::string subtitle{};
	std::filesystem::path level_path{};
	///
	/// \brief Milliseconds since epoch; 0 if never played.
	///
	std::int64_t last_played{};
	std::vector<std::byte> png_icon{};
};

struct ServerSummary {
	std::string name{};
	std::string ip{};
	std::vector<std::byte> png_icon{};
};

struct InstanceModSummary {
	ModID id{};
	std::shared_ptr<ModSummary const> mod{};
	std::string filename{};
	std::filesystem::path path{};
	bool enabled{};
};
} // namespace lapis
