#pragma once
#include <lapis/instance/summaries.hpp>
#include <filesystem>
#include <span>
#include <vector>

namespace lapis::servers {
///
/// \brief Parse uncompressed servers.dat contents.
/// \throws ParseError on malformed NBT
///
std::vector<ServerSummary> parse(std::span<std::byte const> bytes);

///
/// \brief Load servers.dat; a missing or unreadable file yields an empty list.
///
std::vector<ServerSummary> load(std::filesystem::path const& servers_file);
} // namespace lapis::servers
