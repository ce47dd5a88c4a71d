#pragma once
#include <cstddef>
#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace lapis::file {
///
/// \brief Read an entire file into memory.
/// \returns std::nullopt if the file cannot be opened or read
///
std::optional<std::vector<std::byte>> read_bytes(std::filesystem::path const& path);
std::optional<std::string> read_text(std::filesystem::path const& path);

///
/// \brief Write (truncate) bytes to path.
/// \returns false on failure
///
bool write_bytes(std::filesystem::path const& path, std::span<std::byte const> bytes);
bool write_text(std::filesystem::path const& path, std::string_view text);
} // namespace lapis::file
