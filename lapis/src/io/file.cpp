#include <lapis/io/file.hpp>
#include <fstream>

namespace lapis {
std::optional<std::vector<std::byte>> file::read_bytes(std::filesystem::path const& path) {
	auto file = std::ifstream{path, std::ios::binary | std::ios::ate};
	if (!file) { return {}; }
	auto const size = file.tellg();
	if (size < 0) { return {}; }
	file.seekg({}, std::ios::beg);
	auto ret = std::vector<std::byte>(static_cast<std::size_t>(size));
	if (!file.read(reinterpret_cast<char*>(ret.data()), size)) { return {}; }
	return ret;
}

std::optional<std::string> file::read_text(std::filesystem::path const& path) {
	auto bytes = read_bytes(path);
	if (!bytes) { return {}; }
	return std::string{reinterpret_cast<char const*>(bytes->data()), bytes->size()};
}

bool file::write_bytes(std::filesystem::path const& path, std::span<std::byte const> bytes) {
	auto file = std::ofstream{path, std::ios::binary | std::ios::trunc};
	if (!file) { return false; }
	file.write(reinterpret_cast<char const*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
	return static_cast<bool>(file);
}

bool file::write_text(std::filesystem::path const& path, std::string_view const text) { return write_bytes(path, std::as_bytes(std::span{text.data(), text.size()})); }
} // namespace lapis
