#include <lapis/io/compression.hpp>
#include <lapis/util/logger.hpp>
#include <openssl/evp.h>
#include <zlib.h>
#include <algorithm>
#include <array>
#include <string>

namespace lapis {
namespace {
auto const g_log{Logger{"Compression"}};

// window_bits: 15 + 32 auto-detects gzip / zlib headers, -15 is raw deflate
std::optional<std::vector<std::byte>> inflate_bytes(std::span<std::byte const> bytes, int const window_bits, std::size_t const size_hint,
													std::size_t const max_size) {
	auto stream = z_stream{};
	if (inflateInit2(&stream, window_bits) != Z_OK) {
		g_log.error("inflateInit2 failed");
		return {};
	}
	auto ret = std::vector<std::byte>{};
	ret.reserve(std::min(size_hint, max_size));
	stream.next_in = reinterpret_cast<Bytef*>(const_cast<std::byte*>(bytes.data()));
	stream.avail_in = static_cast<uInt>(bytes.size());
	auto chunk = std::array<std::byte, 32 * 1024>{};
	auto status = Z_OK;
	while (status != Z_STREAM_END) {
		stream.next_out = reinterpret_cast<Bytef*>(chunk.data());
		stream.avail_out = static_cast<uInt>(chunk.size());
		status = inflate(&stream, Z_NO_FLUSH);
		if (status != Z_OK && status != Z_STREAM_END) { break; }
		auto const produced = chunk.size() - stream.avail_out;
		if (ret.size() + produced > max_size) {
			status = Z_MEM_ERROR;
			break;
		}
		ret.insert(ret.end(), chunk.begin(), chunk.begin() + static_cast<std::ptrdiff_t>(produced));
		if (status == Z_OK && produced == 0 && stream.avail_in == 0) {
			// truncated input
			status = Z_DATA_ERROR;
			break;
		}
	}
	inflateEnd(&stream);
	if (status != Z_STREAM_END) { return {}; }
	return ret;
}
} // namespace

std::optional<std::vector<std::byte>> compression::gunzip(std::span<std::byte const> bytes, std::size_t const max_size) {
	return inflate_bytes(bytes, 15 + 32, bytes.size() * 4, max_size);
}

std::optional<std::vector<std::byte>> compression::inflate_raw(std::span<std::byte const> bytes, std::size_t const size_hint, std::size_t const max_size) {
	return inflate_bytes(bytes, -MAX_WBITS, size_hint, max_size);
}

std::optional<std::vector<std::byte>> compression::decode_base64(std::string_view const text) {
	auto clean = std::string{};
	clean.reserve(text.size());
	for (auto const ch : text) {
		if (ch == ' ' || ch == '\n' || ch == '\r' || ch == '\t') { continue; }
		clean += ch;
	}
	if (clean.empty()) { return std::vector<std::byte>{}; }
	if (clean.size() % 4 != 0) { return {}; }
	auto ret = std::vector<std::byte>(clean.size() / 4 * 3);
	auto const length = EVP_DecodeBlock(reinterpret_cast<unsigned char*>(ret.data()), reinterpret_cast<unsigned char const*>(clean.data()),
										static_cast<int>(clean.size()));
	if (length < 0) { return {}; }
	// EVP_DecodeBlock counts padding as zero bytes
	auto padding = std::size_t{};
	if (clean.ends_with("==")) {
		padding = 2;
	} else if (clean.ends_with('=')) {
		padding = 1;
	}
	ret.resize(static_cast<std::size_t>(length) - padding);
	return ret;
}
} // namespace lapis
