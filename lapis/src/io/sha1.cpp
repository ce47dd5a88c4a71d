#include <lapis/io/sha1.hpp>
#include <lapis/util/error.hpp>
#include <openssl/evp.h>
#include <cstring>
#include <fstream>

namespace lapis {
namespace {
EVP_MD_CTX* ctx_of(void* ctx) { return static_cast<EVP_MD_CTX*>(ctx); }

constexpr int hex_value(char const ch) {
	if (ch >= '0' && ch <= '9') { return ch - '0'; }
	if (ch >= 'a' && ch <= 'f') { return ch - 'a' + 10; }
	if (ch >= 'A' && ch <= 'F') { return ch - 'A' + 10; }
	return -1;
}
} // namespace

std::size_t Sha1DigestHasher::operator()(Sha1Digest const& digest) const {
	auto ret = std::size_t{};
	std::memcpy(&ret, digest.data(), sizeof(ret));
	return ret;
}

void Sha1::Deleter::operator()(void* ctx) const { EVP_MD_CTX_free(ctx_of(ctx)); }

Sha1::Sha1() : m_ctx(EVP_MD_CTX_new()) {
	if (!m_ctx || EVP_DigestInit_ex(ctx_of(m_ctx.get()), EVP_sha1(), nullptr) != 1) { throw Error{"Failed to initialize SHA-1 context"}; }
}

void Sha1::update(std::span<std::byte const> bytes) {
	if (bytes.empty()) { return; }
	if (EVP_DigestUpdate(ctx_of(m_ctx.get()), bytes.data(), bytes.size()) != 1) { throw Error{"SHA-1 update failed"}; }
}

Sha1Digest Sha1::finish() {
	auto ret = Sha1Digest{};
	auto length = unsigned{};
	if (EVP_DigestFinal_ex(ctx_of(m_ctx.get()), ret.data(), &length) != 1 || length != ret.size()) { throw Error{"SHA-1 finalize failed"}; }
	return ret;
}

Sha1Digest sha1_of(std::span<std::byte const> bytes) {
	auto sha1 = Sha1{};
	sha1.update(bytes);
	return sha1.finish();
}

std::optional<Sha1Digest> sha1_of_file(std::filesystem::path const& path) {
	auto file = std::ifstream{path, std::ios::binary};
	if (!file) { return {}; }
	auto sha1 = Sha1{};
	auto buffer = std::array<char, 64 * 1024>{};
	while (file) {
		file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
		auto const count = static_cast<std::size_t>(file.gcount());
		sha1.update(std::as_bytes(std::span{buffer.data(), count}));
	}
	if (file.bad()) { return {}; }
	return sha1.finish();
}

bool verify_sha1_file(std::filesystem::path const& path, Sha1Digest const& expected) {
	auto ec = std::error_code{};
	if (!std::filesystem::is_regular_file(path, ec)) { return false; }
	auto const actual = sha1_of_file(path);
	return actual && *actual == expected;
}

std::string to_hex(Sha1Digest const& digest) {
	static constexpr char digits_v[] = "0123456789abcdef";
	auto ret = std::string{};
	ret.reserve(digest.size() * 2);
	for (auto const byte : digest) {
		ret += digits_v[byte >> 4];
		ret += digits_v[byte & 0xf];
	}
	return ret;
}

std::optional<Sha1Digest> parse_sha1_hex(std::string_view const hex) {
	auto ret = Sha1Digest{};
	if (hex.size() != ret.size() * 2) { return {}; }
	for (std::size_t i = 0; i < ret.size(); ++i) {
		auto const hi = hex_value(hex[2 * i]);
		auto const lo = hex_value(hex[2 * i + 1]);
		if (hi < 0 || lo < 0) { return {}; }
		ret[i] = static_cast<std::uint8_t>((hi << 4) | lo);
	}
	return ret;
}
} // namespace lapis
