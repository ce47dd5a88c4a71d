#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace lapis {
using Sha1Digest = std::array<std::uint8_t, 20>;

struct Sha1DigestHasher {
	std::size_t operator()(Sha1Digest const& digest) const;
};

///
/// \brief Incremental SHA-1 (OpenSSL EVP).
///
class Sha1 {
  public:
	Sha1();

	void update(std::span<std::byte const> bytes);
	///
	/// \brief Obtain the digest; the hasher must not be updated afterwards.
	///
	Sha1Digest finish();

  private:
	struct Deleter {
		void operator()(void* ctx) const;
	};
	std::unique_ptr<void, Deleter> m_ctx{};
};

Sha1Digest sha1_of(std::span<std::byte const> bytes);
///
/// \brief Stream a file through SHA-1.
/// \returns std::nullopt if the file cannot be read
///
std::optional<Sha1Digest> sha1_of_file(std::filesystem::path const& path);

///
/// \brief Check whether the file at path exists and hashes to expected.
///
bool verify_sha1_file(std::filesystem::path const& path, Sha1Digest const& expected);

///
/// \brief Lowercase hex encoding.
///
std::string to_hex(Sha1Digest const& digest);
///
/// \brief Decode 40 hex digits (either case).
///
std::optional<Sha1Digest> parse_sha1_hex(std::string_view hex);
} // namespace lapis
