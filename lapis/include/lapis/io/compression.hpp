#pragma once
#include <cstddef>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

namespace lapis::compression {
///
/// \brief Default cap on inflated output, guards against decompression bombs.
///
inline constexpr std::size_t max_inflated_v{64 * 1024 * 1024};

///
/// \brief Inflate a gzip (or zlib) stream.
/// \returns std::nullopt on corrupt input or if output exceeds max_size
///
std::optional<std::vector<std::byte>> gunzip(std::span<std::byte const> bytes, std::size_t max_size = max_inflated_v);

///
/// \brief Inflate a raw deflate stream (zip entries).
/// \param size_hint Expected uncompressed size, used to reserve output
///
std::optional<std::vector<std::byte>> inflate_raw(std::span<std::byte const> bytes, std::size_t size_hint, std::size_t max_size = max_inflated_v);

///
/// \brief Decode standard base64; whitespace is ignored.
///
std::optional<std::vector<std::byte>> decode_base64(std::string_view text);
} // namespace lapis::compression
