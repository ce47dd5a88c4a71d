#pragma once
#include <cstdint>
#include <filesystem>

namespace lapis {
struct PathHasher {
	std::size_t operator()(std::filesystem::path const& path) const { return std::filesystem::hash_value(path); }
};

enum class RecursiveMode : std::uint8_t { eNonRecursive, eRecursive };

///
/// \brief OS watch subscription interface.
///
/// Events are collected by the implementation and delivered in debounced batches elsewhere.
///
class FsWatcher {
  public:
	virtual ~FsWatcher() = default;

	///
	/// \brief Subscribe to changes of path (a file or a directory and its direct children).
	/// \returns false if the OS refused (path missing, limits reached)
	///
	virtual bool watch(std::filesystem::path const& path, RecursiveMode mode) = 0;
	virtual bool unwatch(std::filesystem::path const& path) = 0;
};
} // namespace lapis
