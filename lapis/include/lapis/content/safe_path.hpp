#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace lapis {
///
/// \brief Relative, '/'-separated path that cannot escape its base directory.
///
/// Rejects roots, "..", empty components, reserved Windows device names, control characters,
/// characters invalid on common filesystems, and components ending in '.' or ' '.
///
class SafePath {
  public:
	static std::optional<SafePath> make(std::string_view path);

	std::filesystem::path to_path(std::filesystem::path const& base) const;

	std::string_view str() const { return m_path; }
	std::string_view file_name() const;
	///
	/// \brief Extension of the file name, without the dot (empty if none).
	///
	std::string_view extension() const;

	bool starts_with(std::string_view prefix) const;
	std::optional<SafePath> strip_prefix(std::string_view prefix) const;

	bool operator==(SafePath const&) const = default;
	auto operator<=>(SafePath const&) const = default;

  private:
	explicit SafePath(std::string path) : m_path(std::move(path)) {}

	std::string m_path{};
};

///
/// \brief Check a single path component.
///
bool is_safe_component(std::string_view component);
} // namespace lapis
