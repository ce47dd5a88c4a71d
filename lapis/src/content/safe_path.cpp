#include <lapis/content/safe_path.hpp>
#include <algorithm>
#include <array>
#include <cctype>

namespace lapis {
namespace {
constexpr std::size_t max_component_v{255};
constexpr std::string_view invalid_chars_v{"/\\?<>:*|\""};
constexpr auto reserved_names_v = std::array<std::string_view, 22>{
	"CON",	"PRN",	"AUX",	"NUL",	"COM1", "COM2", "COM3", "COM4", "COM5", "COM6", "COM7",
	"COM8", "COM9", "LPT1", "LPT2", "LPT3", "LPT4", "LPT5", "LPT6", "LPT7", "LPT8", "LPT9",
};

bool is_reserved(std::string_view component) {
	// "con.txt" is as reserved as "con"
	component = component.substr(0, component.find('.'));
	auto upper = std::string{component};
	std::transform(upper.begin(), upper.end(), upper.begin(), [](unsigned char ch) { return static_cast<char>(std::toupper(ch)); });
	return std::find(reserved_names_v.begin(), reserved_names_v.end(), upper) != reserved_names_v.end();
}

bool is_control(unsigned char const ch) { return ch < 0x20 || ch == 0x7f; }

template <typename Func>
bool for_each_component(std::string_view path, Func&& func) {
	while (!path.empty()) {
		auto const slash = path.find('/');
		if (!func(path.substr(0, slash))) { return false; }
		if (slash == std::string_view::npos) { break; }
		path = path.substr(slash + 1);
	}
	return true;
}
} // namespace

bool is_safe_component(std::string_view const component) {
	if (component.empty() || component.size() > max_component_v) { return false; }
	if (component == "." || component == "..") { return false; }
	if (component.back() == '.' || component.back() == ' ') { return false; }
	for (auto const ch : component) {
		if (is_control(static_cast<unsigned char>(ch)) || invalid_chars_v.find(ch) != std::string_view::npos) { return false; }
	}
	return !is_reserved(component);
}

std::optional<SafePath> SafePath::make(std::string_view const path) {
	if (path.empty() || path.front() == '/') { return {}; }
	auto normalized = std::string{};
	auto const check = [&normalized](std::string_view const component) {
		// "./a" and "a//b" collapse
		if (component.empty() || component == ".") { return true; }
		if (!is_safe_component(component)) { return false; }
		if (!normalized.empty()) { normalized += '/'; }
		normalized += component;
		return true;
	};
	if (!for_each_component(path, check) || normalized.empty()) { return {}; }
	return SafePath{std::move(normalized)};
}

std::filesystem::path SafePath::to_path(std::filesystem::path const& base) const {
	auto ret = base;
	for_each_component(m_path, [&ret](std::string_view const component) {
		ret /= component;
		return true;
	});
	return ret;
}

std::string_view SafePath::file_name() const {
	auto const view = std::string_view{m_path};
	auto const slash = view.rfind('/');
	return slash == std::string_view::npos ? view : view.substr(slash + 1);
}

std::string_view SafePath::extension() const {
	auto const name = file_name();
	auto const dot = name.rfind('.');
	if (dot == std::string_view::npos || dot == 0) { return {}; }
	return name.substr(dot + 1);
}

bool SafePath::starts_with(std::string_view prefix) const {
	while (prefix.ends_with('/')) { prefix.remove_suffix(1); }
	if (prefix.empty()) { return true; }
	auto const view = std::string_view{m_path};
	if (!view.starts_with(prefix)) { return false; }
	return view.size() == prefix.size() || view[prefix.size()] == '/';
}

std::optional<SafePath> SafePath::strip_prefix(std::string_view prefix) const {
	while (prefix.ends_with('/')) { prefix.remove_suffix(1); }
	if (!starts_with(prefix)) { return {}; }
	auto rest = std::string_view{m_path}.substr(prefix.size());
	while (rest.starts_with('/')) { rest.remove_prefix(1); }
	if (rest.empty()) { return {}; }
	return SafePath{std::string{rest}};
}
} // namespace lapis
