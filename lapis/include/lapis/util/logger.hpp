#pragma once
#include <fmt/format.h>
#include <lapis/util/enum_array.hpp>
#include <lapis/util/pinned.hpp>
#include <filesystem>
#include <span>
#include <string>
#include <string_view>

namespace lapis {
class Logger {
  public:
	enum class Pipe : std::uint8_t { eStdOut, eStdErr };
	///
	/// \brief Severity of a log message; lower values are more severe.
	///
	enum class Level : std::uint8_t { eError, eWarn, eInfo, eDebug, eCOUNT_ };
	static constexpr auto levels_v{EnumArray<Level, char>{'E', 'W', 'I', 'D'}};
	static constexpr EnumArray<Level, std::string_view> level_names_v{"error", "warn", "info", "debug"};

	///
	/// \brief The format for a log message.
	///
	inline static std::string s_format{"[{level}] [T{thread}] [{context}] {message} [{timestamp}]"};

	struct Entry {
		std::string formatted_message{};
		Level level{};
	};

	class Instance;
	struct Sink;

	static int thread_id();

	///
	/// \brief Set the most verbose level that will be logged.
	///
	static void set_max_level(Level level);
	static Level max_level();
	static bool is_enabled(Level level) { return level <= max_level(); }

	///
	/// \brief Parse "error" / "warn" / "info" / "debug".
	/// \returns fallback if text is not a known level
	///
	static Level parse_level(std::string_view text, Level fallback = Level::eInfo);

	///
	/// \brief Attach a sink to receive log callbacks; the sink's destructor detaches it.
	///
	static void attach(Sink& out_sink);

	static void print_to(Pipe pipe, Entry entry);

	static std::string format(Level level, std::string_view context, std::string_view message);

	template <typename... Args>
	static std::string format(Level level, std::string_view const context, fmt::format_string<Args...> fmt, Args const&... args) {
		return format(level, context, fmt::vformat(fmt, fmt::make_format_args(args...)));
	}

	virtual ~Logger() = default;

	Logger(std::string_view context = "General") : context(context) {}

	template <typename... Args>
	void error(fmt::format_string<Args...> fmt, Args const&... args) const {
		log(Level::eError, fmt, args...);
	}

	template <typename... Args>
	void warn(fmt::format_string<Args...> fmt, Args const&... args) const {
		log(Level::eWarn, fmt, args...);
	}

	template <typename... Args>
	void info(fmt::format_string<Args...> fmt, Args const&... args) const {
		log(Level::eInfo, fmt, args...);
	}

	template <typename... Args>
	void debug(fmt::format_string<Args...> fmt, Args const&... args) const {
		log(Level::eDebug, fmt, args...);
	}

	void print(Entry entry) const { print_to(entry.level == Level::eError ? Pipe::eStdErr : Pipe::eStdOut, std::move(entry)); }

	std::string_view context{};

  private:
	template <typename... Args>
	void log(Level const level, fmt::format_string<Args...> fmt, Args const&... args) const {
		if (!is_enabled(level)) { return; }
		print(Entry{format(level, context, fmt, args...), level});
	}
};

struct Logger::Sink : Pinned {
	virtual ~Sink();

	virtual void on_log(Entry const& entry) = 0;
};

///
/// \brief RAII instance that owns the log file (if any) for the lifetime of the process.
///
/// An existing log file is rotated to "<path>.bak".
///
class Logger::Instance : public Pinned {
  public:
	Instance(std::filesystem::path const& file_path = {}, Level max_level = Level::eInfo);
	~Instance();
};

inline auto const g_logger{Logger{}};
} // namespace lapis
