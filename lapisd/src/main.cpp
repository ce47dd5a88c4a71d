#include <daemon.hpp>
#include <lapis/content/curl_http_client.hpp>
#include <lapis/defines.hpp>
#include <lapis/util/cli_args.hpp>
#include <lapis/util/error.hpp>
#include <lapis/util/logger.hpp>
#include <charconv>
#include <csignal>
#include <cstdio>
#include <filesystem>
#include <optional>

namespace fs = std::filesystem;
namespace cli_args = lapis::cli_args;

namespace lapisd {
namespace {
std::atomic<bool> g_stop{};

void on_signal(int) { g_stop.store(true); }

template <typename Type>
bool parse_number(Type& out, std::string_view const text) {
	auto const [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), out);
	return ec == std::errc{} && ptr == text.data() + text.size();
}

void print_error(std::string const& text) { std::fprintf(stderr, "%s\n", text.c_str()); }

struct Args {
	struct Parser;

	fs::path dir{};
	fs::path log_file{};
	std::optional<std::uint32_t> debounce_ms{};
	bool verbose{};

	std::string instance{};
	std::string new_instance{};
	lapis::LoaderKind loader{lapis::LoaderKind::eVanilla};
	std::optional<std::string> game_version{};
	lapis::ContentSource source{lapis::ContentSource::eManual};
	std::vector<std::string_view> files{};
};

struct Args::Parser : cli_args::Parser {
	Args args{};

	bool option(cli_args::Key key, cli_args::Value value) override {
		switch (key.single) {
		case 'v': args.verbose = true; return true;
		case 'd': args.dir = value; return true;
		default: break;
		}
		if (key.full == "log-file") {
			args.log_file = value;
		} else if (key.full == "debounce") {
			auto ms = std::uint32_t{};
			if (!parse_number(ms, value)) {
				print_error(fmt::format("invalid debounce (milliseconds): {}", value));
				return false;
			}
			args.debounce_ms = ms;
		} else if (key.full == "instance") {
			args.instance = value;
		} else if (key.full == "new-instance") {
			args.new_instance = value;
		} else if (key.full == "loader") {
			auto const loader = lapis::parse_loader_kind(value);
			if (!loader) {
				print_error(fmt::format("unknown loader: {}", value));
				return false;
			}
			args.loader = *loader;
		} else if (key.full == "game-version") {
			args.game_version = std::string{value};
		} else if (key.full == "source") {
			auto const source = lapis::parse_content_source(value);
			if (!source) {
				print_error(fmt::format("unknown content source: {}", value));
				return false;
			}
			args.source = *source;
		} else {
			return false;
		}
		return true;
	}

	bool arguments(std::span<char const* const> in) override {
		for (auto const* arg : in) { args.files.emplace_back(arg); }
		return true;
	}
};

///
/// \brief Parse "<url>|<sha1>|<size>[|<dest>]" or a local file path (installed under mods/).
///
std::optional<lapis::install::File> parse_file(std::string_view const arg, lapis::ContentSource const source) {
	auto ret = lapis::install::File{.source = source};
	if (arg.find('|') == std::string_view::npos) {
		auto const path = fs::path{arg};
		if (!fs::is_regular_file(path)) {
			print_error(fmt::format("not a file: {}", arg));
			return {};
		}
		ret.path = fs::path{"mods"} / path.filename();
		ret.download = lapis::install::LocalFile{.path = fs::absolute(path)};
		return ret;
	}
	auto parts = std::vector<std::string_view>{};
	for (auto rest = arg; !rest.empty();) {
		auto const bar = rest.find('|');
		parts.push_back(rest.substr(0, bar));
		rest = bar == std::string_view::npos ? std::string_view{} : rest.substr(bar + 1);
	}
	auto remote = lapis::install::RemoteDownload{};
	if (parts.size() < 3 || parts.size() > 4 || !parse_number(remote.size, parts[2])) {
		print_error(fmt::format("invalid download (expected <url>|<sha1>|<size>[|<dest>]): {}", arg));
		return {};
	}
	remote.url = parts[0];
	remote.sha1 = parts[1];
	auto dest = parts.size() == 4 ? parts[3] : std::string_view{};
	if (dest.empty()) {
		auto const url = std::string_view{remote.url};
		dest = url.substr(url.find_last_of('/') + 1);
		dest = dest.substr(0, dest.find('?'));
		auto const safe = lapis::SafePath::make(fmt::format("mods/{}", dest));
		if (!safe) {
			print_error(fmt::format("cannot derive a file name from: {}", remote.url));
			return {};
		}
		ret.path = *safe;
	} else {
		auto const safe = lapis::SafePath::make(dest);
		if (!safe) {
			print_error(fmt::format("unsafe destination: {}", dest));
			return {};
		}
		ret.path = *safe;
	}
	ret.download = std::move(remote);
	return ret;
}

std::optional<lapis::InstallRequest> make_request(Args const& args, lapis::Backend const& backend) {
	auto ret = lapis::InstallRequest{};
	if (!args.new_instance.empty()) {
		ret.target = lapis::install::TargetNewInstance{.name = args.new_instance, .loader = args.loader, .game_version = args.game_version};
	} else if (!args.instance.empty()) {
		auto target = std::optional<lapis::InstanceID>{};
		for (auto const id : backend.instance_ids()) {
			if (backend.find_instance(id)->name == args.instance) { target = id; }
		}
		if (!target) {
			print_error(fmt::format("unknown instance: {}", args.instance));
			return {};
		}
		ret.target = lapis::install::TargetInstance{*target};
	}
	for (auto const arg : args.files) {
		auto file = parse_file(arg, args.source);
		if (!file) { return {}; }
		ret.files.push_back(std::move(*file));
	}
	if (ret.files.empty()) {
		print_error("missing required argument: <file>...");
		return {};
	}
	return ret;
}

struct App {
	Args args{};

	bool run(std::span<char const* const> in) {
		auto parser = Args::Parser{};
		auto spec = cli_args::Spec{
			.app_name = "lapisd",
			.options =
				{
					cli_args::Opt{.key = {"dir", 'd'}, .value = "PATH", .help = "launcher directory (default: current directory)"},
					cli_args::Opt{.key = {"debounce"}, .value = "MS", .help = "filesystem event debounce window"},
					cli_args::Opt{.key = {"log-file"}, .value = "PATH", .help = "log file (default: <dir>/lapis.log)"},
					cli_args::Opt{.key = {"verbose", 'v'}, .help = "debug logging"},
					cli_args::Opt{.key = {"instance"}, .value = "NAME", .help = "install: target instance"},
					cli_args::Opt{.key = {"new-instance"}, .value = "NAME", .help = "install: create a new instance"},
					cli_args::Opt{.key = {"loader"}, .value = "KIND", .help = "install: loader of the new instance"},
					cli_args::Opt{.key = {"game-version"}, .value = "VERSION", .help = "install: game version of the new instance"},
					cli_args::Opt{.key = {"source"}, .value = "SOURCE", .help = "install: provenance (manual|modrinth|curseforge)"},
				},
			.commands = {"run", "install"},
			.arguments = "[<url>|<sha1>|<size>[|<dest>] | <file>]...",
			.version = lapis::version_v,
		};

		switch (cli_args::parse(std::move(spec), parser, in)) {
		case cli_args::Result::eExitSuccess: return true;
		case cli_args::Result::eExitFailure: return false;
		default: break;
		}
		args = std::move(parser.args);
		auto const command = parser.command.empty() ? std::string_view{"run"} : parser.command;

		auto directories = lapis::Directories::make(args.dir.empty() ? fs::current_path() : args.dir);
		directories.create_all();
		auto config = lapis::Config::load(directories.config_file);
		if (args.debounce_ms) { config.debounce_ms = *args.debounce_ms; }
		if (args.verbose) { config.log_level = lapis::Logger::Level::eDebug; }

		auto const log_file = args.log_file.empty() ? directories.log_file : args.log_file;
		auto const logger = lapis::Logger::Instance{log_file, config.log_level};

		auto watcher = lapis::InotifyWatcher{config.debounce()};
		auto http = lapis::CurlHttpClient{config.user_agent};
		auto backend = lapis::Backend{std::move(directories), std::move(config), watcher, http};
		auto daemon = Daemon{backend, watcher};
		backend.start();

		if (command == "install") {
			auto request = make_request(args, backend);
			if (!request) { return false; }
			return daemon.install(std::move(*request), g_stop);
		}
		daemon.run(g_stop);
		return true;
	}
};
} // namespace
} // namespace lapisd

int main(int argc, char** argv) {
	std::signal(SIGINT, &lapisd::on_signal);
	std::signal(SIGTERM, &lapisd::on_signal);
	try {
		if (!lapisd::App{}.run({argv + 1, static_cast<std::size_t>(argc - 1)})) { return EXIT_FAILURE; }
	} catch (lapis::Error const& e) {
		lapis::g_logger.error("Fatal error: {}", e.what());
		return EXIT_FAILURE;
	} catch (std::exception const& e) {
		lapis::g_logger.error("Unexpected error: {}", e.what());
		return EXIT_FAILURE;
	}
}
