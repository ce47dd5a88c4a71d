#include <fmt/format.h>
#include <fmt/ranges.h>
#include <lapis/util/cli_args.hpp>
#include <algorithm>
#include <cstdio>
#include <iterator>
#include <string>

namespace lapis {
namespace {
using cli_args::Result;

Ptr<cli_args::Opt const> find_opt(cli_args::Spec const& spec, std::string_view const full) {
	auto const it = std::ranges::find_if(spec.options, [full](cli_args::Opt const& o) { return !o.key.full.empty() && o.key.full == full; });
	return it == spec.options.end() ? nullptr : &*it;
}

Ptr<cli_args::Opt const> find_opt(cli_args::Spec const& spec, char const single) {
	auto const it = std::ranges::find_if(spec.options, [single](cli_args::Opt const& o) { return o.key.single != '\0' && o.key.single == single; });
	return it == spec.options.end() ? nullptr : &*it;
}

Result print_help(cli_args::Spec const& spec) {
	auto str = fmt::format("Usage: {} [OPTION]...", spec.app_name);
	if (!spec.commands.empty()) { str += " <COMMAND>"; }
	fmt::format_to(std::back_inserter(str), " {}\n\nOPTIONS:\n", spec.arguments);
	auto width = std::size_t{};
	for (auto const& opt : spec.options) { width = std::max(width, opt.key.full.size() + (opt.value.empty() ? 0 : opt.value.size() + 1)); }
	for (auto const& opt : spec.options) {
		auto key = std::string{opt.key.full};
		if (!opt.value.empty()) { fmt::format_to(std::back_inserter(key), "={}", opt.value); }
		if (opt.key.single) {
			fmt::format_to(std::back_inserter(str), "  -{}, --{:<{}}    {}\n", opt.key.single, key, width, opt.help);
		} else {
			fmt::format_to(std::back_inserter(str), "      --{:<{}}    {}\n", key, width, opt.help);
		}
	}
	if (!spec.commands.empty()) { fmt::format_to(std::back_inserter(str), "\nCOMMANDS: {}\n", fmt::join(spec.commands, " | ")); }
	std::fputs(str.c_str(), stdout);
	return Result::eExitSuccess;
}

Result print_version(cli_args::Spec const& spec) {
	std::fputs(fmt::format("{} version {}\n", spec.app_name, spec.version).c_str(), stdout);
	return Result::eExitSuccess;
}

Result unknown_option(std::string_view const opt) {
	std::fputs(fmt::format("unknown option: {}\n", opt).c_str(), stderr);
	return Result::eExitFailure;
}

Result dispatch(cli_args::Spec const& spec, cli_args::Parser& out, cli_args::Opt const& opt, cli_args::Value const value) {
	if (opt.key.full == "help") { return print_help(spec); }
	if (opt.key.full == "version") { return print_version(spec); }
	if (!opt.value.empty() && value.empty()) {
		std::fputs(fmt::format("missing required value for option: {}\n", opt.key.full.empty() ? std::string_view{&opt.key.single, 1} : opt.key.full).c_str(),
				   stderr);
		return Result::eExitFailure;
	}
	if (!out.option(opt.key, value)) { return Result::eExitFailure; }
	return Result::eContinue;
}

Result parse_option(cli_args::Spec const& spec, cli_args::Parser& out, std::string_view arg) {
	auto value = cli_args::Value{};
	if (auto const eq = arg.find('='); eq != std::string_view::npos) {
		value = arg.substr(eq + 1);
		arg = arg.substr(0, eq);
	}
	if (arg.starts_with("--")) {
		auto const* opt = find_opt(spec, arg.substr(2));
		if (!opt) { return unknown_option(arg); }
		return dispatch(spec, out, *opt, value);
	}
	// -abc: flags; only the last may take a value
	arg = arg.substr(1);
	for (std::size_t i = 0; i < arg.size(); ++i) {
		auto const* opt = find_opt(spec, arg[i]);
		if (!opt) { return unknown_option(std::string_view{&arg[i], 1}); }
		auto const last = i + 1 == arg.size();
		if (auto const result = dispatch(spec, out, *opt, last ? value : cli_args::Value{}); result != Result::eContinue) { return result; }
	}
	return Result::eContinue;
}
} // namespace

auto cli_args::parse(Spec spec, Parser& out, std::span<char const* const> args) -> Result {
	std::erase_if(spec.options, [](Opt const& o) { return !o.key.valid(); });
	spec.options.push_back(Opt{.key = {.full = "help"}, .help = "Show this help text"});
	spec.options.push_back(Opt{.key = {.full = "version"}, .help = "Display the version"});
	for (; !args.empty(); args = args.subspan(1)) {
		auto const arg = std::string_view{args.front()};
		if (arg.size() > 1 && arg[0] == '-') {
			if (auto const result = parse_option(spec, out, arg); result != Result::eContinue) { return result; }
		} else if (out.command.empty() && !spec.commands.empty()) {
			auto const it = std::ranges::find(spec.commands, arg);
			if (it == spec.commands.end()) {
				std::fputs(fmt::format("unrecognized command: {}\n", arg).c_str(), stderr);
				return Result::eExitFailure;
			}
			out.command = *it;
		} else {
			break;
		}
	}
	if (!out.arguments(args)) { return Result::eExitFailure; }
	return Result::eContinue;
}
} // namespace lapis
