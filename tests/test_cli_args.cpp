#include <gtest/gtest.h>
#include <lapis/util/cli_args.hpp>
#include <string>
#include <vector>

namespace lapis {
namespace {
struct Recorder : cli_args::Parser {
	std::vector<std::pair<std::string, std::string>> options{};
	std::vector<std::string> args{};
	bool reject{};

	bool option(cli_args::Key key, cli_args::Value value) override {
		auto name = key.full.empty() ? std::string{key.single} : std::string{key.full};
		options.emplace_back(std::move(name), std::string{value});
		return !reject;
	}

	bool arguments(std::span<char const* const> in) override {
		for (auto const* arg : in) { args.emplace_back(arg); }
		return true;
	}
};

cli_args::Spec make_spec() {
	return cli_args::Spec{
		.app_name = "lapisd",
		.options =
			{
				cli_args::Opt{.key = {.full = "dir", .single = 'd'}, .value = "PATH", .help = "Launcher directory"},
				cli_args::Opt{.key = {.full = "verbose", .single = 'v'}, .help = "Debug logging"},
				cli_args::Opt{.key = {.single = 'q'}, .help = "Quiet"},
			},
		.commands = {"run", "install"},
	};
}

cli_args::Result parse(Recorder& out, std::vector<char const*> const& args) { return cli_args::parse(make_spec(), out, args); }
} // namespace

TEST(CliArgs, LongOptionWithValue) {
	auto out = Recorder{};
	ASSERT_EQ(parse(out, {"--dir=/tmp/launcher"}), cli_args::Result::eContinue);
	ASSERT_EQ(out.options.size(), 1u);
	EXPECT_EQ(out.options[0].first, "dir");
	EXPECT_EQ(out.options[0].second, "/tmp/launcher");
}

TEST(CliArgs, SingleFlagsCombine) {
	auto out = Recorder{};
	ASSERT_EQ(parse(out, {"-vq"}), cli_args::Result::eContinue);
	ASSERT_EQ(out.options.size(), 2u);
	EXPECT_EQ(out.options[0].first, "verbose");
	EXPECT_EQ(out.options[1].first, "q");
}

TEST(CliArgs, SingleOptionTakesValue) {
	auto out = Recorder{};
	ASSERT_EQ(parse(out, {"-d=/srv"}), cli_args::Result::eContinue);
	ASSERT_EQ(out.options.size(), 1u);
	EXPECT_EQ(out.options[0].second, "/srv");
}

TEST(CliArgs, CommandThenArguments) {
	auto out = Recorder{};
	ASSERT_EQ(parse(out, {"-v", "install", "--dir=x", "a", "b"}), cli_args::Result::eContinue);
	EXPECT_EQ(out.command, "install");
	ASSERT_EQ(out.options.size(), 2u);
	ASSERT_EQ(out.args.size(), 2u);
	EXPECT_EQ(out.args[0], "a");
	EXPECT_EQ(out.args[1], "b");
}

TEST(CliArgs, Failures) {
	auto out = Recorder{};
	EXPECT_EQ(parse(out, {"--nope"}), cli_args::Result::eExitFailure);
	out = {};
	EXPECT_EQ(parse(out, {"--dir"}), cli_args::Result::eExitFailure);
	out = {};
	EXPECT_EQ(parse(out, {"launch"}), cli_args::Result::eExitFailure);
	out = {};
	out.reject = true;
	EXPECT_EQ(parse(out, {"-v"}), cli_args::Result::eExitFailure);
}

TEST(CliArgs, VersionExitsEarly) {
	auto out = Recorder{};
	EXPECT_EQ(parse(out, {"--version", "run"}), cli_args::Result::eExitSuccess);
	EXPECT_TRUE(out.command.empty());
}
} // namespace lapis
