#pragma once
#include <lapis/util/ptr.hpp>
#include <span>
#include <string_view>
#include <vector>

namespace lapis::cli_args {
enum class Result { eContinue, eExitFailure, eExitSuccess };

struct Key {
	std::string_view full{};
	char single{};

	constexpr bool valid() const { return !full.empty() || single != '\0'; }
};

using Value = std::string_view;

///
/// \brief Specification of a single option.
///
/// If value is non-empty the option requires one, passed as --key=value or -k=value.
///
struct Opt {
	Key key{};
	Value value{};
	std::string_view help{};
};

///
/// \brief Receiver of parsed options.
///
struct Parser {
	std::string_view command{};

	virtual bool option(Key key, Value value) = 0;
	virtual bool arguments(std::span<char const* const> args) = 0;

  protected:
	~Parser() = default;
};

struct Spec {
	std::string_view app_name{};
	std::vector<Opt> options{};
	std::vector<std::string_view> commands{};
	std::string_view arguments{};
	std::string_view version{"(unknown)"};
};

///
/// \brief Parse options, an optional command, and trailing arguments.
///
/// --help and --version are handled internally and return eExitSuccess.
/// \param args Command line arguments, excluding the program name
///
Result parse(Spec spec, Parser& out, std::span<char const* const> args);
} // namespace lapis::cli_args
