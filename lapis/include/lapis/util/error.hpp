#pragma once
#include <stdexcept>

namespace lapis {
///
/// \brief Base lapis exception.
///
struct Error : std::runtime_error {
	using std::runtime_error::runtime_error;
};

///
/// \brief Error during initialization (directories, watcher, HTTP client).
///
struct InitError : Error {
	using Error::Error;
};

///
/// \brief Malformed binary or text data (NBT, zip, metadata).
///
struct ParseError : Error {
	using Error::Error;
};
} // namespace lapis
