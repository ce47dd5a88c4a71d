#pragma once
#include <lapis/util/enum_array.hpp>
#include <lapis/util/error.hpp>
#include <string>

namespace lapis {
///
/// \brief Failure of a single file install.
///
struct InstallError : Error {
	enum class Kind : std::uint8_t { eWrongHash, eWrongFilesize, eNotOk, eInvalidHash, eIoError, eRequestFailed, eInvalidPath, eCOUNT_ };

	static constexpr EnumArray<Kind, std::string_view> kind_names_v{
		"WrongHash", "WrongFilesize", "NotOK", "InvalidHash", "IoError", "RequestFailed", "InvalidPath",
	};

	InstallError(Kind kind, std::string const& detail, long status = 0);

	Kind kind{};
	long status{};
};
} // namespace lapis
