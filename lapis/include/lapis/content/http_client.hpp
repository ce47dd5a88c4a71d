#pragma once
#include <cstddef>
#include <span>
#include <string>

namespace lapis {
///
/// \brief Blocking HTTP GET with a streamed body.
///
/// Implementations follow redirects and throw InstallError (eRequestFailed) on transport failure.
///
class HttpClient {
  public:
	struct Receiver {
		///
		/// \brief Called once with the final status code, before any body bytes.
		/// \returns false to abort the transfer
		///
		virtual bool on_status(long status) = 0;
		///
		/// \brief Called for each chunk of the body.
		/// \returns false to abort the transfer
		///
		virtual bool on_data(std::span<std::byte const> bytes) = 0;

	  protected:
		~Receiver() = default;
	};

	virtual ~HttpClient() = default;

	///
	/// \brief Perform a GET request.
	/// \returns Final HTTP status code
	///
	virtual long get(std::string const& url, Receiver& receiver) = 0;
};
} // namespace lapis
