#pragma once
#include <lapis/content/http_client.hpp>
#include <lapis/util/pinned.hpp>
#include <chrono>
#include <string>

namespace lapis {
///
/// \brief HttpClient over libcurl easy handles (one per request).
///
/// curl_global_init / cleanup are reference counted across instances.
///
class CurlHttpClient : public HttpClient, public Pinned {
  public:
	explicit CurlHttpClient(std::string user_agent, std::chrono::seconds connect_timeout = std::chrono::seconds{15});
	~CurlHttpClient() override;

	long get(std::string const& url, Receiver& receiver) override;

  private:
	std::string m_user_agent{};
	std::chrono::seconds m_connect_timeout{};
};
} // namespace lapis
