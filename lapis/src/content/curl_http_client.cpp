#include <curl/curl.h>
#include <lapis/content/curl_http_client.hpp>
#include <lapis/content/install_error.hpp>
#include <lapis/util/logger.hpp>
#include <memory>
#include <mutex>

namespace lapis {
namespace {
auto const g_log{Logger{"Http"}};

struct GlobalInit {
	std::mutex mutex{};
	int count{};
};

GlobalInit& global_init() {
	static auto ret = GlobalInit{};
	return ret;
}

struct EasyDeleter {
	void operator()(CURL* curl) const { curl_easy_cleanup(curl); }
};

struct Transfer {
	HttpClient::Receiver& receiver;
	CURL* curl{};
	bool status_sent{};
	bool aborted{};

	bool send_status() {
		if (status_sent) { return true; }
		status_sent = true;
		long status{};
		curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
		return receiver.on_status(status);
	}
};

std::size_t write_body(char* ptr, std::size_t size, std::size_t count, void* user_data) {
	auto& transfer = *static_cast<Transfer*>(user_data);
	auto const bytes = size * count;
	if (!transfer.send_status() || !transfer.receiver.on_data({reinterpret_cast<std::byte const*>(ptr), bytes})) {
		transfer.aborted = true;
		return 0;
	}
	return bytes;
}
} // namespace

CurlHttpClient::CurlHttpClient(std::string user_agent, std::chrono::seconds const connect_timeout)
	: m_user_agent(std::move(user_agent)), m_connect_timeout(connect_timeout) {
	auto& init = global_init();
	auto lock = std::scoped_lock{init.mutex};
	if (init.count++ == 0) { curl_global_init(CURL_GLOBAL_DEFAULT); }
}

CurlHttpClient::~CurlHttpClient() {
	auto& init = global_init();
	auto lock = std::scoped_lock{init.mutex};
	if (--init.count == 0) { curl_global_cleanup(); }
}

long CurlHttpClient::get(std::string const& url, Receiver& receiver) {
	auto curl = std::unique_ptr<CURL, EasyDeleter>{curl_easy_init()};
	if (!curl) { throw InstallError{InstallError::Kind::eRequestFailed, "curl_easy_init failed"}; }

	auto transfer = Transfer{.receiver = receiver, .curl = curl.get()};
	curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
	curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
	curl_easy_setopt(curl.get(), CURLOPT_MAXREDIRS, 10L);
	curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, m_user_agent.c_str());
	curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
	curl_easy_setopt(curl.get(), CURLOPT_ACCEPT_ENCODING, "identity");
	curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(std::chrono::milliseconds{m_connect_timeout}.count()));
	curl_easy_setopt(curl.get(), CURLOPT_LOW_SPEED_TIME, 30L);
	curl_easy_setopt(curl.get(), CURLOPT_LOW_SPEED_LIMIT, 8L);
	curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, &write_body);
	curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &transfer);

	g_log.debug("GET {}", url);
	auto const result = curl_easy_perform(curl.get());
	long status{};
	curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &status);
	if (result != CURLE_OK && !(result == CURLE_WRITE_ERROR && transfer.aborted)) {
		throw InstallError{InstallError::Kind::eRequestFailed, fmt::format("{}: {}", url, curl_easy_strerror(result))};
	}
	// empty body: the receiver has not seen the status yet
	if (!transfer.aborted && !transfer.send_status()) { g_log.debug("{}: response rejected (status {})", url, status); }
	return status;
}
} // namespace lapis
