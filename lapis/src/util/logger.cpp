#include <lapis/util/async_queue.hpp>
#include <lapis/util/logger.hpp>
#include <lapis/util/ptr.hpp>
#include <atomic>
#include <chrono>
#include <cstdio>
#include <fstream>
#include <memory>
#include <mutex>
#include <thread>
#include <unordered_map>
#include <unordered_set>

namespace lapis {
namespace {
namespace fs = std::filesystem;

struct Timestamp {
	char buffer[32]{};
	operator char const*() const { return buffer; }
};

Timestamp make_timestamp() {
	auto const now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
	auto ret = Timestamp{};
	auto tm = std::tm{};
	if (!localtime_r(&now, &tm)) { return {}; }
	if (!std::strftime(ret.buffer, sizeof(ret.buffer), "%H:%M:%S", &tm)) { return {}; }
	return ret;
}

struct GetThreadId {
	std::unordered_map<std::thread::id, int> ids{};
	int next{};
	std::mutex mutex{};

	int operator()() {
		auto lock = std::scoped_lock{mutex};
		auto const tid = std::this_thread::get_id();
		if (auto const it = ids.find(tid); it != ids.end()) { return it->second; }
		auto const [it, _] = ids.insert_or_assign(tid, next++);
		return it->second;
	}
};

class FileLogger : public Logger::Sink {
  public:
	FileLogger(fs::path const& path) : m_path(fs::absolute(path)) {
		prepare_file();
		m_thread = std::jthread{[this](std::stop_token const& stop) { log_to_file(stop); }};
	}

	~FileLogger() override {
		m_thread.request_stop();
		m_queue.ping();
		if (m_thread.joinable()) { m_thread.join(); }
		flush_residue(m_queue.release());
	}

	void on_log(Logger::Entry const& entry) final { m_queue.push(entry); }

  private:
	void prepare_file() {
		auto ec = std::error_code{};
		if (!fs::exists(m_path, ec)) { return; }
		auto backup_path = m_path;
		backup_path += ".bak";
		fs::remove(backup_path, ec);
		fs::rename(m_path, backup_path, ec);
	}

	void flush_residue(std::deque<Logger::Entry> const& residue) {
		if (residue.empty()) { return; }
		auto file = std::ofstream{m_path, std::ios::app};
		if (!file) { return; }
		for (auto const& [message, _] : residue) { file << message << '\n'; }
	}

	void log_to_file(std::stop_token const& stop) {
		auto file = std::ofstream{m_path, std::ios::app};
		while (auto entry = m_queue.pop(stop)) {
			file << entry->formatted_message << '\n';
			file.flush();
		}
	}

	fs::path m_path{};
	AsyncQueue<Logger::Entry> m_queue{};
	std::jthread m_thread{};
};

struct Storage {
	std::unique_ptr<FileLogger> file_logger{};
	std::unordered_set<Ptr<Logger::Sink>> sinks{};
	std::mutex mutex{};
};

GetThreadId get_thread_id{};
Storage g_storage{};
std::atomic<Logger::Level> g_max_level{Logger::Level::eInfo};
} // namespace

Logger::Sink::~Sink() {
	auto lock = std::scoped_lock{g_storage.mutex};
	g_storage.sinks.erase(this);
}

int Logger::thread_id() { return get_thread_id(); }

void Logger::set_max_level(Level const level) { g_max_level = level; }

Logger::Level Logger::max_level() { return g_max_level; }

Logger::Level Logger::parse_level(std::string_view const text, Level const fallback) {
	for (std::size_t i = 0; i < level_names_v.size(); ++i) {
		if (level_names_v.t[i] == text) { return static_cast<Level>(i); }
	}
	return fallback;
}

void Logger::attach(Sink& out_sink) {
	auto lock = std::scoped_lock{g_storage.mutex};
	g_storage.sinks.insert(&out_sink);
}

Logger::Instance::Instance(fs::path const& file_path, Level const max_level) {
	set_max_level(max_level);
	if (file_path.empty()) { return; }
	auto file_logger = std::make_unique<FileLogger>(file_path);
	auto lock = std::scoped_lock{g_storage.mutex};
	g_storage.sinks.insert(file_logger.get());
	g_storage.file_logger = std::move(file_logger);
}

Logger::Instance::~Instance() {
	auto lock = std::unique_lock{g_storage.mutex};
	if (!g_storage.file_logger) { return; }
	g_storage.sinks.erase(g_storage.file_logger.get());
	auto file_logger = std::move(g_storage.file_logger);
	lock.unlock();
}

std::string Logger::format(Level level, std::string_view context, std::string_view const message) {
	if (context.empty()) { context = "Unknown"; }
	return fmt::format(fmt::runtime(s_format), fmt::arg("thread", thread_id()), fmt::arg("level", levels_v[level]), fmt::arg("context", context),
					   fmt::arg("message", message), fmt::arg("timestamp", static_cast<char const*>(make_timestamp())));
}

void Logger::print_to(Pipe pipe, Entry entry) {
	auto* fd = pipe == Pipe::eStdErr ? stderr : stdout;
	std::fprintf(fd, "%s\n", entry.formatted_message.c_str());
	auto lock = std::scoped_lock{g_storage.mutex};
	for (auto const& sink : g_storage.sinks) { sink->on_log(entry); }
}
} // namespace lapis
