#include <lapis/util/error.hpp>
#include <lapis/util/logger.hpp>
#include <lapis/watch/inotify_watcher.hpp>
#include <lapis/watch/move_pairer.hpp>
#include <poll.h>
#include <sys/inotify.h>
#include <unistd.h>
#include <array>
#include <cerrno>
#include <cstring>
#include <mutex>
#include <thread>
#include <unordered_map>

namespace lapis {
namespace {
namespace fs = std::filesystem;

auto const g_log{Logger{"Inotify"}};

constexpr std::uint32_t watch_mask_v{IN_CREATE | IN_DELETE | IN_MODIFY | IN_ATTRIB | IN_MOVED_FROM | IN_MOVED_TO | IN_DELETE_SELF | IN_MOVE_SELF};

constexpr int idle_poll_ms_v{100};
} // namespace

struct InotifyWatcher::Impl {
	struct Watch {
		fs::path path{};
		bool recursive{};
	};

	Debouncer debouncer;
	OnActivity on_activity;
	int fd{-1};
	std::unordered_map<int, Watch> watches{};
	std::unordered_map<fs::path, int, PathHasher> descriptors{};
	// reader thread only
	MovePairer moves;
	std::mutex mutex{};
	std::jthread thread{};

	Impl(std::chrono::milliseconds debounce, OnActivity on_activity)
		: debouncer(debounce), on_activity(std::move(on_activity)), moves([this](RawEvent event) { debouncer.push(std::move(event)); }) {}

	~Impl() {
		thread.request_stop();
		if (thread.joinable()) { thread.join(); }
		if (fd >= 0) { close(fd); }
	}

	// requires lock
	bool add(fs::path const& path, bool const recursive) {
		auto const wd = inotify_add_watch(fd, path.c_str(), watch_mask_v);
		if (wd < 0) {
			g_log.debug("inotify_add_watch [{}] failed: {}", path.generic_string(), std::strerror(errno));
			return false;
		}
		// the same inode yields the same descriptor: move it to the new path
		if (auto const it = watches.find(wd); it != watches.end() && it->second.path != path) { descriptors.erase(it->second.path); }
		watches.insert_or_assign(wd, Watch{path, recursive});
		descriptors.insert_or_assign(path, wd);
		if (!recursive) { return true; }
		auto ec = std::error_code{};
		for (auto const& entry : fs::directory_iterator{path, ec}) {
			if (entry.is_directory(ec) && !entry.is_symlink(ec)) { add(entry.path(), true); }
		}
		return true;
	}

	// requires lock
	void drop(int const wd) {
		auto const it = watches.find(wd);
		if (it == watches.end()) { return; }
		if (auto const dit = descriptors.find(it->second.path); dit != descriptors.end() && dit->second == wd) { descriptors.erase(dit); }
		watches.erase(it);
	}

	void push(raw::Kind kind, std::vector<fs::path> paths) { debouncer.push(RawEvent{kind, std::move(paths)}); }

	void translate(inotify_event const& event) {
		if (event.mask & IN_Q_OVERFLOW) {
			moves.flush();
			debouncer.push_error("inotify event queue overflowed");
			return;
		}
		auto lock = std::unique_lock{mutex};
		auto const it = watches.find(event.wd);
		if (it == watches.end()) { return; }
		auto const dir = it->second.path;
		auto const recursive = it->second.recursive;
		if (event.mask & IN_IGNORED) {
			drop(event.wd);
			return;
		}
		auto const path = event.len > 0 ? dir / event.name : dir;
		auto const is_dir = (event.mask & IN_ISDIR) != 0;

		if (event.mask & IN_MOVED_TO) {
			moves.moved_to(event.cookie, path);
			if (recursive && is_dir) { add(path, true); }
			return;
		}
		if (event.mask & IN_MOVED_FROM) {
			moves.moved_from(event.cookie, path);
			return;
		}
		moves.flush();
		if (event.mask & IN_CREATE) {
			push(raw::Create{is_dir ? raw::CreateKind::eFolder : raw::CreateKind::eFile}, {path});
			if (recursive && is_dir) { add(path, true); }
			return;
		}
		if (event.mask & IN_MODIFY) {
			push(raw::ModifyData{raw::DataChange::eContent}, {path});
			return;
		}
		if (event.mask & IN_ATTRIB) {
			push(raw::ModifyMetadata{}, {path});
			return;
		}
		if (event.mask & IN_DELETE) {
			push(raw::Remove{is_dir ? raw::RemoveKind::eFolder : raw::RemoveKind::eFile}, {path});
			return;
		}
		if (event.mask & IN_DELETE_SELF) {
			push(raw::Remove{raw::RemoveKind::eAny}, {dir});
			return;
		}
		if (event.mask & IN_MOVE_SELF) {
			// the descriptor now follows an inode at an unknown path
			push(raw::ModifyName{raw::RenameMode::eFrom}, {dir});
			inotify_rm_watch(fd, event.wd);
			drop(event.wd);
		}
	}

	void read_loop(std::stop_token const& stop) {
		alignas(inotify_event) auto buffer = std::array<char, 16 * 1024>{};
		auto pfd = pollfd{.fd = fd, .events = POLLIN, .revents = 0};
		while (!stop.stop_requested()) {
			// a held "moved from" may still be paired by the next read: wake up when it expires
			auto timeout = idle_poll_ms_v;
			if (auto const left = moves.remaining()) { timeout = static_cast<int>(std::chrono::ceil<std::chrono::milliseconds>(*left).count()); }
			auto const ready = poll(&pfd, 1, timeout);
			if (ready < 0) {
				if (errno == EINTR) { continue; }
				fail(fmt::format("poll failed: {}", std::strerror(errno)));
				break;
			}
			if (ready == 0) {
				if (moves.expire() && on_activity) { on_activity(); }
				continue;
			}
			auto const length = read(fd, buffer.data(), buffer.size());
			if (length < 0) {
				if (errno == EINTR || errno == EAGAIN) { continue; }
				fail(fmt::format("read failed: {}", std::strerror(errno)));
				break;
			}
			for (auto offset = std::size_t{}; offset < static_cast<std::size_t>(length);) {
				auto const* event = reinterpret_cast<inotify_event const*>(buffer.data() + offset);
				translate(*event);
				offset += sizeof(inotify_event) + event->len;
			}
			moves.expire();
			if (on_activity) { on_activity(); }
		}
	}

	void fail(std::string error) {
		moves.flush();
		debouncer.push_error(std::move(error));
	}
};

InotifyWatcher::InotifyWatcher(std::chrono::milliseconds const debounce, OnActivity on_activity)
	: m_impl(std::make_unique<Impl>(debounce, std::move(on_activity))) {
	m_impl->fd = inotify_init1(IN_NONBLOCK | IN_CLOEXEC);
	if (m_impl->fd < 0) { throw InitError{fmt::format("inotify_init1 failed: {}", std::strerror(errno))}; }
	m_impl->thread = std::jthread{[impl = m_impl.get()](std::stop_token const& stop) { impl->read_loop(stop); }};
}

InotifyWatcher::~InotifyWatcher() = default;

bool InotifyWatcher::watch(fs::path const& path, RecursiveMode const mode) {
	auto lock = std::scoped_lock{m_impl->mutex};
	return m_impl->add(path, mode == RecursiveMode::eRecursive);
}

bool InotifyWatcher::unwatch(fs::path const& path) {
	auto lock = std::scoped_lock{m_impl->mutex};
	auto const it = m_impl->descriptors.find(path);
	if (it == m_impl->descriptors.end()) { return false; }
	auto const wd = it->second;
	inotify_rm_watch(m_impl->fd, wd);
	m_impl->drop(wd);
	return true;
}

std::optional<RawBatch> InotifyWatcher::poll_batch() { return m_impl->debouncer.poll(); }
} // namespace lapis
