#include <lapis/util/thread_pool.hpp>
#include <algorithm>

namespace lapis {
ThreadPool::ThreadPool(std::optional<std::uint32_t> const thread_count) {
	auto const hc = std::max(std::thread::hardware_concurrency(), 1u);
	auto const count = std::clamp(thread_count.value_or(hc), 1u, hc);

	auto agent = [this](std::stop_token const& stop) {
		while (auto task = m_queue.pop(stop)) { (*task)(); }
	};
	for (std::uint32_t i = 0; i < count; ++i) { m_threads.push_back(std::jthread{agent}); }
}

ThreadPool::~ThreadPool() {
	for (auto& thread : m_threads) { thread.request_stop(); }
	// wake every idle worker; tasks still queued are dropped with their promises (broken_promise)
	m_queue.release();
	m_threads.clear();
}
} // namespace lapis
