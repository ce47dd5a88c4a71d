#pragma once
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <stop_token>

namespace lapis {
///
/// \brief Blocking FIFO shared by the log writer thread and the loader pool.
///
template <typename Type>
class AsyncQueue {
  public:
	void push(Type t) {
		auto lock = std::unique_lock{m_mutex};
		m_queue.push_back(std::move(t));
		lock.unlock();
		m_cv.notify_one();
	}

	///
	/// \brief Block until an item is available or stop is requested.
	/// \returns std::nullopt if stop has been requested
	///
	std::optional<Type> pop(std::stop_token const& stop) {
		auto lock = std::unique_lock{m_mutex};
		m_cv.wait(lock, [this, &stop] { return !m_queue.empty() || stop.stop_requested(); });
		if (stop.stop_requested() || m_queue.empty()) { return {}; }
		auto ret = std::move(m_queue.front());
		m_queue.pop_front();
		return ret;
	}

	///
	/// \brief Empty the queue and wake all sleeping consumers.
	/// \returns Items left in the queue
	///
	std::deque<Type> release() {
		auto lock = std::unique_lock{m_mutex};
		auto ret = std::move(m_queue);
		m_queue.clear();
		lock.unlock();
		m_cv.notify_all();
		return ret;
	}

  private:
	std::deque<Type> m_queue{};
	std::condition_variable m_cv{};
	std::mutex m_mutex{};
};
} // namespace lapis
