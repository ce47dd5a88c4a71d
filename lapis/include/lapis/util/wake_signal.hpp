#pragma once
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace lapis {
///
/// \brief Level-triggered wake-up for the control loop.
///
/// Background loads and installs notify() on completion; the control loop sleeps in wait_for().
///
class WakeSignal {
  public:
	void notify() {
		auto lock = std::unique_lock{m_mutex};
		m_pending = true;
		lock.unlock();
		m_cv.notify_all();
	}

	///
	/// \brief Sleep until notified or timeout elapses; consumes a pending notification.
	/// \returns true if woken by notify()
	///
	template <typename Rep, typename Period>
	bool wait_for(std::chrono::duration<Rep, Period> const timeout) {
		auto lock = std::unique_lock{m_mutex};
		auto const ret = m_cv.wait_for(lock, timeout, [this] { return m_pending; });
		m_pending = false;
		return ret;
	}

  private:
	std::condition_variable m_cv{};
	std::mutex m_mutex{};
	bool m_pending{};
};
} // namespace lapis
