#pragma once
#include <lapis/watch/raw_event.hpp>
#include <chrono>
#include <mutex>
#include <optional>

namespace lapis {
///
/// \brief Collects raw events and releases them as one batch once the stream has been quiet for the window.
///
/// A batch is also released after max_delay so a constantly busy directory cannot starve the router.
///
class Debouncer {
  public:
	using Clock = std::chrono::steady_clock;

	explicit Debouncer(std::chrono::milliseconds window = std::chrono::milliseconds{250});

	void push(RawEvent event, Clock::time_point now = Clock::now());
	void push_error(std::string error, Clock::time_point now = Clock::now());

	///
	/// \brief Take the pending batch if it is due.
	///
	std::optional<RawBatch> poll(Clock::time_point now = Clock::now());

	std::chrono::milliseconds window() const { return m_window; }

  private:
	void touch(Clock::time_point now);

	std::chrono::milliseconds m_window;
	std::chrono::milliseconds m_max_delay;
	RawBatch m_pending{};
	std::optional<Clock::time_point> m_first{};
	Clock::time_point m_last{};
	std::mutex m_mutex{};
};
} // namespace lapis
