#include <lapis/watch/debouncer.hpp>

namespace lapis {
Debouncer::Debouncer(std::chrono::milliseconds const window) : m_window(window), m_max_delay(window * 8) {}

void Debouncer::push(RawEvent event, Clock::time_point const now) {
	auto lock = std::scoped_lock{m_mutex};
	m_pending.events.push_back(std::move(event));
	touch(now);
}

void Debouncer::push_error(std::string error, Clock::time_point const now) {
	auto lock = std::scoped_lock{m_mutex};
	if (m_pending.error.empty()) { m_pending.error = std::move(error); }
	touch(now);
}

std::optional<RawBatch> Debouncer::poll(Clock::time_point const now) {
	auto lock = std::scoped_lock{m_mutex};
	if (!m_first) { return {}; }
	if (now - m_last < m_window && now - *m_first < m_max_delay) { return {}; }
	auto ret = std::move(m_pending);
	m_pending = {};
	m_first.reset();
	return ret;
}

void Debouncer::touch(Clock::time_point const now) {
	if (!m_first) { m_first = now; }
	m_last = now;
}
} // namespace lapis
