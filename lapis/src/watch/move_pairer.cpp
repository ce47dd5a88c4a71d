#include <lapis/watch/move_pairer.hpp>
#include <utility>

namespace lapis {
void MovePairer::moved_from(std::uint32_t const cookie, std::filesystem::path from, Clock::time_point const now) {
	flush();
	m_pending = Pending{.cookie = cookie, .from = std::move(from), .deadline = now + hold_v};
}

void MovePairer::moved_to(std::uint32_t const cookie, std::filesystem::path to) {
	if (m_pending && m_pending->cookie == cookie) {
		auto from = std::move(m_pending->from);
		m_pending.reset();
		m_push(RawEvent{raw::ModifyName{raw::RenameMode::eBoth}, {std::move(from), std::move(to)}});
		return;
	}
	flush();
	m_push(RawEvent{raw::ModifyName{raw::RenameMode::eTo}, {std::move(to)}});
}

void MovePairer::flush() {
	if (!m_pending) { return; }
	auto from = std::move(m_pending->from);
	m_pending.reset();
	m_push(RawEvent{raw::ModifyName{raw::RenameMode::eFrom}, {std::move(from)}});
}

bool MovePairer::expire(Clock::time_point const now) {
	if (!m_pending || now < m_pending->deadline) { return false; }
	flush();
	return true;
}

std::optional<MovePairer::Clock::duration> MovePairer::remaining(Clock::time_point const now) const {
	if (!m_pending) { return {}; }
	if (now >= m_pending->deadline) { return Clock::duration::zero(); }
	return m_pending->deadline - now;
}
} // namespace lapis
