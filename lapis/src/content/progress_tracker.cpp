#include <lapis/content/progress_tracker.hpp>

namespace lapis {
ProgressTracker::ProgressTracker(std::string title, OnUpdate on_update) : m_on_update(std::move(on_update)) { m_data.title = std::move(title); }

template <typename F>
void ProgressTracker::update(F func) {
	auto lock = std::unique_lock{m_mutex};
	func(m_data);
	if (!m_on_update) { return; }
	auto const data = m_data;
	lock.unlock();
	m_on_update(data);
}

void ProgressTracker::set_total(std::uint64_t const total) {
	update([total](Snapshot& data) { data.total = total; });
}

void ProgressTracker::set_count(std::uint64_t const count) {
	update([count](Snapshot& data) { data.count = count; });
}

void ProgressTracker::add_count(std::uint64_t const delta) {
	update([delta](Snapshot& data) { data.count += delta; });
}

void ProgressTracker::finish(Finish const type) {
	update([type](Snapshot& data) { data.finish = type; });
}

void ProgressTracker::set_error() {
	update([](Snapshot& data) { data.error = true; });
}

ProgressTracker::Snapshot ProgressTracker::snapshot() const {
	auto lock = std::scoped_lock{m_mutex};
	return m_data;
}

std::shared_ptr<ProgressTracker> InstallAction::add_tracker(std::string title) {
	auto ret = std::make_shared<ProgressTracker>(std::move(title), m_on_update);
	auto lock = std::scoped_lock{m_mutex};
	m_trackers.push_back(ret);
	return ret;
}

std::vector<std::shared_ptr<ProgressTracker>> InstallAction::trackers() const {
	auto lock = std::scoped_lock{m_mutex};
	return m_trackers;
}

void InstallAction::set_error(std::string error) {
	auto lock = std::scoped_lock{m_mutex};
	if (!m_error) { m_error = std::move(error); }
}

std::optional<std::string> InstallAction::error() const {
	auto lock = std::scoped_lock{m_mutex};
	return m_error;
}

void InstallAction::set_done() {
	auto lock = std::scoped_lock{m_mutex};
	m_done = true;
}

bool InstallAction::is_done() const {
	auto lock = std::scoped_lock{m_mutex};
	return m_done;
}
} // namespace lapis
