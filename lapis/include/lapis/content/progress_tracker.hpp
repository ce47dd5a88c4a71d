#pragma once
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace lapis {
///
/// \brief Thread-safe progress of one unit of work (a download or a copy).
///
class ProgressTracker {
  public:
	enum class Finish : std::uint8_t { eNone, eFast, eSlow };

	struct Snapshot {
		std::string title{};
		std::uint64_t count{};
		std::uint64_t total{};
		Finish finish{};
		bool error{};
	};

	using OnUpdate = std::function<void(Snapshot const&)>;

	explicit ProgressTracker(std::string title, OnUpdate on_update = {});

	void set_total(std::uint64_t total);
	void set_count(std::uint64_t count);
	void add_count(std::uint64_t delta);
	void finish(Finish type);
	void set_error();

	Snapshot snapshot() const;

  private:
	template <typename F>
	void update(F func);

	Snapshot m_data{};
	OnUpdate m_on_update{};
	mutable std::mutex m_mutex{};
};

///
/// \brief Progress and outcome of one install request.
///
class InstallAction {
  public:
	explicit InstallAction(ProgressTracker::OnUpdate on_update = {}) : m_on_update(std::move(on_update)) {}

	std::shared_ptr<ProgressTracker> add_tracker(std::string title);
	std::vector<std::shared_ptr<ProgressTracker>> trackers() const;

	void set_error(std::string error);
	std::optional<std::string> error() const;

	void set_done();
	bool is_done() const;

  private:
	ProgressTracker::OnUpdate m_on_update{};
	std::vector<std::shared_ptr<ProgressTracker>> m_trackers{};
	std::optional<std::string> m_error{};
	bool m_done{};
	mutable std::mutex m_mutex{};
};
} // namespace lapis
