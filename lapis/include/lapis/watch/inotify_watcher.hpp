#pragma once
#include <lapis/util/pinned.hpp>
#include <lapis/watch/debouncer.hpp>
#include <lapis/watch/fs_watcher.hpp>
#include <functional>
#include <memory>

namespace lapis {
///
/// \brief Linux inotify backend.
///
/// A reader thread translates inotify records into RawEvents and feeds a Debouncer;
/// the control loop collects batches via poll_batch().
///
class InotifyWatcher : public FsWatcher, public Pinned {
  public:
	///
	/// \brief Invoked on the reader thread whenever new events arrive.
	///
	using OnActivity = std::function<void()>;

	///
	/// \throws InitError if inotify cannot be initialized
	///
	explicit InotifyWatcher(std::chrono::milliseconds debounce, OnActivity on_activity = {});
	~InotifyWatcher() override;

	bool watch(std::filesystem::path const& path, RecursiveMode mode) override;
	bool unwatch(std::filesystem::path const& path) override;

	std::optional<RawBatch> poll_batch();

  private:
	struct Impl;
	std::unique_ptr<Impl> m_impl;
};
} // namespace lapis
