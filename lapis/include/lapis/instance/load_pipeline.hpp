#pragma once
#include <lapis/util/logger.hpp>
#include <lapis/util/thread_pool.hpp>
#include <lapis/util/wake_signal.hpp>
#include <atomic>
#include <future>
#include <memory>
#include <optional>
#include <vector>

namespace lapis {
enum class LoadState : std::uint8_t { eUnloaded, eLoading, eLoaded, eLoadingDirty, eLoadedDirty, eCOUNT_ };

inline constexpr EnumArray<LoadState, std::string_view> load_state_names_v{"Unloaded", "Loading", "Loaded", "LoadingDirty", "LoadedDirty"};

enum class StartLoad : std::uint8_t { eInitial, eReload, eNone };

///
/// \brief One background-loaded resource of an instance (worlds, servers, or mods).
///
/// spawn() runs a scan on the pool; finish() polls it without blocking and publishes the result
/// as an immutable snapshot. State is shared (atomically) with observers.
///
template <typename Type>
class LoadPipeline {
  public:
	using Snapshot = std::shared_ptr<std::vector<Type> const>;

	LoadState state() const { return m_state->load(); }
	std::shared_ptr<std::atomic<LoadState> const> shared_state() const { return m_state; }

	bool is_loading() const { return m_task.has_value(); }
	Snapshot const& snapshot() const { return m_snapshot; }

	///
	/// \brief Loading -> LoadingDirty, Loaded -> LoadedDirty.
	/// \returns true if the state changed
	///
	bool mark_dirty() {
		auto const state = m_state->load();
		if (state == LoadState::eLoading) {
			m_state->store(LoadState::eLoadingDirty);
			return true;
		}
		if (state == LoadState::eLoaded) {
			m_state->store(LoadState::eLoadedDirty);
			return true;
		}
		return false;
	}

	template <typename F>
	void spawn(ThreadPool& pool, std::shared_ptr<WakeSignal> wake, F scan) {
		auto finished = std::make_shared<std::atomic<bool>>(false);
		auto future = pool.submit([finished, wake = std::move(wake), scan = std::move(scan)]() mutable {
			auto ret = scan();
			finished->store(true);
			if (wake) { wake->notify(); }
			return ret;
		});
		m_task = Task{std::move(finished), std::move(future)};
		m_state->store(LoadState::eLoading);
	}

	///
	/// \brief Poll the in-flight task.
	/// \returns The scan result if it completed (and was not invalidated)
	///
	std::optional<std::vector<Type>> finish() {
		if (!m_task || !m_task->finished->load()) { return {}; }
		auto task = std::move(*m_task);
		m_task.reset();
		auto ret = std::vector<Type>{};
		try {
			ret = task.future.get();
		} catch (std::exception const& e) {
			Logger{"Loader"}.error("Load task failed: {}", e.what());
		}
		if (task.discard) { return {}; }
		m_state->store(m_state->load() == LoadState::eLoadingDirty ? LoadState::eLoadedDirty : LoadState::eLoaded);
		return ret;
	}

	void publish(std::vector<Type> items) { m_snapshot = std::make_shared<std::vector<Type> const>(std::move(items)); }

	///
	/// \brief Drop the snapshot and return to Unloaded; an in-flight result will be discarded.
	///
	void invalidate() {
		if (m_task) { m_task->discard = true; }
		m_snapshot.reset();
		m_state->store(LoadState::eUnloaded);
	}

  private:
	struct Task {
		std::shared_ptr<std::atomic<bool>> finished{};
		std::future<std::vector<Type>> future{};
		bool discard{};
	};

	std::shared_ptr<std::atomic<LoadState>> m_state{std::make_shared<std::atomic<LoadState>>(LoadState::eUnloaded)};
	std::optional<Task> m_task{};
	Snapshot m_snapshot{};
};
} // namespace lapis
