#pragma once
#include <lapis/util/async_queue.hpp>
#include <lapis/util/unique_task.hpp>
#include <cstdint>
#include <future>
#include <optional>
#include <thread>
#include <utility>
#include <vector>

namespace lapis {
///
/// \brief Fixed number of worker threads draining a single shared task queue.
///
/// Scans of worlds, servers and mods run here; the control loop never blocks on them.
///
class ThreadPool {
  public:
	///
	/// \brief Construct a ThreadPool.
	/// \param thread_count Number of workers (defaults to hardware concurrency, at least 1)
	///
	explicit ThreadPool(std::optional<std::uint32_t> thread_count = {});
	~ThreadPool();

	ThreadPool(ThreadPool const&) = delete;
	ThreadPool& operator=(ThreadPool const&) = delete;

	///
	/// \brief Schedule a task to be run on the pool.
	/// \param func The task to enqueue
	/// \returns Future of the task's result (exceptions are forwarded)
	///
	template <typename F>
	auto submit(F func) -> std::future<std::invoke_result_t<F>> {
		using Ret = std::invoke_result_t<F>;
		auto promise = std::promise<Ret>{};
		auto ret = promise.get_future();
		submit(std::move(promise), std::move(func));
		return ret;
	}

	std::size_t thread_count() const { return m_threads.size(); }

  private:
	template <typename T, typename F>
	void submit(std::promise<T>&& promise, F func) {
		m_queue.push([p = std::move(promise), f = std::move(func)]() mutable {
			try {
				if constexpr (std::is_void_v<T>) {
					f();
					p.set_value();
				} else {
					p.set_value(f());
				}
			} catch (...) { p.set_exception(std::current_exception()); }
		});
	}

	AsyncQueue<UniqueTask<void()>> m_queue{};
	std::vector<std::jthread> m_threads{};
};

///
/// \brief Future that waits for completion on destruction.
///
template <typename Type>
struct ScopedFuture {
	ScopedFuture() = default;
	ScopedFuture(ScopedFuture&&) = default;

	ScopedFuture(std::future<Type> future) : future(std::move(future)) {}

	~ScopedFuture() { wait(); }

	void wait() const {
		if (future.valid()) { future.wait(); }
	}

	Type get() { return future.get(); }

	std::future<Type> future{};
};
} // namespace lapis
