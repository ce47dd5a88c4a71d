#pragma once
#include <lapis/util/ptr.hpp>
#include <cstdint>
#include <functional>
#include <memory>
#include <vector>

namespace lapis {
///
/// \brief Single-threaded observer list.
///
/// Dispatch copies the callback list, so callbacks may connect / disconnect during dispatch.
///
template <typename... Args>
class Signal {
  public:
	using Callback = std::function<void(Args const&...)>;

	class Handle;
	class Listener;

	Signal() = default;
	Signal(Signal&&) = default;
	Signal& operator=(Signal&&) = default;

	Signal(Signal const&) = delete;
	Signal& operator=(Signal const&) = delete;

	Handle connect(Callback callback) {
		auto id = ++m_prev_id;
		m_storage->push_back({std::move(callback), id});
		return Handle{m_storage, id};
	}

	void operator()(Args const&... args) const {
		auto storage = *m_storage;
		for (auto const& entry : storage) { entry.callback(args...); }
	}

  private:
	struct Entry {
		Callback callback{};
		std::uint64_t id{};
	};

	using Storage = std::vector<Entry>;

	std::shared_ptr<Storage> m_storage{std::make_shared<Storage>()};
	std::uint64_t m_prev_id{};
};

template <typename... Args>
class Signal<Args...>::Handle {
  public:
	Handle() = default;

	void disconnect() {
		if (!m_id) { return; }
		if (auto storage = m_storage.lock()) {
			std::erase_if(*storage, [id = m_id](Entry const& e) { return e.id == id; });
		}
		m_id = {};
	}

  private:
	Handle(std::shared_ptr<Storage> const& storage, std::uint64_t id) : m_storage(storage), m_id(id) {}

	std::weak_ptr<Storage> m_storage{};
	std::uint64_t m_id{};

	friend class Signal;
};

///
/// \brief RAII connection: disconnects on destruction.
///
template <typename... Args>
class Signal<Args...>::Listener {
  public:
	Listener() = default;

	Listener(Listener&&) = default;
	Listener& operator=(Listener&& rhs) noexcept {
		if (&rhs != this) {
			disconnect();
			m_handle = std::move(rhs.m_handle);
		}
		return *this;
	}

	Listener& operator=(Listener const&) = delete;
	Listener(Listener const&) = delete;

	Listener(Handle handle) : m_handle(std::move(handle)) {}
	~Listener() { disconnect(); }

	void disconnect() { m_handle.disconnect(); }

  private:
	Handle m_handle{};
};
} // namespace lapis
