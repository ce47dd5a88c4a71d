#pragma once
#include <lapis/backend.hpp>
#include <lapis/watch/inotify_watcher.hpp>
#include <atomic>
#include <chrono>
#include <vector>

namespace lapisd {
///
/// \brief Headless front end: drives the backend's control loop and logs every notification.
///
class Daemon {
  public:
	static constexpr auto tick_v = std::chrono::milliseconds{100};

	Daemon(lapis::Backend& backend, lapis::InotifyWatcher& watcher);

	///
	/// \brief Run the control loop until stop is set.
	///
	void run(std::atomic<bool> const& stop);

	///
	/// \brief Run the control loop until the install completes (or stop is set).
	/// \returns true if the install succeeded
	///
	bool install(lapis::InstallRequest request, std::atomic<bool> const& stop);

  private:
	struct Request {
		lapis::InstanceID id{};
		lapis::Resource resource{};
	};

	void step();
	void request_all(lapis::InstanceID id);
	void flush_requests();

	lapis::Ptr<lapis::Backend> m_backend;
	lapis::Ptr<lapis::InotifyWatcher> m_watcher;
	std::vector<Request> m_requests{};

	lapis::Signal<lapis::InstanceInfoMessage>::Listener m_on_added{};
	lapis::Signal<lapis::InstanceInfoMessage>::Listener m_on_modified{};
	lapis::Signal<lapis::InstanceID>::Listener m_on_removed{};
	lapis::Signal<lapis::LoadStateMessage>::Listener m_on_state{};
	lapis::Signal<lapis::InstanceID, lapis::Instance::Worlds>::Listener m_on_worlds{};
	lapis::Signal<lapis::InstanceID, lapis::Instance::Servers>::Listener m_on_servers{};
	lapis::Signal<lapis::InstanceID, lapis::Instance::Mods>::Listener m_on_mods{};
	lapis::Signal<std::string>::Listener m_on_info{};
	lapis::Signal<std::string>::Listener m_on_error{};
};
} // namespace lapisd
