#pragma once
#include <lapis/watch/raw_event.hpp>
#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <utility>

namespace lapis {
///
/// \brief Pairs "moved from" / "moved to" records that share a cookie into one rename.
///
/// The two halves of a rename may arrive in separate reads, so an unmatched "from" is held
/// until hold_v elapses (or any other record arrives) and only then reported on its own.
///
class MovePairer {
  public:
	using Clock = std::chrono::steady_clock;
	using Push = std::function<void(RawEvent)>;

	static constexpr auto hold_v = std::chrono::milliseconds{20};

	explicit MovePairer(Push push) : m_push(std::move(push)) {}

	void moved_from(std::uint32_t cookie, std::filesystem::path from, Clock::time_point now = Clock::now());
	void moved_to(std::uint32_t cookie, std::filesystem::path to);

	///
	/// \brief Report a held "from" on its own.
	///
	void flush();
	///
	/// \returns true if a held "from" was past its deadline and got flushed
	///
	bool expire(Clock::time_point now = Clock::now());

	///
	/// \brief Time left before the held "from" expires, if any is held.
	///
	std::optional<Clock::duration> remaining(Clock::time_point now = Clock::now()) const;
	bool holding() const { return m_pending.has_value(); }

  private:
	struct Pending {
		std::uint32_t cookie{};
		std::filesystem::path from{};
		Clock::time_point deadline{};
	};

	Push m_push;
	std::optional<Pending> m_pending{};
};
} // namespace lapis
