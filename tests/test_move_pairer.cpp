#include <gtest/gtest.h>
#include <lapis/watch/fs_event.hpp>
#include <lapis/watch/move_pairer.hpp>

namespace lapis {
namespace {
using namespace std::chrono_literals;

struct MovePairerTest : ::testing::Test {
	std::vector<RawEvent> events{};
	MovePairer pairer{[this](RawEvent event) { events.push_back(std::move(event)); }};
	MovePairer::Clock::time_point const t0{};

	raw::RenameMode mode_of(std::size_t const index) const { return std::get<raw::ModifyName>(events.at(index).kind).mode; }
};
} // namespace

TEST_F(MovePairerTest, HalvesInSeparateReadsBecomeOneRename) {
	// end of one read: only the "from" half arrived
	pairer.moved_from(7, "/instances/Before", t0);
	EXPECT_FALSE(pairer.expire(t0 + 5ms));
	EXPECT_TRUE(events.empty());
	ASSERT_TRUE(pairer.remaining(t0 + 5ms));
	EXPECT_EQ(*pairer.remaining(t0 + 5ms), MovePairer::hold_v - 5ms);

	// next read
	pairer.moved_to(7, "/instances/After");
	ASSERT_EQ(events.size(), 1u);
	EXPECT_EQ(mode_of(0), raw::RenameMode::eBoth);
	EXPECT_EQ(events[0].paths, (std::vector<std::filesystem::path>{"/instances/Before", "/instances/After"}));
	EXPECT_FALSE(pairer.holding());

	auto const classified = classify(events[0]);
	ASSERT_TRUE(classified);
	ASSERT_TRUE(std::holds_alternative<fs_event::Rename>(*classified));
	EXPECT_EQ(std::get<fs_event::Rename>(*classified).to, "/instances/After");
}

TEST_F(MovePairerTest, UnmatchedFromExpires) {
	pairer.moved_from(3, "/instances/Gone", t0);
	EXPECT_FALSE(pairer.expire(t0 + MovePairer::hold_v - 1ms));
	EXPECT_TRUE(pairer.expire(t0 + MovePairer::hold_v));
	ASSERT_EQ(events.size(), 1u);
	EXPECT_EQ(mode_of(0), raw::RenameMode::eFrom);
	EXPECT_EQ(events[0].paths.front(), "/instances/Gone");
	EXPECT_FALSE(pairer.remaining(t0 + 1s));
	EXPECT_FALSE(pairer.expire(t0 + 1s));
}

TEST_F(MovePairerTest, MismatchedCookiesStaySeparate) {
	pairer.moved_from(1, "/a", t0);
	pairer.moved_to(2, "/b");
	ASSERT_EQ(events.size(), 2u);
	EXPECT_EQ(mode_of(0), raw::RenameMode::eFrom);
	EXPECT_EQ(mode_of(1), raw::RenameMode::eTo);

	// a second "from" releases the first
	pairer.moved_from(4, "/c", t0);
	pairer.moved_from(5, "/d", t0);
	ASSERT_EQ(events.size(), 3u);
	EXPECT_EQ(events[2].paths.front(), "/c");
	pairer.flush();
	ASSERT_EQ(events.size(), 4u);
	EXPECT_EQ(events[3].paths.front(), "/d");
}
} // namespace lapis
