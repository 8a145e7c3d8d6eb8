#include "app/presence.hpp"

#include <gtest/gtest.h>

namespace wordgrid::gtest {

using namespace std::chrono_literals;

TEST(Presence, ExpiresAfterGrace) {
	app::Presence presence(120s);
	const auto now = app::Presence::Clock::now();

	presence.connected("alice");
	EXPECT_TRUE(presence.isOnline("alice"));

	presence.disconnected("alice", now);
	EXPECT_FALSE(presence.isOnline("alice"));
	EXPECT_TRUE(presence.expired(now + 119s).empty());

	EXPECT_EQ(presence.expired(now + 120s), std::vector<UserId>{"alice"});
	EXPECT_TRUE(presence.expired(now + 240s).empty()); // Reported once.
}

TEST(Presence, ReconnectCancelsExpiry) {
	app::Presence presence(1s);
	const auto now = app::Presence::Clock::now();

	presence.connected("alice");
	presence.disconnected("alice", now);
	presence.connected("alice");

	EXPECT_TRUE(presence.expired(now + 10s).empty());
	EXPECT_TRUE(presence.isOnline("alice"));
}

TEST(Presence, LastConnectionStartsGrace) {
	app::Presence presence(1s);
	const auto now = app::Presence::Clock::now();

	presence.connected("alice");
	presence.connected("alice");
	presence.disconnected("alice", now);
	EXPECT_TRUE(presence.isOnline("alice"));
	EXPECT_TRUE(presence.expired(now + 10s).empty());

	presence.disconnected("alice", now);
	EXPECT_EQ(presence.expired(now + 10s), std::vector<UserId>{"alice"});
}

TEST(Presence, UnknownUserIsIgnored) {
	app::Presence presence(1s);
	const auto now = app::Presence::Clock::now();

	presence.disconnected("ghost", now);
	EXPECT_TRUE(presence.expired(now + 10s).empty());
}

} // namespace wordgrid::gtest
