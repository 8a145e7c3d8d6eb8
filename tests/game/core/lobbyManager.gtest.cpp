#include "core/lobbyManager.hpp"
#include "testHelpers.hpp"

#include <gtest/gtest.h>

#include <chrono>

namespace wordgrid::gtest {

static const std::vector<Coord> TOP_ROW{{0u, 0u}, {0u, 1u}, {0u, 2u}};

class LobbyManagerTest : public ::testing::Test {
protected:
	LobbyManagerTest() : m_lobbies(m_dictionary, LobbyOptions{.maxPlayers = 3u, .match = {.maxRoundsPerPlayer = 2u, .grid = {}, .seed = 0u}, .seed = 5u}) {
		m_lobbies.subscribe(&m_listener);
	}

	Lobby create(const UserId& hostId, const std::string& username, Visibility visibility, const ServerId& serverId = DEFAULT_SERVER_ID) {
		auto created = m_lobbies.create(hostId, username, visibility, serverId);
		EXPECT_FALSE(isRejected(created));
		return std::get<Lobby>(created);
	}

	//! Lobby hosted by "a" with the given extra players joined.
	Lobby lobbyWith(std::initializer_list<std::string> guests) {
		auto lobby = create("a", "Alice", Visibility::Public);
		for (const auto& guest: guests) {
			lobby = std::get<Lobby>(m_lobbies.join(lobby.id, guest, "name-" + guest));
		}
		return lobby;
	}

	StartResult startedWith(std::initializer_list<std::string> guests) {
		const auto lobby = lobbyWith(guests);
		for (const auto& player: lobby.players) {
			EXPECT_FALSE(isRejected(m_lobbies.setReady(lobby.id, player.userId, true)));
		}
		auto started = m_lobbies.start(lobby.id, "a");
		EXPECT_FALSE(isRejected(started));
		return std::get<StartResult>(started);
	}

	AcceptAllDictionary m_dictionary;
	RecordingListener m_listener;
	LobbyManager m_lobbies;
};

TEST_F(LobbyManagerTest, CreateSeedsHost) {
	const auto lobby = create("a", "Alice", Visibility::Private, "eu");

	EXPECT_EQ(lobby.status, LobbyStatus::Waiting);
	EXPECT_EQ(lobby.hostId, "a");
	EXPECT_EQ(lobby.serverId, "eu");
	EXPECT_EQ(lobby.maxPlayers, 3u);
	ASSERT_EQ(lobby.players.size(), 1u);
	EXPECT_TRUE(lobby.players.front().isHost);
	EXPECT_FALSE(lobby.players.front().ready);

	ASSERT_EQ(lobby.code.size(), 4u);
	EXPECT_GE(std::stoi(lobby.code), 1000);

	ASSERT_EQ(m_listener.signals, std::vector<Signal>{Signal::LobbyUpdated});
	EXPECT_EQ(m_listener.lobbies.back(), lobby);
	EXPECT_EQ(m_lobbies.findByCode(lobby.code), lobby);
}

TEST_F(LobbyManagerTest, CodesAreUnique) {
	std::set<std::string> codes;
	for (int i = 0; i < 200; ++i) {
		codes.insert(create(std::to_string(i), "player", Visibility::Public).code);
	}
	EXPECT_EQ(codes.size(), 200u);
}

TEST_F(LobbyManagerTest, JoinRejections) {
	const auto lobby = lobbyWith({"b", "c"});

	EXPECT_EQ(std::get<Rejection>(m_lobbies.join(lobby.id, "d", "Dan")).reason, RejectReason::Full);
	EXPECT_EQ(std::get<Rejection>(m_lobbies.join("lobby-404", "d", "Dan")).reason, RejectReason::NotFound);
	EXPECT_EQ(std::get<Rejection>(m_lobbies.joinByCode("0000", "d", "Dan")).reason, RejectReason::NotFound);

	const auto started = startedWith({"b"});
	EXPECT_EQ(std::get<Rejection>(m_lobbies.join(started.lobby.id, "d", "Dan")).reason, RejectReason::AlreadyPlaying);
}

TEST_F(LobbyManagerTest, JoinIsIdempotent) {
	const auto lobby   = lobbyWith({"b"});
	const auto signals = m_listener.signals.size();

	const auto again = m_lobbies.join(lobby.id, "b", "Bob");
	ASSERT_FALSE(isRejected(again));
	EXPECT_EQ(std::get<Lobby>(again), lobby);
	EXPECT_EQ(m_listener.signals.size(), signals);
}

TEST_F(LobbyManagerTest, JoinByCode) {
	const auto lobby = create("a", "Alice", Visibility::Private);

	const auto joined = m_lobbies.joinByCode(lobby.code, "b", "Bob");
	ASSERT_FALSE(isRejected(joined));
	EXPECT_EQ(std::get<Lobby>(joined).players.size(), 2u);
	EXPECT_EQ(std::get<Lobby>(joined).players.back().userId, "b");
}

TEST_F(LobbyManagerTest, SetReady) {
	const auto lobby = lobbyWith({"b"});

	const auto ready = m_lobbies.setReady(lobby.id, "b", true);
	ASSERT_FALSE(isRejected(ready));
	EXPECT_TRUE(std::get<Lobby>(ready).findPlayer("b")->ready);
	EXPECT_EQ(m_listener.lobbies.back(), std::get<Lobby>(ready));

	const auto signals = m_listener.signals.size();
	const auto ghost   = m_lobbies.setReady(lobby.id, "ghost", true);
	ASSERT_FALSE(isRejected(ghost));
	EXPECT_EQ(std::get<Lobby>(ghost), std::get<Lobby>(ready));
	EXPECT_EQ(m_listener.signals.size(), signals);
}

TEST_F(LobbyManagerTest, HostLeavingPromotesEarliestJoined) {
	const auto lobby = lobbyWith({"b", "c"});

	const auto left = m_lobbies.leave(lobby.id, "a");
	ASSERT_FALSE(isRejected(left));
	const auto& remaining = std::get<std::optional<Lobby>>(left);
	ASSERT_TRUE(remaining.has_value());

	EXPECT_EQ(remaining->hostId, "b");
	EXPECT_TRUE(remaining->findPlayer("b")->isHost);
	EXPECT_FALSE(remaining->findPlayer("c")->isHost);
	EXPECT_EQ(std::ranges::count_if(remaining->players, &LobbyPlayer::isHost), 1);
}

TEST_F(LobbyManagerTest, LastPlayerLeavingDeletesLobby) {
	const auto lobby = lobbyWith({});

	const auto left = m_lobbies.leave(lobby.id, "a");
	ASSERT_FALSE(isRejected(left));
	EXPECT_FALSE(std::get<std::optional<Lobby>>(left).has_value());

	EXPECT_FALSE(m_lobbies.lobby(lobby.id).has_value());
	EXPECT_FALSE(m_lobbies.findByCode(lobby.code).has_value());
	EXPECT_EQ(m_listener.signals.back(), Signal::LobbyDeleted);
	EXPECT_EQ(std::get<Rejection>(m_lobbies.leave(lobby.id, "a")).reason, RejectReason::NotFound);
}

TEST_F(LobbyManagerTest, RemovePlayerRules) {
	const auto lobby = lobbyWith({"b", "c"});

	EXPECT_EQ(std::get<Rejection>(m_lobbies.removePlayer(lobby.id, "c", "b")).reason, RejectReason::NotHost);
	EXPECT_EQ(std::get<Rejection>(m_lobbies.removePlayer(lobby.id, "a", "a")).reason, RejectReason::SelfRemoval);

	const auto absent = m_lobbies.removePlayer(lobby.id, "ghost", "a");
	ASSERT_FALSE(isRejected(absent));
	EXPECT_EQ(std::get<Lobby>(absent), lobby);

	const auto removed = m_lobbies.removePlayer(lobby.id, "c", "a");
	ASSERT_FALSE(isRejected(removed));
	EXPECT_EQ(std::get<Lobby>(removed).findPlayer("c"), nullptr);
	EXPECT_EQ(m_listener.lobbies.back(), std::get<Lobby>(removed));
}

TEST_F(LobbyManagerTest, StartPreconditions) {
	const auto solo = lobbyWith({});
	ASSERT_FALSE(isRejected(m_lobbies.setReady(solo.id, "a", true)));
	EXPECT_EQ(std::get<Rejection>(m_lobbies.start(solo.id, "a")).reason, RejectReason::NotEnoughPlayers);

	const auto pair = create("x", "Xena", Visibility::Public);
	ASSERT_FALSE(isRejected(m_lobbies.join(pair.id, "y", "Yan")));
	ASSERT_FALSE(isRejected(m_lobbies.setReady(pair.id, "x", true)));
	EXPECT_EQ(std::get<Rejection>(m_lobbies.start(pair.id, "x")).reason, RejectReason::PlayersNotReady);

	EXPECT_EQ(std::get<Rejection>(m_lobbies.start("lobby-404", "a")).reason, RejectReason::NotFound);
}

TEST_F(LobbyManagerTest, OnlyHostStarts) {
	const auto lobby = lobbyWith({"b"});
	ASSERT_FALSE(isRejected(m_lobbies.setReady(lobby.id, "a", true)));
	ASSERT_FALSE(isRejected(m_lobbies.setReady(lobby.id, "b", true)));

	EXPECT_EQ(std::get<Rejection>(m_lobbies.start(lobby.id, "b")).reason, RejectReason::NotHost);
	EXPECT_EQ(m_lobbies.lobby(lobby.id)->status, LobbyStatus::Waiting);

	// Host moved while the lobby waited. The new host may start, the old one may not.
	ASSERT_FALSE(isRejected(m_lobbies.join(lobby.id, "c", "Cid")));
	ASSERT_FALSE(isRejected(m_lobbies.setReady(lobby.id, "c", true)));
	ASSERT_FALSE(isRejected(m_lobbies.leave(lobby.id, "a")));
	EXPECT_EQ(std::get<Rejection>(m_lobbies.start(lobby.id, "a")).reason, RejectReason::NotHost);
	EXPECT_FALSE(isRejected(m_lobbies.start(lobby.id, "b")));
}

TEST_F(LobbyManagerTest, CreateIsRejectedWhenCodesRunOut) {
	LobbyManager lobbies(m_dictionary, LobbyOptions{.maxPlayers = 3u, .match = {}, .seed = 5u, .maxLobbies = 2u});

	const auto first = lobbies.create("a", "Alice", Visibility::Public);
	ASSERT_FALSE(isRejected(first));
	ASSERT_FALSE(isRejected(lobbies.create("b", "Bob", Visibility::Public)));

	const auto third = lobbies.create("c", "Cid", Visibility::Public);
	ASSERT_TRUE(isRejected(third));
	EXPECT_EQ(std::get<Rejection>(third).reason, RejectReason::NoFreeCode);
	EXPECT_EQ(toString(RejectReason::NoFreeCode), "no_free_code");
	EXPECT_TRUE(lobbies.lobbiesOf("c").empty());

	// A deleted lobby frees its code.
	ASSERT_FALSE(isRejected(lobbies.leave(std::get<Lobby>(first).id, "a")));
	EXPECT_FALSE(isRejected(lobbies.create("c", "Cid", Visibility::Public)));
}

TEST_F(LobbyManagerTest, RefillsDoNotReplayTheInitialGrid) {
	// Each match refills from its own sequence, so the letter replacing (0,0) is not tied to the old one.
	std::size_t replayed = 0u;
	constexpr std::size_t MATCHES = 20u;
	for (std::size_t i = 0; i < MATCHES; ++i) {
		const auto started = startedWith({"b"});
		const auto before  = started.match.grid.at({0u, 0u}).letter;

		const auto submitted = m_lobbies.submitWord(started.match.id, "a", TOP_ROW);
		ASSERT_FALSE(isRejected(submitted));
		if (std::get<MatchState>(submitted).grid.at({0u, 0u}).letter == before) {
			++replayed;
		}
	}
	EXPECT_LT(replayed, MATCHES);
}

TEST_F(LobbyManagerTest, StartCreatesMatchInJoinOrder) {
	const auto signalsBefore = m_listener.signals.size();
	const auto started       = startedWith({"b", "c"});

	EXPECT_EQ(started.lobby.status, LobbyStatus::Playing);
	ASSERT_TRUE(started.lobby.matchId.has_value());
	EXPECT_EQ(*started.lobby.matchId, started.match.id);

	ASSERT_EQ(started.match.players.size(), 3u);
	EXPECT_EQ(started.match.players[0].userId, "a");
	EXPECT_EQ(started.match.players[1].userId, "b");
	EXPECT_EQ(started.match.players[2].userId, "c");
	EXPECT_EQ(started.match.currentPlayerId, "a");
	EXPECT_EQ(started.match.grid.rows(), 5u);
	EXPECT_EQ(started.match.maxRoundsPerPlayer, 2u);

	ASSERT_GE(m_listener.signals.size(), signalsBefore + 2u);
	const auto last = m_listener.signals.size();
	EXPECT_EQ(m_listener.signals[last - 2u], Signal::MatchStarted);
	EXPECT_EQ(m_listener.signals[last - 1u], Signal::LobbyUpdated);
	EXPECT_EQ(m_lobbies.match(started.match.id), started.match);

	EXPECT_EQ(std::get<Rejection>(m_lobbies.start(started.lobby.id, "a")).reason, RejectReason::AlreadyPlaying);
}

TEST_F(LobbyManagerTest, EvictionDuringMatchPassesTurn) {
	const auto started = startedWith({"b", "c"});
	const auto& matchId = started.match.id;

	ASSERT_FALSE(isRejected(m_lobbies.submitWord(matchId, "a", TOP_ROW)));
	ASSERT_EQ(m_lobbies.match(matchId)->currentPlayerId, "b");

	ASSERT_FALSE(isRejected(m_lobbies.removePlayer(started.lobby.id, "b", "a")));
	const auto match = m_lobbies.match(matchId);
	ASSERT_TRUE(match.has_value());
	EXPECT_EQ(match->currentPlayerId, "c");
	EXPECT_EQ(match->findPlayer("b"), nullptr);

	EXPECT_EQ(std::get<Rejection>(m_lobbies.submitWord(matchId, "b", TOP_ROW)).reason, RejectReason::NotYourTurn);
}

TEST_F(LobbyManagerTest, CompletedMatchFinishesLobby) {
	const auto started = startedWith({"b"});
	const auto& matchId = started.match.id;

	for (int round = 0; round < 2; ++round) {
		ASSERT_FALSE(isRejected(m_lobbies.submitWord(matchId, "a", TOP_ROW)));
		ASSERT_FALSE(isRejected(m_lobbies.submitWord(matchId, "b", TOP_ROW)));
	}

	EXPECT_EQ(m_lobbies.match(matchId)->status, MatchStatus::Completed);
	EXPECT_EQ(m_lobbies.lobby(started.lobby.id)->status, LobbyStatus::Finished);
	EXPECT_EQ(m_listener.count(Signal::MatchCompleted), 1u);
	EXPECT_EQ(m_listener.lobbies.back().status, LobbyStatus::Finished);
}

TEST_F(LobbyManagerTest, LeavingTwoPlayerMatchCompletesIt) {
	const auto started = startedWith({"b"});

	const auto left = m_lobbies.leave(started.lobby.id, "b");
	ASSERT_FALSE(isRejected(left));
	EXPECT_EQ(std::get<std::optional<Lobby>>(left)->status, LobbyStatus::Finished);
	EXPECT_EQ(m_lobbies.match(started.match.id)->status, MatchStatus::Completed);
}

TEST_F(LobbyManagerTest, ShuffleIsRoutedToMatch) {
	const auto started = startedWith({"b"});

	EXPECT_FALSE(isRejected(m_lobbies.shuffleGrid(started.match.id, "a")));
	EXPECT_EQ(std::get<Rejection>(m_lobbies.shuffleGrid(started.match.id, "a")).reason, RejectReason::AlreadyShuffled);
	EXPECT_EQ(std::get<Rejection>(m_lobbies.shuffleGrid("match-404", "a")).reason, RejectReason::NotFound);
	EXPECT_EQ(std::get<Rejection>(m_lobbies.submitWord("match-404", "a", TOP_ROW)).reason, RejectReason::NotFound);
}

TEST_F(LobbyManagerTest, ListShowsPublicWaitingLobbiesNewestFirst) {
	const auto first   = create("a", "Alice", Visibility::Public);
	const auto hidden  = create("b", "Bob", Visibility::Private);
	const auto other   = create("c", "Cid", Visibility::Public, "eu");
	const auto second  = create("d", "Dan", Visibility::Public);

	const auto listed = m_lobbies.list(DEFAULT_SERVER_ID);
	ASSERT_EQ(listed.size(), 2u);
	EXPECT_EQ(listed[0].id, second.id);
	EXPECT_EQ(listed[1].id, first.id);

	EXPECT_EQ(m_lobbies.list("eu").front().id, other.id);
	EXPECT_EQ(m_lobbies.lobbiesOf("b"), std::vector<LobbyId>{hidden.id});
}

TEST_F(LobbyManagerTest, PurgeIdleLobbies) {
	const auto lonely = lobbyWith({});
	const auto busy   = create("x", "Xena", Visibility::Public);
	ASSERT_FALSE(isRejected(m_lobbies.join(busy.id, "y", "Yan")));

	EXPECT_EQ(m_lobbies.purgeIdle(std::chrono::steady_clock::now()), 0u);
	EXPECT_EQ(m_lobbies.purgeIdle(std::chrono::steady_clock::now() + std::chrono::minutes(6)), 1u);

	EXPECT_FALSE(m_lobbies.lobby(lonely.id).has_value());
	EXPECT_TRUE(m_lobbies.lobby(busy.id).has_value());
	EXPECT_EQ(m_listener.signals.back(), Signal::LobbyDeleted);
}

} // namespace wordgrid::gtest
