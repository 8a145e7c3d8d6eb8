#include "network/clientView.hpp"

#include "network/channels.hpp"

#include <gtest/gtest.h>

namespace wordgrid::gtest {

class ClientViewTest : public ::testing::Test {
protected:
	static Lobby makeLobby(const LobbyId& id, std::size_t players) {
		Lobby lobby{.id = id, .code = "1000", .serverId = DEFAULT_SERVER_ID, .hostId = "alice"};
		for (std::size_t i = 0; i < players; ++i) {
			const auto userId = i == 0u ? UserId{"alice"} : UserId{"player" + std::to_string(i)};
			lobby.players.push_back(LobbyPlayer{.userId = userId, .username = userId, .ready = false, .isHost = i == 0u, .joinedAt = i});
		}
		return lobby;
	}

	static MatchState makeMatch(const UserId& current) {
		MatchState match;
		match.id              = "match-1";
		match.lobbyId         = "lobby-1";
		match.players         = {MatchPlayer{.userId = "alice", .username = "Alice"}, MatchPlayer{.userId = "bob", .username = "Bob"}};
		match.currentPlayerId = current;
		match.grid            = Grid(1u, 1u, {Tile{.letter = 'A', .bonus = Bonus::None, .row = 0u, .col = 0u, .isGem = false}});
		return match;
	}
};

TEST_F(ClientViewTest, LobbyUpdateReplacesWholesale) {
	network::ClientView view;
	view.lobby = makeLobby("lobby-1", 1u);

	const auto updated = makeLobby("lobby-1", 3u);
	view               = network::apply(view, network::ServerLobbyUpdate{.channel = network::lobbyChannel("lobby-1"), .lobby = updated}, "alice");

	ASSERT_TRUE(view.lobby.has_value());
	EXPECT_EQ(*view.lobby, updated);
}

TEST_F(ClientViewTest, ListingUpdatesDoNotTouchOwnLobby) {
	network::ClientView view;
	view.lobby = makeLobby("lobby-1", 1u);

	const auto other = makeLobby("lobby-2", 2u);
	view             = network::apply(view, network::ServerLobbyUpdate{.channel = network::serverLobbiesChannel(DEFAULT_SERVER_ID), .lobby = other}, "alice");

	EXPECT_EQ(view.lobby->id, "lobby-1");
}

TEST_F(ClientViewTest, MatchBroadcastDiscardsSelection) {
	network::ClientView view;
	view.match     = makeMatch("alice");
	view.selection = {Coord{0u, 0u}};

	view = network::apply(view, network::ServerMatchUpdate{.channel = network::matchChannel("match-1"), .match = makeMatch("bob")}, "alice");

	EXPECT_TRUE(view.selection.empty());
	EXPECT_FALSE(network::isMyTurn(view, "alice"));
	EXPECT_TRUE(network::isMyTurn(view, "bob"));
}

TEST_F(ClientViewTest, PlayerActionKeepsView) {
	network::ClientView view;
	view.match     = makeMatch("alice");
	view.selection = {Coord{0u, 0u}};

	const auto after = network::apply(view, network::ServerPlayerAction{.channel = network::matchChannel("match-1"), .playerId = "bob", .username = "Bob", .action = {}}, "alice");

	EXPECT_EQ(after.selection, view.selection);
	EXPECT_EQ(after.match, view.match);
}

TEST_F(ClientViewTest, LobbyDeletedClearsView) {
	network::ClientView view;
	view.lobby = makeLobby("lobby-1", 1u);
	view.match = makeMatch("alice");

	view = network::apply(view, network::ServerLobbyDeleted{.channel = network::lobbyChannel("lobby-2"), .lobbyId = "lobby-2"}, "alice");
	EXPECT_TRUE(view.lobby.has_value());

	view = network::apply(view, network::ServerLobbyDeleted{.channel = network::lobbyChannel("lobby-1"), .lobbyId = "lobby-1"}, "alice");
	EXPECT_FALSE(view.lobby.has_value());
	EXPECT_FALSE(view.match.has_value());
}

TEST_F(ClientViewTest, ReplyOnlyFillsUnknownState) {
	network::ClientView view;

	const auto joined = makeLobby("lobby-1", 2u);
	view              = network::apply(view, network::ServerReply{.requestId = 1u, .lobby = joined}, "alice");
	ASSERT_TRUE(view.lobby.has_value());
	EXPECT_EQ(*view.lobby, joined);

	// A newer broadcast already arrived. The trailing reply must not roll it back.
	const auto newer = makeLobby("lobby-1", 3u);
	view             = network::apply(view, network::ServerLobbyUpdate{.channel = network::lobbyChannel("lobby-1"), .lobby = newer}, "alice");
	view             = network::apply(view, network::ServerReply{.requestId = 2u, .lobby = joined}, "alice");
	EXPECT_EQ(*view.lobby, newer);

	view = network::apply(view, network::ServerReply{.requestId = 3u, .error = "full", .lobby = makeLobby("lobby-9", 1u)}, "alice");
	EXPECT_EQ(view.lobby->id, "lobby-1");
}

TEST_F(ClientViewTest, PairingIsAdoptedByItsMembersOnly) {
	auto paired = makeLobby("lobby-7", 2u);
	const network::ServerMatchmakingUpdate event{.channel = network::matchmakingChannel(DEFAULT_SERVER_ID), .lobby = paired};

	const auto outsider = network::apply(network::ClientView{}, event, "carol");
	EXPECT_FALSE(outsider.lobby.has_value());

	const auto member = network::apply(network::ClientView{}, event, "player1");
	ASSERT_TRUE(member.lobby.has_value());
	EXPECT_EQ(member.lobby->id, "lobby-7");

	// A client already in a lobby keeps it.
	network::ClientView busy;
	busy.lobby = makeLobby("lobby-1", 1u);
	EXPECT_EQ(network::apply(busy, event, "alice").lobby->id, "lobby-1");
}

TEST_F(ClientViewTest, CompletedMatchIsNobodysTurn) {
	network::ClientView view;
	auto match            = makeMatch("alice");
	match.status          = MatchStatus::Completed;
	match.currentPlayerId = std::nullopt;

	view = network::apply(view, network::ServerMatchCompleted{.channel = network::lobbyChannel("lobby-1"), .match = match}, "alice");

	ASSERT_TRUE(view.match.has_value());
	EXPECT_FALSE(network::isMyTurn(view, "alice"));
}

} // namespace wordgrid::gtest
