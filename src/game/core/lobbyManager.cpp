#include "core/lobbyManager.hpp"

#include "Logging.hpp"
#include "core/gridGenerator.hpp"
#include "core/invariant.hpp"
#include "model/json.hpp"

#include <algorithm>
#include <format>

namespace wordgrid {

static constexpr unsigned MIN_CODE = 1000u;
static constexpr unsigned MAX_CODE = MIN_CODE + static_cast<unsigned>(MAX_LIVE_LOBBIES) - 1u;

static constexpr std::size_t MIN_PLAYERS_TO_START = 2u;

LobbyManager::LobbyManager(const IDictionary& dictionary, LobbyOptions options, IMatchArchive* archive)
    : m_dictionary(dictionary), m_options(options), m_archive(archive), m_rng(options.seed) {
}

LobbyManager::~LobbyManager() = default;

void LobbyManager::subscribe(IStateListener* listener) {
	m_eventHub.subscribe(listener);
}

void LobbyManager::unsubscribe(IStateListener* listener) {
	m_eventHub.unsubscribe(listener);
}

Outcome<Lobby> LobbyManager::create(const UserId& hostId, const std::string& username, Visibility visibility, const ServerId& serverId) {
	auto entry = std::make_shared<LobbyEntry>();
	std::lock_guard<std::mutex> entryLock(entry->mutex);

	{
		std::lock_guard<std::mutex> lock(m_registryMutex);

		auto code = generateCode();
		if (!code) {
			Logger().Log(Logging::LogLevel::Warning, std::format("[LobbyManager] No free lobby code for '{}'. {} lobbies live.", hostId, m_lobbies.size()));
			return Rejection{RejectReason::NoFreeCode};
		}

		entry->createdAt = ++m_lobbyCounter;
		entry->lobby     = Lobby{
		        .id         = std::format("lobby-{}", entry->createdAt),
		        .code       = std::move(*code),
		        .serverId   = serverId,
		        .hostId     = hostId,
		        .visibility = visibility,
		        .status     = LobbyStatus::Waiting,
		        .maxPlayers = std::clamp<std::size_t>(m_options.maxPlayers, MIN_PLAYERS_TO_START, MAX_LOBBY_PLAYERS),
		        .players    = {LobbyPlayer{.userId = hostId, .username = username, .ready = false, .isHost = true, .joinedAt = ++m_joinSequence}},
		        .matchId    = std::nullopt,
		};

		m_codes.emplace(entry->lobby.code, entry->lobby.id);
		m_lobbies.emplace(entry->lobby.id, entry);
	}
	touch(*entry);
	verify(entry->lobby);

	Logger().Log(Logging::LogLevel::Info, std::format("[LobbyManager] '{}' created lobby {} (code {}).", hostId, entry->lobby.id, entry->lobby.code));
	m_eventHub.signalLobbyUpdated(entry->lobby);
	return entry->lobby;
}

Outcome<Lobby> LobbyManager::join(const LobbyId& lobbyId, const UserId& userId, const std::string& username) {
	const auto entry = findEntry(lobbyId);
	if (!entry) {
		return Rejection{RejectReason::NotFound};
	}
	std::lock_guard<std::mutex> entryLock(entry->mutex);
	if (entry->deleted) {
		return Rejection{RejectReason::NotFound};
	}

	auto& lobby = entry->lobby;
	if (lobby.findPlayer(userId)) {
		return lobby;
	}
	if (lobby.status != LobbyStatus::Waiting) {
		return Rejection{RejectReason::AlreadyPlaying};
	}
	if (lobby.isFull()) {
		return Rejection{RejectReason::Full};
	}

	std::uint64_t joinedAt = 0u;
	{
		std::lock_guard<std::mutex> lock(m_registryMutex);
		joinedAt = ++m_joinSequence;
	}
	lobby.players.push_back(LobbyPlayer{.userId = userId, .username = username, .ready = false, .isHost = false, .joinedAt = joinedAt});
	touch(*entry);
	verify(lobby);

	Logger().Log(Logging::LogLevel::Info, std::format("[LobbyManager] '{}' joined lobby {}.", userId, lobbyId));
	m_eventHub.signalLobbyUpdated(lobby);
	return lobby;
}

Outcome<Lobby> LobbyManager::joinByCode(const std::string& code, const UserId& userId, const std::string& username) {
	LobbyId lobbyId;
	{
		std::lock_guard<std::mutex> lock(m_registryMutex);
		const auto it = m_codes.find(code);
		if (it == m_codes.end()) {
			return Rejection{RejectReason::NotFound};
		}
		lobbyId = it->second;
	}
	return join(lobbyId, userId, username);
}

Outcome<Lobby> LobbyManager::setReady(const LobbyId& lobbyId, const UserId& userId, bool ready) {
	const auto entry = findEntry(lobbyId);
	if (!entry) {
		return Rejection{RejectReason::NotFound};
	}
	std::lock_guard<std::mutex> entryLock(entry->mutex);
	if (entry->deleted) {
		return Rejection{RejectReason::NotFound};
	}

	auto& lobby  = entry->lobby;
	auto* player = lobby.findPlayer(userId);
	if (!player || lobby.status != LobbyStatus::Waiting || player->ready == ready) {
		return lobby;
	}

	player->ready = ready;
	touch(*entry);

	m_eventHub.signalLobbyUpdated(lobby);
	return lobby;
}

Outcome<std::optional<Lobby>> LobbyManager::leave(const LobbyId& lobbyId, const UserId& userId) {
	const auto entry = findEntry(lobbyId);
	if (!entry) {
		return Rejection{RejectReason::NotFound};
	}
	std::lock_guard<std::mutex> entryLock(entry->mutex);
	if (entry->deleted) {
		return Rejection{RejectReason::NotFound};
	}

	auto& lobby   = entry->lobby;
	const auto it = std::ranges::find(lobby.players, userId, &LobbyPlayer::userId);
	if (it == lobby.players.end()) {
		return std::optional<Lobby>(lobby);
	}
	const bool wasHost = it->isHost;
	lobby.players.erase(it);
	removeFromMatch(*entry, userId);

	Logger().Log(Logging::LogLevel::Info, std::format("[LobbyManager] '{}' left lobby {}.", userId, lobbyId));

	if (lobby.players.empty()) {
		erase(*entry);
		return std::optional<Lobby>();
	}

	if (wasHost) {
		auto& next  = *std::ranges::min_element(lobby.players, {}, &LobbyPlayer::joinedAt);
		next.isHost = true;
		lobby.hostId = next.userId;
		Logger().Log(Logging::LogLevel::Info, std::format("[LobbyManager] Lobby {} host moved to '{}'.", lobbyId, next.userId));
	}
	touch(*entry);
	verify(lobby);

	m_eventHub.signalLobbyUpdated(lobby);
	return std::optional<Lobby>(lobby);
}

Outcome<Lobby> LobbyManager::removePlayer(const LobbyId& lobbyId, const UserId& targetUserId, const UserId& requestedBy) {
	const auto entry = findEntry(lobbyId);
	if (!entry) {
		return Rejection{RejectReason::NotFound};
	}
	std::lock_guard<std::mutex> entryLock(entry->mutex);
	if (entry->deleted) {
		return Rejection{RejectReason::NotFound};
	}

	auto& lobby = entry->lobby;
	if (lobby.hostId != requestedBy) {
		return Rejection{RejectReason::NotHost};
	}
	if (targetUserId == requestedBy) {
		return Rejection{RejectReason::SelfRemoval};
	}

	const auto it = std::ranges::find(lobby.players, targetUserId, &LobbyPlayer::userId);
	if (it == lobby.players.end()) {
		return lobby;
	}
	lobby.players.erase(it);
	removeFromMatch(*entry, targetUserId);
	touch(*entry);
	verify(lobby);

	Logger().Log(Logging::LogLevel::Info, std::format("[LobbyManager] Host '{}' removed '{}' from lobby {}.", requestedBy, targetUserId, lobbyId));
	m_eventHub.signalLobbyUpdated(lobby);
	return lobby;
}

Outcome<StartResult> LobbyManager::start(const LobbyId& lobbyId, const UserId& requestedBy) {
	const auto entry = findEntry(lobbyId);
	if (!entry) {
		return Rejection{RejectReason::NotFound};
	}
	std::lock_guard<std::mutex> entryLock(entry->mutex);
	if (entry->deleted) {
		return Rejection{RejectReason::NotFound};
	}

	auto& lobby = entry->lobby;
	if (lobby.hostId != requestedBy) {
		return Rejection{RejectReason::NotHost};
	}
	if (lobby.status != LobbyStatus::Waiting) {
		return Rejection{RejectReason::AlreadyPlaying};
	}
	if (lobby.players.size() < MIN_PLAYERS_TO_START) {
		return Rejection{RejectReason::NotEnoughPlayers};
	}
	if (!std::ranges::all_of(lobby.players, &LobbyPlayer::ready)) {
		return Rejection{RejectReason::PlayersNotReady};
	}

	auto ordered = lobby.players;
	std::ranges::sort(ordered, {}, &LobbyPlayer::joinedAt);

	std::vector<MatchPlayer> players;
	players.reserve(ordered.size());
	for (const auto& player: ordered) {
		players.push_back(MatchPlayer{.userId = player.userId, .username = player.username, .score = 0u, .roundsPlayed = 0u, .wordsFound = {}});
	}

	// Initial grid and the match's refills draw from separate sequences.
	MatchId matchId;
	std::uint64_t gridSeed = 0u;
	auto options           = m_options.match;
	{
		std::lock_guard<std::mutex> lock(m_registryMutex);
		matchId      = std::format("match-{}", ++m_matchCounter);
		gridSeed     = m_rng();
		options.seed = m_rng();
	}

	GridGenerator generator(gridSeed, options.grid);
	auto grid  = generator.generate();
	auto match = std::make_shared<Match>(matchId, lobbyId, std::move(players), std::move(grid), m_dictionary, m_eventHub, options, m_archive);
	auto state = match->state();

	{
		std::lock_guard<std::mutex> lock(m_registryMutex);
		m_matches.emplace(matchId, match);
	}
	entry->match  = std::move(match);
	lobby.status  = LobbyStatus::Playing;
	lobby.matchId = matchId;
	touch(*entry);

	Logger().Log(Logging::LogLevel::Info, std::format("[LobbyManager] Lobby {} started match {} with {} players.", lobbyId, matchId, state.players.size()));
	m_eventHub.signalMatchStarted(state);
	m_eventHub.signalLobbyUpdated(lobby);
	return StartResult{.lobby = lobby, .match = std::move(state)};
}

Outcome<MatchState> LobbyManager::submitWord(const MatchId& matchId, const UserId& playerId, const std::vector<Coord>& path) {
	const auto match = findMatch(matchId);
	if (!match) {
		return Rejection{RejectReason::NotFound};
	}

	auto outcome = match->submitWord(playerId, path);
	if (const auto* state = std::get_if<MatchState>(&outcome); state && state->status == MatchStatus::Completed) {
		finishLobby(match->lobbyId());
	}
	return outcome;
}

Outcome<MatchState> LobbyManager::shuffleGrid(const MatchId& matchId, const UserId& playerId) {
	const auto match = findMatch(matchId);
	if (!match) {
		return Rejection{RejectReason::NotFound};
	}
	return match->shuffleGrid(playerId);
}

std::optional<Lobby> LobbyManager::lobby(const LobbyId& lobbyId) const {
	const auto entry = findEntry(lobbyId);
	if (!entry) {
		return {};
	}
	std::lock_guard<std::mutex> entryLock(entry->mutex);
	if (entry->deleted) {
		return {};
	}
	return entry->lobby;
}

std::optional<Lobby> LobbyManager::findByCode(const std::string& code) const {
	LobbyId lobbyId;
	{
		std::lock_guard<std::mutex> lock(m_registryMutex);
		const auto it = m_codes.find(code);
		if (it == m_codes.end()) {
			return {};
		}
		lobbyId = it->second;
	}
	return lobby(lobbyId);
}

std::optional<MatchState> LobbyManager::match(const MatchId& matchId) const {
	const auto match = findMatch(matchId);
	if (!match) {
		return {};
	}
	return match->state();
}

std::vector<Lobby> LobbyManager::list(const ServerId& serverId) const {
	std::vector<std::pair<std::uint64_t, Lobby>> found;
	for (const auto& entry: entries()) {
		std::lock_guard<std::mutex> entryLock(entry->mutex);
		const auto& lobby = entry->lobby;
		if (!entry->deleted && lobby.serverId == serverId && lobby.visibility == Visibility::Public && lobby.status == LobbyStatus::Waiting) {
			found.emplace_back(entry->createdAt, lobby);
		}
	}

	std::ranges::sort(found, std::ranges::greater{}, &std::pair<std::uint64_t, Lobby>::first);
	if (found.size() > MAX_LISTED_LOBBIES) {
		found.resize(MAX_LISTED_LOBBIES);
	}

	std::vector<Lobby> lobbies;
	lobbies.reserve(found.size());
	for (auto& [createdAt, lobby]: found) {
		lobbies.push_back(std::move(lobby));
	}
	return lobbies;
}

std::vector<LobbyId> LobbyManager::lobbiesOf(const UserId& userId) const {
	std::vector<LobbyId> lobbyIds;
	for (const auto& entry: entries()) {
		std::lock_guard<std::mutex> entryLock(entry->mutex);
		if (!entry->deleted && entry->lobby.findPlayer(userId)) {
			lobbyIds.push_back(entry->lobby.id);
		}
	}
	return lobbyIds;
}

std::size_t LobbyManager::purgeIdle(std::chrono::steady_clock::time_point now) {
	std::size_t purged = 0u;
	for (const auto& entry: entries()) {
		std::lock_guard<std::mutex> entryLock(entry->mutex);
		const auto& lobby = entry->lobby;
		if (entry->deleted || lobby.status != LobbyStatus::Waiting || lobby.players.size() > 1u) {
			continue;
		}
		if (now - entry->updatedAt < m_options.idleTimeout) {
			continue;
		}

		Logger().Log(Logging::LogLevel::Info, std::format("[LobbyManager] Purging idle lobby {}.", lobby.id));
		erase(*entry);
		++purged;
	}
	return purged;
}

std::shared_ptr<LobbyManager::LobbyEntry> LobbyManager::findEntry(const LobbyId& lobbyId) const {
	std::lock_guard<std::mutex> lock(m_registryMutex);
	const auto it = m_lobbies.find(lobbyId);
	return it == m_lobbies.end() ? nullptr : it->second;
}

std::vector<std::shared_ptr<LobbyManager::LobbyEntry>> LobbyManager::entries() const {
	std::lock_guard<std::mutex> lock(m_registryMutex);

	std::vector<std::shared_ptr<LobbyEntry>> result;
	result.reserve(m_lobbies.size());
	for (const auto& [id, entry]: m_lobbies) {
		result.push_back(entry);
	}
	return result;
}

std::shared_ptr<Match> LobbyManager::findMatch(const MatchId& matchId) const {
	std::lock_guard<std::mutex> lock(m_registryMutex);
	const auto it = m_matches.find(matchId);
	return it == m_matches.end() ? nullptr : it->second;
}

std::optional<std::string> LobbyManager::generateCode() {
	if (m_codes.size() >= std::min<std::size_t>(m_options.maxLobbies, MAX_LIVE_LOBBIES)) {
		return {};
	}

	std::uniform_int_distribution<unsigned> distribution(MIN_CODE, MAX_CODE);
	auto code = std::to_string(distribution(m_rng));
	while (m_codes.contains(code)) {
		code = std::to_string(distribution(m_rng));
	}
	return code;
}

void LobbyManager::removeFromMatch(LobbyEntry& entry, const UserId& userId) {
	if (!entry.match || entry.lobby.status != LobbyStatus::Playing) {
		return;
	}

	const auto state = entry.match->removePlayer(userId);
	if (state.status == MatchStatus::Completed) {
		entry.lobby.status = LobbyStatus::Finished;
	}
}

void LobbyManager::erase(LobbyEntry& entry) {
	entry.deleted = true;
	{
		std::lock_guard<std::mutex> lock(m_registryMutex);
		m_lobbies.erase(entry.lobby.id);
		m_codes.erase(entry.lobby.code);
		if (entry.lobby.matchId) {
			m_matches.erase(*entry.lobby.matchId);
		}
	}

	Logger().Log(Logging::LogLevel::Info, std::format("[LobbyManager] Lobby {} deleted.", entry.lobby.id));
	m_eventHub.signalLobbyDeleted(entry.lobby);
}

void LobbyManager::touch(LobbyEntry& entry) {
	entry.updatedAt = std::chrono::steady_clock::now();
}

void LobbyManager::verify(const Lobby& lobby) const {
	const auto hosts = std::ranges::count_if(lobby.players, &LobbyPlayer::isHost);
	if (hosts != 1 || !lobby.findPlayer(lobby.hostId) || !lobby.findPlayer(lobby.hostId)->isHost) {
		raiseInvariantViolation("LobbyManager", "lobby must have exactly one host who is a member", lobby);
	}
	if (lobby.players.size() > lobby.maxPlayers) {
		raiseInvariantViolation("LobbyManager", "lobby holds more players than allowed", lobby);
	}
}

void LobbyManager::finishLobby(const LobbyId& lobbyId) {
	const auto entry = findEntry(lobbyId);
	if (!entry) {
		return;
	}
	std::lock_guard<std::mutex> entryLock(entry->mutex);
	if (entry->deleted || entry->lobby.status != LobbyStatus::Playing) {
		return;
	}

	entry->lobby.status = LobbyStatus::Finished;
	touch(*entry);
	m_eventHub.signalLobbyUpdated(entry->lobby);
}

} // namespace wordgrid
