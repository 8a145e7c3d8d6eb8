#include "core/outcome.hpp"

#include <array>
#include <utility>

namespace wordgrid {

static constexpr std::array<std::pair<RejectReason, std::string_view>, static_cast<std::size_t>(RejectReason::Count)> REASON_NAMES{{
        {RejectReason::NotFound, "not_found"},
        {RejectReason::Full, "full"},
        {RejectReason::AlreadyPlaying, "already_playing"},
        {RejectReason::NotHost, "not_host"},
        {RejectReason::SelfRemoval, "self_removal"},
        {RejectReason::NotInLobby, "not_in_lobby"},
        {RejectReason::NotEnoughPlayers, "not_enough_players"},
        {RejectReason::PlayersNotReady, "players_not_ready"},
        {RejectReason::NotYourTurn, "not_your_turn"},
        {RejectReason::MatchCompleted, "match_completed"},
        {RejectReason::TooFewTiles, "too_few_tiles"},
        {RejectReason::InvalidPath, "invalid_path"},
        {RejectReason::InvalidWord, "invalid_word"},
        {RejectReason::AlreadyShuffled, "already_shuffled"},
        {RejectReason::NotIdentified, "not_identified"},
        {RejectReason::InvalidRequest, "invalid_request"},
        {RejectReason::NoFreeCode, "no_free_code"},
}};

std::string_view toString(RejectReason reason) {
	for (const auto& [value, name]: REASON_NAMES) {
		if (value == reason) {
			return name;
		}
	}
	return "unknown";
}

std::optional<RejectReason> rejectReasonFromString(std::string_view value) {
	for (const auto& [reason, name]: REASON_NAMES) {
		if (name == value) {
			return reason;
		}
	}
	return {};
}

} // namespace wordgrid
