#pragma once

#include <cstdint>
#include <optional>
#include <string_view>
#include <variant>

namespace wordgrid {

//! Why a request was turned down. Rejections are normal results, not errors.
enum class RejectReason : std::uint8_t {
	NotFound,
	Full,
	AlreadyPlaying,
	NotHost,
	SelfRemoval,
	NotInLobby,
	NotEnoughPlayers,
	PlayersNotReady,
	NotYourTurn,
	MatchCompleted,
	TooFewTiles,
	InvalidPath,
	InvalidWord,
	AlreadyShuffled,
	NotIdentified,
	InvalidRequest,
	NoFreeCode,
	Count //!< Used in serialisation to check when enum changes.
};

struct Rejection {
	RejectReason reason;

	bool operator==(const Rejection&) const = default;
};

//! Either the updated entity or the reason nothing changed.
template <class T>
using Outcome = std::variant<T, Rejection>;

template <class T>
bool isRejected(const Outcome<T>& outcome) {
	return std::holds_alternative<Rejection>(outcome);
}

//! Wire name of a reject reason, e.g. "not_host".
std::string_view toString(RejectReason reason);
std::optional<RejectReason> rejectReasonFromString(std::string_view value);

} // namespace wordgrid
