#pragma once

#include <bit>
#include <cstddef>
#include <cstdint>

#include <string>

namespace wordgrid::network::core {

using ConnectionId = std::uint32_t; //!< Identifies a connection on network layer.
using Message      = std::string;   //!< One framed payload.

inline constexpr std::uint16_t DEFAULT_PORT = 12345;

//! Largest payload accepted on either side. Full match snapshots have to fit.
inline constexpr std::uint32_t MAX_PAYLOAD_BYTES = 256 * 1024;

//! Every frame is prefixed with its payload size in network byte order.
struct FrameHeader {
	std::uint32_t payloadSize{};
};

constexpr std::uint32_t byteswap32(std::uint32_t value) {
	return ((value & 0x000000FFu) << 24) | ((value & 0x0000FF00u) << 8) | ((value & 0x00FF0000u) >> 8) | ((value & 0xFF000000u) >> 24);
}

constexpr std::uint32_t toNetworkOrder(std::uint32_t value) {
	if constexpr (std::endian::native == std::endian::big) {
		return value;
	}
	return byteswap32(value);
}

constexpr std::uint32_t fromNetworkOrder(std::uint32_t value) {
	return toNetworkOrder(value);
}

} // namespace wordgrid::network::core
