#pragma once

#include "peer_message.hpp"
#include "piece.hpp"
#include "utils.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <span>
#include <string>
#include <utility>
#include <variant>
#include <vector>

enum class SessionState {
	CONNECTING,
	HANDSHAKING,
	READY,
	CLOSED,
	ERRORED,
};

enum class RetireReason {
	PROTOCOL_VIOLATION,
	TRANSPORT_FAILURE,
	TIMEOUT,
	IDLE,
	CANCELLED,
};

[[nodiscard]] const char *to_string(SessionState state);
[[nodiscard]] const char *to_string(RetireReason reason);

struct SessionTimeouts {
	std::chrono::milliseconds handshake{ 20000 };
	std::chrono::milliseconds idle{ 120000 };
	std::chrono::milliseconds keepalive{ 90000 };
	std::chrono::milliseconds request{ 30000 };
};

namespace session
{

using Clock = std::chrono::steady_clock;

// events fed into a session

struct Connected {};
struct ConnectFailed {
	std::string reason;
};
struct BytesReceived {
	std::span<const uint8_t> bytes;
};
struct Tick {};
struct SendRequest {
	BlockInfo block;
};
struct SendCancel {
	BlockInfo block;
};
/**
 * @brief Ends the session from our side
 *
 * CANCELLED and IDLE close it normally, any other reason marks it ERRORED.
 */
struct Close {
	RetireReason reason = RetireReason::CANCELLED;
	std::string detail = "closed by us";
};

using Event =
	std::variant<Connected, ConnectFailed, BytesReceived, Tick, SendRequest, SendCancel, Close>;

// actions the owner of the session must carry out

struct Send {
	std::unique_ptr<message::Message> message;
};
struct BlockArrived {
	message::Piece piece;
};
struct RequestTimedOut {
	BlockInfo block;
};
struct PeerHas {
	uint32_t index;
};
// the peer's whole bitfield arrived, see PeerSession::peer_bitfield()
struct PeerBitfield {};
struct Retire {
	RetireReason reason;
	std::string detail;
};

using Action = std::variant<Send, BlockArrived, RequestTimedOut, PeerHas, PeerBitfield, Retire>;

} // namespace session

/**
 * @brief Peer wire protocol state machine for one connection
 *
 * The session doesn't own a socket. Its owner feeds it events (connection
 * established, bytes received, timer ticks, commands) and carries out the
 * actions it returns (send a message, report a block, retire the session).
 * This keeps the whole protocol testable without a network.
 *
 * CONNECTING -> HANDSHAKING -> READY -> CLOSED, and ERRORED from any
 * non-terminal state. Terminal states ignore every further event.
 */
class PeerSession {
public:
	using BitfieldSource = std::function<message::Bitfield()>;

private:
	struct InFlight {
		uint32_t length;
		session::Clock::time_point requested_at;
	};

	SessionState m_state = SessionState::CONNECTING;

	utils::Sha1Digest m_info_hash;
	utils::PeerId m_our_id;
	size_t m_pieces;
	BitfieldSource m_bitfield_source;
	SessionTimeouts m_timeouts;

	message::FrameReader m_reader;
	message::Bitfield m_peer_bitfield;
	utils::PeerId m_peer_id{};

	bool m_peer_choking = true;
	bool m_peer_interested = false;
	bool m_am_interested = false;
	bool m_first_message = true;

	std::map<std::pair<uint32_t, uint32_t>, InFlight> m_in_flight;

	session::Clock::time_point m_state_since;
	session::Clock::time_point m_last_received;
	session::Clock::time_point m_last_sent;

	using Actions = std::vector<session::Action>;

	void on_connected(Actions &out, session::Clock::time_point now);
	void on_bytes(std::span<const uint8_t> bytes, Actions &out, session::Clock::time_point now);
	void on_tick(Actions &out, session::Clock::time_point now);
	void on_request(const BlockInfo &block, Actions &out, session::Clock::time_point now);
	void on_cancel(const BlockInfo &block, Actions &out, session::Clock::time_point now);

	void on_handshake(std::span<const uint8_t> frame, Actions &out,
			  session::Clock::time_point now);
	void on_message(message::Inbound &&msg, Actions &out);

	void send(std::unique_ptr<message::Message> message, Actions &out,
		  session::Clock::time_point now);
	void drop_in_flight(Actions &out);
	void retire(SessionState state, RetireReason reason, std::string detail, Actions &out);

public:
	PeerSession(const utils::Sha1Digest &info_hash, const utils::PeerId &our_id, size_t pieces,
		    BitfieldSource bitfield_source, SessionTimeouts timeouts,
		    session::Clock::time_point now);

	/**
	 * @brief Feeds one event into the state machine
	 *
	 * @return the actions to carry out, in order
	 */
	[[nodiscard]] std::vector<session::Action> handle(session::Event event,
							  session::Clock::time_point now);

	[[nodiscard]] SessionState state() const;
	[[nodiscard]] bool is_terminal() const;
	[[nodiscard]] bool is_peer_choking() const;
	[[nodiscard]] bool is_peer_interested() const;
	/**
	 * @brief READY and unchoked, so requests will be served
	 */
	[[nodiscard]] bool can_request() const;
	[[nodiscard]] size_t in_flight() const;
	[[nodiscard]] bool is_requested(uint32_t piece, uint32_t offset) const;

	[[nodiscard]] const message::Bitfield &peer_bitfield() const;
	[[nodiscard]] const utils::PeerId &peer_id() const;
};
