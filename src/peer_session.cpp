#include "peer_session.hpp"

#include "peer_message.hpp"
#include "utils.hpp"

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

const char *to_string(SessionState state)
{
	switch (state)
	{
	case SessionState::CONNECTING:
		return "connecting";
	case SessionState::HANDSHAKING:
		return "handshaking";
	case SessionState::READY:
		return "ready";
	case SessionState::CLOSED:
		return "closed";
	case SessionState::ERRORED:
		return "errored";
	}
	return "unknown";
}

const char *to_string(RetireReason reason)
{
	switch (reason)
	{
	case RetireReason::PROTOCOL_VIOLATION:
		return "protocol violation";
	case RetireReason::TRANSPORT_FAILURE:
		return "transport failure";
	case RetireReason::TIMEOUT:
		return "timeout";
	case RetireReason::IDLE:
		return "idle";
	case RetireReason::CANCELLED:
		return "cancelled";
	}
	return "unknown";
}

PeerSession::PeerSession(const utils::Sha1Digest &info_hash, const utils::PeerId &our_id,
			 size_t pieces, BitfieldSource bitfield_source, SessionTimeouts timeouts,
			 session::Clock::time_point now)
	: m_info_hash(info_hash)
	, m_our_id(our_id)
	, m_pieces(pieces)
	, m_bitfield_source(std::move(bitfield_source))
	, m_timeouts(timeouts)
	, m_peer_bitfield(pieces)
	, m_state_since(now)
	, m_last_received(now)
	, m_last_sent(now)
{
}

std::vector<session::Action> PeerSession::handle(session::Event event,
						 session::Clock::time_point now)
{
	Actions out;
	if (is_terminal())
	{
		return out;
	}

	std::visit(utils::overloaded{
			   [&](const session::Connected &) { on_connected(out, now); },
			   [&](const session::ConnectFailed &ev) {
				   retire(SessionState::ERRORED, RetireReason::TRANSPORT_FAILURE,
					  ev.reason, out);
			   },
			   [&](const session::BytesReceived &ev) { on_bytes(ev.bytes, out, now); },
			   [&](const session::Tick &) { on_tick(out, now); },
			   [&](const session::SendRequest &ev) { on_request(ev.block, out, now); },
			   [&](const session::SendCancel &ev) { on_cancel(ev.block, out, now); },
			   [&](const session::Close &ev) {
				   const bool clean = ev.reason == RetireReason::CANCELLED ||
						      ev.reason == RetireReason::IDLE;
				   retire(clean ? SessionState::CLOSED : SessionState::ERRORED, ev.reason,
					  ev.detail, out);
			   },
		   },
		   event);
	return out;
}

void PeerSession::on_connected(Actions &out, session::Clock::time_point now)
{
	if (m_state != SessionState::CONNECTING)
	{
		return;
	}
	m_state = SessionState::HANDSHAKING;
	m_state_since = now;
	m_last_received = now;
	send(std::make_unique<message::Handshake>(m_info_hash, m_our_id), out, now);
}

void PeerSession::on_bytes(std::span<const uint8_t> bytes, Actions &out,
			   session::Clock::time_point now)
{
	if (m_state == SessionState::CONNECTING)
	{
		retire(SessionState::ERRORED, RetireReason::PROTOCOL_VIOLATION,
		       "data before connection was established", out);
		return;
	}
	m_last_received = now;
	m_reader.feed(bytes);

	while (!is_terminal())
	{
		auto frame = m_reader.next();
		if (!frame)
		{
			retire(SessionState::ERRORED, RetireReason::PROTOCOL_VIOLATION,
			       message::to_string(frame.error()), out);
			return;
		}
		if (!frame->has_value())
		{
			return;
		}

		if (m_state == SessionState::HANDSHAKING)
		{
			on_handshake(**frame, out, now);
			continue;
		}

		auto msg = message::parse(std::move(**frame), m_pieces);
		if (!msg)
		{
			retire(SessionState::ERRORED, RetireReason::PROTOCOL_VIOLATION,
			       message::to_string(msg.error()), out);
			return;
		}
		on_message(std::move(*msg), out);
	}
}

void PeerSession::on_handshake(std::span<const uint8_t> frame, Actions &out,
			       session::Clock::time_point now)
{
	const message::Handshake peer_hs(frame);
	if (!peer_hs.is_valid(m_info_hash))
	{
		retire(SessionState::ERRORED, RetireReason::PROTOCOL_VIOLATION, "invalid handshake",
		       out);
		return;
	}
	const auto peer_id = peer_hs.get_peer_id();
	std::copy(peer_id.begin(), peer_id.end(), m_peer_id.begin());

	m_state = SessionState::READY;
	m_state_since = now;

	message::Bitfield ours = m_bitfield_source ? m_bitfield_source() : message::Bitfield(m_pieces);
	const bool seeding = ours.all();
	if (!ours.none())
	{
		send(std::make_unique<message::Bitfield>(std::move(ours)), out, now);
	}
	if (!seeding)
	{
		m_am_interested = true;
		send(std::make_unique<message::Interested>(), out, now);
	}
}

void PeerSession::on_message(message::Inbound &&msg, Actions &out)
{
	const bool first_message = std::exchange(m_first_message, false);

	std::visit(
		utils::overloaded{
			[](const message::KeepAlive &) {},
			[&](const message::Choke &) {
				m_peer_choking = true;
				// peers discard pending requests when choking
				drop_in_flight(out);
			},
			[&](const message::Unchoke &) { m_peer_choking = false; },
			[&](const message::Interested &) { m_peer_interested = true; },
			[&](const message::NotInterested &) { m_peer_interested = false; },
			[&](const message::Have &have) {
				const uint32_t index = have.get_index();
				if (index >= m_pieces)
				{
					retire(SessionState::ERRORED, RetireReason::PROTOCOL_VIOLATION,
					       "have index out of range", out);
					return;
				}
				if (!m_peer_bitfield.get_index(index))
				{
					m_peer_bitfield.set_index(index, true);
					out.emplace_back(session::PeerHas{ index });
				}
			},
			[&](message::Bitfield &bitfield) {
				if (!first_message)
				{
					retire(SessionState::ERRORED, RetireReason::PROTOCOL_VIOLATION,
					       "bitfield is only allowed right after the handshake", out);
					return;
				}
				m_peer_bitfield = std::move(bitfield);
				out.emplace_back(session::PeerBitfield{});
			},
			// uploading is not supported, so requests and cancels are ignored
			[](const message::Request &) {},
			[](const message::Cancel &) {},
			[](const message::Port &) {},
			[&](message::Piece &piece) {
				const auto it = m_in_flight.find({ piece.get_index(), piece.get_begin() });
				if (it != m_in_flight.end())
				{
					if (it->second.length != piece.get_length())
					{
						retire(SessionState::ERRORED,
						       RetireReason::PROTOCOL_VIOLATION,
						       "block length differs from request", out);
						return;
					}
					m_in_flight.erase(it);
				}
				// late answers to cancelled requests are still reported,
				// the piece manager drops what it doesn't need
				out.emplace_back(session::BlockArrived{ std::move(piece) });
			},
		},
		msg);
}

void PeerSession::on_tick(Actions &out, session::Clock::time_point now)
{
	switch (m_state)
	{
	case SessionState::CONNECTING:
	case SessionState::HANDSHAKING:
		if (now - m_state_since > m_timeouts.handshake)
		{
			retire(SessionState::ERRORED, RetireReason::TIMEOUT,
			       std::string(to_string(m_state)) + " took too long", out);
		}
		return;
	case SessionState::READY:
		break;
	default:
		return;
	}

	if (now - m_last_received > m_timeouts.idle)
	{
		retire(SessionState::CLOSED, RetireReason::IDLE, "no traffic from peer", out);
		return;
	}

	for (auto it = m_in_flight.begin(); it != m_in_flight.end();)
	{
		if (now - it->second.requested_at > m_timeouts.request)
		{
			const BlockInfo block{ it->first.first, it->first.second, it->second.length };
			it = m_in_flight.erase(it);
			// the peer may still be working on it
			send(std::make_unique<message::Cancel>(block.piece, block.offset, block.length),
			     out, now);
			out.emplace_back(session::RequestTimedOut{ block });
		}
		else
		{
			++it;
		}
	}

	if (now - m_last_sent >= m_timeouts.keepalive)
	{
		send(std::make_unique<message::KeepAlive>(), out, now);
	}
}

void PeerSession::on_request(const BlockInfo &block, Actions &out,
			     session::Clock::time_point now)
{
	if (!can_request() || m_in_flight.contains({ block.piece, block.offset }))
	{
		// hand it straight back so it can be assigned elsewhere
		out.emplace_back(session::RequestTimedOut{ block });
		return;
	}
	m_in_flight.emplace(std::make_pair(block.piece, block.offset),
			    InFlight{ block.length, now });
	send(std::make_unique<message::Request>(block.piece, block.offset, block.length), out, now);
}

void PeerSession::on_cancel(const BlockInfo &block, Actions &out, session::Clock::time_point now)
{
	if (m_state != SessionState::READY || m_in_flight.erase({ block.piece, block.offset }) == 0)
	{
		return;
	}
	send(std::make_unique<message::Cancel>(block.piece, block.offset, block.length), out, now);
}

void PeerSession::send(std::unique_ptr<message::Message> message, Actions &out,
		       session::Clock::time_point now)
{
	m_last_sent = now;
	out.emplace_back(session::Send{ std::move(message) });
}

void PeerSession::drop_in_flight(Actions &out)
{
	for (const auto &[key, request] : m_in_flight)
	{
		out.emplace_back(session::RequestTimedOut{ BlockInfo{ key.first, key.second, request.length } });
	}
	m_in_flight.clear();
}

void PeerSession::retire(SessionState state, RetireReason reason, std::string detail, Actions &out)
{
	m_state = state;
	m_in_flight.clear();
	out.emplace_back(session::Retire{ reason, std::move(detail) });
}

SessionState PeerSession::state() const
{
	return m_state;
}

bool PeerSession::is_terminal() const
{
	return m_state == SessionState::CLOSED || m_state == SessionState::ERRORED;
}

bool PeerSession::is_peer_choking() const
{
	return m_peer_choking;
}

bool PeerSession::is_peer_interested() const
{
	return m_peer_interested;
}

bool PeerSession::can_request() const
{
	return m_state == SessionState::READY && !m_peer_choking;
}

size_t PeerSession::in_flight() const
{
	return m_in_flight.size();
}

bool PeerSession::is_requested(uint32_t piece, uint32_t offset) const
{
	return m_in_flight.contains({ piece, offset });
}

const message::Bitfield &PeerSession::peer_bitfield() const
{
	return m_peer_bitfield;
}

const utils::PeerId &PeerSession::peer_id() const
{
	return m_peer_id;
}
