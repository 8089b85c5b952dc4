#include "download.hpp"

#include "config.hpp"
#include "peer_channel.hpp"
#include "peer_message.hpp"
#include "peer_session.hpp"
#include "piece_manager.hpp"
#include "utils.hpp"

#include <algorithm>
#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <memory>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>
#include <vector>

const char *to_string(DownloadResult result)
{
	switch (result)
	{
	case DownloadResult::COMPLETED:
		return "completed";
	case DownloadResult::STALLED:
		return "stalled";
	case DownloadResult::CANCELLED:
		return "cancelled";
	}
	return "unknown";
}

Download::Download(const TorrentDescriptor &descriptor, PieceManager &pieces, PeerSource &source,
		   Connector &connector, config::Settings settings)
	: m_descriptor(descriptor)
	, m_pieces(pieces)
	, m_source(source)
	, m_connector(connector)
	, m_settings(settings)
{
	if (m_settings.max_peers == 0 || m_settings.pipeline_depth == 0)
	{
		throw std::invalid_argument("max_peers and pipeline_depth must be at least 1");
	}
}

bool Download::verbose(config::LogLevel level) const
{
	return static_cast<int>(m_settings.log_level) >= static_cast<int>(level);
}

SessionTimeouts Download::session_timeouts() const
{
	SessionTimeouts ret;
	ret.handshake = m_settings.handshake_timeout;
	ret.idle = m_settings.idle_timeout;
	ret.keepalive = m_settings.keepalive_interval;
	ret.request = m_settings.request_timeout;
	return ret;
}

Download::Slot *Download::find_slot(const PeerKey key)
{
	const auto it = std::find_if(m_slots.begin(), m_slots.end(),
				     [key](const auto &slot) { return slot->key == key; });
	return it == m_slots.end() ? nullptr : it->get();
}

// peers -------------------------------------------------------------------------------

void Download::discover_peers(const Clock::time_point now)
{
	if (m_last_discovery.has_value() && now - *m_last_discovery < m_settings.discovery_interval)
	{
		return;
	}
	m_last_discovery = now;

	for (auto &address : m_source.poll_peers())
	{
		if (m_known_peers.insert(address).second)
		{
			m_peer_backlog.push_back(std::move(address));
		}
	}
}

void Download::connect_to_peers(const Clock::time_point now)
{
	while (m_slots.size() < m_settings.max_peers && !m_peer_backlog.empty())
	{
		PeerAddress address = std::move(m_peer_backlog.front());
		m_peer_backlog.pop_front();

		const PeerKey key = m_next_key++;
		auto channel = m_connector.open(address);
		if (verbose(config::LogLevel::DEBUG))
		{
			std::clog << "Connecting to " << address.to_string() << '\n';
		}

		PeerSession session(
			m_descriptor.info_hash, m_peer_id, m_descriptor.number_of_pieces(),
			[this]() { return m_pieces.completed_bitfield(); }, session_timeouts(), now);

		m_slots.push_back(std::make_unique<Slot>(
			Slot{ key, std::move(address), std::move(channel), std::move(session), {}, 0,
			      message::Bitfield(m_descriptor.number_of_pieces()) }));
	}
}

// sessions ----------------------------------------------------------------------------

void Download::feed(Slot &slot, session::Event event, const Clock::time_point now)
{
	dispatch(slot, slot.session.handle(std::move(event), now), now);
}

void Download::dispatch(Slot &slot, std::vector<session::Action> &&actions,
			const Clock::time_point now)
{
	for (auto &action : actions)
	{
		std::visit(
			utils::overloaded{
				[&](session::Send &send) {
					const auto bytes = send.message->serialized();
					slot.outbound.insert(slot.outbound.end(), bytes.begin(),
							     bytes.end());
				},
				[&](session::BlockArrived &arrived) {
					on_block(slot, std::move(arrived.piece), now);
				},
				[&](session::RequestTimedOut &timed_out) {
					m_pieces.report_request_timed_out(slot.key,
									  timed_out.block.piece,
									  timed_out.block.offset, now);
				},
				[&](session::PeerHas &has) {
					if (!slot.mirrored.get_index(has.index))
					{
						slot.mirrored.set_index(has.index, true);
						m_pieces.add_peer_have(has.index);
					}
				},
				[&](session::PeerBitfield &) {
					m_pieces.remove_peer_availability(slot.mirrored);
					slot.mirrored = slot.session.peer_bitfield();
					m_pieces.add_peer_availability(slot.mirrored);
				},
				[&](session::Retire &retire) {
					if (retire.reason == RetireReason::PROTOCOL_VIOLATION)
					{
						m_banned_peers.insert(slot.address);
					}
					if (verbose(config::LogLevel::INFO))
					{
						std::clog << "Peer " << slot.address.to_string()
							  << " disconnected due to: " << to_string(retire.reason)
							  << " (" << retire.detail << ")" << '\n';
					}
				},
			},
			action);
	}
}

void Download::on_block(Slot &slot, message::Piece &&piece, const Clock::time_point now)
{
	const uint32_t index = piece.get_index();
	const uint32_t begin = piece.get_begin();
	const auto report = m_pieces.report_block_received(slot.key, index, begin, piece.get_data());
	if (!report)
	{
		feed(slot,
		     session::Close{ RetireReason::PROTOCOL_VIOLATION,
				     std::string("block rejected: ") + to_string(report.error()) },
		     now);
		return;
	}

	for (const PeerKey other : report->cancel_peers)
	{
		if (Slot *holder = find_slot(other); holder != nullptr)
		{
			feed(*holder, session::SendCancel{ BlockInfo{ index, begin, piece.get_length() } },
			     now);
		}
	}

	if (report->piece_completed.has_value() && verbose(config::LogLevel::INFO))
	{
		std::clog << "Piece " << index << " was received (" << m_pieces.completed_pieces()
			  << "/" << m_descriptor.number_of_pieces() << ", " << std::fixed
			  << std::setprecision(1) << m_pieces.progress() * 100 << "%)" << '\n';
	}

	for (const PeerKey blamed : report->blamed_peers)
	{
		punish(blamed, now);
	}
}

void Download::punish(const PeerKey key, const Clock::time_point now)
{
	if (m_pieces.hash_failures(key) < m_settings.max_hash_failures)
	{
		return;
	}
	Slot *slot = find_slot(key);
	if (slot == nullptr)
	{
		return;
	}
	m_banned_peers.insert(slot->address);
	feed(*slot, session::Close{ RetireReason::PROTOCOL_VIOLATION, "too many hash failures" },
	     now);
}

// i/o ---------------------------------------------------------------------------------

void Download::flush(Slot &slot, const Clock::time_point now)
{
	try
	{
		while (slot.out_offset < slot.outbound.size())
		{
			const std::span<const uint8_t> pending(slot.outbound.data() + slot.out_offset,
							       slot.outbound.size() - slot.out_offset);
			const long n = slot.channel->send(pending);
			if (n < 0)
			{
				return;
			}
			slot.out_offset += static_cast<size_t>(n);
		}
		slot.outbound.clear();
		slot.out_offset = 0;
	}
	catch (const std::runtime_error &e)
	{
		feed(slot, session::ConnectFailed{ e.what() }, now);
	}
}

void Download::proceed_peer(Slot &slot, const Clock::time_point now)
{
	if (slot.session.state() == SessionState::CONNECTING)
	{
		switch (slot.channel->status())
		{
		case ChannelStatus::CONNECTING:
			return;
		case ChannelStatus::FAILED:
			feed(slot, session::ConnectFailed{ slot.channel->error() }, now);
			return;
		case ChannelStatus::CONNECTED:
			feed(slot, session::Connected{}, now);
			break;
		}
	}

	flush(slot, now);

	std::array<uint8_t, m_recv_chunk> buffer{};
	for (size_t i = 0; i < m_max_reads_per_step && !slot.session.is_terminal(); ++i)
	{
		long n = 0;
		try
		{
			n = slot.channel->recv(buffer);
		}
		catch (const std::runtime_error &e)
		{
			feed(slot, session::ConnectFailed{ e.what() }, now);
			return;
		}
		if (n < 0)
		{
			break;
		}
		if (n == 0)
		{
			feed(slot, session::ConnectFailed{ "connection closed by peer" }, now);
			return;
		}
		feed(slot,
		     session::BytesReceived{ std::span<const uint8_t>(buffer.data(),
								      static_cast<size_t>(n)) },
		     now);
	}
}

void Download::expire_requests(const Clock::time_point now)
{
	for (const auto &expired : m_pieces.expired_requests(now))
	{
		m_pieces.report_request_timed_out(expired.peer, expired.block.piece,
						  expired.block.offset, now);
		if (Slot *slot = find_slot(expired.peer); slot != nullptr)
		{
			feed(*slot, session::SendCancel{ expired.block }, now);
		}
	}
}

void Download::fill_pipeline(Slot &slot, const Clock::time_point now)
{
	while (slot.session.can_request() && slot.session.in_flight() < m_settings.pipeline_depth)
	{
		const auto assignment =
			m_pieces.next_block_to_request(slot.key, slot.session.peer_bitfield(), now);
		if (!assignment.has_value())
		{
			return;
		}
		feed(slot, session::SendRequest{ assignment->block }, now);
	}
}

void Download::remove_finished_sessions()
{
	std::erase_if(m_slots, [this](const std::unique_ptr<Slot> &slot) {
		if (!slot->session.is_terminal())
		{
			return false;
		}
		m_pieces.release_all_for(slot->key);
		m_pieces.remove_peer_availability(slot->mirrored);
		return true;
	});
}

void Download::close_all(const Clock::time_point now)
{
	for (auto &slot : m_slots)
	{
		feed(*slot, session::Close{}, now);
		// the cancel messages are best effort
		flush(*slot, now);
	}
	remove_finished_sessions();
}

bool Download::supply_possible() const
{
	if (!m_peer_backlog.empty())
	{
		return true;
	}
	return std::any_of(m_slots.begin(), m_slots.end(), [this](const auto &slot) {
		// availability of peers that aren't ready yet is unknown, give them a chance
		return slot->session.state() != SessionState::READY ||
		       m_pieces.can_supply(slot->session.peer_bitfield());
	});
}

// loop --------------------------------------------------------------------------------

std::optional<DownloadResult> Download::step(const Clock::time_point now)
{
	if (m_cancelled.load())
	{
		close_all(now);
		return DownloadResult::CANCELLED;
	}
	if (m_pieces.is_complete())
	{
		close_all(now);
		return DownloadResult::COMPLETED;
	}

	discover_peers(now);
	connect_to_peers(now);

	// slots can't be added while iterating, removal happens after the loop
	for (size_t i = 0; i < m_slots.size(); ++i)
	{
		Slot &slot = *m_slots[i];
		if (!slot.session.is_terminal())
		{
			proceed_peer(slot, now);
		}
		if (!slot.session.is_terminal())
		{
			feed(slot, session::Tick{}, now);
		}
	}

	expire_requests(now);

	for (auto &slot : m_slots)
	{
		if (!slot->session.is_terminal())
		{
			fill_pipeline(*slot, now);
			flush(*slot, now);
		}
	}

	remove_finished_sessions();

	if (m_pieces.is_complete())
	{
		close_all(now);
		return DownloadResult::COMPLETED;
	}

	if (!m_last_supply.has_value() || supply_possible())
	{
		m_last_supply = now;
	}
	else if (now - *m_last_supply >= m_settings.stall_timeout)
	{
		std::cerr << "Download is stalled, no peer can supply the missing pieces" << '\n';
		close_all(now);
		return DownloadResult::STALLED;
	}
	return std::nullopt;
}

DownloadResult Download::run()
{
	while (true)
	{
		if (const auto result = step(Clock::now()); result.has_value())
		{
			return *result;
		}

		std::vector<Connector::Interest> interests;
		interests.reserve(m_slots.size());
		for (const auto &slot : m_slots)
		{
			const bool want_write = slot->session.state() == SessionState::CONNECTING ||
						slot->out_offset < slot->outbound.size();
			interests.push_back({ slot->channel.get(), want_write });
		}
		m_connector.wait(interests, m_poll_timeout);
	}
}

void Download::cancel()
{
	m_cancelled.store(true);
}

size_t Download::active_sessions() const
{
	return m_slots.size();
}

size_t Download::backlog_size() const
{
	return m_peer_backlog.size();
}

bool Download::is_banned(const PeerAddress &address) const
{
	return m_banned_peers.contains(address);
}

const utils::PeerId &Download::peer_id() const
{
	return m_peer_id;
}
