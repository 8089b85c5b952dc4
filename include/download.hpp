#pragma once

#include "config.hpp"
#include "metainfo_file.hpp"
#include "peer_channel.hpp"
#include "peer_message.hpp"
#include "peer_session.hpp"
#include "piece.hpp"
#include "piece_manager.hpp"
#include "utils.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

enum class DownloadResult {
	COMPLETED,
	STALLED,
	CANCELLED,
};

[[nodiscard]] const char *to_string(DownloadResult result);

/**
 * @brief Drives one download: owns the peer sessions and their channels
 *
 * Sessions are multiplexed on a single thread. Every step flushes and reads the
 * channels, feeds the sessions, carries out their actions, expires stale
 * requests and fills the request pipelines of unchoked peers from the
 * PieceManager. Only cancel() may be called from another thread.
 */
class Download {
public:
	using Clock = std::chrono::steady_clock;

private:
	struct Slot {
		PeerKey key;
		PeerAddress address;
		std::unique_ptr<PeerChannel> channel;
		PeerSession session;
		std::vector<uint8_t> outbound;
		size_t out_offset = 0;
		// what was added to the availability histogram on behalf of this peer
		message::Bitfield mirrored;
	};

	static constexpr size_t m_recv_chunk = 64 * 1024;
	// upper bound for reads from one peer per step, so a fast peer can't starve the others
	static constexpr size_t m_max_reads_per_step = 16;
	static constexpr std::chrono::milliseconds m_poll_timeout{ 1000 };

	TorrentDescriptor m_descriptor;
	PieceManager &m_pieces;
	PeerSource &m_source;
	Connector &m_connector;
	config::Settings m_settings;
	utils::PeerId m_peer_id = utils::generate_peer_id();

	std::vector<std::unique_ptr<Slot>> m_slots;
	std::deque<PeerAddress> m_peer_backlog;
	// every address ever seen: queued, in use, failed or banned, none is retried
	std::set<PeerAddress> m_known_peers;
	std::set<PeerAddress> m_banned_peers;
	PeerKey m_next_key = 1;

	std::atomic<bool> m_cancelled = false;
	std::optional<Clock::time_point> m_last_discovery;
	std::optional<Clock::time_point> m_last_supply;

	[[nodiscard]] bool verbose(config::LogLevel level) const;
	[[nodiscard]] SessionTimeouts session_timeouts() const;
	[[nodiscard]] Slot *find_slot(PeerKey key);

	void discover_peers(Clock::time_point now);
	void connect_to_peers(Clock::time_point now);

	void feed(Slot &slot, session::Event event, Clock::time_point now);
	void dispatch(Slot &slot, std::vector<session::Action> &&actions, Clock::time_point now);
	void on_block(Slot &slot, message::Piece &&piece, Clock::time_point now);
	void punish(PeerKey key, Clock::time_point now);

	void proceed_peer(Slot &slot, Clock::time_point now);
	void flush(Slot &slot, Clock::time_point now);
	void expire_requests(Clock::time_point now);
	void fill_pipeline(Slot &slot, Clock::time_point now);
	void remove_finished_sessions();
	void close_all(Clock::time_point now);

	[[nodiscard]] bool supply_possible() const;

public:
	/**
	 * @brief Everything passed by reference must outlive the download
	 *
	 * @throws std::invalid_argument if max_peers or pipeline_depth is 0
	 */
	Download(const TorrentDescriptor &descriptor, PieceManager &pieces, PeerSource &source,
		 Connector &connector, config::Settings settings);

	Download(const Download &) = delete;
	Download &operator=(const Download &) = delete;

	/**
	 * @brief One round of the loop, never blocks
	 *
	 * @return the result once the download is over, std::nullopt otherwise
	 */
	[[nodiscard]] std::optional<DownloadResult> step(Clock::time_point now);

	/**
	 * @brief Runs step() until the download is over, waiting on the connector in between
	 */
	[[nodiscard]] DownloadResult run();

	/**
	 * @brief Makes run() return CANCELLED, safe to call from any thread
	 */
	void cancel();

	[[nodiscard]] size_t active_sessions() const;
	[[nodiscard]] size_t backlog_size() const;
	[[nodiscard]] bool is_banned(const PeerAddress &address) const;
	[[nodiscard]] const utils::PeerId &peer_id() const;
};
