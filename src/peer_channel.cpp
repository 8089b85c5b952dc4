#include "peer_channel.hpp"

#include <poll.h>

#include <cerrno>
#include <charconv>
#include <cstring>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>
#include <utility>
#include <vector>

// PeerAddress -------------------------------------------------------------------------

std::optional<PeerAddress> PeerAddress::parse(std::string_view text)
{
	const size_t colon = text.rfind(':');
	if (colon == std::string_view::npos || colon == 0 || colon + 1 == text.size())
	{
		return std::nullopt;
	}

	std::string_view host = text.substr(0, colon);
	if (host.front() == '[')
	{
		if (host.size() < 3 || host.back() != ']')
		{
			return std::nullopt;
		}
		host = host.substr(1, host.size() - 2);
	}
	else if (host.find(':') != std::string_view::npos)
	{
		// bare IPv6 addresses are ambiguous
		return std::nullopt;
	}

	const std::string_view port_text = text.substr(colon + 1);
	uint16_t port = 0;
	const auto [ptr, ec] =
		std::from_chars(port_text.data(), port_text.data() + port_text.size(), port);
	if (ec != std::errc() || ptr != port_text.data() + port_text.size() || port == 0)
	{
		return std::nullopt;
	}
	return PeerAddress{ std::string(host), port };
}

std::string PeerAddress::to_string() const
{
	if (host.find(':') != std::string::npos)
	{
		return "[" + host + "]:" + std::to_string(port);
	}
	return host + ":" + std::to_string(port);
}

// StaticPeerSource --------------------------------------------------------------------

StaticPeerSource::StaticPeerSource(std::vector<PeerAddress> peers)
	: m_peers(std::move(peers))
{
}

std::vector<PeerAddress> StaticPeerSource::poll_peers()
{
	return m_peers;
}

// TcpChannel --------------------------------------------------------------------------

TcpChannel::TcpChannel(const PeerAddress &address)
{
	try
	{
		m_client.connect(address.host, std::to_string(address.port));
	}
	catch (const std::runtime_error &e)
	{
		m_error = e.what();
	}
}

ChannelStatus TcpChannel::status()
{
	if (!m_error.empty())
	{
		return ChannelStatus::FAILED;
	}
	if (m_connected)
	{
		return ChannelStatus::CONNECTED;
	}

	struct pollfd pfd = { m_client.get_fd(), POLLOUT, 0 };
	const int rc = ::poll(&pfd, 1, 0);
	if (rc == -1)
	{
		m_error = std::string("poll(): ") + strerror(errno);
		return ChannelStatus::FAILED;
	}
	if (rc == 0)
	{
		return ChannelStatus::CONNECTING;
	}

	if (auto err = m_client.connect_error(); err.has_value())
	{
		m_error = std::move(*err);
		m_client.disconnect();
		return ChannelStatus::FAILED;
	}
	m_connected = true;
	return ChannelStatus::CONNECTED;
}

std::string TcpChannel::error() const
{
	return m_error;
}

long TcpChannel::send(std::span<const uint8_t> bytes)
{
	return m_client.send(bytes);
}

long TcpChannel::recv(std::span<uint8_t> buffer)
{
	return m_client.recv(buffer);
}

int TcpChannel::fd() const
{
	return m_client.get_fd();
}

// TcpConnector ------------------------------------------------------------------------

std::unique_ptr<PeerChannel> TcpConnector::open(const PeerAddress &address)
{
	return std::make_unique<TcpChannel>(address);
}

void TcpConnector::wait(std::span<const Interest> channels, std::chrono::milliseconds timeout)
{
	std::vector<struct pollfd> fds;
	fds.reserve(channels.size());
	for (const auto &interest : channels)
	{
		const int fd = interest.channel->fd();
		if (fd < 0)
		{
			continue;
		}
		const short events = interest.want_write ? (POLLIN | POLLOUT) : POLLIN;
		fds.push_back({ fd, events, 0 });
	}

	if (fds.empty())
	{
		std::this_thread::sleep_for(timeout);
		return;
	}

	const int rc = ::poll(fds.data(), fds.size(), static_cast<int>(timeout.count()));
	if (rc == -1 && errno != EINTR)
	{
		throw std::runtime_error(std::string("poll(): ") + strerror(errno));
	}
}
