#include "socket.hpp"

#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <fcntl.h>
#include <memory>
#include <netdb.h>
#include <optional>
#include <stdexcept>
#include <string>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>
#include <utility>

TCPClient::TCPClient(const std::string &hostname, const std::string &port)
{
	connect(hostname, port);
}

void TCPClient::connect(const std::string &hostname, const std::string &port)
{
	disconnect();

	int rc = 0;
	struct addrinfo hints {};
	struct addrinfo *res_temp = nullptr;

	hints.ai_family = AF_UNSPEC;
	hints.ai_socktype = SOCK_STREAM;

	rc = getaddrinfo(hostname.c_str(), port.c_str(), &hints, &res_temp);
	if (rc != 0)
	{
		throw std::runtime_error(std::string("getaddrinfo(): ") + gai_strerror(rc));
	}

	const std::unique_ptr<struct addrinfo, decltype(&freeaddrinfo)> res(res_temp, freeaddrinfo);

	std::string last_error = "no usable address";
	for (struct addrinfo *curr = res.get(); curr != nullptr; curr = curr->ai_next)
	{
		const int fd = socket(curr->ai_family, curr->ai_socktype, curr->ai_protocol);
		if (fd == -1)
		{
			last_error = std::string("socket(): ") + strerror(errno);
			continue;
		}

		rc = fcntl(fd, F_SETFL, O_NONBLOCK);
		if (rc == -1)
		{
			last_error = std::string("fcntl(): ") + strerror(errno);
			close(fd);
			continue;
		}

		rc = ::connect(fd, curr->ai_addr, curr->ai_addrlen);
		if (rc == -1 && errno != EINPROGRESS)
		{
			last_error = std::string("connect(): ") + strerror(errno);
			close(fd);
			continue;
		}

		m_socket = fd;
		return;
	}

	throw std::runtime_error(last_error);
}

TCPClient::TCPClient(TCPClient &&other) noexcept
	: m_socket(std::exchange(other.m_socket, -1))
{
}

TCPClient &TCPClient::operator=(TCPClient &&other) noexcept
{
	if (this != &other)
	{
		disconnect();
		m_socket = std::exchange(other.m_socket, -1);
	}

	return *this;
}

std::optional<std::string> TCPClient::connect_error() const
{
	int error = 0;
	socklen_t err_len = sizeof error;
	if (getsockopt(m_socket, SOL_SOCKET, SO_ERROR, &error, &err_len) == -1)
	{
		return std::string("getsockopt(): ") + strerror(errno);
	}
	if (error != 0)
	{
		return std::string("connect(): ") + strerror(error);
	}
	return std::nullopt;
}

long TCPClient::send(const std::span<const uint8_t> buffer) const
{
	const ssize_t n = ::send(m_socket, buffer.data(), buffer.size(), MSG_NOSIGNAL);

	if (n == -1 && (errno == EWOULDBLOCK || errno == EAGAIN))
	{
		return -1;
	}

	if (n == -1)
	{
		throw std::runtime_error(std::string("send(): ") + strerror(errno));
	}

	return n;
}

long TCPClient::recv(const std::span<uint8_t> buffer) const
{
	const ssize_t n = ::recv(m_socket, buffer.data(), buffer.size(), 0);

	if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK))
	{
		return -1;
	}

	if (n < 0)
	{
		throw std::runtime_error(std::string("recv(): ") + strerror(errno));
	}

	return n;
}

int TCPClient::get_fd() const
{
	return m_socket;
}

void TCPClient::disconnect()
{
	if (m_socket >= 0)
	{
		close(m_socket);
		m_socket = -1;
	}
}

TCPClient::~TCPClient()
{
	disconnect();
}
