/*
 *	Client interface for Eufy Security device access
 *
 *	This is the base UDP communication class for relay lookups and device
 *	sessions. Every instance owns exactly one non-blocking datagram socket.
 *
 *
 *	Copyright 2026 - eufypp contributors
 *
 *	Licensed under GNU General Public License 3.0 or later.
 *	Some rights reserved. See COPYING, AUTHORS.
 *
 *	@license GPL-3.0+
 */

#include "eufyUDP.hpp"
#include <unistd.h>
#include <cstring>
#include <netdb.h>
#include <sys/socket.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <errno.h>
#include <fcntl.h>
#include <poll.h>

#ifdef DEBUG
#include <iostream>
#endif


/* local */ static bool resolve_address(const Eufy::Address &address, struct sockaddr_in &serv_addr)
{
	memset(&serv_addr, 0, sizeof(serv_addr));
	serv_addr.sin_family = AF_INET;
	serv_addr.sin_port = htons(address.port);

	if (address.ip.empty())
		return false;

	if ((address.ip[0] ^ 0x30) < 10)
		return (inet_pton(AF_INET, address.ip.c_str(), &serv_addr.sin_addr) == 1);

	struct addrinfo hints;
	memset(&hints, 0, sizeof(hints));
	hints.ai_family = AF_INET;
	hints.ai_socktype = SOCK_DGRAM;
	struct addrinfo *result;
	if (getaddrinfo(address.ip.c_str(), nullptr, &hints, &result) != 0)
		return false;
	serv_addr.sin_addr = ((struct sockaddr_in *)result->ai_addr)->sin_addr;
	freeaddrinfo(result);
	return true;
}


/* local */ static void to_address(const struct sockaddr_in &sock_addr, Eufy::Address &address)
{
	char cAddress[INET_ADDRSTRLEN];
	if (inet_ntop(AF_INET, &sock_addr.sin_addr, cAddress, sizeof(cAddress)) != nullptr)
		address.ip = cAddress;
	else
		address.ip.clear();
	address.port = ntohs(sock_addr.sin_port);
}


eufyUDP::eufyUDP()
{
	m_sockfd = -1;
	m_lasterror = 0;
	m_socketState = Eufy::UDP::Socket::CLOSED;
}


eufyUDP::~eufyUDP()
{
	disconnect();
}


Eufy::UDP::Socket::value eufyUDP::getSocketState() const
{
	return m_socketState;
}


bool eufyUDP::isOpen() const
{
	return (m_sockfd >= 0) && (m_socketState == Eufy::UDP::Socket::OPEN);
}


bool eufyUDP::open(const std::string &bind_address, const uint16_t port)
{
	if (m_sockfd >= 0)
		disconnect();

	struct sockaddr_in bind_addr;
	if (!resolve_address(Eufy::Address(bind_address, port), bind_addr))
	{
		m_socketState = Eufy::UDP::Socket::NO_SUCH_HOST;
		return false;
	}

	m_sockfd = socket(AF_INET, SOCK_DGRAM, 0);
	if (m_sockfd < 0)
	{
		m_lasterror = errno;
		m_socketState = Eufy::UDP::Socket::NO_SOCK_AVAIL;
		return false;
	}

	// set nonblocking mode
	int sockopts = fcntl(m_sockfd, F_GETFL, 0);
	if ((sockopts == -1) || (fcntl(m_sockfd, F_SETFL, sockopts | O_NONBLOCK) == -1))
	{
		m_lasterror = errno;
		disconnect();
		m_socketState = Eufy::UDP::Socket::FAILED;
		return false;
	}

	if (bind(m_sockfd, (const sockaddr*)&bind_addr, sizeof(bind_addr)) != 0)
	{
		m_lasterror = errno;
#ifdef DEBUG
		std::cout << "{\"msg\":\"" << strerror(m_lasterror) << "\",\"code\":" << m_lasterror << "}\n";
#endif
		disconnect();
		m_socketState = Eufy::UDP::Socket::FAILED;
		return false;
	}

	m_lasterror = 0;
	m_socketState = Eufy::UDP::Socket::OPEN;
	return true;
}


bool eufyUDP::connectTo(const Eufy::Address &address)
{
	if (m_sockfd < 0)
		return false;

	struct sockaddr_in serv_addr;
	if (!resolve_address(address, serv_addr))
	{
		m_socketState = Eufy::UDP::Socket::NO_SUCH_HOST;
		return false;
	}

	if (connect(m_sockfd, (const sockaddr*)&serv_addr, sizeof(serv_addr)) != 0)
	{
		m_lasterror = errno;
		return false;
	}
	return true;
}


bool eufyUDP::enableBroadcast()
{
	if (m_sockfd < 0)
		return false;

	int set = 1;
	if (setsockopt(m_sockfd, SOL_SOCKET, SO_BROADCAST, &set, sizeof(set)) != 0)
	{
		m_lasterror = errno;
		return false;
	}
	return true;
}


int eufyUDP::send(const unsigned char* buffer, const int size)
{
	if (m_sockfd < 0)
		return -1;

	int numbytes = (int)::send(m_sockfd, buffer, size, 0);
	if (numbytes < 0)
		m_lasterror = errno;
	return numbytes;
}


int eufyUDP::sendTo(const unsigned char* buffer, const int size, const Eufy::Address &address)
{
	if (m_sockfd < 0)
		return -1;

	struct sockaddr_in serv_addr;
	if (!resolve_address(address, serv_addr))
	{
		m_lasterror = EDESTADDRREQ;
		return -1;
	}

	int numbytes = (int)sendto(m_sockfd, buffer, size, 0, (const sockaddr*)&serv_addr, sizeof(serv_addr));
	if (numbytes < 0)
		m_lasterror = errno;
	return numbytes;
}


int eufyUDP::receive(unsigned char* buffer, const int maxsize, Eufy::Address *from, const int timeout_ms)
{
	m_lasterror = EAGAIN;
	if (m_sockfd < 0)
		return -1;

	if (getSocketEvents(POLLIN, timeout_ms) != 0)
		return -1;

	struct sockaddr_in peer_addr;
	socklen_t peer_len = sizeof(peer_addr);
	memset(&peer_addr, 0, sizeof(peer_addr));
	int numbytes = (int)recvfrom(m_sockfd, buffer, maxsize, 0, (sockaddr*)&peer_addr, &peer_len);
	if (numbytes < 0)
	{
		m_lasterror = errno;
		return -1;
	}

	m_lasterror = 0;
	if (from)
		to_address(peer_addr, *from);
	return numbytes;
}


bool eufyUDP::isSocketReadable(const int timeout_ms)
{
	return (getSocketEvents(POLLIN, timeout_ms) == 0);
}


bool eufyUDP::getLocalAddress(Eufy::Address &address)
{
	if (m_sockfd < 0)
		return false;

	struct sockaddr_in local_addr;
	socklen_t local_len = sizeof(local_addr);
	if (getsockname(m_sockfd, (sockaddr*)&local_addr, &local_len) != 0)
	{
		m_lasterror = errno;
		return false;
	}
	to_address(local_addr, address);
	return true;
}


int eufyUDP::getlasterror() const
{
	return m_lasterror;
}


void eufyUDP::disconnect()
{
	if (m_sockfd >= 0)
		close(m_sockfd);
	m_sockfd = -1;
	m_socketState = Eufy::UDP::Socket::CLOSED;
}


/* private */ int eufyUDP::getSocketEvents(short events, int timeout_ms)
{
	struct pollfd fds;
	fds.fd = m_sockfd;
	fds.events = events;
	fds.revents = 0;
	int result = poll(&fds, 1, timeout_ms);
	if (result > 0)
	{
		if (fds.revents & (POLLERR | POLLNVAL))
		{
			// try to get socket error
			int sockerr = 0;
			socklen_t len = sizeof sockerr;
			if (getsockopt(m_sockfd, SOL_SOCKET, SO_ERROR, (char *)&sockerr, &len) >= 0)
			{
				if (sockerr > 0)
					m_lasterror = sockerr;
			}
			return m_lasterror;
		}
		else if (fds.revents & events)
		{
			m_lasterror = 0;
			return m_lasterror;
		}
	}
	else if (result < 0)
	{
		m_lasterror = errno;
		m_socketState = Eufy::UDP::Socket::FAILED;
	}
	return -1;
}
