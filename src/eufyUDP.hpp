/*
 *	Client interface for Eufy Security device access
 *
 *	This is the base UDP communication class for relay lookups and device
 *	sessions. Every instance owns exactly one non-blocking datagram socket.
 *
 *	Functions:
 *	 - open(bind_address, port)
 *		Creates the socket and binds it (port 0 selects an ephemeral port)
 *		Returns true|false indicating success or failure
 *	 - connectTo(address)
 *		Sets the default peer, which also fixes the local interface address
 *		Returns true|false indicating success or failure
 *	 - enableBroadcast()
 *		Allows sending to broadcast addresses
 *		Returns true|false indicating success or failure
 *	 - send(buffer[], size) / sendTo(buffer[], size, address)
 *		Sends one datagram to the default peer or to `address`
 *		Returns `size` on success or -1 if an error occurred
 *	 - receive(buffer[], maxsize, from, timeout_ms)
 *		Reads one datagram, waiting at most `timeout_ms` (0 means don't wait)
 *		Returns number of bytes received or -1 if nothing was read
 *	 - getLocalAddress(address)
 *		Reports the address the socket is bound to
 *	 - disconnect()
 *		Closes the socket, may be called any number of times
 *	 - getlasterror()
 *		Use this instead of referencing `errno`, which may be polluted
 *		Returns the last error state of the socket
 *
 *
 *	Copyright 2026 - eufypp contributors
 *
 *	Licensed under GNU General Public License 3.0 or later.
 *	Some rights reserved. See COPYING, AUTHORS.
 *
 *	@license GPL-3.0+
 */

#ifndef _eufyUDP
#define _eufyUDP

#include <string>
#include <cstdint>


namespace Eufy {
  namespace UDP {
    namespace Socket {
      enum value {
        NO_SUCH_HOST,
        NO_SOCK_AVAIL,
        FAILED,
        CLOSED,
        OPEN
      }; // enum value
    }; // namespace Socket
  }; // namespace UDP


struct Address
{
	std::string ip;
	uint16_t port;

	Address() : port(0) {}
	Address(const std::string &szIp, const uint16_t nPort) : ip(szIp), port(nPort) {}

	bool operator==(const Address &other) const { return (ip == other.ip) && (port == other.port); }
	bool operator!=(const Address &other) const { return !(*this == other); }
	std::string toString() const { return ip + ":" + std::to_string(port); }
};

}; // namespace Eufy


class eufyUDP
{

public:
	eufyUDP();
	virtual ~eufyUDP();

	Eufy::UDP::Socket::value getSocketState() const;
	bool isOpen() const;
	int get_fd() const { return m_sockfd; }

	bool open(const std::string &bind_address = "0.0.0.0", const uint16_t port = 0);
	bool connectTo(const Eufy::Address &address);
	bool enableBroadcast();
	int send(const unsigned char* buffer, const int size);
	int sendTo(const unsigned char* buffer, const int size, const Eufy::Address &address);
	int receive(unsigned char* buffer, const int maxsize, Eufy::Address *from = nullptr, const int timeout_ms = 0);
	bool isSocketReadable(const int timeout_ms = 0);
	bool getLocalAddress(Eufy::Address &address);
	int getlasterror() const;
	void disconnect();

protected:
	Eufy::UDP::Socket::value m_socketState;

private:
	int getSocketEvents(short events, int timeout_ms);

	int m_sockfd;
	int m_lasterror;
};

#endif // _eufyUDP
