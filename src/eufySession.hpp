/*
 *	Client interface for Eufy Security device access
 *
 *	Direct session with a station. A session is bound to one station serial
 *	and one target address, and runs through the states
 *
 *	  UNCONNECTED -> CONNECTING -> CONNECTED -> CLOSED
 *
 *	with CONNECTING dropping straight to CLOSED when the handshake fails. A
 *	closed session is never reopened; create a new instance instead.
 *
 *	The device handshake itself is delegated to an eufyAuthenticator, which
 *	runs the exchange over the session's own socket.
 *
 *	Functions:
 *	 - connect(address)
 *		Opens the socket and authenticates against `address`
 *		Returns true|false indicating connected or not connected
 *		Throws Eufy::AuthenticationError if the device rejected the credentials
 *	 - validFor(serial)
 *		Returns true if this session is connected to station `serial`
 *	 - sendCommandWithInt(channel, command, value)
 *	 - sendCommandWithIntString(channel, command, value)
 *		Sends a command without waiting for an acknowledgement
 *		Returns true|false indicating whether the datagram left the socket
 *	 - close()
 *		Ends the session and releases the socket, may be called repeatedly
 *
 *
 *	Copyright 2026 - eufypp contributors
 *
 *	Licensed under GNU General Public License 3.0 or later.
 *	Some rights reserved. See COPYING, AUTHORS.
 *
 *	@license GPL-3.0+
 */

#ifndef _eufySession
#define _eufySession

// Eufy Command Types
#define EUFY_CMD_SET_DEVS_OSD 1214
#define EUFY_CMD_SET_ARMING 1224
#define EUFY_CMD_SET_FLOODLIGHT_MANUAL_SWITCH 1400

// command header magic
#define EUFY_COMMAND_MAGIC "XZYH"
#define EUFY_COMMAND_HEADER_SIZE 12
#define EUFY_COMMAND_INT_SIZE 12
#define EUFY_COMMAND_STRING_SIZE 128

#include "eufyUDP.hpp"
#include <string>
#include <vector>
#include <cstdint>
#include <ostream>


namespace Eufy {
  namespace Session {
    enum value {
      UNCONNECTED,
      CONNECTING,
      CONNECTED,
      CLOSED
    }; // enum value
  }; // namespace Session
}; // namespace Eufy


class eufyAuthenticator
{
public:
	virtual ~eufyAuthenticator() {}

	// run the device handshake over `transport`; throw Eufy::AuthenticationError on explicit rejection
	virtual bool authenticate(eufyUDP &transport, const Eufy::Address &address, const std::string &dsk_key, const std::string &user_id) = 0;
};


class eufySession : public eufyUDP
{

public:
	eufySession(const std::string &serial, const std::string &p2p_did, const std::string &dsk_key,
	            const std::string &user_id, eufyAuthenticator *authenticator, std::ostream *out = nullptr);
	virtual ~eufySession();

	bool connect(const Eufy::Address &address);
	bool validFor(const std::string &serial) const;

	bool sendCommandWithInt(const int channel, const uint16_t command, const int value);
	bool sendCommandWithIntString(const int channel, const uint16_t command, const int value);

	virtual void close();

	Eufy::Session::value getState() const { return m_state; }
	const std::string &getSerial() const { return m_serial; }
	const std::string &getP2PDID() const { return m_p2p_did; }
	const Eufy::Address &getAddress() const { return m_address; }

	static std::vector<unsigned char> BuildCommandPayload(const uint16_t seqno, const uint16_t command, const int channel,
	                                                      const int value, const std::string *text);

private:
	bool sendCommand(const int channel, const uint16_t command, const int value, const std::string *text);

	Eufy::Session::value m_state;
	std::string m_serial;
	std::string m_p2p_did;
	std::string m_dsk_key;
	std::string m_user_id;
	eufyAuthenticator *m_authenticator;
	Eufy::Address m_address;
	uint16_t m_seqno;
	std::ostream *m_out;
};

#endif // _eufySession
