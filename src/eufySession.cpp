/*
 *	Client interface for Eufy Security device access
 *
 *	Direct session module
 *
 *
 *	Copyright 2026 - eufypp contributors
 *
 *	Licensed under GNU General Public License 3.0 or later.
 *	Some rights reserved. See COPYING, AUTHORS.
 *
 *	@license GPL-3.0+
 */

// DATA payload preamble: marker, channel, sequence number (BE)
#define DATA_MARKER 0xD1
#define DATA_CHANNEL_CONTROL 0x00

#include "eufySession.hpp"
#include "eufyFrame.hpp"
#include "eufyErrors.hpp"
#include <iostream>


eufySession::eufySession(const std::string &serial, const std::string &p2p_did, const std::string &dsk_key,
                         const std::string &user_id, eufyAuthenticator *authenticator, std::ostream *out)
	: m_state(Eufy::Session::UNCONNECTED)
	, m_serial(serial)
	, m_p2p_did(p2p_did)
	, m_dsk_key(dsk_key)
	, m_user_id(user_id)
	, m_authenticator(authenticator)
	, m_seqno(0)
	, m_out(out ? out : &std::cerr)
{
}


eufySession::~eufySession()
{
	close();
}


bool eufySession::connect(const Eufy::Address &address)
{
	if (m_state != Eufy::Session::UNCONNECTED)
	{
		*m_out << "session " << m_serial << ": already used, create a new session to reconnect\n";
		return false;
	}

	m_state = Eufy::Session::CONNECTING;
	m_address = address;

	if (!open() || !connectTo(address))
	{
		*m_out << "session " << m_serial << ": cannot open socket to " << address.toString() << " (" << getlasterror() << ")\n";
		close();
		return false;
	}

	if (!m_authenticator)
	{
		*m_out << "session " << m_serial << ": no authenticator configured\n";
		close();
		return false;
	}

	bool authenticated;
	try
	{
		authenticated = m_authenticator->authenticate(*this, address, m_dsk_key, m_user_id);
	}
	catch (...)
	{
		close();
		throw;
	}

	if (!authenticated)
	{
		*m_out << "session " << m_serial << ": handshake with " << address.toString() << " failed\n";
		close();
		return false;
	}

	m_state = Eufy::Session::CONNECTED;
	*m_out << "session " << m_serial << ": connected to " << address.toString() << "\n";
	return true;
}


bool eufySession::validFor(const std::string &serial) const
{
	return (m_state == Eufy::Session::CONNECTED) && (m_serial == serial);
}


bool eufySession::sendCommandWithInt(const int channel, const uint16_t command, const int value)
{
	return sendCommand(channel, command, value, nullptr);
}


bool eufySession::sendCommandWithIntString(const int channel, const uint16_t command, const int value)
{
	return sendCommand(channel, command, value, &m_user_id);
}


void eufySession::close()
{
	if (m_state == Eufy::Session::CONNECTED)
	{
		std::vector<unsigned char> message = Eufy::EncodeFrame(Eufy::Request::END, std::vector<unsigned char>());
		if (send(message.data(), (int)message.size()) < 0)
			*m_out << "session " << m_serial << ": failed to send END (" << getlasterror() << ")\n";
		*m_out << "session " << m_serial << ": closed\n";
	}

	disconnect();
	m_state = Eufy::Session::CLOSED;
}


std::vector<unsigned char> eufySession::BuildCommandPayload(const uint16_t seqno, const uint16_t command, const int channel,
                                                            const int value, const std::string *text)
{
	std::vector<unsigned char> body;
	body.push_back(value & 0xFF);
	body.push_back((value >> 8) & 0xFF);
	body.push_back((value >> 16) & 0xFF);
	body.push_back((value >> 24) & 0xFF);
	body.insert(body.end(), 4, 0x00);
	body.push_back(channel & 0xFF);
	body.insert(body.end(), 3, 0x00);
	if (text)
	{
		// zero padded, always terminated
		std::string szText = text->substr(0, EUFY_COMMAND_STRING_SIZE - 1);
		body.insert(body.end(), szText.begin(), szText.end());
		body.insert(body.end(), EUFY_COMMAND_STRING_SIZE - szText.length(), 0x00);
	}

	std::vector<unsigned char> payload;
	payload.reserve(4 + EUFY_COMMAND_HEADER_SIZE + body.size());
	payload.push_back(DATA_MARKER);
	payload.push_back(DATA_CHANNEL_CONTROL);
	payload.push_back((seqno & 0xFF00) >> 8);
	payload.push_back(seqno & 0x00FF);

	payload.insert(payload.end(), EUFY_COMMAND_MAGIC, EUFY_COMMAND_MAGIC + 4);
	payload.push_back(command & 0x00FF);
	payload.push_back((command & 0xFF00) >> 8);
	payload.push_back(body.size() & 0x00FF);
	payload.push_back((body.size() & 0xFF00) >> 8);
	payload.insert(payload.end(), 4, 0x00);

	payload.insert(payload.end(), body.begin(), body.end());
	return payload;
}


/* private */ bool eufySession::sendCommand(const int channel, const uint16_t command, const int value, const std::string *text)
{
	if (m_state != Eufy::Session::CONNECTED)
	{
		*m_out << "session " << m_serial << ": command " << command << " dropped, session not connected\n";
		return false;
	}

	std::vector<unsigned char> message = Eufy::EncodeFrame(Eufy::Request::DATA, BuildCommandPayload(m_seqno++, command, channel, value, text));
	int numbytes = send(message.data(), (int)message.size());
	if (numbytes != (int)message.size())
	{
		*m_out << "session " << m_serial << ": failed to send command " << command << " (" << getlasterror() << ")\n";
		return false;
	}

#ifdef DEBUG
	*m_out << "session " << m_serial << ": sent command " << command << " channel=" << channel << " value=" << value << "\n";
#endif
	return true;
}
