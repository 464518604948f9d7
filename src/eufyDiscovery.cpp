/*
 *	Client interface for Eufy Security device access
 *
 *	Relay lookup module
 *
 *
 *	Copyright 2026 - eufypp contributors
 *
 *	Licensed under GNU General Public License 3.0 or later.
 *	Some rights reserved. See COPYING, AUTHORS.
 *
 *	@license GPL-3.0+
 */

// LOOKUP_ADDR payload carries a sockaddr: family(2) port(2, LE) address(4, reversed)
#define LOOKUP_ADDR_PORT_OFFSET 2
#define LOOKUP_ADDR_IP_OFFSET 4
#define LOOKUP_ADDR_MIN_SIZE 8

#include "eufyDiscovery.hpp"
#include "eufyErrors.hpp"
#include <cstring>
#include <cstdlib>


eufyDiscovery::eufyDiscovery(const std::string &p2p_did, const std::string &key, std::ostream *out, const int timeout_ms)
	: eufyLookup(timeout_ms, out)
	, m_p2p_did(p2p_did)
	, m_key(key)
{
}


std::vector<unsigned char> eufyDiscovery::BuildLookupPayload(const Eufy::P2PDID &did, const std::string &key, const Eufy::Address &local)
{
	static const unsigned char cFlags[] = {0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x02, 0x04, 0x00, 0x00};

	std::vector<unsigned char> payload;
	Eufy::AppendP2PDID(payload, did);
	payload.insert(payload.end(), 5, 0x00);

	payload.push_back(local.port & 0x00FF);
	payload.push_back((local.port & 0xFF00) >> 8);

	// IPv4 octets in reverse order
	unsigned char cOctets[4] = {0, 0, 0, 0};
	const char *szIp = local.ip.c_str();
	for (int i = 0; i < 4; i++)
	{
		char *szEnd;
		cOctets[i] = (unsigned char)strtoul(szIp, &szEnd, 10);
		if (*szEnd != '.')
			break;
		szIp = szEnd + 1;
	}
	for (int i = 3; i >= 0; i--)
		payload.push_back(cOctets[i]);

	payload.insert(payload.end(), cFlags, cFlags + sizeof(cFlags));
	payload.insert(payload.end(), key.begin(), key.end());
	payload.insert(payload.end(), 4, 0x00);
	return payload;
}


bool eufyDiscovery::ParseLookupAddr(const std::vector<unsigned char> &payload, Eufy::Address &address)
{
	if (payload.size() < LOOKUP_ADDR_MIN_SIZE)
		return false;

	address.port = (uint16_t)(payload[LOOKUP_ADDR_PORT_OFFSET] + (payload[LOOKUP_ADDR_PORT_OFFSET + 1] << 8));
	address.ip = std::to_string(payload[LOOKUP_ADDR_IP_OFFSET + 3]) + "." +
			std::to_string(payload[LOOKUP_ADDR_IP_OFFSET + 2]) + "." +
			std::to_string(payload[LOOKUP_ADDR_IP_OFFSET + 1]) + "." +
			std::to_string(payload[LOOKUP_ADDR_IP_OFFSET]);
	return true;
}


/* protected */ bool eufyDiscovery::sendRequest(const Eufy::Address &relay)
{
	Eufy::P2PDID did;
	if (!Eufy::ParseP2PDID(m_p2p_did, did))
	{
		*m_out << getName() << ": invalid P2P-DID '" << m_p2p_did << "'\n";
		return false;
	}

	// a connected datagram socket reports the interface address used for the relay
	Eufy::Address local;
	if (!connectTo(relay) || !getLocalAddress(local))
		return false;

	std::vector<unsigned char> message;
	try
	{
		message = Eufy::EncodeFrame(Eufy::Request::LOOKUP_WITH_KEY, BuildLookupPayload(did, m_key, local));
	}
	catch (const Eufy::ProtocolError &e)
	{
		*m_out << getName() << ": " << e.what() << "\n";
		return false;
	}

	return (send(message.data(), (int)message.size()) == (int)message.size());
}


/* protected */ void eufyDiscovery::processResponse(const Eufy::Frame &frame, const Eufy::Address &from)
{
	if (frame.type != Eufy::Response::LOOKUP_ADDR)
	{
#ifdef DEBUG
		*m_out << getName() << ": ignoring " << Eufy::ResponseName(frame.type) << " from " << from.toString() << "\n";
#endif
		return;
	}

	Eufy::Address candidate;
	if (!ParseLookupAddr(frame.payload, candidate))
		throw Eufy::ProtocolError("LOOKUP_ADDR payload too short");

	addCandidate(candidate);
	if (m_candidates.size() >= EUFY_LOOKUP_MAX_CANDIDATES)
		complete();
}
