/*
 *  Client interface for Eufy Security device access
 *
 *  Frame codec for the UDP envelope shared by relay and device traffic
 *
 *
 *  Copyright 2026 - eufypp contributors
 *
 *  Licensed under GNU General Public License 3.0 or later.
 *  Some rights reserved. See COPYING, AUTHORS.
 *
 *  @license GPL-3.0+
 */

#include "eufyFrame.hpp"
#include "eufyErrors.hpp"
#include <cstdlib>
#include <cstdio>

#ifdef DEBUG
#include <iostream>
#endif


namespace Eufy {

std::vector<unsigned char> EncodeFrame(const uint16_t type, const std::vector<unsigned char> &payload)
{
	if (payload.size() > EUFY_FRAME_MAX_PAYLOAD)
		throw ProtocolError("frame payload of " + std::to_string(payload.size()) + " bytes exceeds the 16 bit length field");

	std::vector<unsigned char> cMessage;
	cMessage.reserve(EUFY_FRAME_HEADER_SIZE + payload.size());
	cMessage.push_back((type & 0xFF00) >> 8);
	cMessage.push_back(type & 0x00FF);
	cMessage.push_back((payload.size() & 0xFF00) >> 8);
	cMessage.push_back(payload.size() & 0x00FF);
	cMessage.insert(cMessage.end(), payload.begin(), payload.end());

#ifdef DEBUG
	std::cout << "dbg: encoded frame (size=" << cMessage.size() << "): ";
	for (size_t i = 0; i < cMessage.size(); ++i)
		printf("%.2x", (uint8_t)cMessage[i]);
	std::cout << "\n";
#endif

	return cMessage;
}


Frame DecodeFrame(const unsigned char *cMessageBuffer, const int buffersize)
{
	if (buffersize < 2)
		throw ProtocolError("datagram too short to hold a message type");

	Frame frame;
	frame.type = (uint16_t)(((uint8_t)cMessageBuffer[0] << 8) + (uint8_t)cMessageBuffer[1]);
	if (!IsResponseType(frame.type))
	{
		char cErrorMessage[50];
		snprintf(cErrorMessage, sizeof(cErrorMessage), "unknown response type 0x%.4x", frame.type);
		throw ProtocolError(cErrorMessage);
	}

	// the datagram boundary is authoritative, the length field is not verified
	if (buffersize > EUFY_FRAME_HEADER_SIZE)
		frame.payload.assign(cMessageBuffer + EUFY_FRAME_HEADER_SIZE, cMessageBuffer + buffersize);

#ifdef DEBUG
	std::cout << "dbg: decoded frame " << ResponseName(frame.type) << " (size=" << buffersize << "): ";
	for (int i = 0; i < buffersize; ++i)
		printf("%.2x", (uint8_t)cMessageBuffer[i]);
	std::cout << "\n";
#endif

	return frame;
}


bool IsResponseType(const uint16_t type)
{
	switch (type)
	{
		case Response::STUN:
		case Response::LOOKUP_RESP:
		case Response::LOOKUP_ADDR:
		case Response::LOCAL_LOOKUP_RESP:
		case Response::CAM_ID:
		case Response::DATA:
		case Response::ACK:
		case Response::PING:
		case Response::PONG:
		case Response::END:
			return true;
		default:
			break;
	}
	return false;
}


const char *ResponseName(const uint16_t type)
{
	switch (type)
	{
		case Response::STUN:
			return "STUN";
		case Response::LOOKUP_RESP:
			return "LOOKUP_RESP";
		case Response::LOOKUP_ADDR:
			return "LOOKUP_ADDR";
		case Response::LOCAL_LOOKUP_RESP:
			return "LOCAL_LOOKUP_RESP";
		case Response::CAM_ID:
			return "CAM_ID";
		case Response::DATA:
			return "DATA";
		case Response::ACK:
			return "ACK";
		case Response::PING:
			return "PING";
		case Response::PONG:
			return "PONG";
		case Response::END:
			return "END";
		default:
			break;
	}
	return "UNKNOWN";
}


bool ParseP2PDID(const std::string &szDid, P2PDID &did)
{
	size_t first = szDid.find('-');
	if (first == std::string::npos)
		return false;
	size_t second = szDid.find('-', first + 1);
	if ((second == std::string::npos) || (szDid.find('-', second + 1) != std::string::npos))
		return false;

	std::string szSerial = szDid.substr(first + 1, second - first - 1);
	if (szSerial.empty() || (szSerial.length() > 13))
		return false;
	for (size_t i = 0; i < szSerial.length(); i++)
	{
		if ((szSerial[i] < '0') || (szSerial[i] > '9'))
			return false;
	}

	uint64_t serial = std::strtoull(szSerial.c_str(), nullptr, 10);
	if (serial >> (EUFY_P2PDID_SERIAL_SIZE * 8))
		return false;

	did.prefix = szDid.substr(0, first);
	did.serial = serial;
	did.suffix = szDid.substr(second + 1);
	return true;
}


void AppendP2PDID(std::vector<unsigned char> &buffer, const P2PDID &did)
{
	buffer.insert(buffer.end(), did.prefix.begin(), did.prefix.end());
	for (int i = EUFY_P2PDID_SERIAL_SIZE - 1; i >= 0; i--)
		buffer.push_back((did.serial >> (i * 8)) & 0xFF);
	buffer.insert(buffer.end(), did.suffix.begin(), did.suffix.end());
}

}; // namespace Eufy
