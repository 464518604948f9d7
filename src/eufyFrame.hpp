/*
 *  Client interface for Eufy Security device access
 *
 *  Frame codec for the UDP envelope shared by relay and device traffic
 *
 *	Every datagram starts with a two byte message type, followed by a two
 *	byte big-endian payload length and the payload itself.
 *
 *	Functions:
 *	 - EncodeFrame(type, payload)
 *		Returns the complete datagram
 *		Throws Eufy::ProtocolError if the payload exceeds 65535 bytes
 *	 - DecodeFrame(buffer[], size)
 *		Returns the message type and the bytes following the length field.
 *		The length field itself is not checked against the datagram size.
 *		Throws Eufy::ProtocolError on an unknown message type
 *	 - ParseP2PDID(did_string, did)
 *		Splits a P2P-DID such as "ABCD-012345-EFGHI" into its components
 *		Returns true|false indicating success or failure
 *
 *
 *  Copyright 2026 - eufypp contributors
 *
 *  Licensed under GNU General Public License 3.0 or later.
 *  Some rights reserved. See COPYING, AUTHORS.
 *
 *  @license GPL-3.0+
 */

#ifndef _eufyFrame
#define _eufyFrame

#define EUFY_FRAME_HEADER_SIZE 4
#define EUFY_FRAME_MAX_PAYLOAD 65535

// size of the numeric P2P-DID component on the wire
#define EUFY_P2PDID_SERIAL_SIZE 5

#include <string>
#include <vector>
#include <cstdint>


namespace Eufy {
  namespace Request {
    enum value : uint16_t {
      STUN = 0xF100,
      LOOKUP = 0xF120,
      LOOKUP_WITH_KEY = 0xF126,
      LOCAL_LOOKUP = 0xF130,
      CHECK_CAM = 0xF141,
      DATA = 0xF1D0,
      ACK = 0xF1D1,
      PING = 0xF1E0,
      PONG = 0xF1E1,
      END = 0xF1F0
    }; // enum value
  }; // namespace Request

  namespace Response {
    enum value : uint16_t {
      STUN = 0xF101,
      LOOKUP_RESP = 0xF121,
      LOOKUP_ADDR = 0xF140,
      LOCAL_LOOKUP_RESP = 0xF141,
      CAM_ID = 0xF142,
      DATA = 0xF1D0,
      ACK = 0xF1D1,
      PING = 0xF1E0,
      PONG = 0xF1E1,
      END = 0xF1F0
    }; // enum value
  }; // namespace Response


struct Frame
{
	uint16_t type;
	std::vector<unsigned char> payload;
};

struct P2PDID
{
	std::string prefix;
	uint64_t serial;
	std::string suffix;
};


std::vector<unsigned char> EncodeFrame(const uint16_t type, const std::vector<unsigned char> &payload);
Frame DecodeFrame(const unsigned char *buffer, const int size);

bool IsResponseType(const uint16_t type);
const char *ResponseName(const uint16_t type);

bool ParseP2PDID(const std::string &szDid, P2PDID &did);
void AppendP2PDID(std::vector<unsigned char> &buffer, const P2PDID &did);

}; // namespace Eufy

#endif // _eufyFrame
