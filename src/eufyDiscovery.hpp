/*
 *	Client interface for Eufy Security device access
 *
 *	Relay lookup: asks a rendezvous relay for the addresses under which a
 *	device identified by its P2P-DID can be reached. A relay answers with at
 *	most two addresses (LAN and WAN), so the lookup resolves as soon as two
 *	LOOKUP_ADDR answers have arrived.
 *
 *
 *	Copyright 2026 - eufypp contributors
 *
 *	Licensed under GNU General Public License 3.0 or later.
 *	Some rights reserved. See COPYING, AUTHORS.
 *
 *	@license GPL-3.0+
 */

#ifndef _eufyDiscovery
#define _eufyDiscovery

// Rendezvous relay UDP port
#define EUFY_RELAY_PORT 32100

#define EUFY_LOOKUP_MAX_CANDIDATES 2

#include "eufyLookup.hpp"
#include <string>
#include <vector>


class eufyDiscovery : public eufyLookup
{

public:
	eufyDiscovery(const std::string &p2p_did, const std::string &key, std::ostream *out = nullptr, const int timeout_ms = EUFY_LOOKUP_TIMEOUT_MS);

	static std::vector<unsigned char> BuildLookupPayload(const Eufy::P2PDID &did, const std::string &key, const Eufy::Address &local);
	static bool ParseLookupAddr(const std::vector<unsigned char> &payload, Eufy::Address &address);

protected:
	bool sendRequest(const Eufy::Address &relay) override;
	void processResponse(const Eufy::Frame &frame, const Eufy::Address &from) override;
	const char *getName() const override { return "relay lookup"; }

private:
	std::string m_p2p_did;
	std::string m_key;
};

#endif // _eufyDiscovery
