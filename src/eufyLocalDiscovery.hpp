/*
 *	Client interface for Eufy Security device access
 *
 *	Local lookup: broadcasts a LOCAL_LOOKUP on the device port of the local
 *	network segment. The first device that answers wins.
 *
 *
 *	Copyright 2026 - eufypp contributors
 *
 *	Licensed under GNU General Public License 3.0 or later.
 *	Some rights reserved. See COPYING, AUTHORS.
 *
 *	@license GPL-3.0+
 */

#ifndef _eufyLocalDiscovery
#define _eufyLocalDiscovery

// Device local lookup UDP port
#define EUFY_LOCAL_PORT 32108

#include "eufyLookup.hpp"
#include <string>


class eufyLocalDiscovery : public eufyLookup
{

public:
	explicit eufyLocalDiscovery(std::ostream *out = nullptr, const int timeout_ms = EUFY_LOOKUP_TIMEOUT_MS);

	using eufyLookup::lookup;

	// looks up on the device port of a broadcast or host address
	std::vector<Eufy::Address> lookup(const std::string &host);
	void setDevicePort(const uint16_t port) { m_device_port = port; }
	uint16_t getDevicePort() const { return m_device_port; }

protected:
	bool sendRequest(const Eufy::Address &target) override;
	void processResponse(const Eufy::Frame &frame, const Eufy::Address &from) override;
	const char *getName() const override { return "local lookup"; }

private:
	uint16_t m_device_port;
};

#endif // _eufyLocalDiscovery
