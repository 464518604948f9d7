/*
 *	Client interface for Eufy Security device access
 *
 *	Local lookup module
 *
 *
 *	Copyright 2026 - eufypp contributors
 *
 *	Licensed under GNU General Public License 3.0 or later.
 *	Some rights reserved. See COPYING, AUTHORS.
 *
 *	@license GPL-3.0+
 */

#include "eufyLocalDiscovery.hpp"


eufyLocalDiscovery::eufyLocalDiscovery(std::ostream *out, const int timeout_ms)
	: eufyLookup(timeout_ms, out)
	, m_device_port(EUFY_LOCAL_PORT)
{
}


std::vector<Eufy::Address> eufyLocalDiscovery::lookup(const std::string &host)
{
	return eufyLookup::lookup(Eufy::Address(host, m_device_port));
}


/* protected */ bool eufyLocalDiscovery::sendRequest(const Eufy::Address &target)
{
	if (!enableBroadcast())
		*m_out << getName() << ": broadcast not permitted (" << getlasterror() << ")\n";

	std::vector<unsigned char> message = Eufy::EncodeFrame(Eufy::Request::LOCAL_LOOKUP, std::vector<unsigned char>(2, 0x00));
	return (sendTo(message.data(), (int)message.size(), target) == (int)message.size());
}


/* protected */ void eufyLocalDiscovery::processResponse(const Eufy::Frame &frame, const Eufy::Address &from)
{
	if (frame.type != Eufy::Response::LOCAL_LOOKUP_RESP)
	{
#ifdef DEBUG
		*m_out << getName() << ": ignoring " << Eufy::ResponseName(frame.type) << " from " << from.toString() << "\n";
#endif
		return;
	}

	addCandidate(from);
	complete();
}
