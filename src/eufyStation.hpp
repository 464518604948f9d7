/*
 *	Client interface for Eufy Security device access
 *
 *	Home base (or standalone doorbell/floodlight) as reported by the hub
 *	inventory. The station is the endpoint that P2P sessions are opened to.
 *
 *	Functions:
 *	 - discover(dsk_key)
 *		Asks the configured relays for the station's addresses, one relay at
 *		a time, and falls back to a local lookup when none answered
 *	 - connect(address)
 *		Opens a session to the given address or, without one, to the first
 *		discovered address that accepts the handshake. The returned scope
 *		owns the session and closes it when released.
 *	 - acquireSession(session)
 *		Reuses the given session if it is connected to this station
 *	 - setGuardMode(mode, session)
 *
 *
 *	Copyright 2026 - eufypp contributors
 *
 *	Licensed under GNU General Public License 3.0 or later.
 *	Some rights reserved. See COPYING, AUTHORS.
 *
 *	@license GPL-3.0+
 */

#ifndef _eufyStation
#define _eufyStation

#include "eufyDevice.hpp"
#include "eufyScopedSession.hpp"
#include "eufyUDP.hpp"
#include <json/json.h>
#include <string>
#include <vector>


class eufyAPI;

class eufyStation
{

public:
	eufyStation(eufyAPI &api, const Json::Value &station_info);
	virtual ~eufyStation() {}

	Eufy::Device::type getType() const { return m_type; }
	std::string getModel() const;
	std::string getName() const;
	std::string getSerial() const;
	std::string getHardwareVersion() const;
	std::string getSoftwareVersion() const;
	std::string getMac() const;
	std::string getIp() const;
	std::string getP2PDID() const;
	std::string getUserId() const;
	const Json::Value &getInfo() const { return m_station_info; }

	void update(const Json::Value &station_info);

	std::vector<Eufy::Address> discover(const std::string &dsk_key);
	eufyScopedSession connect(const Eufy::Address *address = nullptr);
	eufyScopedSession acquireSession(eufySession *session = nullptr);

	void setGuardMode(const Eufy::GuardMode::value mode, eufySession *session = nullptr);

private:
	eufyAPI &m_api;
	Json::Value m_station_info;
	Eufy::Device::type m_type;
};

#endif // _eufyStation
