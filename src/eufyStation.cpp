/*
 *	Client interface for Eufy Security device access
 *
 *	Station module
 *
 *
 *	Copyright 2026 - eufypp contributors
 *
 *	Licensed under GNU General Public License 3.0 or later.
 *	Some rights reserved. See COPYING, AUTHORS.
 *
 *	@license GPL-3.0+
 */

#include "eufyStation.hpp"
#include "eufyAPI.hpp"
#include "eufyDiscovery.hpp"
#include "eufyLocalDiscovery.hpp"
#include "eufyErrors.hpp"
#include <iostream>


eufyStation::eufyStation(eufyAPI &api, const Json::Value &station_info)
	: m_api(api)
	, m_type(Eufy::Device::STATION)
{
	update(station_info);
}


std::string eufyStation::getModel() const
{
	return m_station_info["station_model"].asString();
}


std::string eufyStation::getName() const
{
	return m_station_info["station_name"].asString();
}


std::string eufyStation::getSerial() const
{
	return m_station_info["station_sn"].asString();
}


std::string eufyStation::getHardwareVersion() const
{
	return m_station_info["main_hw_version"].asString();
}


std::string eufyStation::getSoftwareVersion() const
{
	return m_station_info["main_sw_version"].asString();
}


std::string eufyStation::getMac() const
{
	return m_station_info["wifi_mac"].asString();
}


std::string eufyStation::getIp() const
{
	return m_station_info["ip_addr"].asString();
}


std::string eufyStation::getP2PDID() const
{
	return m_station_info["p2p_did"].asString();
}


std::string eufyStation::getUserId() const
{
	return m_station_info["member"]["action_user_id"].asString();
}


void eufyStation::update(const Json::Value &station_info)
{
	int code = station_info["device_type"].asInt();
	if (!Eufy::Device::isKnownType(code) || !Eufy::Device::isStation((Eufy::Device::type)code))
		throw Eufy::Error("device type " + std::to_string(code) + " is not a station");

	m_station_info = station_info;
	m_type = (Eufy::Device::type)code;
}


std::vector<Eufy::Address> eufyStation::discover(const std::string &dsk_key)
{
	const Eufy::Config &config = m_api.getConfig();
	std::ostream *out = m_api.getLog();
	std::vector<Eufy::Address> candidates;

	for (size_t i = 0; i < config.relays.size(); i++)
	{
		eufyDiscovery discovery(getP2PDID(), dsk_key, out, config.discovery_timeout_ms);
		candidates = discovery.lookup(config.relays[i]);
		if (!candidates.empty())
			return candidates;
		*out << "Relay " << config.relays[i].toString() << " did not find " << getName() << "\n";
	}

	if (!config.local_fallback)
		return candidates;

	eufyLocalDiscovery local(out, config.discovery_timeout_ms);
	local.setDevicePort(config.local_port);
	std::string target = getIp().empty() ? config.broadcast_address : getIp();
	return local.lookup(target);
}


eufyScopedSession eufyStation::connect(const Eufy::Address *address)
{
	std::string dsk_key;
	if (!m_api.getDskKey(getSerial(), dsk_key))
		throw Eufy::ConnectionError("Could not retrieve discovery key for " + getName());

	std::vector<Eufy::Address> candidates;
	if (address)
		candidates.push_back(*address);
	else
		candidates = discover(dsk_key);

	if (candidates.empty())
		throw Eufy::ConnectionError("Could not find " + getName() + " on the network");

	for (size_t i = 0; i < candidates.size(); i++)
	{
		std::unique_ptr<eufySession> session(new eufySession(getSerial(), getP2PDID(), dsk_key, getUserId(), m_api.getAuthenticator(), m_api.getLog()));
		if (session->connect(candidates[i]))
			return eufyScopedSession(std::move(session));
		*m_api.getLog() << "Could not connect to " << getName() << " at " << candidates[i].toString() << "\n";
	}
	throw Eufy::ConnectionError("Could not connect to " + getName());
}


eufyScopedSession eufyStation::acquireSession(eufySession *session)
{
	if (session && session->validFor(getSerial()))
		return eufyScopedSession(session);
	return connect();
}


void eufyStation::setGuardMode(const Eufy::GuardMode::value mode, eufySession *session)
{
	eufyScopedSession scoped = acquireSession(session);
	if (!scoped->sendCommandWithInt(0, EUFY_CMD_SET_ARMING, (int)mode))
		throw Eufy::ConnectionError("Could not send guard mode to " + getName());
}
