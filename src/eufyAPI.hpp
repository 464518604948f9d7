/*
 *	Client interface for Eufy Security device access
 *
 *	Cloud account client. Keeps the inventory of stations, cameras and
 *	sensors belonging to the account and serves the discovery keys that
 *	are needed to open a session to a station.
 *
 *	Functions:
 *	 - authenticate()
 *		Logs in with the account credentials. The login response may name
 *		another API domain; subsequent requests go there.
 *	 - request(method, endpoint, body)
 *		Returns the decoded JSON response. A non zero "code" in the response
 *		raises Eufy::RequestError. An expired token is renewed before the
 *		request and a 401 reply is retried once after logging in again.
 *	 - updateDeviceInfo()
 *		Reloads the inventory and notifies subscribers
 *	 - getDskKey(station_serial, dsk_key)
 *		Returns false if the account has no key for the station
 *
 *
 *	Copyright 2026 - eufypp contributors
 *
 *	Licensed under GNU General Public License 3.0 or later.
 *	Some rights reserved. See COPYING, AUTHORS.
 *
 *	@license GPL-3.0+
 */

#ifndef _eufyAPI
#define _eufyAPI

#define EUFY_HTTP_TIMEOUT 30

#include "eufyConfig.hpp"
#include "eufyDevice.hpp"
#include "eufyStation.hpp"
#include "eufySession.hpp"
#include <json/json.h>
#include <ctime>
#include <functional>
#include <map>
#include <memory>
#include <ostream>
#include <string>
#include <vector>


class eufyAPI
{

public:
	typedef std::function<void(eufyAPI&)> Listener;
	typedef std::map<std::string, std::unique_ptr<eufyDevice> > DeviceMap;
	typedef std::map<std::string, std::unique_ptr<eufyStation> > StationMap;

	explicit eufyAPI(const Eufy::Config &config, std::ostream *out = nullptr);
	eufyAPI(const std::string &email, const std::string &password, std::ostream *out = nullptr);
	virtual ~eufyAPI();

	eufyAPI(const eufyAPI&) = delete;
	eufyAPI& operator=(const eufyAPI&) = delete;

	void login();
	void authenticate();
	Json::Value request(const std::string &method, const std::string &endpoint, const Json::Value &body = Json::Value());

	void updateDeviceInfo();
	Json::Value getHistory();
	bool getDskKey(const std::string &station_serial, std::string &dsk_key);
	std::string startStream(const eufyDevice &device);
	void stopStream(const eufyDevice &device);
	void updateDeviceParams(const eufyDevice &device, const Json::Value &params);

	int subscribe(Listener listener);
	void unsubscribe(const int id);
	void dispatch();

	const DeviceMap &getCameras() const { return m_cameras; }
	const DeviceMap &getSensors() const { return m_sensors; }
	const StationMap &getStations() const { return m_stations; }
	eufyDevice *getCamera(const std::string &serial) const;
	eufyDevice *getSensor(const std::string &serial) const;
	eufyStation *getStation(const std::string &serial) const;

	Eufy::Config &getConfig() { return m_config; }
	const Eufy::Config &getConfig() const { return m_config; }
	const std::string &getApiBase() const { return m_api_base; }
	bool isAuthenticated() const { return !m_token.empty(); }
	std::ostream *getLog() const { return m_out; }

	void setAuthenticator(eufyAuthenticator *authenticator) { m_authenticator = authenticator; }
	eufyAuthenticator *getAuthenticator() const { return m_authenticator; }

protected:
	// returns the HTTP status, or -1 if no response was received
	virtual long performRequest(const std::string &method, const std::string &url, const std::vector<std::string> &headers,
	                            const std::string &body, std::string &response);

	std::ostream *m_out;

private:
	Json::Value execute(const std::string &method, const std::string &endpoint, const Json::Value &body, const bool retry);

	Eufy::Config m_config;
	std::string m_api_base;
	std::string m_token;
	time_t m_token_expiration;

	DeviceMap m_cameras;
	DeviceMap m_sensors;
	StationMap m_stations;

	std::map<int, Listener> m_listeners;
	int m_next_listener;

	eufyAuthenticator *m_authenticator;
};

#endif // _eufyAPI
