/*
 *	Client interface for Eufy Security device access
 *
 *	Cloud account module
 *
 *
 *	Copyright 2026 - eufypp contributors
 *
 *	Licensed under GNU General Public License 3.0 or later.
 *	Some rights reserved. See COPYING, AUTHORS.
 *
 *	@license GPL-3.0+
 */

#include "eufyAPI.hpp"
#include "eufyErrors.hpp"
#include <curl/curl.h>
#include <algorithm>
#include <cctype>
#include <iostream>


/* local */ static size_t write_response(char *data, size_t size, size_t nmemb, void *userp)
{
	std::string *response = static_cast<std::string*>(userp);
	response->append(data, size * nmemb);
	return size * nmemb;
}


/* local */ static std::string write_json(const Json::Value &jValue)
{
	Json::StreamWriterBuilder jBuilder;
	jBuilder["indentation"] = "";
	return Json::writeString(jBuilder, jValue);
}


eufyAPI::eufyAPI(const Eufy::Config &config, std::ostream *out)
	: m_out(out ? out : &std::cerr)
	, m_config(config)
	, m_api_base(config.api_base)
	, m_token_expiration(0)
	, m_next_listener(1)
	, m_authenticator(nullptr)
{
}


eufyAPI::eufyAPI(const std::string &email, const std::string &password, std::ostream *out)
	: m_out(out ? out : &std::cerr)
	, m_token_expiration(0)
	, m_next_listener(1)
	, m_authenticator(nullptr)
{
	m_config.email = email;
	m_config.password = password;
	m_api_base = m_config.api_base;
}


eufyAPI::~eufyAPI()
{
}


void eufyAPI::login()
{
	authenticate();
	updateDeviceInfo();
}


void eufyAPI::authenticate()
{
	Json::Value jBody;
	jBody["email"] = m_config.email;
	jBody["password"] = m_config.password;

	Json::Value jResponse;
	try
	{
		jResponse = execute("post", "passport/login", jBody, false);
	}
	catch (const Eufy::InvalidCredentialsError&)
	{
		throw;
	}
	catch (const Eufy::RequestError &e)
	{
		// the account service answered but refused the login
		if (e.code() != 0)
			throw Eufy::InvalidCredentialsError(e.what(), e.code());
		throw;
	}

	const Json::Value &jData = jResponse["data"];
	m_token = jData["auth_token"].asString();
	m_token_expiration = (time_t)jData["token_expires_at"].asInt64();

	std::string szDomain = jData.get("domain", "").asString();
	if (!szDomain.empty())
	{
		m_api_base = "https://" + szDomain + "/v1";
		*m_out << "Switching to API base " << m_api_base << "\n";
	}
}


Json::Value eufyAPI::request(const std::string &method, const std::string &endpoint, const Json::Value &body)
{
	if ((m_token_expiration != 0) && (time(NULL) >= m_token_expiration))
	{
		*m_out << "Access token expired, fetching a new one\n";
		m_token.clear();
		m_token_expiration = 0;
		authenticate();
	}
	return execute(method, endpoint, body, true);
}


/* private */ Json::Value eufyAPI::execute(const std::string &method, const std::string &endpoint, const Json::Value &body, const bool retry)
{
	std::vector<std::string> headers;
	headers.push_back("Content-Type: application/json");
	if (!m_token.empty())
		headers.push_back("x-auth-token: " + m_token);

	std::string szBody = body.isNull() ? "" : write_json(body);
	std::string szResponse;
	long status = performRequest(method, m_api_base + "/" + endpoint, headers, szBody, szResponse);

	if (status == 401)
	{
		if (!retry)
			throw Eufy::InvalidCredentialsError("Token error while requesting " + endpoint);
		*m_out << "Request to " << endpoint << " was not authorized, logging in again\n";
		authenticate();
		return execute(method, endpoint, body, false);
	}

	if ((status < 200) || (status >= 300))
		throw Eufy::RequestError("Error while requesting " + endpoint + ": HTTP status " + std::to_string(status));

	Json::Value jResponse;
	Json::CharReaderBuilder jBuilder;
	std::unique_ptr<Json::CharReader> jReader(jBuilder.newCharReader());
	std::string szErrors;
	if (szResponse.empty() || !jReader->parse(szResponse.c_str(), szResponse.c_str() + szResponse.size(), &jResponse, &szErrors) || !jResponse.isObject())
		throw Eufy::RequestError("No valid response while requesting " + endpoint);

	int code = jResponse.get("code", 0).asInt();
	if (code != 0)
		throw Eufy::RequestError("There was an error while requesting " + endpoint + ": " + jResponse.get("msg", "").asString(), code);

	return jResponse;
}


/* protected */ long eufyAPI::performRequest(const std::string &method, const std::string &url, const std::vector<std::string> &headers,
                                             const std::string &body, std::string &response)
{
	CURL *curl = curl_easy_init();
	if (!curl)
	{
		*m_out << "Cannot initialize HTTP client\n";
		return -1;
	}

	std::string szMethod(method);
	std::transform(szMethod.begin(), szMethod.end(), szMethod.begin(), ::toupper);

	struct curl_slist *header_list = nullptr;
	for (size_t i = 0; i < headers.size(); i++)
		header_list = curl_slist_append(header_list, headers[i].c_str());

	curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
	curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, szMethod.c_str());
	curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list);
	curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_response);
	curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response);
	curl_easy_setopt(curl, CURLOPT_TIMEOUT, (long)EUFY_HTTP_TIMEOUT);
	curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
	if (!body.empty())
	{
		curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
		curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, (long)body.size());
	}

	long status = -1;
	CURLcode res = curl_easy_perform(curl);
	if (res == CURLE_OK)
		curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
	else
		*m_out << szMethod << " " << url << " failed: " << curl_easy_strerror(res) << "\n";

	curl_slist_free_all(header_list);
	curl_easy_cleanup(curl);
	return status;
}


void eufyAPI::updateDeviceInfo()
{
	Json::Value jDevices = request("post", "app/get_devs_list");
	const Json::Value &jDeviceList = jDevices["data"];
	for (int i = 0; i < (int)jDeviceList.size(); i++)
	{
		const Json::Value &jInfo = jDeviceList[i];
		int code = jInfo["device_type"].asInt();
		if (!Eufy::Device::isKnownType(code))
		{
			*m_out << "Skipping device " << jInfo["device_sn"].asString() << " of unknown type " << code << "\n";
			continue;
		}

		Eufy::Device::type device_type = (Eufy::Device::type)code;
		DeviceMap *devices;
		if (Eufy::Device::isCamera(device_type))
			devices = &m_cameras;
		else if (Eufy::Device::isSensor(device_type))
			devices = &m_sensors;
		else
			continue;

		std::string szSerial = jInfo["device_sn"].asString();
		DeviceMap::iterator it = devices->find(szSerial);
		if (it != devices->end())
			it->second->update(jInfo);
		else
			(*devices)[szSerial] = eufyDevice::create(*this, jInfo);
	}

	Json::Value jStations = request("post", "app/get_hub_list");
	const Json::Value &jStationList = jStations["data"];
	for (int i = 0; i < (int)jStationList.size(); i++)
	{
		const Json::Value &jInfo = jStationList[i];
		int code = jInfo["device_type"].asInt();
		if (!Eufy::Device::isKnownType(code) || !Eufy::Device::isStation((Eufy::Device::type)code))
		{
			*m_out << "Skipping station " << jInfo["station_sn"].asString() << " of type " << code << "\n";
			continue;
		}

		std::string szSerial = jInfo["station_sn"].asString();
		StationMap::iterator it = m_stations.find(szSerial);
		if (it != m_stations.end())
			it->second->update(jInfo);
		else
			m_stations[szSerial] = std::unique_ptr<eufyStation>(new eufyStation(*this, jInfo));
	}

	dispatch();
}


Json::Value eufyAPI::getHistory()
{
	Json::Value jResponse = request("post", "event/app/get_all_history_record");
	return jResponse["data"];
}


bool eufyAPI::getDskKey(const std::string &station_serial, std::string &dsk_key)
{
	Json::Value jBody;
	jBody["station_sns"].append(station_serial);

	Json::Value jResponse = request("post", "app/equipment/get_dsk_keys", jBody);
	const Json::Value &jKeys = jResponse["data"]["dsk_keys"];
	for (int i = 0; i < (int)jKeys.size(); i++)
	{
		if (jKeys[i]["station_sn"].asString() == station_serial)
		{
			dsk_key = jKeys[i]["dsk_key"].asString();
			return true;
		}
	}
	return false;
}


std::string eufyAPI::startStream(const eufyDevice &device)
{
	Json::Value jBody;
	jBody["device_sn"] = device.getSerial();
	jBody["station_sn"] = device.getStationSerial();
	jBody["proto"] = 2;

	Json::Value jResponse = request("post", "web/equipment/start_stream", jBody);
	return jResponse["data"]["url"].asString();
}


void eufyAPI::stopStream(const eufyDevice &device)
{
	Json::Value jBody;
	jBody["device_sn"] = device.getSerial();
	jBody["station_sn"] = device.getStationSerial();
	jBody["proto"] = 2;

	request("post", "web/equipment/stop_stream", jBody);
}


void eufyAPI::updateDeviceParams(const eufyDevice &device, const Json::Value &params)
{
	Json::Value jBody;
	jBody["device_sn"] = device.getSerial();
	jBody["station_sn"] = device.getStationSerial();
	jBody["params"] = params;

	request("post", "app/upload_devs_params", jBody);
	updateDeviceInfo();
}


int eufyAPI::subscribe(Listener listener)
{
	int id = m_next_listener++;
	m_listeners[id] = listener;
	return id;
}


void eufyAPI::unsubscribe(const int id)
{
	m_listeners.erase(id);
}


void eufyAPI::dispatch()
{
	// listeners may unsubscribe while being notified
	std::map<int, Listener> listeners(m_listeners);
	for (std::map<int, Listener>::iterator it = listeners.begin(); it != listeners.end(); ++it)
		it->second(*this);
}


eufyDevice *eufyAPI::getCamera(const std::string &serial) const
{
	DeviceMap::const_iterator it = m_cameras.find(serial);
	return (it != m_cameras.end()) ? it->second.get() : nullptr;
}


eufyDevice *eufyAPI::getSensor(const std::string &serial) const
{
	DeviceMap::const_iterator it = m_sensors.find(serial);
	return (it != m_sensors.end()) ? it->second.get() : nullptr;
}


eufyStation *eufyAPI::getStation(const std::string &serial) const
{
	StationMap::const_iterator it = m_stations.find(serial);
	return (it != m_stations.end()) ? it->second.get() : nullptr;
}
