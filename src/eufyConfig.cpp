/*
 *	Client interface for Eufy Security device access
 *
 *	Account and transport settings
 *
 *
 *	Copyright 2026 - eufypp contributors
 *
 *	Licensed under GNU General Public License 3.0 or later.
 *	Some rights reserved. See COPYING, AUTHORS.
 *
 *	@license GPL-3.0+
 */

#include "eufyConfig.hpp"
#include "eufyDiscovery.hpp"
#include "eufyLocalDiscovery.hpp"
#include <json/json.h>
#include <fstream>
#include <memory>


namespace Eufy {

/* local */ static bool set_error(std::string *error, const std::string &message)
{
	if (error)
		*error = message;
	return false;
}


Config::Config()
	: api_base(EUFY_API_BASE)
	, discovery_timeout_ms(EUFY_LOOKUP_TIMEOUT_MS)
	, local_port(EUFY_LOCAL_PORT)
	, broadcast_address("255.255.255.255")
	, local_fallback(true)
{
	relays.push_back(Address("34.235.4.153", EUFY_RELAY_PORT));
	relays.push_back(Address("54.153.101.7", EUFY_RELAY_PORT));
	relays.push_back(Address("18.223.127.200", EUFY_RELAY_PORT));
}


bool Config::LoadFromFile(const std::string &filename, std::string *error)
{
	std::string szFileContent;
	std::ifstream myfile (filename);
	if (!myfile.is_open())
		return set_error(error, "cannot open " + filename);

	std::string line;
	while (getline(myfile, line))
	{
		szFileContent.append(line);
		szFileContent.append("\n");
	}
	myfile.close();

	return LoadFromString(szFileContent, error);
}


bool Config::LoadFromString(const std::string &content, std::string *error)
{
	Json::Value jRoot;
	Json::CharReaderBuilder jBuilder;
	std::unique_ptr<Json::CharReader> jReader(jBuilder.newCharReader());
	std::string szErrors;
	if (!jReader->parse(content.c_str(), content.c_str() + content.size(), &jRoot, &szErrors))
		return set_error(error, "invalid JSON: " + szErrors);

	return Load(jRoot, error);
}


bool Config::Load(const Json::Value &jRoot, std::string *error)
{
	if (!jRoot.isObject())
		return set_error(error, "configuration must be a JSON object");

	// fields are only taken over once the whole document validates
	Config parsed(*this);
	try
	{
		if (jRoot.isMember("email"))
			parsed.email = jRoot["email"].asString();
		if (jRoot.isMember("password"))
			parsed.password = jRoot["password"].asString();
		if (jRoot.isMember("api_base"))
			parsed.api_base = jRoot["api_base"].asString();

		if (jRoot.isMember("relays"))
		{
			if (!jRoot["relays"].isArray())
				return set_error(error, "relays must be an array");
			parsed.relays.clear();
			for (int i = 0; i < (int)jRoot["relays"].size(); i++)
			{
				const Json::Value &jRelay = jRoot["relays"][i];
				int port = jRelay.get("port", EUFY_RELAY_PORT).asInt();
				if ((port <= 0) || (port > 65535))
					return set_error(error, "relay port out of range");
				parsed.relays.push_back(Address(jRelay["host"].asString(), (uint16_t)port));
			}
		}

		if (jRoot.isMember("discovery_timeout_ms"))
			parsed.discovery_timeout_ms = jRoot["discovery_timeout_ms"].asInt();
		if (jRoot.isMember("local_port"))
		{
			int port = jRoot["local_port"].asInt();
			if ((port <= 0) || (port > 65535))
				return set_error(error, "local_port out of range");
			parsed.local_port = (uint16_t)port;
		}
		if (jRoot.isMember("broadcast_address"))
			parsed.broadcast_address = jRoot["broadcast_address"].asString();
		if (jRoot.isMember("local_fallback"))
			parsed.local_fallback = jRoot["local_fallback"].asBool();
	}
	catch (const Json::Exception &e)
	{
		return set_error(error, std::string("invalid value: ") + e.what());
	}

	if (!parsed.Validate(error))
		return false;
	*this = parsed;
	return true;
}


bool Config::Validate(std::string *error) const
{
	if (discovery_timeout_ms <= 0)
		return set_error(error, "discovery_timeout_ms must be positive");
	if (api_base.empty())
		return set_error(error, "api_base must not be empty");
	for (size_t i = 0; i < relays.size(); i++)
	{
		if (relays[i].ip.empty())
			return set_error(error, "relay host must not be empty");
	}
	if (relays.empty() && !local_fallback)
		return set_error(error, "no relays configured and local fallback disabled");
	return true;
}

}; // namespace Eufy
