/*
 *	Client interface for Eufy Security device access
 *
 *	Account and transport settings, read from a JSON file such as
 *
 *	{
 *	  "email": "user@example.com",
 *	  "password": "secret",
 *	  "relays": [ { "host": "34.235.4.153", "port": 32100 } ],
 *	  "discovery_timeout_ms": 1500,
 *	  "local_port": 32108,
 *	  "broadcast_address": "255.255.255.255",
 *	  "local_fallback": true
 *	}
 *
 *	All keys except the credentials are optional.
 *
 *
 *	Copyright 2026 - eufypp contributors
 *
 *	Licensed under GNU General Public License 3.0 or later.
 *	Some rights reserved. See COPYING, AUTHORS.
 *
 *	@license GPL-3.0+
 */

#ifndef _eufyConfig
#define _eufyConfig

#ifndef EUFY_CONFIG_FILE
#define EUFY_CONFIG_FILE "eufy-account.json"
#endif

#define EUFY_API_BASE "https://mysecurity.eufylife.com/api/v1"

#include "eufyUDP.hpp"
#include <string>
#include <vector>

namespace Json {
class Value;
};


namespace Eufy {

struct Config
{
	Config();

	std::string email;
	std::string password;
	std::string api_base;

	std::vector<Address> relays;
	int discovery_timeout_ms;
	uint16_t local_port;
	std::string broadcast_address;
	bool local_fallback;

	bool LoadFromFile(const std::string &filename, std::string *error = nullptr);
	bool LoadFromString(const std::string &content, std::string *error = nullptr);
	bool Load(const Json::Value &root, std::string *error = nullptr);
	bool Validate(std::string *error = nullptr) const;
};

}; // namespace Eufy

#endif // _eufyConfig
