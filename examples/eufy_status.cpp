/*
 *  Inventory listing example for Eufy Security client
 *
 *  Copyright 2026 - eufypp contributors
 *
 *  Licensed under GNU General Public License 3.0 or later.
 *  Some rights reserved. See COPYING, AUTHORS.
 *
 *  @license GPL-3.0+
 */

#ifndef SECRETSFILE
#define SECRETSFILE EUFY_CONFIG_FILE
#endif

#include "eufyAPI.hpp"
#include "eufyErrors.hpp"
#include <cstdlib>
#include <iostream>


int main(int argc, char *argv[])
{
	std::string config_file = (argc > 1) ? argv[1] : SECRETSFILE;

	Eufy::Config config;
	std::string error;
	if (!config.LoadFromFile(config_file, &error))
	{
		std::cout << "Error: " << error << "\n";
		exit(1);
	}

	eufyAPI eufyclient(config);
	try
	{
		eufyclient.login();
	}
	catch (const Eufy::InvalidCredentialsError &e)
	{
		std::cout << "Error: login refused: " << e.what() << "\n";
		exit(1);
	}
	catch (const Eufy::RequestError &e)
	{
		std::cout << "Error: " << e.what() << "\n";
		exit(1);
	}

	std::cout << "Stations:\n";
	for (eufyAPI::StationMap::const_iterator it = eufyclient.getStations().begin(); it != eufyclient.getStations().end(); ++it)
	{
		const eufyStation *station = it->second.get();
		std::cout << "  " << station->getSerial() << "  " << station->getName() << " (" << station->getModel() << ")";
		if (!station->getIp().empty())
			std::cout << " at " << station->getIp();
		std::cout << "\n";
	}

	std::cout << "Cameras:\n";
	for (eufyAPI::DeviceMap::const_iterator it = eufyclient.getCameras().begin(); it != eufyclient.getCameras().end(); ++it)
	{
		const eufyDevice *camera = it->second.get();
		std::cout << "  " << camera->getSerial() << "  " << camera->getName() << " (" << camera->getModel() << ")";
		std::cout << " station " << camera->getStationSerial();
		std::cout << ", motion detection " << (camera->isMotionDetectionEnabled() ? "on" : "off") << "\n";
	}

	std::cout << "Sensors:\n";
	for (eufyAPI::DeviceMap::const_iterator it = eufyclient.getSensors().begin(); it != eufyclient.getSensors().end(); ++it)
	{
		const eufyDevice *sensor = it->second.get();
		std::cout << "  " << sensor->getSerial() << "  " << sensor->getName() << " (" << sensor->getModel() << ")";
		std::cout << " station " << sensor->getStationSerial() << "\n";

#ifdef APPDEBUG
		eufyParams params = sensor->getParams();
		std::string raw;
		if (params.getRaw(Eufy::Param::SENSOR_OPEN, raw))
			std::cout << "dbg:   SENSOR_OPEN = " << raw << "\n";
#endif
	}

	return 0;
}
