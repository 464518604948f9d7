/*
 *  Guard mode example for Eufy Security client
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
#include <iostream>
#include <cstdio>
#include <cstdlib>


bool get_guard_mode(const std::string name, Eufy::GuardMode::value &mode)
{
	std::string lowername = name;
	for (int i=0;i<(int)lowername.length();i++)
	{
		if (lowername[i] & 0x40)
			lowername[i] = lowername[i] | 0x20;
	}

	if (lowername == "away")
		mode = Eufy::GuardMode::AWAY;
	else if (lowername == "home")
		mode = Eufy::GuardMode::HOME;
	else if (lowername == "schedule")
		mode = Eufy::GuardMode::SCHEDULE;
	else if (lowername == "disarmed")
		mode = Eufy::GuardMode::DISARMED;
	else
		return false;
	return true;
}


int main(int argc, char *argv[])
{
	if (argc < 3) {
	   fprintf(stderr,"usage %s station_serial away|home|schedule|disarmed\n", argv[0]);
	   exit(0);
	}

	Eufy::GuardMode::value mode;
	if (!get_guard_mode(std::string(argv[2]), mode))
	{
		std::cout << "Error: unknown guard mode " << argv[2] << "\n";
		exit(0);
	}

	Eufy::Config config;
	std::string error;
	if (!config.LoadFromFile(SECRETSFILE, &error))
	{
		std::cout << "Error: " << error << "\n";
		exit(1);
	}

	eufyAPI eufyclient(config);
	try
	{
		eufyclient.login();

		eufyStation *station = eufyclient.getStation(std::string(argv[1]));
		if (!station)
		{
			std::cout << "Error: station " << argv[1] << " unknown\n";
			exit(1);
		}

		// the session needs an eufyAuthenticator set through setAuthenticator()
		eufyScopedSession session = station->connect();
		station->setGuardMode(mode, session.get());
		std::cout << station->getName() << ": guard mode set to " << argv[2] << "\n";
	}
	catch (const Eufy::ConnectionError &e)
	{
		std::cout << "Error connecting to station: " << e.what() << "\n";
		exit(1);
	}
	catch (const Eufy::AuthenticationError &e)
	{
		std::cout << "Error negotiating session: " << e.what() << "\n";
		exit(1);
	}
	catch (const Eufy::RequestError &e)
	{
		std::cout << "Error: " << e.what() << "\n";
		exit(1);
	}

	return 0;
}
