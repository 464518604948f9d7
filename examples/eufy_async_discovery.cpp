/*
 *  Async discovery example using eufyDiscovery class
 *
 *  Looks up every station of the account through the first configured
 *  relay, all at the same time, from a single select() loop.
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
#include "eufyDiscovery.hpp"
#include "eufyErrors.hpp"
#include <cstdlib>
#include <iostream>
#include <sys/select.h>
#include <vector>


int main(int argc, char *argv[])
{
	std::cout.setf(std::ios::unitbuf);  // Unbuffered output

	Eufy::Config config;
	std::string error;
	if (!config.LoadFromFile((argc > 1) ? argv[1] : SECRETSFILE, &error))
	{
		std::cout << "Error: " << error << "\n";
		exit(1);
	}
	if (config.relays.empty())
	{
		std::cerr << "No relays configured\n";
		return 1;
	}

	eufyAPI eufyclient(config);
	std::vector<std::unique_ptr<eufyDiscovery> > lookups;
	try
	{
		eufyclient.login();

		for (eufyAPI::StationMap::const_iterator it = eufyclient.getStations().begin(); it != eufyclient.getStations().end(); ++it)
		{
			eufyStation *station = it->second.get();
			std::string dsk_key;
			if (!eufyclient.getDskKey(station->getSerial(), dsk_key))
			{
				std::cout << "Error: no discovery key for " << station->getName() << "\n";
				continue;
			}

			std::string name = station->getName();
			std::unique_ptr<eufyDiscovery> lookup(new eufyDiscovery(station->getP2PDID(), dsk_key, &std::cout, config.discovery_timeout_ms));
			lookup->setCompletionCallback([name](const std::vector<Eufy::Address> &candidates)
			{
				std::cout << name << ": " << candidates.size() << " address(es)";
				for (size_t i = 0; i < candidates.size(); i++)
					std::cout << " " << candidates[i].toString();
				std::cout << "\n";
			});
			if (lookup->start(config.relays[0]))
				lookups.push_back(std::move(lookup));
		}
	}
	catch (const Eufy::RequestError &e)
	{
		std::cout << "Error: " << e.what() << "\n";
		exit(1);
	}

	if (lookups.empty()) {
		std::cerr << "No stations to look up\n";
		return 1;
	}

	bool pending = true;
	while (pending)
	{
		struct timeval tv = {1, 0};
		fd_set read_fds;
		FD_ZERO(&read_fds);
		int max_fd = -1;
		pending = false;

		// Let each lookup run and collect their fd requirements
		for (size_t i = 0; i < lookups.size(); i++) {
			struct timeval lookup_tv = {0, 0};
			lookups[i]->loop(lookup_tv);
			if (lookups[i]->isComplete())
				continue;
			pending = true;

			// Use the minimum timeout
			if ((lookup_tv.tv_sec < tv.tv_sec) || ((lookup_tv.tv_sec == tv.tv_sec) && (lookup_tv.tv_usec < tv.tv_usec)))
				tv = lookup_tv;

			int fd = lookups[i]->get_fd();
			if ((fd >= 0) && lookups[i]->wants_read()) {
				FD_SET(fd, &read_fds);
				if (fd > max_fd)
					max_fd = fd;
			}
		}

		if (pending && (max_fd >= 0))
			select(max_fd + 1, &read_fds, nullptr, nullptr, &tv);
	}

	return 0;
}
