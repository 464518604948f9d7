/*
 *	Client interface for Eufy Security device access
 *
 *	Base class for address lookups
 *
 *
 *	Copyright 2026 - eufypp contributors
 *
 *	Licensed under GNU General Public License 3.0 or later.
 *	Some rights reserved. See COPYING, AUTHORS.
 *
 *	@license GPL-3.0+
 */

#include "eufyLookup.hpp"
#include "eufyErrors.hpp"
#include <iostream>


eufyLookup::eufyLookup(const int timeout_ms, std::ostream *out)
	: m_out(out ? out : &std::cerr)
	, m_timeout_ms(timeout_ms)
	, m_started(false)
	, m_complete(false)
{
}


bool eufyLookup::start(const Eufy::Address &target)
{
	if (m_started)
		return false;
	m_started = true;

	if (!open())
	{
		*m_out << getName() << ": failed to open socket (" << getlasterror() << ")\n";
		complete();
		return false;
	}

	m_deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(m_timeout_ms);
	if (!sendRequest(target))
	{
		*m_out << getName() << ": failed to send request to " << target.toString() << " (" << getlasterror() << ")\n";
		complete();
		return false;
	}

#ifdef DEBUG
	*m_out << getName() << ": request sent to " << target.toString() << "\n";
#endif
	return true;
}


void eufyLookup::loop(struct timeval &tv)
{
	tv.tv_sec = 0;
	tv.tv_usec = 0;
	if (m_complete || !m_started)
		return;

	Eufy::Address from;
	int numbytes;
	while (!m_complete && ((numbytes = receive(m_message_buffer, sizeof(m_message_buffer), &from, 0)) >= 0))
		processDatagram(m_message_buffer, numbytes, from);

	if (m_complete)
		return;

	std::chrono::steady_clock::time_point now = std::chrono::steady_clock::now();
	if (now >= m_deadline)
	{
		onTimeout();
		return;
	}

	long remaining = (long)std::chrono::duration_cast<std::chrono::microseconds>(m_deadline - now).count();
	tv.tv_sec = remaining / 1000000;
	tv.tv_usec = remaining % 1000000;
}


std::vector<Eufy::Address> eufyLookup::lookup(const Eufy::Address &target)
{
	if (!start(target))
		return m_candidates;

	while (!m_complete)
	{
		struct timeval tv;
		loop(tv);
		if (m_complete)
			break;
		int timeout_ms = (int)(tv.tv_sec * 1000 + (tv.tv_usec + 999) / 1000);
		isSocketReadable(timeout_ms);
	}
	return m_candidates;
}


void eufyLookup::processDatagram(const unsigned char *buffer, const int size, const Eufy::Address &from)
{
	if (m_complete)
		return;

	try
	{
		Eufy::Frame frame = Eufy::DecodeFrame(buffer, size);
		processResponse(frame, from);
	}
	catch (const Eufy::ProtocolError &e)
	{
		*m_out << getName() << ": dropped datagram from " << from.toString() << ": " << e.what() << "\n";
	}
}


void eufyLookup::onTimeout()
{
	if (m_complete)
		return;

	if (m_candidates.empty())
		*m_out << getName() << ": no answer within " << m_timeout_ms << " ms\n";
	complete();
}


void eufyLookup::addCandidate(const Eufy::Address &address)
{
	*m_out << getName() << ": found candidate " << address.toString() << "\n";
	m_candidates.push_back(address);
}


void eufyLookup::complete()
{
	if (m_complete)
		return;

	m_complete = true;
	disconnect();
	if (m_callback)
		m_callback(m_candidates);
}
