/*
 *	Client interface for Eufy Security device access
 *
 *	Base class for address lookups. A lookup sends a single request and then
 *	collects candidate addresses until the derived class declares itself
 *	satisfied or the timeout expires, whichever comes first. The result is
 *	resolved exactly once; later responses or a late timeout are ignored.
 *
 *	Async functions (application event loop):
 *	 - start(target)
 *		Opens the socket, sends the request and arms the timeout
 *		Returns true|false indicating success or failure
 *	 - loop(tv)
 *		Reads pending datagrams and checks the timeout. On return `tv` holds
 *		the time left until the timeout, to be used in the caller's select()
 *	 - get_fd() / wants_read()
 *		Socket to watch for the caller's select() or poll()
 *	 - isComplete()
 *		Returns true once the result has been resolved
 *
 *	Blocking function:
 *	 - lookup(target)
 *		Runs start() and loop() until the result is resolved
 *		Returns the candidate list, which is empty when nothing answered
 *
 *
 *	Copyright 2026 - eufypp contributors
 *
 *	Licensed under GNU General Public License 3.0 or later.
 *	Some rights reserved. See COPYING, AUTHORS.
 *
 *	@license GPL-3.0+
 */

#ifndef _eufyLookup
#define _eufyLookup

// default lookup timeout for relay and local discovery
#define EUFY_LOOKUP_TIMEOUT_MS 1500

#define EUFY_LOOKUP_BUFFER_SIZE 1024

#include "eufyUDP.hpp"
#include "eufyFrame.hpp"
#include <string>
#include <vector>
#include <chrono>
#include <functional>
#include <ostream>
#include <sys/time.h>


class eufyLookup : public eufyUDP
{

public:
	typedef std::function<void(const std::vector<Eufy::Address>&)> CompletionCallback;

	eufyLookup(const int timeout_ms, std::ostream *out);
	virtual ~eufyLookup() {}

	bool start(const Eufy::Address &target);
	void loop(struct timeval &tv);
	std::vector<Eufy::Address> lookup(const Eufy::Address &target);

	// feed one received datagram into the lookup
	void processDatagram(const unsigned char *buffer, const int size, const Eufy::Address &from);
	// expire the lookup as if its timer fired
	void onTimeout();

	bool isComplete() const { return m_complete; }
	bool wants_read() const { return !m_complete && (get_fd() >= 0); }
	const std::vector<Eufy::Address> &getCandidates() const { return m_candidates; }
	void setCompletionCallback(CompletionCallback callback) { m_callback = callback; }
	int getTimeout() const { return m_timeout_ms; }

protected:
	virtual bool sendRequest(const Eufy::Address &target) = 0;
	virtual void processResponse(const Eufy::Frame &frame, const Eufy::Address &from) = 0;
	virtual const char *getName() const = 0;

	void addCandidate(const Eufy::Address &address);
	void complete();

	std::ostream *m_out;
	std::vector<Eufy::Address> m_candidates;

private:
	int m_timeout_ms;
	bool m_started;
	bool m_complete;
	std::chrono::steady_clock::time_point m_deadline;
	CompletionCallback m_callback;
	unsigned char m_message_buffer[EUFY_LOOKUP_BUFFER_SIZE];
};

#endif // _eufyLookup
