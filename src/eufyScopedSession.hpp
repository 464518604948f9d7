/*
 *	Client interface for Eufy Security device access
 *
 *	Scope guard around a session. A guard either borrows a session that the
 *	caller keeps owning, or owns a session opened on the caller's behalf and
 *	closes it exactly once when the guard goes out of scope.
 *
 *
 *	Copyright 2026 - eufypp contributors
 *
 *	Licensed under GNU General Public License 3.0 or later.
 *	Some rights reserved. See COPYING, AUTHORS.
 *
 *	@license GPL-3.0+
 */

#ifndef _eufyScopedSession
#define _eufyScopedSession

#include "eufySession.hpp"
#include <memory>


class eufyScopedSession
{

public:
	explicit eufyScopedSession(eufySession *borrowed);
	explicit eufyScopedSession(std::unique_ptr<eufySession> owned);
	eufyScopedSession(eufyScopedSession &&other);
	~eufyScopedSession();

	eufyScopedSession(const eufyScopedSession&) = delete;
	eufyScopedSession& operator=(const eufyScopedSession&) = delete;
	eufyScopedSession& operator=(eufyScopedSession&&) = delete;

	eufySession *operator->() const { return m_session; }
	eufySession &operator*() const { return *m_session; }
	eufySession *get() const { return m_session; }
	bool isOwned() const { return m_owned != nullptr; }

private:
	std::unique_ptr<eufySession> m_owned;
	eufySession *m_session;
};

#endif // _eufyScopedSession
