/*
 *	Client interface for Eufy Security device access
 *
 *	Scope guard around a session
 *
 *
 *	Copyright 2026 - eufypp contributors
 *
 *	Licensed under GNU General Public License 3.0 or later.
 *	Some rights reserved. See COPYING, AUTHORS.
 *
 *	@license GPL-3.0+
 */

#include "eufyScopedSession.hpp"


eufyScopedSession::eufyScopedSession(eufySession *borrowed)
	: m_owned()
	, m_session(borrowed)
{
}


eufyScopedSession::eufyScopedSession(std::unique_ptr<eufySession> owned)
	: m_owned(std::move(owned))
	, m_session(m_owned.get())
{
}


eufyScopedSession::eufyScopedSession(eufyScopedSession &&other)
	: m_owned(std::move(other.m_owned))
	, m_session(other.m_session)
{
	other.m_session = nullptr;
}


eufyScopedSession::~eufyScopedSession()
{
	if (m_owned)
		m_owned->close();
}
