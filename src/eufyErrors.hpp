/*
 *  Client interface for Eufy Security device access
 *
 *  Exception types raised by the codec, session policy and REST layers
 *
 *
 *  Copyright 2026 - eufypp contributors
 *
 *  Licensed under GNU General Public License 3.0 or later.
 *  Some rights reserved. See COPYING, AUTHORS.
 *
 *  @license GPL-3.0+
 */

#ifndef _eufyErrors
#define _eufyErrors

#include <stdexcept>
#include <string>

namespace Eufy {

class Error : public std::runtime_error
{
public:
	explicit Error(const std::string &message) : std::runtime_error(message) {}
};

// malformed or unrecognized frame
class ProtocolError : public Error
{
public:
	explicit ProtocolError(const std::string &message) : Error(message) {}
};

// no usable session could be established
class ConnectionError : public Error
{
public:
	explicit ConnectionError(const std::string &message) : Error(message) {}
};

// the owning station of a device is not known
class LookupError : public ConnectionError
{
public:
	explicit LookupError(const std::string &message) : ConnectionError(message) {}
};

// handshake explicitly rejected by the device
class AuthenticationError : public Error
{
public:
	explicit AuthenticationError(const std::string &message) : Error(message) {}
};

class RequestError : public Error
{
public:
	explicit RequestError(const std::string &message, int code = 0) : Error(message), m_code(code) {}
	int code() const { return m_code; }

private:
	int m_code;
};

class InvalidCredentialsError : public RequestError
{
public:
	explicit InvalidCredentialsError(const std::string &message, int code = 0) : RequestError(message, code) {}
};

class ParamError : public Error
{
public:
	explicit ParamError(const std::string &message) : Error(message) {}
};

// operation not available for this device type
class UnsupportedError : public Error
{
public:
	explicit UnsupportedError(const std::string &message) : Error(message) {}
};

}; // namespace Eufy

#endif // _eufyErrors
