/*
 *  Client interface for Eufy Security device access
 *
 *  Base64 encode/decode module
 *
 *
 *  Copyright 2026 - eufypp contributors
 *
 *  Licensed under GNU General Public License 3.0 or later.
 *  Some rights reserved. See COPYING, AUTHORS.
 *
 *  @license GPL-3.0+
 */

#ifndef USE_MBEDTLS

// select default encryption routines
#define USE_OPENSSL

#endif

#include <string>
#include <vector>


#ifdef USE_OPENSSL

#include <openssl/evp.h>

namespace Eufy {

static std::string base64_encode(const std::string &szInput)
{
	std::vector<unsigned char> cOutputBuffer(4 * ((szInput.length() + 2) / 3) + 1);
	int outputSize = EVP_EncodeBlock(cOutputBuffer.data(), (const unsigned char*)szInput.data(), (int)szInput.length());
	return std::string((char*)cOutputBuffer.data(), outputSize);
}

static bool base64_decode(const std::string &szInput, std::string &szOutput)
{
	if (szInput.length() % 4)
		return false;

	std::vector<unsigned char> cOutputBuffer(3 * (szInput.length() / 4) + 1);
	int outputSize = EVP_DecodeBlock(cOutputBuffer.data(), (const unsigned char*)szInput.data(), (int)szInput.length());
	if (outputSize < 0)
		return false;

	// EVP_DecodeBlock keeps the bytes that stand in for padding
	for (size_t i = szInput.length(); (i > 0) && (szInput[i - 1] == '='); i--)
		outputSize--;
	szOutput.assign((char*)cOutputBuffer.data(), outputSize);
	return true;
}

}; // namespace Eufy

#endif // USE_OPENSSL


#ifdef USE_MBEDTLS

#include <mbedtls/base64.h>

namespace Eufy {

static std::string base64_encode(const std::string &szInput)
{
	size_t outputSize = 0;
	std::vector<unsigned char> cOutputBuffer(4 * ((szInput.length() + 2) / 3) + 1);
	mbedtls_base64_encode(cOutputBuffer.data(), cOutputBuffer.size(), &outputSize, (const unsigned char*)szInput.data(), szInput.length());
	return std::string((char*)cOutputBuffer.data(), outputSize);
}

static bool base64_decode(const std::string &szInput, std::string &szOutput)
{
	size_t outputSize = 0;
	std::vector<unsigned char> cOutputBuffer(3 * (szInput.length() / 4) + 1);
	if (mbedtls_base64_decode(cOutputBuffer.data(), cOutputBuffer.size(), &outputSize, (const unsigned char*)szInput.data(), szInput.length()) != 0)
		return false;
	szOutput.assign((char*)cOutputBuffer.data(), outputSize);
	return true;
}

}; // namespace Eufy

#endif // USE_MBEDTLS
