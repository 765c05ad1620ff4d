/***********************************************************************************************************************
*                                                                                                                      *
* libmixscope                                                                                                          *
*                                                                                                                      *
* Copyright (c) 2012-2024 Andrew D. Zonenberg and contributors                                                         *
* All rights reserved.                                                                                                 *
*                                                                                                                      *
* Redistribution and use in source and binary forms, with or without modification, are permitted provided that the     *
* following conditions are met:                                                                                        *
*                                                                                                                      *
*    * Redistributions of source code must retain the above copyright notice, this list of conditions, and the         *
*      following disclaimer.                                                                                           *
*                                                                                                                      *
*    * Redistributions in binary form must reproduce the above copyright notice, this list of conditions and the       *
*      following disclaimer in the documentation and/or other materials provided with the distribution.                *
*                                                                                                                      *
*    * Neither the name of the author nor the names of any contributors may be used to endorse or promote products     *
*      derived from this software without specific prior written permission.                                           *
*                                                                                                                      *
* THIS SOFTWARE IS PROVIDED BY THE AUTHORS "AS IS" AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED   *
* TO, THE IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE ARE DISCLAIMED. IN NO EVENT SHALL *
* THE AUTHORS BE HELD LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL DAMAGES        *
* (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR SERVICES; LOSS OF USE, DATA, OR PROFITS; OR       *
* BUSINESS INTERRUPTION) HOWEVER CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY, OR TORT *
* (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE OF THIS SOFTWARE, EVEN IF ADVISED OF THE       *
* POSSIBILITY OF SUCH DAMAGE.                                                                                          *
*                                                                                                                      *
***********************************************************************************************************************/

/**
	@file
	@brief Implementation of ScopeTransport
	@ingroup transports
 */

#include "mixscope.h"

using namespace std;

ScopeTransport::CreateMapType ScopeTransport::m_createprocs;

ScopeTransport::ScopeTransport()
	: m_timeout(0)
{
}

ScopeTransport::~ScopeTransport()
{
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Enumeration

void ScopeTransport::DoAddTransportClass(string name, CreateProcType proc)
{
	m_createprocs[name] = proc;
}

void ScopeTransport::EnumTransports(vector<string>& names)
{
	for(CreateMapType::iterator it=m_createprocs.begin(); it != m_createprocs.end(); ++it)
		names.push_back(it->first);
}

/**
	@brief Creates a transport by name

	@return The new transport (owned by the caller), or nullptr if the name is not registered
 */
ScopeTransport* ScopeTransport::CreateTransport(const string& transport, const string& args)
{
	if(m_createprocs.find(transport) != m_createprocs.end())
		return m_createprocs[transport](args);

	LogError("Invalid transport name \"%s\"\n", transport.c_str());
	return nullptr;
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Reply helpers

/**
	@brief Reads exactly len bytes of reply

	@throw TransportError on a short read
 */
vector<uint8_t> ScopeTransport::ReadReply(size_t len)
{
	vector<uint8_t> ret(len);
	if(len == 0)
		return ret;

	size_t got = ReadRawData(len, &ret[0]);
	if(got != len)
	{
		LogError("Short read from %s: got %zu of %zu bytes\n", GetConnectionString().c_str(), got, len);
		throw TransportError("short read from device");
	}
	return ret;
}

/**
	@brief Reads a block of raw ADC codes

	Codes are sent as little-endian 16-bit words. Bits above the capture resolution carry no data and are masked off.

	@param count	Number of samples to read
	@param bitDepth	Resolution of the capture
 */
vector<uint16_t> ScopeTransport::ReadSamples(size_t count, int bitDepth)
{
	auto raw = ReadReply(count * 2);

	uint16_t mask = (1 << bitDepth) - 1;
	vector<uint16_t> ret(count);
	for(size_t i=0; i<count; i++)
		ret[i] = (raw[i*2] | (raw[i*2 + 1] << 8)) & mask;

	LogTrace("Got %zu %d-bit samples\n", count, bitDepth);
	return ret;
}
