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
	@brief Declaration of ScopeTransport
	@ingroup transports
 */

#ifndef ScopeTransport_h
#define ScopeTransport_h

/**
	@brief Abstraction of the byte channel between the host and the device

	Implementations only need to move bytes. Everything above that (sample unpacking, error reporting to the
	caller) is done here or in the acquisition engine.

	The device has no command queue, so only one command sequence may be in flight at a time. Callers that issue a
	multi-command sequence must hold GetMutex() for its whole duration.

	@ingroup transports
 */
class ScopeTransport
{
public:
	ScopeTransport();
	virtual ~ScopeTransport();

	virtual std::string GetConnectionString() =0;
	virtual std::string GetName() =0;

	//Manual mutex locking for multi-command sequences
	std::recursive_mutex& GetMutex()
	{ return m_netMutex; }

	//Raw byte API
	virtual bool SendCommand(const std::vector<uint8_t>& cmd) =0;
	virtual size_t ReadRawData(size_t len, unsigned char* buf) =0;
	virtual bool IsConnected() =0;

	//Helpers built on the raw API
	std::vector<uint8_t> ReadReply(size_t len);
	std::vector<uint16_t> ReadSamples(size_t count, int bitDepth);

	/**
		@brief Sets how long a single read may block before it is reported as a failure

		A zero timeout blocks forever. Since the trigger wait happens inside the device, this is also the only way
		to bound how long a triggered capture can take.
	 */
	void SetTimeout(std::chrono::milliseconds timeout)
	{ m_timeout = timeout; }

	std::chrono::milliseconds GetTimeout()
	{ return m_timeout; }

public:
	typedef ScopeTransport* (*CreateProcType)(const std::string& args);
	static void DoAddTransportClass(std::string name, CreateProcType proc);

	static void EnumTransports(std::vector<std::string>& names);
	static ScopeTransport* CreateTransport(const std::string& transport, const std::string& args);

protected:

	//Class enumeration
	typedef std::map< std::string, CreateProcType > CreateMapType;
	static CreateMapType m_createprocs;

	std::recursive_mutex m_netMutex;

	std::chrono::milliseconds m_timeout;
};

#define TRANSPORT_INITPROC(T) \
	static ScopeTransport* CreateInstance(const std::string& args) \
	{ \
		return new T(args); \
	} \
	virtual std::string GetName() override \
	{ return GetTransportName(); }

#define AddTransportClass(T) ScopeTransport::DoAddTransportClass(T::GetTransportName(), T::CreateInstance)

#endif
