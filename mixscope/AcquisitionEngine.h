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
	@brief Declaration of AcquisitionEngine
	@ingroup core
 */
#ifndef AcquisitionEngine_h
#define AcquisitionEngine_h

/**
	@brief Validates capture requests and runs them on the device

	Does no locking of its own. The owning session holds the transport mutex around every call.

	@ingroup core
 */
class AcquisitionEngine
{
public:
	AcquisitionEngine(
		ScopeTransport* transport,
		const DeviceLimits& limits,
		const ChannelRegistry& registry,
		const TriggerController& trigger,
		const VoltageConverter& converter);
	virtual ~AcquisitionEngine();

	CaptureResult Capture(const CaptureRequest& request);
	void Validate(const CaptureRequest& request) const;

	void Send(const DeviceCommand& cmd);

protected:
	void ArmTrigger(size_t slot, int bitDepth);
	void WaitForCapture(size_t samples);
	std::vector<uint16_t> ReadChannel(size_t slotIndex, size_t samples, int bitDepth);

	ScopeTransport* m_transport;
	const DeviceLimits& m_limits;
	const ChannelRegistry& m_registry;
	const TriggerController& m_trigger;
	const VoltageConverter& m_converter;
};

#endif
