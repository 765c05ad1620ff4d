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
	@brief Implementation of AcquisitionEngine
	@ingroup core
 */

#include "mixscope.h"

using namespace std;

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Construction / destruction

AcquisitionEngine::AcquisitionEngine(
	ScopeTransport* transport,
	const DeviceLimits& limits,
	const ChannelRegistry& registry,
	const TriggerController& trigger,
	const VoltageConverter& converter)
	: m_transport(transport)
	, m_limits(limits)
	, m_registry(registry)
	, m_trigger(trigger)
	, m_converter(converter)
{
}

AcquisitionEngine::~AcquisitionEngine()
{
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Validation

/**
	@brief Checks a request against the device limits and current configuration

	Nothing is sent to the device. The checks run in a fixed order and the first failure is thrown.
 */
void AcquisitionEngine::Validate(const CaptureRequest& request) const
{
	size_t nchans = request.m_channelCount;
	if( (nchans < 1) || (nchans > NUM_CAPTURE_SLOTS) )
	{
		LogError("Cannot capture %zu channels, must be 1 to %d\n", nchans, NUM_CAPTURE_SLOTS);
		throw RangeError(RangeError::TOO_MANY_CHANNELS, "too many channels");
	}

	//Measurement front ends can't share the ADC with other channels
	for(size_t slot=1; slot<=nchans; slot++)
	{
		auto input = m_registry.Resolve(slot);
		if( (nchans > 1) && !IsDirectlyDigitized(input) )
		{
			LogError("Slot %zu reads from %s, which can only be captured on its own\n",
				slot, GetInputName(input).c_str());
			throw InvalidChannelError(string("invalid channel: ") + GetInputName(input));
		}
	}

	if(request.m_sampleCount == 0)
	{
		LogError("Cannot capture zero samples\n");
		throw RangeError(RangeError::TOO_FEW_SAMPLES, "too few samples");
	}

	double mingap = m_limits.GetMinimumTimegap(nchans, m_trigger.IsEnabled());
	if( !(request.m_timegap >= mingap) )
	{
		LogError("Timegap %.3f us is below the %.3f us minimum for %zu channels\n",
			request.m_timegap, mingap, nchans);
		throw RangeError(RangeError::TIMEGAP_TOO_SMALL, "timegap too small");
	}
	double ticks = m_limits.QuantizeTimegap(request.m_timegap);
	if( !isfinite(ticks) || (ticks > 0xffff) )
	{
		LogError("Timegap %.3f us is longer than the capture timer can count\n", request.m_timegap);
		throw RangeError(RangeError::TIMEGAP_TOO_LARGE, "timegap too large");
	}

	if(request.m_sampleCount > m_limits.m_bufferCapacity / nchans)
	{
		LogError("%zu samples on %zu channels exceeds the %zu sample buffer\n",
			request.m_sampleCount, nchans, m_limits.m_bufferCapacity);
		throw RangeError(RangeError::TOO_MANY_SAMPLES, "too many samples");
	}

	//The comparator only sees the ADC stream, so the trigger source has to be one of the captured slots
	if(m_trigger.IsEnabled())
	{
		size_t slot = m_trigger.ResolveSlot(m_registry);
		if(slot > nchans)
		{
			LogError("Trigger watches slot %zu, but only %zu channels are captured\n", slot, nchans);
			throw TypeMismatchError(m_trigger.GetSource().GetName() + " is not part of the capture");
		}
	}
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Capture

/**
	@brief Runs a capture and returns the calibrated waveforms

	Blocks until the device reports completion, which includes waiting for the trigger if it is armed.

	@throw RangeError, InvalidChannelError, TypeMismatchError on a rejected request (nothing sent to the device)
	@throw TransportError if communication fails part way through
 */
CaptureResult AcquisitionEngine::Capture(const CaptureRequest& request)
{
	Validate(request);

	size_t nchans = request.m_channelCount;
	size_t depth = request.m_sampleCount;
	int bits = ResolutionFor(nchans);
	auto ticks = static_cast<uint32_t>(m_limits.QuantizeTimegap(request.m_timegap));
	bool triggered = m_trigger.IsEnabled();

	CaptureResult ret;
	ret.m_timegap = m_limits.TicksToMicroseconds(ticks);
	ret.m_bitDepth = bits;
	ret.m_triggered = triggered;

	LogDebug("Capturing %zu x %zu samples at %.3f us, %d bits%s\n",
		nchans, depth, ret.m_timegap, bits, triggered ? ", triggered" : "");
	LogIndenter li;

	if(triggered)
		ArmTrigger(m_trigger.ResolveSlot(m_registry), bits);

	Send(DeviceCommand::Capture(nchans, bits, m_registry.GetChannelOneMap(), depth, ticks, triggered));
	WaitForCapture(depth);

	//Pull all the data before converting anything, so a failed read doesn't leave a partial result around
	vector< vector<uint16_t> > raw;
	for(size_t i=0; i<nchans; i++)
		raw.push_back(ReadChannel(i, depth, bits));

	ret.m_timeAxis.resize(depth);
	for(size_t i=0; i<depth; i++)
		ret.m_timeAxis[i] = i * ret.m_timegap;

	for(size_t i=0; i<nchans; i++)
	{
		auto input = m_registry.Resolve(i+1);
		ret.m_inputs.push_back(input);
		ret.m_voltages.push_back(m_converter.ToVolts(input, raw[i], bits));
	}

	return ret;
}

/**
	@brief Loads the trigger comparator for the upcoming capture

	The level goes to the device as a raw code, so it has to be converted at the bit depth of this capture.
 */
void AcquisitionEngine::ArmTrigger(size_t slot, int bitDepth)
{
	auto input = m_registry.Resolve(slot);
	float level = m_trigger.GetLevel();

	auto& range = m_converter.GetRange(input);
	if( (level < range.m_min) || (level > range.m_max) )
	{
		LogWarning("Trigger level %.3f V is outside the %.3f to %.3f V range of %s, capture will only start on timeout\n",
			level, range.m_min, range.m_max, GetInputName(input).c_str());
	}

	Send(DeviceCommand::ConfigureTrigger(slot - 1, m_converter.ToRawCode(input, level, bitDepth)));
}

/**
	@brief Polls the device until the capture is complete

	A transport with a nonzero timeout bounds the total wait. Otherwise this blocks as long as the device does.
 */
void AcquisitionEngine::WaitForCapture(size_t samples)
{
	auto timeout = m_transport->GetTimeout();
	auto start = chrono::steady_clock::now();

	while(true)
	{
		Send(DeviceCommand::GetCaptureStatus());
		auto reply = m_transport->ReadReply(3);
		bool done = (reply[0] != 0);
		size_t captured = DeviceCommand::ReadWord(reply, 1);

		if(done)
		{
			if(captured < samples)
			{
				LogError("Device finished with %zu of %zu samples\n", captured, samples);
				throw TransportError("device returned an incomplete capture");
			}
			return;
		}

		if( (timeout.count() > 0) && (chrono::steady_clock::now() - start > timeout) )
		{
			LogError("Capture did not complete within %lld ms\n", static_cast<long long>(timeout.count()));
			throw TransportError("capture timed out");
		}

		this_thread::sleep_for(chrono::milliseconds(1));
	}
}

/**
	@brief Fetches one channel's buffer, split into transfers the device can handle
 */
vector<uint16_t> AcquisitionEngine::ReadChannel(size_t slotIndex, size_t samples, int bitDepth)
{
	vector<uint16_t> ret;
	ret.reserve(samples);

	for(size_t offset = 0; offset < samples; )
	{
		size_t count = min(samples - offset, m_limits.m_maxSamplesPerRead);
		Send(DeviceCommand::RetrieveBuffer(slotIndex, offset, count));
		auto chunk = m_transport->ReadSamples(count, bitDepth);
		ret.insert(ret.end(), chunk.begin(), chunk.end());
		offset += count;
	}

	return ret;
}

/**
	@brief Sends one frame, converting a failed send into TransportError
 */
void AcquisitionEngine::Send(const DeviceCommand& cmd)
{
	if(!m_transport->IsConnected())
	{
		LogError("Transport %s is not connected\n", m_transport->GetConnectionString().c_str());
		throw TransportError("transport not connected");
	}

	if(!m_transport->SendCommand(cmd.GetFrame()))
	{
		LogError("Failed to send command %s\n", DeviceCommand::FormatFrame(cmd.GetFrame()).c_str());
		throw TransportError("failed to send command");
	}
}
