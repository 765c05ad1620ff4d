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
	@brief Implementation of SimulatedTransport
	@ingroup transports
 */

#include "mixscope.h"

using namespace std;

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// SignalSource

double SignalSource::GetVoltage(double t_us) const
{
	if(m_type == SIGNAL_SINE)
		return m_offset + m_amplitude * sin(2 * M_PI * m_frequency * t_us * 1e-6);
	return m_offset;
}

/**
	@brief Finds the first time at or after t_us where the signal rises through a level

	@param level		Trigger level, in volts
	@param t_us			Start of the search window
	@param[out]	crossing	Time of the crossing

	@return False if the signal never crosses the level
 */
bool SignalSource::FindRisingCrossing(double level, double t_us, double& crossing) const
{
	if( (m_type != SIGNAL_SINE) || (m_amplitude <= 0) || (m_frequency <= 0) )
		return false;

	double s = (level - m_offset) / m_amplitude;
	if( (s < -1) || (s > 1) )
		return false;

	//Rising crossings sit at phase asin(s) + 2*pi*n
	double period = 1e6 / m_frequency;
	double first = asin(s) / (2 * M_PI) * period;
	double n = ceil((t_us - first) / period);
	crossing = first + n * period;
	return true;
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Construction / destruction

SimulatedTransport::SimulatedTransport(const string& args)
	: m_args(args)
	, m_clockMHz(DeviceLimits().m_clockMHz)
{
	Initialize();
}

/**
	@brief Creates a simulated device whose front end matches the ranges of a device profile
 */
SimulatedTransport::SimulatedTransport(const string& args, const DeviceProfile& profile)
	: m_args(args)
	, m_clockMHz(profile.m_limits.m_clockMHz)
{
	for(auto input : GetAllInputs())
		m_frontEnd.SetLadder(input, profile.m_calibration.GetRanges(input));
	Initialize();
}

SimulatedTransport::~SimulatedTransport()
{
}

void SimulatedTransport::Initialize()
{
	m_connected = true;
	m_stalled = false;
	m_noiseStdev = 0;
	m_triggerSlot = 0;
	m_triggerCode = 0;
	m_samplesCaptured = 0;
	m_captureDone = false;
	m_commandCount = 0;
	m_lastOpcode = 0;

	unsigned int seed = 0;
	if(!m_args.empty())
		seed = strtoul(m_args.c_str(), NULL, 10);
	m_rng.seed(seed);

	for(int i=0; i<INPUT_COUNT; i++)
		m_gain[i] = 0;

	//Function generator looped back onto the first three channels
	auto sine = SignalSource::Sine(3, 1000);
	m_sources[INPUT_CH1] = sine;
	m_sources[INPUT_CH2] = sine;
	m_sources[INPUT_CH3] = sine;

	LogDebug("Created simulated device (seed %u)\n", seed);
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Transport API

string SimulatedTransport::GetTransportName()
{
	return "sim";
}

string SimulatedTransport::GetConnectionString()
{
	return m_args;
}

bool SimulatedTransport::IsConnected()
{
	return m_connected;
}

bool SimulatedTransport::SendCommand(const vector<uint8_t>& cmd)
{
	if(!m_connected || cmd.empty())
		return false;

	LogTrace("Sending %s\n", DeviceCommand::FormatFrame(cmd).c_str());
	m_commandCount ++;
	m_lastOpcode = cmd[0];

	switch(cmd[0])
	{
		case DeviceCommand::OP_SET_PGA_GAIN:
			if( (cmd.size() != 3) || (cmd[1] >= INPUT_COUNT) )
				return false;
			if(cmd[2] >= m_frontEnd.GetRangeCount(static_cast<PhysicalInput>(cmd[1])))
				return false;
			m_gain[cmd[1]] = cmd[2];
			return true;

		case DeviceCommand::OP_CONFIGURE_TRIGGER:
			if(cmd.size() != 4)
				return false;
			m_triggerSlot = cmd[1];
			m_triggerCode = DeviceCommand::ReadWord(cmd, 2);
			return true;

		case DeviceCommand::OP_CAPTURE:
			if(cmd.size() != 9)
				return false;
			DoCapture(cmd);
			return true;

		case DeviceCommand::OP_GET_CAPTURE_STATUS:
			if(m_stalled)
			{
				m_reply.push_back(0);
				PushWord(0);
			}
			else
			{
				m_reply.push_back(m_captureDone ? 1 : 0);
				PushWord(m_samplesCaptured);
			}
			return true;

		case DeviceCommand::OP_RETRIEVE_BUFFER:
			{
				if(cmd.size() != 6)
					return false;
				size_t slot = cmd[1];
				size_t offset = DeviceCommand::ReadWord(cmd, 2);
				size_t count = DeviceCommand::ReadWord(cmd, 4);
				if( (slot >= m_buffers.size()) || (offset + count > m_buffers[slot].size()) )
					return false;
				for(size_t i=0; i<count; i++)
					PushWord(m_buffers[slot][offset + i]);
			}
			return true;

		default:
			LogWarning("Simulated device got unknown opcode %02x\n", cmd[0]);
			return false;
	}
}

size_t SimulatedTransport::ReadRawData(size_t len, unsigned char* buf)
{
	if(!m_connected)
		return 0;

	size_t n = min(len, m_reply.size());
	for(size_t i=0; i<n; i++)
	{
		buf[i] = m_reply.front();
		m_reply.pop_front();
	}
	return n;
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Device model

void SimulatedTransport::PushWord(uint16_t w)
{
	m_reply.push_back(w & 0xff);
	m_reply.push_back(w >> 8);
}

/**
	@brief Converts a pin voltage to an ADC code through the current front end range, clipping at the rails
 */
uint16_t SimulatedTransport::Digitize(PhysicalInput input, double volts, int bitDepth)
{
	auto& range = m_frontEnd.GetRange(input, m_gain[input]);
	double codes = (1 << bitDepth) - 1;
	double code = round((volts - range.m_min) / range.GetSpan() * codes);
	if(code < 0)
		return 0;
	if(code > codes)
		return codes;
	return code;
}

void SimulatedTransport::DoCapture(const vector<uint8_t>& cmd)
{
	size_t channels = cmd[1];
	int bits = cmd[2];
	auto slotOne = static_cast<PhysicalInput>(cmd[3]);
	size_t samples = DeviceCommand::ReadWord(cmd, 4);
	double timegap = DeviceCommand::ReadWord(cmd, 6) / m_clockMHz;
	bool triggered = (cmd[8] != 0);

	m_buffers.clear();
	m_captureDone = false;
	m_samplesCaptured = 0;
	if( (channels < 1) || (channels > NUM_CAPTURE_SLOTS) || (slotOne >= INPUT_COUNT) || (bits < 1) || (bits > 16) )
	{
		LogWarning("Simulated device rejected malformed capture command\n");
		return;
	}

	PhysicalInput inputs[NUM_CAPTURE_SLOTS] = {slotOne, INPUT_CH2, INPUT_CH3, INPUT_CH4};

	uniform_real_distribution<double> startdist(0, 1e6);
	double tstart = startdist(m_rng);

	if(triggered)
	{
		double level = 0;
		if(m_triggerSlot < channels)
		{
			auto tin = inputs[m_triggerSlot];
			auto& range = m_frontEnd.GetRange(tin, m_gain[tin]);
			level = range.m_min + m_triggerCode * range.GetSpan() / ((1 << bits) - 1);
		}

		double crossing;
		if( (m_triggerSlot < channels) && m_sources[inputs[m_triggerSlot]].FindRisingCrossing(level, tstart, crossing) )
			tstart = crossing;
		else
			LogDebug("Simulated trigger timed out, forcing trigger\n");
	}

	normal_distribution<double> noise(0, m_noiseStdev);
	for(size_t i=0; i<channels; i++)
	{
		vector<uint16_t> buf(samples);
		for(size_t j=0; j<samples; j++)
		{
			double v = m_sources[inputs[i]].GetVoltage(tstart + j*timegap);
			if(m_noiseStdev > 0)
				v += noise(m_rng);
			buf[j] = Digitize(inputs[i], v, bits);
		}
		m_buffers.push_back(buf);
	}

	m_samplesCaptured = samples;
	m_captureDone = true;
}
