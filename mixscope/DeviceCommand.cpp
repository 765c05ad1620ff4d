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
	@brief Implementation of DeviceCommand
	@ingroup transports
 */

#include "mixscope.h"

using namespace std;

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Frame builders

DeviceCommand DeviceCommand::SetGain(PhysicalInput input, size_t rung)
{
	DeviceCommand cmd(OP_SET_PGA_GAIN);
	cmd.PushByte(input);
	cmd.PushByte(rung);
	return cmd;
}

/**
	@brief Arms the trigger comparator

	@param slotIndex	Zero based index of the capture slot to watch
	@param levelCode	Level as a raw ADC code at the resolution of the upcoming capture
 */
DeviceCommand DeviceCommand::ConfigureTrigger(size_t slotIndex, uint16_t levelCode)
{
	DeviceCommand cmd(OP_CONFIGURE_TRIGGER);
	cmd.PushByte(slotIndex);
	cmd.PushWord(levelCode);
	return cmd;
}

DeviceCommand DeviceCommand::Capture(
	size_t channels,
	int bitDepth,
	PhysicalInput slotOne,
	size_t samples,
	uint32_t ticks,
	bool triggered)
{
	DeviceCommand cmd(OP_CAPTURE);
	cmd.PushByte(channels);
	cmd.PushByte(bitDepth);
	cmd.PushByte(slotOne);
	cmd.PushWord(samples);
	cmd.PushWord(ticks);
	cmd.PushByte(triggered ? 1 : 0);
	return cmd;
}

DeviceCommand DeviceCommand::GetCaptureStatus()
{
	return DeviceCommand(OP_GET_CAPTURE_STATUS);
}

DeviceCommand DeviceCommand::RetrieveBuffer(size_t slotIndex, size_t offset, size_t count)
{
	DeviceCommand cmd(OP_RETRIEVE_BUFFER);
	cmd.PushByte(slotIndex);
	cmd.PushWord(offset);
	cmd.PushWord(count);
	return cmd;
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Helpers

///@brief Formats a frame as space separated hex bytes, for trace logging
string DeviceCommand::FormatFrame(const vector<uint8_t>& frame)
{
	string ret;
	char tmp[4];
	for(auto b : frame)
	{
		if(!ret.empty())
			ret += " ";
		snprintf(tmp, sizeof(tmp), "%02x", b);
		ret += tmp;
	}
	return ret;
}

///@brief Reads a little-endian word out of a frame, returning 0 past the end
uint16_t DeviceCommand::ReadWord(const vector<uint8_t>& frame, size_t offset)
{
	if(offset + 2 > frame.size())
		return 0;
	return frame[offset] | (frame[offset + 1] << 8);
}
