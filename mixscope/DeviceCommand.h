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
	@brief Declaration of DeviceCommand
	@ingroup transports
 */

#ifndef DeviceCommand_h
#define DeviceCommand_h

/**
	@brief Builder for the command frames written to the device

	A frame is one opcode byte followed by the arguments, multi-byte values little endian.

	@ingroup transports
 */
class DeviceCommand
{
public:

	enum Opcode
	{
		///@brief Set the front end gain of an input. Args: input, rung
		OP_SET_PGA_GAIN			= 0x01,

		///@brief Arm the level trigger. Args: slot index, level code (u16)
		OP_CONFIGURE_TRIGGER	= 0x02,

		///@brief Start a capture. Args: channels, bits, slot 1 input, samples (u16), ticks (u16), trigger
		OP_CAPTURE				= 0x03,

		///@brief Poll capture progress. Reply: done, samples captured (u16)
		OP_GET_CAPTURE_STATUS	= 0x04,

		///@brief Read part of a channel buffer. Args: slot index, offset (u16), count (u16). Reply: count words
		OP_RETRIEVE_BUFFER		= 0x05
	};

	DeviceCommand(Opcode op)
	{ m_frame.push_back(op); }

	void PushByte(uint8_t b)
	{ m_frame.push_back(b); }

	void PushWord(uint16_t w)
	{
		m_frame.push_back(w & 0xff);
		m_frame.push_back(w >> 8);
	}

	const std::vector<uint8_t>& GetFrame() const
	{ return m_frame; }

	static DeviceCommand SetGain(PhysicalInput input, size_t rung);
	static DeviceCommand ConfigureTrigger(size_t slotIndex, uint16_t levelCode);
	static DeviceCommand Capture(
		size_t channels,
		int bitDepth,
		PhysicalInput slotOne,
		size_t samples,
		uint32_t ticks,
		bool triggered);
	static DeviceCommand GetCaptureStatus();
	static DeviceCommand RetrieveBuffer(size_t slotIndex, size_t offset, size_t count);

	static std::string FormatFrame(const std::vector<uint8_t>& frame);
	static uint16_t ReadWord(const std::vector<uint8_t>& frame, size_t offset);

protected:
	std::vector<uint8_t> m_frame;
};

#endif
