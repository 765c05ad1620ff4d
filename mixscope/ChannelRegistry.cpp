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
	@brief Implementation of ChannelRegistry
	@ingroup core
 */

#include "mixscope.h"

using namespace std;

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Construction / destruction

ChannelRegistry::ChannelRegistry()
	: m_channelOneMap(INPUT_CH1)
{
}

ChannelRegistry::~ChannelRegistry()
{
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Slot resolution

/**
	@brief Gets the physical input a slot currently reads from

	@param slot		Logical slot, 1 to NUM_CAPTURE_SLOTS
 */
PhysicalInput ChannelRegistry::Resolve(size_t slot) const
{
	switch(slot)
	{
		case 1:
			return m_channelOneMap;
		case 2:
			return INPUT_CH2;
		case 3:
			return INPUT_CH3;
		case 4:
			return INPUT_CH4;

		default:
			LogError("Slot %zu does not exist\n", slot);
			throw InvalidChannelError(string("invalid channel: slot ") + to_string(slot));
	}
}

/**
	@brief Finds the lowest numbered slot bound to an input

	@param input		The input to look for
	@param[out]	slot	The slot, untouched if the input is not bound

	@return True if some slot reads from the input
 */
bool ChannelRegistry::FindSlot(PhysicalInput input, size_t& slot) const
{
	for(size_t i=1; i<=NUM_CAPTURE_SLOTS; i++)
	{
		if(Resolve(i) == input)
		{
			slot = i;
			return true;
		}
	}
	return false;
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Remapping

///@brief Checks if the slot 1 multiplexer can be pointed at an input
bool ChannelRegistry::IsAllowedChannelOneMap(PhysicalInput input)
{
	return (input >= INPUT_CH1) && (input < INPUT_COUNT);
}

void ChannelRegistry::SetChannelOneMap(PhysicalInput input)
{
	Remap(1, input);
}

/**
	@brief Points slot 1 at an input given by name

	An unknown name throws InvalidChannelError and leaves the previous mapping in place.
 */
void ChannelRegistry::SetChannelOneMap(const string& name)
{
	Remap(1, ParseInputNameOrThrow(name));
}

/**
	@brief Rebinds a slot to a different input. Only slot 1 is remappable.
 */
void ChannelRegistry::Remap(size_t slot, PhysicalInput input)
{
	if(slot != 1)
	{
		LogError("Slot %zu is hard wired and cannot be remapped\n", slot);
		throw InvalidChannelError(string("invalid channel: slot ") + to_string(slot) + " cannot be remapped");
	}

	if(!IsAllowedChannelOneMap(input))
	{
		LogError("Slot 1 cannot be mapped to %s\n", GetInputName(input).c_str());
		throw InvalidChannelError(string("invalid channel: ") + GetInputName(input));
	}

	LogDebug("Slot 1 now reads from %s\n", GetInputName(input).c_str());
	m_channelOneMap = input;
}
