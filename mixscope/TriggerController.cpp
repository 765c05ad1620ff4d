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
	@brief Implementation of TriggerController
	@ingroup triggers
 */

#include "mixscope.h"

using namespace std;

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// TriggerSource

TriggerSource TriggerSource::Slot(size_t slot)
{
	TriggerSource ret;
	ret.m_type = SOURCE_SLOT;
	ret.m_slot = slot;
	ret.m_input = INPUT_CH1;
	return ret;
}

TriggerSource TriggerSource::Input(PhysicalInput input)
{
	TriggerSource ret;
	ret.m_type = SOURCE_INPUT;
	ret.m_slot = 0;
	ret.m_input = input;
	return ret;
}

string TriggerSource::GetName() const
{
	if(m_type == SOURCE_SLOT)
		return string("slot ") + to_string(m_slot);
	return GetInputName(m_input);
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Construction / destruction

TriggerController::TriggerController()
	: m_enabled(false)
	, m_source(TriggerSource::Slot(1))
	, m_level(0)
{
}

TriggerController::~TriggerController()
{
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Configuration

/**
	@brief Sets the trigger source and level

	The source is checked against the current channel mapping first. If it is rejected, the previous configuration
	(including the enable state) is left untouched.

	@param source	Slot or input to watch
	@param level	Trigger level, in volts
	@param registry	Current channel mapping
	@param enable	Arm the trigger as well
 */
void TriggerController::Configure(const TriggerSource& source, float level, const ChannelRegistry& registry, bool enable)
{
	size_t slot = ResolveSlot(source, registry);

	m_source = source;
	m_level = level;
	if(enable)
		m_enabled = true;

	LogDebug("Trigger on %s (slot %zu) at %.3f V, %s\n",
		source.GetName().c_str(), slot, level, m_enabled ? "enabled" : "disabled");
}

/**
	@brief Stores a source and level with the trigger disabled

	Routing is not checked here. Enable() and every triggered capture check it against the mapping in force at that
	point. A slot number that can never exist is still rejected.

	@throw InvalidChannelError if the source is a slot outside 1 to NUM_CAPTURE_SLOTS
 */
void TriggerController::ConfigureDisarmed(const TriggerSource& source, float level)
{
	bool badSlot = (source.m_slot < 1) || (source.m_slot > NUM_CAPTURE_SLOTS);
	if( (source.m_type == TriggerSource::SOURCE_SLOT) && badSlot)
	{
		LogError("Slot %zu does not exist\n", source.m_slot);
		throw InvalidChannelError(string("invalid channel: slot ") + to_string(source.m_slot));
	}

	m_source = source;
	m_level = level;
	m_enabled = false;

	LogDebug("Trigger on %s at %.3f V, disabled\n", source.GetName().c_str(), level);
}

/**
	@brief Arms the trigger with the current configuration, which must still be routable
 */
void TriggerController::Enable(const ChannelRegistry& registry)
{
	ResolveSlot(m_source, registry);
	m_enabled = true;
}

void TriggerController::Disable()
{
	m_enabled = false;
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Routing

/**
	@brief Finds the slot the trigger watches under the current mapping

	Called again at capture time so a remap after configuration is never silently ignored.
 */
size_t TriggerController::ResolveSlot(const ChannelRegistry& registry) const
{
	return ResolveSlot(m_source, registry);
}

size_t TriggerController::ResolveSlot(const TriggerSource& source, const ChannelRegistry& registry)
{
	size_t slot = source.m_slot;
	if(source.m_type == TriggerSource::SOURCE_INPUT)
	{
		if(!registry.FindSlot(source.m_input, slot))
		{
			LogError("Cannot trigger on %s: not routed to any capture slot\n", GetInputName(source.m_input).c_str());
			throw TypeMismatchError(GetInputName(source.m_input) + " is not routed to an ADC");
		}
	}

	//Throws InvalidChannelError for a slot that doesn't exist
	auto input = registry.Resolve(slot);
	if(!IsDirectlyDigitized(input))
	{
		LogError("Cannot trigger on %s: slot %zu reads from %s, which is not directly digitized\n",
			source.GetName().c_str(), slot, GetInputName(input).c_str());
		throw TypeMismatchError(source.GetName() + " is mapped to " + GetInputName(input) + ", not an ADC input");
	}

	return slot;
}
