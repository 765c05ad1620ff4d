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
	@brief Implementation of DeviceLimits
	@ingroup core
 */

#include "mixscope.h"

using namespace std;

/**
	@brief Gets the ADC bit depth used for a capture with the given number of channels

	Single channel captures get the full 12-bit converter. As soon as the ADC is multiplexed between several inputs
	it runs in 10-bit mode.
 */
int ResolutionFor(size_t channelCount)
{
	if(channelCount <= 1)
		return 12;
	return 10;
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Construction / destruction

DeviceLimits::DeviceLimits()
	: m_bufferCapacity(10000)
	, m_clockMHz(8)
	, m_maxSamplesPerRead(2500)
{
	//Untriggered / triggered minimums, in microseconds
	m_minTimegap[0][0] = 0.5;
	m_minTimegap[0][1] = 0.75;
	m_minTimegap[1][0] = 0.875;
	m_minTimegap[1][1] = 0.875;
	m_minTimegap[2][0] = 1.75;
	m_minTimegap[2][1] = 1.75;
	m_minTimegap[3][0] = 1.75;
	m_minTimegap[3][1] = 1.75;
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Accessors

/**
	@brief Gets the smallest legal inter-sample interval

	Multiplexed captures need more time per composite sample, and arming the trigger comparator costs a little more
	in single channel mode.

	@param channelCount	Number of channels in the capture, 1 to NUM_CAPTURE_SLOTS
	@param triggered	True if the trigger is enabled
 */
double DeviceLimits::GetMinimumTimegap(size_t channelCount, bool triggered) const
{
	if( (channelCount < 1) || (channelCount > NUM_CAPTURE_SLOTS) )
		return DBL_MAX;
	return m_minTimegap[channelCount - 1][triggered ? 1 : 0];
}

void DeviceLimits::SetMinimumTimegap(size_t channelCount, bool triggered, double timegap)
{
	if( (channelCount < 1) || (channelCount > NUM_CAPTURE_SLOTS) )
	{
		LogWarning("Ignoring minimum timegap for unsupported channel count %zu\n", channelCount);
		return;
	}
	m_minTimegap[channelCount - 1][triggered ? 1 : 0] = timegap;
}

/**
	@brief Converts a timegap to a whole number of sample clock ticks, rounding down

	The count is returned as a double so callers can range check it before narrowing to the width of the capture
	command's tick field.
 */
double DeviceLimits::QuantizeTimegap(double timegap) const
{
	return floor(timegap * m_clockMHz);
}
