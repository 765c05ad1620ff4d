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
	@brief Declaration of DeviceLimits
	@ingroup core
 */
#ifndef DeviceLimits_h
#define DeviceLimits_h

int ResolutionFor(size_t channelCount);

/**
	@brief Timing and buffer constraints of one device

	The defaults match the reference hardware. A device profile may override any of them.

	@ingroup core
 */
class DeviceLimits
{
public:
	DeviceLimits();

	double GetMinimumTimegap(size_t channelCount, bool triggered) const;
	void SetMinimumTimegap(size_t channelCount, bool triggered, double timegap);

	double QuantizeTimegap(double timegap) const;

	///@brief Converts a number of sample clock ticks back to microseconds
	double TicksToMicroseconds(uint32_t ticks) const
	{ return ticks / m_clockMHz; }

	///@brief Total number of samples the device can hold, across all channels
	size_t m_bufferCapacity;

	///@brief Sample clock used to time captures, in MHz
	double m_clockMHz;

	///@brief Largest number of samples fetched in a single buffer read
	size_t m_maxSamplesPerRead;

protected:

	/**
		@brief Minimum inter-sample interval, in microseconds

		Indexed by [channel count - 1][trigger enabled]
	 */
	double m_minTimegap[NUM_CAPTURE_SLOTS][2];
};

#endif
