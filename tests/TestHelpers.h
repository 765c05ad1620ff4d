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
	@brief Shared fixtures and waveform helpers for the unit tests
 */
#ifndef TestHelpers_h
#define TestHelpers_h

#include "mixscope.h"
#include <gtest/gtest.h>
#include <algorithm>

///@brief Four times the coarsest resolution of CH1 (10 bits over +/- 16.5V)
#define ABSTOL (4 * (16.5 - (-16.5)) / ((1 << 10) - 1))

/**
	@brief A session on a freshly reset simulated device
 */
class SessionTest : public testing::Test
{
public:
	SessionTest()
		: m_transport("1")
		, m_session(&m_transport)
	{}

protected:
	SimulatedTransport m_transport;
	AcquisitionSession m_session;
};

///@brief Smallest nonzero difference between any two samples
inline double MinimumStep(std::vector<float> samples)
{
	std::sort(samples.begin(), samples.end());
	double step = DBL_MAX;
	for(size_t i=1; i<samples.size(); i++)
	{
		double d = samples[i] - samples[i-1];
		if(d > 0)
			step = std::min(step, d);
	}
	return step;
}

///@brief Number of sign changes in a waveform
inline size_t CountZeroCrossings(const std::vector<float>& samples)
{
	size_t n = 0;
	for(size_t i=1; i<samples.size(); i++)
	{
		if( (samples[i-1] < 0) != (samples[i] < 0) )
			n ++;
	}
	return n;
}

/**
	@brief Average interval between rising zero crossings, linearly interpolated

	@return Zero if there are fewer than two rising crossings
 */
inline double MeasurePeriod(const std::vector<double>& t, const std::vector<float>& samples)
{
	std::vector<double> crossings;
	for(size_t i=1; i<samples.size(); i++)
	{
		if( (samples[i-1] < 0) && (samples[i] >= 0) )
		{
			double frac = -samples[i-1] / (samples[i] - samples[i-1]);
			crossings.push_back(t[i-1] + frac * (t[i] - t[i-1]));
		}
	}
	if(crossings.size() < 2)
		return 0;
	return (crossings.back() - crossings.front()) / (crossings.size() - 1);
}

#endif
