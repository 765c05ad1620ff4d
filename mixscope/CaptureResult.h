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
	@brief Declaration of CaptureResult
	@ingroup core
 */
#ifndef CaptureResult_h
#define CaptureResult_h

/**
	@brief Parameters of one capture
 */
class CaptureRequest
{
public:
	CaptureRequest(size_t channels = 1, size_t samples = 0, double timegap = 0)
		: m_channelCount(channels)
		, m_sampleCount(samples)
		, m_timegap(timegap)
	{}

	///@brief Number of slots to capture, starting at slot 1
	size_t m_channelCount;

	///@brief Samples per channel
	size_t m_sampleCount;

	///@brief Requested inter-sample interval, in microseconds
	double m_timegap;
};

/**
	@brief Calibrated waveforms from one capture, all sharing one time axis

	@ingroup core
 */
class CaptureResult
{
public:

	size_t GetChannelCount() const
	{ return m_voltages.size(); }

	size_t GetSampleCount() const
	{ return m_timeAxis.size(); }

	///@brief Sample timestamps, in microseconds from the first sample
	std::vector<double> m_timeAxis;

	///@brief One voltage sequence per captured slot, slot 1 first
	std::vector< std::vector<float> > m_voltages;

	///@brief Physical input each sequence was read from
	std::vector<PhysicalInput> m_inputs;

	///@brief Interval the device actually sampled at, after quantization to its clock
	double m_timegap;

	///@brief ADC resolution of the capture
	int m_bitDepth;

	///@brief True if the capture waited for the trigger
	bool m_triggered;
};

#endif
