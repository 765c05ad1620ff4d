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
	@brief Declaration of CalibrationTable
	@ingroup core
 */
#ifndef CalibrationTable_h
#define CalibrationTable_h

///@brief Bit depth the calibration entries are expressed in
#define CALIBRATION_BIT_DEPTH 12

/**
	@brief One rung of an input's range ladder: the voltage span covered by the full ADC code range
 */
class VoltageRange
{
public:
	VoltageRange(float vmin = 0, float vmax = 0)
		: m_min(vmin)
		, m_max(vmax)
	{}

	float GetSpan() const
	{ return m_max - m_min; }

	float m_min;
	float m_max;
};

/**
	@brief Linear transform from raw ADC code to volts
 */
class CalibrationEntry
{
public:
	CalibrationEntry(double slope = 0, double intercept = 0)
		: m_slope(slope)
		, m_intercept(intercept)
	{}

	float Apply(uint16_t raw) const
	{ return m_slope * raw + m_intercept; }

	double m_slope;
	double m_intercept;
};

/**
	@brief Range ladders and raw-to-volts calibration for every physical input

	Entries are stored for CALIBRATION_BIT_DEPTH codes. GetEntry() rescales the slope for lower resolution captures
	so the full code span of any bit depth always covers the same voltage span.

	@ingroup core
 */
class CalibrationTable
{
public:
	CalibrationTable();

	const std::vector<VoltageRange>& GetRanges(PhysicalInput input) const
	{ return m_inputs[input].m_ranges; }

	size_t GetRangeCount(PhysicalInput input) const
	{ return m_inputs[input].m_ranges.size(); }

	const VoltageRange& GetRange(PhysicalInput input, size_t rung) const;

	CalibrationEntry GetEntry(PhysicalInput input, size_t rung, int bitDepth) const;

	void SetLadder(PhysicalInput input, const std::vector<VoltageRange>& ranges);
	void SetEntry(PhysicalInput input, size_t rung, const CalibrationEntry& entry);

	static CalibrationEntry GetNominalEntry(const VoltageRange& range);

protected:

	///@brief Ladder and entries for one input
	class InputCalibration
	{
	public:
		std::vector<VoltageRange> m_ranges;
		std::vector<CalibrationEntry> m_entries;
	};

	InputCalibration m_inputs[INPUT_COUNT];
};

#endif
