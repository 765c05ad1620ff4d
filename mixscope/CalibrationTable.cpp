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
	@brief Implementation of CalibrationTable
	@ingroup core
 */

#include "mixscope.h"

using namespace std;

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Construction / destruction

/**
	@brief Creates a table with the nominal ladders of the reference hardware
 */
CalibrationTable::CalibrationTable()
{
	//CH1 and CH2 have a programmable gain amplifier, +/- 16.5V at unity gain
	static const int gains[] = {1, 2, 4, 5, 8, 10, 16, 32};
	vector<VoltageRange> pga;
	for(auto g : gains)
		pga.push_back(VoltageRange(-16.5f / g, 16.5f / g));
	SetLadder(INPUT_CH1, pga);
	SetLadder(INPUT_CH2, pga);

	//Everything else is a single fixed range
	vector<VoltageRange> bipolar = { VoltageRange(-3.3f, 3.3f) };
	vector<VoltageRange> unipolar = { VoltageRange(0, 3.3f) };
	SetLadder(INPUT_CH3, bipolar);
	SetLadder(INPUT_CH4, bipolar);
	SetLadder(INPUT_CAP, unipolar);
	SetLadder(INPUT_RES, unipolar);
	SetLadder(INPUT_VOL, unipolar);
	SetLadder(INPUT_AN8, unipolar);
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Accessors

const VoltageRange& CalibrationTable::GetRange(PhysicalInput input, size_t rung) const
{
	auto& ranges = m_inputs[input].m_ranges;
	if(rung >= ranges.size())
	{
		LogError("Range %zu does not exist on %s\n", rung, GetInputName(input).c_str());
		throw RangeError(RangeError::RANGE_UNSUPPORTED, "range unsupported");
	}
	return ranges[rung];
}

/**
	@brief Gets the calibration for one input and range at a given bit depth

	@param input	The physical input
	@param rung		Index into the input's range ladder
	@param bitDepth	ADC resolution the raw codes were captured at
 */
CalibrationEntry CalibrationTable::GetEntry(PhysicalInput input, size_t rung, int bitDepth) const
{
	GetRange(input, rung);

	auto entry = m_inputs[input].m_entries[rung];
	double fullscale = (1 << CALIBRATION_BIT_DEPTH) - 1;
	double codes = (1 << bitDepth) - 1;
	entry.m_slope *= fullscale / codes;
	return entry;
}

/**
	@brief Computes the ideal entry for a range, mapping code 0 to the bottom and the top code to the top of the span
 */
CalibrationEntry CalibrationTable::GetNominalEntry(const VoltageRange& range)
{
	double fullscale = (1 << CALIBRATION_BIT_DEPTH) - 1;
	return CalibrationEntry(range.GetSpan() / fullscale, range.m_min);
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Loading

/**
	@brief Replaces the range ladder of an input

	All entries are reset to their nominal values. Rungs must be ordered widest first, since the rung index is also
	the gain setting written to the front end.
 */
void CalibrationTable::SetLadder(PhysicalInput input, const vector<VoltageRange>& ranges)
{
	if(ranges.empty())
		throw ConfigurationError(string("empty range ladder for ") + GetInputName(input));

	for(size_t i=1; i<ranges.size(); i++)
	{
		if(ranges[i].m_max > ranges[i-1].m_max)
			throw ConfigurationError(string("range ladder for ") + GetInputName(input) + " is not ordered widest first");
	}

	auto& cal = m_inputs[input];
	cal.m_ranges = ranges;
	cal.m_entries.clear();
	for(auto& r : ranges)
		cal.m_entries.push_back(GetNominalEntry(r));
}

/**
	@brief Overrides the calibration of one rung

	The slope has to be nonzero so the transform can be inverted when converting trigger levels to codes.
 */
void CalibrationTable::SetEntry(PhysicalInput input, size_t rung, const CalibrationEntry& entry)
{
	auto& cal = m_inputs[input];
	if(rung >= cal.m_entries.size())
		throw ConfigurationError(string("no range ") + to_string(rung) + " on " + GetInputName(input));
	if(!isfinite(entry.m_slope) || !isfinite(entry.m_intercept) || (entry.m_slope == 0))
	{
		LogError("Bad calibration for %s range %zu: slope %f, intercept %f\n",
			GetInputName(input).c_str(), rung, entry.m_slope, entry.m_intercept);
		throw ConfigurationError(string("invalid calibration for ") + GetInputName(input));
	}
	cal.m_entries[rung] = entry;
}
