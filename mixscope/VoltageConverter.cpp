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
	@brief Implementation of VoltageConverter
	@ingroup core
 */

#include "mixscope.h"

using namespace std;

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Construction / destruction

/**
	@brief Creates a converter with every input on its widest range

	@param table	Calibration constants. Must outlive the converter.
 */
VoltageConverter::VoltageConverter(const CalibrationTable& table)
	: m_table(table)
{
	for(int i=0; i<INPUT_COUNT; i++)
		m_selection[i] = 0;
}

VoltageConverter::~VoltageConverter()
{
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Conversion

/**
	@brief Converts raw ADC codes to volts using the input's current range

	@param input	Input the samples were read from
	@param raw		Raw codes
	@param bitDepth	Resolution the codes were captured at
 */
vector<float> VoltageConverter::ToVolts(PhysicalInput input, const vector<uint16_t>& raw, int bitDepth) const
{
	auto entry = m_table.GetEntry(input, m_selection[input], bitDepth);

	vector<float> ret;
	ret.reserve(raw.size());
	for(auto code : raw)
		ret.push_back(entry.Apply(code));
	return ret;
}

/**
	@brief Converts a voltage to the nearest ADC code, clamped to the code span
 */
uint16_t VoltageConverter::ToRawCode(PhysicalInput input, float volts, int bitDepth) const
{
	auto entry = m_table.GetEntry(input, m_selection[input], bitDepth);
	double codes = (1 << bitDepth) - 1;

	double code = round((volts - entry.m_intercept) / entry.m_slope);
	if(code < 0)
		return 0;
	if(code > codes)
		return codes;
	return code;
}

///@brief Gets the size of one ADC step on the input's current range, in volts
double VoltageConverter::GetResolution(PhysicalInput input, int bitDepth) const
{
	return m_table.GetEntry(input, m_selection[input], bitDepth).m_slope;
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Range selection

/**
	@brief Finds the narrowest range whose top is at or above the desired voltage

	A voltage between two rungs rounds up to the wider one, so 15V on CH1 selects +/- 16.5V. Only voltages above
	the widest rung are refused. Does not change the selection.

	@throw RangeError if the voltage is above the widest range or is not a positive number
 */
size_t VoltageConverter::FindRange(PhysicalInput input, float desired) const
{
	auto& ranges = m_table.GetRanges(input);
	if(desired > 0)
	{
		for(size_t i=ranges.size(); i>0; i--)
		{
			if(ranges[i-1].m_max >= desired)
				return i-1;
		}
	}

	LogError("No range on %s covers %.3f V (widest is %.3f V)\n",
		GetInputName(input).c_str(), desired, ranges[0].m_max);
	throw RangeError(RangeError::RANGE_UNSUPPORTED, "range unsupported");
}

/**
	@brief Selects the narrowest range covering the desired voltage

	On failure the previous selection is kept.

	@return The selected rung
 */
size_t VoltageConverter::SelectRange(PhysicalInput input, float desired)
{
	size_t rung = FindRange(input, desired);
	SetRangeIndex(input, rung);
	return rung;
}

void VoltageConverter::SetRangeIndex(PhysicalInput input, size_t rung)
{
	auto& range = m_table.GetRange(input, rung);
	m_selection[input] = rung;

	LogDebug("%s range is now %.3f to %.3f V\n", GetInputName(input).c_str(), range.m_min, range.m_max);
}
