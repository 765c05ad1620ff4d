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
	@brief Declaration of VoltageConverter
	@ingroup core
 */
#ifndef VoltageConverter_h
#define VoltageConverter_h

/**
	@brief Tracks the selected range of every input and converts raw codes to volts with it

	@ingroup core
 */
class VoltageConverter
{
public:
	VoltageConverter(const CalibrationTable& table);
	virtual ~VoltageConverter();

	std::vector<float> ToVolts(PhysicalInput input, const std::vector<uint16_t>& raw, int bitDepth) const;
	uint16_t ToRawCode(PhysicalInput input, float volts, int bitDepth) const;

	size_t FindRange(PhysicalInput input, float desired) const;
	size_t SelectRange(PhysicalInput input, float desired);
	void SetRangeIndex(PhysicalInput input, size_t rung);

	///@brief Gets the index of the selected rung of an input's ladder (0 is the widest)
	size_t GetRangeIndex(PhysicalInput input) const
	{ return m_selection[input]; }

	const VoltageRange& GetRange(PhysicalInput input) const
	{ return m_table.GetRange(input, m_selection[input]); }

	double GetResolution(PhysicalInput input, int bitDepth) const;

protected:
	const CalibrationTable& m_table;

	///@brief Selected rung, per input
	size_t m_selection[INPUT_COUNT];
};

#endif
