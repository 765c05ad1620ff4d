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
	@brief Declaration of PhysicalInput and related helpers
	@ingroup core
 */
#ifndef PhysicalInput_h
#define PhysicalInput_h

/**
	@brief The analog pins of the device

	This is a closed set: names coming in through the API are parsed into one of these values at the boundary, and
	everything past that point works on the enumeration only.

	@ingroup core
 */
enum PhysicalInput
{
	///@brief Channel 1, programmable gain front end
	INPUT_CH1,

	///@brief Channel 2, programmable gain front end
	INPUT_CH2,

	///@brief Channel 3, fixed +/- 3.3V
	INPUT_CH3,

	///@brief Channel 4 (microphone input), fixed +/- 3.3V
	INPUT_CH4,

	///@brief Capacitance measurement front end
	INPUT_CAP,

	///@brief Resistance measurement front end
	INPUT_RES,

	///@brief Voltmeter input, 0 - 3.3V
	INPUT_VOL,

	///@brief Auxiliary analog pin, 0 - 3.3V
	INPUT_AN8,

	INPUT_COUNT
};

///@brief Number of logical capture slots
#define NUM_CAPTURE_SLOTS 4

std::string GetInputName(PhysicalInput input);
bool ParseInputName(const std::string& name, PhysicalInput& input);
PhysicalInput ParseInputNameOrThrow(const std::string& name);
bool IsDirectlyDigitized(PhysicalInput input);
std::vector<PhysicalInput> GetAllInputs();

#endif
