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
	@brief Implementation of PhysicalInput helpers
	@ingroup core
 */

#include "mixscope.h"

using namespace std;

static const char* g_inputNames[INPUT_COUNT] =
{
	"CH1",
	"CH2",
	"CH3",
	"CH4",
	"CAP",
	"RES",
	"VOL",
	"AN8"
};

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Name conversion

///@brief Gets the display / API name of an input
string GetInputName(PhysicalInput input)
{
	if( (input < 0) || (input >= INPUT_COUNT) )
		return "invalid";
	return g_inputNames[input];
}

/**
	@brief Parses an input name

	@param name		Name of the input, e.g. "CH1"
	@param[out]	input	The parsed input, untouched on failure

	@return True if the name refers to a physical input
 */
bool ParseInputName(const string& name, PhysicalInput& input)
{
	for(int i=0; i<INPUT_COUNT; i++)
	{
		if(name == g_inputNames[i])
		{
			input = static_cast<PhysicalInput>(i);
			return true;
		}
	}
	return false;
}

///@brief Parses an input name, throwing InvalidChannelError if it is not known
PhysicalInput ParseInputNameOrThrow(const string& name)
{
	PhysicalInput input;
	if(!ParseInputName(name, input))
	{
		LogError("Invalid channel name \"%s\"\n", name.c_str());
		throw InvalidChannelError(string("invalid channel: ") + name);
	}
	return input;
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Capabilities

/**
	@brief Checks if an input is wired straight to an ADC path

	CAP and RES pass through a measurement front end first, so their samples are not the pin voltage and they cannot
	be used as a trigger source or shared with other channels in a multiplexed capture.
 */
bool IsDirectlyDigitized(PhysicalInput input)
{
	switch(input)
	{
		case INPUT_CAP:
		case INPUT_RES:
			return false;

		case INPUT_CH1:
		case INPUT_CH2:
		case INPUT_CH3:
		case INPUT_CH4:
		case INPUT_VOL:
		case INPUT_AN8:
			return true;

		default:
			return false;
	}
}

vector<PhysicalInput> GetAllInputs()
{
	vector<PhysicalInput> ret;
	for(int i=0; i<INPUT_COUNT; i++)
		ret.push_back(static_cast<PhysicalInput>(i));
	return ret;
}
