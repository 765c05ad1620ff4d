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
	@brief Implementation of DeviceProfile
	@ingroup core
 */

#include "mixscope.h"

using namespace std;

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Construction / destruction

DeviceProfile::DeviceProfile()
	: m_name("Reference device")
{
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Profile file parsing

/**
	@brief Loads a profile from a YAML file

	Keys missing from the file keep their default values.
 */
DeviceProfile DeviceProfile::Load(const string& path)
{
	try
	{
		auto docs = YAML::LoadAllFromFile(path);
		if(docs.empty())
			throw ConfigurationError(string("device profile ") + path + " is empty");
		return FromYAML(docs[0]);
	}
	catch(const YAML::BadFile& ex)
	{
		LogError("Couldn't open device profile %s\n", path.c_str());
		throw ConfigurationError(string("cannot open device profile ") + path);
	}
	catch(const YAML::Exception& ex)
	{
		LogError("Malformed device profile %s: %s\n", path.c_str(), ex.what());
		throw ConfigurationError(string("malformed device profile ") + path + ": " + ex.what());
	}
}

/**
	@brief Loads a profile from an already parsed YAML node
 */
DeviceProfile DeviceProfile::FromYAML(const YAML::Node& node)
{
	DeviceProfile ret;

	try
	{
		if(node["name"])
			ret.m_name = node["name"].as<string>();

		if(node["limits"])
			ret.LoadLimits(node["limits"]);

		auto inputs = node["inputs"];
		for(auto it : inputs)
		{
			auto name = it.first.as<string>();
			PhysicalInput input;
			if(!ParseInputName(name, input))
				throw ConfigurationError(string("unknown input \"") + name + "\" in device profile");
			ret.LoadInput(input, it.second);
		}
	}
	catch(const YAML::Exception& ex)
	{
		LogError("Malformed device profile: %s\n", ex.what());
		throw ConfigurationError(string("malformed device profile: ") + ex.what());
	}

	LogDebug("Loaded device profile \"%s\"\n", ret.m_name.c_str());
	return ret;
}

void DeviceProfile::LoadLimits(const YAML::Node& node)
{
	if(node["buffer_capacity"])
		m_limits.m_bufferCapacity = node["buffer_capacity"].as<size_t>();
	if(node["clock_mhz"])
		m_limits.m_clockMHz = node["clock_mhz"].as<double>();
	if(node["max_samples_per_read"])
		m_limits.m_maxSamplesPerRead = node["max_samples_per_read"].as<size_t>();

	if( (m_limits.m_bufferCapacity == 0) || (m_limits.m_clockMHz <= 0) || (m_limits.m_maxSamplesPerRead == 0) )
		throw ConfigurationError("device limits must be positive");

	//The capture command carries 16-bit sample counts
	if(m_limits.m_bufferCapacity > 0xffff)
		throw ConfigurationError("buffer capacity too large for the capture command");

	for(auto entry : node["min_timegap"])
	{
		auto channels = entry["channels"].as<size_t>();
		if(entry["untriggered"])
			m_limits.SetMinimumTimegap(channels, false, entry["untriggered"].as<double>());
		if(entry["triggered"])
			m_limits.SetMinimumTimegap(channels, true, entry["triggered"].as<double>());
	}
}

/**
	@brief Loads the range ladder and calibration constants for one input

	"ranges" is a list of [min, max] pairs, widest first. "calibration" is a list of {rung, slope, intercept} with
	slopes in volts per 12-bit code.
 */
void DeviceProfile::LoadInput(PhysicalInput input, const YAML::Node& node)
{
	if(node["ranges"])
	{
		vector<VoltageRange> ranges;
		for(auto r : node["ranges"])
		{
			if(!r.IsSequence() || (r.size() != 2))
				throw ConfigurationError(string("range for ") + GetInputName(input) + " must be a [min, max] pair");
			VoltageRange range(r[0].as<float>(), r[1].as<float>());
			if(!isfinite(range.m_min) || !isfinite(range.m_max) || !(range.GetSpan() > 0))
				throw ConfigurationError(string("empty voltage range for ") + GetInputName(input));
			ranges.push_back(range);
		}
		m_calibration.SetLadder(input, ranges);
	}

	for(auto c : node["calibration"])
	{
		m_calibration.SetEntry(
			input,
			c["rung"].as<size_t>(),
			CalibrationEntry(c["slope"].as<double>(), c["intercept"].as<double>()));
	}
}
