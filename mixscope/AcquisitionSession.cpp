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
	@brief Implementation of AcquisitionSession
	@ingroup core
 */

#include "mixscope.h"

using namespace std;

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Construction / destruction

/**
	@brief Opens a session on a device

	Every input with a selectable range is put on its widest range, so the front end and the session agree from the
	start.

	@param transport	Link to the device. Must outlive the session.
	@param profile		Limits and calibration of the device
 */
AcquisitionSession::AcquisitionSession(ScopeTransport* transport, const DeviceProfile& profile)
	: m_transport(transport)
	, m_profile(profile)
	, m_converter(m_profile.m_calibration)
	, m_engine(transport, m_profile.m_limits, m_registry, m_trigger, m_converter)
{
	if(m_transport == nullptr)
		throw TransportError("no transport");

	LogDebug("Opening session on %s (%s)\n", m_profile.m_name.c_str(), m_transport->GetConnectionString().c_str());
	LogIndenter li;

	lock_guard<recursive_mutex> lock(m_transport->GetMutex());
	for(auto input : GetAllInputs())
	{
		if(m_profile.m_calibration.GetRangeCount(input) > 1)
			WriteRange(input, 0);
	}
}

AcquisitionSession::~AcquisitionSession()
{
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Capture

/**
	@brief Captures waveforms from the first N slots

	@param channels		Number of slots to capture, 1 to 4
	@param samples		Samples per channel
	@param timegap		Inter-sample interval, in microseconds
 */
CaptureResult AcquisitionSession::Capture(size_t channels, size_t samples, double timegap)
{
	return Capture(CaptureRequest(channels, samples, timegap));
}

CaptureResult AcquisitionSession::Capture(const CaptureRequest& request)
{
	CaptureResult ret;
	{
		lock_guard<recursive_mutex> lock(m_transport->GetMutex());
		ret = m_engine.Capture(request);
	}

	m_captureCompleteSignal.emit(ret);
	return ret;
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Channel mapping

void AcquisitionSession::SetChannelOneMap(const string& name)
{
	SetChannelOneMap(ParseInputNameOrThrow(name));
}

/**
	@brief Routes slot 1 to a different input

	The mux setting goes out with the next capture command, so nothing is written to the device here.
 */
void AcquisitionSession::SetChannelOneMap(PhysicalInput input)
{
	{
		lock_guard<recursive_mutex> lock(m_transport->GetMutex());
		m_registry.SetChannelOneMap(input);
	}
	m_channelMapChangedSignal.emit();
}

PhysicalInput AcquisitionSession::GetChannelOneMap()
{
	lock_guard<recursive_mutex> lock(m_transport->GetMutex());
	return m_registry.GetChannelOneMap();
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Triggering

/**
	@brief Triggers on a physical input, by name

	The input must currently be routed to a capture slot through a plain ADC path. An unknown name throws
	InvalidChannelError, an unroutable one TypeMismatchError.
 */
void AcquisitionSession::ConfigureTrigger(const string& channel, float level, bool enable)
{
	ConfigureTrigger(TriggerSource::Input(ParseInputNameOrThrow(channel)), level, enable);
}

void AcquisitionSession::ConfigureTrigger(PhysicalInput input, float level, bool enable)
{
	ConfigureTrigger(TriggerSource::Input(input), level, enable);
}

///@brief Triggers on whatever a logical slot is mapped to at capture time
void AcquisitionSession::ConfigureTriggerSlot(size_t slot, float level, bool enable)
{
	ConfigureTrigger(TriggerSource::Slot(slot), level, enable);
}

void AcquisitionSession::ConfigureTrigger(const TriggerSource& source, float level, bool enable)
{
	{
		lock_guard<recursive_mutex> lock(m_transport->GetMutex());
		m_trigger.Configure(source, level, m_registry, enable);
	}
	m_triggerChangedSignal.emit();
}

void AcquisitionSession::EnableTrigger()
{
	{
		lock_guard<recursive_mutex> lock(m_transport->GetMutex());
		m_trigger.Enable(m_registry);
	}
	m_triggerChangedSignal.emit();
}

void AcquisitionSession::DisableTrigger()
{
	{
		lock_guard<recursive_mutex> lock(m_transport->GetMutex());
		m_trigger.Disable();
	}
	m_triggerChangedSignal.emit();
}

bool AcquisitionSession::IsTriggerEnabled()
{
	lock_guard<recursive_mutex> lock(m_transport->GetMutex());
	return m_trigger.IsEnabled();
}

float AcquisitionSession::GetTriggerLevel()
{
	lock_guard<recursive_mutex> lock(m_transport->GetMutex());
	return m_trigger.GetLevel();
}

TriggerSource AcquisitionSession::GetTriggerSource()
{
	lock_guard<recursive_mutex> lock(m_transport->GetMutex());
	return m_trigger.GetSource();
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Front end ranges

size_t AcquisitionSession::SelectRange(const string& channel, float volts)
{
	return SelectRange(ParseInputNameOrThrow(channel), volts);
}

/**
	@brief Selects the narrowest range of an input that covers the given voltage

	The gain is written to the device before the selection changes. If either step fails, the previous range stays
	selected.

	@return Index of the selected rung
 */
size_t AcquisitionSession::SelectRange(PhysicalInput input, float volts)
{
	size_t rung;
	{
		lock_guard<recursive_mutex> lock(m_transport->GetMutex());
		rung = m_converter.FindRange(input, volts);
		WriteRange(input, rung);
	}
	m_rangeChangedSignal.emit(input);
	return rung;
}

VoltageRange AcquisitionSession::GetRange(PhysicalInput input)
{
	lock_guard<recursive_mutex> lock(m_transport->GetMutex());
	return m_converter.GetRange(input);
}

/**
	@brief Writes a gain setting to the front end, then records it

	Inputs with a single fixed range have no gain stage, so only the selection is updated for them.
 */
void AcquisitionSession::WriteRange(PhysicalInput input, size_t rung)
{
	//Throws RangeError for a rung that doesn't exist, before anything is sent
	m_profile.m_calibration.GetRange(input, rung);

	if(m_profile.m_calibration.GetRangeCount(input) > 1)
		m_engine.Send(DeviceCommand::SetGain(input, rung));
	m_converter.SetRangeIndex(input, rung);
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Serialization

/**
	@brief Saves the channel mapping, range selections and trigger configuration
 */
YAML::Node AcquisitionSession::SerializeConfiguration()
{
	lock_guard<recursive_mutex> lock(m_transport->GetMutex());

	YAML::Node node;
	node["channel_one_map"] = GetInputName(m_registry.GetChannelOneMap());

	YAML::Node ranges;
	for(auto input : GetAllInputs())
		ranges[GetInputName(input)] = m_converter.GetRangeIndex(input);
	node["ranges"] = ranges;

	YAML::Node trigger;
	auto& source = m_trigger.GetSource();
	if(source.m_type == TriggerSource::SOURCE_SLOT)
		trigger["slot"] = source.m_slot;
	else
		trigger["input"] = GetInputName(source.m_input);
	trigger["level"] = m_trigger.GetLevel();
	trigger["enabled"] = m_trigger.IsEnabled();
	node["trigger"] = trigger;

	return node;
}

/**
	@brief Restores a configuration saved by SerializeConfiguration()

	The whole document is checked against scratch copies of the mapping and trigger first, so a malformed or
	unroutable configuration is rejected with nothing changed. A disabled trigger is restored without a routing
	check, the same as a trigger that was configured and then remapped away. Keys that are absent are left alone.

	Ranges are written to the device last. If that fails part way, the settings already applied stay applied and
	their change signals still fire.
 */
void AcquisitionSession::LoadConfiguration(const YAML::Node& node)
{
	bool mapChanged = false;
	bool triggerChanged = false;
	vector<PhysicalInput> rangesChanged;

	try
	{
		lock_guard<recursive_mutex> lock(m_transport->GetMutex());

		ChannelRegistry registry = m_registry;
		TriggerController trigger = m_trigger;
		vector< pair<PhysicalInput, size_t> > ranges;
		bool hasMap = false;
		bool hasTrigger = false;

		try
		{
			if(node["channel_one_map"])
			{
				registry.SetChannelOneMap(node["channel_one_map"].as<string>());
				hasMap = true;
			}

			for(auto it : node["ranges"])
			{
				auto input = ParseInputNameOrThrow(it.first.as<string>());
				auto rung = it.second.as<size_t>();
				m_profile.m_calibration.GetRange(input, rung);
				ranges.push_back(pair<PhysicalInput, size_t>(input, rung));
			}

			auto tnode = node["trigger"];
			if(tnode)
			{
				TriggerSource source = TriggerSource::Slot(1);
				if(tnode["input"])
					source = TriggerSource::Input(ParseInputNameOrThrow(tnode["input"].as<string>()));
				else if(tnode["slot"])
					source = TriggerSource::Slot(tnode["slot"].as<size_t>());

				bool enabled = tnode["enabled"] && tnode["enabled"].as<bool>();
				float level = tnode["level"] ? tnode["level"].as<float>() : 0;
				if(enabled)
					trigger.Configure(source, level, registry, true);
				else
					trigger.ConfigureDisarmed(source, level);
				hasTrigger = true;
			}
		}
		catch(const YAML::Exception& ex)
		{
			LogError("Malformed session configuration: %s\n", ex.what());
			throw ConfigurationError(string("malformed session configuration: ") + ex.what());
		}

		if(hasMap)
		{
			m_registry = registry;
			mapChanged = true;
		}
		if(hasTrigger)
		{
			m_trigger = trigger;
			triggerChanged = true;
		}
		for(auto& r : ranges)
		{
			WriteRange(r.first, r.second);
			rangesChanged.push_back(r.first);
		}
	}
	catch(const TransportError&)
	{
		EmitConfigurationSignals(mapChanged, triggerChanged, rangesChanged);
		throw;
	}

	EmitConfigurationSignals(mapChanged, triggerChanged, rangesChanged);
}

void AcquisitionSession::EmitConfigurationSignals(
	bool mapChanged,
	bool triggerChanged,
	const vector<PhysicalInput>& rangesChanged)
{
	if(mapChanged)
		m_channelMapChangedSignal.emit();
	if(triggerChanged)
		m_triggerChangedSignal.emit();
	for(auto input : rangesChanged)
		m_rangeChangedSignal.emit(input);
}
