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
	@brief Declaration of AcquisitionSession
	@ingroup core
 */
#ifndef AcquisitionSession_h
#define AcquisitionSession_h

/**
	@brief All acquisition state for one device, and the public API to it

	Owns the channel mapping, trigger configuration and range selections. Every operation takes the transport mutex
	for its whole duration, so a capture (including its trigger wait) always completes before the next operation on
	the same device starts. Several sessions can coexist in one process as long as each has its own transport.

	@ingroup core
 */
class AcquisitionSession
{
public:
	AcquisitionSession(ScopeTransport* transport, const DeviceProfile& profile = DeviceProfile());
	virtual ~AcquisitionSession();

	//not copyable or assignable
	AcquisitionSession(const AcquisitionSession& rhs) =delete;
	AcquisitionSession& operator=(const AcquisitionSession& rhs) =delete;

	//Capture
	CaptureResult Capture(size_t channels, size_t samples, double timegap);
	CaptureResult Capture(const CaptureRequest& request);

	//Channel mapping
	void SetChannelOneMap(const std::string& name);
	void SetChannelOneMap(PhysicalInput input);
	PhysicalInput GetChannelOneMap();

	//Triggering
	void ConfigureTrigger(const std::string& channel, float level, bool enable = true);
	void ConfigureTrigger(PhysicalInput input, float level, bool enable = true);
	void ConfigureTriggerSlot(size_t slot, float level, bool enable = true);
	void EnableTrigger();
	void DisableTrigger();
	bool IsTriggerEnabled();
	float GetTriggerLevel();
	TriggerSource GetTriggerSource();

	//Front end ranges
	size_t SelectRange(const std::string& channel, float volts);
	size_t SelectRange(PhysicalInput input, float volts);
	VoltageRange GetRange(PhysicalInput input);

	//Serialization
	YAML::Node SerializeConfiguration();
	void LoadConfiguration(const YAML::Node& node);

	const DeviceProfile& GetProfile() const
	{ return m_profile; }

	ScopeTransport* GetTransport()
	{ return m_transport; }

	sigc::signal<void()> signal_channelMapChanged()
	{ return m_channelMapChangedSignal; }

	sigc::signal<void(PhysicalInput)> signal_rangeChanged()
	{ return m_rangeChangedSignal; }

	sigc::signal<void()> signal_triggerChanged()
	{ return m_triggerChangedSignal; }

	sigc::signal<void(const CaptureResult&)> signal_captureComplete()
	{ return m_captureCompleteSignal; }

protected:
	void ConfigureTrigger(const TriggerSource& source, float level, bool enable);
	void WriteRange(PhysicalInput input, size_t rung);
	void EmitConfigurationSignals(
		bool mapChanged,
		bool triggerChanged,
		const std::vector<PhysicalInput>& rangesChanged);

	///@brief The device link. Not owned.
	ScopeTransport* m_transport;

	DeviceProfile m_profile;
	ChannelRegistry m_registry;
	TriggerController m_trigger;
	VoltageConverter m_converter;
	AcquisitionEngine m_engine;

	sigc::signal<void()> m_channelMapChangedSignal;
	sigc::signal<void(PhysicalInput)> m_rangeChangedSignal;
	sigc::signal<void()> m_triggerChangedSignal;
	sigc::signal<void(const CaptureResult&)> m_captureCompleteSignal;
};

#endif
