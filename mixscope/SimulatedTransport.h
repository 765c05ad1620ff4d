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
	@brief Declaration of SimulatedTransport
	@ingroup transports
 */

#ifndef SimulatedTransport_h
#define SimulatedTransport_h

/**
	@brief An analog signal applied to one simulated input
 */
class SignalSource
{
public:
	enum SignalType
	{
		SIGNAL_DC,
		SIGNAL_SINE
	};

	SignalSource(SignalType type = SIGNAL_DC, float amplitude = 0, float frequency = 0, float offset = 0)
		: m_type(type)
		, m_amplitude(amplitude)
		, m_frequency(frequency)
		, m_offset(offset)
	{}

	static SignalSource Sine(float amplitude, float frequency, float offset = 0)
	{ return SignalSource(SIGNAL_SINE, amplitude, frequency, offset); }

	static SignalSource DC(float level)
	{ return SignalSource(SIGNAL_DC, 0, 0, level); }

	double GetVoltage(double t_us) const;
	bool FindRisingCrossing(double level, double t_us, double& crossing) const;

	SignalType m_type;

	///@brief Peak amplitude, in volts
	float m_amplitude;

	///@brief Frequency, in Hz
	float m_frequency;

	///@brief DC offset, in volts
	float m_offset;
};

/**
	@brief In-process model of the device, used for testing without hardware

	Interprets the command frames the engine sends and answers them the way the reference hardware does: the front
	end gain comes from SET_PGA_GAIN, the ADC runs at the requested resolution, and a triggered capture starts on the
	first rising crossing of the trigger level. If the trigger source never crosses the level, the device forces a
	trigger so the capture still completes.

	By default a 3V 1 kHz sine is looped back onto CH1, CH2 and CH3. All other inputs sit at 0V.

	Connection string: an optional integer random seed.

	@ingroup transports
 */
class SimulatedTransport : public ScopeTransport
{
public:
	SimulatedTransport(const std::string& args);
	SimulatedTransport(const std::string& args, const DeviceProfile& profile);
	virtual ~SimulatedTransport();

	virtual std::string GetConnectionString() override;
	static std::string GetTransportName();

	virtual bool SendCommand(const std::vector<uint8_t>& cmd) override;
	virtual size_t ReadRawData(size_t len, unsigned char* buf) override;
	virtual bool IsConnected() override;

	//Test hooks
	void SetInputSignal(PhysicalInput input, const SignalSource& source)
	{ m_sources[input] = source; }

	void SetNoise(float stdev)
	{ m_noiseStdev = stdev; }

	///@brief Simulate a dropped link: all commands fail
	void SetConnected(bool connected)
	{ m_connected = connected; }

	///@brief Simulate a device that never finishes its capture
	void SetStalled(bool stalled)
	{ m_stalled = stalled; }

	size_t GetGain(PhysicalInput input)
	{ return m_gain[input]; }

	///@brief Number of frames received since construction
	size_t GetCommandCount()
	{ return m_commandCount; }

	///@brief Opcode of the most recent frame, or 0 if none
	uint8_t GetLastOpcode()
	{ return m_lastOpcode; }

	TRANSPORT_INITPROC(SimulatedTransport)

protected:
	void Initialize();

	void DoCapture(const std::vector<uint8_t>& cmd);
	void PushWord(uint16_t w);
	uint16_t Digitize(PhysicalInput input, double volts, int bitDepth);

	std::string m_args;

	///@brief Sample clock, in MHz
	double m_clockMHz;

	///@brief Front end model, nominal ranges only
	CalibrationTable m_frontEnd;

	SignalSource m_sources[INPUT_COUNT];
	size_t m_gain[INPUT_COUNT];

	bool m_connected;
	bool m_stalled;
	float m_noiseStdev;

	//Trigger comparator
	size_t m_triggerSlot;
	uint16_t m_triggerCode;

	//Most recent capture
	std::vector< std::vector<uint16_t> > m_buffers;
	size_t m_samplesCaptured;
	bool m_captureDone;

	///@brief Pending reply bytes
	std::deque<uint8_t> m_reply;

	size_t m_commandCount;
	uint8_t m_lastOpcode;

	std::minstd_rand m_rng;
};

#endif
