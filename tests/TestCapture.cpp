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
	@brief End to end capture tests against the simulated device
 */

#include "TestHelpers.h"

using namespace std;

class CaptureTest : public SessionTest
{
};

TEST_F(CaptureTest, ResultShape)
{
	for(size_t channels=1; channels<=4; channels++)
	{
		auto result = m_session.Capture(channels, 500, 2);

		ASSERT_EQ(result.GetChannelCount(), channels);
		ASSERT_EQ(result.m_inputs.size(), channels);
		EXPECT_EQ(result.GetSampleCount(), 500u);
		for(auto& v : result.m_voltages)
			EXPECT_EQ(v.size(), 500u);

		EXPECT_EQ(result.m_bitDepth, ResolutionFor(channels));
		EXPECT_FALSE(result.m_triggered);
	}
}

TEST_F(CaptureTest, ChannelOrder)
{
	auto result = m_session.Capture(4, 200, 2);
	vector<PhysicalInput> expected = {INPUT_CH1, INPUT_CH2, INPUT_CH3, INPUT_CH4};
	EXPECT_EQ(result.m_inputs, expected);

	m_session.SetChannelOneMap("CH2");
	result = m_session.Capture(4, 200, 2);
	expected[0] = INPUT_CH2;
	EXPECT_EQ(result.m_inputs, expected);

	//CH2 is on both slot 1 and slot 2, so both see the same signal
	for(size_t i=0; i<200; i++)
		EXPECT_FLOAT_EQ(result.m_voltages[0][i], result.m_voltages[1][i]);
}

TEST_F(CaptureTest, TimeAxis)
{
	auto result = m_session.Capture(1, 100, 2);
	EXPECT_DOUBLE_EQ(result.m_timegap, 2);
	for(size_t i=0; i<100; i++)
		EXPECT_DOUBLE_EQ(result.m_timeAxis[i], i * 2.0);

	//Rounded down to a whole number of 125 ns clock ticks
	result = m_session.Capture(1, 100, 1.3);
	EXPECT_DOUBLE_EQ(result.m_timegap, 1.25);
	EXPECT_DOUBLE_EQ(result.m_timeAxis[0], 0);
	EXPECT_DOUBLE_EQ(result.m_timeAxis[99], 99 * 1.25);
}

TEST_F(CaptureTest, ResolutionDependsOnChannelCount)
{
	auto one = m_session.Capture(1, 2000, 1);
	EXPECT_EQ(one.m_bitDepth, 12);
	EXPECT_NEAR(MinimumStep(one.m_voltages[0]), 33.0 / 4095, 1e-5);

	auto two = m_session.Capture(2, 2000, 1);
	EXPECT_EQ(two.m_bitDepth, 10);
	EXPECT_NEAR(MinimumStep(two.m_voltages[0]), 33.0 / 1023, 1e-5);
	EXPECT_NEAR(MinimumStep(two.m_voltages[1]), 33.0 / 1023, 1e-5);
}

TEST_F(CaptureTest, DefaultTrigger)
{
	m_session.EnableTrigger();

	auto result = m_session.Capture(1, 500, 1);
	EXPECT_TRUE(result.m_triggered);
	EXPECT_NEAR(result.m_voltages[0][0], 0, ABSTOL);

	//Rising edge
	EXPECT_GT(result.m_voltages[0][50], result.m_voltages[0][0]);
}

TEST_F(CaptureTest, TriggerOnRemappedInput)
{
	m_session.SetChannelOneMap("CH3");
	m_session.ConfigureTrigger("CH3", 1.5);

	auto result = m_session.Capture(1, 500, 1);
	EXPECT_EQ(result.m_inputs[0], INPUT_CH3);
	EXPECT_TRUE(result.m_triggered);
	EXPECT_NEAR(result.m_voltages[0][0], 1.5, ABSTOL);
}

TEST_F(CaptureTest, TriggerOnSecondSlot)
{
	m_session.ConfigureTrigger("CH2", -1);

	auto result = m_session.Capture(2, 500, 1);
	ASSERT_EQ(result.GetChannelCount(), 2u);
	EXPECT_NEAR(result.m_voltages[1][0], -1, ABSTOL);
}

TEST_F(CaptureTest, UnreachableTriggerLevelStillCompletes)
{
	m_session.ConfigureTrigger("CH1", 5);

	auto result = m_session.Capture(1, 500, 1);
	EXPECT_EQ(result.GetSampleCount(), 500u);
	EXPECT_TRUE(result.m_triggered);
}

TEST_F(CaptureTest, DisabledTrigger)
{
	m_session.ConfigureTrigger("CH1", 1);
	m_session.DisableTrigger();

	auto result = m_session.Capture(1, 500, 0.5);
	EXPECT_FALSE(result.m_triggered);
	EXPECT_NEAR(result.m_timegap, 0.5, 1e-9);
}

TEST_F(CaptureTest, RangeClipsSignal)
{
	EXPECT_EQ(m_session.SelectRange("CH1", 1.5), 5u);

	auto result = m_session.Capture(1, 2000, 1);
	auto& y = result.m_voltages[0];
	float vmax = *max_element(y.begin(), y.end());
	float vmin = *min_element(y.begin(), y.end());

	//3V sine clips at the +/- 1.65V rails
	EXPECT_GE(vmax, 1.5);
	EXPECT_LE(vmax, 1.65 + 1e-3);
	EXPECT_LE(vmin, -1.5);
	EXPECT_GE(vmin, -1.65 - 1e-3);
}

TEST_F(CaptureTest, TriggeredCapturesAreRepeatable)
{
	m_session.ConfigureTrigger("CH1", 0.5);

	auto first = m_session.Capture(1, 2000, 1);
	auto second = m_session.Capture(1, 2000, 1);

	EXPECT_EQ(CountZeroCrossings(first.m_voltages[0]), CountZeroCrossings(second.m_voltages[0]));
	EXPECT_NEAR(first.m_voltages[0][0], second.m_voltages[0][0], ABSTOL);
}

TEST_F(CaptureTest, SignalPeriod)
{
	auto result = m_session.Capture(1, 3000, 1);

	//Default loopback is 1 kHz
	EXPECT_NEAR(MeasurePeriod(result.m_timeAxis, result.m_voltages[0]), 1000, 5);
	EXPECT_GE(CountZeroCrossings(result.m_voltages[0]), 5u);
}

TEST_F(CaptureTest, MeasurementInput)
{
	m_session.SetChannelOneMap("CAP");

	auto result = m_session.Capture(1, 200, 2);
	EXPECT_EQ(result.m_inputs[0], INPUT_CAP);
	for(auto v : result.m_voltages[0])
		EXPECT_NEAR(v, 0, ABSTOL);
}

TEST_F(CaptureTest, UnconnectedInputReadsZero)
{
	auto result = m_session.Capture(4, 500, 2);
	for(auto v : result.m_voltages[3])
		EXPECT_NEAR(v, 0, ABSTOL);
}

TEST_F(CaptureTest, InjectedSignal)
{
	m_transport.SetInputSignal(INPUT_CH4, SignalSource::DC(1.25));

	auto result = m_session.Capture(4, 100, 2);
	for(auto v : result.m_voltages[3])
		EXPECT_NEAR(v, 1.25, ABSTOL);
}

TEST_F(CaptureTest, FullBufferIsReadInChunks)
{
	size_t before = m_transport.GetCommandCount();

	auto result = m_session.Capture(1, 10000, 1);
	EXPECT_EQ(result.GetSampleCount(), 10000u);
	EXPECT_DOUBLE_EQ(result.m_timeAxis.back(), 9999);

	//Capture, at least one status poll, then four 2500 sample reads
	EXPECT_GE(m_transport.GetCommandCount() - before, 6u);
	EXPECT_EQ(m_transport.GetLastOpcode(), DeviceCommand::OP_RETRIEVE_BUFFER);

	//Last chunk carries real data, not padding
	EXPECT_GT(MeasurePeriod(result.m_timeAxis, result.m_voltages[0]), 0);
	auto& y = result.m_voltages[0];
	EXPECT_GT(*max_element(y.begin() + 7500, y.end()), 2.5);
}

TEST_F(CaptureTest, FailedRemapKeepsMapping)
{
	m_session.SetChannelOneMap("CH3");
	EXPECT_THROW(m_session.SetChannelOneMap("BAD"), InvalidChannelError);

	auto result = m_session.Capture(1, 100, 2);
	EXPECT_EQ(result.m_inputs[0], INPUT_CH3);
}

TEST_F(CaptureTest, RequestStruct)
{
	auto result = m_session.Capture(CaptureRequest(2, 300, 4));
	EXPECT_EQ(result.GetChannelCount(), 2u);
	EXPECT_EQ(result.GetSampleCount(), 300u);
	EXPECT_DOUBLE_EQ(result.m_timegap, 4);
}
