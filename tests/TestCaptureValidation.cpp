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
	@brief Tests for capture request validation
 */

#include "TestHelpers.h"

using namespace std;

class CaptureValidation : public SessionTest
{
protected:

	///@brief Runs a capture that must be rejected with a RangeError, checking nothing reached the device
	RangeError::Reason ExpectRangeError(size_t channels, size_t samples, double timegap)
	{
		size_t before = m_transport.GetCommandCount();
		try
		{
			m_session.Capture(channels, samples, timegap);
		}
		catch(const RangeError& ex)
		{
			EXPECT_EQ(m_transport.GetCommandCount(), before);
			return ex.GetReason();
		}
		ADD_FAILURE() << "expected RangeError";
		return RangeError::RANGE_UNSUPPORTED;
	}
};

TEST_F(CaptureValidation, TooManyChannels)
{
	EXPECT_EQ(ExpectRangeError(5, 200, 2), RangeError::TOO_MANY_CHANNELS);
	EXPECT_EQ(ExpectRangeError(0, 200, 2), RangeError::TOO_MANY_CHANNELS);

	//Checked first, whatever else is wrong
	EXPECT_EQ(ExpectRangeError(5, 100000, 0.01), RangeError::TOO_MANY_CHANNELS);
}

TEST_F(CaptureValidation, TimegapTooSmall)
{
	for(size_t channels=1; channels<=4; channels++)
	{
		EXPECT_EQ(ExpectRangeError(channels, 200, 0.2), RangeError::TIMEGAP_TOO_SMALL);
		EXPECT_EQ(ExpectRangeError(channels, 1, 0.2), RangeError::TIMEGAP_TOO_SMALL);
	}
	EXPECT_EQ(ExpectRangeError(1, 200, 0), RangeError::TIMEGAP_TOO_SMALL);
	EXPECT_EQ(ExpectRangeError(1, 200, -1), RangeError::TIMEGAP_TOO_SMALL);
	EXPECT_EQ(ExpectRangeError(1, 200, NAN), RangeError::TIMEGAP_TOO_SMALL);

	//Multiplexed captures need longer per sample
	EXPECT_EQ(ExpectRangeError(2, 200, 0.5), RangeError::TIMEGAP_TOO_SMALL);
	EXPECT_EQ(ExpectRangeError(4, 200, 1), RangeError::TIMEGAP_TOO_SMALL);
}

TEST_F(CaptureValidation, MinimumTimegapDependsOnTrigger)
{
	EXPECT_NO_THROW(m_session.Capture(1, 2000, 0.5));

	m_session.EnableTrigger();
	EXPECT_EQ(ExpectRangeError(1, 2000, 0.5), RangeError::TIMEGAP_TOO_SMALL);
	EXPECT_NO_THROW(m_session.Capture(1, 2000, 0.75));
}

TEST_F(CaptureValidation, TimegapTooLarge)
{
	EXPECT_EQ(ExpectRangeError(1, 10, 10000), RangeError::TIMEGAP_TOO_LARGE);

	//Tick counts past 32 bits and infinite intervals must not wrap into a short timegap
	EXPECT_EQ(ExpectRangeError(1, 10, (4294967296.0 + 100) / 8), RangeError::TIMEGAP_TOO_LARGE);
	EXPECT_EQ(ExpectRangeError(1, 10, 1e300), RangeError::TIMEGAP_TOO_LARGE);
	EXPECT_EQ(ExpectRangeError(1, 10, INFINITY), RangeError::TIMEGAP_TOO_LARGE);

	//Largest interval the 16-bit tick counter holds
	auto result = m_session.Capture(1, 10, 0xffff / 8.0);
	EXPECT_DOUBLE_EQ(result.m_timegap, 0xffff / 8.0);
	EXPECT_EQ(ExpectRangeError(1, 10, 0x10000 / 8.0), RangeError::TIMEGAP_TOO_LARGE);
}

TEST_F(CaptureValidation, TooManySamples)
{
	EXPECT_EQ(ExpectRangeError(4, 3000, 2), RangeError::TOO_MANY_SAMPLES);
	EXPECT_EQ(ExpectRangeError(2, 5001, 2), RangeError::TOO_MANY_SAMPLES);
	EXPECT_EQ(ExpectRangeError(1, 10001, 1), RangeError::TOO_MANY_SAMPLES);
	EXPECT_EQ(ExpectRangeError(1, 0, 1), RangeError::TOO_FEW_SAMPLES);

	//Sample counts whose product with the channel count wraps around
	EXPECT_EQ(ExpectRangeError(4, SIZE_MAX / 4 + 1, 2), RangeError::TOO_MANY_SAMPLES);
	EXPECT_EQ(ExpectRangeError(2, SIZE_MAX / 2 + 1, 2), RangeError::TOO_MANY_SAMPLES);
	EXPECT_EQ(ExpectRangeError(1, SIZE_MAX, 2), RangeError::TOO_MANY_SAMPLES);

	//Exactly full is fine
	EXPECT_NO_THROW(m_session.Capture(4, 2500, 2));
	EXPECT_NO_THROW(m_session.Capture(1, 10000, 1));
}

TEST_F(CaptureValidation, MeasurementInputsOnlyInSingleChannelMode)
{
	m_session.SetChannelOneMap("CAP");

	size_t before = m_transport.GetCommandCount();
	EXPECT_THROW(m_session.Capture(2, 200, 2), InvalidChannelError);
	EXPECT_EQ(m_transport.GetCommandCount(), before);

	auto result = m_session.Capture(1, 200, 2);
	ASSERT_EQ(result.m_inputs.size(), 1u);
	EXPECT_EQ(result.m_inputs[0], INPUT_CAP);
}

TEST_F(CaptureValidation, TriggerMustBeOnCapturedSlot)
{
	m_session.ConfigureTrigger("CH3", 1.0);

	size_t before = m_transport.GetCommandCount();
	EXPECT_THROW(m_session.Capture(1, 200, 2), TypeMismatchError);
	EXPECT_THROW(m_session.Capture(2, 200, 2), TypeMismatchError);
	EXPECT_EQ(m_transport.GetCommandCount(), before);

	EXPECT_NO_THROW(m_session.Capture(3, 200, 2));

	//Still armed after the rejected captures
	EXPECT_TRUE(m_session.IsTriggerEnabled());
}

TEST_F(CaptureValidation, RejectedCaptureLeavesStateAlone)
{
	m_session.SetChannelOneMap("CH2");
	m_session.ConfigureTrigger("CH2", 0.5);
	m_session.SelectRange("CH2", 4);

	EXPECT_THROW(m_session.Capture(4, 3000, 2), RangeError);

	EXPECT_EQ(m_session.GetChannelOneMap(), INPUT_CH2);
	EXPECT_TRUE(m_session.IsTriggerEnabled());
	EXPECT_FLOAT_EQ(m_session.GetTriggerLevel(), 0.5);
	EXPECT_NEAR(m_session.GetRange(INPUT_CH2).m_max, 4.125, 1e-5);
}
