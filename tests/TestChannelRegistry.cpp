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
	@brief Tests for ChannelRegistry
 */

#include "TestHelpers.h"

using namespace std;

TEST(ChannelRegistry, DefaultMapping)
{
	ChannelRegistry reg;
	EXPECT_EQ(reg.Resolve(1), INPUT_CH1);
	EXPECT_EQ(reg.Resolve(2), INPUT_CH2);
	EXPECT_EQ(reg.Resolve(3), INPUT_CH3);
	EXPECT_EQ(reg.Resolve(4), INPUT_CH4);

	EXPECT_THROW(reg.Resolve(0), InvalidChannelError);
	EXPECT_THROW(reg.Resolve(5), InvalidChannelError);
}

TEST(ChannelRegistry, RemapSlotOne)
{
	ChannelRegistry reg;
	reg.SetChannelOneMap("CH3");
	EXPECT_EQ(reg.Resolve(1), INPUT_CH3);
	EXPECT_EQ(reg.Resolve(3), INPUT_CH3);

	//Lowest slot wins
	size_t slot = 0;
	ASSERT_TRUE(reg.FindSlot(INPUT_CH3, slot));
	EXPECT_EQ(slot, 1u);

	//CH1 isn't routed anywhere any more
	EXPECT_FALSE(reg.FindSlot(INPUT_CH1, slot));

	reg.SetChannelOneMap(INPUT_AN8);
	EXPECT_EQ(reg.GetChannelOneMap(), INPUT_AN8);
	ASSERT_TRUE(reg.FindSlot(INPUT_AN8, slot));
	EXPECT_EQ(slot, 1u);
}

TEST(ChannelRegistry, RejectsUnknownNames)
{
	ChannelRegistry reg;
	reg.SetChannelOneMap("VOL");

	EXPECT_THROW(reg.SetChannelOneMap("BAD"), InvalidChannelError);
	EXPECT_THROW(reg.SetChannelOneMap(""), InvalidChannelError);
	EXPECT_THROW(reg.SetChannelOneMap("ch1"), InvalidChannelError);
	EXPECT_THROW(reg.SetChannelOneMap(static_cast<PhysicalInput>(42)), InvalidChannelError);

	//Previous mapping is kept
	EXPECT_EQ(reg.Resolve(1), INPUT_VOL);
}

TEST(ChannelRegistry, FixedSlotsCannotBeRemapped)
{
	ChannelRegistry reg;
	EXPECT_THROW(reg.Remap(2, INPUT_CH1), InvalidChannelError);
	EXPECT_THROW(reg.Remap(4, INPUT_CAP), InvalidChannelError);
	EXPECT_EQ(reg.Resolve(2), INPUT_CH2);
	EXPECT_EQ(reg.Resolve(4), INPUT_CH4);

	reg.Remap(1, INPUT_CAP);
	EXPECT_EQ(reg.Resolve(1), INPUT_CAP);
}

TEST(ChannelRegistry, InputNames)
{
	for(auto input : GetAllInputs())
	{
		PhysicalInput parsed;
		ASSERT_TRUE(ParseInputName(GetInputName(input), parsed));
		EXPECT_EQ(parsed, input);
	}

	EXPECT_FALSE(IsDirectlyDigitized(INPUT_CAP));
	EXPECT_FALSE(IsDirectlyDigitized(INPUT_RES));
	EXPECT_TRUE(IsDirectlyDigitized(INPUT_CH1));
	EXPECT_TRUE(IsDirectlyDigitized(INPUT_AN8));
}
