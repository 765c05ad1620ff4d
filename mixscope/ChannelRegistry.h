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
	@brief Declaration of ChannelRegistry
	@ingroup core
 */
#ifndef ChannelRegistry_h
#define ChannelRegistry_h

/**
	@brief Maps the four logical capture slots onto physical inputs

	Slot 1 goes through an analog multiplexer and may be pointed at any input in the allowed set. Slots 2, 3 and 4
	are hard wired to CH2, CH3 and CH4.

	@ingroup core
 */
class ChannelRegistry
{
public:
	ChannelRegistry();
	virtual ~ChannelRegistry();

	PhysicalInput Resolve(size_t slot) const;

	///@brief Gets the input slot 1 is currently routed to
	PhysicalInput GetChannelOneMap() const
	{ return m_channelOneMap; }

	void SetChannelOneMap(PhysicalInput input);
	void SetChannelOneMap(const std::string& name);
	void Remap(size_t slot, PhysicalInput input);

	bool FindSlot(PhysicalInput input, size_t& slot) const;

	static bool IsAllowedChannelOneMap(PhysicalInput input);

protected:
	PhysicalInput m_channelOneMap;
};

#endif
