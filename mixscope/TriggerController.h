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
	@brief Declaration of TriggerController
	@ingroup triggers
 */
#ifndef TriggerController_h
#define TriggerController_h

/**
	@brief What the trigger watches: either a logical slot, or a physical input wherever it is currently routed
 */
class TriggerSource
{
public:
	enum SourceType
	{
		SOURCE_SLOT,
		SOURCE_INPUT
	};

	static TriggerSource Slot(size_t slot);
	static TriggerSource Input(PhysicalInput input);

	std::string GetName() const;

	SourceType m_type;
	size_t m_slot;
	PhysicalInput m_input;
};

/**
	@brief Level trigger state for one device

	The trigger fires on a rising crossing of the level on one captured slot. The configuration persists across
	captures until it is changed or the trigger is disabled.

	@ingroup triggers
 */
class TriggerController
{
public:
	TriggerController();
	virtual ~TriggerController();

	void Configure(const TriggerSource& source, float level, const ChannelRegistry& registry, bool enable = true);
	void ConfigureDisarmed(const TriggerSource& source, float level);
	void Enable(const ChannelRegistry& registry);
	void Disable();

	///@brief Checks if captures wait for the trigger
	bool IsEnabled() const
	{ return m_enabled; }

	///@brief Gets the trigger level, in volts
	float GetLevel() const
	{ return m_level; }

	const TriggerSource& GetSource() const
	{ return m_source; }

	size_t ResolveSlot(const ChannelRegistry& registry) const;

protected:
	static size_t ResolveSlot(const TriggerSource& source, const ChannelRegistry& registry);

	bool m_enabled;
	TriggerSource m_source;
	float m_level;
};

#endif
