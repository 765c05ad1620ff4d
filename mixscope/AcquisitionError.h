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
	@brief Declaration of the AcquisitionError exception hierarchy
	@ingroup core
 */
#ifndef AcquisitionError_h
#define AcquisitionError_h

/**
	@brief Base class for all errors raised by the acquisition core

	Validation errors are always thrown before anything is written to the device, so the caller may catch one and
	retry with corrected parameters against an unchanged session.

	@ingroup core
 */
class AcquisitionError : public std::runtime_error
{
public:
	AcquisitionError(const std::string& what)
		: std::runtime_error(what)
	{}
};

/**
	@brief A channel name or slot does not exist, or cannot be sampled in the requested configuration
 */
class InvalidChannelError : public AcquisitionError
{
public:
	InvalidChannelError(const std::string& what)
		: AcquisitionError(what)
	{}
};

/**
	@brief A channel reference is well formed, but cannot serve the requested role under the current mapping

	Typical case: a trigger configured on an input that is not routed to any ADC slot.
 */
class TypeMismatchError : public AcquisitionError
{
public:
	TypeMismatchError(const std::string& what)
		: AcquisitionError(what)
	{}
};

/**
	@brief A numeric parameter is outside the capability of the device
 */
class RangeError : public AcquisitionError
{
public:

	///@brief The specific limit that was violated
	enum Reason
	{
		///@brief More channels requested than the device has capture slots
		TOO_MANY_CHANNELS,

		///@brief sample_count * channel_count exceeds the sample buffer
		TOO_MANY_SAMPLES,

		///@brief A capture of zero samples was requested
		TOO_FEW_SAMPLES,

		///@brief Inter-sample interval below the device minimum
		TIMEGAP_TOO_SMALL,

		///@brief Inter-sample interval longer than the capture timer can count
		TIMEGAP_TOO_LARGE,

		///@brief Requested voltage is not covered by the range ladder
		RANGE_UNSUPPORTED
	};

	RangeError(Reason reason, const std::string& what)
		: AcquisitionError(what)
		, m_reason(reason)
	{}

	Reason GetReason() const
	{ return m_reason; }

protected:
	Reason m_reason;
};

/**
	@brief Communication with the device failed (short read, timeout, disconnection)

	Never retried by the core, since a partially transferred capture cannot be resumed.
 */
class TransportError : public AcquisitionError
{
public:
	TransportError(const std::string& what)
		: AcquisitionError(what)
	{}
};

/**
	@brief A device profile or saved session configuration is malformed
 */
class ConfigurationError : public AcquisitionError
{
public:
	ConfigurationError(const std::string& what)
		: AcquisitionError(what)
	{}
};

#endif
