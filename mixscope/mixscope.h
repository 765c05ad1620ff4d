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
	@brief Main library include file
 */

#ifndef mixscope_h
#define mixscope_h

#include <deque>
#include <vector>
#include <string>
#include <map>
#include <set>
#include <list>
#include <mutex>
#include <chrono>
#include <thread>
#include <memory>
#include <random>
#include <functional>
#include <algorithm>
#include <stdexcept>
#include <stdint.h>
#include <stdio.h>
#include <math.h>
#include <float.h>

#include <sigc++/sigc++.h>

#include <yaml-cpp/yaml.h>

#include <log.h>

#include "AcquisitionError.h"
#include "PhysicalInput.h"
#include "DeviceLimits.h"
#include "CalibrationTable.h"
#include "DeviceProfile.h"

#include "ScopeTransport.h"
#include "DeviceCommand.h"
#include "SimulatedTransport.h"

#include "ChannelRegistry.h"
#include "TriggerController.h"
#include "VoltageConverter.h"
#include "CaptureResult.h"
#include "AcquisitionEngine.h"
#include "AcquisitionSession.h"

void TransportStaticInit();


#endif
