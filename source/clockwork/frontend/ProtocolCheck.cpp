/*  This file is part of Clockwork, a library for circuit design.
	Copyright (C) 2021 Michael Offel, Andreas Ley

	Clockwork is free software; you can redistribute it and/or
	modify it under the terms of the GNU Lesser General Public
	License as published by the Free Software Foundation; either
	version 3 of the License, or (at your option) any later version.

	Clockwork is distributed in the hope that it will be useful,
	but WITHOUT ANY WARRANTY; without even the implied warranty of
	MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the GNU
	Lesser General Public License for more details.

	You should have received a copy of the GNU Lesser General Public
	License along with this library; if not, write to the Free Software
	Foundation, Inc., 51 Franklin Street, Fifth Floor, Boston, MA  02110-1301  USA
*/
#include "clockwork/pch.h"
#include "ProtocolCheck.h"

#include "Block.h"

#include "../debug/DebugInterface.h"
#include "../simulation/Simulator.h"
#include "../utils/Exceptions.h"

namespace cwk {

void reportProtocolViolation(const Block *block, ViolationPolicy policy, const std::string &what)
{
	std::stringstream time;
	if (sim::Simulator::hasActive())
		sim::formatTime(time, sim::Simulator::active().getCurrentSimulationTime());

	dbg::log(dbg::LogMessage(block) << dbg::LogMessage::LOG_ERROR << dbg::LogMessage::LOG_SIMULATION
		<< "Protocol violation in " << block << " at " << time.str() << ": " << what);

	if (policy == ViolationPolicy::THROW)
		CWK_PROTOCOL_ERROR(block->instancePath(), what);
}

}
