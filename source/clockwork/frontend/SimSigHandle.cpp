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
#include "SimSigHandle.h"

namespace cwk {

	Seconds getCurrentSimulationTime()
	{
		return sim::Simulator::active().getCurrentSimulationTime();
	}

	sim::WaitClock AfterClk(const Clock& clk)
	{
		return sim::WaitClock(clk.getClk(), sim::WaitClock::AFTER);
	}

	sim::WaitClock OnClk(const Clock& clk)
	{
		return sim::WaitClock(clk.getClk(), sim::WaitClock::DURING);
	}

}
