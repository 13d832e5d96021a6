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
#include "ClockRational.h"

namespace cwk::sim {

void formatTime(std::ostream &stream, ClockRational time)
{
	std::vector<const char*> unitsOfTime = {"s", "ms", "us", "ns", "ps", "fs"};

	size_t unitIdx = 0;
	while (time.numerator() != 0 && clockLess(time, ClockRational(1, 1)) && unitIdx+1 < unitsOfTime.size()) {
		unitIdx++;
		time *= ClockRational(1000, 1);
	}

	if (time.denominator() == 1)
		stream << time.numerator() << ' ' << unitsOfTime[unitIdx];
	else
		stream << toDouble(time) << ' ' << unitsOfTime[unitIdx];
}

}
