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
#include "Clock.h"

#include "DesignScope.h"

#include "../utils/Exceptions.h"

#include <boost/algorithm/string.hpp>

namespace cwk
{
	ClockRational clockFromString(std::string text)
	{
		double number = 0;
		std::string unit;
		std::istringstream{ text } >> number >> unit;

		ClockRational roundedNumber{ uint64_t(number * 1000), 1000 };
		ClockRational frequency;

		boost::algorithm::to_lower(unit);
		if (unit == "ps")
			frequency = ClockRational{ 1'000'000'000'000, 1 } / roundedNumber;
		else if (unit == "ns")
			frequency = ClockRational{ 1'000'000'000, 1 } / roundedNumber;
		else if (unit == "us")
			frequency = ClockRational{ 1'000'000, 1 } / roundedNumber;
		else if (unit == "ms")
			frequency = ClockRational{ 1'000, 1 } / roundedNumber;
		else if (unit == "s")
			frequency = ClockRational{ 1, 1 } / roundedNumber;
		else if (unit == "hz")
			frequency = roundedNumber;
		else if (unit == "khz")
			frequency = ClockRational{ 1'000, 1 } * roundedNumber;
		else if (unit == "mhz")
			frequency = ClockRational{ 1'000'000, 1 } * roundedNumber;
		else if (unit == "ghz")
			frequency = ClockRational{ 1'000'000'000, 1 } * roundedNumber;
		else
			throw std::runtime_error{ "unknown clock period unit '" + unit + "'. must be one of (ps, ns, us, ms, s, Hz, KHz, MHz, GHz)" };

		return frequency;
	}

	void ClockConfig::loadConfig(const utils::ConfigTree& config)
	{
		if (config.isScalar())
			absoluteFrequency = clockFromString(config.as<std::string>());
		else
		{
			if (config["name"])
				name = config["name"].as<std::string>();

			if (config["frequency"])
				absoluteFrequency = clockFromString(config["frequency"].as<std::string>());
			else if (config["period"])
				absoluteFrequency = clockFromString(config["period"].as<std::string>());

			if (config["phase"])
				phase = ClockRational{ 1, 1 } / clockFromString(config["phase"].as<std::string>());

			if (config["reset_type"])
				resetType = config["reset_type"].as<ResetType>();

			if (config["reset_active"])
				resetActive = config["reset_active"].as<ResetActive>();
		}
	}

	void ClockConfig::print(std::ostream& s) const
	{
		auto print = [&](std::string_view label, const auto& value)
		{
			if (value)
				s << ", " << label << ": " << magic_enum::enum_name(*value);
		};

		if (name)
			s << *name;

		if (absoluteFrequency)
			s << ", frequency: " << sim::toDouble(*absoluteFrequency) / 1'000'000 << " MHz";

		print("reset_type", resetType);
		print("reset_active", resetActive);
	}

	std::ostream& operator<<(std::ostream& s, const ClockConfig& cfg)
	{
		cfg.print(s);
		return s;
	}

	Clock::Clock(const ClockConfig &config)
	{
		CWK_DESIGNCHECK_HINT(config.absoluteFrequency, "A clock needs a frequency.");

		m_clock = DesignScope::require().getCircuit().createClockDomain(
			config.name.value_or("clk"),
			*config.absoluteFrequency,
			config.phase.value_or(ClockRational{ 0, 1 }),
			config.resetType.value_or(ResetType::SYNCHRONOUS),
			config.resetActive.value_or(ResetActive::LOW)
		);
	}

	void Clock::assertReset() const
	{
		m_clock->setResetLine(m_clock->resetActive() == ResetActive::HIGH);
	}

	void Clock::releaseReset() const
	{
		m_clock->setResetLine(m_clock->resetActive() == ResetActive::LOW);
	}
}
