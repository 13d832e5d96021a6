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
#include "DebugInterface.h"

#include "../frontend/Block.h"

#include <iostream>
#include <sstream>

namespace cwk::dbg {

thread_local std::unique_ptr<DebugInterface> DebugInterface::instance = std::make_unique<DebugInterface>();

LogMessage::LogMessage() { }

LogMessage::LogMessage(const Block *anchor)
{
	(*this) << Anchor{anchor};
}

LogMessage::LogMessage(const char *c)
{
	(*this) << c;
}

std::string LogMessage::text() const
{
	std::stringstream str;
	for (const auto &part : m_messageParts)
		std::visit([&str](const auto &v) {
			using T = std::decay_t<decltype(v)>;
			if constexpr (std::is_same_v<T, const Block*>) {
				if (v)
					str << v->instancePath();
				else
					str << "<unnamed>";
			} else
				str << v;
		}, part);
	return str.str();
}

std::ostream &operator<<(std::ostream &stream, LogMessage::Severity severity)
{
	switch (severity) {
		case LogMessage::LOG_INFO: return stream << "info";
		case LogMessage::LOG_WARNING: return stream << "warning";
		case LogMessage::LOG_ERROR: return stream << "error";
	}
	return stream;
}

void ConsoleLog::log(LogMessage msg)
{
	if (msg.severity() < m_minSeverity)
		return;

	std::cerr << '[' << msg.severity();
	if (msg.anchor())
		std::cerr << ' ' << msg.anchor()->instancePath();
	std::cerr << "] " << msg.text() << std::endl;
}

void logConsole(LogMessage::Severity minSeverity)
{
	DebugInterface::instance = std::make_unique<ConsoleLog>(minSeverity);
}

void log(const LogMessage &msg)
{
	DebugInterface::instance->log(msg);
}

std::string howToReachLog()
{
	return DebugInterface::instance->howToReachLog();
}

}
