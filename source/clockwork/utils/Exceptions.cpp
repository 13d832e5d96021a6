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
#include "Exceptions.h"

#include <boost/format.hpp>

namespace cwk::utils {

template class ClockworkError<std::logic_error>;
template class ClockworkError<std::runtime_error>;

std::string composeErrorString(const char *file, size_t line, const std::string &what)
{
	return (boost::format("%s Location: %s(%d)") % what % file % line).str();
}

void printStackTrace(std::ostream &stream, const boost::stacktrace::stacktrace &trace)
{
	size_t idx = 0;
	for (const auto &frame : trace)
		stream << boost::format("\t%d: %s at %s:%d") % idx++ % frame.name() % frame.source_file() % frame.source_line() << std::endl;
}

InternalError::InternalError(const char *file, size_t line, const std::string &what) : ClockworkError<std::logic_error>(file, line, what) { }
InternalError::~InternalError() { }

DesignError::DesignError(const char *file, size_t line, const std::string &what) : ClockworkError<std::runtime_error>(file, line, what) { }
DesignError::~DesignError() { }

ProtocolError::ProtocolError(const char *file, size_t line, std::string instancePath, const std::string &what) :
	ClockworkError<std::runtime_error>(file, line, instancePath + ": " + what),
	m_instancePath(std::move(instancePath))
{
}

ProtocolError::~ProtocolError() { }

}
