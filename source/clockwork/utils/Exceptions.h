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
#pragma once

#include "Preprocessor.h"

#include <boost/stacktrace.hpp>

#include <stdexcept>
#include <string>
#include <ostream>

namespace cwk::utils {

std::string composeErrorString(const char *file, size_t line, const std::string &what);
void printStackTrace(std::ostream &stream, const boost::stacktrace::stacktrace &trace);

/**
 * @brief Common base of all errors raised by the library.
 * @details Remembers where it was raised, both as source location and as the call stack leading there.
 */
template<class BaseError>
class ClockworkError : public BaseError
{
	public:
		ClockworkError(const char *file, size_t line, const std::string &what) :
				BaseError(composeErrorString(file, line, what)), m_file(file), m_line(line), m_trace(1, 20) { }

		const char *file() const { return m_file; }
		size_t line() const { return m_line; }
		const boost::stacktrace::stacktrace &getStackTrace() const { return m_trace; }
	protected:
		const char *m_file;
		size_t m_line;
		boost::stacktrace::stacktrace m_trace;
};

extern template class ClockworkError<std::logic_error>;
extern template class ClockworkError<std::runtime_error>;

/// Broken invariant inside the library itself.
class InternalError : public ClockworkError<std::logic_error>
{
	public:
		InternalError(const char *file, size_t line, const std::string &what);
		~InternalError();
};

/// Invalid design or configuration, detected while elaborating.
class DesignError : public ClockworkError<std::runtime_error>
{
	public:
		DesignError(const char *file, size_t line, const std::string &what);
		~DesignError();
};

/**
 * @brief A block was driven in a way its handshake contract forbids.
 * @details Only raised during simulation and only for blocks whose violation policy is set to throw.
 */
class ProtocolError : public ClockworkError<std::runtime_error>
{
	public:
		ProtocolError(const char *file, size_t line, std::string instancePath, const std::string &what);
		~ProtocolError();

		/// Instance path of the block whose protocol was violated.
		const std::string &instancePath() const { return m_instancePath; }
	protected:
		std::string m_instancePath;
};

template<class BaseError>
std::ostream &operator<<(std::ostream &stream, const ClockworkError<BaseError> &exception) {
	stream << exception.what() << std::endl << "Stack trace: " << std::endl;
	printStackTrace(stream, exception.getStackTrace());
	return stream;
}

}
