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

#include <memory>
#include <ostream>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace cwk {
	class Block;
}

/**
 * @addtogroup cwk_debug Debugging and logging
 * @{
 */

namespace cwk::dbg {

/**
 * @brief Log message that can refer to blocks of the design.
 * @details Log messages are composed with the << operator, similar to output streams.
 *
 * A common use case is `log(LogMessage(this) << LogMessage::LOG_ERROR << LogMessage::LOG_SIMULATION << "Event dropped at " << name());`
 */
class LogMessage
{
	public:
		enum Severity {
			LOG_INFO,
			LOG_WARNING,
			LOG_ERROR
		};

		enum Source {
			LOG_DESIGN,
			LOG_SIMULATION
		};

		struct Anchor {
			const Block *block;
		};

		/// Creates an empty log message
		LogMessage();
		/// Same as `LogMessage() << Anchor(anchor)`
		LogMessage(const Block *anchor);
		/// Same as `LogMessage() << c`
		LogMessage(const char *c);

		/// Sets the severity of the log message
		LogMessage &operator<<(Severity s) { m_severity = s; return *this; }
		/// Sets the origin of the log message
		LogMessage &operator<<(Source s) { m_source = s; return *this; }
		/// Sets a block as the context of this log message, to allow backends to filter messages by block.
		LogMessage &operator<<(Anchor a) { m_anchor = a.block; return *this; }
		LogMessage &operator<<(const char *c) { m_messageParts.push_back(c); return *this; }
		LogMessage &operator<<(std::string s) { m_messageParts.push_back(std::move(s)); return *this; }
		LogMessage &operator<<(std::string_view s) { m_messageParts.push_back(std::string(s)); return *this; }
		/// @brief Adds a reference to a block to the message, rendered as its instance path.
		LogMessage &operator<<(const Block *block) { m_messageParts.push_back(block); return *this; }
		LogMessage &operator<<(std::size_t v) { m_messageParts.push_back(std::to_string(v)); return *this; }

		Severity severity() const { return m_severity; }
		Source source() const { return m_source; }

		const auto &parts() const { return m_messageParts; }
		const Block *anchor() const { return m_anchor; }

		/// Renders all parts into a single line of text.
		std::string text() const;
	protected:
		Severity m_severity = LOG_INFO;
		Source m_source = LOG_DESIGN;
		const Block *m_anchor = nullptr;

		std::vector<std::variant<const char*, std::string, const Block*>> m_messageParts;
};

std::ostream &operator<<(std::ostream &stream, LogMessage::Severity severity);

/**
 * @brief Common interface that all logging backends must implement.
 * @details Also serves as the default implementation that silently ignores all log messages.
 */
class DebugInterface
{
	public:
		virtual ~DebugInterface() = default;

		thread_local static std::unique_ptr<DebugInterface> instance;

		virtual void log(LogMessage msg) { }
		virtual std::string howToReachLog() { return "Logging disabled! Rerun with a call to e.g. cwk::dbg::logConsole."; }
};

/// Writes every message of at least the given severity to std::cerr.
class ConsoleLog : public DebugInterface
{
	public:
		ConsoleLog(LogMessage::Severity minSeverity) : m_minSeverity(minSeverity) { }

		void log(LogMessage msg) override;
		std::string howToReachLog() override { return "Log is written to stderr."; }
	protected:
		LogMessage::Severity m_minSeverity;
};

/// Initialize logging to write to the console
void logConsole(LogMessage::Severity minSeverity = LogMessage::LOG_WARNING);

/// Log a message to whatever backend has been initialized.
void log(const LogMessage &msg);
/// Print a short, human readable description of how the log can be accessed.
std::string howToReachLog();

}

/**@}*/
