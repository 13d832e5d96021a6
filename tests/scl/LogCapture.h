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

#include <clockwork/debug/DebugInterface.h>

#include <algorithm>
#include <memory>
#include <string>
#include <vector>

namespace cwk::test {

	/// Keeps every log message for inspection.
	class CollectingLog : public dbg::DebugInterface
	{
	public:
		void log(dbg::LogMessage msg) override { messages.push_back(std::move(msg)); }

		size_t count(dbg::LogMessage::Severity severity) const {
			return std::count_if(messages.begin(), messages.end(), [severity](const dbg::LogMessage &msg) { return msg.severity() == severity; });
		}

		std::vector<dbg::LogMessage> messages;
	};

	/**
	 * @brief Redirects the log of the current thread into a CollectingLog for the lifetime of this object.
	 * @details Must be destroyed before the blocks that are referenced by the collected messages.
	 */
	class LogCapture
	{
	public:
		LogCapture() : m_previous(std::move(dbg::DebugInterface::instance)) {
			auto log = std::make_unique<CollectingLog>();
			m_log = log.get();
			dbg::DebugInterface::instance = std::move(log);
		}
		~LogCapture() { dbg::DebugInterface::instance = std::move(m_previous); }

		LogCapture(const LogCapture&) = delete;
		void operator=(const LogCapture&) = delete;

		const CollectingLog &log() const { return *m_log; }
	protected:
		std::unique_ptr<dbg::DebugInterface> m_previous;
		CollectingLog *m_log;
	};

}
