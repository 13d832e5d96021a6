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
#include "SimulationProcess.h"

#include <algorithm>

namespace cwk::sim {

thread_local SimulationCoroutineHandler *SimulationCoroutineHandler::activeHandler = nullptr;

SimulationCoroutineHandler::~SimulationCoroutineHandler()
{
	stopAll();
}

void SimulationCoroutineHandler::start(const SimProcess &process, bool runImmediate)
{
	CWK_ASSERT(!process.getHandle().done());
	m_processes.push_back(process.getHandle());
	if (runImmediate)
		process.getHandle().resume();
	else
		readyToResume(process.getHandle().rawHandle());
}

void SimulationCoroutineHandler::stopAll()
{
	auto lastHandler = activeHandler;
	activeHandler = this;
	while (!m_readyToResume.empty())
		m_readyToResume.pop();
	// Destroying a process can destroy sub-processes, which must not find themselves in the list anymore.
	auto processes = std::move(m_processes);
	m_processes.clear();
	processes.clear();
	m_finished.clear();
	activeHandler = lastHandler;
}

void SimulationCoroutineHandler::run()
{
	auto lastHandler = activeHandler;
	activeHandler = this;
	try {
		while (!m_readyToResume.empty()) {
			auto handle = m_readyToResume.front();
			m_readyToResume.pop();
			handle.resume();
			m_finished.clear();
		}
	} catch (...) {
		activeHandler = lastHandler;
		throw;
	}
	activeHandler = lastHandler;
}

void SimulationCoroutineHandler::coroutineFinalSuspending(std::coroutine_handle<> handle)
{
	auto it = std::find_if(m_processes.begin(), m_processes.end(), [&](const SimProcess::Handle &h) {
		return h.rawHandle().address() == handle.address();
	});
	if (it != m_processes.end()) {
		// Defer destruction until the coroutine has fully suspended.
		auto finished = std::move(*it);
		m_processes.erase(it);
		m_finished.push_back(std::move(finished));
	}
}

template class SimulationFunction<void>;
template class SimulationFunction<bool>;
template class SimulationFunction<std::uint64_t>;

}
