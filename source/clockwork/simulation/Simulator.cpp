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
#include "Simulator.h"

#include "../debug/DebugInterface.h"
#include "../utils/Exceptions.h"

#include <sstream>

namespace cwk::sim {

thread_local Simulator *Simulator::m_active = nullptr;

bool Simulator::Timer::operator<(const Timer &rhs) const
{
	// std::priority_queue pops the largest element, so the earliest timer must compare largest.
	if (clockMore(time, rhs.time)) return true;
	if (clockLess(time, rhs.time)) return false;
	return order > rhs.order;
}

Simulator::Simulator(Circuit &circuit) : m_circuit(circuit)
{
	m_previouslyActive = m_active;
	m_active = this;
}

Simulator::~Simulator()
{
	m_coroutineHandler.stopAll();
	m_active = m_previouslyActive;
}

Simulator &Simulator::active()
{
	CWK_DESIGNCHECK_HINT(m_active != nullptr, "Simulation processes and signal access require an active simulator.");
	return *m_active;
}

void Simulator::addSimulationProcess(std::function<SimProcess()> simProc)
{
	m_simProcs.push_back(std::move(simProc));
	if (m_poweredOn) {
		auto *lastHandler = SimulationCoroutineHandler::activeHandler;
		SimulationCoroutineHandler::activeHandler = &m_coroutineHandler;
		forkFunc(std::function<SimProcess()>(m_simProcs.back()));
		SimulationCoroutineHandler::activeHandler = lastHandler;
		runProcesses();
	}
}

void Simulator::powerOn()
{
	m_coroutineHandler.stopAll();
	m_clockWaiters.clear();
	m_timers = {};
	m_now = ClockRational(0, 1);
	m_abortCalled = false;

	m_circuit.powerOn();
	m_stableChangeCounter = signalChangeCounter();
	m_poweredOn = true;

	dbg::log(dbg::LogMessage() << dbg::LogMessage::LOG_INFO << dbg::LogMessage::LOG_SIMULATION
		<< "Simulation powered on with " << m_circuit.getClockDomains().size() << " clock domains and "
		<< m_simProcs.size() << " simulation processes");

	auto *lastHandler = SimulationCoroutineHandler::activeHandler;
	SimulationCoroutineHandler::activeHandler = &m_coroutineHandler;
	for (const auto &simProc : m_simProcs) {
		auto functor = simProc;
		forkFunc(std::move(functor));
		if (m_abortCalled) break;
	}
	SimulationCoroutineHandler::activeHandler = lastHandler;
	runProcesses();
}

std::optional<ClockRational> Simulator::nextEventTime() const
{
	std::optional<ClockRational> next;
	if (!m_timers.empty())
		next = m_timers.top().time;
	for (const auto &domain : m_circuit.getClockDomains()) {
		ClockRational edge = domain->nextEdge();
		if (!next || clockLess(edge, *next))
			next = edge;
	}
	return next;
}

bool Simulator::advanceEvent()
{
	CWK_DESIGNCHECK_HINT(m_poweredOn, "The simulation must be powered on before it can advance.");
	if (m_abortCalled)
		return false;

	auto next = nextEventTime();
	if (!next)
		return false;

	CWK_ASSERT(!clockLess(*next, m_now));
	m_now = *next;

	while (!m_timers.empty() && m_timers.top().time == m_now) {
		m_coroutineHandler.readyToResume(m_timers.top().handle);
		m_timers.pop();
	}
	runProcesses();
	if (m_abortCalled) return true;

	std::vector<ClockDomain*> ticking;
	for (auto &domain : m_circuit.getClockDomains())
		if (domain->nextEdge() == m_now)
			ticking.push_back(domain.get());

	if (ticking.empty())
		return true;

	resumeClockWaiters(ticking, WaitClock::BEFORE);
	if (m_abortCalled) return true;

	for (auto *domain : ticking)
		domain->sample();

	resumeClockWaiters(ticking, WaitClock::DURING);
	if (m_abortCalled) return true;

	for (auto *domain : ticking)
		domain->commit();
	ensureStable();

	resumeClockWaiters(ticking, WaitClock::AFTER);
	return true;
}

void Simulator::advance(const ClockRational &seconds)
{
	ClockRational target = m_now + seconds;
	while (!m_abortCalled) {
		auto next = nextEventTime();
		if (!next || clockMore(*next, target))
			break;
		advanceEvent();
	}
	if (!m_abortCalled)
		m_now = target;
}

void Simulator::abort()
{
	m_abortCalled = true;
}

void Simulator::ensureStable()
{
	if (m_stableChangeCounter == signalChangeCounter())
		return;
	m_circuit.reevaluate();
	m_stableChangeCounter = signalChangeCounter();
}

void Simulator::waitClock(const ClockDomain *clock, WaitClock::TimingPhase phase, std::coroutine_handle<> handle)
{
	m_clockWaiters[clock][phase].push_back(handle);
}

void Simulator::waitFor(const ClockRational &seconds, std::coroutine_handle<> handle)
{
	if (seconds.numerator() == 0) {
		waitStable(handle);
		return;
	}
	m_timers.push(Timer{ m_now + seconds, m_timerOrder++, handle });
}

void Simulator::waitStable(std::coroutine_handle<> handle)
{
	ensureStable();
	m_coroutineHandler.readyToResume(handle);
}

void Simulator::resumeClockWaiters(const std::vector<ClockDomain*> &ticking, WaitClock::TimingPhase phase)
{
	for (auto *domain : ticking) {
		auto it = m_clockWaiters.find(domain);
		if (it == m_clockWaiters.end())
			continue;
		// Waiters registered while resuming wait for the next edge.
		auto waiters = std::move(it->second[phase]);
		it->second[phase].clear();
		for (auto handle : waiters)
			m_coroutineHandler.readyToResume(handle);
	}
	runProcesses();
}

void Simulator::runProcesses()
{
	ensureStable();
	m_coroutineHandler.run();
	if (m_abortCalled) {
		m_coroutineHandler.stopAll();
		m_clockWaiters.clear();
		m_timers = {};
		return;
	}
	ensureStable();
}

}
