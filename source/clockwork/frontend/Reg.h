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

#include "Signal.h"
#include "Clock.h"

#include "../simulation/ClockDomain.h"

namespace cwk {

/**
 * @addtogroup cwk_frontend
 * @{
 */

/**
 * @brief A signal that is owned by a clock domain.
 * @details The value only changes on a tick of its clock, to whatever was last passed to setNext()
 * by a sequential process of that clock. Without a new next value, the register keeps its value.
 * Asserting the reset of the clock loads the reset value instead, and so does power on.
 */
template<SignalValue T>
class Reg : public Signal<T>, public sim::RegisterBase
{
	public:
		Reg(const Clock &clock, T resetValue = T{}) : m_domain(clock.getClk()), m_resetValue(resetValue) {
			init();
		}
		Reg(const Clock &clock, T resetValue, BitWidth width) : Signal<T>(width), m_domain(clock.getClk()), m_resetValue(resetValue) {
			init();
		}
		~Reg() { m_domain->removeRegister(this); }

		Reg(const Reg&) = delete;
		void operator=(const Reg&) = delete;

		void setNext(T v) { m_next = this->truncate(v); }
		T next() const { return m_next; }
		T resetValue() const { return m_resetValue; }
		const sim::ClockDomain *domain() const { return m_domain; }

		void powerOn() override { m_next = m_resetValue; this->set(m_resetValue); }
		void loadReset() override { m_next = m_resetValue; }
		void commit() override { this->set(m_next); }
	protected:
		sim::ClockDomain *m_domain;
		T m_resetValue;
		T m_next;

		void init() {
			m_resetValue = this->truncate(m_resetValue);
			m_next = m_resetValue;
			this->m_value = m_resetValue;
			m_domain->addRegister(this);
		}
};

/**@}*/

}
