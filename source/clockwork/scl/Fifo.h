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

#include "../frontend/Block.h"
#include "../frontend/Clock.h"
#include "../frontend/ProtocolCheck.h"
#include "../frontend/Signal.h"
#include "../simulation/ClockDomain.h"

#include <deque>

namespace cwk::scl
{
	/**
	 * @brief Single clock show-ahead fifo.
	 * @details The oldest element is always visible on popData while empty is low. Asserting pop removes it on the next tick,
	 * asserting push appends pushData on the next tick. Pushing into a full fifo (unless also popping) and popping an empty fifo
	 * are reported according to the violation policy and do not change the content.
	 */
	template<SignalValue T>
	class SyncFifo : public Block, public sim::RegisterBase
	{
	public:
		SyncFifo(const Clock &clock, size_t depth, BitWidth width = BitWidth{ std::is_same_v<T, bool> ? 1 : sizeof(T) * 8 },
				ViolationPolicy policy = DEFAULT_VIOLATION_POLICY);
		~SyncFifo();

		Bit push;
		Signal<T> pushData;
		Bit pop;

		Signal<T> popData;
		Bit empty;
		Bit full;
		Bit almostEmpty;
		Bit almostFull;
		UInt count;

		/// almostEmpty is high while at most this many elements are stored.
		void almostEmptyThreshold(size_t elements);
		/// almostFull is high while at least this many elements are stored.
		void almostFullThreshold(size_t elements);

		size_t depth() const { return m_depth; }
		size_t violations() const { return m_violations; }

		void evaluate() override;

		void powerOn() override;
		void loadReset() override;
		void commit() override;
	protected:
		sim::ClockDomain *m_domain;
		ViolationPolicy m_policy;
		size_t m_depth;
		size_t m_almostEmptyThreshold = 0;
		size_t m_almostFullThreshold;

		std::deque<T> m_buffer;
		std::deque<T> m_nextBuffer;
		size_t m_violations = 0;

		void tick();
	};

	template<SignalValue T>
	SyncFifo<T>::SyncFifo(const Clock &clock, size_t depth, BitWidth width, ViolationPolicy policy) :
		Block("fifo"),
		pushData(width),
		popData(width),
		count(BitWidth::forValue(depth)),
		m_domain(clock.getClk()),
		m_policy(policy),
		m_depth(depth),
		m_almostFullThreshold(depth)
	{
		CWK_DESIGNCHECK_HINT(depth > 0, "A fifo needs to be able to hold at least one element.");

		if (auto cfg = config("almost_empty"))
			almostEmptyThreshold(cfg.as<size_t>());
		if (auto cfg = config("almost_full"))
			almostFullThreshold(cfg.as<size_t>());

		push.setName(instancePath() + ".push");
		pushData.setName(instancePath() + ".push_data");
		pop.setName(instancePath() + ".pop");
		popData.setName(instancePath() + ".pop_data");

		m_domain->addRegister(this);
		sequential(clock, [this]() { tick(); });
	}

	template<SignalValue T>
	SyncFifo<T>::~SyncFifo()
	{
		m_domain->removeRegister(this);
	}

	template<SignalValue T>
	void SyncFifo<T>::almostEmptyThreshold(size_t elements)
	{
		CWK_DESIGNCHECK_HINT(elements <= depth(), "The almost empty threshold must not exceed the fifo depth.");
		m_almostEmptyThreshold = elements;
		sim::signalChangeCounter()++;
	}

	template<SignalValue T>
	void SyncFifo<T>::almostFullThreshold(size_t elements)
	{
		CWK_DESIGNCHECK_HINT(elements <= depth(), "The almost full threshold must not exceed the fifo depth.");
		m_almostFullThreshold = elements;
		sim::signalChangeCounter()++;
	}

	template<SignalValue T>
	void SyncFifo<T>::tick()
	{
		m_nextBuffer = m_buffer;

		bool popping = pop.value();
		if (popping) {
			if (m_buffer.empty()) {
				m_violations++;
				reportProtocolViolation(this, m_policy, "pop was asserted while the fifo was empty.");
				popping = false;
			} else
				m_nextBuffer.pop_front();
		}

		if (push.value()) {
			if (m_buffer.size() == m_depth && !popping) {
				m_violations++;
				reportProtocolViolation(this, m_policy, "push was asserted while the fifo was full.");
			} else
				m_nextBuffer.push_back(pushData.value());
		}
	}

	template<SignalValue T>
	void SyncFifo<T>::evaluate()
	{
		popData = m_buffer.empty() ? T{} : m_buffer.front();
		empty = m_buffer.empty();
		full = m_buffer.size() == m_depth;
		almostEmpty = m_buffer.size() <= m_almostEmptyThreshold;
		almostFull = m_buffer.size() >= m_almostFullThreshold;
		count = m_buffer.size();
	}

	template<SignalValue T>
	void SyncFifo<T>::powerOn()
	{
		m_buffer.clear();
		m_nextBuffer.clear();
		sim::signalChangeCounter()++;
	}

	template<SignalValue T>
	void SyncFifo<T>::loadReset()
	{
		m_nextBuffer.clear();
	}

	template<SignalValue T>
	void SyncFifo<T>::commit()
	{
		if (m_buffer == m_nextBuffer)
			return;
		m_buffer = m_nextBuffer;
		sim::signalChangeCounter()++;
	}
}
