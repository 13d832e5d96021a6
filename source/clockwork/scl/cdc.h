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
#include "../frontend/Reg.h"
#include "../frontend/Signal.h"
#include "../utils/ConfigTree.h"

#include <cstdint>
#include <memory>
#include <optional>
#include <random>
#include <vector>

namespace cwk::scl
{
	struct SynchronizeParams {
		/// How many registers to build on the receiving side to prevent signal metastability
		size_t outStages = 2;
		/// Value of all synchronizer registers after reset of the receiving clock
		bool resetValue = false;
		/// Probability that the first stage resolves a changing input to the old value for one more tick
		double metastabilityProbability = 0.0;
		/// Seed of the metastability model
		std::uint32_t seed = 0;

		void loadConfig(const utils::ConfigTree &config);
	};

	/**
	 * @brief Synchronizer chain that brings an asynchronous bit into the clock domain of outClock.
	 * @details Some ticks after the input changed, the output carries a value the input held stably before.
	 * All registers are clocked and reset by outClock.
	 */
	class Synchronizer : public Block
	{
	public:
		Synchronizer(const Clock &outClock, SynchronizeParams params = {});

		/// Asynchronous input, usually connected to a register of another clock domain.
		Bit in;
		/// Synchronized level.
		Bit out;
		/// High for one tick whenever out changes from 0 to 1.
		Bit rising;
		/// High for one tick whenever out changes from 1 to 0.
		Bit falling;

		const SynchronizeParams &params() const { return m_params; }

		void evaluate() override;
	protected:
		SynchronizeParams m_params;
		std::vector<std::unique_ptr<Reg<bool>>> m_stages;
		std::optional<Reg<bool>> m_lastOut;
		std::mt19937 m_rng;
		std::bernoulli_distribution m_metastable;
	};

	/**
	 * @brief Transfers single tick events from the domain of inClock to the domain of outClock without losing or duplicating any.
	 * @details A rising edge on eventIn while ready is high sets a latch in the input domain and lowers ready.
	 * The latch is synchronized into the output domain, where its rising edge produces exactly one tick of eventOut.
	 * The synchronized level is synchronized back, clears the latch once it arrives and, once the cleared
	 * latch has made the round trip as well, raises ready again. This works for any ratio of clock frequencies.
	 *
	 * A rising edge on eventIn while ready is low is never accepted and is reported according to the violation policy.
	 */
	class EventRelay : public Block
	{
	public:
		enum class State {
			READY,
			WAITING
		};

		EventRelay(const Clock &inClock, const Clock &outClock, const SynchronizeParams &syncParams = {}, ViolationPolicy policy = DEFAULT_VIOLATION_POLICY);

		/// Input domain: assert for one tick to send an event.
		Bit eventIn;
		/// Input domain: high if a new event can be accepted.
		Bit ready;
		/// Output domain: high for one tick per accepted event.
		Bit eventOut;

		State state() const { return m_ready.value() ? State::READY : State::WAITING; }
		size_t accepted() const { return m_accepted; }
		size_t violations() const { return m_violations; }

		void setViolationPolicy(ViolationPolicy policy) { m_policy = policy; }
		ViolationPolicy violationPolicy() const { return m_policy; }
	protected:
		ViolationPolicy m_policy;

		Reg<bool> m_latch;
		Reg<bool> m_ready;
		Reg<bool> m_eventInLast;

		std::optional<Synchronizer> m_forward;
		std::optional<Synchronizer> m_feedback;

		size_t m_accepted = 0;
		size_t m_violations = 0;

		void tick();
	};
}
