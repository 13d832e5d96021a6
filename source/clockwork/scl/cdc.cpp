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
#include "cdc.h"

#include "../debug/DebugInterface.h"

namespace cwk::scl
{
	void SynchronizeParams::loadConfig(const utils::ConfigTree &config)
	{
		if (config["out_stages"])
			outStages = config["out_stages"].as<size_t>();
		if (config["reset_value"])
			resetValue = config["reset_value"].as<bool>();
		if (config["metastability_probability"])
			metastabilityProbability = config["metastability_probability"].as<double>();
		if (config["seed"])
			seed = config["seed"].as<std::uint32_t>();
	}

	Synchronizer::Synchronizer(const Clock &outClock, SynchronizeParams params) :
		Block("synchronizer"),
		m_params(params)
	{
		m_params.loadConfig(config());

		CWK_DESIGNCHECK_HINT(m_params.outStages >= 2, "Building a synchronizer chain with less than two synchronization registers is probably a mistake!");
		CWK_DESIGNCHECK_HINT(m_params.metastabilityProbability >= 0.0 && m_params.metastabilityProbability < 1.0, "The metastability probability must be in [0, 1).");

		in.setName(instancePath() + ".in");
		out.setName(instancePath() + ".out");
		rising.setName(instancePath() + ".rising");
		falling.setName(instancePath() + ".falling");

		for (size_t i = 0; i < m_params.outStages; i++)
			m_stages.push_back(std::make_unique<Reg<bool>>(outClock, m_params.resetValue));
		m_lastOut.emplace(outClock, m_params.resetValue);

		out.connect(*m_stages.back());

		m_rng.seed(m_params.seed);
		m_metastable = std::bernoulli_distribution(m_params.metastabilityProbability);

		sequential(outClock, [this]() {
			bool captured = in.value();
			if (captured != m_stages.front()->value() && m_params.metastabilityProbability > 0.0 && m_metastable(m_rng))
				captured = m_stages.front()->value();
			m_stages.front()->setNext(captured);

			for (size_t i = 1; i < m_stages.size(); i++)
				m_stages[i]->setNext(m_stages[i-1]->value());

			m_lastOut->setNext(m_stages.back()->value());
		});
	}

	void Synchronizer::evaluate()
	{
		rising = out.value() && !m_lastOut->value();
		falling = !out.value() && m_lastOut->value();
	}

	EventRelay::EventRelay(const Clock &inClock, const Clock &outClock, const SynchronizeParams &syncParams, ViolationPolicy policy) :
		Block("event_relay"),
		m_policy(policy),
		m_latch(inClock, false),
		m_ready(inClock, true),
		m_eventInLast(inClock, false)
	{
		auto scope = enter();

		eventIn.setName(instancePath() + ".event_in");
		ready.setName(instancePath() + ".ready");
		eventOut.setName(instancePath() + ".event_out");

		SynchronizeParams feedbackParams = syncParams;
		feedbackParams.seed = syncParams.seed + 1;

		m_forward.emplace(outClock, syncParams);
		m_forward->in.connect(m_latch);
		m_feedback.emplace(inClock, feedbackParams);
		m_feedback->in.connect(m_forward->out);

		eventOut.connect(m_forward->rising);
		ready.connect(m_ready);

		sequential(inClock, [this]() { tick(); });
	}

	void EventRelay::tick()
	{
		bool rising = eventIn.value() && !m_eventInLast.value();
		m_eventInLast.setNext(eventIn.value());

		bool feedback = m_feedback->out.value();

		if (rising) {
			if (m_ready.value()) {
				m_latch.setNext(true);
				m_ready.setNext(false);
				m_accepted++;
			} else {
				m_violations++;
				reportProtocolViolation(this, m_policy, "event_in was asserted while ready was low, the event is dropped.");
			}
		}

		if (m_latch.value() && feedback)
			m_latch.setNext(false);
		else if (!m_latch.value() && !feedback && !m_ready.value())
			m_ready.setNext(true);
	}
}
