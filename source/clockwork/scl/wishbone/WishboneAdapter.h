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

#include "Wishbone.h"

#include "../../frontend/Block.h"
#include "../../frontend/Clock.h"
#include "../../frontend/Reg.h"
#include "../../utils/ConfigTree.h"

#include <string_view>
#include <variant>

namespace cwk::scl
{
	struct WishboneAdapterConfig
	{
		WishboneMode initiatorMode = WishboneMode::CLASSIC;
		WishboneGranularity initiatorGranularity = WishboneGranularity::BYTE;
		InterfacePresentation initiatorPresentation = InterfacePresentation::BUNDLED;

		WishboneMode targetMode = WishboneMode::CLASSIC;
		WishboneGranularity targetGranularity = WishboneGranularity::BYTE;
		InterfacePresentation targetPresentation = InterfacePresentation::BUNDLED;

		BitWidth addrWidth = BitWidth{ 32 };
		BitWidth dataWidth = BitWidth{ 32 };

		void loadConfig(const utils::ConfigTree &config);
	};

	/**
	 * @brief Connects a wishbone initiator to a wishbone target that differs in mode and/or address granularity.
	 * @details Requests and responses are forwarded in order and without buffering, the adapter only translates
	 * addresses and the handshake. Which handshake translation is used is decided once on construction:
	 * - same mode on both sides: all signals are passed through.
	 * - pipelined initiator, classic target: the strobe is forwarded as is and the initiator is stalled until
	 *   the target terminates the cycle, so at most one request is ever outstanding.
	 * - classic initiator, pipelined target: the strobe is only forwarded until the target accepted it (IDLE),
	 *   afterwards the adapter waits for the termination (WAIT_ACK), so a held strobe is not taken as a new request.
	 *
	 * The port connected to the initiator is initiator(), the port connected to the target is target().
	 */
	class WishboneAdapter : public Block
	{
	public:
		enum class GateState {
			IDLE,
			WAIT_ACK
		};

		struct SameMode {};
		struct PipelinedToClassic {};
		struct ClassicToPipelined {
			ClassicToPipelined(const Clock &clock) : waitAck(clock, false) { }
			Reg<bool> waitAck;
		};
		using Bridge = std::variant<SameMode, PipelinedToClassic, ClassicToPipelined>;

		WishboneAdapter(const Clock &clock, WishboneAdapterConfig config = {});

		/// Port that the initiator connects to. The adapter acts as a target here.
		Wishbone &initiator() { return m_initiator; }
		/// Port that the target connects to. The adapter acts as an initiator here.
		Wishbone &target() { return m_target; }

		const WishboneAdapterConfig &getConfig() const { return m_config; }
		const Bridge &bridge() const { return m_bridge; }
		std::string_view bridgeName() const;
		GateState gateState() const;

		void evaluate() override;
	protected:
		WishboneAdapterConfig m_config;
		Wishbone m_initiator;
		Wishbone m_target;
		Bridge m_bridge;

		WishboneAdapterConfig withInstanceConfig(WishboneAdapterConfig config) const;
	};
}
