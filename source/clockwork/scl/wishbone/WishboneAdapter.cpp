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
#include "WishboneAdapter.h"

#include "../../debug/DebugInterface.h"

namespace cwk::scl
{
	void WishboneAdapterConfig::loadConfig(const utils::ConfigTree &config)
	{
		if (config["initiator_mode"])
			initiatorMode = config["initiator_mode"].as<WishboneMode>();
		if (config["initiator_granularity"])
			initiatorGranularity = config["initiator_granularity"].as<WishboneGranularity>();
		if (config["initiator_presentation"])
			initiatorPresentation = config["initiator_presentation"].as<InterfacePresentation>();

		if (config["target_mode"])
			targetMode = config["target_mode"].as<WishboneMode>();
		if (config["target_granularity"])
			targetGranularity = config["target_granularity"].as<WishboneGranularity>();
		if (config["target_presentation"])
			targetPresentation = config["target_presentation"].as<InterfacePresentation>();

		if (config["addr_width"])
			addrWidth = config["addr_width"].as<BitWidth>();
		if (config["data_width"])
			dataWidth = config["data_width"].as<BitWidth>();
	}

	WishboneAdapterConfig WishboneAdapter::withInstanceConfig(WishboneAdapterConfig config) const
	{
		config.loadConfig(Block::config());

		CWK_DESIGNCHECK_HINT(config.addrWidth.bits() >= 1 && config.addrWidth.bits() <= 64, "Wishbone address width must be between 1 and 64 bits.");
		const std::uint64_t dataBits = config.dataWidth.bits();
		CWK_DESIGNCHECK_HINT(dataBits == 8 || dataBits == 16 || dataBits == 32 || dataBits == 64, "Wishbone data width must be 8, 16, 32 or 64 bits.");
		return config;
	}

	WishboneAdapter::WishboneAdapter(const Clock &clock, WishboneAdapterConfig config) :
		Block("wishbone_adapter"),
		m_config(withInstanceConfig(std::move(config))),
		m_initiator(m_config.addrWidth, m_config.dataWidth),
		m_target(m_config.addrWidth, m_config.dataWidth)
	{
		m_initiator.setName(instancePath() + "/initiator", m_config.initiatorPresentation, WishboneRole::TARGET);
		m_target.setName(instancePath() + "/target", m_config.targetPresentation, WishboneRole::INITIATOR);

		if (m_config.initiatorMode == WishboneMode::PIPELINED && m_config.targetMode == WishboneMode::CLASSIC)
			m_bridge.emplace<PipelinedToClassic>();
		else if (m_config.initiatorMode == WishboneMode::CLASSIC && m_config.targetMode == WishboneMode::PIPELINED) {
			auto &gate = m_bridge.emplace<ClassicToPipelined>(clock);
			sequential(clock, [this, &gate]() {
				if (!gate.waitAck.value()) {
					if (m_initiator.request() && !m_target.stall.value() && !m_target.ack.value())
						gate.waitAck.setNext(true);
				} else {
					if (m_target.terminated() || (!m_initiator.cyc.value() && !m_initiator.stb.value()))
						gate.waitAck.setNext(false);
				}
			});
		}

		dbg::log(dbg::LogMessage(this) << dbg::LogMessage::LOG_INFO << dbg::LogMessage::LOG_DESIGN
			<< "Bridging " << magic_enum::enum_name(m_config.initiatorMode) << " initiator ("
			<< magic_enum::enum_name(m_config.initiatorGranularity) << ") to "
			<< magic_enum::enum_name(m_config.targetMode) << " target ("
			<< magic_enum::enum_name(m_config.targetGranularity) << ") with " << bridgeName());
	}

	std::string_view WishboneAdapter::bridgeName() const
	{
		return std::visit([](const auto &bridge) -> std::string_view {
			using T = std::decay_t<decltype(bridge)>;
			if constexpr (std::is_same_v<T, SameMode>)
				return "passthrough";
			else if constexpr (std::is_same_v<T, PipelinedToClassic>)
				return "stall until termination";
			else
				return "strobe gate";
		}, m_bridge);
	}

	WishboneAdapter::GateState WishboneAdapter::gateState() const
	{
		if (auto *gate = std::get_if<ClassicToPipelined>(&m_bridge))
			return gate->waitAck.value() ? GateState::WAIT_ACK : GateState::IDLE;
		return GateState::IDLE;
	}

	void WishboneAdapter::evaluate()
	{
		m_target.adr = translateWishboneAddress(m_initiator.adr.value(), m_config.initiatorGranularity, m_config.targetGranularity,
												m_config.dataWidth, m_config.addrWidth);
		m_target.datW = m_initiator.datW.value();
		m_target.sel = m_initiator.sel.value();
		m_target.we = m_initiator.we.value();
		m_target.cyc = m_initiator.cyc.value();

		m_initiator.datR = m_target.datR.value();
		m_initiator.ack = m_target.ack.value();
		m_initiator.err = m_target.err.value();
		m_initiator.rty = m_target.rty.value();

		std::visit([this](const auto &bridge) {
			using T = std::decay_t<decltype(bridge)>;
			if constexpr (std::is_same_v<T, SameMode>) {
				m_target.stb = m_initiator.stb.value();
				m_initiator.stall = m_target.stall.value();
			} else if constexpr (std::is_same_v<T, PipelinedToClassic>) {
				m_target.stb = m_initiator.stb.value();
				m_initiator.stall = !m_target.terminated();
			} else {
				m_target.stb = m_initiator.stb.value() && !bridge.waitAck.value();
				m_initiator.stall = m_target.stall.value();
			}
		}, m_bridge);
	}
}
