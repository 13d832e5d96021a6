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

#include "Scope.h"

#include "../simulation/Circuit.h"
#include "../utils/ConfigTree.h"

#include <filesystem>
#include <map>
#include <string>
#include <string_view>

namespace cwk {

/**
 * @addtogroup cwk_scopes
 * @{
 */

/**
 * @brief The design scope holds the circuit and the design configuration and provides the context for all blocks and clocks.
 * @details Everything that is part of a design must be created while its DesignScope is the innermost one
 * and must be destroyed before it.
 */
class DesignScope : public ScopeStack<DesignScope>
{
	public:
		DesignScope(std::string_view topName = "top");

		static DesignScope *get() { return innermost(); }
		/// Same as get(), but fails with a DesignError if no design scope exists.
		static DesignScope &require();

		sim::Circuit &getCircuit() { return m_circuit; }
		const sim::Circuit &getCircuit() const { return m_circuit; }

		const std::string &topName() const { return m_topName; }

		/// Layers another yaml document on top of the design configuration.
		void loadConfig(const std::filesystem::path &filename) { m_config.loadFromFile(filename); }
		void loadConfigString(const std::string &document) { m_config.loadFromString(document); }
		const utils::ConfigTree &config() const { return m_config; }
		utils::ConfigTree config(std::string_view path) const { return m_config[path]; }

		/// Hands out unique instance names among the top level blocks.
		std::string allocateInstanceName(const std::string &name) { return name + std::to_string(m_instanceCounter[name]++); }
	protected:
		sim::Circuit m_circuit;
		utils::ConfigTree m_config;
		std::string m_topName;
		std::map<std::string, size_t> m_instanceCounter;
};

/** @}*/

}
