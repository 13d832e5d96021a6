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

#include <string>

namespace cwk {

class Block;

/**
 * @addtogroup cwk_frontend
 * @{
 */

/// How a block reacts when its inputs are driven in a way that breaks its handshake.
enum class ViolationPolicy {
	THROW,	///< Log an error and throw a utils::ProtocolError out of the simulation.
	LOG		///< Log an error and continue, the offending input is ignored.
};

#ifdef NDEBUG
constexpr ViolationPolicy DEFAULT_VIOLATION_POLICY = ViolationPolicy::LOG;
#else
constexpr ViolationPolicy DEFAULT_VIOLATION_POLICY = ViolationPolicy::THROW;
#endif

/**
 * @brief Reports a protocol violation of block according to policy.
 * @details Always logs an error, throws a utils::ProtocolError if the policy demands it.
 */
void reportProtocolViolation(const Block *block, ViolationPolicy policy, const std::string &what);

/**@}*/

}
