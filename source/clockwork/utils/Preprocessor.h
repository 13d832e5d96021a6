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

/// Internal invariant, an InternalError points at a bug in the library.
#define CWK_ASSERT(x) { if (!(x)) { throw cwk::utils::InternalError(__FILE__, __LINE__, std::string("Assertion failed: ") + #x); }}

/// Elaboration time check of user supplied parameters and configuration.
#define CWK_DESIGNCHECK_HINT(x, message) { if (!(x)) { throw cwk::utils::DesignError(__FILE__, __LINE__, std::string("Design failed: ") + #x + " Hint: " + message); }}

/// Simulation time handshake violation of the block at instancePath.
#define CWK_PROTOCOL_ERROR(instancePath, message) { throw cwk::utils::ProtocolError(__FILE__, __LINE__, instancePath, std::string("Protocol violated: ") + message); }
