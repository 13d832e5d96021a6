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

#include "../../frontend/BitWidth.h"
#include "../../frontend/Signal.h"

#include <cstdint>
#include <string>
#include <string_view>

namespace cwk::scl
{
	enum class WishboneMode {
		CLASSIC,	///< Strobe is held until the target terminates the cycle with ack, err or rty.
		PIPELINED	///< Every strobe without stall is a new request, responses follow in order.
	};

	enum class WishboneGranularity {
		BYTE,	///< Addresses count bytes.
		WORD	///< Addresses count words of the data width.
	};

	/// How the signals of a bus port are named.
	enum class InterfacePresentation {
		BUNDLED,	///< "prefix.adr", "prefix.ack", ...
		DISCRETE	///< "prefix_adr_i", "prefix_ack_o", ... with directions from the point of view of the port.
	};

	/// Whether a bus port receives requests (target) or issues them (initiator).
	enum class WishboneRole {
		TARGET,
		INITIATOR
	};

	/**
	 * @brief Signals of one wishbone bus.
	 * @details Request signals are driven by the initiator, response signals (datR, ack, err, rty, stall) by the target.
	 * stall is only meaningful in pipelined mode.
	 */
	struct Wishbone
	{
		Wishbone(BitWidth addrWidth, BitWidth dataWidth);

		UInt adr;
		UInt datW;
		UInt sel;
		Bit cyc;
		Bit stb;
		Bit we;

		UInt datR;
		Bit ack;
		Bit err;
		Bit rty;
		Bit stall;

		BitWidth addrWidth() const { return adr.width(); }
		BitWidth dataWidth() const { return datW.width(); }

		void setName(std::string_view prefix, InterfacePresentation presentation = InterfacePresentation::BUNDLED, WishboneRole role = WishboneRole::TARGET);

		/// A request is presented on the bus.
		bool request() const { return cyc.value() && stb.value(); }
		/// The cycle is terminated by the target.
		bool terminated() const { return ack.value() || err.value() || rty.value(); }
	};

	/// Number of low address bits that select a byte within a data word, i.e. log2 of the data width in bytes.
	size_t wishboneByteOffsetBits(BitWidth dataWidth);

	/**
	 * @brief Converts an address between byte and word granularity.
	 * @details Byte to word drops the byte offset bits, word to byte appends zero byte offset bits and drops
	 * whatever exceeds the address width. Unsupported data widths are a design error.
	 */
	std::uint64_t translateWishboneAddress(std::uint64_t address, WishboneGranularity from, WishboneGranularity to, BitWidth dataWidth, BitWidth addrWidth);
}
