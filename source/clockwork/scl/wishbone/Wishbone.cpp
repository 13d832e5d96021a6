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
#include "Wishbone.h"

#include "../../utils/Exceptions.h"

namespace cwk::scl
{
	Wishbone::Wishbone(BitWidth addrWidth, BitWidth dataWidth) :
		adr(addrWidth),
		datW(dataWidth),
		sel(BitWidth{ std::max<uint64_t>(dataWidth.bits() / 8, 1) }),
		datR(dataWidth)
	{
	}

	void Wishbone::setName(std::string_view prefix, InterfacePresentation presentation, WishboneRole role)
	{
		const bool isTarget = role == WishboneRole::TARGET;

		auto name = [&](SignalBase &signal, std::string_view field, std::string_view discreteField, bool request) {
			if (presentation == InterfacePresentation::BUNDLED)
				signal.setName(std::string(prefix) + '.' + std::string(field));
			else
				signal.setName(std::string(prefix) + '_' + std::string(discreteField) + (request == isTarget ? "_i" : "_o"));
		};

		name(adr, "adr", "adr", true);
		name(datW, "dat_w", "dat", true);
		name(sel, "sel", "sel", true);
		name(cyc, "cyc", "cyc", true);
		name(stb, "stb", "stb", true);
		name(we, "we", "we", true);

		name(datR, "dat_r", "dat", false);
		name(ack, "ack", "ack", false);
		name(err, "err", "err", false);
		name(rty, "rty", "rty", false);
		name(stall, "stall", "stall", false);
	}

	size_t wishboneByteOffsetBits(BitWidth dataWidth)
	{
		switch (dataWidth.bits()) {
			case 8: return 0;
			case 16: return 1;
			case 32: return 2;
			case 64: return 3;
		}
		CWK_DESIGNCHECK_HINT(false, "Wishbone data width must be 8, 16, 32 or 64 bits to convert between byte and word addresses.");
		return 0;
	}

	std::uint64_t translateWishboneAddress(std::uint64_t address, WishboneGranularity from, WishboneGranularity to, BitWidth dataWidth, BitWidth addrWidth)
	{
		const size_t offsetBits = wishboneByteOffsetBits(dataWidth);
		address = addrWidth.truncate(address);

		if (from == to)
			return address;

		if (from == WishboneGranularity::BYTE)
			return address >> offsetBits;
		return addrWidth.truncate(address << offsetBits);
	}
}
