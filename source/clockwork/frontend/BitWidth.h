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

#include <compare>
#include <cstdint>
#include <ostream>

namespace cwk
{
/**
 * @addtogroup cwk_frontend
 * @{
 */

	/// Number of bits of a signal or bus field.
	struct BitWidth
	{
		std::uint64_t value = 0;

		BitWidth() = default;
		constexpr explicit BitWidth(std::uint64_t v) : value(v) { }

		/// Smallest width able to hold every value in [0, maxValue].
		static constexpr BitWidth forValue(std::uint64_t maxValue) {
			std::uint64_t bits = 1;
			while (bits < 64 && (maxValue >> bits) != 0)
				bits++;
			return BitWidth{ bits };
		}

		auto operator <=> (const BitWidth&) const = default;
		bool operator == (const BitWidth&) const = default;

		constexpr std::uint64_t bits() const { return value; }
		constexpr std::uint64_t mask() const { return (value >= 64) ? ~0ull : (1ull << value) - 1; }
		constexpr std::uint64_t truncate(std::uint64_t v) const { return v & mask(); }
	};

	inline namespace literals
	{
		constexpr BitWidth operator"" _b(unsigned long long bit) { return BitWidth{ bit }; }
	}

	inline std::ostream& operator << (std::ostream& s, BitWidth width)
	{
		return s << width.value << 'b';
	}

/**@}*/
}
