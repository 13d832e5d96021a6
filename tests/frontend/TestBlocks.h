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

#include <clockwork/frontend.h>

namespace cwk::test {

	/// Combinational adder.
	class Adder : public Block
	{
	public:
		Adder(BitWidth width) : Block("adder"), a(width), b(width), sum(width) { }

		UInt a;
		UInt b;
		UInt sum;

		void evaluate() override { sum = a.value() + b.value(); }
	};

	/// Counter that increments while enable is high.
	class Counter : public Block
	{
	public:
		Counter(const Clock &clock, BitWidth width, std::uint64_t resetValue = 0) : Block("counter"), value(width), m_counter(clock, resetValue, width) {
			value.connect(m_counter);
			sequential(clock, [this]() {
				if (enable.value())
					m_counter.setNext(m_counter.value() + 1);
			});
		}

		Bit enable;
		UInt value;
	protected:
		Reg<std::uint64_t> m_counter;
	};

	/// Inverter driving its own input.
	class Oscillator : public Block
	{
	public:
		Oscillator() : Block("oscillator") { }

		Bit a;

		void evaluate() override { a = !a.value(); }
	};

}
