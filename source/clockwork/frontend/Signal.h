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

#include "BitWidth.h"

#include "../simulation/Circuit.h"
#include "../utils/Exceptions.h"

#include <concepts>
#include <string>
#include <type_traits>

namespace cwk {

/**
 * @addtogroup cwk_frontend
 * @{
 */

class SignalBase
{
	public:
		void setName(std::string name) { m_name = std::move(name); }
		const std::string &getName() const { return m_name; }
	protected:
		std::string m_name;
};

template<typename T>
concept SignalValue = std::is_same_v<T, bool> || std::is_unsigned_v<T>;

/**
 * @brief A wire carrying a value of type T.
 * @details Unsigned signals have a width and all assigned values are truncated to it.
 * A signal can be connected to a driving signal, after which it always carries the value of the driver
 * and must not be assigned anymore. Signals are not copyable since they represent specific wires in the circuit,
 * assigning one signal to another copies the current value.
 */
template<SignalValue T>
class Signal : public SignalBase
{
	public:
		using value_type = T;

		Signal() : m_width(std::is_same_v<T, bool> ? 1 : sizeof(T) * 8) { }
		explicit Signal(BitWidth width) : m_width(width) {
			CWK_DESIGNCHECK_HINT(width.bits() > 0 && width.bits() <= sizeof(T) * 8, "Signal width must fit into the value type.");
			if constexpr (std::is_same_v<T, bool>)
				CWK_DESIGNCHECK_HINT(width.bits() == 1, "Bits are always one bit wide.");
		}
		Signal(const Signal&) = delete;

		Signal &operator=(const Signal &rhs) { set(rhs.value()); return *this; }
		Signal &operator=(T v) { set(v); return *this; }

		operator T() const { return value(); }
		T value() const { return m_driver != nullptr ? m_driver->value() : m_value; }
		BitWidth width() const { return m_width; }

		void set(T v) {
			CWK_DESIGNCHECK_HINT(m_driver == nullptr, "Signal " + m_name + " is driven by another signal and can not be assigned.");
			v = truncate(v);
			if (v != m_value) {
				m_value = v;
				sim::signalChangeCounter()++;
			}
		}

		/// Makes this signal follow driver. The driver must outlive this signal.
		void connect(const Signal &driver) {
			CWK_DESIGNCHECK_HINT(driver.width() == m_width, "Connected signals must be of the same width.");
			CWK_DESIGNCHECK_HINT(&driver != this, "A signal can not drive itself.");
			m_driver = &driver;
			sim::signalChangeCounter()++;
		}
		void disconnect() { m_driver = nullptr; sim::signalChangeCounter()++; }
		bool connected() const { return m_driver != nullptr; }

		T truncate(T v) const {
			if constexpr (std::is_same_v<T, bool>)
				return v;
			else
				return T(m_width.truncate(std::uint64_t(v)));
		}
	protected:
		BitWidth m_width;
		T m_value = T{};
		const Signal *m_driver = nullptr;
};

using Bit = Signal<bool>;
using UInt = Signal<std::uint64_t>;

/**@}*/

}
