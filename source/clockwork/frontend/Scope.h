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

namespace cwk {

/**
 * @addtogroup cwk_scopes
 * @{
 */

/**
 * @brief Per thread stack of RAII scopes of one kind.
 * @details Scopes must be destroyed in reverse order of construction, which holds for scopes living on the stack.
 */
template<class FinalType>
class ScopeStack
{
	public:
		ScopeStack() : m_outer(m_innermost) { m_innermost = static_cast<FinalType*>(this); }
		~ScopeStack() { m_innermost = m_outer; }

		ScopeStack(const ScopeStack&) = delete;
		void operator=(const ScopeStack&) = delete;

		/// Most recently entered scope of this kind that is still alive, or nullptr.
		static FinalType *innermost() { return m_innermost; }
		FinalType *outer() const { return m_outer; }
	private:
		FinalType *m_outer;
		static thread_local FinalType *m_innermost;
};

template<class FinalType>
thread_local FinalType *ScopeStack<FinalType>::m_innermost = nullptr;

/**@}*/

}
