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

#include "../frontend/BitWidth.h"

#include <yaml-cpp/yaml.h>
#include <magic_enum.hpp>
#include <boost/lexical_cast.hpp>

#include <cctype>
#include <filesystem>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace cwk::utils
{
	/// Matches the beginning of str against a pattern where '*' matches anything except '/'.
	std::optional<std::string_view> globbingMatchPath(std::string_view pattern, std::string_view str);
	/// Replaces all occurences of $(NAME) with the value of the environment variable NAME.
	std::string replaceEnvVars(const std::string& src);

	/**
	 * @brief Read only view into one or more layered yaml documents.
	 * @details Later documents override earlier ones. Map keys may contain '*' wildcards which are matched
	 * against the '/' separated path segments of a lookup, so that e.g. a key "top/adapter_*" configures every
	 * instance whose name starts with "adapter_" directly below "top".
	 */
	class YamlConfigTree
	{
	public:
		YamlConfigTree() = default;
		YamlConfigTree(YAML::Node node);

		explicit operator bool() const { return isDefined(); }
		bool isDefined() const;
		bool isNull() const;
		bool isScalar() const;
		bool isSequence() const;
		bool isMap() const;

		size_t size() const;
		YamlConfigTree operator[](size_t index) const;

		YamlConfigTree operator[](std::string_view path) const;
		template<typename T> T as(const T& def) const;
		template<typename T> T as() const;

		void loadFromFile(const std::filesystem::path &filename);
		void loadFromString(const std::string &document);

	protected:
		std::vector<YAML::Node> m_nodes;
	};

	template<typename T>
	inline T YamlConfigTree::as(const T& def) const
	{
		if (m_nodes.size() != 1)
			return def;

		try {
			return m_nodes.front().as<T>();
		} catch (const YAML::Exception &) {
			auto str = m_nodes.front().as<std::string>();
			if (str.empty() || str[0] != '$')
				throw;
			str = replaceEnvVars(str);
			if constexpr (std::is_same_v<T, bool>) {
				if (str == "false" || str == "No")
					return false;
				if (str == "true" || str == "Yes")
					return true;
				throw;
			} else if constexpr (std::is_integral_v<T> || std::is_floating_point_v<T>)
				return boost::lexical_cast<T>(str);
			else
				throw;
		}
	}

	template<typename T>
	inline T YamlConfigTree::as() const
	{
		if (m_nodes.size() != 1)
			throw std::runtime_error{ "non optional config value not found" };

		return m_nodes.front().as<T>();
	}

	template<>
	inline std::string YamlConfigTree::as(const std::string& def) const
	{
		if (m_nodes.size() != 1)
			return def;
		return replaceEnvVars(m_nodes.front().as<std::string>());
	}

	template<>
	inline std::string YamlConfigTree::as() const
	{
		if (m_nodes.size() != 1)
			throw std::runtime_error{ "non optional config value not found" };
		return replaceEnvVars(m_nodes.front().as<std::string>());
	}

	using ConfigTree = YamlConfigTree;
}

namespace YAML
{
	template<>
	struct convert<cwk::BitWidth>
	{
		static Node encode(cwk::BitWidth rhs)
		{
			return Node{ rhs.bits() };
		}

		static bool decode(const Node& node, cwk::BitWidth& out)
		{
			out = cwk::BitWidth{ node.as<uint64_t>() };
			return true;
		}
	};

	template<typename T>
	struct convert
	{
		static auto encode(T value) -> std::enable_if_t<std::is_enum_v<T>, Node>
		{
			return Node{ std::string{ magic_enum::enum_name(value) } };
		}

		static auto decode(const Node& node, T& out) -> std::enable_if_t<std::is_enum_v<T>, bool>
		{
			const std::string value = node.as<std::string>();
			const std::optional<T> eval = magic_enum::enum_cast<T>(value,
				[](char a, char b) { return std::tolower(a) == std::tolower(b); });

			if (eval)
			{
				out = *eval;
				return true;
			}

			std::ostringstream err;
			err << "unknown value '" << value << "' for enum " << magic_enum::enum_type_name<T>()
				<< ". Valid values are ";

			auto names = magic_enum::enum_names<T>();
			for (size_t i = 0; i < names.size(); ++i)
			{
				if (i == names.size() - 1 && names.size() > 1)
					err << " or ";
				else if (i != 0)
					err << ", ";
				err << names[i];
			}

			throw std::runtime_error{ err.str() };
		}
	};
}
