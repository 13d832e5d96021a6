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
#include "frontend/pch.h"
#include "frontend/TestBlocks.h"

#include <boost/test/unit_test.hpp>

#include <cstdlib>

using namespace boost::unit_test;
using namespace cwk;

namespace {

	class Configured : public Block
	{
	public:
		Configured(std::string_view name = "configured") : Block(name),
			depth(config("depth").as<size_t>(4)),
			label(config("label").as<std::string>("unnamed"))
		{ }

		size_t depth;
		std::string label;
	};

}

BOOST_AUTO_TEST_CASE(ConfigTree_Globbing)
{
	utils::ConfigTree tree;
	tree.loadFromString(
		"top/adapter_*:\n"
		"  data_width: 16\n"
		"top/adapter_b:\n"
		"  data_width: 64\n"
	);

	BOOST_TEST(tree["top/adapter_a/data_width"].as<size_t>() == 16);
	BOOST_TEST(tree["top/adapter_b/data_width"].as<size_t>() == 64);
	BOOST_TEST(!tree["top/adapter_a/addr_width"]);
	BOOST_TEST(!tree["top/other/data_width"]);
	BOOST_TEST(tree["top/other/data_width"].as<size_t>(8) == 8);
	BOOST_CHECK_THROW(tree["top/other/data_width"].as<size_t>(), std::runtime_error);
}

BOOST_AUTO_TEST_CASE(ConfigTree_GlobbingStopsAtPathSeparator)
{
	BOOST_TEST(utils::globbingMatchPath("top/*", "top/a/b").value_or("") == "top/a");
	BOOST_TEST(utils::globbingMatchPath("top/*/b", "top/a/b").value_or("") == "top/a/b");
	BOOST_TEST(!utils::globbingMatchPath("top/x*", "top/a/b"));
}

BOOST_AUTO_TEST_CASE(ConfigTree_LaterDocumentsOverride)
{
	utils::ConfigTree tree;
	tree.loadFromString("top/fifo0/depth: 16\ntop/fifo0/label: first\n");
	tree.loadFromString("top/fifo0/depth: 32\n");

	BOOST_TEST(tree["top/fifo0/depth"].as<size_t>() == 32);
	BOOST_TEST(tree["top/fifo0/label"].as<std::string>() == "first");

	BOOST_CHECK_THROW(tree.loadFromString("- not\n- a map\n"), std::runtime_error);
}

BOOST_AUTO_TEST_CASE(ConfigTree_EnvironmentVariables)
{
	setenv("CWK_TEST_WIDTH", "24", 1);
	setenv("CWK_TEST_NAME", "relay", 1);

	utils::ConfigTree tree;
	tree.loadFromString(
		"width: $(CWK_TEST_WIDTH)\n"
		"name: $(CWK_TEST_NAME)_in\n"
		"missing: $(CWK_TEST_UNDEFINED_VARIABLE)\n"
	);

	BOOST_TEST(tree["width"].as<size_t>(0) == 24);
	BOOST_TEST(tree["name"].as<std::string>() == "relay_in");
	BOOST_CHECK_THROW(tree["missing"].as<std::string>(), std::runtime_error);
}

BOOST_AUTO_TEST_CASE(ConfigTree_Enums)
{
	utils::ConfigTree tree;
	tree.loadFromString(
		"a: asynchronous\n"
		"b: NONE\n"
		"c: sometimes\n"
	);

	BOOST_TEST((tree["a"].as<ClockConfig::ResetType>() == ClockConfig::ResetType::ASYNCHRONOUS));
	BOOST_TEST((tree["b"].as<ClockConfig::ResetType>() == ClockConfig::ResetType::NONE));
	BOOST_CHECK_THROW(tree["c"].as<ClockConfig::ResetType>(), std::runtime_error);
}

BOOST_AUTO_TEST_CASE(ClockFromString)
{
	BOOST_TEST(clockFromString("125 MHz") == ClockRational(125'000'000, 1));
	BOOST_TEST(clockFromString("8 ns") == ClockRational(125'000'000, 1));
	BOOST_TEST(clockFromString("1.5 kHz") == ClockRational(1'500, 1));
	BOOST_TEST(clockFromString("3 ns") == ClockRational(1'000'000'000, 3));
	BOOST_CHECK_THROW(clockFromString("3 parsecs"), std::runtime_error);
}

BOOST_AUTO_TEST_CASE(ClockConfig_Load)
{
	utils::ConfigTree tree;
	tree.loadFromString(
		"sys:\n"
		"  name: sys\n"
		"  period: 8 ns\n"
		"  reset_type: asynchronous\n"
		"  reset_active: high\n"
		"io: 25 MHz\n"
	);

	ClockConfig sys;
	sys.loadConfig(tree["sys"]);
	BOOST_TEST(*sys.name == "sys");
	BOOST_TEST(*sys.absoluteFrequency == ClockRational(125'000'000, 1));
	BOOST_TEST((*sys.resetType == ClockConfig::ResetType::ASYNCHRONOUS));
	BOOST_TEST((*sys.resetActive == ClockConfig::ResetActive::HIGH));
	BOOST_TEST(!sys.phase);

	ClockConfig io;
	io.loadConfig(tree["io"]);
	BOOST_TEST(*io.absoluteFrequency == ClockRational(25'000'000, 1));
	BOOST_TEST(!io.name);
}

BOOST_AUTO_TEST_CASE(Clock_FromConfig)
{
	DesignScope design;

	ClockConfig config;
	config.absoluteFrequency = clockFromString("100 MHz");
	config.resetType = ClockConfig::ResetType::NONE;
	Clock clock(config);

	BOOST_TEST(clock.name() == "clk");
	BOOST_TEST(clock.period() == ClockRational(1, 100'000'000));
	BOOST_TEST((clock.getClk()->resetType() == Clock::ResetType::NONE));
	BOOST_TEST((clock.getClk()->resetActive() == Clock::ResetActive::LOW));

	BOOST_CHECK_THROW(Clock{ ClockConfig{} }, utils::DesignError);
}

BOOST_AUTO_TEST_CASE(Block_InstancePaths)
{
	DesignScope design("soc");

	test::Adder first(8_b);
	test::Adder second(8_b);
	BOOST_TEST(first.instancePath() == "soc/adder0");
	BOOST_TEST(second.instancePath() == "soc/adder1");
	BOOST_TEST(first.parent() == nullptr);

	{
		auto scope = first.enter();
		test::Adder child(8_b);
		test::Adder sibling(8_b);
		BOOST_TEST(child.instancePath() == "soc/adder0/adder0");
		BOOST_TEST(sibling.instancePath() == "soc/adder0/adder1");
		BOOST_TEST(child.parent() == &first);

		auto innerScope = child.enter();
		test::Oscillator grandChild;
		BOOST_TEST(grandChild.instancePath() == "soc/adder0/adder0/oscillator0");
	}

	test::Adder third(8_b);
	BOOST_TEST(third.instancePath() == "soc/adder2");
	BOOST_TEST(third.parent() == nullptr);
}

BOOST_AUTO_TEST_CASE(Block_RequiresDesign)
{
	BOOST_CHECK_THROW(test::Adder(8_b), utils::DesignError);
}

BOOST_AUTO_TEST_CASE(Block_Config)
{
	DesignScope design;
	design.loadConfigString(
		"top/configured*:\n"
		"  depth: 16\n"
		"top/configured1:\n"
		"  label: second\n"
	);

	Configured first;
	Configured second;
	Configured other("other");

	BOOST_TEST(first.depth == 16);
	BOOST_TEST(first.label == "unnamed");
	BOOST_TEST(second.depth == 16);
	BOOST_TEST(second.label == "second");
	BOOST_TEST(other.depth == 4);

	BOOST_TEST(second.config().isMap());
	BOOST_TEST(!other.config());
}
