/*
 * Unit tests for src/collection.cpp and src/device.cpp
 */

#include "collection.hpp"
#include "device.hpp"
#include "lib_error.hpp"

#include <memory>
#include <string>
#include <utility>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/null_sink.h>

using namespace zonedisc;

namespace {

struct TaggedDevice final : device {
	std::string ip;
	int tag;

	TaggedDevice(std::string _ip, int _tag) noexcept
		:ip(std::move(_ip)), tag(_tag) {}

	const std::string &get_ip() const noexcept override {
		return ip;
	}
};

} // namespace

TEST(Collection, AddIp)
{
	memory_collection c;
	c.add_ip("10.0.0.1").add_ip("10.0.0.2").add_ip("10.0.0.1");

	const auto devices = c.get_devices();
	ASSERT_EQ(devices.size(), 2u);
	EXPECT_EQ(devices[0]->get_ip(), "10.0.0.1");
	EXPECT_EQ(devices[1]->get_ip(), "10.0.0.2");

	const auto zp = std::dynamic_pointer_cast<zone_player>(devices[0]);
	ASSERT_NE(zp, nullptr);
	EXPECT_EQ(zp->get_control_url(), "http://10.0.0.1:1400/");
}

TEST(Collection, AddDeviceReplaces)
{
	memory_collection c;
	c.add_device(std::make_shared<TaggedDevice>("10.0.0.1", 1));
	c.add_device(std::make_shared<TaggedDevice>("10.0.0.2", 2));
	c.add_device(std::make_shared<TaggedDevice>("10.0.0.1", 3));

	/* an address already stored keeps its handle */
	c.add_ip("10.0.0.2");

	const auto devices = c.get_devices();
	ASSERT_EQ(devices.size(), 2u);
	EXPECT_EQ(std::static_pointer_cast<TaggedDevice>(devices[0])->tag, 3);
	EXPECT_EQ(std::static_pointer_cast<TaggedDevice>(devices[1])->tag, 2);

	EXPECT_THROW(c.add_device(nullptr), ex::invalid_argument);
}

TEST(Collection, Factory)
{
	int n = 0;
	memory_collection c([&n](const std::string &ip) -> device_ptr {
		return std::make_shared<TaggedDevice>(ip, ++n);
	});

	c.add_ip("10.0.0.1");
	c.add_ip("10.0.0.1");
	c.add_ip("10.0.0.2");
	EXPECT_EQ(n, 2);

	memory_collection broken([](const std::string &) -> device_ptr {
		return nullptr;
	});
	EXPECT_THROW(broken.add_ip("10.0.0.1"), ex::runtime_error);
	EXPECT_TRUE(broken.get_devices().empty());

	EXPECT_THROW(memory_collection(device_factory{}), ex::invalid_argument);
}

TEST(Collection, Clear)
{
	memory_collection c;
	c.add_ip("10.0.0.1");
	c.clear();
	EXPECT_TRUE(c.get_devices().empty());
}

TEST(Collection, Logger)
{
	memory_collection c;
	EXPECT_NE(c.get_logger(), nullptr);

	auto logger = std::make_shared<spdlog::logger>("test",
						       std::make_shared<spdlog::sinks::null_sink_mt>());
	c.set_logger(logger);
	EXPECT_EQ(c.get_logger(), logger);

	EXPECT_THROW(c.set_logger(nullptr), ex::invalid_argument);
}

TEST(Device, Json)
{
	memory_collection c;
	c.add_ip("10.0.0.1").add_ip("fe80::1");

	EXPECT_EQ(devices_to_json(c.get_devices()).dump(),
		  R"([{"ip":"10.0.0.1"},{"ip":"fe80::1"}])");
	EXPECT_EQ(zone_player("fe80::1").get_control_url(),
		  "http://[fe80::1]:1400/");
}
