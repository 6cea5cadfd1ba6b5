/*
 * Unit tests for include/discovery_config.hpp
 */

#include "discovery_config.hpp"

#include <chrono>
#include <string>

#include <gtest/gtest.h>

using namespace zonedisc;

TEST(DiscoveryConfig, Defaults)
{
	const discovery_config config;

	EXPECT_EQ(config._multicast_address, "239.255.255.250");
	EXPECT_EQ(std::string(discovery_config::default_multicast_address()), "239.255.255.250");
	EXPECT_EQ(config._timeout, std::chrono::milliseconds(3000));
	EXPECT_EQ(config._request_count, 3u);
	EXPECT_FALSE(config._network_interface.has_value());
	EXPECT_FALSE(config.use_proxy());
}

TEST(DiscoveryConfig, UseProxy)
{
	discovery_config config;
	config._discovery_url = "http://10.0.0.9:8080/ssdp";
	EXPECT_TRUE(config.use_proxy());
}
