/******************************************************************************
*
*	CAEN SpA - Software Division
*	Via Vetraia, 11 - 55049 - Viareggio ITALY
*	+39 0594 388 398 - www.caen.it
*
*******************************************************************************
*
*	Copyright (C) 2020-2023 CAEN SpA
*
*	This file is part of the ZoneDisc Library.
*
*	The ZoneDisc Library is free software; you can redistribute it and/or
*	modify it under the terms of the GNU Lesser General Public
*	License as published by the Free Software Foundation; either
*	version 3 of the License, or (at your option) any later version.
*
*	The ZoneDisc Library is distributed in the hope that it will be useful,
*	but WITHOUT ANY WARRANTY; without even the implied warranty of
*	MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the GNU
*	Lesser General Public License for more details.
*
*	You should have received a copy of the GNU Lesser General Public
*	License along with the ZoneDisc Library; if not, see
*	https://www.gnu.org/licenses/.
*
*	SPDX-License-Identifier: LGPL-3.0-or-later
*
***************************************************************************//*!
*
*	\file		discovery.hpp
*	\brief		Discovery of zone players on the local network
*
******************************************************************************/

#ifndef ZONEDISC_INCLUDE_DISCOVERY_HPP_
#define ZONEDISC_INCLUDE_DISCOVERY_HPP_

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <boost/core/noncopyable.hpp>
#include <spdlog/spdlog.h>

#include "collection.hpp"
#include "device.hpp"
#include "discovery_config.hpp"
#include "ssdp_transport.hpp"

namespace zonedisc {

/**
 * @brief Collection populated by SSDP discovery.
 *
 * The network round trip runs on the first call to get_devices() and its
 * result is cached for the lifetime of the instance. Devices added manually
 * are merged with the discovered ones. All members are thread safe.
 *
 * @note clear() empties the wrapped collection but does not rearm discovery:
 * after clear() get_devices() returns only devices added afterwards.
 */
struct discovery : public collection, private boost::noncopyable {

	/**
	 * @param coll				collection to store devices in; a memory_collection if `nullptr`
	 * @param discovery_url		discovery server URL; empty to use multicast
	 * @param factory			builds the transport of each discovery run
	 */
	explicit discovery(std::shared_ptr<collection> coll = nullptr, std::string discovery_url = std::string{}, ssdp::transport_factory factory = ssdp::make_transport);

	discovery& set_network_interface(network_interface_t network_interface);
	std::optional<network_interface_t> get_network_interface() const;

	discovery& set_multicast_address(std::string multicast_address);
	std::string get_multicast_address() const;

	discovery& set_discovery_url(std::string discovery_url);
	std::string get_discovery_url() const;

	discovery& set_timeout(std::chrono::milliseconds timeout);
	std::chrono::milliseconds get_timeout() const;

	discovery_config get_config() const;

	discovery& add_device(device_ptr device) override;
	discovery& add_ip(const std::string& address) override;
	discovery& clear() override;

	/**
	 * Get all the devices on the current network
	 * @return discovered and manually added devices
	 * @throw ex::network_error if the transport fails; discovery is retried on the next call
	 */
	std::vector<device_ptr> get_devices() override;

	std::shared_ptr<spdlog::logger> get_logger() const override;
	void set_logger(std::shared_ptr<spdlog::logger> logger) override;

	bool is_discovered() const;

private:

	void discover_devices();

	mutable std::mutex _mtx;
	std::shared_ptr<collection> _collection;
	ssdp::transport_factory _transport_factory;
	discovery_config _config;
	bool _discovered;

};

} // namespace zonedisc

#endif /* ZONEDISC_INCLUDE_DISCOVERY_HPP_ */
