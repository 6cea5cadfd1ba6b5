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
*	\file		discovery.cpp
*	\brief		
*
******************************************************************************/

#include "discovery.hpp"

#include <utility>

#include "lib_error.hpp"
#include "ssdp_parser.hpp"

using namespace std::literals;

namespace zonedisc {

discovery::discovery(std::shared_ptr<collection> coll, std::string discovery_url, ssdp::transport_factory factory)
	: _mtx{}
	, _collection{coll != nullptr ? std::move(coll) : std::make_shared<memory_collection>()}
	, _transport_factory{std::move(factory)}
	, _config{}
	, _discovered{false} {
	if (!_transport_factory)
		throw ex::invalid_argument("empty transport factory"s);
	_config._discovery_url = std::move(discovery_url);
}

discovery& discovery::set_network_interface(network_interface_t network_interface) {
	std::lock_guard<std::mutex> lock(_mtx);
	_config._network_interface = std::move(network_interface);
	return *this;
}

std::optional<network_interface_t> discovery::get_network_interface() const {
	std::lock_guard<std::mutex> lock(_mtx);
	return _config._network_interface;
}

discovery& discovery::set_multicast_address(std::string multicast_address) {
	std::lock_guard<std::mutex> lock(_mtx);
	_config._multicast_address = std::move(multicast_address);
	return *this;
}

std::string discovery::get_multicast_address() const {
	std::lock_guard<std::mutex> lock(_mtx);
	return _config._multicast_address;
}

discovery& discovery::set_discovery_url(std::string discovery_url) {
	std::lock_guard<std::mutex> lock(_mtx);
	_config._discovery_url = std::move(discovery_url);
	return *this;
}

std::string discovery::get_discovery_url() const {
	std::lock_guard<std::mutex> lock(_mtx);
	return _config._discovery_url;
}

discovery& discovery::set_timeout(std::chrono::milliseconds timeout) {
	std::lock_guard<std::mutex> lock(_mtx);
	_config._timeout = timeout;
	return *this;
}

std::chrono::milliseconds discovery::get_timeout() const {
	std::lock_guard<std::mutex> lock(_mtx);
	return _config._timeout;
}

discovery_config discovery::get_config() const {
	std::lock_guard<std::mutex> lock(_mtx);
	return _config;
}

discovery& discovery::add_device(device_ptr device) {
	std::lock_guard<std::mutex> lock(_mtx);
	_collection->add_device(std::move(device));
	return *this;
}

discovery& discovery::add_ip(const std::string& address) {
	std::lock_guard<std::mutex> lock(_mtx);
	_collection->add_ip(address);
	return *this;
}

discovery& discovery::clear() {
	std::lock_guard<std::mutex> lock(_mtx);
	_collection->clear();
	return *this;
}

std::vector<device_ptr> discovery::get_devices() {
	std::lock_guard<std::mutex> lock(_mtx);
	if (!_discovered) {
		discover_devices();
		_discovered = true;
	}
	return _collection->get_devices();
}

std::shared_ptr<spdlog::logger> discovery::get_logger() const {
	std::lock_guard<std::mutex> lock(_mtx);
	return _collection->get_logger();
}

void discovery::set_logger(std::shared_ptr<spdlog::logger> logger) {
	std::lock_guard<std::mutex> lock(_mtx);
	_collection->set_logger(std::move(logger));
}

bool discovery::is_discovered() const {
	std::lock_guard<std::mutex> lock(_mtx);
	return _discovered;
}

void discovery::discover_devices() {

	const auto logger = _collection->get_logger();

	// a new transport for each run, so that it gets the current config
	const auto transport = _transport_factory(_config, logger);
	if (transport == nullptr)
		throw ex::runtime_error("transport factory returned null transport"s);

	const auto response = transport->request();

	for (const auto& d : ssdp::extract(response, *logger))
		_collection->add_ip(d._host);
}

} // namespace zonedisc
