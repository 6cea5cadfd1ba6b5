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
*	\file		collection.cpp
*	\brief		
*
******************************************************************************/

#include "collection.hpp"

#include <algorithm>
#include <utility>

#include "lib_error.hpp"
#include "library_logger.hpp"

using namespace std::literals;

namespace zonedisc {

memory_collection::memory_collection(device_factory factory)
	: _mtx{}
	, _factory{std::move(factory)}
	, _logger{library_logger::create_logger("collection"s)}
	, _devices{} {
	if (!_factory)
		throw ex::invalid_argument("empty device factory"s);
}

memory_collection& memory_collection::add_device(device_ptr device) {
	if (device == nullptr)
		throw ex::invalid_argument("null device"s);
	std::lock_guard<std::mutex> lock(_mtx);
	auto it = std::find_if(_devices.begin(), _devices.end(), [&ip = device->get_ip()](const device_ptr& d) {
		return d->get_ip() == ip;
	});
	if (it != _devices.end()) {
		_logger->debug("replacing device {}", device->get_ip());
		*it = std::move(device);
	} else {
		_devices.emplace_back(std::move(device));
	}
	return *this;
}

memory_collection& memory_collection::add_ip(const std::string& address) {
	std::lock_guard<std::mutex> lock(_mtx);
	const bool found = std::any_of(_devices.cbegin(), _devices.cend(), [&address](const device_ptr& d) {
		return d->get_ip() == address;
	});
	if (found) {
		_logger->debug("device {} already in collection", address);
		return *this;
	}
	auto device = _factory(address);
	if (device == nullptr)
		throw ex::runtime_error("device factory returned null handle for "s + address);
	_devices.emplace_back(std::move(device));
	return *this;
}

memory_collection& memory_collection::clear() {
	std::lock_guard<std::mutex> lock(_mtx);
	_devices.clear();
	return *this;
}

std::vector<device_ptr> memory_collection::get_devices() {
	std::lock_guard<std::mutex> lock(_mtx);
	return _devices;
}

std::shared_ptr<spdlog::logger> memory_collection::get_logger() const {
	std::lock_guard<std::mutex> lock(_mtx);
	return _logger;
}

void memory_collection::set_logger(std::shared_ptr<spdlog::logger> logger) {
	if (logger == nullptr)
		throw ex::invalid_argument("null logger"s);
	std::lock_guard<std::mutex> lock(_mtx);
	_logger = std::move(logger);
}

} // namespace zonedisc
