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
*	\file		collection.hpp
*	\brief		Device collection interface and in-memory implementation
*
******************************************************************************/

#ifndef ZONEDISC_INCLUDE_COLLECTION_HPP_
#define ZONEDISC_INCLUDE_COLLECTION_HPP_

#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <boost/core/noncopyable.hpp>
#include <spdlog/spdlog.h>

#include "device.hpp"

namespace zonedisc {

/**
 * @brief Store of device handles.
 *
 * Devices are unique by IP address and enumerated in insertion order.
 */
struct collection {

	virtual ~collection() = default;

	/**
	 * Add a device handle, replacing a stored handle with the same IP address
	 * @param device	the handle to add
	 * @return this collection
	 */
	virtual collection& add_device(device_ptr device) = 0;

	/**
	 * Add a device using its IP address; no-op if the address is already stored
	 * @param address	the IP address of the device
	 * @return this collection
	 */
	virtual collection& add_ip(const std::string& address) = 0;

	virtual collection& clear() = 0;

	virtual std::vector<device_ptr> get_devices() = 0;

	virtual std::shared_ptr<spdlog::logger> get_logger() const = 0;

	virtual void set_logger(std::shared_ptr<spdlog::logger> logger) = 0;

};

struct memory_collection : public collection, private boost::noncopyable {

	explicit memory_collection(device_factory factory = make_zone_player);

	memory_collection& add_device(device_ptr device) override;
	memory_collection& add_ip(const std::string& address) override;
	memory_collection& clear() override;
	std::vector<device_ptr> get_devices() override;
	std::shared_ptr<spdlog::logger> get_logger() const override;
	void set_logger(std::shared_ptr<spdlog::logger> logger) override;

private:

	mutable std::mutex _mtx;
	device_factory _factory;
	std::shared_ptr<spdlog::logger> _logger;
	std::vector<device_ptr> _devices;

};

} // namespace zonedisc

#endif /* ZONEDISC_INCLUDE_COLLECTION_HPP_ */
