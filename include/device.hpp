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
*	\file		device.hpp
*	\brief		Device handles stored in a collection
*
******************************************************************************/

#ifndef ZONEDISC_INCLUDE_DEVICE_HPP_
#define ZONEDISC_INCLUDE_DEVICE_HPP_

#include <functional>
#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace zonedisc {

/**
 * @brief Handle to a networked media player.
 *
 * Control protocols are implemented elsewhere: the library only needs the
 * network address the handle was built from.
 */
struct device {
	virtual ~device() = default;
	virtual const std::string& get_ip() const noexcept = 0;
};

using device_ptr = std::shared_ptr<device>;

/**
 * @brief Build a device handle from an IP address.
 */
using device_factory = std::function<device_ptr(const std::string& ip)>;

struct zone_player : public device {

	explicit zone_player(std::string ip);

	const std::string& get_ip() const noexcept override;

	/**
	 * Base URL of the UPnP control endpoint
	 * @return `http://<ip>:1400/`
	 */
	std::string get_control_url() const;

	static constexpr unsigned short control_port{1400};

private:
	std::string _ip;
};

device_ptr make_zone_player(const std::string& ip);

/**
 * Convert a list of device handles to JSON
 * @param devices	the handles
 * @return an array of objects with key `ip`
 */
nlohmann::json devices_to_json(const std::vector<device_ptr>& devices);

} // namespace zonedisc

#endif /* ZONEDISC_INCLUDE_DEVICE_HPP_ */
