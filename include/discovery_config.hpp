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
*	\file		discovery_config.hpp
*	\brief		Configuration of a discovery run
*
******************************************************************************/

#ifndef ZONEDISC_INCLUDE_DISCOVERY_CONFIG_HPP_
#define ZONEDISC_INCLUDE_DISCOVERY_CONFIG_HPP_

#include <chrono>
#include <optional>
#include <string>
#include <variant>

namespace zonedisc {

/**
 * @brief Outbound multicast interface.
 *
 * A string is either an IP literal of a local interface or an interface
 * name (e.g. `eth0`); a number is an interface index.
 */
using network_interface_t = std::variant<std::string, unsigned int>;

struct discovery_config {

	static constexpr const char* default_multicast_address() noexcept { return "239.255.255.250"; }
	static constexpr std::chrono::milliseconds default_timeout{3000};
	static constexpr unsigned int default_request_count{3};

	std::optional<network_interface_t> _network_interface;
	std::string _multicast_address{default_multicast_address()};
	std::string _discovery_url;
	std::chrono::milliseconds _timeout{default_timeout};
	unsigned int _request_count{default_request_count};

	bool use_proxy() const noexcept { return !_discovery_url.empty(); }

};

} // namespace zonedisc

#endif /* ZONEDISC_INCLUDE_DISCOVERY_CONFIG_HPP_ */
