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
*	\file		device.cpp
*	\brief		
*
******************************************************************************/

#include "device.hpp"

#include <utility>

#include <spdlog/fmt/fmt.h>

using namespace std::literals;

namespace zonedisc {

zone_player::zone_player(std::string ip)
	: _ip{std::move(ip)} {
}

const std::string& zone_player::get_ip() const noexcept {
	return _ip;
}

std::string zone_player::get_control_url() const {
	// IPv6 literals must be bracketed inside an URL
	if (_ip.find(':') != std::string::npos)
		return fmt::format("http://[{}]:{}/", _ip, control_port);
	return fmt::format("http://{}:{}/", _ip, control_port);
}

device_ptr make_zone_player(const std::string& ip) {
	return std::make_shared<zone_player>(ip);
}

nlohmann::json devices_to_json(const std::vector<device_ptr>& devices) {
	auto j = nlohmann::json::array();
	for (const auto& d : devices)
		j.push_back({ { "ip"s, d->get_ip() } });
	return j;
}

} // namespace zonedisc
