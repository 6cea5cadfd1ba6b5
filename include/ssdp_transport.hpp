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
*	\file		ssdp_transport.hpp
*	\brief		Transports returning aggregated SSDP replies
*
******************************************************************************/

#ifndef ZONEDISC_INCLUDE_SSDP_TRANSPORT_HPP_
#define ZONEDISC_INCLUDE_SSDP_TRANSPORT_HPP_

#include <functional>
#include <memory>
#include <string>

#include <boost/core/noncopyable.hpp>
#include <spdlog/spdlog.h>

#include "discovery_config.hpp"

namespace zonedisc {

namespace ssdp {

static constexpr unsigned short ssdp_port{1900};

/**
 * @brief Source of the raw text of a discovery round trip.
 *
 * The returned text contains one reply per device, each terminated by an
 * empty line (CRLF CRLF).
 */
struct transport {
	virtual ~transport() = default;

	/**
	 * Run a discovery request
	 * @return the aggregated replies
	 * @throw ex::network_error if the request could not be completed
	 */
	virtual std::string request() = 0;
};

using transport_ptr = std::unique_ptr<transport>;

using transport_factory = std::function<transport_ptr(const discovery_config& config, std::shared_ptr<spdlog::logger> logger)>;

/**
 * Render the M-SEARCH datagram for zone players
 * @param multicast_address		IPv4 or IPv6 literal of the SSDP group
 * @param mx					maximum reply delay in seconds
 * @return the request text, terminated by an empty line
 */
std::string search_request(const std::string& multicast_address, unsigned int mx);

/**
 * @brief Send M-SEARCH requests over UDP and collect replies for a fixed window.
 */
struct multicast_transport : public transport, private boost::noncopyable {

	multicast_transport(discovery_config config, std::shared_ptr<spdlog::logger> logger);

	std::string request() override;

private:
	discovery_config _config;
	std::shared_ptr<spdlog::logger> _logger;
};

/**
 * @brief Fetch pre-aggregated replies from an HTTP discovery server.
 *
 * Used where multicast is blocked. Only plain `http` URLs are supported.
 */
struct proxy_transport : public transport, private boost::noncopyable {

	proxy_transport(discovery_config config, std::shared_ptr<spdlog::logger> logger);

	std::string request() override;

private:
	discovery_config _config;
	std::shared_ptr<spdlog::logger> _logger;
};

/**
 * Default transport factory
 * @return a proxy_transport if the config has a discovery URL, a multicast_transport otherwise
 */
transport_ptr make_transport(const discovery_config& config, std::shared_ptr<spdlog::logger> logger);

} // namespace ssdp

} // namespace zonedisc

#endif /* ZONEDISC_INCLUDE_SSDP_TRANSPORT_HPP_ */
