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
*	\file		ssdp_parser.hpp
*	\brief		Parser of aggregated SSDP replies
*
******************************************************************************/

#ifndef ZONEDISC_INCLUDE_SSDP_PARSER_HPP_
#define ZONEDISC_INCLUDE_SSDP_PARSER_HPP_

#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace zonedisc {

namespace ssdp {

static constexpr auto& zone_player_search_target() noexcept { return "urn:schemas-upnp-org:device:ZonePlayer:1"; }

static constexpr auto& frame_delimiter() noexcept { return "\r\n\r\n"; }

struct discovered_device {

	std::string _host;

	static constexpr auto& key_host() noexcept { return "host"; }

	friend bool operator==(const discovered_device& lhs, const discovered_device& rhs) noexcept {
		return lhs._host == rhs._host;
	}

	friend void from_json(const nlohmann::json& j, discovered_device& e) {
		j.at(key_host()).get_to(e._host);
	}

	friend void to_json(nlohmann::json& j, const discovered_device& e) {
		j[key_host()] = e._host;
	}

};

/**
 * @brief Headers of a single SSDP announcement.
 *
 * Header names are stored lower-case, values trimmed. When a name is
 * repeated, the last value wins. The headers required to accept an
 * announcement are `st` and `usn`; a missing `location` yields an empty host.
 */
struct announcement_headers {

	static constexpr auto& key_st() noexcept { return "st"; }
	static constexpr auto& key_usn() noexcept { return "usn"; }
	static constexpr auto& key_location() noexcept { return "location"; }

	/**
	 * Parse one announcement
	 * @param block		the announcement text, lines separated by CRLF
	 * @return the headers; lines without a colon (or starting with it) are ignored
	 */
	static announcement_headers parse(std::string_view block);

	/**
	 * @param key		lower-case header name
	 * @return pointer to the value, or `nullptr` if missing
	 */
	const std::string* find(std::string_view key) const;

	const std::string* st() const { return find(key_st()); }
	const std::string* usn() const { return find(key_usn()); }
	const std::string* location() const { return find(key_location()); }

	std::size_t size() const noexcept { return _headers.size(); }

private:
	std::map<std::string, std::string, std::less<>> _headers;
};

/**
 * Split an aggregated response into non-empty announcement blocks
 * @param raw		the aggregated response
 * @return views on `raw`, in order of appearance
 */
std::vector<std::string_view> split_announcements(std::string_view raw);

/**
 * Host component of an URL, without brackets for IPv6 literals
 * @param url		the URL
 * @return the host, or an empty string if the URL has no parseable host
 */
std::string get_url_host(std::string_view url);

/**
 * Extract the zone players announced in an aggregated response
 *
 * Announcements not matching the zone player search target are skipped,
 * as are announcements whose `usn` was already accepted.
 * @param raw		the aggregated response
 * @param logger	logger to report found devices
 * @return devices in order of first appearance
 */
std::vector<discovered_device> extract(std::string_view raw, spdlog::logger& logger);

} // namespace ssdp

} // namespace zonedisc

#endif /* ZONEDISC_INCLUDE_SSDP_PARSER_HPP_ */
