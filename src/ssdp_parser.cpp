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
*	\file		ssdp_parser.cpp
*	\brief		
*
******************************************************************************/

#include "ssdp_parser.hpp"

#include <algorithm>
#include <regex>
#include <unordered_set>

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <spdlog/fmt/fmt.h>

using namespace std::literals;

namespace zonedisc {

namespace ssdp {

namespace {

constexpr auto crlf = "\r\n"sv;

// whitespace stripped from header values, NUL and VT included
bool is_space(char c) noexcept {
	switch (c) {
	case ' ':
	case '\t':
	case '\n':
	case '\r':
	case '\0':
	case '\x0B':
		return true;
	default:
		return false;
	}
}

template <typename F>
void for_each_token(std::string_view text, std::string_view delimiter, F&& f) {
	for (;;) {
		const auto pos = text.find(delimiter);
		f(text.substr(0, pos));
		if (pos == std::string_view::npos)
			break;
		text.remove_prefix(pos + delimiter.size());
	}
}

} // unnamed namespace

announcement_headers announcement_headers::parse(std::string_view block) {
	announcement_headers res;
	for_each_token(block, crlf, [&res](std::string_view line) {
		const auto sep = line.find(':');
		// a colon at position zero means no header name
		if (sep == std::string_view::npos || sep == 0)
			return;
		auto key = boost::algorithm::to_lower_copy(std::string(line.substr(0, sep)));
		auto value = boost::algorithm::trim_copy_if(std::string(line.substr(sep + 1)), is_space);
		res._headers[std::move(key)] = std::move(value);
	});
	return res;
}

const std::string* announcement_headers::find(std::string_view key) const {
	const auto it = _headers.find(key);
	if (it == _headers.end())
		return nullptr;
	return &it->second;
}

std::vector<std::string_view> split_announcements(std::string_view raw) {
	std::vector<std::string_view> res;
	for_each_token(raw, frame_delimiter(), [&res](std::string_view block) {
		if (!block.empty())
			res.push_back(block);
	});
	return res;
}

std::string get_url_host(std::string_view url) {

	// [scheme:]//[userinfo@]host[:port][/path...]
	static const std::regex authority_regex(R"(^(?:[A-Za-z][A-Za-z0-9+.\-]*:)?//(?:[^@/?#]*@)?(\[[^\]/?#]*\]|[^:/?#]*))");
	// host:port[/path...] without scheme, numeric port only
	static const std::regex host_port_regex(R"(^([^:/?#@]+):[0-9]+(?:[/?#]|$))");

	std::match_results<std::string_view::const_iterator> what;
	if (!std::regex_search(url.cbegin(), url.cend(), what, authority_regex)
		&& !std::regex_search(url.cbegin(), url.cend(), what, host_port_regex))
		return std::string{};

	auto host = what[1].str();
	if (host.size() >= 2 && host.front() == '[' && host.back() == ']')
		host = host.substr(1, host.size() - 2);

	return host;
}

std::vector<discovered_device> extract(std::string_view raw, spdlog::logger& logger) {

	static constexpr std::string_view search_target{zone_player_search_target()};

	std::vector<discovered_device> res;
	std::unordered_set<std::string> unique;

	for (const auto block : split_announcements(raw)) {

		// cheap check before parsing: skip replies from other kind of devices
		if (block.find(search_target) == std::string_view::npos)
			continue;

		const auto headers = announcement_headers::parse(block);

		const auto st = headers.st();
		if (st == nullptr || *st != search_target)
			continue;

		const auto usn = headers.usn();
		if (usn == nullptr) {
			logger.debug("ignoring {} announcement without usn", search_target);
			continue;
		}

		if (!unique.insert(*usn).second)
			continue;

		// named arguments need a runtime format string
		logger.info(fmt::runtime("found device: {usn}"), fmt::arg("usn", *usn));

		const auto location = headers.location();
		res.push_back({ location != nullptr ? get_url_host(*location) : std::string{} });
	}

	return res;
}

} // namespace ssdp

} // namespace zonedisc
