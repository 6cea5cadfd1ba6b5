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
*	\file		lib_error.hpp
*	\brief		Exceptions thrown by the library
*
******************************************************************************/

#ifndef ZONEDISC_INCLUDE_LIB_ERROR_HPP_
#define ZONEDISC_INCLUDE_LIB_ERROR_HPP_

#include <exception>
#include <stdexcept>
#include <string>

namespace zonedisc {

namespace ex {

using namespace std::string_literals;

struct runtime_error : public std::runtime_error {
	using std::runtime_error::runtime_error;
};

struct timeout : public ex::runtime_error {
	timeout() : runtime_error("timeout"s) {}
};

struct invalid_argument : public std::invalid_argument {
	using std::invalid_argument::invalid_argument;
};

/**
 * @brief Transport could not complete a discovery request.
 *
 * Raised on socket, bind, send and receive failures of the multicast
 * transport, and on any failure of the discovery proxy.
 */
struct network_error : public ex::runtime_error {
	explicit network_error(const std::string& reason, const std::string& url = std::string{}, const std::string& detail = std::string{})
		: runtime_error(compose(reason, url, detail))
		, _reason{reason}
		, _url{url} {}
	const std::string& reason() const noexcept { return _reason; }
	const std::string& url() const noexcept { return _url; }
private:
	static std::string compose(const std::string& reason, const std::string& url, const std::string& detail) {
		auto res = reason;
		if (!url.empty())
			res += " ("s + url + ")"s;
		if (!detail.empty())
			res += ": "s + detail;
		return res;
	}
	std::string _reason;
	std::string _url;
};

} // namespace ex

/**
 * @brief UDL to generate ex::runtime_error with compile-time defined message.
 *
 * Example:
 * @code
 * throw "generic error"_ex;
 * @endcode
 */
inline auto operator""_ex(const char* str, std::size_t len) {
	return ex::runtime_error(std::string(str, len));
}

} // namespace zonedisc

#endif /* ZONEDISC_INCLUDE_LIB_ERROR_HPP_ */
