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
*	\file		ssdp_transport.cpp
*	\brief		
*
******************************************************************************/

#include "ssdp_transport.hpp"

#include <array>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <memory>
#include <optional>
#include <ostream>
#include <regex>
#include <string_view>
#include <utility>

#include <boost/asio.hpp>
#include <boost/asio/steady_timer.hpp>
#include <spdlog/fmt/fmt.h>

#include <sys/types.h>
#include <ifaddrs.h>
#include <net/if.h>
#include <netinet/in.h>
#include <arpa/inet.h>

#include "lib_error.hpp"
#include "ssdp_parser.hpp"

using namespace std::literals;

namespace zonedisc {

namespace ssdp {

namespace detail {

static constexpr auto& ssdp_request() noexcept {
	return "M-SEARCH * HTTP/1.1\r\nHOST: {}:{}\r\nMAN: \"ssdp:discover\"\r\nMX: {}\r\nST: {}\r\n\r\n";
}

static constexpr const char* http_request() noexcept {
	return "GET {} HTTP/1.0\r\nHost: {}\r\nAccept: */*\r\nConnection: close\r\n\r\n";
}

std::string host_literal(const std::string& address) {
	// IPv6 literals must be bracketed when followed by a port
	if (address.find(':') != std::string::npos)
		return fmt::format("[{}]", address);
	return address;
}

std::string interface_name(const network_interface_t& id) {
	if (const auto name = std::get_if<std::string>(&id))
		return *name;
	std::array<char, IF_NAMESIZE> buff{};
	if (::if_indextoname(std::get<unsigned int>(id), buff.data()) == nullptr)
		throw ex::network_error("unknown network interface"s, std::string{}, fmt::format("index {}: {}", std::get<unsigned int>(id), std::strerror(errno)));
	return buff.data();
}

boost::asio::ip::address_v4 interface_address_v4(const network_interface_t& id) {

	// an IPv4 literal is used as is
	if (const auto name = std::get_if<std::string>(&id)) {
		boost::system::error_code ec;
		const auto addr = boost::asio::ip::make_address_v4(*name, ec);
		if (!ec)
			return addr;
	}

	const auto name = interface_name(id);

	ifaddrs* ifa = nullptr;
	if (::getifaddrs(&ifa) != 0)
		throw ex::network_error("unknown network interface"s, std::string{}, fmt::format("getifaddrs failed: {}", std::strerror(errno)));
	// store ifa in a unique_ptr for RAII delete
	std::unique_ptr<ifaddrs, decltype(&::freeifaddrs)> deleter(ifa, &::freeifaddrs);
	for (; ifa != nullptr; ifa = ifa->ifa_next) {
		const auto ifa_member = ifa->ifa_addr;
		if (ifa_member == nullptr || ifa_member->sa_family != AF_INET)
			continue;
		if (name != ifa->ifa_name)
			continue;
		sockaddr_in sockaddr_in_member;
		std::memcpy(&sockaddr_in_member, ifa_member, sizeof(sockaddr_in_member));
		return boost::asio::ip::address_v4(ntohl(sockaddr_in_member.sin_addr.s_addr));
	}

	throw ex::network_error("unknown network interface"s, std::string{}, fmt::format("no IPv4 address on {}", name));
}

unsigned int interface_index(const network_interface_t& id) {
	if (const auto index = std::get_if<unsigned int>(&id))
		return *index;
	const auto& name = std::get<std::string>(id);
	const auto index = ::if_nametoindex(name.c_str());
	if (index == 0)
		throw ex::network_error("unknown network interface"s, std::string{}, fmt::format("{}: {}", name, std::strerror(errno)));
	return index;
}

bool ends_with_delimiter(std::string_view text) noexcept {
	const std::string_view delimiter{frame_delimiter()};
	return text.size() >= delimiter.size() && text.substr(text.size() - delimiter.size()) == delimiter;
}

struct search_session : private boost::noncopyable {

	search_session(const discovery_config& config, spdlog::logger& logger)
		: _config(config)
		, _logger(logger)
		, _io_context{}
		, _timeout_timer(_io_context)
		, _request_timer(_io_context)
		, _request_count{config._request_count}
		, _multicast_ep{}
		, _ssdp_request{}
		, _socket(_io_context)
		, _remote_ep{}
		, _buffer{}
		, _response{}
		, _error{} {
	}

	void open() {

		boost::system::error_code ec;
		const auto address = boost::asio::ip::make_address(_config._multicast_address, ec);
		if (ec)
			throw ex::network_error("invalid multicast address"s, std::string{}, fmt::format("{}: {}", _config._multicast_address, ec.message()));

		_multicast_ep = boost::asio::ip::udp::endpoint(address, ssdp_port);
		_ssdp_request = search_request(_config._multicast_address, mx);

		_socket.open(_multicast_ep.protocol(), ec);
		check(ec, "open"sv);
		_socket.set_option(boost::asio::ip::udp::socket::reuse_address(true), ec);
		check(ec, "reuse_address"sv);
		_socket.bind(boost::asio::ip::udp::endpoint(_multicast_ep.protocol(), 0), ec);
		check(ec, "bind"sv);
		_socket.set_option(boost::asio::ip::multicast::hops(4), ec); // UPnP default
		check(ec, "hops"sv);

		if (_config._network_interface) {
			const auto& id = *_config._network_interface;
			if (address.is_v4()) {
				const auto if_addr = interface_address_v4(id);
				_logger.debug("outbound interface {}", if_addr.to_string());
				_socket.set_option(boost::asio::ip::multicast::outbound_interface(if_addr), ec);
			} else {
				const auto if_index = interface_index(id);
				_logger.debug("outbound interface index {}", if_index);
				_socket.set_option(boost::asio::ip::multicast::outbound_interface(if_index), ec);
			}
			check(ec, "outbound_interface"sv);
		}
	}

	std::string run() {
		_timeout_timer.expires_after(_config._timeout);
		_timeout_timer.async_wait([this](const boost::system::error_code& error) {
			if (error)
				return;
			_logger.debug("discovery window closed");
			stop();
		});
		periodic_send();
		receive();
		_io_context.run();
		if (_error)
			throw ex::network_error(_error->first, std::string{}, _error->second);
		return std::move(_response);
	}

private:

	void check(const boost::system::error_code& ec, std::string_view what) {
		if (!ec)
			return;
		throw ex::network_error("socket error"s, std::string{}, fmt::format("{}: {}", what, ec.message()));
	}

	void fail(const std::string& reason, const boost::system::error_code& ec) {
		_logger.error("{}: {}", reason, ec.message());
		if (!_error)
			_error.emplace(reason, ec.message());
		stop();
	}

	void stop() {
		_timeout_timer.cancel();
		_request_timer.cancel();
		boost::system::error_code ec;
		_socket.close(ec);
		if (ec)
			_logger.warn("close error: {}", ec.message());
	}

	void periodic_send() {
		if (_request_count == 0)
			return;
		--_request_count;
		boost::system::error_code ec;
		_socket.send_to(boost::asio::buffer(_ssdp_request), _multicast_ep, 0, ec);
		if (ec) {
			fail("send failed"s, ec);
			return;
		}
		_logger.debug("M-SEARCH sent to {}:{}", _multicast_ep.address().to_string(), _multicast_ep.port());
		if (_request_count == 0)
			return;
		_request_timer.expires_after(request_interval);
		_request_timer.async_wait([this](const boost::system::error_code& error) {
			if (error)
				return;
			periodic_send();
		});
	}

	void receive() {
		_socket.async_receive_from(boost::asio::buffer(_buffer), _remote_ep, [this](const boost::system::error_code& error, std::size_t s) {
			// socket closed at the end of the window
			if (error == boost::asio::error::operation_aborted || !_socket.is_open())
				return;
			if (error) {
				fail("receive failed"s, error);
				return;
			}
			_logger.debug("reply from {} ({} bytes)", _remote_ep.address().to_string(), s);
			_response.append(_buffer.data(), s);
			if (!ends_with_delimiter(_response))
				_response.append(frame_delimiter());
			// wait for another message
			receive();
		});
	}

	static constexpr unsigned int mx{1};
	static constexpr std::chrono::seconds request_interval{1};

	const discovery_config& _config;
	spdlog::logger& _logger;
	boost::asio::io_context _io_context;
	boost::asio::steady_timer _timeout_timer;
	boost::asio::steady_timer _request_timer;
	unsigned int _request_count;
	boost::asio::ip::udp::endpoint _multicast_ep;
	std::string _ssdp_request;
	boost::asio::ip::udp::socket _socket;
	boost::asio::ip::udp::endpoint _remote_ep;
	std::array<char, 8192> _buffer;
	std::string _response;
	std::optional<std::pair<std::string, std::string>> _error;
};

struct http_client : private boost::noncopyable {

	explicit http_client(std::chrono::milliseconds timeout)
		: _timeout{timeout}
		, _io_context{}
		, _resolver(_io_context)
		, _socket(_io_context)
		, _request_buffer{}
		, _response_buffer{}
		, _result{} {
	}

	/**
	 * Get the body of an URL
	 * @param url	a `http` URL
	 * @return the response body
	 * @throw ex::invalid_argument on unsupported URL, ex::timeout, ex::runtime_error on any other failure
	 */
	std::string get_string(const std::string& url) {

		static const std::regex url_regex(R"((http|https)://([^/ :]+):?([^/ ]*)(/?[^ #?]*)\x3f?([^ #]*)#?([^ ]*))");
		std::smatch what;

		if (!std::regex_match(url, what, url_regex))
			throw ex::invalid_argument("invalid url"s);

		if (what[1] != "http")
			throw ex::invalid_argument("unsupported scheme "s + what[1].str());

		const auto domain = what[2].str();
		const auto port = what[3].length() != 0 ? what[3].str() : "80"s;
		const auto path = what[4].length() != 0 ? what[4].str() : "/"s;
		const auto query = what[5].str();
		const auto target = query.empty() ? path : path + "?"s + query;
		const auto host = what[3].length() != 0 ? domain + ":"s + port : domain;

		std::ostream request_stream(&_request_buffer);
		// HTTP/1.0 to avoid chunked transfer encoding
		request_stream << fmt::format(fmt::runtime(http_request()), target, host);

		start(domain, port);

		_io_context.run_for(_timeout);

		if (!_result)
			throw ex::timeout();
		if (*_result)
			throw ex::runtime_error(_result->message());

		return get_body();
	}

private:

	void start(const std::string& domain, const std::string& port) {
		_resolver.async_resolve(domain, port, [this](const boost::system::error_code& ec, const boost::asio::ip::tcp::resolver::results_type& results) {
			if (ec)
				return finish(ec);
			boost::asio::async_connect(_socket, results, [this](const boost::system::error_code& ec, const boost::asio::ip::tcp::endpoint&) {
				if (ec)
					return finish(ec);
				boost::asio::async_write(_socket, _request_buffer, [this](const boost::system::error_code& ec, std::size_t) {
					if (ec)
						return finish(ec);
					boost::asio::async_read(_socket, _response_buffer, [this](const boost::system::error_code& ec, std::size_t) {
						// server closes the connection at the end of the body
						finish(ec == boost::asio::error::eof ? boost::system::error_code{} : ec);
					});
				});
			});
		});
	}

	void finish(const boost::system::error_code& ec) {
		_result = ec;
	}

	std::string get_body() {

		const auto data = _response_buffer.data();
		const std::string response(boost::asio::buffers_begin(data), boost::asio::buffers_end(data));

		static const std::regex status_regex(R"(^HTTP/\d+(?:\.\d+)? (\d{3}))");
		std::smatch what;

		if (!std::regex_search(response, what, status_regex))
			throw "invalid response"_ex;

		const auto status = std::stoi(what[1].str());
		if (status < 200 || status > 299)
			throw ex::runtime_error(fmt::format("HTTP status {}", status));

		// skip header, that ends with an empty line
		const auto header_end = response.find("\r\n\r\n"sv);
		if (header_end == std::string::npos)
			throw "invalid response"_ex;

		return response.substr(header_end + 4);
	}

	const std::chrono::milliseconds _timeout;
	boost::asio::io_context _io_context;
	boost::asio::ip::tcp::resolver _resolver;
	boost::asio::ip::tcp::socket _socket;
	boost::asio::streambuf _request_buffer;
	boost::asio::streambuf _response_buffer;
	std::optional<boost::system::error_code> _result;
};

} // namespace detail

std::string search_request(const std::string& multicast_address, unsigned int mx) {
	return fmt::format(detail::ssdp_request(), detail::host_literal(multicast_address), ssdp_port, mx, zone_player_search_target());
}

multicast_transport::multicast_transport(discovery_config config, std::shared_ptr<spdlog::logger> logger)
	: _config{std::move(config)}
	, _logger{std::move(logger)} {
}

std::string multicast_transport::request() {
	_logger->info("discovering devices...");
	detail::search_session session(_config, *_logger);
	try {
		session.open();
	}
	catch (const ex::network_error& e) {
		_logger->error("discovery failed: {}", e.what());
		throw;
	}
	return session.run();
}

proxy_transport::proxy_transport(discovery_config config, std::shared_ptr<spdlog::logger> logger)
	: _config{std::move(config)}
	, _logger{std::move(logger)} {
}

std::string proxy_transport::request() {
	const auto& url = _config._discovery_url;
	_logger->info("discovering devices...");
	_logger->info("using discovery server at {}", url);
	try {
		detail::http_client hc(_config._timeout);
		return hc.get_string(url);
	}
	catch (const std::exception& e) {
		_logger->error("failed to contact discovery server at {}: {}", url, e.what());
		throw ex::network_error("proxy unreachable"s, url, e.what());
	}
}

transport_ptr make_transport(const discovery_config& config, std::shared_ptr<spdlog::logger> logger) {
	if (config.use_proxy())
		return std::make_unique<proxy_transport>(config, std::move(logger));
	return std::make_unique<multicast_transport>(config, std::move(logger));
}

} // namespace ssdp

} // namespace zonedisc
