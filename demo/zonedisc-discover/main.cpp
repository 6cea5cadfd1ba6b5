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
*	\file		main.cpp
*	\brief		Command line discovery of zone players
*
******************************************************************************/

#include <chrono>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <string>

#include <boost/program_options.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "discovery.hpp"
#include "lib_error.hpp"
#include "library_logger.hpp"

namespace po = boost::program_options;

int main(int argc, char* argv[]) {

	po::options_description desc("Allowed options");
	desc.add_options()
		("help,h", "print this message")
		("interface,i", po::value<std::string>(), "outbound multicast interface: name, IPv4 address or index")
		("multicast-address,m", po::value<std::string>()->default_value(zonedisc::discovery_config::default_multicast_address()), "SSDP multicast group")
		("discovery-url,u", po::value<std::string>()->default_value(std::string{}), "HTTP discovery server used instead of multicast")
		("timeout,t", po::value<unsigned int>()->default_value(static_cast<unsigned int>(zonedisc::discovery_config::default_timeout.count())), "listen window in milliseconds")
		("json,j", "print devices as JSON")
		("verbose,v", "log discovery details at debug level, also on standard error")
		("log-file,l", po::value<std::string>(), "log file, default $HOME/.zonedisc/zonedisc.log");

	po::variables_map vm;
	try {
		po::store(po::parse_command_line(argc, argv, desc), vm);
		po::notify(vm);
	}
	catch (const po::error& e) {
		std::cerr << e.what() << '\n' << desc << '\n';
		return EXIT_FAILURE;
	}

	if (vm.count("help")) {
		std::cout << desc << '\n';
		return EXIT_SUCCESS;
	}

	try {
		// without --verbose the level comes from SPDLOG_LEVEL
		zonedisc::library_logger::options log_options;
		if (vm.count("verbose")) {
			log_options._level = spdlog::level::debug;
			log_options._console = true;
		}
		if (vm.count("log-file"))
			log_options._file = vm["log-file"].as<std::string>();
		zonedisc::library_logger::init(log_options);

		zonedisc::discovery disco(nullptr, vm["discovery-url"].as<std::string>());
		disco.set_multicast_address(vm["multicast-address"].as<std::string>());
		disco.set_timeout(std::chrono::milliseconds(vm["timeout"].as<unsigned int>()));

		if (vm.count("interface")) {
			const auto& id = vm["interface"].as<std::string>();
			// a plain number is an interface index
			if (!id.empty() && id.find_first_not_of("0123456789") == std::string::npos)
				disco.set_network_interface(static_cast<unsigned int>(std::stoul(id)));
			else
				disco.set_network_interface(id);
		}

		const auto devices = disco.get_devices();
		if (vm.count("json")) {
			std::cout << zonedisc::devices_to_json(devices).dump(4) << '\n';
		} else {
			for (const auto& d : devices)
				std::cout << d->get_ip() << '\n';
		}
	}
	catch (const zonedisc::ex::network_error& e) {
		spdlog::error("discovery failed: {}", e.what());
		std::cerr << "discovery failed: " << e.what() << '\n';
		return EXIT_FAILURE;
	}
	catch (const std::exception& e) {
		spdlog::error("unexpected error: {}", e.what());
		std::cerr << "error: " << e.what() << '\n';
		return EXIT_FAILURE;
	}

	return EXIT_SUCCESS;
}
