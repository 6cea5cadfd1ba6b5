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
*	\file		library_logger.cpp
*	\brief		
*
******************************************************************************/

#include "library_logger.hpp"

#include <cstdlib>
#include <utility>
#include <vector>

#include <boost/predef/os.h>
#include <spdlog/spdlog.h>
#include <spdlog/cfg/env.h>
#include <spdlog/sinks/dist_sink.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/fmt/fmt.h>

#include "ZoneDisc.h"

using namespace std::literals;

namespace zonedisc {

namespace library_logger {

namespace {

// every library logger writes here; empty until init
const std::shared_ptr<spdlog::sinks::dist_sink_mt>& main_sink() {
	static const auto instance = std::make_shared<spdlog::sinks::dist_sink_mt>();
	return instance;
}

} // unnamed namespace

std::string default_file() {
#if BOOST_OS_WINDOWS
	const auto base_env = std::getenv("APPDATA");
	return fmt::format("{}/ZoneDisc/zonedisc.log", base_env != nullptr ? base_env : ".");
#else
	const auto base_env = std::getenv("HOME");
	return fmt::format("{}/.zonedisc/zonedisc.log", base_env != nullptr ? base_env : ".");
#endif
}

void init(const options& opt) {

	// SPDLOG_LEVEL applies only when no level is given
	spdlog::set_level(spdlog::level::off);
	if (opt._level)
		spdlog::set_level(*opt._level);
	else
		spdlog::cfg::load_env_levels();

	// open the file first: on failure the current sinks are kept
	static constexpr bool truncate{true};
	std::vector<spdlog::sink_ptr> sinks{
		std::make_shared<spdlog::sinks::basic_file_sink_mt>(opt._file.value_or(default_file()), truncate),
	};
	if (opt._console)
		sinks.emplace_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
	main_sink()->set_sinks(std::move(sinks));

	spdlog::set_default_logger(create_logger("default"s));

	spdlog::info("zonedisc {} logging at level {}", ZONEDISC_VERSION_STRING, spdlog::level::to_string_view(spdlog::get_level()));
}

std::shared_ptr<spdlog::logger> create_logger(const std::string& name) {
	// not registered, so the same name can be created more than once
	auto logger = std::make_shared<spdlog::logger>(name, main_sink());
	logger->set_level(spdlog::get_level());
	// flush on every enabled message, since log is for debug only
	logger->flush_on(spdlog::get_level());
	return logger;
}

} // namespace library_logger

} // namespace zonedisc
