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
*	\file		library_logger.hpp
*	\brief		Logging setup and logger factory
*
******************************************************************************/

#ifndef ZONEDISC_INCLUDE_LIBRARY_LOGGER_HPP_
#define ZONEDISC_INCLUDE_LIBRARY_LOGGER_HPP_

#include <memory>
#include <optional>
#include <string>

#include <spdlog/spdlog.h>

namespace zonedisc {

namespace library_logger {

struct options {

	/**
	 * Level of the loggers; if not set, `SPDLOG_LEVEL` is used and, if that
	 * is unset too, logging is off
	 */
	std::optional<spdlog::level::level_enum> _level;

	/**
	 * Log file, truncated at init; if not set, `$HOME/.zonedisc/zonedisc.log`
	 */
	std::optional<std::string> _file;

	/**
	 * Also log to standard error
	 */
	bool _console{false};

};

/**
 * Path of the log file when options::_file is not set
 */
std::string default_file();

/**
 * Set the level and attach the sinks shared by all the library loggers.
 * Loggers created before are affected only by the sinks.
 * @param opt		the options
 * @throw spdlog::spdlog_ex if the log file cannot be opened
 */
void init(const options& opt = options{});

/**
 * Create a new logger writing to the library sinks, at the level set by init()
 * @param name		the logger name
 * @return a new logger instance; nothing is written until init() is called
 */
std::shared_ptr<spdlog::logger> create_logger(const std::string& name);

} // namespace library_logger

} // namespace zonedisc

#endif /* ZONEDISC_INCLUDE_LIBRARY_LOGGER_HPP_ */
