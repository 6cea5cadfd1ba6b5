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
*	\file		ZoneDisc.h
*	\brief		Library version
*
******************************************************************************/

#ifndef ZONEDISC_INCLUDE_ZONEDISC_H_
#define ZONEDISC_INCLUDE_ZONEDISC_H_

#define ZONEDISC_STR_HELPER(x)		#x
#define ZONEDISC_STR(x)				ZONEDISC_STR_HELPER(x)

#define ZONEDISC_VERSION_MAJOR		1
#define ZONEDISC_VERSION_MINOR		0
#define ZONEDISC_VERSION_PATCH		0
#define ZONEDISC_VERSION			(ZONEDISC_VERSION_MAJOR * 10000) + (ZONEDISC_VERSION_MINOR * 100) + (ZONEDISC_VERSION_PATCH)
#define ZONEDISC_VERSION_STRING		ZONEDISC_STR(ZONEDISC_VERSION_MAJOR) "." ZONEDISC_STR(ZONEDISC_VERSION_MINOR) "." ZONEDISC_STR(ZONEDISC_VERSION_PATCH)

#endif /* ZONEDISC_INCLUDE_ZONEDISC_H_ */
