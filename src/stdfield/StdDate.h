///////////////////////////////////////////////////////////////////////////////
///
///	\file    StdDate.h
///	\author  Paul Ullrich
///	\version October 18, 2026
///
///	<remarks>
///		Copyright 2000-2026 Paul Ullrich
///
///		This file is distributed as part of the Tempest source code package.
///		Permission is granted to use, copy, modify and distribute this
///		source code and its documentation under the terms of the GNU General
///		Public License.  This software is provided "as is" without express
///		or implied warranty.
///	</remarks>

#ifndef _STDDATE_H_
#define _STDDATE_H_

#include "TimeObj.h"

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Offset added to the packed representation of a date stamp.
///	</summary>
static const long StdDateStampOffset = 123200000;

///	<summary>
///		Resolution of a date stamp, in seconds.
///	</summary>
static const long StdDateResolutionSeconds = 5;

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Convert a number of seconds since 1980-01-01 00:00:00 UTC to a date
///		stamp.  Seconds are truncated to the stamp resolution.
///	</summary>
long StdDateFromSeconds(long lSeconds);

///	<summary>
///		Convert a date stamp to seconds since 1980-01-01 00:00:00 UTC.
///	</summary>
long StdDateToSeconds(long lStamp);

///	<summary>
///		Convert a calendar time to a date stamp.
///	</summary>
long StdDateFromTime(const Time & time);

///	<summary>
///		Convert a date stamp to a calendar time.
///	</summary>
Time StdDateToTime(long lStamp);

///	<summary>
///		Parse a validity time given either as a date stamp (an integer of
///		at most 9 digits) or as a calendar string accepted by
///		Time::FromFormattedString.
///	</summary>
long StdDateFromString(const std::string & strDate);

///////////////////////////////////////////////////////////////////////////////

#endif

