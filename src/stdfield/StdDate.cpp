///////////////////////////////////////////////////////////////////////////////
///
///	\file    StdDate.cpp
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

#include "StdDate.h"
#include "STLStringHelper.h"
#include "Exception.h"

#include <cstdlib>

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Reference time of the date stamp.
///	</summary>
static const Time StdDateEpoch(1980, 0, 0, 0);

///////////////////////////////////////////////////////////////////////////////

long StdDateFromSeconds(long lSeconds) {
	if (lSeconds < 0) {
		_EXCEPTION1("Time precedes 1980-01-01 (%li seconds); cannot be "
			"represented as a date stamp", lSeconds);
	}

	// Stamps count 5 second intervals in groups of 8 per decimal digit
	long lTicks = lSeconds / StdDateResolutionSeconds;

	return StdDateStampOffset + (lTicks / 8) * 10 + (lTicks % 8);
}

///////////////////////////////////////////////////////////////////////////////

long StdDateToSeconds(long lStamp) {
	long lPacked = lStamp - StdDateStampOffset;
	if (lPacked < 0) {
		_EXCEPTION1("Invalid date stamp %li", lStamp);
	}
	if ((lPacked % 10) >= 8) {
		_EXCEPTION1("Invalid date stamp %li", lStamp);
	}

	long lTicks = (lPacked / 10) * 8 + (lPacked % 10);

	return lTicks * StdDateResolutionSeconds;
}

///////////////////////////////////////////////////////////////////////////////

long StdDateFromTime(const Time & time) {
	double dSeconds = StdDateEpoch.DeltaSeconds(time);
	return StdDateFromSeconds(static_cast<long>(dSeconds));
}

///////////////////////////////////////////////////////////////////////////////

Time StdDateToTime(long lStamp) {
	Time time(StdDateEpoch);
	time.AddSeconds(StdDateToSeconds(lStamp));
	return time;
}

///////////////////////////////////////////////////////////////////////////////

long StdDateFromString(const std::string & strDate) {
	std::string strTrimmed = strDate;
	STLStringHelper::RemoveWhitespaceInPlace(strTrimmed);

	if (STLStringHelper::IsInteger(strTrimmed) && (strTrimmed.length() <= 9)) {
		long lStamp = atol(strTrimmed.c_str());

		// Validates the stamp
		StdDateToSeconds(lStamp);

		return lStamp;
	}

	Time time(strTrimmed);
	return StdDateFromTime(time);
}

///////////////////////////////////////////////////////////////////////////////

