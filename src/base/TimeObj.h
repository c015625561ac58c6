///////////////////////////////////////////////////////////////////////////////
///
///	\file    TimeObj.h
///	\author  Paul Ullrich
///	\version October 18, 2026
///
///	<remarks>
///		Copyright 2000- Paul Ullrich
///
///		This file is distributed as part of the Tempest source code package.
///		Permission is granted to use, copy, modify and distribute this
///		source code and its documentation under the terms of the GNU General
///		Public License.  This software is provided "as is" without express
///		or implied warranty.
///	</remarks>

#ifndef _TIMEOBJ_H_
#define _TIMEOBJ_H_

#include "Exception.h"

#include <string>

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		A class for storing a UTC time on the standard (Gregorian) calendar
///		as year, month, day and seconds.  Months and days are stored
///		zero-indexed.
///	</summary>
class Time {

public:
	///	<summary>
	///		Constructor.
	///	</summary>
	Time() :
		m_iYear(0),
		m_iMonth(0),
		m_iDay(0),
		m_iSecond(0)
	{ }

	///	<summary>
	///		Constructor (month and day are zero-indexed).
	///	</summary>
	Time(
		int iYear,
		int iMonth,
		int iDay,
		int iSecond
	) :
		m_iYear(iYear),
		m_iMonth(iMonth),
		m_iDay(iDay),
		m_iSecond(iSecond)
	{
		NormalizeTime();
	}

	///	<summary>
	///		Constructor from a formatted string.
	///	</summary>
	explicit Time(
		const std::string & strFormattedTime
	) :
		m_iYear(0),
		m_iMonth(0),
		m_iDay(0),
		m_iSecond(0)
	{
		FromFormattedString(strFormattedTime);
	}

public:
	///	<summary>
	///		Equality between Times.
	///	</summary>
	bool operator==(const Time & time) const {
		return ((m_iYear == time.m_iYear) &&
		        (m_iMonth == time.m_iMonth) &&
		        (m_iDay == time.m_iDay) &&
		        (m_iSecond == time.m_iSecond));
	}

	///	<summary>
	///		Inequality between Times.
	///	</summary>
	bool operator!=(const Time & time) const {
		return !((*this) == time);
	}

	///	<summary>
	///		Comparator between Times.
	///	</summary>
	bool operator<(const Time & time) const {
		return (DeltaSeconds(time) > 0.0);
	}

	///	<summary>
	///		Comparator between Times.
	///	</summary>
	bool operator>(const Time & time) const {
		return (DeltaSeconds(time) < 0.0);
	}

public:
	///	<summary>
	///		Bring month, day and second back into their valid ranges.
	///	</summary>
	void NormalizeTime();

	///	<summary>
	///		Add the specified number of seconds to this Time.
	///	</summary>
	inline void AddSeconds(long lSeconds) {
		long lDays = lSeconds / 86400;
		m_iDay += static_cast<int>(lDays);
		m_iSecond += static_cast<int>(lSeconds - lDays * 86400);
		NormalizeTime();
	}

	///	<summary>
	///		Day number of this Time counted from a fixed epoch.
	///	</summary>
	long DayNumber() const;

	///	<summary>
	///		Number of seconds from this Time to the given Time.
	///	</summary>
	double DeltaSeconds(const Time & time) const;

public:
	///	<summary>
	///		Get the year.
	///	</summary>
	inline int GetYear() const {
		return m_iYear;
	}

	///	<summary>
	///		Get the zero-indexed month.
	///	</summary>
	inline int GetZeroIndexedMonth() const {
		return m_iMonth;
	}

	///	<summary>
	///		Get the zero-indexed day.
	///	</summary>
	inline int GetZeroIndexedDay() const {
		return m_iDay;
	}

	///	<summary>
	///		Get the second of the day.
	///	</summary>
	inline int GetSecond() const {
		return m_iSecond;
	}

public:
	///	<summary>
	///		Output as a string of the form "yyyy-mm-dd hh:mm:ss".
	///	</summary>
	std::string ToString() const;

	///	<summary>
	///		Output as a string of the form "yyyy-mm-dd-sssss".
	///	</summary>
	std::string ToLongString() const;

	///	<summary>
	///		Parse a time from a string.  Accepted forms are
	///		"yyyy-mm-dd hh:mm:ss", "yyyy-mm-ddThh:mm:ss", "yyyy-mm-dd-sssss",
	///		"yyyy-mm-dd" and "yyyymmddhh[mm[ss]]".
	///	</summary>
	void FromFormattedString(const std::string & strFormattedTime);

private:
	///	<summary>
	///		The year.
	///	</summary>
	int m_iYear;

	///	<summary>
	///		The month (zero-indexed).
	///	</summary>
	int m_iMonth;

	///	<summary>
	///		The day (zero-indexed).
	///	</summary>
	int m_iDay;

	///	<summary>
	///		The second of the day.
	///	</summary>
	int m_iSecond;
};

///////////////////////////////////////////////////////////////////////////////

#endif

