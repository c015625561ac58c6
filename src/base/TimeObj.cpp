///////////////////////////////////////////////////////////////////////////////
///
///	\file    TimeObj.cpp
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

#include "TimeObj.h"
#include "STLStringHelper.h"

#include <cstdio>
#include <cstdlib>

///////////////////////////////////////////////////////////////////////////////

static int DaysInMonth(int iYear, int iMonth) {
	static const int nDaysPerMonth[]
		= {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};

	if (iMonth == 1) {
		if ((iYear % 4) == 0) {
			if (((iYear % 100) == 0) && ((iYear % 400) != 0)) {
				return 28;
			}
			return 29;
		}
	}
	return nDaysPerMonth[iMonth];
}

///////////////////////////////////////////////////////////////////////////////

void Time::NormalizeTime() {

	// Add days
	int nAddedDays = m_iSecond / 86400;
	if ((m_iSecond % 86400) < 0) {
		nAddedDays--;
	}
	m_iSecond -= nAddedDays * 86400;
	m_iDay += nAddedDays;

	// Add years
	int nAddedYears = m_iMonth / 12;
	if ((m_iMonth % 12) < 0) {
		nAddedYears--;
	}
	m_iMonth -= nAddedYears * 12;
	m_iYear += nAddedYears;

	// Subtract months
	while (m_iDay < 0) {
		m_iMonth--;
		if (m_iMonth < 0) {
			m_iMonth = 11;
			m_iYear--;
		}
		m_iDay += DaysInMonth(m_iYear, m_iMonth);
	}

	// Add months
	while (m_iDay >= DaysInMonth(m_iYear, m_iMonth)) {
		m_iDay -= DaysInMonth(m_iYear, m_iMonth);
		m_iMonth++;
		if (m_iMonth > 11) {
			m_iMonth = 0;
			m_iYear++;
		}
	}

	// Check that the result is ok
	if ((m_iMonth < 0) || (m_iMonth >= 12) ||
	    (m_iDay < 0) || (m_iDay >= DaysInMonth(m_iYear, m_iMonth)) ||
	    (m_iSecond < 0) || (m_iSecond >= 86400)
	) {
		_EXCEPTION4("Logic error: %i %i %i %i",
			m_iYear, m_iMonth, m_iDay, m_iSecond);
	}
}

///////////////////////////////////////////////////////////////////////////////

long Time::DayNumber() const {

	// Based on https://alcor.concordia.ca/~gpkatch/gdate-algorithm.html
	// but modified since m_iMonth and m_iDay are zero-indexed
	long nM = (m_iMonth + 10) % 12;
	long nY = m_iYear - nM/10;
	long nDay = 365 * nY + nY / 4 - nY / 100 + nY / 400
		+ (nM * 306 + 5) / 10 + m_iDay;

	return nDay;
}

///////////////////////////////////////////////////////////////////////////////

double Time::DeltaSeconds(const Time & time) const {

	long nDayNumber1 = DayNumber();
	long nDayNumber2 = time.DayNumber();

	return static_cast<double>(nDayNumber2 - nDayNumber1) * 86400.0
		+ static_cast<double>(time.m_iSecond - m_iSecond);
}

///////////////////////////////////////////////////////////////////////////////

std::string Time::ToString() const {
	char szBuffer[100];

	snprintf(szBuffer, 100, "%04i-%02i-%02i %02i:%02i:%02i",
		m_iYear,
		m_iMonth + 1,
		m_iDay + 1,
		m_iSecond / 3600,
		(m_iSecond % 3600) / 60,
		(m_iSecond % 60));

	return std::string(szBuffer);
}

///////////////////////////////////////////////////////////////////////////////

std::string Time::ToLongString() const {
	char szBuffer[100];

	snprintf(szBuffer, 100, "%04i-%02i-%02i-%05i",
		m_iYear, m_iMonth + 1, m_iDay + 1, m_iSecond);

	return std::string(szBuffer);
}

///////////////////////////////////////////////////////////////////////////////

void Time::FromFormattedString(
	const std::string & strFormattedTime
) {
	std::string strTime = strFormattedTime;
	STLStringHelper::RemoveWhitespaceInPlace(strTime);

	int iYear = 0;
	int iMonth = 1;
	int iDay = 1;
	int iHour = 0;
	int iMinute = 0;
	int iSecond = 0;

	char cTrailing;

	// Compact form yyyymmddhh[mm[ss]]
	if (STLStringHelper::IsInteger(strTime)) {
		if ((strTime.length() != 10) &&
		    (strTime.length() != 12) &&
		    (strTime.length() != 14)
		) {
			_EXCEPTION1("Malformed Time string (%s): expected "
				"yyyymmddhh[mm[ss]]", strFormattedTime.c_str());
		}
		iYear = atoi(strTime.substr(0,4).c_str());
		iMonth = atoi(strTime.substr(4,2).c_str());
		iDay = atoi(strTime.substr(6,2).c_str());
		iHour = atoi(strTime.substr(8,2).c_str());
		if (strTime.length() >= 12) {
			iMinute = atoi(strTime.substr(10,2).c_str());
		}
		if (strTime.length() == 14) {
			iSecond = atoi(strTime.substr(12,2).c_str());
		}

	} else {
		int nDateChars = 0;
		int nRead = sscanf(strTime.c_str(), "%d-%d-%d%n",
			&iYear, &iMonth, &iDay, &nDateChars);

		if (nRead != 3) {
			_EXCEPTION1("Malformed Time string (%s)",
				strFormattedTime.c_str());
		}

		std::string strRest = strTime.substr(nDateChars);

		if (strRest.length() == 0) {

		// yyyy-mm-dd-sssss
		} else if ((strRest[0] == '-') &&
		           (strRest.find(':') == std::string::npos)
		) {
			std::string strSeconds = strRest.substr(1);
			if (!STLStringHelper::IsInteger(strSeconds)) {
				_EXCEPTION1("Malformed Time string (%s)",
					strFormattedTime.c_str());
			}
			iSecond = atoi(strSeconds.c_str());

		// yyyy-mm-dd hh:mm[:ss]
		} else if (
			(strRest[0] == ' ') ||
			(strRest[0] == 'T') ||
			(strRest[0] == '_') ||
			(strRest[0] == '-')
		) {
			nRead = sscanf(strRest.c_str() + 1, "%d:%d:%d%c",
				&iHour, &iMinute, &iSecond, &cTrailing);
			if ((nRead < 2) || (nRead > 3)) {
				_EXCEPTION1("Malformed Time string (%s)",
					strFormattedTime.c_str());
			}

		} else {
			_EXCEPTION1("Malformed Time string (%s)",
				strFormattedTime.c_str());
		}
	}

	if ((iMonth < 1) || (iMonth > 12)) {
		_EXCEPTION1("Month out of range in Time string (%s)",
			strFormattedTime.c_str());
	}
	if ((iDay < 1) || (iDay > DaysInMonth(iYear, iMonth - 1))) {
		_EXCEPTION1("Day out of range in Time string (%s)",
			strFormattedTime.c_str());
	}
	if ((iHour < 0) || (iHour > 23) ||
	    (iMinute < 0) || (iMinute > 59) ||
	    (iSecond < 0) || (iSecond >= 86400)
	) {
		_EXCEPTION1("Time of day out of range in Time string (%s)",
			strFormattedTime.c_str());
	}

	m_iYear = iYear;
	m_iMonth = iMonth - 1;
	m_iDay = iDay - 1;
	m_iSecond = iHour * 3600 + iMinute * 60 + iSecond;

	NormalizeTime();
}

///////////////////////////////////////////////////////////////////////////////

