///////////////////////////////////////////////////////////////////////////////
///
///	\file    Constants.h
///	\author  Paul Ullrich
///	\version October 18, 2026
///
///	<remarks>
///		Copyright 2000-2014 Paul Ullrich
///
///		This file is distributed as part of the Tempest source code package.
///		Permission is granted to use, copy, modify and distribute this
///		source code and its documentation under the terms of the GNU General
///		Public License.  This software is provided "as is" without express
///		or implied warranty.
///	</remarks>

#ifndef _CONSTANTS_H_
#define _CONSTANTS_H_

///////////////////////////////////////////////////////////////////////////////
// Earth standard atmospheric pressure, in hectoPascals
static const double EarthAtmosphericPressureHPa = 1013.25;

///////////////////////////////////////////////////////////////////////////////
// Scale height of the standard atmosphere, in meters
static const double AtmosphericScaleHeight = 7000.0;

///////////////////////////////////////////////////////////////////////////////
// Meters/second per knot
static const double MetersPerSecondPerKnot = 0.514444;

#endif // _CONSTANTS_H_

