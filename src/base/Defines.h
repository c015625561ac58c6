///////////////////////////////////////////////////////////////////////////////
///
///	\file    Defines.h
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

#ifndef _DEFINES_H_
#define _DEFINES_H_

///////////////////////////////////////////////////////////////////////////////

typedef double Real;

///////////////////////////////////////////////////////////////////////////////
//
// Defines for floating point tolerance.
//
static const Real HighTolerance      = 1.0e-10;
static const Real ReferenceTolerance = 1.0e-12;

///////////////////////////////////////////////////////////////////////////////
//
// Relative tolerance used when checking that a value survives conversion
// to single precision.
//
static const Real SinglePrecisionTolerance = 1.0e-6;

///////////////////////////////////////////////////////////////////////////////
//
// Name of the composite variable that resolves to the UU/VV wind pair.
//
#define WIND_VECTORS_VARIABLE "wind_vectors"

///////////////////////////////////////////////////////////////////////////////

#endif

