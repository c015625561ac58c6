///////////////////////////////////////////////////////////////////////////////
///
///	\file    NetCDFUtilities.h
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

#ifndef _NETCDFUTILITIES_H_
#define _NETCDFUTILITIES_H_

#include "netcdfcpp.h"

#include <string>

////////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Determine if the variable carries the given attribute.
///	</summary>
bool NcHasAttribute(
	NcVar * var,
	const std::string & strAttName
);

///	<summary>
///		Read a text attribute of a variable.  Throws if it is missing.
///	</summary>
std::string NcGetAttributeString(
	NcVar * var,
	const std::string & strAttName
);

///	<summary>
///		Read an integer attribute of a variable.  Throws if it is missing.
///	</summary>
long NcGetAttributeInt(
	NcVar * var,
	const std::string & strAttName
);

///	<summary>
///		Read a floating point attribute of a variable.  Throws if it is
///		missing.
///	</summary>
double NcGetAttributeDouble(
	NcVar * var,
	const std::string & strAttName
);

///	<summary>
///		Read a global text attribute of a file, or return strDefault if
///		the attribute is not present.
///	</summary>
std::string NcGetGlobalAttributeString(
	NcFile & ncFile,
	const std::string & strAttName,
	const std::string & strDefault = ""
);

////////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Add a new dimension to a NcFile or use an existing one if available.
///	</summary>
NcDim * AddNcDimOrUseExisting(
	NcFile & ncFile,
	const std::string & strDimName,
	long lDimSize
);

////////////////////////////////////////////////////////////////////////////////

#endif

