///////////////////////////////////////////////////////////////////////////////
///
///	\file    NetCDFUtilities.cpp
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

#include "NetCDFUtilities.h"
#include "Exception.h"

////////////////////////////////////////////////////////////////////////////////

bool NcHasAttribute(
	NcVar * var,
	const std::string & strAttName
) {
	NcAtt * att = var->get_att(strAttName.c_str());
	if (att == NULL) {
		return false;
	}
	delete att;
	return true;
}

////////////////////////////////////////////////////////////////////////////////

std::string NcGetAttributeString(
	NcVar * var,
	const std::string & strAttName
) {
	NcAtt * att = var->get_att(strAttName.c_str());
	if (att == NULL) {
		_EXCEPTION2("Variable \"%s\" is missing attribute \"%s\"",
			var->name(), strAttName.c_str());
	}
	if (att->type() != ncChar) {
		delete att;
		_EXCEPTION2("Attribute \"%s::%s\" is not of type char",
			var->name(), strAttName.c_str());
	}

	char * szValue = att->as_string(0);
	std::string strValue(szValue);
	delete[] szValue;
	delete att;

	return strValue;
}

////////////////////////////////////////////////////////////////////////////////

long NcGetAttributeInt(
	NcVar * var,
	const std::string & strAttName
) {
	NcAtt * att = var->get_att(strAttName.c_str());
	if (att == NULL) {
		_EXCEPTION2("Variable \"%s\" is missing attribute \"%s\"",
			var->name(), strAttName.c_str());
	}
	if ((att->type() != ncInt) && (att->type() != ncShort)) {
		delete att;
		_EXCEPTION2("Attribute \"%s::%s\" is not of integer type",
			var->name(), strAttName.c_str());
	}

	long lValue = att->as_long(0);
	delete att;

	return lValue;
}

////////////////////////////////////////////////////////////////////////////////

double NcGetAttributeDouble(
	NcVar * var,
	const std::string & strAttName
) {
	NcAtt * att = var->get_att(strAttName.c_str());
	if (att == NULL) {
		_EXCEPTION2("Variable \"%s\" is missing attribute \"%s\"",
			var->name(), strAttName.c_str());
	}
	if (att->type() == ncChar) {
		delete att;
		_EXCEPTION2("Attribute \"%s::%s\" is not of numeric type",
			var->name(), strAttName.c_str());
	}

	double dValue = att->as_double(0);
	delete att;

	return dValue;
}

////////////////////////////////////////////////////////////////////////////////

std::string NcGetGlobalAttributeString(
	NcFile & ncFile,
	const std::string & strAttName,
	const std::string & strDefault
) {
	NcAtt * att = ncFile.get_att(strAttName.c_str());
	if (att == NULL) {
		return strDefault;
	}
	if (att->type() != ncChar) {
		delete att;
		return strDefault;
	}

	char * szValue = att->as_string(0);
	std::string strValue(szValue);
	delete[] szValue;
	delete att;

	return strValue;
}

////////////////////////////////////////////////////////////////////////////////

NcDim * AddNcDimOrUseExisting(
	NcFile & ncFile,
	const std::string & strDimName,
	long lDimSize
) {
	NcDim * dim = ncFile.get_dim(strDimName.c_str());
	if (dim == NULL) {
		dim = ncFile.add_dim(strDimName.c_str(), lDimSize);
		if (dim == NULL) {
			_EXCEPTION2("Error adding dimension \"%s\" (%li) to file",
				strDimName.c_str(), lDimSize);
		}
	} else if (dim->size() != lDimSize) {
		_EXCEPTION3("Attempting to redefine dimension \"%s\" from size %li to %li",
			strDimName.c_str(), dim->size(), lDimSize);
	}
	return dim;
}

////////////////////////////////////////////////////////////////////////////////

