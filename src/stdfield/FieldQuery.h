///////////////////////////////////////////////////////////////////////////////
///
///	\file    FieldQuery.h
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


#ifndef _FIELDQUERY_H_
#define _FIELDQUERY_H_

#include "AssembledField.h"
#include "RecordLocator.h"
#include "WindRotator.h"

#include <string>
#include <vector>
#include <memory>

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Result of a FieldQuery.  For the composite wind variable the field
///		is the U component, the V field is the V component and the wind is
///		present.
///	</summary>
class FieldQueryResult {

public:
	///	<summary>
	///		True if the result carries rotated winds.
	///	</summary>
	bool HasWind() const {
		return m_wind.IsPresent();
	}

public:
	///	<summary>
	///		File the field was read from.
	///	</summary>
	std::string m_strFileName;

	///	<summary>
	///		The field (the U component for winds).
	///	</summary>
	std::shared_ptr<AssembledField> m_pField;

	///	<summary>
	///		The V component for winds.
	///	</summary>
	std::shared_ptr<AssembledField> m_pFieldV;

	///	<summary>
	///		Geographic wind.
	///	</summary>
	WindFields m_wind;
};

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		A request for a field: where to look, what to select and what to
///		attach.  Integer selectors equal to RecordSearch::Any and empty
///		strings are not applied.
///	</summary>
class FieldQuery {

public:
	///	<summary>
	///		Constructor.
	///	</summary>
	FieldQuery();

	///	<summary>
	///		Validity date stamp of the query, or RecordSearch::Any.
	///	</summary>
	long GetDateV() const;

	///	<summary>
	///		Selection criteria of the query.
	///	</summary>
	void GetRecordQuery(RecordQuery & query) const;

	///	<summary>
	///		Run the query.
	///	</summary>
	void Execute(FieldQueryResult & result) const;

public:
	///	<summary>
	///		Single file source (supersedes the directory source).
	///	</summary>
	std::string m_strFileName;

	///	<summary>
	///		Directory source and filename prefix and suffix.
	///	</summary>
	std::string m_strDirName;
	std::string m_strPrefix;
	std::string m_strSuffix;

	///	<summary>
	///		Variable name, or "wind_vectors" for rotated winds.
	///	</summary>
	std::string m_strVarName;

	///	<summary>
	///		Validity time as a date stamp or a calendar time, and the
	///		tolerance on it (seconds).
	///	</summary>
	std::string m_strDateV;
	long m_lDateVTolerance;

	///	<summary>
	///		Explicit level codes.
	///	</summary>
	std::vector<int> m_vecIp1;

	///	<summary>
	///		Secondary selectors.
	///	</summary>
	int m_iIp2;
	int m_iIp3;
	int m_iIg1;
	int m_iIg2;
	int m_iIg3;
	std::string m_strTypVar;
	std::string m_strEtiket;

	///	<summary>
	///		Attach latitude and longitude.
	///	</summary>
	bool m_fLatLon;

	///	<summary>
	///		Attach the pressure at every point.
	///	</summary>
	bool m_fPresFromVar;

	///	<summary>
	///		Pressure levels (hPa) to interpolate to.
	///	</summary>
	std::vector<double> m_vecPresLevels;

	///	<summary>
	///		Base directory of the interpolation workspace.
	///	</summary>
	std::string m_strTmpDir;

	///	<summary>
	///		Timeout of the interpolation program (seconds).
	///	</summary>
	double m_dInterpTimeout;

	///	<summary>
	///		Interpolation program and leading arguments.
	///	</summary>
	std::vector<std::string> m_vecInterpTool;
};

///////////////////////////////////////////////////////////////////////////////

#endif

