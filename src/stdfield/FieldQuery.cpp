///////////////////////////////////////////////////////////////////////////////
///
///	\file    FieldQuery.cpp
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


#include "FieldQuery.h"
#include "FieldAssembler.h"
#include "PressureInterpolator.h"
#include "NcRecordFile.h"
#include "StdDate.h"
#include "Announce.h"
#include "Exception.h"

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Assemble the records of one variable and interpolate them to the
///		requested pressure levels, if any.
///	</summary>
static std::shared_ptr<AssembledField> AssembleAndInterpolate(
	RecordStore & store,
	const std::vector<RecordMetadata> & vecRecords,
	const FieldQuery & fq,
	bool fLatLon
) {
	AssemblyOptions opts;
	opts.m_fLatLon = fLatLon;
	opts.m_fPressure = fq.m_fPresFromVar;

	std::shared_ptr<AssembledField> pField(new AssembledField);

	if (fq.m_vecPresLevels.size() == 0) {
		FieldAssembler::Assemble(store, vecRecords, opts, *pField);
		return pField;
	}

	// Coordinates and pressure are attached to the interpolated field
	AssembledField fieldNative;
	FieldAssembler::Assemble(store, vecRecords, AssemblyOptions(), fieldNative);

	InterpolationOptions optsInterp;
	optsInterp.m_strTmpDir = fq.m_strTmpDir;
	optsInterp.m_dTimeout = fq.m_dInterpTimeout;
	optsInterp.m_vecTool = fq.m_vecInterpTool;
	optsInterp.m_optsAssembly = opts;

	PressureInterpolator::Interpolate(
		store, fieldNative, fq.m_vecPresLevels, optsInterp, *pField);

	return pField;
}

///////////////////////////////////////////////////////////////////////////////

FieldQuery::FieldQuery() :
	m_lDateVTolerance(0),
	m_iIp2(RecordSearch::Any),
	m_iIp3(RecordSearch::Any),
	m_iIg1(RecordSearch::Any),
	m_iIg2(RecordSearch::Any),
	m_iIg3(RecordSearch::Any),
	m_fLatLon(false),
	m_fPresFromVar(false),
	m_dInterpTimeout(InterpolationOptions::DefaultTimeout)
{
	m_vecInterpTool.push_back(InterpolationOptions::DefaultTool);
}

///////////////////////////////////////////////////////////////////////////////

long FieldQuery::GetDateV() const {
	if (m_strDateV == "") {
		return RecordSearch::Any;
	}
	return StdDateFromString(m_strDateV);
}

///////////////////////////////////////////////////////////////////////////////

void FieldQuery::GetRecordQuery(RecordQuery & query) const {
	query = RecordQuery();

	query.m_strFileName = m_strFileName;
	query.m_strDirName = m_strDirName;
	query.m_strPrefix = m_strPrefix;
	query.m_strSuffix = m_strSuffix;
	query.m_strVarName = m_strVarName;
	query.m_lDateV = GetDateV();
	query.m_lDateVTolerance = m_lDateVTolerance;
	query.m_vecIp1 = m_vecIp1;
	query.m_iIp2 = m_iIp2;
	query.m_iIp3 = m_iIp3;
	query.m_iIg1 = m_iIg1;
	query.m_iIg2 = m_iIg2;
	query.m_iIg3 = m_iIg3;
	query.m_strTypVar = m_strTypVar;
	query.m_strEtiket = m_strEtiket;
}

///////////////////////////////////////////////////////////////////////////////

void FieldQuery::Execute(FieldQueryResult & result) const {
	if (m_strVarName == "") {
		_EXCEPTIONT("No variable name specified");
	}

	result = FieldQueryResult();

	RecordQuery query;
	GetRecordQuery(query);

	LocatedRecords located;
	RecordLocator::Locate(query, located);

	result.m_strFileName = located.m_strFileName;

	NcRecordFile file;
	file.Open(located.m_strFileName);

	if (!located.m_fComposite) {
		result.m_pField = AssembleAndInterpolate(
			file, located.m_vecRecords, *this, m_fLatLon);
		return;
	}

	// Winds need coordinates to be rotated
	result.m_pField = AssembleAndInterpolate(
		file, located.m_vecRecords, *this, true);
	result.m_pFieldV = AssembleAndInterpolate(
		file, located.m_vecPartnerRecords, *this, true);

	WindRotator::Rotate(*(result.m_pField), *(result.m_pFieldV), result.m_wind);

	Announce(1, "Rotated winds of \"%s\"", located.m_strFileName.c_str());
}

///////////////////////////////////////////////////////////////////////////////

