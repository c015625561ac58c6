///////////////////////////////////////////////////////////////////////////////
///
///	\file    RecordLocator.h
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


#ifndef _RECORDLOCATOR_H_
#define _RECORDLOCATOR_H_

#include "RecordStore.h"

#include <string>
#include <vector>

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Name of the U and V components of the composite wind variable.
///	</summary>
#define WIND_COMPONENT_U "UU"
#define WIND_COMPONENT_V "VV"

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Selection criteria of a record query.  Integer criteria equal to
///		RecordSearch::Any and empty strings are not applied.
///	</summary>
class RecordQuery {

public:
	///	<summary>
	///		Constructor.
	///	</summary>
	RecordQuery() :
		m_lDateV(RecordSearch::Any),
		m_lDateVTolerance(0),
		m_iIp2(RecordSearch::Any),
		m_iIp3(RecordSearch::Any),
		m_iIg1(RecordSearch::Any),
		m_iIg2(RecordSearch::Any),
		m_iIg3(RecordSearch::Any),
		m_fMetadataOnly(false)
	{ }

	///	<summary>
	///		True if the query names the composite wind variable.
	///	</summary>
	bool IsCompositeWind() const;

public:
	///	<summary>
	///		Single file source.  Supersedes the directory source.
	///	</summary>
	std::string m_strFileName;

	///	<summary>
	///		Directory source with optional filename prefix and suffix.
	///	</summary>
	std::string m_strDirName;
	std::string m_strPrefix;
	std::string m_strSuffix;

	///	<summary>
	///		Variable name.
	///	</summary>
	std::string m_strVarName;

	///	<summary>
	///		Validity date stamp and the tolerance on it (seconds).
	///	</summary>
	long m_lDateV;
	long m_lDateVTolerance;

	///	<summary>
	///		Explicit list of level codes.
	///	</summary>
	std::vector<int> m_vecIp1;

	///	<summary>
	///		Secondary discriminators.
	///	</summary>
	int m_iIp2;
	int m_iIp3;
	int m_iIg1;
	int m_iIg2;
	int m_iIg3;
	std::string m_strTypVar;
	std::string m_strEtiket;

	///	<summary>
	///		Only return the reference record.
	///	</summary>
	bool m_fMetadataOnly;
};

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Result of a record query.  For the composite wind variable the
///		records are the U component and the partner records are the V
///		component, level by level.
///	</summary>
class LocatedRecords {

public:
	///	<summary>
	///		Constructor.
	///	</summary>
	LocatedRecords() :
		m_fComposite(false)
	{ }

public:
	///	<summary>
	///		File the records were found in.
	///	</summary>
	std::string m_strFileName;

	///	<summary>
	///		Matching records.
	///	</summary>
	std::vector<RecordMetadata> m_vecRecords;

	///	<summary>
	///		V component records of a composite wind query.
	///	</summary>
	std::vector<RecordMetadata> m_vecPartnerRecords;

	///	<summary>
	///		True if the query was a composite wind query.
	///	</summary>
	bool m_fComposite;
};

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Locates the records that answer a query.
///	</summary>
class RecordLocator {

public:
	///	<summary>
	///		Locate the records of query.m_strVarName in an open store.
	///		Returns false if no record matches.  If an explicit ip1 list is
	///		given the records are returned in the order of the list and a
	///		missing level is a NoMatchingRecord error.
	///	</summary>
	static bool LocateInStore(
		const RecordStore & store,
		const RecordQuery & query,
		std::vector<RecordMetadata> & vecRecords
	);

	///	<summary>
	///		Locate the U and V components of the wind in an open store.
	///		Returns false if the U component is not present.
	///	</summary>
	static bool LocateWindInStore(
		const RecordStore & store,
		const RecordQuery & query,
		std::vector<RecordMetadata> & vecRecordsU,
		std::vector<RecordMetadata> & vecRecordsV
	);

	///	<summary>
	///		Locate the records that answer a query, in a single file or by
	///		scanning a directory.  Throws NoMatchingRecord if nothing
	///		matches and AmbiguousMatch if more than one file matches.
	///	</summary>
	static void Locate(
		const RecordQuery & query,
		LocatedRecords & located
	);

protected:
	///	<summary>
	///		Locate in one open store, handling the composite variable.
	///	</summary>
	static bool LocateQueryInStore(
		const RecordStore & store,
		const RecordQuery & query,
		LocatedRecords & located
	);
};

///////////////////////////////////////////////////////////////////////////////

#endif

