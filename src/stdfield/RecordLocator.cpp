///////////////////////////////////////////////////////////////////////////////
///
///	\file    RecordLocator.cpp
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


#include "RecordLocator.h"
#include "NcRecordFile.h"
#include "StdDate.h"
#include "FilenameList.h"
#include "Defines.h"
#include "Announce.h"
#include "Exception.h"

#include <set>
#include <cstdio>
#include <cstdlib>
#include <sys/stat.h>

///////////////////////////////////////////////////////////////////////////////
// RecordQuery
///////////////////////////////////////////////////////////////////////////////

bool RecordQuery::IsCompositeWind() const {
	return (m_strVarName == WIND_VECTORS_VARIABLE);
}

///////////////////////////////////////////////////////////////////////////////
// RecordLocator
///////////////////////////////////////////////////////////////////////////////

bool RecordLocator::LocateInStore(
	const RecordStore & store,
	const RecordQuery & query,
	std::vector<RecordMetadata> & vecRecords
) {
	vecRecords.clear();

	if (query.m_strVarName == "") {
		_EXCEPTIONT("No variable name specified in query");
	}
	if (query.m_lDateVTolerance < 0) {
		_EXCEPTION1("Negative validity time tolerance (%li)",
			query.m_lDateVTolerance);
	}

	RecordSearch search(query.m_strVarName);
	search.m_strTypVar = query.m_strTypVar;
	search.m_strEtiket = query.m_strEtiket;
	search.m_iIp2 = query.m_iIp2;
	search.m_iIp3 = query.m_iIp3;
	search.m_iIg1 = query.m_iIg1;
	search.m_iIg2 = query.m_iIg2;
	search.m_iIg3 = query.m_iIg3;

	bool fHasDateV = (query.m_lDateV != RecordSearch::Any);
	if (fHasDateV && (query.m_lDateVTolerance == 0)) {
		search.m_lDateV = query.m_lDateV;
	}

	std::vector<RecordMetadata> vecCandidates;
	store.FindRecords(search, vecCandidates);

	// Keep only the validity time closest to the requested one
	if (fHasDateV && (query.m_lDateVTolerance != 0)) {
		long lTarget = StdDateToSeconds(query.m_lDateV);

		long lBestDelta = (-1);
		long lBestDateV = RecordSearch::Any;
		bool fTied = false;

		for (size_t c = 0; c < vecCandidates.size(); c++) {
			long lDelta =
				labs(StdDateToSeconds(vecCandidates[c].m_lDateV) - lTarget);

			if (lDelta > query.m_lDateVTolerance) {
				continue;
			}
			if ((lBestDelta < 0) || (lDelta < lBestDelta)) {
				lBestDelta = lDelta;
				lBestDateV = vecCandidates[c].m_lDateV;
				fTied = false;

			} else if (
			    (lDelta == lBestDelta) &&
			    (vecCandidates[c].m_lDateV != lBestDateV)
			) {
				fTied = true;
			}
		}

		if (fTied) {
			_EXCEPTIONX3(Exception::AmbiguousMatch,
				"Records of \"%s\" at two validity times are %li seconds "
				"from the requested stamp %li",
				query.m_strVarName.c_str(), lBestDelta, query.m_lDateV);
		}

		std::vector<RecordMetadata> vecInWindow;
		for (size_t c = 0; c < vecCandidates.size(); c++) {
			if (vecCandidates[c].m_lDateV == lBestDateV) {
				vecInWindow.push_back(vecCandidates[c]);
			}
		}
		vecCandidates.swap(vecInWindow);
	}

	if (vecCandidates.size() == 0) {
		return false;
	}

	// Reference record: the first candidate, or the first candidate at
	// one of the requested levels
	int iRef = (-1);
	if (query.m_vecIp1.size() == 0) {
		iRef = 0;

	} else {
		for (size_t i = 0; i < query.m_vecIp1.size(); i++) {
			for (size_t c = 0; c < vecCandidates.size(); c++) {
				if (vecCandidates[c].m_iIp1 == query.m_vecIp1[i]) {
					iRef = static_cast<int>(c);
					break;
				}
			}
			if (iRef != (-1)) {
				break;
			}
		}
		if (iRef == (-1)) {
			return false;
		}
	}

	const RecordMetadata & metaRef = vecCandidates[iRef];

	if (query.m_fMetadataOnly) {
		vecRecords.push_back(metaRef);
		return true;
	}

	std::set<int> setIp1;

	// Requested levels, in the requested order
	if (query.m_vecIp1.size() != 0) {
		for (size_t i = 0; i < query.m_vecIp1.size(); i++) {
			int iIp1 = query.m_vecIp1[i];
			if (setIp1.find(iIp1) != setIp1.end()) {
				Announce("WARNING: Level %i requested more than once for "
					"\"%s\"; ignoring repeat", iIp1,
					query.m_strVarName.c_str());
				continue;
			}

			int nFound = 0;
			for (size_t c = 0; c < vecCandidates.size(); c++) {
				if ((vecCandidates[c].m_iIp1 != iIp1) ||
				    (!vecCandidates[c].SameFieldAs(metaRef))
				) {
					continue;
				}
				if (nFound == 0) {
					vecRecords.push_back(vecCandidates[c]);
				}
				nFound++;
			}

			if (nFound == 0) {
				_EXCEPTIONX2(Exception::NoMatchingRecord,
					"No record of \"%s\" with ip1 %i",
					query.m_strVarName.c_str(), iIp1);
			}
			if (nFound > 1) {
				Announce("WARNING: %i records of \"%s\" with ip1 %i share "
					"the same metadata; keeping the first",
					nFound, query.m_strVarName.c_str(), iIp1);
			}
			setIp1.insert(iIp1);
		}

	// All levels of the reference field
	} else {
		for (size_t c = 0; c < vecCandidates.size(); c++) {
			if (!vecCandidates[c].SameFieldAs(metaRef)) {
				continue;
			}
			if (setIp1.find(vecCandidates[c].m_iIp1) != setIp1.end()) {
				Announce("WARNING: More than one record of \"%s\" with "
					"ip1 %i shares the same metadata; keeping the first",
					query.m_strVarName.c_str(), vecCandidates[c].m_iIp1);
				continue;
			}
			setIp1.insert(vecCandidates[c].m_iIp1);
			vecRecords.push_back(vecCandidates[c]);
		}
	}

	Announce(2, "Found %lu level(s) of \"%s\" in \"%s\"",
		vecRecords.size(),
		query.m_strVarName.c_str(),
		store.GetPath().c_str());

	return true;
}

///////////////////////////////////////////////////////////////////////////////

bool RecordLocator::LocateWindInStore(
	const RecordStore & store,
	const RecordQuery & query,
	std::vector<RecordMetadata> & vecRecordsU,
	std::vector<RecordMetadata> & vecRecordsV
) {
	vecRecordsV.clear();

	RecordQuery queryU = query;
	queryU.m_strVarName = WIND_COMPONENT_U;

	if (!LocateInStore(store, queryU, vecRecordsU)) {
		return false;
	}

	// V shares the level and time discriminators of U
	const RecordMetadata & metaU = vecRecordsU[0];

	RecordQuery queryV;
	queryV.m_strVarName = WIND_COMPONENT_V;
	queryV.m_lDateV = metaU.m_lDateV;
	queryV.m_iIp2 = metaU.m_iIp2;
	queryV.m_iIp3 = metaU.m_iIp3;
	queryV.m_iIg1 = metaU.m_iIg1;
	queryV.m_iIg2 = metaU.m_iIg2;
	queryV.m_iIg3 = metaU.m_iIg3;
	queryV.m_strTypVar = metaU.m_strTypVar;
	queryV.m_strEtiket = metaU.m_strEtiket;
	queryV.m_fMetadataOnly = query.m_fMetadataOnly;

	for (size_t k = 0; k < vecRecordsU.size(); k++) {
		queryV.m_vecIp1.push_back(vecRecordsU[k].m_iIp1);
	}

	if (!LocateInStore(store, queryV, vecRecordsV)) {
		_EXCEPTIONX2(Exception::NoMatchingRecord,
			"Found \"%s\" but no matching \"%s\" in \"%s\"",
			WIND_COMPONENT_U, WIND_COMPONENT_V, store.GetPath().c_str());
	}

	if (vecRecordsV.size() != vecRecordsU.size()) {
		_EXCEPTIONX2(Exception::NoMatchingRecord,
			"Found %lu levels of \"" WIND_COMPONENT_U "\" but %lu of \""
			WIND_COMPONENT_V "\"", vecRecordsU.size(), vecRecordsV.size());
	}

	for (size_t k = 0; k < vecRecordsU.size(); k++) {
		if (!vecRecordsV[k].SameGridAs(vecRecordsU[k])) {
			_EXCEPTIONX1(Exception::InconsistentGridShape,
				"Wind components at ip1 %i are not on the same grid",
				vecRecordsU[k].m_iIp1);
		}
	}

	return true;
}

///////////////////////////////////////////////////////////////////////////////

bool RecordLocator::LocateQueryInStore(
	const RecordStore & store,
	const RecordQuery & query,
	LocatedRecords & located
) {
	located.m_fComposite = query.IsCompositeWind();

	if (located.m_fComposite) {
		return LocateWindInStore(
			store, query,
			located.m_vecRecords,
			located.m_vecPartnerRecords);
	}

	located.m_vecPartnerRecords.clear();
	return LocateInStore(store, query, located.m_vecRecords);
}

///////////////////////////////////////////////////////////////////////////////

void RecordLocator::Locate(
	const RecordQuery & query,
	LocatedRecords & located
) {
	located = LocatedRecords();

	// Single file mode
	if (query.m_strFileName != "") {
		struct stat statFile;
		if (stat(query.m_strFileName.c_str(), &statFile) != 0) {
			_EXCEPTIONX1(Exception::NoMatchingRecord,
				"File \"%s\" does not exist",
				query.m_strFileName.c_str());
		}

		NcRecordFile file;
		file.Open(query.m_strFileName);

		if (!LocateQueryInStore(file, query, located)) {
			_EXCEPTIONX2(Exception::NoMatchingRecord,
				"No record of \"%s\" matches the query in \"%s\"",
				query.m_strVarName.c_str(),
				query.m_strFileName.c_str());
		}
		located.m_strFileName = query.m_strFileName;
		return;
	}

	// Directory mode
	if (query.m_strDirName == "") {
		_EXCEPTIONT("Query requires either a file name or a directory name");
	}

	FilenameList vecFiles;
	vecFiles.FromDirectory(
		query.m_strDirName, query.m_strPrefix, query.m_strSuffix);

	if (vecFiles.size() == 0) {
		_EXCEPTIONX3(Exception::NoMatchingRecord,
			"No files match \"%s/%s*%s\"",
			query.m_strDirName.c_str(),
			query.m_strPrefix.c_str(),
			query.m_strSuffix.c_str());
	}

	char szBuffer[256];
	snprintf(szBuffer, 256, "Scanning %lu file(s) in \"%s\"",
		vecFiles.size(), query.m_strDirName.c_str());
	AnnounceBlock block(1, szBuffer);

	for (size_t f = 0; f < vecFiles.size(); f++) {
		if (!NcRecordFile::IsRecordFile(vecFiles[f])) {
			Announce(1, "Skipping \"%s\" (not a record file)",
				vecFiles[f].c_str());
			continue;
		}

		NcRecordFile file;
		file.Open(vecFiles[f]);

		LocatedRecords locatedFile;
		if (!LocateQueryInStore(file, query, locatedFile)) {
			continue;
		}

		if (located.m_strFileName != "") {
			_EXCEPTIONX3(Exception::AmbiguousMatch,
				"Records of \"%s\" match the query in both \"%s\" and \"%s\"",
				query.m_strVarName.c_str(),
				located.m_strFileName.c_str(),
				vecFiles[f].c_str());
		}

		Announce(1, "Found match in \"%s\"", vecFiles[f].c_str());

		located = locatedFile;
		located.m_strFileName = vecFiles[f];
	}

	block.End(NULL);

	if (located.m_strFileName == "") {
		_EXCEPTIONX2(Exception::NoMatchingRecord,
			"No record of \"%s\" matches the query in directory \"%s\"",
			query.m_strVarName.c_str(),
			query.m_strDirName.c_str());
	}
}

///////////////////////////////////////////////////////////////////////////////

