///////////////////////////////////////////////////////////////////////////////
///
///	\file    FilenameList.h
///	\author  Paul Ullrich
///	\version October 18, 2026
///
///	<remarks>
///		Copyright 2020 Paul Ullrich
///
///		This file is distributed as part of the Tempest source code package.
///		Permission is granted to use, copy, modify and distribute this
///		source code and its documentation under the terms of the GNU General
///		Public License.  This software is provided "as is" without express
///		or implied warranty.
///	</remarks>

#ifndef _FILENAMELIST_H_
#define _FILENAMELIST_H_

#include "Exception.h"

#include <string>
#include <vector>
#include <algorithm>

#include <dirent.h>
#include <sys/stat.h>

///////////////////////////////////////////////////////////////////////////////

class FilenameList : public std::vector<std::string> {

public:
	///	<summary>
	///		Populate the list with the regular files in strDirectory whose
	///		names begin with strPrefix and end with strSuffix.  Entries are
	///		full paths sorted by name.  An unreadable directory is reported
	///		as NoMatchingRecord since no record can come from it.
	///	</summary>
	void FromDirectory(
		const std::string & strDirectory,
		const std::string & strPrefix = "",
		const std::string & strSuffix = ""
	) {
		DIR * pDir = opendir(strDirectory.c_str());
		if (pDir == NULL) {
			_EXCEPTIONX1(Exception::NoMatchingRecord,
				"Unable to open directory \"%s\"",
				strDirectory.c_str());
		}

		std::vector<std::string> vecNames;

		struct dirent * pEntry;
		while ((pEntry = readdir(pDir)) != NULL) {
			std::string strName(pEntry->d_name);
			if ((strName == ".") || (strName == "..")) {
				continue;
			}
			if (strName.length() < strPrefix.length() + strSuffix.length()) {
				continue;
			}
			if (strName.compare(0, strPrefix.length(), strPrefix) != 0) {
				continue;
			}
			if (strName.compare(
				strName.length() - strSuffix.length(),
				strSuffix.length(),
				strSuffix) != 0
			) {
				continue;
			}

			std::string strPath = strDirectory + "/" + strName;

			struct stat statEntry;
			if (stat(strPath.c_str(), &statEntry) != 0) {
				continue;
			}
			if (!S_ISREG(statEntry.st_mode)) {
				continue;
			}
			vecNames.push_back(strName);
		}
		closedir(pDir);

		std::sort(vecNames.begin(), vecNames.end());

		for (size_t i = 0; i < vecNames.size(); i++) {
			push_back(strDirectory + "/" + vecNames[i]);
		}
	}
};

///////////////////////////////////////////////////////////////////////////////

#endif

