///////////////////////////////////////////////////////////////////////////////
///
///	\file    RecordStore.cpp
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

#include "RecordStore.h"

#include <cstdio>

///////////////////////////////////////////////////////////////////////////////

const int RecordSearch::Any;

///////////////////////////////////////////////////////////////////////////////

std::string RecordMetadata::ToString() const {
	char szBuffer[256];
	snprintf(szBuffer, 256,
		"%s typvar=%s etiket=%s ip1=%i ip2=%i ip3=%i datev=%li "
		"grtyp=%s ig=(%i,%i,%i,%i) ni=%i nj=%i",
		m_strNomVar.c_str(),
		m_strTypVar.c_str(),
		m_strEtiket.c_str(),
		m_iIp1, m_iIp2, m_iIp3,
		m_lDateV,
		m_strGrTyp.c_str(),
		m_iIg1, m_iIg2, m_iIg3, m_iIg4,
		m_nNi, m_nNj);
	return std::string(szBuffer);
}

///////////////////////////////////////////////////////////////////////////////

