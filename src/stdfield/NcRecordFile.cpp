///////////////////////////////////////////////////////////////////////////////
///
///	\file    NcRecordFile.cpp
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

#include "NcRecordFile.h"
#include "NetCDFUtilities.h"
#include "Announce.h"
#include "Exception.h"

#include <cstdio>
#include <cstring>

///////////////////////////////////////////////////////////////////////////////

const char * NcRecordFile::RecordFormat = "stdfield";

///////////////////////////////////////////////////////////////////////////////

NcRecordFile::NcRecordFile() :
	m_pncFile(NULL),
	m_fWritable(false)
{ }

///////////////////////////////////////////////////////////////////////////////

NcRecordFile::~NcRecordFile() {
	Close();
}

///////////////////////////////////////////////////////////////////////////////

bool NcRecordFile::IsRecordFile(const std::string & strPath) {
	NcError error(NcError::silent_nonfatal);

	NcFile ncFile(strPath.c_str(), NcFile::ReadOnly);
	if (!ncFile.is_valid()) {
		return false;
	}

	std::string strFormat =
		NcGetGlobalAttributeString(ncFile, "record_format");

	ncFile.close();

	return (strFormat == RecordFormat);
}

///////////////////////////////////////////////////////////////////////////////

void NcRecordFile::ReadMetadata(
	NcVar * var,
	long lHandle,
	RecordMetadata & meta
) {
	if (var->num_dims() != 2) {
		_EXCEPTION2("Record variable \"%s\" has %i dimensions (expected 2)",
			var->name(), var->num_dims());
	}

	meta.m_lHandle = lHandle;

	meta.m_strNomVar = NcGetAttributeString(var, "nomvar");
	meta.m_strTypVar = NcGetAttributeString(var, "typvar");
	meta.m_strEtiket = NcGetAttributeString(var, "etiket");
	meta.m_strGrTyp = NcGetAttributeString(var, "grtyp");

	meta.m_iIp1 = static_cast<int>(NcGetAttributeInt(var, "ip1"));
	meta.m_iIp2 = static_cast<int>(NcGetAttributeInt(var, "ip2"));
	meta.m_iIp3 = static_cast<int>(NcGetAttributeInt(var, "ip3"));
	meta.m_lDateV = NcGetAttributeInt(var, "datev");
	meta.m_lDateO = NcGetAttributeInt(var, "dateo");
	meta.m_iDeet = static_cast<int>(NcGetAttributeInt(var, "deet"));
	meta.m_iNpas = static_cast<int>(NcGetAttributeInt(var, "npas"));
	meta.m_iIg1 = static_cast<int>(NcGetAttributeInt(var, "ig1"));
	meta.m_iIg2 = static_cast<int>(NcGetAttributeInt(var, "ig2"));
	meta.m_iIg3 = static_cast<int>(NcGetAttributeInt(var, "ig3"));
	meta.m_iIg4 = static_cast<int>(NcGetAttributeInt(var, "ig4"));

	meta.m_dXg1 = NcGetAttributeDouble(var, "xg1");
	meta.m_dXg2 = NcGetAttributeDouble(var, "xg2");
	meta.m_dXg3 = NcGetAttributeDouble(var, "xg3");
	meta.m_dXg4 = NcGetAttributeDouble(var, "xg4");

	meta.m_nNj = static_cast<int>(var->get_dim(0)->size());
	meta.m_nNi = static_cast<int>(var->get_dim(1)->size());
}

///////////////////////////////////////////////////////////////////////////////

void NcRecordFile::Open(const std::string & strPath) {
	if (IsOpen()) {
		_EXCEPTION1("Record file already open (\"%s\")", m_strPath.c_str());
	}

	NcError error(NcError::silent_nonfatal);

	NcFile * pncFile = new NcFile(strPath.c_str(), NcFile::ReadOnly);
	if (!pncFile->is_valid()) {
		delete pncFile;
		_EXCEPTION1("Unable to open record file \"%s\"", strPath.c_str());
	}

	std::string strFormat =
		NcGetGlobalAttributeString(*pncFile, "record_format");
	if (strFormat != RecordFormat) {
		delete pncFile;
		_EXCEPTION1("File \"%s\" is not a record file", strPath.c_str());
	}

	std::vector<RecordMetadata> vecRecords;

	try {
		for (int v = 0; v < pncFile->num_vars(); v++) {
			NcVar * var = pncFile->get_var(v);

			long lHandle;
			char cTrailing;
			if (sscanf(var->name(), "r%ld%c", &lHandle, &cTrailing) != 1) {
				continue;
			}
			if (!NcHasAttribute(var, "nomvar")) {
				continue;
			}

			RecordMetadata meta;
			ReadMetadata(var, lHandle, meta);
			vecRecords.push_back(meta);
		}

	} catch(Exception & e) {
		delete pncFile;
		throw;
	}

	// Variables are written in handle order
	for (size_t r = 1; r < vecRecords.size(); r++) {
		if (vecRecords[r].m_lHandle <= vecRecords[r-1].m_lHandle) {
			delete pncFile;
			_EXCEPTION1("Records out of order in file \"%s\"",
				strPath.c_str());
		}
	}

	m_pncFile = pncFile;
	m_strPath = strPath;
	m_fWritable = false;
	m_vecRecords.swap(vecRecords);

	Announce(2, "Opened record file \"%s\" (%lu records)",
		m_strPath.c_str(), m_vecRecords.size());
}

///////////////////////////////////////////////////////////////////////////////

void NcRecordFile::Create(const std::string & strPath) {
	if (IsOpen()) {
		_EXCEPTION1("Record file already open (\"%s\")", m_strPath.c_str());
	}

	NcError error(NcError::silent_nonfatal);

	NcFile * pncFile = new NcFile(strPath.c_str(), NcFile::Replace);
	if (!pncFile->is_valid()) {
		delete pncFile;
		_EXCEPTION1("Unable to create record file \"%s\"", strPath.c_str());
	}

	if (!pncFile->add_att("record_format", RecordFormat)) {
		delete pncFile;
		_EXCEPTION1("Unable to write to record file \"%s\"", strPath.c_str());
	}

	m_pncFile = pncFile;
	m_strPath = strPath;
	m_fWritable = true;
	m_vecRecords.clear();
}

///////////////////////////////////////////////////////////////////////////////

void NcRecordFile::Close() {
	if (m_pncFile != NULL) {
		m_pncFile->close();
		delete m_pncFile;
		m_pncFile = NULL;
	}
	m_fWritable = false;
	m_vecRecords.clear();
}

///////////////////////////////////////////////////////////////////////////////

void NcRecordFile::FindRecords(
	const RecordSearch & search,
	std::vector<RecordMetadata> & vecRecords
) const {
	if (!IsOpen()) {
		_EXCEPTIONT("Record file not open");
	}

	vecRecords.clear();
	for (size_t r = 0; r < m_vecRecords.size(); r++) {
		if (search.Matches(m_vecRecords[r])) {
			vecRecords.push_back(m_vecRecords[r]);
		}
	}
}

///////////////////////////////////////////////////////////////////////////////

NcVar * NcRecordFile::GetRecordVar(
	const RecordMetadata & meta
) const {
	if (!IsOpen()) {
		_EXCEPTIONT("Record file not open");
	}

	char szVarName[32];
	snprintf(szVarName, 32, "r%06ld", meta.m_lHandle);

	NcVar * var = m_pncFile->get_var(szVarName);
	if (var == NULL) {
		_EXCEPTION2("Record %li not found in \"%s\"",
			meta.m_lHandle, m_strPath.c_str());
	}
	if ((var->get_dim(0)->size() != meta.m_nNj) ||
	    (var->get_dim(1)->size() != meta.m_nNi)
	) {
		_EXCEPTIONX3(Exception::InconsistentGridShape,
			"Record %li of \"%s\" does not have shape (%i, ...)",
			meta.m_lHandle, m_strPath.c_str(), meta.m_nNj);
	}
	return var;
}

///////////////////////////////////////////////////////////////////////////////

void NcRecordFile::ReadRecord(
	const RecordMetadata & meta,
	DataArray2D<float> & data
) {
	NcError error(NcError::silent_nonfatal);

	NcVar * var = GetRecordVar(meta);

	data.Allocate(meta.m_nNj, meta.m_nNi);
	if (!var->get(data.GetData(), meta.m_nNj, meta.m_nNi)) {
		_EXCEPTION2("Unable to read record %li of \"%s\"",
			meta.m_lHandle, m_strPath.c_str());
	}
}

///////////////////////////////////////////////////////////////////////////////

void NcRecordFile::ReadRecord(
	const RecordMetadata & meta,
	DataArray2D<double> & data
) {
	NcError error(NcError::silent_nonfatal);

	NcVar * var = GetRecordVar(meta);

	data.Allocate(meta.m_nNj, meta.m_nNi);
	if (!var->get(data.GetData(), meta.m_nNj, meta.m_nNi)) {
		_EXCEPTION2("Unable to read record %li of \"%s\"",
			meta.m_lHandle, m_strPath.c_str());
	}
}

///////////////////////////////////////////////////////////////////////////////

VerticalDescriptor NcRecordFile::GetVerticalDescriptor(
	const RecordMetadata & meta
) {
	VerticalDescriptor vdesc;

	std::vector<RecordMetadata> vecDescriptors;
	FindRecords(RecordSearch("!!"), vecDescriptors);

	for (size_t d = 0; d < vecDescriptors.size(); d++) {
		if ((vecDescriptors[d].m_iIp1 != meta.m_iIg1) ||
		    (vecDescriptors[d].m_iIp2 != meta.m_iIg2)
		) {
			continue;
		}

		DataArray2D<double> dTable;
		ReadRecord(vecDescriptors[d], dTable);

		vdesc.FromRecord(vecDescriptors[d], dTable);
		break;
	}

	return vdesc;
}

///////////////////////////////////////////////////////////////////////////////

NcVar * NcRecordFile::AddRecordVar(
	RecordMetadata & meta,
	NcType nctype,
	size_t sRows,
	size_t sColumns
) {
	if (!IsOpen()) {
		_EXCEPTIONT("Record file not open");
	}
	if (!m_fWritable) {
		_EXCEPTION1("Record file \"%s\" is open read-only", m_strPath.c_str());
	}
	if ((sRows == 0) || (sColumns == 0)) {
		_EXCEPTION1("Attempting to write empty record \"%s\"",
			meta.m_strNomVar.c_str());
	}

	meta.m_lHandle = static_cast<long>(m_vecRecords.size());
	meta.m_nNj = static_cast<int>(sRows);
	meta.m_nNi = static_cast<int>(sColumns);

	char szName[32];

	snprintf(szName, 32, "nj%lu", sRows);
	NcDim * dimNj = AddNcDimOrUseExisting(*m_pncFile, szName, sRows);

	snprintf(szName, 32, "ni%lu", sColumns);
	NcDim * dimNi = AddNcDimOrUseExisting(*m_pncFile, szName, sColumns);

	snprintf(szName, 32, "r%06ld", meta.m_lHandle);
	NcVar * var = m_pncFile->add_var(szName, nctype, dimNj, dimNi);
	if (var == NULL) {
		_EXCEPTION2("Unable to add record \"%s\" to \"%s\"",
			szName, m_strPath.c_str());
	}

	bool fSuccess = true;
	fSuccess &= var->add_att("nomvar", meta.m_strNomVar.c_str());
	fSuccess &= var->add_att("typvar", meta.m_strTypVar.c_str());
	fSuccess &= var->add_att("etiket", meta.m_strEtiket.c_str());
	fSuccess &= var->add_att("grtyp", meta.m_strGrTyp.c_str());
	fSuccess &= var->add_att("ip1", meta.m_iIp1);
	fSuccess &= var->add_att("ip2", meta.m_iIp2);
	fSuccess &= var->add_att("ip3", meta.m_iIp3);
	fSuccess &= var->add_att("datev", static_cast<int>(meta.m_lDateV));
	fSuccess &= var->add_att("dateo", static_cast<int>(meta.m_lDateO));
	fSuccess &= var->add_att("deet", meta.m_iDeet);
	fSuccess &= var->add_att("npas", meta.m_iNpas);
	fSuccess &= var->add_att("ig1", meta.m_iIg1);
	fSuccess &= var->add_att("ig2", meta.m_iIg2);
	fSuccess &= var->add_att("ig3", meta.m_iIg3);
	fSuccess &= var->add_att("ig4", meta.m_iIg4);
	fSuccess &= var->add_att("xg1", meta.m_dXg1);
	fSuccess &= var->add_att("xg2", meta.m_dXg2);
	fSuccess &= var->add_att("xg3", meta.m_dXg3);
	fSuccess &= var->add_att("xg4", meta.m_dXg4);

	if (!fSuccess) {
		_EXCEPTION2("Unable to write attributes of record \"%s\" to \"%s\"",
			szName, m_strPath.c_str());
	}

	return var;
}

///////////////////////////////////////////////////////////////////////////////

void NcRecordFile::WriteRecord(
	RecordMetadata & meta,
	const DataArray2D<float> & data
) {
	NcError error(NcError::silent_nonfatal);

	NcVar * var = AddRecordVar(
		meta, ncFloat, data.GetRows(), data.GetColumns());

	if (!var->put(data.GetData(), meta.m_nNj, meta.m_nNi)) {
		_EXCEPTION2("Unable to write record %li to \"%s\"",
			meta.m_lHandle, m_strPath.c_str());
	}

	m_vecRecords.push_back(meta);
}

///////////////////////////////////////////////////////////////////////////////

void NcRecordFile::WriteRecord(
	RecordMetadata & meta,
	const DataArray2D<double> & data
) {
	NcError error(NcError::silent_nonfatal);

	NcVar * var = AddRecordVar(
		meta, ncDouble, data.GetRows(), data.GetColumns());

	if (!var->put(data.GetData(), meta.m_nNj, meta.m_nNi)) {
		_EXCEPTION2("Unable to write record %li to \"%s\"",
			meta.m_lHandle, m_strPath.c_str());
	}

	m_vecRecords.push_back(meta);
}

///////////////////////////////////////////////////////////////////////////////

