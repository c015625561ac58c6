///////////////////////////////////////////////////////////////////////////////
///
///	\file    PressureInterpolator.cpp
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


#include "PressureInterpolator.h"
#include "NcRecordFile.h"
#include "RecordLocator.h"
#include "GridResolver.h"
#include "LevelCodec.h"
#include "ProcessRunner.h"
#include "Announce.h"
#include "Exception.h"

#include <map>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <cerrno>

#include <dirent.h>
#include <unistd.h>
#include <sys/stat.h>

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Remove a file or a directory and everything in it.
///	</summary>
static bool RemoveTree(const std::string & strPath) {
	struct stat statPath;
	if (lstat(strPath.c_str(), &statPath) != 0) {
		return (errno == ENOENT);
	}

	if (!S_ISDIR(statPath.st_mode)) {
		return (unlink(strPath.c_str()) == 0);
	}

	bool fSuccess = true;

	DIR * pDir = opendir(strPath.c_str());
	if (pDir == NULL) {
		return false;
	}

	struct dirent * pEntry;
	while ((pEntry = readdir(pDir)) != NULL) {
		std::string strName(pEntry->d_name);
		if ((strName == ".") || (strName == "..")) {
			continue;
		}
		fSuccess &= RemoveTree(strPath + "/" + strName);
	}
	closedir(pDir);

	fSuccess &= (rmdir(strPath.c_str()) == 0);

	return fSuccess;
}

///////////////////////////////////////////////////////////////////////////////
// InterpolationWorkspace
///////////////////////////////////////////////////////////////////////////////

InterpolationWorkspace::InterpolationWorkspace(
	const std::string & strBaseDir
) {
	std::string strBase = strBaseDir;
	if (strBase == "") {
		const char * szTmpDir = getenv("TMPDIR");
		if ((szTmpDir != NULL) && (szTmpDir[0] != '\0')) {
			strBase = szTmpDir;
		} else {
			strBase = "/tmp";
		}
	}

	struct stat statBase;
	if ((stat(strBase.c_str(), &statBase) != 0) ||
	    (!S_ISDIR(statBase.st_mode))
	) {
		_EXCEPTIONX1(Exception::WorkspaceIOError,
			"Workspace base \"%s\" is not a directory", strBase.c_str());
	}

	std::string strTemplate = strBase + "/stdfield_XXXXXX";
	std::vector<char> vecTemplate(strTemplate.begin(), strTemplate.end());
	vecTemplate.push_back('\0');

	if (mkdtemp(&(vecTemplate[0])) == NULL) {
		_EXCEPTIONX2(Exception::WorkspaceIOError,
			"Unable to create workspace under \"%s\" (%s)",
			strBase.c_str(), strerror(errno));
	}

	m_strPath = &(vecTemplate[0]);

	Announce(2, "Created workspace \"%s\"", m_strPath.c_str());
}

///////////////////////////////////////////////////////////////////////////////

InterpolationWorkspace::~InterpolationWorkspace() {
	if (!Release()) {
		Announce("WARNING: Unable to remove workspace \"%s\"",
			m_strPath.c_str());
	}
}

///////////////////////////////////////////////////////////////////////////////

bool InterpolationWorkspace::Release() {
	if (m_strPath == "") {
		return true;
	}
	if (!RemoveTree(m_strPath)) {
		return false;
	}

	Announce(2, "Removed workspace \"%s\"", m_strPath.c_str());
	m_strPath = "";
	return true;
}

///////////////////////////////////////////////////////////////////////////////
// InterpolationOptions
///////////////////////////////////////////////////////////////////////////////

const char * InterpolationOptions::DefaultTool = "d.pxs2pxt";

const double InterpolationOptions::DefaultTimeout = 600.0;

///////////////////////////////////////////////////////////////////////////////
// PressureInterpolator
///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		A pressure level as it is passed to the interpolation program.
///	</summary>
static std::string FormatPressureLevel(double dPressure) {
	char szLevel[32];
	snprintf(szLevel, 32, "%07.2f", dPressure);
	return std::string(szLevel);
}

///////////////////////////////////////////////////////////////////////////////

std::string PressureInterpolator::FormatPressureLevels(
	const std::vector<double> & vecPressureLevels
) {
	std::string strLevels;
	for (size_t k = 0; k < vecPressureLevels.size(); k++) {
		if (k != 0) {
			strLevels += ",";
		}
		strLevels += FormatPressureLevel(vecPressureLevels[k]);
	}
	return strLevels;
}

///////////////////////////////////////////////////////////////////////////////

std::vector<int> PressureInterpolator::EncodePressureLevels(
	const std::vector<double> & vecPressureLevels
) {
	std::vector<int> vecIp1;
	std::map<int, size_t> mapIp1;

	for (size_t k = 0; k < vecPressureLevels.size(); k++) {
		if (!(vecPressureLevels[k] > 0.0)) {
			_EXCEPTION1("Invalid pressure level %f", vecPressureLevels[k]);
		}

		// Encode the level the program is given
		std::string strLevel = FormatPressureLevel(vecPressureLevels[k]);

		int iIp1 = LevelCodec::Encode(
			atof(strLevel.c_str()), LevelKind_Pressure);

		std::map<int, size_t>::const_iterator iter = mapIp1.find(iIp1);
		if (iter != mapIp1.end()) {
			if (vecPressureLevels[iter->second] == vecPressureLevels[k]) {
				_EXCEPTION1("Pressure level %f requested more than once",
					vecPressureLevels[k]);
			}
			_EXCEPTION3("Pressure levels %f and %f share level code %i",
				vecPressureLevels[iter->second], vecPressureLevels[k], iIp1);
		}
		mapIp1.insert(std::pair<int, size_t>(iIp1, k));
		vecIp1.push_back(iIp1);
	}
	return vecIp1;
}

///////////////////////////////////////////////////////////////////////////////

void PressureInterpolator::SetRequestedLevels(
	const std::vector<double> & vecPressureLevels,
	AssembledField & field
) {
	if (field.m_vecLevels.size() != vecPressureLevels.size()) {
		_EXCEPTION2("Field has %lu levels but %lu were requested",
			field.m_vecLevels.size(), vecPressureLevels.size());
	}

	for (size_t k = 0; k < vecPressureLevels.size(); k++) {
		field.m_vecLevels[k].m_dValue = vecPressureLevels[k];
	}

	if (field.HasPressure()) {
		DataArray3D<float> & dPressure = *(field.m_pPressure);
		for (size_t k = 0; k < dPressure.GetSize(0); k++) {
		for (size_t i = 0; i < dPressure.GetSize(1); i++) {
		for (size_t j = 0; j < dPressure.GetSize(2); j++) {
			dPressure(k,i,j) = static_cast<float>(vecPressureLevels[k]);
		}
		}
		}
	}

	if (field.m_pYin) {
		SetRequestedLevels(vecPressureLevels, *(field.m_pYin));
	}
	if (field.m_pYang) {
		SetRequestedLevels(vecPressureLevels, *(field.m_pYang));
	}
}

///////////////////////////////////////////////////////////////////////////////

void PressureInterpolator::WriteDescriptorRecords(
	RecordStore & storeSource,
	const RecordMetadata & meta,
	RecordStore & storeTo
) {
	GridResolver::CopyGridRecords(storeSource, meta, storeTo);

	VerticalDescriptor vdesc = storeSource.GetVerticalDescriptor(meta);
	if (vdesc.IsPresent()) {
		RecordMetadata metaVDesc;
		DataArray2D<double> dTable;
		vdesc.ToRecord(meta.m_iIg1, meta.m_iIg2, metaVDesc, dTable);
		storeTo.WriteRecord(metaVDesc, dTable);
	}
}

///////////////////////////////////////////////////////////////////////////////

void PressureInterpolator::WriteSourceFile(
	RecordStore & storeSource,
	const AssembledField & field,
	const std::string & strPath
) {
	// Yin-Yang fields are written as the combined record
	DataArray3D<float> dCombined;
	const DataArray3D<float> * pValues = field.m_pValues.get();

	if (field.IsYinYang()) {
		CombineYinYang(
			*(field.m_pYin->m_pValues),
			*(field.m_pYang->m_pValues),
			dCombined);
		pValues = &dCombined;
	}

	if (pValues == NULL) {
		_EXCEPTIONT("Field to interpolate has no values");
	}

	size_t sRows = pValues->GetSize(1);
	size_t sColumns = pValues->GetSize(2);

	if ((sRows != static_cast<size_t>(field.m_meta.m_nNj)) ||
	    (sColumns != static_cast<size_t>(field.m_meta.m_nNi)) ||
	    (pValues->GetSize(0) != field.m_vecLevels.size())
	) {
		_EXCEPTIONX2(Exception::InconsistentGridShape,
			"Values of \"%s\" do not match its metadata (%lu rows)",
			field.m_meta.m_strNomVar.c_str(), sRows);
	}

	NcRecordFile file;
	file.Create(strPath);

	for (size_t k = 0; k < field.m_vecLevels.size(); k++) {
		DataArray2D<float> data(sRows, sColumns);
		memcpy(data.GetData(), (*pValues)[k], sRows * sColumns * sizeof(float));

		RecordMetadata meta = field.m_meta;
		meta.m_iIp1 = field.m_vecLevels[k].m_iIp1;
		file.WriteRecord(meta, data);
	}

	WriteDescriptorRecords(storeSource, field.m_meta, file);

	file.Close();
}

///////////////////////////////////////////////////////////////////////////////

RecordMetadata PressureInterpolator::WriteSurfacePressureFile(
	RecordStore & storeSource,
	const AssembledField & field,
	const std::string & strPath
) {
	RecordMetadata metaP0 =
		FieldAssembler::FindSurfacePressure(storeSource, field.m_meta);

	DataArray2D<float> dP0;
	storeSource.ReadRecord(metaP0, dP0);

	NcRecordFile file;
	file.Create(strPath);

	RecordMetadata metaWrite = metaP0;
	file.WriteRecord(metaWrite, dP0);

	WriteDescriptorRecords(storeSource, field.m_meta, file);

	file.Close();

	return metaP0;
}

///////////////////////////////////////////////////////////////////////////////

void PressureInterpolator::Interpolate(
	RecordStore & storeSource,
	const AssembledField & field,
	const std::vector<double> & vecPressureLevels,
	const InterpolationOptions & opts,
	AssembledField & fieldOut
) {
	if (vecPressureLevels.size() == 0) {
		_EXCEPTIONT("No pressure levels to interpolate to");
	}
	if (opts.m_vecTool.size() == 0) {
		_EXCEPTIONT("No interpolation program specified");
	}

	std::vector<int> vecIp1 = EncodePressureLevels(vecPressureLevels);

	AnnounceBlock block(1, "Interpolating to pressure levels");

	// Released on every exit path
	InterpolationWorkspace workspace(opts.m_strTmpDir);

	std::string strSourceFile = workspace.GetFilePath("source.nc");
	std::string strPxsFile = workspace.GetFilePath("pxs.nc");
	std::string strOutputFile = workspace.GetFilePath("interpolated.nc");

	WriteSourceFile(storeSource, field, strSourceFile);

	RecordMetadata metaP0 =
		WriteSurfacePressureFile(storeSource, field, strPxsFile);

	char szDateV[32];
	snprintf(szDateV, 32, "%07ld", metaP0.m_lDateV);

	std::vector<std::string> vecArgs = opts.m_vecTool;
	vecArgs.push_back("-s");
	vecArgs.push_back(strSourceFile);
	vecArgs.push_back("-datev");
	vecArgs.push_back(szDateV);
	vecArgs.push_back("-d");
	vecArgs.push_back(strOutputFile);
	vecArgs.push_back("-pxs");
	vecArgs.push_back(strPxsFile);
	vecArgs.push_back("-plevs");
	vecArgs.push_back(FormatPressureLevels(vecPressureLevels));
	vecArgs.push_back("-var");
	vecArgs.push_back(std::string("CUB_") + field.m_meta.m_strNomVar);

	ProcessResult result;
	ProcessRunner::Run(vecArgs, opts.m_dTimeout, result);

	if (result.m_fTimedOut) {
		_EXCEPTIONX3(Exception::InterpolationTimeout,
			"\"%s\" did not finish within %1.1f seconds\n%s",
			opts.m_vecTool[0].c_str(), opts.m_dTimeout,
			result.m_strOutput.c_str());
	}
	if (result.m_fExecFailed) {
		_EXCEPTIONX1(Exception::InterpolationToolFailed,
			"%s", result.m_strOutput.c_str());
	}
	if (result.m_iSignal != 0) {
		_EXCEPTIONX3(Exception::InterpolationToolFailed,
			"\"%s\" was terminated by signal %i\n%s",
			opts.m_vecTool[0].c_str(), result.m_iSignal,
			result.m_strOutput.c_str());
	}
	if (result.m_iExitStatus != 0) {
		_EXCEPTIONX3(Exception::InterpolationToolFailed,
			"\"%s\" exited with status %i\n%s",
			opts.m_vecTool[0].c_str(), result.m_iExitStatus,
			result.m_strOutput.c_str());
	}

	if (!NcRecordFile::IsRecordFile(strOutputFile)) {
		_EXCEPTIONX2(Exception::InterpolationToolFailed,
			"\"%s\" did not produce a record file\n%s",
			opts.m_vecTool[0].c_str(), result.m_strOutput.c_str());
	}

	// Read back the requested levels in the requested order
	NcRecordFile fileOut;
	fileOut.Open(strOutputFile);

	RecordQuery query;
	query.m_strVarName = field.m_meta.m_strNomVar;
	query.m_lDateV = metaP0.m_lDateV;
	query.m_vecIp1 = vecIp1;

	std::vector<RecordMetadata> vecRecords;
	try {
		if (!RecordLocator::LocateInStore(fileOut, query, vecRecords)) {
			_EXCEPTIONX1(Exception::NoMatchingRecord,
				"No \"%s\" in interpolated output",
				field.m_meta.m_strNomVar.c_str());
		}

	} catch(Exception & e) {
		_EXCEPTIONX2(Exception::InterpolationToolFailed,
			"Output of \"%s\" is incomplete: %s",
			opts.m_vecTool[0].c_str(), e.GetText().c_str());
	}

	AssemblyOptions optsAssembly = opts.m_optsAssembly;
	optsAssembly.m_fPreserveOrder = true;

	FieldAssembler::Assemble(fileOut, vecRecords, optsAssembly, fieldOut);

	fileOut.Close();

	SetRequestedLevels(vecPressureLevels, fieldOut);

	block.End("Done");
}

///////////////////////////////////////////////////////////////////////////////

