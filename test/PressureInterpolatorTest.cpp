///////////////////////////////////////////////////////////////////////////////
///
///	\file    PressureInterpolatorTest.cpp
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
#include "ProcessRunner.h"
#include "NcRecordFile.h"
#include "TestRecordFiles.h"
#include "Announce.h"

#include <gtest/gtest.h>

#include <cmath>
#include <csignal>
#include <cstdio>
#include <dirent.h>
#include <sys/stat.h>

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Number of entries in a directory, or -1 if it does not exist.
///	</summary>
static int CountDirectoryEntries(const std::string & strPath) {
	DIR * pDir = opendir(strPath.c_str());
	if (pDir == NULL) {
		return (-1);
	}

	int nEntries = 0;
	struct dirent * pEntry;
	while ((pEntry = readdir(pDir)) != NULL) {
		std::string strName(pEntry->d_name);
		if ((strName != ".") && (strName != "..")) {
			nEntries++;
		}
	}
	closedir(pDir);
	return nEntries;
}

///	<summary>
///		True if the path is an existing directory.
///	</summary>
static bool IsDirectory(const std::string & strPath) {
	struct stat statPath;
	if (stat(strPath.c_str(), &statPath) != 0) {
		return false;
	}
	return S_ISDIR(statPath.st_mode);
}

///////////////////////////////////////////////////////////////////////////////

TEST(ProcessRunnerTest, CapturesOutput) {
	std::vector<std::string> vecArgs;
	vecArgs.push_back("/bin/sh");
	vecArgs.push_back("-c");
	vecArgs.push_back("echo to stdout; echo to stderr >&2");

	ProcessResult result;
	ProcessRunner::Run(vecArgs, 10.0, result);

	EXPECT_TRUE(result.Succeeded());
	EXPECT_EQ(0, result.m_iExitStatus);
	EXPECT_NE(std::string::npos, result.m_strOutput.find("to stdout"));
	EXPECT_NE(std::string::npos, result.m_strOutput.find("to stderr"));
}

TEST(ProcessRunnerTest, ReportsExitStatus) {
	std::vector<std::string> vecArgs;
	vecArgs.push_back("/bin/sh");
	vecArgs.push_back("-c");
	vecArgs.push_back("exit 3");

	ProcessResult result;
	ProcessRunner::Run(vecArgs, 10.0, result);

	EXPECT_FALSE(result.Succeeded());
	EXPECT_EQ(3, result.m_iExitStatus);
	EXPECT_FALSE(result.m_fTimedOut);
	EXPECT_FALSE(result.m_fExecFailed);
}

TEST(ProcessRunnerTest, ReportsSignal) {
	std::vector<std::string> vecArgs;
	vecArgs.push_back("/bin/sh");
	vecArgs.push_back("-c");
	vecArgs.push_back("kill -TERM $$");

	ProcessResult result;
	ProcessRunner::Run(vecArgs, 10.0, result);

	EXPECT_FALSE(result.Succeeded());
	EXPECT_EQ(SIGTERM, result.m_iSignal);
}

TEST(ProcessRunnerTest, ReportsMissingProgram) {
	std::vector<std::string> vecArgs;
	vecArgs.push_back("/nonexistent/d.pxs2pxt");

	ProcessResult result;
	ProcessRunner::Run(vecArgs, 10.0, result);

	EXPECT_TRUE(result.m_fExecFailed);
	EXPECT_FALSE(result.Succeeded());
	EXPECT_NE(std::string::npos, result.m_strOutput.find("/nonexistent"));
}

TEST(ProcessRunnerTest, KillsProgramAfterTimeout) {
	std::vector<std::string> vecArgs;
	vecArgs.push_back("/bin/sh");
	vecArgs.push_back("-c");
	vecArgs.push_back("sleep 30");

	ProcessResult result;
	ProcessRunner::Run(vecArgs, 0.5, result);

	EXPECT_TRUE(result.m_fTimedOut);
	EXPECT_FALSE(result.Succeeded());
}

///////////////////////////////////////////////////////////////////////////////

TEST(InterpolationWorkspaceTest, RemovedOnRelease) {
	InterpolationWorkspace scratch;

	std::string strPath;
	{
		InterpolationWorkspace workspace(scratch.GetPath());
		strPath = workspace.GetPath();

		ASSERT_TRUE(IsDirectory(strPath));
		EXPECT_EQ(0u, strPath.find(scratch.GetPath() + "/stdfield_"));

		// Nested content is removed too
		ASSERT_EQ(0, mkdir(workspace.GetFilePath("nested").c_str(), 0700));
		FILE * fp = fopen(
			workspace.GetFilePath("nested/source.nc").c_str(), "w");
		ASSERT_TRUE(fp != NULL);
		fclose(fp);

		EXPECT_EQ(1, CountDirectoryEntries(scratch.GetPath()));
	}

	EXPECT_FALSE(IsDirectory(strPath));
	EXPECT_EQ(0, CountDirectoryEntries(scratch.GetPath()));

	InterpolationWorkspace workspace(scratch.GetPath());
	strPath = workspace.GetPath();
	EXPECT_TRUE(workspace.Release());
	EXPECT_FALSE(IsDirectory(strPath));
	EXPECT_TRUE(workspace.Release());
}

TEST(InterpolationWorkspaceTest, BaseMustBeDirectory) {
	EXPECT_EXCEPTION_TYPE(
		InterpolationWorkspace workspace("/nonexistent/tmp"),
		Exception::WorkspaceIOError);
}

///////////////////////////////////////////////////////////////////////////////

TEST(PressureLevelsTest, Format) {
	std::vector<double> vecLevels;
	vecLevels.push_back(1000.0);
	vecLevels.push_back(850.5);
	vecLevels.push_back(10.0);

	EXPECT_EQ("1000.00,0850.50,0010.00",
		PressureInterpolator::FormatPressureLevels(vecLevels));
}

TEST(PressureLevelsTest, Encode) {
	std::vector<double> vecLevels;
	vecLevels.push_back(500.0);
	vecLevels.push_back(850.0);

	std::vector<int> vecIp1 =
		PressureInterpolator::EncodePressureLevels(vecLevels);

	ASSERT_EQ(2u, vecIp1.size());
	EXPECT_EQ(41394464, vecIp1[0]);
	EXPECT_EQ(LevelCodec::Encode(850.0, LevelKind_Pressure), vecIp1[1]);

	vecLevels.push_back(500.0);
	EXPECT_THROW(
		PressureInterpolator::EncodePressureLevels(vecLevels), Exception);

	vecLevels[2] = 0.0;
	EXPECT_THROW(
		PressureInterpolator::EncodePressureLevels(vecLevels), Exception);

	vecLevels[2] = -100.0;
	EXPECT_THROW(
		PressureInterpolator::EncodePressureLevels(vecLevels), Exception);

	// Distinct levels that cannot be told apart once formatted
	vecLevels[2] = 500.001;
	EXPECT_THROW(
		PressureInterpolator::EncodePressureLevels(vecLevels), Exception);
}

TEST(PressureLevelsTest, RequestedValuesReplaceDecodedValues) {
	std::vector<double> vecLevels;
	vecLevels.push_back(1013.257);
	vecLevels.push_back(500.0);

	std::vector<int> vecIp1 =
		PressureInterpolator::EncodePressureLevels(vecLevels);
	ASSERT_EQ(2u, vecIp1.size());

	// Level codes keep a limited number of digits
	LevelCodec codec;
	EXPECT_EQ(LevelCodec::Encode(1013.26, LevelKind_Pressure), vecIp1[0]);
	EXPECT_NE(1013.257, codec.Decode(vecIp1[0]).m_dValue);

	AssembledField field;
	for (size_t k = 0; k < vecIp1.size(); k++) {
		field.m_vecLevels.push_back(codec.Decode(vecIp1[k]));
	}
	field.m_pPressure.reset(new DataArray3D<float>(2, 1, 2));

	PressureInterpolator::SetRequestedLevels(vecLevels, field);

	EXPECT_EQ(1013.257, field.m_vecLevels[0].m_dValue);
	EXPECT_EQ(500.0, field.m_vecLevels[1].m_dValue);
	EXPECT_EQ(vecIp1[0], field.m_vecLevels[0].m_iIp1);
	EXPECT_FLOAT_EQ(1013.257f, (*(field.m_pPressure))(0,0,1));
	EXPECT_FLOAT_EQ(500.0f, (*(field.m_pPressure))(1,0,0));

	std::vector<double> vecOther(3, 100.0);
	EXPECT_THROW(
		PressureInterpolator::SetRequestedLevels(vecOther, field), Exception);
}

///////////////////////////////////////////////////////////////////////////////

class PressureInterpolatorTest : public ::testing::Test {

protected:
	virtual void SetUp() {
		m_strTmpDir = m_scratch.GetFilePath("tmp");
		mkdir(m_strTmpDir.c_str(), 0700);

		m_file.Create(m_scratch.GetFilePath("model.nc"));

		m_opts.m_strTmpDir = m_strTmpDir;
		m_opts.m_dTimeout = 60.0;
		m_opts.m_vecTool.clear();
		m_opts.m_vecTool.push_back(MOCK_PXS2PXT_PATH);

		m_vecLevels.push_back(850.0);
		m_vecLevels.push_back(500.0);
		m_vecLevels.push_back(250.0);
	}

	///	<summary>
	///		Write TT on two hybrid levels of a Z grid, with its vertical
	///		descriptor, and assemble it.
	///	</summary>
	void WriteHybridField(
		bool fSurfacePressure
	) {
		std::vector<double> vecAx(3, 0.0);
		vecAx[0] = 10.0;
		vecAx[1] = 20.0;
		vecAx[2] = 30.0;
		std::vector<double> vecAy(2, 0.0);
		vecAy[0] = 40.0;
		vecAy[1] = 50.0;
		WriteZGridRecords(m_file, "L", vecAx, vecAy);

		std::vector<int> vecIp1;
		vecIp1.push_back(LevelCodec::Encode(0.5, LevelKind_Hybrid));
		vecIp1.push_back(LevelCodec::Encode(1.0, LevelKind_Hybrid));

		VerticalDescriptor vdesc;
		vdesc.m_iVCode = 5002;
		vdesc.m_dPRef = 100000.0;
		vdesc.m_vecIp1 = vecIp1;
		vdesc.m_vecA.push_back(log(50000.0));
		vdesc.m_vecA.push_back(log(100000.0));
		vdesc.m_vecB.push_back(0.0);
		vdesc.m_vecB.push_back(1.0);
		WriteVerticalDescriptorRecord(m_file, vdesc);

		for (size_t k = 0; k < vecIp1.size(); k++) {
			WriteConstantRecord(m_file,
				MakeFieldMeta("TT", vecIp1[k], "Z", 3, 2), 0.0f);
		}
		if (fSurfacePressure) {
			WriteConstantRecord(m_file,
				MakeFieldMeta("P0", 0, "Z", 3, 2), 1000.0f);
		}

		AssembleField("TT");
	}

	///	<summary>
	///		Assemble all records of a variable.
	///	</summary>
	void AssembleField(const std::string & strNomVar) {
		std::vector<RecordMetadata> vecRecords;
		m_file.FindRecords(RecordSearch(strNomVar), vecRecords);
		FieldAssembler::Assemble(
			m_file, vecRecords, AssemblyOptions(), m_field);
	}

protected:
	InterpolationWorkspace m_scratch;

	std::string m_strTmpDir;

	NcRecordFile m_file;

	InterpolationOptions m_opts;

	std::vector<double> m_vecLevels;

	AssembledField m_field;
};

///////////////////////////////////////////////////////////////////////////////

TEST_F(PressureInterpolatorTest, DefaultOptions) {
	InterpolationOptions opts;
	ASSERT_EQ(1u, opts.m_vecTool.size());
	EXPECT_EQ("d.pxs2pxt", opts.m_vecTool[0]);
	EXPECT_DOUBLE_EQ(600.0, opts.m_dTimeout);
}

TEST_F(PressureInterpolatorTest, InterpolatesToRequestedLevels) {
	WriteHybridField(true);

	m_opts.m_optsAssembly.m_fLatLon = true;
	m_opts.m_optsAssembly.m_fPressure = true;

	AssembledField fieldOut;
	PressureInterpolator::Interpolate(
		m_file, m_field, m_vecLevels, m_opts, fieldOut);

	// Requested order is kept
	ASSERT_EQ(3u, fieldOut.GetLevelCount());
	std::vector<double> vecValues = fieldOut.GetLevelValues();
	for (size_t k = 0; k < 3; k++) {
		EXPECT_EQ(LevelKind_Pressure, fieldOut.m_vecLevels[k].m_eKind);
		EXPECT_DOUBLE_EQ(m_vecLevels[k], vecValues[k]);
		EXPECT_FLOAT_EQ(static_cast<float>(m_vecLevels[k]),
			(*(fieldOut.m_pValues))(k,1,2));
		EXPECT_FLOAT_EQ(static_cast<float>(m_vecLevels[k]),
			(*(fieldOut.m_pPressure))(k,0,1));
	}

	EXPECT_EQ("TT", fieldOut.m_meta.m_strNomVar);
	EXPECT_EQ(TestDateV, fieldOut.m_meta.m_lDateV);
	EXPECT_TRUE(fieldOut.m_grid == m_field.m_grid);

	ASSERT_TRUE(fieldOut.HasLatLon());
	EXPECT_DOUBLE_EQ(50.0, (*(fieldOut.m_pLat))(1,0));
	EXPECT_DOUBLE_EQ(30.0, (*(fieldOut.m_pLon))(0,2));

	// The workspace is gone
	EXPECT_EQ(0, CountDirectoryEntries(m_strTmpDir));
}

TEST_F(PressureInterpolatorTest, ResultHasExactRequestedValues) {
	WriteHybridField(true);

	m_opts.m_optsAssembly.m_fPressure = true;

	std::vector<double> vecLevels;
	vecLevels.push_back(1013.257);
	vecLevels.push_back(500.0);
	vecLevels.push_back(850.004);

	AssembledField fieldOut;
	PressureInterpolator::Interpolate(
		m_file, m_field, vecLevels, m_opts, fieldOut);

	std::vector<int> vecIp1 =
		PressureInterpolator::EncodePressureLevels(vecLevels);

	ASSERT_EQ(3u, fieldOut.GetLevelCount());
	std::vector<double> vecValues = fieldOut.GetLevelValues();
	for (size_t k = 0; k < 3; k++) {
		EXPECT_EQ(vecLevels[k], vecValues[k]);
		EXPECT_EQ(vecIp1[k], fieldOut.m_vecLevels[k].m_iIp1);
		EXPECT_FLOAT_EQ(static_cast<float>(vecLevels[k]),
			(*(fieldOut.m_pPressure))(k,1,1));
	}

	EXPECT_EQ(0, CountDirectoryEntries(m_strTmpDir));
}

TEST_F(PressureInterpolatorTest, AnnouncementBlocksClosedOnFailure) {
	WriteHybridField(true);

	FILE * fpOutput = tmpfile();
	ASSERT_TRUE(fpOutput != NULL);

	int iVerbosity = AnnounceGetVerbosityLevel();
	AnnounceSetOutputBuffer(fpOutput);
	AnnounceSetVerbosityLevel(1);

	int nIndentation = AnnounceGetIndentationLevel();

	AssembledField fieldOut;

	m_opts.m_vecTool[0] = "/bin/false";
	for (int i = 0; i < 3; i++) {
		EXPECT_EXCEPTION_TYPE(
			PressureInterpolator::Interpolate(
				m_file, m_field, m_vecLevels, m_opts, fieldOut),
			Exception::InterpolationToolFailed);
		EXPECT_EQ(nIndentation, AnnounceGetIndentationLevel());
	}

	m_opts.m_vecTool[0] = MOCK_PXS2PXT_PATH;
	PressureInterpolator::Interpolate(
		m_file, m_field, m_vecLevels, m_opts, fieldOut);
	EXPECT_EQ(nIndentation, AnnounceGetIndentationLevel());

	AnnounceSetVerbosityLevel(iVerbosity);
	AnnounceSetOutputBuffer(NULL);
	fclose(fpOutput);
}

TEST_F(PressureInterpolatorTest, InterpolatesYinYangField) {
	std::vector<double> vecAx(3, 0.0);
	vecAx[1] = 15.0;
	vecAx[2] = 30.0;
	std::vector<double> vecAy(2, -10.0);
	vecAy[1] = 10.0;
	WriteYinYangRecord(m_file, vecAx, vecAy);

	WriteRampRecord(m_file, MakeFieldMeta("TT", 93423264, "U", 3, 4), 0.0f);
	WriteRampRecord(m_file, MakeFieldMeta("TT", 95246367, "U", 3, 4), 0.0f);
	WriteConstantRecord(m_file, MakeFieldMeta("P0", 0, "U", 3, 4), 1000.0f);

	AssembleField("TT");
	ASSERT_TRUE(m_field.IsYinYang());

	AssembledField fieldOut;
	PressureInterpolator::Interpolate(
		m_file, m_field, m_vecLevels, m_opts, fieldOut);

	ASSERT_TRUE(fieldOut.IsYinYang());
	EXPECT_EQ(3u, fieldOut.m_pYang->GetLevelCount());
	EXPECT_EQ(2u, fieldOut.m_pYang->m_pValues->GetSize(1));
	EXPECT_FLOAT_EQ(250.0f, (*(fieldOut.m_pYang->m_pValues))(2,1,1));
	EXPECT_EQ(0, CountDirectoryEntries(m_strTmpDir));
}

TEST_F(PressureInterpolatorTest, MissingSurfacePressure) {
	WriteHybridField(false);

	AssembledField fieldOut;
	EXPECT_EXCEPTION_TYPE(
		PressureInterpolator::Interpolate(
			m_file, m_field, m_vecLevels, m_opts, fieldOut),
		Exception::NoMatchingRecord);

	EXPECT_EQ(0, CountDirectoryEntries(m_strTmpDir));
}

TEST_F(PressureInterpolatorTest, ToolFailure) {
	WriteHybridField(true);

	AssembledField fieldOut;

	m_opts.m_vecTool[0] = "/bin/false";
	EXPECT_EXCEPTION_TYPE(
		PressureInterpolator::Interpolate(
			m_file, m_field, m_vecLevels, m_opts, fieldOut),
		Exception::InterpolationToolFailed);

	m_opts.m_vecTool[0] = "/nonexistent/d.pxs2pxt";
	EXPECT_EXCEPTION_TYPE(
		PressureInterpolator::Interpolate(
			m_file, m_field, m_vecLevels, m_opts, fieldOut),
		Exception::InterpolationToolFailed);

	// Succeeds without writing any output
	m_opts.m_vecTool[0] = "/bin/true";
	EXPECT_EXCEPTION_TYPE(
		PressureInterpolator::Interpolate(
			m_file, m_field, m_vecLevels, m_opts, fieldOut),
		Exception::InterpolationToolFailed);

	EXPECT_EQ(0, CountDirectoryEntries(m_strTmpDir));
}

TEST_F(PressureInterpolatorTest, ToolOutputMissingLevel) {
	WriteHybridField(true);

	m_opts.m_vecTool.push_back("-drop-last");

	AssembledField fieldOut;
	EXPECT_EXCEPTION_TYPE(
		PressureInterpolator::Interpolate(
			m_file, m_field, m_vecLevels, m_opts, fieldOut),
		Exception::InterpolationToolFailed);

	EXPECT_EQ(0, CountDirectoryEntries(m_strTmpDir));
}

TEST_F(PressureInterpolatorTest, ToolTimeout) {
	WriteHybridField(true);

	m_opts.m_vecTool.clear();
	m_opts.m_vecTool.push_back("/bin/sh");
	m_opts.m_vecTool.push_back("-c");
	m_opts.m_vecTool.push_back("sleep 30");
	m_opts.m_dTimeout = 0.5;

	AssembledField fieldOut;
	EXPECT_EXCEPTION_TYPE(
		PressureInterpolator::Interpolate(
			m_file, m_field, m_vecLevels, m_opts, fieldOut),
		Exception::InterpolationTimeout);

	EXPECT_EQ(0, CountDirectoryEntries(m_strTmpDir));
}

TEST_F(PressureInterpolatorTest, InvalidRequest) {
	WriteHybridField(true);

	AssembledField fieldOut;

	std::vector<double> vecNone;
	EXPECT_THROW(
		PressureInterpolator::Interpolate(
			m_file, m_field, vecNone, m_opts, fieldOut),
		Exception);

	m_opts.m_strTmpDir = m_scratch.GetFilePath("missing");
	EXPECT_EXCEPTION_TYPE(
		PressureInterpolator::Interpolate(
			m_file, m_field, m_vecLevels, m_opts, fieldOut),
		Exception::WorkspaceIOError);
}

///////////////////////////////////////////////////////////////////////////////

