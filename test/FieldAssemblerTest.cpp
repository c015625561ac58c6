///////////////////////////////////////////////////////////////////////////////
///
///	\file    FieldAssemblerTest.cpp
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


#include "FieldAssembler.h"
#include "NcRecordFile.h"
#include "PressureInterpolator.h"
#include "TestRecordFiles.h"

#include <gtest/gtest.h>

#include <cmath>
#include <algorithm>

///////////////////////////////////////////////////////////////////////////////

static const int Ip1_800hPa = 41694464;
static const int Ip1_500hPa = 41394464;
static const int Ip1_200hPa = 41094464;

///////////////////////////////////////////////////////////////////////////////

class FieldAssemblerTest : public ::testing::Test {

protected:
	virtual void SetUp() {
		m_file.Create(m_scratch.GetFilePath("fields.nc"));
	}

	///	<summary>
	///		Write TT at 500, 200 and 800 hPa, in that order, and locate the
	///		records in the order they were written.
	///	</summary>
	void WriteTemperature(
		std::vector<RecordMetadata> & vecRecords
	) {
		WriteConstantRecord(m_file,
			MakeLFieldMeta("TT", Ip1_500hPa, 3, 2, 0.0, 0.0, 1.0, 1.0), -20.0f);
		WriteConstantRecord(m_file,
			MakeLFieldMeta("TT", Ip1_200hPa, 3, 2, 0.0, 0.0, 1.0, 1.0), -50.0f);
		WriteConstantRecord(m_file,
			MakeLFieldMeta("TT", Ip1_800hPa, 3, 2, 0.0, 0.0, 1.0, 1.0), 5.0f);

		m_file.FindRecords(RecordSearch("TT"), vecRecords);
	}

	///	<summary>
	///		Metadata of an L grid record linked through ig1/ig2 to the
	///		vertical descriptor written by WriteVerticalDescriptorRecord.
	///	</summary>
	static RecordMetadata MakeLinkedMeta(
		const std::string & strNomVar,
		int iIp1
	) {
		RecordMetadata meta = MakeFieldMeta(strNomVar, iIp1, "L", 3, 2);
		meta.m_iIg1 = TestIg1;
		meta.m_iIg2 = TestIg2;
		return meta;
	}

	///	<summary>
	///		Write a field at the given levels and locate its records.
	///	</summary>
	void WriteLevels(
		const std::string & strNomVar,
		const std::vector<int> & vecIp1,
		std::vector<RecordMetadata> & vecRecords,
		bool fLinked = false
	) {
		for (size_t k = 0; k < vecIp1.size(); k++) {
			RecordMetadata meta = (fLinked)?
				(MakeLinkedMeta(strNomVar, vecIp1[k])):
				(MakeFieldMeta(strNomVar, vecIp1[k], "L", 3, 2));

			WriteConstantRecord(m_file, meta, static_cast<float>(k));
		}
		m_file.FindRecords(RecordSearch(strNomVar), vecRecords);
	}

protected:
	InterpolationWorkspace m_scratch;

	NcRecordFile m_file;
};

///////////////////////////////////////////////////////////////////////////////

TEST_F(FieldAssemblerTest, LevelsSortedLowestFirst) {
	std::vector<RecordMetadata> vecRecords;
	WriteTemperature(vecRecords);
	ASSERT_EQ(3u, vecRecords.size());

	AssembledField field;
	FieldAssembler::Assemble(m_file, vecRecords, AssemblyOptions(), field);

	ASSERT_EQ(3u, field.GetLevelCount());

	std::vector<int> vecIp1 = field.GetIp1List();
	EXPECT_EQ(Ip1_800hPa, vecIp1[0]);
	EXPECT_EQ(Ip1_500hPa, vecIp1[1]);
	EXPECT_EQ(Ip1_200hPa, vecIp1[2]);

	std::vector<double> vecValues = field.GetLevelValues();
	EXPECT_DOUBLE_EQ(800.0, vecValues[0]);
	EXPECT_DOUBLE_EQ(200.0, vecValues[2]);

	ASSERT_TRUE(field.m_pValues.get() != NULL);
	const DataArray3D<float> & dValues = *(field.m_pValues);
	ASSERT_EQ(3u, dValues.GetSize(0));
	ASSERT_EQ(2u, dValues.GetSize(1));
	ASSERT_EQ(3u, dValues.GetSize(2));
	EXPECT_FLOAT_EQ(5.0f, dValues(0,1,2));
	EXPECT_FLOAT_EQ(-20.0f, dValues(1,0,0));
	EXPECT_FLOAT_EQ(-50.0f, dValues(2,1,1));

	EXPECT_EQ("TT", field.m_meta.m_strNomVar);
	EXPECT_EQ("L", field.m_grid.m_strGrTyp);
	EXPECT_FALSE(field.HasLatLon());
	EXPECT_FALSE(field.HasPressure());
	EXPECT_FALSE(field.IsYinYang());
}

TEST_F(FieldAssemblerTest, LevelsSortedForEveryRecordOrder) {
	std::vector<RecordMetadata> vecWritten;
	WriteTemperature(vecWritten);
	ASSERT_EQ(3u, vecWritten.size());

	std::vector<size_t> vecPermutation;
	for (size_t r = 0; r < vecWritten.size(); r++) {
		vecPermutation.push_back(r);
	}

	int nPermutations = 0;
	do {
		std::vector<RecordMetadata> vecRecords;
		for (size_t r = 0; r < vecPermutation.size(); r++) {
			vecRecords.push_back(vecWritten[vecPermutation[r]]);
		}

		AssembledField field;
		FieldAssembler::Assemble(m_file, vecRecords, AssemblyOptions(), field);

		std::vector<int> vecIp1 = field.GetIp1List();
		ASSERT_EQ(3u, vecIp1.size());
		EXPECT_EQ(Ip1_800hPa, vecIp1[0]) << "permutation " << nPermutations;
		EXPECT_EQ(Ip1_500hPa, vecIp1[1]) << "permutation " << nPermutations;
		EXPECT_EQ(Ip1_200hPa, vecIp1[2]) << "permutation " << nPermutations;

		// Values follow their levels
		EXPECT_FLOAT_EQ(5.0f, (*(field.m_pValues))(0,0,0));
		EXPECT_FLOAT_EQ(-20.0f, (*(field.m_pValues))(1,0,0));
		EXPECT_FLOAT_EQ(-50.0f, (*(field.m_pValues))(2,0,0));

		nPermutations++;

	} while (std::next_permutation(
		vecPermutation.begin(), vecPermutation.end()));

	EXPECT_EQ(6, nPermutations);
}

TEST_F(FieldAssemblerTest, PreserveOrderKeepsRecordOrder) {
	std::vector<RecordMetadata> vecRecords;
	WriteTemperature(vecRecords);

	AssemblyOptions opts;
	opts.m_fPreserveOrder = true;

	AssembledField field;
	FieldAssembler::Assemble(m_file, vecRecords, opts, field);

	std::vector<int> vecIp1 = field.GetIp1List();
	ASSERT_EQ(3u, vecIp1.size());
	EXPECT_EQ(Ip1_500hPa, vecIp1[0]);
	EXPECT_EQ(Ip1_200hPa, vecIp1[1]);
	EXPECT_EQ(Ip1_800hPa, vecIp1[2]);
	EXPECT_FLOAT_EQ(-20.0f, (*(field.m_pValues))(0,0,0));
}

TEST_F(FieldAssemblerTest, CoordinatesAndPressureOnPressureLevels) {
	std::vector<RecordMetadata> vecRecords;
	WriteTemperature(vecRecords);

	AssemblyOptions opts;
	opts.m_fLatLon = true;
	opts.m_fPressure = true;

	// No surface pressure is needed on pressure levels
	AssembledField field;
	FieldAssembler::Assemble(m_file, vecRecords, opts, field);

	ASSERT_TRUE(field.HasLatLon());
	EXPECT_EQ(2u, field.m_pLat->GetRows());
	EXPECT_EQ(3u, field.m_pLat->GetColumns());
	EXPECT_DOUBLE_EQ(1.0, (*(field.m_pLat))(1,2));
	EXPECT_DOUBLE_EQ(2.0, (*(field.m_pLon))(1,2));

	ASSERT_TRUE(field.HasPressure());
	EXPECT_FLOAT_EQ(800.0f, (*(field.m_pPressure))(0,1,1));
	EXPECT_FLOAT_EQ(500.0f, (*(field.m_pPressure))(1,0,2));
	EXPECT_FLOAT_EQ(200.0f, (*(field.m_pPressure))(2,1,0));
}

TEST_F(FieldAssemblerTest, PressureOnSigmaLevels) {
	std::vector<int> vecIp1;
	vecIp1.push_back(LevelCodec::Encode(0.5, LevelKind_Sigma));
	vecIp1.push_back(LevelCodec::Encode(1.0, LevelKind_Sigma));

	std::vector<RecordMetadata> vecRecords;
	WriteLevels("TT", vecIp1, vecRecords);

	WriteRampRecord(m_file, MakeFieldMeta("P0", 0, "L", 3, 2), 1000.0f);

	AssemblyOptions opts;
	opts.m_fPressure = true;

	AssembledField field;
	FieldAssembler::Assemble(m_file, vecRecords, opts, field);

	// Sigma 1.0 is the lowest level
	ASSERT_EQ(2u, field.GetLevelCount());
	EXPECT_EQ(vecIp1[1], field.m_vecLevels[0].m_iIp1);

	const DataArray3D<float> & dPressure = *(field.m_pPressure);
	EXPECT_FLOAT_EQ(1012.0f, dPressure(0,1,2));
	EXPECT_FLOAT_EQ(506.0f, dPressure(1,1,2));
	EXPECT_FLOAT_EQ(500.0f, dPressure(1,0,0));
}

TEST_F(FieldAssemblerTest, SigmaLevelsWithoutSurfacePressure) {
	std::vector<int> vecIp1;
	vecIp1.push_back(LevelCodec::Encode(0.5, LevelKind_Sigma));

	std::vector<RecordMetadata> vecRecords;
	WriteLevels("TT", vecIp1, vecRecords);

	AssemblyOptions opts;
	opts.m_fPressure = true;

	AssembledField field;
	EXPECT_EXCEPTION_TYPE(
		FieldAssembler::Assemble(m_file, vecRecords, opts, field),
		Exception::NoMatchingRecord);

	// Surface pressure on another grid
	WriteConstantRecord(m_file, MakeFieldMeta("P0", 0, "L", 4, 2), 1000.0f);

	EXPECT_EXCEPTION_TYPE(
		FieldAssembler::Assemble(m_file, vecRecords, opts, field),
		Exception::InconsistentGridShape);

	// Values alone do not need surface pressure
	FieldAssembler::Assemble(m_file, vecRecords, AssemblyOptions(), field);
	EXPECT_EQ(1u, field.GetLevelCount());
}

TEST_F(FieldAssemblerTest, PressureOnStaggeredHybridLevels) {
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

	std::vector<RecordMetadata> vecRecords;
	WriteLevels("TT", vecIp1, vecRecords, true);

	WriteConstantRecord(m_file, MakeLinkedMeta("P0", 0), 950.0f);

	AssemblyOptions opts;
	opts.m_fPressure = true;

	AssembledField field;
	FieldAssembler::Assemble(m_file, vecRecords, opts, field);

	ASSERT_EQ(2u, field.GetLevelCount());
	EXPECT_EQ(vecIp1[1], field.m_vecLevels[0].m_iIp1);
	EXPECT_NEAR(950.0f, (*(field.m_pPressure))(0,0,0), 1.0e-3);
	EXPECT_NEAR(500.0f, (*(field.m_pPressure))(1,0,0), 1.0e-3);
}

TEST_F(FieldAssemblerTest, PressureLevelsIgnoreUnlinkedDescriptor) {
	VerticalDescriptor vdesc;
	vdesc.m_iVCode = 21001;
	WriteVerticalDescriptorRecord(m_file, vdesc);

	std::vector<RecordMetadata> vecRecords;
	WriteTemperature(vecRecords);

	AssemblyOptions opts;
	opts.m_fLatLon = true;
	opts.m_fPressure = true;

	AssembledField field;
	FieldAssembler::Assemble(m_file, vecRecords, opts, field);

	ASSERT_EQ(3u, field.GetLevelCount());
	ASSERT_TRUE(field.HasPressure());
	EXPECT_FLOAT_EQ(800.0f, (*(field.m_pPressure))(0,0,0));
	EXPECT_FLOAT_EQ(200.0f, (*(field.m_pPressure))(2,1,2));

	// A single level 2D field
	WriteConstantRecord(m_file, MakeFieldMeta("P0", 0, "L", 3, 2), 1000.0f);

	std::vector<RecordMetadata> vecP0;
	m_file.FindRecords(RecordSearch("P0"), vecP0);
	ASSERT_EQ(1u, vecP0.size());

	AssembledField fieldP0;
	FieldAssembler::Assemble(m_file, vecP0, AssemblyOptions(), fieldP0);
	EXPECT_EQ(1u, fieldP0.GetLevelCount());
	EXPECT_FLOAT_EQ(1000.0f, (*(fieldP0.m_pValues))(0,1,1));
}

TEST_F(FieldAssemblerTest, UnsupportedVerticalCoordinate) {
	std::vector<int> vecIp1;
	vecIp1.push_back(LevelCodec::Encode(0.5, LevelKind_Hybrid));
	vecIp1.push_back(LevelCodec::Encode(1.0, LevelKind_Hybrid));

	VerticalDescriptor vdesc;
	vdesc.m_iVCode = 21001;
	WriteVerticalDescriptorRecord(m_file, vdesc);

	std::vector<RecordMetadata> vecRecords;
	WriteLevels("TT", vecIp1, vecRecords, true);

	WriteConstantRecord(m_file, MakeLinkedMeta("P0", 0), 1000.0f);

	// Levels decode without the vertical coordinate
	AssembledField field;
	FieldAssembler::Assemble(m_file, vecRecords, AssemblyOptions(), field);
	ASSERT_EQ(2u, field.GetLevelCount());
	EXPECT_EQ(vecIp1[1], field.m_vecLevels[0].m_iIp1);

	// Pressure needs a supported vertical coordinate
	AssemblyOptions opts;
	opts.m_fPressure = true;

	EXPECT_EXCEPTION_TYPE(
		FieldAssembler::Assemble(m_file, vecRecords, opts, field),
		Exception::UnsupportedVerticalCoordinate);
}

TEST_F(FieldAssemblerTest, RejectsInconsistentRecords) {
	std::vector<RecordMetadata> vecRecords;
	WriteTemperature(vecRecords);

	AssembledField field;

	std::vector<RecordMetadata> vecNone;
	EXPECT_EXCEPTION_TYPE(
		FieldAssembler::Assemble(m_file, vecNone, AssemblyOptions(), field),
		Exception::NoMatchingRecord);

	std::vector<RecordMetadata> vecRepeated = vecRecords;
	vecRepeated.push_back(vecRecords[0]);
	EXPECT_EXCEPTION_TYPE(
		FieldAssembler::Assemble(
			m_file, vecRepeated, AssemblyOptions(), field),
		Exception::General);

	RecordMetadata metaOther =
		MakeLFieldMeta("TT", 41794464, 4, 2, 0.0, 0.0, 1.0, 1.0);
	WriteConstantRecord(m_file, metaOther, 0.0f);

	std::vector<RecordMetadata> vecMixed;
	m_file.FindRecords(RecordSearch("TT"), vecMixed);
	ASSERT_EQ(4u, vecMixed.size());

	EXPECT_EXCEPTION_TYPE(
		FieldAssembler::Assemble(m_file, vecMixed, AssemblyOptions(), field),
		Exception::InconsistentGridShape);
}

///////////////////////////////////////////////////////////////////////////////

TEST_F(FieldAssemblerTest, YinYangFieldHasPanels) {
	std::vector<double> vecAx;
	vecAx.push_back(10.0);
	vecAx.push_back(20.0);
	vecAx.push_back(30.0);

	std::vector<double> vecAy;
	vecAy.push_back(-5.0);
	vecAy.push_back(5.0);

	WriteYinYangRecord(m_file, vecAx, vecAy);

	WriteRampRecord(m_file, MakeFieldMeta("TT", Ip1_500hPa, "U", 3, 4), 0.0f);
	WriteRampRecord(m_file, MakeFieldMeta("TT", Ip1_800hPa, "U", 3, 4), 100.0f);

	std::vector<RecordMetadata> vecRecords;
	m_file.FindRecords(RecordSearch("TT"), vecRecords);

	AssemblyOptions opts;
	opts.m_fLatLon = true;

	AssembledField field;
	FieldAssembler::Assemble(m_file, vecRecords, opts, field);

	ASSERT_TRUE(field.IsYinYang());
	ASSERT_TRUE(field.m_pYang.get() != NULL);

	// The combined field keeps its metadata
	EXPECT_EQ(4, field.m_meta.m_nNj);
	EXPECT_TRUE(field.m_grid.m_fYinYang);

	// while its arrays hold the Yin rows
	EXPECT_EQ(2, (int)field.m_pValues->GetSize(1));

	const AssembledField & yin = *(field.m_pYin);
	const AssembledField & yang = *(field.m_pYang);

	EXPECT_EQ(2, yin.m_meta.m_nNj);
	EXPECT_EQ(2, yang.m_meta.m_nNj);
	EXPECT_DOUBLE_EQ(90.0, yin.m_grid.m_dXLon1);
	EXPECT_DOUBLE_EQ(180.0, yang.m_grid.m_dXLon1);
	EXPECT_EQ(2u, yang.GetLevelCount());

	ASSERT_EQ(2u, yin.m_pValues->GetSize(1));
	ASSERT_EQ(2u, yang.m_pValues->GetSize(1));

	// Level 0 is 800 hPa
	EXPECT_FLOAT_EQ(112.0f, (*(yin.m_pValues))(0,1,2));
	EXPECT_FLOAT_EQ(132.0f, (*(yang.m_pValues))(0,1,2));
	EXPECT_FLOAT_EQ(21.0f, (*(yang.m_pValues))(1,0,1));

	ASSERT_TRUE(yang.HasLatLon());
	EXPECT_NEAR(100.0, (*(yang.m_pLon))(0,0), 1.0e-9);

	// The default view is the Yin panel
	EXPECT_EQ(yin.m_pValues.get(), field.m_pValues.get());
	EXPECT_EQ(yin.m_pLat.get(), field.m_pLat.get());
}

///////////////////////////////////////////////////////////////////////////////

