///////////////////////////////////////////////////////////////////////////////
///
///	\file    NcRecordFileTest.cpp
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
#include "PressureInterpolator.h"
#include "TestRecordFiles.h"
#include "Exception.h"

#include <gtest/gtest.h>

///////////////////////////////////////////////////////////////////////////////

class NcRecordFileTest : public ::testing::Test {

protected:
	virtual void SetUp() {
		m_strPath = m_scratch.GetFilePath("records.nc");
	}

protected:
	InterpolationWorkspace m_scratch;

	std::string m_strPath;
};

///////////////////////////////////////////////////////////////////////////////

TEST_F(NcRecordFileTest, WrittenRecordsReadBack) {
	{
		NcRecordFile file;
		file.Create(m_strPath);

		RecordMetadata meta = MakeFieldMeta("TT", 41394464, "Z", 4, 3);
		meta.m_iIg4 = 7;
		WriteRampRecord(file, meta, -40.0f);

		std::vector<double> vecAx(4, 0.0);
		std::vector<double> vecAy(3, 0.0);
		WriteZGridRecords(file, "E", vecAx, vecAy, 10.0, 20.0, 30.0, 40.0);

		file.Close();
	}

	EXPECT_TRUE(NcRecordFile::IsRecordFile(m_strPath));

	NcRecordFile file;
	file.Open(m_strPath);

	std::vector<RecordMetadata> vecRecords;
	file.FindRecords(RecordSearch(), vecRecords);
	ASSERT_EQ(3u, vecRecords.size());

	const RecordMetadata & meta = vecRecords[0];
	EXPECT_EQ("TT", meta.m_strNomVar);
	EXPECT_EQ("P", meta.m_strTypVar);
	EXPECT_EQ("R1_V800_N", meta.m_strEtiket);
	EXPECT_EQ("Z", meta.m_strGrTyp);
	EXPECT_EQ(41394464, meta.m_iIp1);
	EXPECT_EQ(6, meta.m_iIp2);
	EXPECT_EQ(TestDateV, meta.m_lDateV);
	EXPECT_EQ(450, meta.m_iDeet);
	EXPECT_EQ(TestIg1, meta.m_iIg1);
	EXPECT_EQ(TestIg2, meta.m_iIg2);
	EXPECT_EQ(TestIg3, meta.m_iIg3);
	EXPECT_EQ(7, meta.m_iIg4);
	EXPECT_EQ(4, meta.m_nNi);
	EXPECT_EQ(3, meta.m_nNj);

	DataArray2D<float> data;
	file.ReadRecord(meta, data);
	ASSERT_EQ(3u, data.GetRows());
	ASSERT_EQ(4u, data.GetColumns());
	EXPECT_FLOAT_EQ(-40.0f, data(0,0));
	EXPECT_FLOAT_EQ(-17.0f, data(2,3));

	EXPECT_EQ(">>", vecRecords[1].m_strNomVar);
	EXPECT_EQ("E", vecRecords[1].m_strGrTyp);
	EXPECT_DOUBLE_EQ(10.0, vecRecords[1].m_dXg1);
	EXPECT_DOUBLE_EQ(40.0, vecRecords[1].m_dXg4);
	EXPECT_EQ(1, vecRecords[1].m_nNj);
	EXPECT_EQ(4, vecRecords[1].m_nNi);

	EXPECT_EQ("^^", vecRecords[2].m_strNomVar);
	EXPECT_EQ(3, vecRecords[2].m_nNj);
	EXPECT_EQ(1, vecRecords[2].m_nNi);
}

TEST_F(NcRecordFileTest, FindRecordsFilters) {
	NcRecordFile file;
	file.Create(m_strPath);

	WriteConstantRecord(file, MakeFieldMeta("TT", 41394464, "L", 2, 2), 1.0f);
	WriteConstantRecord(file, MakeFieldMeta("TT", 41094464, "L", 2, 2), 2.0f);
	WriteConstantRecord(file,
		MakeFieldMeta("TT", 41394464, "L", 2, 2, TestDateV + 1), 3.0f);
	WriteConstantRecord(file, MakeFieldMeta("HU", 41394464, "L", 2, 2), 4.0f);

	std::vector<RecordMetadata> vecRecords;

	file.FindRecords(RecordSearch("TT"), vecRecords);
	EXPECT_EQ(3u, vecRecords.size());

	RecordSearch search("TT");
	search.m_iIp1 = 41394464;
	file.FindRecords(search, vecRecords);
	EXPECT_EQ(2u, vecRecords.size());

	search.m_lDateV = TestDateV;
	file.FindRecords(search, vecRecords);
	ASSERT_EQ(1u, vecRecords.size());

	DataArray2D<float> data;
	file.ReadRecord(vecRecords[0], data);
	EXPECT_FLOAT_EQ(1.0f, data(1,1));

	file.FindRecords(RecordSearch("GZ"), vecRecords);
	EXPECT_EQ(0u, vecRecords.size());
}

TEST_F(NcRecordFileTest, ReadOnlyFileRejectsWrites) {
	{
		NcRecordFile file;
		file.Create(m_strPath);
		WriteConstantRecord(file, MakeFieldMeta("P0", 0, "L", 2, 2), 1000.0f);
	}

	NcRecordFile file;
	file.Open(m_strPath);

	EXPECT_THROW(
		WriteConstantRecord(file, MakeFieldMeta("P0", 0, "L", 2, 2), 1.0f),
		Exception);
}

TEST_F(NcRecordFileTest, ShapeMismatchOnRead) {
	NcRecordFile file;
	file.Create(m_strPath);
	WriteConstantRecord(file, MakeFieldMeta("TT", 41394464, "L", 3, 2), 1.0f);

	std::vector<RecordMetadata> vecRecords;
	file.FindRecords(RecordSearch("TT"), vecRecords);
	ASSERT_EQ(1u, vecRecords.size());

	RecordMetadata meta = vecRecords[0];
	meta.m_nNj = 5;

	DataArray2D<float> data;
	try {
		file.ReadRecord(meta, data);
		FAIL() << "Expected an exception";

	} catch(Exception & e) {
		EXPECT_EQ(Exception::InconsistentGridShape, e.GetType());
	}
}

TEST_F(NcRecordFileTest, PlainNetCDFIsNotARecordFile) {
	{
		NcFile ncFile(m_strPath.c_str(), NcFile::Replace);
		ASSERT_TRUE(ncFile.is_valid());
		NcDim * dim = ncFile.add_dim("x", 2);
		ncFile.add_var("r000000", ncFloat, dim);
	}

	EXPECT_FALSE(NcRecordFile::IsRecordFile(m_strPath));
	EXPECT_FALSE(NcRecordFile::IsRecordFile(m_scratch.GetFilePath("none.nc")));

	NcRecordFile file;
	EXPECT_THROW(file.Open(m_strPath), Exception);
}

TEST_F(NcRecordFileTest, VerticalDescriptorFollowsGridLink) {
	NcRecordFile file;
	file.Create(m_strPath);

	RecordMetadata meta = MakeFieldMeta("TT", 41394464, "Z", 2, 2);

	EXPECT_FALSE(file.GetVerticalDescriptor(meta).IsPresent());

	// An unrelated descriptor first, then the linked one
	VerticalDescriptor vdescOther;
	vdescOther.m_iVCode = 1001;
	RecordMetadata metaOther;
	DataArray2D<double> dTable;
	vdescOther.ToRecord(1, 2, metaOther, dTable);
	file.WriteRecord(metaOther, dTable);

	VerticalDescriptor vdesc;
	vdesc.m_iVCode = 5002;
	vdesc.m_dPRef = 100000.0;
	WriteVerticalDescriptorRecord(file, vdesc);

	EXPECT_EQ(5002, file.GetVerticalDescriptor(meta).m_iVCode);

	// Without a link no descriptor applies
	RecordMetadata metaL = MakeFieldMeta("TT", 41394464, "L", 2, 2);
	EXPECT_FALSE(file.GetVerticalDescriptor(metaL).IsPresent());
}

TEST_F(NcRecordFileTest, UnsupportedDescriptorIsReadAsStored) {
	NcRecordFile file;
	file.Create(m_strPath);

	VerticalDescriptor vdesc;
	vdesc.m_iVCode = 21001;
	WriteVerticalDescriptorRecord(file, vdesc);

	RecordMetadata meta = MakeFieldMeta("TT", 41394464, "Z", 2, 2);

	VerticalDescriptor vdescRead = file.GetVerticalDescriptor(meta);
	EXPECT_TRUE(vdescRead.IsPresent());
	EXPECT_EQ(21001, vdescRead.m_iVCode);
	EXPECT_EQ(0u, vdescRead.m_vecIp1.size());
}

///////////////////////////////////////////////////////////////////////////////

