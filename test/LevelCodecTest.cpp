///////////////////////////////////////////////////////////////////////////////
///
///	\file    LevelCodecTest.cpp
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


#include "LevelCodec.h"
#include "RecordStore.h"
#include "TestRecordFiles.h"
#include "Exception.h"

#include <gtest/gtest.h>

#include <cmath>

///////////////////////////////////////////////////////////////////////////////

TEST(LevelCodecTest, DecodesNewStyleCodes) {
	LevelCodec codec;

	LevelCode level = codec.Decode(41394464);
	EXPECT_EQ(LevelKind_Pressure, level.m_eKind);
	EXPECT_DOUBLE_EQ(500.0, level.m_dValue);
	EXPECT_EQ(41394464, level.m_iIp1);

	level = codec.Decode(75597472);
	EXPECT_EQ(LevelKind_HeightAGL, level.m_eKind);
	EXPECT_DOUBLE_EQ(10.0, level.m_dValue);
}

TEST(LevelCodecTest, EncodesReferenceCodes) {
	EXPECT_EQ(41394464, LevelCodec::Encode(500.0, LevelKind_Pressure));
	EXPECT_EQ(75597472, LevelCodec::Encode(10.0, LevelKind_HeightAGL));
}

TEST(LevelCodecTest, EncodeThenDecodeKeepsValueAndKind) {
	const double dValues[4] = { 0.9737, 0.000125, 1013.25, 25000.0 };
	const LevelKind eKinds[4] = {
		LevelKind_Hybrid,
		LevelKind_Sigma,
		LevelKind_Pressure,
		LevelKind_Height };

	for (int n = 0; n < 4; n++) {
		double dValue;
		LevelKind eKind;
		LevelCodec::DecodeIp1(
			LevelCodec::Encode(dValues[n], eKinds[n]), dValue, eKind);

		EXPECT_EQ(eKinds[n], eKind);
		EXPECT_NEAR(dValues[n], dValue, 1.0e-5 * fabs(dValues[n]));
	}
}

TEST(LevelCodecTest, EncodesNegativeValues) {
	int iIp1 = LevelCodec::Encode(-5.0, LevelKind_Arbitrary);

	double dValue;
	LevelKind eKind;
	LevelCodec::DecodeIp1(iIp1, dValue, eKind);

	EXPECT_EQ(LevelKind_Arbitrary, eKind);
	EXPECT_DOUBLE_EQ(-5.0, dValue);
}

TEST(LevelCodecTest, EncodesZero) {
	double dValue;
	LevelKind eKind;
	LevelCodec::DecodeIp1(
		LevelCodec::Encode(0.0, LevelKind_HeightAGL), dValue, eKind);

	EXPECT_EQ(LevelKind_HeightAGL, eKind);
	EXPECT_DOUBLE_EQ(0.0, dValue);
}

TEST(LevelCodecTest, DecodesOldStyleCodes) {
	double dValue;
	LevelKind eKind;

	LevelCodec::DecodeIp1(500, dValue, eKind);
	EXPECT_EQ(LevelKind_Pressure, eKind);
	EXPECT_DOUBLE_EQ(500.0, dValue);

	LevelCodec::DecodeIp1(1203, dValue, eKind);
	EXPECT_EQ(LevelKind_Arbitrary, eKind);
	EXPECT_DOUBLE_EQ(3.0, dValue);

	LevelCodec::DecodeIp1(7000, dValue, eKind);
	EXPECT_EQ(LevelKind_Sigma, eKind);
	EXPECT_DOUBLE_EQ(0.5, dValue);

	LevelCodec::DecodeIp1(12003, dValue, eKind);
	EXPECT_EQ(LevelKind_Height, eKind);
	EXPECT_DOUBLE_EQ(10.0, dValue);
}

TEST(LevelCodecTest, RejectsInvalidCodes) {
	double dValue;
	LevelKind eKind;

	EXPECT_THROW(LevelCodec::DecodeIp1(-1, dValue, eKind), Exception);
	EXPECT_THROW(LevelCodec::DecodeIp1(32100, dValue, eKind), Exception);

	// Kind 7 is not assigned
	int iIp1 = (7 << 24) | (4 << 20) | 1;
	EXPECT_THROW(LevelCodec::DecodeIp1(iIp1, dValue, eKind), Exception);

	EXPECT_THROW(LevelCodec::Encode(NAN, LevelKind_Pressure), Exception);
}

TEST(LevelCodecTest, OrderKeyPutsLowestLevelFirst) {
	LevelCodec codec;

	double dKey800 = LevelCodec::OrderKey(
		codec.Decode(LevelCodec::Encode(800.0, LevelKind_Pressure)));
	double dKey500 = LevelCodec::OrderKey(codec.Decode(41394464));
	double dKey200 = LevelCodec::OrderKey(
		codec.Decode(LevelCodec::Encode(200.0, LevelKind_Pressure)));

	EXPECT_LT(dKey800, dKey500);
	EXPECT_LT(dKey500, dKey200);

	double dKeySurface = LevelCodec::OrderKey(
		codec.Decode(LevelCodec::Encode(1.0, LevelKind_Sigma)));
	double dKeyMid = LevelCodec::OrderKey(
		codec.Decode(LevelCodec::Encode(0.5, LevelKind_Sigma)));

	EXPECT_LT(dKeySurface, dKeyMid);

	double dKey10m = LevelCodec::OrderKey(codec.Decode(75597472));
	double dKey100m = LevelCodec::OrderKey(
		codec.Decode(LevelCodec::Encode(100.0, LevelKind_HeightAGL)));

	EXPECT_LT(dKey10m, dKey100m);
}

TEST(LevelCodecTest, PressureOfPressureAndSigmaLevels) {
	LevelCodec codec;

	EXPECT_DOUBLE_EQ(500.0,
		codec.GetLevelPressure(codec.Decode(41394464), 1000.0));

	LevelCode sigma = codec.Decode(
		LevelCodec::Encode(0.5, LevelKind_Sigma));
	EXPECT_NEAR(490.0, codec.GetLevelPressure(sigma, 980.0), 1.0e-6);
}

TEST(LevelCodecTest, PressureOfHeightLevelThrows) {
	LevelCodec codec;

	try {
		codec.GetLevelPressure(codec.Decode(75597472), 1000.0);
		FAIL() << "Expected an exception";

	} catch(Exception & e) {
		EXPECT_EQ(Exception::UnsupportedVerticalCoordinate, e.GetType());
	}
}

TEST(LevelCodecTest, HybridLevelRequiresDescriptor) {
	LevelCodec codec;

	LevelCode hybrid = codec.Decode(
		LevelCodec::Encode(0.9737, LevelKind_Hybrid));

	try {
		codec.GetLevelPressure(hybrid, 1000.0);
		FAIL() << "Expected an exception";

	} catch(Exception & e) {
		EXPECT_EQ(Exception::UnsupportedVerticalCoordinate, e.GetType());
	}
}

TEST(LevelCodecTest, RegularHybridAtSurfaceIsSurfacePressure) {
	VerticalDescriptor vdesc;
	vdesc.m_iVCode = 5001;
	vdesc.m_dPTop = 1000.0;
	vdesc.m_dPRef = 80000.0;
	vdesc.m_dRCoef1 = 1.6;

	LevelCodec codec(vdesc);

	LevelCode surface = codec.Decode(
		LevelCodec::Encode(1.0, LevelKind_Hybrid));

	EXPECT_NEAR(987.5, codec.GetLevelPressure(surface, 987.5), 1.0e-6);
}

TEST(LevelCodecTest, StaggeredHybridUsesLevelTable) {
	int iIp1Top = LevelCodec::Encode(0.5, LevelKind_Hybrid);
	int iIp1Bottom = LevelCodec::Encode(1.0, LevelKind_Hybrid);

	VerticalDescriptor vdesc;
	vdesc.m_iVCode = 5002;
	vdesc.m_dPRef = 100000.0;

	// Constant 500 hPa level and a terrain following level
	vdesc.m_vecIp1.push_back(iIp1Top);
	vdesc.m_vecA.push_back(log(50000.0));
	vdesc.m_vecB.push_back(0.0);

	vdesc.m_vecIp1.push_back(iIp1Bottom);
	vdesc.m_vecA.push_back(log(100000.0));
	vdesc.m_vecB.push_back(1.0);

	LevelCodec codec(vdesc);

	EXPECT_NEAR(500.0,
		codec.GetLevelPressure(codec.Decode(iIp1Top), 950.0), 1.0e-6);
	EXPECT_NEAR(950.0,
		codec.GetLevelPressure(codec.Decode(iIp1Bottom), 950.0), 1.0e-6);

	// Levels missing from the table cannot be computed
	LevelCode missing = codec.Decode(
		LevelCodec::Encode(0.75, LevelKind_Hybrid));
	EXPECT_THROW(codec.GetLevelPressure(missing, 950.0), Exception);

	// Sigma levels are not defined under a hybrid coordinate
	LevelCode sigma = codec.Decode(
		LevelCodec::Encode(0.5, LevelKind_Sigma));
	EXPECT_THROW(codec.GetLevelPressure(sigma, 950.0), Exception);
}

///////////////////////////////////////////////////////////////////////////////

TEST(VerticalDescriptorTest, SupportedCodes) {
	EXPECT_TRUE(VerticalDescriptor::IsSupportedVCode(1001));
	EXPECT_TRUE(VerticalDescriptor::IsSupportedVCode(2001));
	EXPECT_TRUE(VerticalDescriptor::IsSupportedVCode(5001));
	EXPECT_TRUE(VerticalDescriptor::IsSupportedVCode(5005));
	EXPECT_FALSE(VerticalDescriptor::IsSupportedVCode(5100));
	EXPECT_FALSE(VerticalDescriptor::IsSupportedVCode(21001));
}

TEST(VerticalDescriptorTest, UnsupportedCodeThrows) {
	VerticalDescriptor vdesc;
	vdesc.m_iVCode = 21001;

	EXPECT_EXCEPTION_TYPE(vdesc.Validate(),
		Exception::UnsupportedVerticalCoordinate);

	// Only levels that need the descriptor are affected
	LevelCodec codec(vdesc);

	LevelCode pressure = codec.Decode(41394464);
	EXPECT_DOUBLE_EQ(500.0, pressure.m_dValue);
	EXPECT_DOUBLE_EQ(500.0, codec.GetLevelPressure(pressure, 1000.0));

	LevelCode hybrid = codec.Decode(
		LevelCodec::Encode(0.5, LevelKind_Hybrid));
	EXPECT_EQ(LevelKind_Hybrid, hybrid.m_eKind);
	EXPECT_EXCEPTION_TYPE(codec.GetLevelPressure(hybrid, 1000.0),
		Exception::UnsupportedVerticalCoordinate);

	LevelCode sigma = codec.Decode(
		LevelCodec::Encode(0.5, LevelKind_Sigma));
	EXPECT_EXCEPTION_TYPE(codec.GetLevelPressure(sigma, 1000.0),
		Exception::UnsupportedVerticalCoordinate);
}

TEST(VerticalDescriptorTest, RecordKeepsLevelTable) {
	VerticalDescriptor vdesc;
	vdesc.m_iVCode = 5005;
	vdesc.m_dPTop = 10.0;
	vdesc.m_dPRef = 100000.0;
	vdesc.m_dRCoef1 = 3.0;
	vdesc.m_dRCoef2 = 15.0;
	vdesc.m_vecIp1.push_back(93423264);
	vdesc.m_vecA.push_back(8.5);
	vdesc.m_vecB.push_back(0.25);

	RecordMetadata meta;
	DataArray2D<double> dTable;
	vdesc.ToRecord(1100, 1200, meta, dTable);

	EXPECT_EQ("!!", meta.m_strNomVar);
	EXPECT_EQ(1100, meta.m_iIp1);
	EXPECT_EQ(1200, meta.m_iIp2);
	EXPECT_EQ(5005, meta.m_iIg1);

	VerticalDescriptor vdescRead;
	vdescRead.FromRecord(meta, dTable);

	EXPECT_EQ(5005, vdescRead.m_iVCode);
	EXPECT_DOUBLE_EQ(10.0, vdescRead.m_dPTop);
	EXPECT_DOUBLE_EQ(100000.0, vdescRead.m_dPRef);
	EXPECT_DOUBLE_EQ(3.0, vdescRead.m_dRCoef1);
	EXPECT_DOUBLE_EQ(15.0, vdescRead.m_dRCoef2);
	ASSERT_EQ(1u, vdescRead.m_vecIp1.size());
	EXPECT_EQ(0, vdescRead.FindLevel(93423264));
	EXPECT_EQ(-1, vdescRead.FindLevel(41394464));
	EXPECT_DOUBLE_EQ(8.5, vdescRead.m_vecA[0]);
	EXPECT_DOUBLE_EQ(0.25, vdescRead.m_vecB[0]);
}

TEST(VerticalDescriptorTest, RecordWithoutLevels) {
	VerticalDescriptor vdesc;
	vdesc.m_iVCode = 1001;

	RecordMetadata meta;
	DataArray2D<double> dTable;
	vdesc.ToRecord(0, 0, meta, dTable);

	EXPECT_EQ(1u, dTable.GetRows());

	VerticalDescriptor vdescRead;
	vdescRead.FromRecord(meta, dTable);

	EXPECT_EQ(1001, vdescRead.m_iVCode);
	EXPECT_EQ(0u, vdescRead.m_vecIp1.size());
}

///////////////////////////////////////////////////////////////////////////////

