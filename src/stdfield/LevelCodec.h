///////////////////////////////////////////////////////////////////////////////
///
///	\file    LevelCodec.h
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

#ifndef _LEVELCODEC_H_
#define _LEVELCODEC_H_

#include "DataArray2D.h"

#include <string>
#include <vector>

class RecordMetadata;

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Kind of vertical level carried by an ip1 code.
///	</summary>
enum LevelKind {
	LevelKind_Height = 0,
	LevelKind_Sigma = 1,
	LevelKind_Pressure = 2,
	LevelKind_Arbitrary = 3,
	LevelKind_HeightAGL = 4,
	LevelKind_Hybrid = 5,
	LevelKind_Theta = 6,
	LevelKind_Hours = 10,
	LevelKind_Index = 15
};

///	<summary>
///		Short name of a level kind ("m", "sg", "mb", ...).
///	</summary>
const char * LevelKindName(LevelKind eKind);

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		A vertical level: its ip1 code and the decoded value and kind.
///	</summary>
class LevelCode {

public:
	///	<summary>
	///		Default constructor.
	///	</summary>
	LevelCode() :
		m_iIp1(0),
		m_dValue(0.0),
		m_eKind(LevelKind_Pressure)
	{ }

	///	<summary>
	///		Constructor.
	///	</summary>
	LevelCode(
		int iIp1,
		double dValue,
		LevelKind eKind
	) :
		m_iIp1(iIp1),
		m_dValue(dValue),
		m_eKind(eKind)
	{ }

	///	<summary>
	///		Output as a string, for example "500 mb (41394464)".
	///	</summary>
	std::string ToString() const;

public:
	///	<summary>
	///		The encoded level.
	///	</summary>
	int m_iIp1;

	///	<summary>
	///		The decoded value.
	///	</summary>
	double m_dValue;

	///	<summary>
	///		The kind of level.
	///	</summary>
	LevelKind m_eKind;
};

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Vertical coordinate of a record file (the "!!" record).  The
///		descriptor is absent when m_iVCode is zero.
///	</summary>
class VerticalDescriptor {

public:
	///	<summary>
	///		Default constructor (absent descriptor).
	///	</summary>
	VerticalDescriptor() :
		m_iVCode(0),
		m_dPTop(0.0),
		m_dPRef(0.0),
		m_dRCoef1(0.0),
		m_dRCoef2(0.0)
	{ }

	///	<summary>
	///		True if a vertical coordinate is present.
	///	</summary>
	bool IsPresent() const {
		return (m_iVCode != 0);
	}

	///	<summary>
	///		True if the vertical coordinate code is one this codec knows.
	///	</summary>
	static bool IsSupportedVCode(int iVCode);

	///	<summary>
	///		Throw UnsupportedVerticalCoordinate if the descriptor is present
	///		with an unknown vertical coordinate code.
	///	</summary>
	void Validate() const;

	///	<summary>
	///		Index of the given ip1 in the level table, or (-1).
	///	</summary>
	int FindLevel(int iIp1) const;

	///	<summary>
	///		Populate this descriptor from a "!!" record and its payload,
	///		an nk x 3 table of (ip1, A, B).
	///	</summary>
	void FromRecord(
		const RecordMetadata & meta,
		const DataArray2D<double> & dTable
	);

	///	<summary>
	///		Write this descriptor as a "!!" record linked by (iIp1, iIp2).
	///	</summary>
	void ToRecord(
		int iIp1,
		int iIp2,
		RecordMetadata & meta,
		DataArray2D<double> & dTable
	) const;

public:
	///	<summary>
	///		Vertical coordinate code (1001 sigma, 2001 pressure, 5001-5005
	///		hybrid).
	///	</summary>
	int m_iVCode;

	///	<summary>
	///		Pressure at the model top (Pa).
	///	</summary>
	double m_dPTop;

	///	<summary>
	///		Reference pressure (Pa).
	///	</summary>
	double m_dPRef;

	///	<summary>
	///		Hybrid rectification coefficients.
	///	</summary>
	double m_dRCoef1;
	double m_dRCoef2;

	///	<summary>
	///		Level table.
	///	</summary>
	std::vector<int> m_vecIp1;
	std::vector<double> m_vecA;
	std::vector<double> m_vecB;
};

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Decoder for ip1 codes under the vertical coordinate of one file.
///	</summary>
class LevelCodec {

public:
	///	<summary>
	///		Constructor.  The descriptor is only needed to compute the
	///		pressure of sigma and hybrid levels, and is validated there.
	///	</summary>
	explicit LevelCodec(
		const VerticalDescriptor & vdesc = VerticalDescriptor()
	);

	///	<summary>
	///		Decode a level code.
	///	</summary>
	LevelCode Decode(int iIp1) const;

	///	<summary>
	///		Decode an ip1 code in either the old (<= 32767) or the new
	///		(kind / exponent / mantissa) encoding.
	///	</summary>
	static void DecodeIp1(
		int iIp1,
		double & dValue,
		LevelKind & eKind
	);

	///	<summary>
	///		Encode a value in the new ip1 encoding.
	///	</summary>
	static int Encode(
		double dValue,
		LevelKind eKind
	);

	///	<summary>
	///		Sort key of a level.  Keys increase with height above the
	///		surface, so that sorting ascending puts the lowest level first.
	///	</summary>
	static double OrderKey(const LevelCode & level);

	///	<summary>
	///		Pressure (hPa) at a level given the surface pressure dP0 (hPa).
	///		Throws UnsupportedVerticalCoordinate for sigma and hybrid levels
	///		under an unknown vertical coordinate code.
	///	</summary>
	double GetLevelPressure(
		const LevelCode & level,
		double dP0
	) const;

	///	<summary>
	///		Get the vertical descriptor.
	///	</summary>
	const VerticalDescriptor & GetVerticalDescriptor() const {
		return m_vdesc;
	}

protected:
	///	<summary>
	///		The vertical coordinate in use.
	///	</summary>
	VerticalDescriptor m_vdesc;
};

///////////////////////////////////////////////////////////////////////////////

#endif

