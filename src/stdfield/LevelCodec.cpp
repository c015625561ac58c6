///////////////////////////////////////////////////////////////////////////////
///
///	\file    LevelCodec.cpp
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
#include "Constants.h"
#include "Exception.h"

#include <cmath>
#include <cstdio>
#include <limits>

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Largest ip1 in the old encoding.
///	</summary>
static const int OldStyleIp1Max = 32767;

///	<summary>
///		Mantissa values above this carry a negative sign.
///	</summary>
static const int NegativeMantissaOffset = 1000000;

///////////////////////////////////////////////////////////////////////////////

const char * LevelKindName(LevelKind eKind) {
	switch (eKind) {
		case LevelKind_Height:
			return "m";
		case LevelKind_Sigma:
			return "sg";
		case LevelKind_Pressure:
			return "mb";
		case LevelKind_Arbitrary:
			return "arbitrary";
		case LevelKind_HeightAGL:
			return "M";
		case LevelKind_Hybrid:
			return "hy";
		case LevelKind_Theta:
			return "th";
		case LevelKind_Hours:
			return "H";
		case LevelKind_Index:
			return "index";
	}
	return "unknown";
}

///////////////////////////////////////////////////////////////////////////////
// LevelCode
///////////////////////////////////////////////////////////////////////////////

std::string LevelCode::ToString() const {
	char szBuffer[64];
	snprintf(szBuffer, 64, "%g %s (%i)",
		m_dValue, LevelKindName(m_eKind), m_iIp1);
	return std::string(szBuffer);
}

///////////////////////////////////////////////////////////////////////////////
// VerticalDescriptor
///////////////////////////////////////////////////////////////////////////////

bool VerticalDescriptor::IsSupportedVCode(int iVCode) {
	if ((iVCode == 1001) || (iVCode == 2001)) {
		return true;
	}
	if ((iVCode >= 5001) && (iVCode <= 5005)) {
		return true;
	}
	return false;
}

///////////////////////////////////////////////////////////////////////////////

void VerticalDescriptor::Validate() const {
	if (!IsPresent()) {
		return;
	}
	if (!IsSupportedVCode(m_iVCode)) {
		_EXCEPTIONX1(Exception::UnsupportedVerticalCoordinate,
			"Vertical coordinate code %i is not supported", m_iVCode);
	}
	if ((m_vecIp1.size() != m_vecA.size()) ||
	    (m_vecIp1.size() != m_vecB.size())
	) {
		_EXCEPTIONX1(Exception::UnsupportedVerticalCoordinate,
			"Vertical coordinate %i has an inconsistent level table",
			m_iVCode);
	}
}

///////////////////////////////////////////////////////////////////////////////

int VerticalDescriptor::FindLevel(int iIp1) const {
	for (size_t k = 0; k < m_vecIp1.size(); k++) {
		if (m_vecIp1[k] == iIp1) {
			return static_cast<int>(k);
		}
	}
	return (-1);
}

///////////////////////////////////////////////////////////////////////////////

void VerticalDescriptor::FromRecord(
	const RecordMetadata & meta,
	const DataArray2D<double> & dTable
) {
	m_iVCode = meta.m_iIg1;
	m_dPTop = meta.m_dXg1;
	m_dPRef = meta.m_dXg2;
	m_dRCoef1 = meta.m_dXg3;
	m_dRCoef2 = meta.m_dXg4;

	m_vecIp1.clear();
	m_vecA.clear();
	m_vecB.clear();

	if (dTable.GetTotalSize() != 0) {
		if (dTable.GetColumns() != 3) {
			_EXCEPTIONX1(Exception::UnsupportedVerticalCoordinate,
				"Vertical descriptor table has %lu columns (expected 3)",
				dTable.GetColumns());
		}
		for (size_t k = 0; k < dTable.GetRows(); k++) {
			if (dTable(k,0) < 0.0) {
				continue;
			}
			m_vecIp1.push_back(static_cast<int>(dTable(k,0)));
			m_vecA.push_back(dTable(k,1));
			m_vecB.push_back(dTable(k,2));
		}
	}
}

///////////////////////////////////////////////////////////////////////////////

void VerticalDescriptor::ToRecord(
	int iIp1,
	int iIp2,
	RecordMetadata & meta,
	DataArray2D<double> & dTable
) const {
	meta = RecordMetadata();
	meta.m_strNomVar = "!!";
	meta.m_strTypVar = "X";
	meta.m_strGrTyp = "X";
	meta.m_iIp1 = iIp1;
	meta.m_iIp2 = iIp2;
	meta.m_iIg1 = m_iVCode;
	meta.m_dXg1 = m_dPTop;
	meta.m_dXg2 = m_dPRef;
	meta.m_dXg3 = m_dRCoef1;
	meta.m_dXg4 = m_dRCoef2;

	if (m_vecIp1.size() == 0) {
		// Records cannot be empty; store a single row with no level
		dTable.Allocate(1, 3);
		dTable(0,0) = -1.0;
		return;
	}

	dTable.Allocate(m_vecIp1.size(), 3);
	for (size_t k = 0; k < m_vecIp1.size(); k++) {
		dTable(k,0) = static_cast<double>(m_vecIp1[k]);
		dTable(k,1) = m_vecA[k];
		dTable(k,2) = m_vecB[k];
	}
}

///////////////////////////////////////////////////////////////////////////////
// LevelCodec
///////////////////////////////////////////////////////////////////////////////

LevelCodec::LevelCodec(
	const VerticalDescriptor & vdesc
) :
	m_vdesc(vdesc)
{ }

///////////////////////////////////////////////////////////////////////////////

LevelCode LevelCodec::Decode(int iIp1) const {
	double dValue;
	LevelKind eKind;
	DecodeIp1(iIp1, dValue, eKind);
	return LevelCode(iIp1, dValue, eKind);
}

///////////////////////////////////////////////////////////////////////////////

void LevelCodec::DecodeIp1(
	int iIp1,
	double & dValue,
	LevelKind & eKind
) {
	if (iIp1 < 0) {
		_EXCEPTION1("Invalid level code %i", iIp1);
	}

	// New style encoding
	if (iIp1 > OldStyleIp1Max) {
		int iKind = (iIp1 >> 24) & 0xF;
		int iExp = (iIp1 >> 20) & 0xF;
		int iMantissa = iIp1 & 0xFFFFF;

		if (iMantissa > NegativeMantissaOffset) {
			iMantissa = - (iMantissa - NegativeMantissaOffset);
		}

		switch (iKind) {
			case LevelKind_Height:
			case LevelKind_Sigma:
			case LevelKind_Pressure:
			case LevelKind_Arbitrary:
			case LevelKind_HeightAGL:
			case LevelKind_Hybrid:
			case LevelKind_Theta:
			case LevelKind_Hours:
			case LevelKind_Index:
				eKind = static_cast<LevelKind>(iKind);
				break;
			default:
				_EXCEPTION2("Invalid level kind %i in level code %i",
					iKind, iIp1);
		}

		dValue = static_cast<double>(iMantissa)
			/ pow(10.0, static_cast<double>(iExp - 4));

		return;
	}

	// Old style encoding
	if (iIp1 <= 1100) {
		eKind = LevelKind_Pressure;
		dValue = static_cast<double>(iIp1);

	} else if (iIp1 < 2000) {
		eKind = LevelKind_Arbitrary;
		dValue = static_cast<double>(iIp1 - 1200);

	} else if (iIp1 <= 12000) {
		eKind = LevelKind_Sigma;
		dValue = static_cast<double>(iIp1 - 2000) / 10000.0;

	} else if (iIp1 <= 32000) {
		eKind = LevelKind_Height;
		dValue = static_cast<double>(iIp1 - 12001) * 5.0;

	} else {
		_EXCEPTION1("Level code %i is outside the old style encoding", iIp1);
	}
}

///////////////////////////////////////////////////////////////////////////////

int LevelCodec::Encode(
	double dValue,
	LevelKind eKind
) {
	if (!std::isfinite(dValue)) {
		_EXCEPTIONT("Cannot encode a non-finite level value");
	}

	int iExp = 4;
	double dTemp = dValue;

	if (fabs(dTemp) < 1.0e-6) {
		dTemp = 0.0;
	}

	// Negative mantissas are offset and must still fit in 20 bits
	double dMantissaMax = 1000000.0;
	if (dTemp < 0.0) {
		dMantissaMax = static_cast<double>(0xFFFFF - NegativeMantissaOffset);
	}

	while (fabs(dTemp) > dMantissaMax) {
		if (iExp == 0) {
			_EXCEPTION1("Level value %g is too large to encode", dValue);
		}
		dTemp /= 10.0;
		iExp--;
	}
	while ((dTemp != 0.0) &&
	       (fabs(dTemp) < 100000.0) &&
	       (fabs(dTemp) * 10.0 <= dMantissaMax) &&
	       (iExp < 15)
	) {
		dTemp *= 10.0;
		iExp++;
	}

	int iMantissa = static_cast<int>(floor(fabs(dTemp) + 0.5));
	if (iMantissa > static_cast<int>(dMantissaMax)) {
		_EXCEPTION1("Level value %g cannot be encoded", dValue);
	}
	if (dTemp < 0.0) {
		iMantissa += NegativeMantissaOffset;
	}

	return ((static_cast<int>(eKind) & 0xF) << 24)
		| (iExp << 20)
		| iMantissa;
}

///////////////////////////////////////////////////////////////////////////////

double LevelCodec::OrderKey(const LevelCode & level) {
	double dRatio;

	switch (level.m_eKind) {
		case LevelKind_Pressure:
			dRatio = level.m_dValue / EarthAtmosphericPressureHPa;
			break;

		case LevelKind_Sigma:
		case LevelKind_Hybrid:
			dRatio = level.m_dValue;
			break;

		default:
			return level.m_dValue;
	}

	// Zero pressure is the top of the atmosphere
	if (dRatio <= 0.0) {
		return std::numeric_limits<double>::max();
	}

	return - AtmosphericScaleHeight * log(dRatio);
}

///////////////////////////////////////////////////////////////////////////////

double LevelCodec::GetLevelPressure(
	const LevelCode & level,
	double dP0
) const {
	if (level.m_eKind == LevelKind_Pressure) {
		return level.m_dValue;
	}

	m_vdesc.Validate();

	if (level.m_eKind == LevelKind_Sigma) {
		if (m_vdesc.IsPresent() && (m_vdesc.m_iVCode != 1001)) {
			_EXCEPTIONX2(Exception::UnsupportedVerticalCoordinate,
				"Sigma level %i under vertical coordinate %i",
				level.m_iIp1, m_vdesc.m_iVCode);
		}
		return level.m_dValue * dP0;
	}

	if (level.m_eKind != LevelKind_Hybrid) {
		_EXCEPTIONX2(Exception::UnsupportedVerticalCoordinate,
			"Cannot compute pressure at level %i of kind %s",
			level.m_iIp1, LevelKindName(level.m_eKind));
	}

	if (!m_vdesc.IsPresent()) {
		_EXCEPTIONX1(Exception::UnsupportedVerticalCoordinate,
			"Hybrid level %i without vertical descriptor", level.m_iIp1);
	}

	int k = m_vdesc.FindLevel(level.m_iIp1);

	// Regular hybrid coordinate
	if (m_vdesc.m_iVCode == 5001) {
		if (k != (-1)) {
			return (m_vdesc.m_vecA[k] + m_vdesc.m_vecB[k] * dP0 * 100.0)
				/ 100.0;
		}

		double dEtaTop = m_vdesc.m_dPTop / m_vdesc.m_dPRef;
		double dEta = level.m_dValue;

		double dB = pow(
			(dEta - dEtaTop) / (1.0 - dEtaTop),
			m_vdesc.m_dRCoef1);
		double dA = m_vdesc.m_dPRef * (dEta - dB);

		return (dA + dB * dP0 * 100.0) / 100.0;
	}

	// Staggered log-pressure hybrid coordinates
	if ((m_vdesc.m_iVCode >= 5002) && (m_vdesc.m_iVCode <= 5005)) {
		if (k == (-1)) {
			_EXCEPTIONX2(Exception::UnsupportedVerticalCoordinate,
				"Level %i not found in vertical coordinate %i",
				level.m_iIp1, m_vdesc.m_iVCode);
		}
		return exp(m_vdesc.m_vecA[k] + m_vdesc.m_vecB[k]
			* log(dP0 * 100.0 / m_vdesc.m_dPRef)) / 100.0;
	}

	_EXCEPTIONX2(Exception::UnsupportedVerticalCoordinate,
		"Hybrid level %i under vertical coordinate %i",
		level.m_iIp1, m_vdesc.m_iVCode);
}

///////////////////////////////////////////////////////////////////////////////

