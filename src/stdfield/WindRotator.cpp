///////////////////////////////////////////////////////////////////////////////
///
///	\file    WindRotator.cpp
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


#include "WindRotator.h"
#include "CoordTransforms.h"
#include "Constants.h"
#include "Defines.h"
#include "Announce.h"

#include <cmath>
#include <cfloat>

///////////////////////////////////////////////////////////////////////////////

bool WindRotator::GetRotationMatrix(
	const GridDescriptor & grid,
	size_t sRow,
	size_t sRows,
	double dR[3][3]
) {
	// Combined Yin-Yang grid: Yin rows first
	if (grid.m_fYinYang) {
		if ((!grid.m_pYin) || (!grid.m_pYang)) {
			_EXCEPTIONXT(Exception::MalformedYinYangGrid,
				"Yin-Yang grid is missing a sub-grid");
		}
		if ((sRows % 2) != 0) {
			_EXCEPTIONX1(Exception::MalformedYinYangGrid,
				"Yin-Yang field has an odd number of rows (%lu)", sRows);
		}
		if (sRow < sRows / 2) {
			return GetRotationMatrix(*(grid.m_pYin), sRow, sRows / 2, dR);
		} else {
			return GetRotationMatrix(
				*(grid.m_pYang), sRow - sRows / 2, sRows / 2, dR);
		}
	}

	if (grid.m_strGrTyp == "L") {
		return false;
	}

	if (grid.m_strGrTyp == "Z") {
		if (!grid.IsRotated()) {
			return false;
		}
		RotatedGridMatrix(
			grid.m_dXLat1, grid.m_dXLon1,
			grid.m_dXLat2, grid.m_dXLon2,
			dR);
		return true;
	}

	_EXCEPTION1("Cannot rotate winds on grid type \"%s\"",
		grid.m_strGrTyp.c_str());
}

///////////////////////////////////////////////////////////////////////////////

void WindRotator::Rotate(
	const DataArray3D<float> & dUU,
	const DataArray3D<float> & dVV,
	const DataArray2D<double> & dLat,
	const DataArray2D<double> & dLon,
	const GridDescriptor & grid,
	WindFieldsT<float> & wind
) {
	size_t sLevels = dUU.GetSize(0);
	size_t sRows = dUU.GetSize(1);
	size_t sColumns = dUU.GetSize(2);

	if ((dVV.GetSize(0) != sLevels) ||
	    (dVV.GetSize(1) != sRows) ||
	    (dVV.GetSize(2) != sColumns)
	) {
		_EXCEPTIONXT(Exception::InconsistentGridShape,
			"Wind components differ in shape");
	}
	if ((dLat.GetRows() != sRows) || (dLat.GetColumns() != sColumns) ||
	    (dLon.GetRows() != sRows) || (dLon.GetColumns() != sColumns)
	) {
		_EXCEPTIONX4(Exception::InconsistentGridShape,
			"Coordinates (%lu x %lu) do not match wind (%lu x %lu)",
			dLat.GetRows(), dLat.GetColumns(), sRows, sColumns);
	}

	wind.m_pUUWE.reset(new DataArray3D<float>(sLevels, sRows, sColumns));
	wind.m_pVVSN.reset(new DataArray3D<float>(sLevels, sRows, sColumns));
	wind.m_pUV.reset(new DataArray3D<float>(sLevels, sRows, sColumns));
	wind.m_pWD.reset(new DataArray3D<float>(sLevels, sRows, sColumns));
	wind.m_pYin.reset();
	wind.m_pYang.reset();

	DataArray3D<float> & dUUWE = *(wind.m_pUUWE);
	DataArray3D<float> & dVVSN = *(wind.m_pVVSN);
	DataArray3D<float> & dUV = *(wind.m_pUV);
	DataArray3D<float> & dWD = *(wind.m_pWD);

	for (size_t i = 0; i < sRows; i++) {
		double dR[3][3];
		bool fRotated = GetRotationMatrix(grid, i, sRows, dR);

		for (size_t j = 0; j < sColumns; j++) {
			double dLonRad = DegToRad(dLon(i,j));
			double dLatRad = DegToRad(dLat(i,j));

			// Position of the point on the rotated sphere
			double dLonRRad = dLonRad;
			double dLatRRad = dLatRad;
			if (fRotated) {
				double dXYZ[3];
				double dXYZr[3];
				RLLtoXYZ_Deg(dLon(i,j), dLat(i,j), dXYZ[0], dXYZ[1], dXYZ[2]);
				MatrixVectorProduct3(dR, dXYZ, dXYZr);

				double dLonRDeg;
				double dLatRDeg;
				XYZtoRLL_Deg(dXYZr[0], dXYZr[1], dXYZr[2], dLonRDeg, dLatRDeg);

				dLonRRad = DegToRad(dLonRDeg);
				dLatRRad = DegToRad(dLatRDeg);
			}

			for (size_t k = 0; k < sLevels; k++) {
				double dU = static_cast<double>(dUU(k,i,j));
				double dV = static_cast<double>(dVV(k,i,j));

				double dUlon = dU;
				double dUlat = dV;

				if (fRotated) {
					double dUr[3];
					VecTransRLL2DtoXYZ_Rad(
						dLonRRad, dLatRRad, dU, dV,
						dUr[0], dUr[1], dUr[2]);

					double dUg[3];
					MatrixVectorProduct3(dR, dUr, dUg, true);

					VecTransXYZtoRLL2D_Rad(
						dLonRad, dLatRad,
						dUg[0], dUg[1], dUg[2],
						dUlon, dUlat);
				}

				dUlon *= MetersPerSecondPerKnot;
				dUlat *= MetersPerSecondPerKnot;

				dUUWE(k,i,j) = static_cast<float>(dUlon);
				dVVSN(k,i,j) = static_cast<float>(dUlat);
				dUV(k,i,j) = static_cast<float>(sqrt(dU * dU + dV * dV));
				dWD(k,i,j) = static_cast<float>(
					RadToDeg(atan2(dUlon, dUlat)) + 180.0);
			}
		}
	}
}

///////////////////////////////////////////////////////////////////////////////

void WindRotator::ToSinglePrecision(
	const DataArray3D<double> & dIn,
	DataArray3D<float> & dOut
) {
	dOut.Allocate(dIn.GetSize(0), dIn.GetSize(1), dIn.GetSize(2));

	const double * pIn = dIn.GetData();
	float * pOut = dOut.GetData();

	for (size_t n = 0; n < dIn.GetTotalSize(); n++) {
		double dValue = pIn[n];

		if (!std::isfinite(dValue)) {
			_EXCEPTIONX1(Exception::PrecisionPolicyViolation,
				"Non-finite wind component at index %lu", n);
		}
		if (fabs(dValue) > static_cast<double>(FLT_MAX)) {
			_EXCEPTIONX2(Exception::PrecisionPolicyViolation,
				"Wind component %1.8e at index %lu is out of single "
				"precision range", dValue, n);
		}

		float flValue = static_cast<float>(dValue);

		double dError = fabs(static_cast<double>(flValue) - dValue);
		if (dError > SinglePrecisionTolerance * fabs(dValue)) {
			_EXCEPTIONX2(Exception::PrecisionPolicyViolation,
				"Wind component %1.8e at index %lu loses its magnitude in "
				"single precision", dValue, n);
		}

		pOut[n] = flValue;
	}
}

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Convert a single precision array back to double precision.
///	</summary>
static void ToDoublePrecision(
	const DataArray3D<float> & dIn,
	std::shared_ptr< DataArray3D<double> > & pOut
) {
	pOut.reset(new DataArray3D<double>(
		dIn.GetSize(0), dIn.GetSize(1), dIn.GetSize(2)));

	const float * pIn = dIn.GetData();
	double * pData = pOut->GetData();
	for (size_t n = 0; n < dIn.GetTotalSize(); n++) {
		pData[n] = static_cast<double>(pIn[n]);
	}
}

///////////////////////////////////////////////////////////////////////////////

void WindRotator::Rotate(
	const DataArray3D<double> & dUU,
	const DataArray3D<double> & dVV,
	const DataArray2D<double> & dLat,
	const DataArray2D<double> & dLon,
	const GridDescriptor & grid,
	WindFieldsT<double> & wind
) {
	Announce(1, "Converting double precision wind to single precision");

	DataArray3D<float> dUUsp;
	DataArray3D<float> dVVsp;

	ToSinglePrecision(dUU, dUUsp);
	ToSinglePrecision(dVV, dVVsp);

	WindFieldsT<float> windsp;
	Rotate(dUUsp, dVVsp, dLat, dLon, grid, windsp);

	ToDoublePrecision(*(windsp.m_pUUWE), wind.m_pUUWE);
	ToDoublePrecision(*(windsp.m_pVVSN), wind.m_pVVSN);
	ToDoublePrecision(*(windsp.m_pUV), wind.m_pUV);
	ToDoublePrecision(*(windsp.m_pWD), wind.m_pWD);
	wind.m_pYin.reset();
	wind.m_pYang.reset();
}

///////////////////////////////////////////////////////////////////////////////

void WindRotator::Rotate(
	const AssembledField & fieldUU,
	const AssembledField & fieldVV,
	WindFields & wind
) {
	if (fieldUU.IsYinYang() != fieldVV.IsYinYang()) {
		_EXCEPTIONXT(Exception::InconsistentGridShape,
			"Only one wind component is on a Yin-Yang grid");
	}

	if (fieldUU.IsYinYang()) {
		std::shared_ptr<WindFields> pYin(new WindFields);
		std::shared_ptr<WindFields> pYang(new WindFields);

		Rotate(*(fieldUU.m_pYin), *(fieldVV.m_pYin), *pYin);
		Rotate(*(fieldUU.m_pYang), *(fieldVV.m_pYang), *pYang);

		wind.m_pUUWE = pYin->m_pUUWE;
		wind.m_pVVSN = pYin->m_pVVSN;
		wind.m_pUV = pYin->m_pUV;
		wind.m_pWD = pYin->m_pWD;
		wind.m_pYin = pYin;
		wind.m_pYang = pYang;
		return;
	}

	if (!fieldUU.HasLatLon()) {
		_EXCEPTION1("Coordinates of \"%s\" are required to rotate winds",
			fieldUU.m_meta.m_strNomVar.c_str());
	}
	if (fieldUU.m_grid != fieldVV.m_grid) {
		_EXCEPTIONXT(Exception::InconsistentGridShape,
			"Wind components are not on the same grid");
	}

	Rotate(
		*(fieldUU.m_pValues),
		*(fieldVV.m_pValues),
		*(fieldUU.m_pLat),
		*(fieldUU.m_pLon),
		fieldUU.m_grid,
		wind);
}

///////////////////////////////////////////////////////////////////////////////

