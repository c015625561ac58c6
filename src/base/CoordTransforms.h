///////////////////////////////////////////////////////////////////////////////
///
///	\file    CoordTransforms.h
///	\author  Paul Ullrich
///	\version October 18, 2026
///
///	<remarks>
///		Copyright 2000-2014 Paul Ullrich
///
///		This file is distributed as part of the Tempest source code package.
///		Permission is granted to use, copy, modify and distribute this
///		source code and its documentation under the terms of the GNU General
///		Public License.  This software is provided "as is" without express
///		or implied warranty.
///	</remarks>

#ifndef _COORDTRANSFORMS_H_
#define _COORDTRANSFORMS_H_

///////////////////////////////////////////////////////////////////////////////

#include <cmath>

#include "Defines.h"
#include "Exception.h"

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Convert radians to degrees.
///	</summary>
inline double RadToDeg(
	double dRad
) {
	return (dRad * 180.0 / M_PI);
}

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Convert degrees to radians.
///	</summary>
inline double DegToRad(
	double dDeg
) {
	return (dDeg * M_PI / 180.0);
}

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Translate a longitude value to the range [0,360)
///	</summary>
inline double LonDegToStandardRange(
	double dLonDeg
) {
	dLonDeg = (dLonDeg - 360.0 * floor(dLonDeg / 360.0));
	if ((dLonDeg < 0.0) || (dLonDeg >= 360.0)) {
		return 0.0;
	}
	return dLonDeg;
}

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Calculate 3D Cartesian coordinates from latitude and longitude,
///		in degrees.
///	</summary>
inline void RLLtoXYZ_Deg(
	double dLonDeg,
	double dLatDeg,
	double & dX,
	double & dY,
	double & dZ
) {
	if (fabs(dLatDeg) > 90.0 + HighTolerance) {
		_EXCEPTION1("Latitude out of range (%2.14f)", dLatDeg);
	}

	double dLonRad = DegToRad(dLonDeg);
	double dLatRad = DegToRad(dLatDeg);

	dX = cos(dLonRad) * cos(dLatRad);
	dY = sin(dLonRad) * cos(dLatRad);
	dZ = sin(dLatRad);
}

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Calculate latitude and longitude from normalized 3D Cartesian
///		coordinates, in degrees.  Longitude is returned in [0,360).
///	</summary>
inline void XYZtoRLL_Deg(
	double dX,
	double dY,
	double dZ,
	double & dLonDeg,
	double & dLatDeg
) {
	double dMag2 = dX * dX + dY * dY + dZ * dZ;

	if (fabs(dMag2 - 1.0) >= 0.01) {
		_EXCEPTION4("Grid point has non-unit magnitude: "
			"(%1.15e, %1.15e, %1.15e) (magnitude %1.15e)",
			dX, dY, dZ, dMag2);
	}

	double dMag = sqrt(dMag2);

	dX /= dMag;
	dY /= dMag;
	dZ /= dMag;

	if (fabs(dZ) < 1.0 - ReferenceTolerance) {
		dLonDeg = RadToDeg(atan2(dY, dX));
		dLatDeg = RadToDeg(asin(dZ));

		if (dLonDeg < 0.0) {
			dLonDeg += 360.0;
		}

	} else if (dZ > 0.0) {
		dLonDeg = 0.0;
		dLatDeg = 90.0;

	} else {
		dLonDeg = 0.0;
		dLatDeg = -90.0;
	}
}

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Convert a vector in RLL coordinates to XYZ.
///	</summary>
inline void VecTransRLL2DtoXYZ_Rad(
	double dLonRad,
	double dLatRad,
	double dUlon,
	double dUlat,
	double & dUx,
	double & dUy,
	double & dUz
) {
	double dSinLon = sin(dLonRad);
	double dCosLon = cos(dLonRad);
	double dSinLat = sin(dLatRad);
	double dCosLat = cos(dLatRad);

	dUx = - dSinLon * dUlon - dCosLon * dSinLat * dUlat;
	dUy =   dCosLon * dUlon - dSinLon * dSinLat * dUlat;
	dUz =                               dCosLat * dUlat;
}

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Project a vector in XYZ onto the local tangent plane at the given
///		point, giving its zonal and meridional components.
///	</summary>
inline void VecTransXYZtoRLL2D_Rad(
	double dLonRad,
	double dLatRad,
	double dUx,
	double dUy,
	double dUz,
	double & dUlon,
	double & dUlat
) {
	double dSinLon = sin(dLonRad);
	double dCosLon = cos(dLonRad);
	double dSinLat = sin(dLatRad);
	double dCosLat = cos(dLatRad);

	dUlon = - dSinLon * dUx + dCosLon * dUy;
	dUlat = - dSinLat * dCosLon * dUx - dSinLat * dSinLon * dUy
		+ dCosLat * dUz;
}

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Build the rotation matrix that takes geographic XYZ coordinates to
///		the XYZ coordinates of a rotated grid whose axis passes through
///		(dLat1, dLon1) and (dLat2, dLon2) (in degrees).  The inverse is the
///		transpose.
///	</summary>
inline void RotatedGridMatrix(
	double dLat1,
	double dLon1,
	double dLat2,
	double dLon2,
	double dR[3][3]
) {
	double dX1[3];
	double dX2[3];

	RLLtoXYZ_Deg(dLon1, dLat1, dX1[0], dX1[1], dX1[2]);
	RLLtoXYZ_Deg(dLon2, dLat2, dX2[0], dX2[1], dX2[2]);

	double dA = dX1[0] * dX2[0] + dX1[1] * dX2[1] + dX1[2] * dX2[2];

	double dC[3];
	dC[0] = dX1[1] * dX2[2] - dX2[1] * dX1[2];
	dC[1] = dX2[0] * dX1[2] - dX1[0] * dX2[2];
	dC[2] = dX1[0] * dX2[1] - dX2[0] * dX1[1];

	double dB = sqrt(dC[0] * dC[0] + dC[1] * dC[1] + dC[2] * dC[2]);

	if (dB < HighTolerance) {
		_EXCEPTION4("Degenerate rotated grid axis (%1.5f, %1.5f) "
			"(%1.5f, %1.5f)", dLat1, dLon1, dLat2, dLon2);
	}

	for (int j = 0; j < 3; j++) {
		dR[0][j] = (dA * dX1[j] - dX2[j]) / dB;
		dR[1][j] = dX1[j];
		dR[2][j] = dC[j] / dB;
	}
}

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Apply a 3x3 matrix (or its transpose) to a vector.
///	</summary>
inline void MatrixVectorProduct3(
	const double dR[3][3],
	const double dIn[3],
	double dOut[3],
	bool fTranspose = false
) {
	for (int i = 0; i < 3; i++) {
		dOut[i] = 0.0;
		for (int j = 0; j < 3; j++) {
			if (fTranspose) {
				dOut[i] += dR[j][i] * dIn[j];
			} else {
				dOut[i] += dR[i][j] * dIn[j];
			}
		}
	}
}

///////////////////////////////////////////////////////////////////////////////

#endif

