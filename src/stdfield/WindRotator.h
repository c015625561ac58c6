///////////////////////////////////////////////////////////////////////////////
///
///	\file    WindRotator.h
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


#ifndef _WINDROTATOR_H_
#define _WINDROTATOR_H_

#include "AssembledField.h"
#include "GridResolver.h"
#include "DataArray2D.h"
#include "DataArray3D.h"
#include "Exception.h"

#include <memory>
#include <typeinfo>

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Geographic wind derived from model-relative components.
///	</summary>
template <typename T>
class WindFieldsT {

public:
	///	<summary>
	///		True if the derived fields are present.
	///	</summary>
	bool IsPresent() const {
		return (m_pUUWE.get() != NULL);
	}

public:
	///	<summary>
	///		Zonal (west to east) and meridional (south to north)
	///		components (m/s).
	///	</summary>
	std::shared_ptr< DataArray3D<T> > m_pUUWE;
	std::shared_ptr< DataArray3D<T> > m_pVVSN;

	///	<summary>
	///		Modulus, in the units of the model-relative components.
	///	</summary>
	std::shared_ptr< DataArray3D<T> > m_pUV;

	///	<summary>
	///		Direction the wind is coming from (degrees).
	///	</summary>
	std::shared_ptr< DataArray3D<T> > m_pWD;

	///	<summary>
	///		Wind on the Yin and Yang panels.
	///	</summary>
	std::shared_ptr< WindFieldsT<T> > m_pYin;
	std::shared_ptr< WindFieldsT<T> > m_pYang;
};

typedef WindFieldsT<float> WindFields;

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Rotates model-relative wind components (knots) into geographic
///		components.  The rotation is only defined in single precision:
///		double precision input is converted to single precision with
///		checks and the result converted back.
///	</summary>
class WindRotator {

public:
	///	<summary>
	///		Rotate winds given in single precision.
	///	</summary>
	static void Rotate(
		const DataArray3D<float> & dUU,
		const DataArray3D<float> & dVV,
		const DataArray2D<double> & dLat,
		const DataArray2D<double> & dLon,
		const GridDescriptor & grid,
		WindFieldsT<float> & wind
	);

	///	<summary>
	///		Rotate winds given in double precision.  Throws
	///		PrecisionPolicyViolation if the input does not survive
	///		conversion to single precision.
	///	</summary>
	static void Rotate(
		const DataArray3D<double> & dUU,
		const DataArray3D<double> & dVV,
		const DataArray2D<double> & dLat,
		const DataArray2D<double> & dLon,
		const GridDescriptor & grid,
		WindFieldsT<double> & wind
	);

	///	<summary>
	///		Any other element type is rejected.
	///	</summary>
	template <typename T>
	static void Rotate(
		const DataArray3D<T> & dUU,
		const DataArray3D<T> & dVV,
		const DataArray2D<double> & dLat,
		const DataArray2D<double> & dLon,
		const GridDescriptor & grid,
		WindFieldsT<T> & wind
	) {
		_EXCEPTIONX1(Exception::PrecisionPolicyViolation,
			"Wind rotation is not defined for element type \"%s\"",
			typeid(T).name());
	}

	///	<summary>
	///		Rotate the wind of two assembled fields, which must carry
	///		latitude and longitude.  Yin-Yang fields are rotated panel by
	///		panel and the wind of the field shares the arrays of the wind
	///		of the Yin panel.
	///	</summary>
	static void Rotate(
		const AssembledField & fieldUU,
		const AssembledField & fieldVV,
		WindFields & wind
	);

	///	<summary>
	///		Convert an array to single precision.  Throws
	///		PrecisionPolicyViolation on non-finite values, values out of
	///		range and values whose magnitude is not preserved.
	///	</summary>
	static void ToSinglePrecision(
		const DataArray3D<double> & dIn,
		DataArray3D<float> & dOut
	);

protected:
	///	<summary>
	///		Rotation matrix that applies to a row of the grid.  Returns
	///		false if the grid is not rotated.
	///	</summary>
	static bool GetRotationMatrix(
		const GridDescriptor & grid,
		size_t sRow,
		size_t sRows,
		double dR[3][3]
	);
};

///////////////////////////////////////////////////////////////////////////////

#endif

