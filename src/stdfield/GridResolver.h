///////////////////////////////////////////////////////////////////////////////
///
///	\file    GridResolver.h
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


#ifndef _GRIDRESOLVER_H_
#define _GRIDRESOLVER_H_

#include "RecordStore.h"
#include "DataArray2D.h"
#include "DataArray3D.h"
#include "Exception.h"

#include <string>
#include <vector>
#include <memory>

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Horizontal grid of a record.
///
///		Z grids are defined by a longitude axis record ">>" and a latitude
///		axis record "^^" whose ip1/ip2/ip3 equal the field's ig1/ig2/ig3.
///		The grtyp of the axis records is the reference grid: "L" for plain
///		axes, "E" for axes on a rotated sphere whose equator passes through
///		(xg1, xg2) and (xg3, xg4) of the ">>" record.
///
///		L grids are regular with (lat0, lon0, dlat, dlon) in xg1-xg4.
///
///		U grids are Yin-Yang grids.  The "^>" record, linked like the axis
///		records, is a single row holding the number of sub-grids (2), the
///		ni and nj of one sub-grid, then for the Yin and the Yang sub-grids
///		in turn xlat1, xlon1, xlat2, xlon2, ni longitudes and nj latitudes.
///		The field holds the Yin rows followed by the Yang rows.
///	</summary>
class GridDescriptor {

public:
	///	<summary>
	///		Constructor.
	///	</summary>
	GridDescriptor() :
		m_iIg1(0),
		m_iIg2(0),
		m_iIg3(0),
		m_iIg4(0),
		m_nNi(0),
		m_nNj(0),
		m_dXLat1(0.0),
		m_dXLon1(0.0),
		m_dXLat2(0.0),
		m_dXLon2(0.0),
		m_dLat0(0.0),
		m_dLon0(0.0),
		m_dDLat(0.0),
		m_dDLon(0.0),
		m_fYinYang(false)
	{ }

	///	<summary>
	///		Equality comparator.
	///	</summary>
	bool operator==(const GridDescriptor & grid) const;

	///	<summary>
	///		Inequality comparator.
	///	</summary>
	bool operator!=(const GridDescriptor & grid) const {
		return !((*this) == grid);
	}

	///	<summary>
	///		True if the grid axes are on a rotated sphere.
	///	</summary>
	bool IsRotated() const {
		return (m_strRefGrTyp == "E");
	}

	///	<summary>
	///		Output as a string, for diagnostics.
	///	</summary>
	std::string ToString() const;

public:
	///	<summary>
	///		Grid type and grid descriptors of the field.
	///	</summary>
	std::string m_strGrTyp;
	int m_iIg1;
	int m_iIg2;
	int m_iIg3;
	int m_iIg4;

	///	<summary>
	///		Number of columns and rows.
	///	</summary>
	int m_nNi;
	int m_nNj;

	///	<summary>
	///		Reference grid type of Z grids.
	///	</summary>
	std::string m_strRefGrTyp;

	///	<summary>
	///		Two points on the equator of a rotated grid (degrees).
	///	</summary>
	double m_dXLat1;
	double m_dXLon1;
	double m_dXLat2;
	double m_dXLon2;

	///	<summary>
	///		Longitude and latitude axes of Z grids (degrees).
	///	</summary>
	std::vector<double> m_vecAx;
	std::vector<double> m_vecAy;

	///	<summary>
	///		Origin and spacing of L grids (degrees).
	///	</summary>
	double m_dLat0;
	double m_dLon0;
	double m_dDLat;
	double m_dDLon;

	///	<summary>
	///		Yin-Yang flag and sub-grids.
	///	</summary>
	bool m_fYinYang;
	std::shared_ptr<GridDescriptor> m_pYin;
	std::shared_ptr<GridDescriptor> m_pYang;
};

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Split a field on a Yin-Yang grid along its rows.  The first half of
///		the rows is the Yin panel and the second half the Yang panel.
///	</summary>
template <typename T>
void SplitYinYang(
	const DataArray3D<T> & data,
	DataArray3D<T> & dataYin,
	DataArray3D<T> & dataYang
) {
	size_t sLevels = data.GetSize(0);
	size_t sRows = data.GetSize(1);
	size_t sColumns = data.GetSize(2);

	if ((sRows % 2) != 0) {
		_EXCEPTIONX1(Exception::MalformedYinYangGrid,
			"Yin-Yang field has an odd number of rows (%lu)", sRows);
	}

	size_t sHalf = sRows / 2;

	dataYin.Allocate(sLevels, sHalf, sColumns);
	dataYang.Allocate(sLevels, sHalf, sColumns);

	for (size_t k = 0; k < sLevels; k++) {
	for (size_t i = 0; i < sHalf; i++) {
	for (size_t j = 0; j < sColumns; j++) {
		dataYin(k,i,j) = data(k,i,j);
		dataYang(k,i,j) = data(k,sHalf+i,j);
	}
	}
	}
}

///	<summary>
///		Split a 2D array on a Yin-Yang grid along its rows.
///	</summary>
template <typename T>
void SplitYinYang(
	const DataArray2D<T> & data,
	DataArray2D<T> & dataYin,
	DataArray2D<T> & dataYang
) {
	size_t sRows = data.GetRows();
	size_t sColumns = data.GetColumns();

	if ((sRows % 2) != 0) {
		_EXCEPTIONX1(Exception::MalformedYinYangGrid,
			"Yin-Yang field has an odd number of rows (%lu)", sRows);
	}

	size_t sHalf = sRows / 2;

	dataYin.Allocate(sHalf, sColumns);
	dataYang.Allocate(sHalf, sColumns);

	for (size_t i = 0; i < sHalf; i++) {
	for (size_t j = 0; j < sColumns; j++) {
		dataYin(i,j) = data(i,j);
		dataYang(i,j) = data(sHalf+i,j);
	}
	}
}

///	<summary>
///		Stack the Yin and Yang panels of a field back into one array.
///	</summary>
template <typename T>
void CombineYinYang(
	const DataArray3D<T> & dataYin,
	const DataArray3D<T> & dataYang,
	DataArray3D<T> & data
) {
	size_t sLevels = dataYin.GetSize(0);
	size_t sHalf = dataYin.GetSize(1);
	size_t sColumns = dataYin.GetSize(2);

	if ((dataYang.GetSize(0) != sLevels) ||
	    (dataYang.GetSize(1) != sHalf) ||
	    (dataYang.GetSize(2) != sColumns)
	) {
		_EXCEPTIONX2(Exception::MalformedYinYangGrid,
			"Yin panel (%lu rows) and Yang panel (%lu rows) differ in shape",
			sHalf, dataYang.GetSize(1));
	}

	data.Allocate(sLevels, 2 * sHalf, sColumns);

	for (size_t k = 0; k < sLevels; k++) {
	for (size_t i = 0; i < sHalf; i++) {
	for (size_t j = 0; j < sColumns; j++) {
		data(k,i,j) = dataYin(k,i,j);
		data(k,sHalf+i,j) = dataYang(k,i,j);
	}
	}
	}
}

///	<summary>
///		Stack the Yin and Yang panels of a 2D array back into one array.
///	</summary>
template <typename T>
void CombineYinYang(
	const DataArray2D<T> & dataYin,
	const DataArray2D<T> & dataYang,
	DataArray2D<T> & data
) {
	size_t sHalf = dataYin.GetRows();
	size_t sColumns = dataYin.GetColumns();

	if ((dataYang.GetRows() != sHalf) || (dataYang.GetColumns() != sColumns)) {
		_EXCEPTIONX2(Exception::MalformedYinYangGrid,
			"Yin panel (%lu rows) and Yang panel (%lu rows) differ in shape",
			sHalf, dataYang.GetRows());
	}

	data.Allocate(2 * sHalf, sColumns);

	for (size_t i = 0; i < sHalf; i++) {
	for (size_t j = 0; j < sColumns; j++) {
		data(i,j) = dataYin(i,j);
		data(sHalf+i,j) = dataYang(i,j);
	}
	}
}

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Resolves the horizontal grid of records.
///	</summary>
class GridResolver {

public:
	///	<summary>
	///		Name of the grid descriptor records.
	///	</summary>
	static const char * AxisXName;
	static const char * AxisYName;
	static const char * YinYangName;

public:
	///	<summary>
	///		Resolve the grid of a set of records, which must all be on the
	///		same grid (InconsistentGridShape otherwise).
	///	</summary>
	static void Resolve(
		RecordStore & store,
		const std::vector<RecordMetadata> & vecRecords,
		GridDescriptor & grid
	);

	///	<summary>
	///		Resolve the grid of one record.
	///	</summary>
	static void Resolve(
		RecordStore & store,
		const RecordMetadata & meta,
		GridDescriptor & grid
	);

	///	<summary>
	///		Compute the latitude and longitude (degrees, longitude in
	///		[0, 360)) of every point of a grid.  For Yin-Yang grids the
	///		Yin rows come first.
	///	</summary>
	static void ComputeLatLon(
		const GridDescriptor & grid,
		DataArray2D<double> & dLat,
		DataArray2D<double> & dLon
	);

	///	<summary>
	///		Copy the grid descriptor records of a field from one store to
	///		another.  Returns the number of records copied.
	///	</summary>
	static int CopyGridRecords(
		RecordStore & storeFrom,
		const RecordMetadata & meta,
		RecordStore & storeTo
	);

protected:
	///	<summary>
	///		Find the grid descriptor record of the given name linked to a
	///		field, and read its payload as a single row.
	///	</summary>
	static void ReadLinkedRecord(
		RecordStore & store,
		const RecordMetadata & meta,
		const char * szName,
		RecordMetadata & metaLinked,
		std::vector<double> & vecData
	);

	///	<summary>
	///		Resolve a Z grid from its axis records.
	///	</summary>
	static void ResolveZ(
		RecordStore & store,
		const RecordMetadata & meta,
		GridDescriptor & grid
	);

	///	<summary>
	///		Resolve a U (Yin-Yang) grid from its "^>" record.
	///	</summary>
	static void ResolveU(
		RecordStore & store,
		const RecordMetadata & meta,
		GridDescriptor & grid
	);
};

///////////////////////////////////////////////////////////////////////////////

#endif

