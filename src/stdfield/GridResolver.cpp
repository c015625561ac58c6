///////////////////////////////////////////////////////////////////////////////
///
///	\file    GridResolver.cpp
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


#include "GridResolver.h"
#include "CoordTransforms.h"
#include "Announce.h"

#include <cmath>
#include <cstdio>

///////////////////////////////////////////////////////////////////////////////
// GridDescriptor
///////////////////////////////////////////////////////////////////////////////

bool GridDescriptor::operator==(const GridDescriptor & grid) const {
	if ((m_strGrTyp != grid.m_strGrTyp) ||
	    (m_iIg1 != grid.m_iIg1) ||
	    (m_iIg2 != grid.m_iIg2) ||
	    (m_iIg3 != grid.m_iIg3) ||
	    (m_iIg4 != grid.m_iIg4) ||
	    (m_nNi != grid.m_nNi) ||
	    (m_nNj != grid.m_nNj) ||
	    (m_strRefGrTyp != grid.m_strRefGrTyp)
	) {
		return false;
	}

	if ((m_dXLat1 != grid.m_dXLat1) ||
	    (m_dXLon1 != grid.m_dXLon1) ||
	    (m_dXLat2 != grid.m_dXLat2) ||
	    (m_dXLon2 != grid.m_dXLon2) ||
	    (m_dLat0 != grid.m_dLat0) ||
	    (m_dLon0 != grid.m_dLon0) ||
	    (m_dDLat != grid.m_dDLat) ||
	    (m_dDLon != grid.m_dDLon)
	) {
		return false;
	}

	if ((m_vecAx != grid.m_vecAx) || (m_vecAy != grid.m_vecAy)) {
		return false;
	}

	if (m_fYinYang != grid.m_fYinYang) {
		return false;
	}
	if (m_fYinYang) {
		if ((!m_pYin) || (!m_pYang) ||
		    (!grid.m_pYin) || (!grid.m_pYang)
		) {
			return ((m_pYin == grid.m_pYin) && (m_pYang == grid.m_pYang));
		}
		return ((*m_pYin == *(grid.m_pYin)) && (*m_pYang == *(grid.m_pYang)));
	}

	return true;
}

///////////////////////////////////////////////////////////////////////////////

std::string GridDescriptor::ToString() const {
	char szBuffer[256];
	snprintf(szBuffer, 256, "%s%s%s (%i x %i) ig=(%i,%i,%i,%i)%s",
		m_strGrTyp.c_str(),
		(m_strRefGrTyp == "")?(""):("/"),
		m_strRefGrTyp.c_str(),
		m_nNj, m_nNi,
		m_iIg1, m_iIg2, m_iIg3, m_iIg4,
		(m_fYinYang)?(" yin-yang"):(""));
	return std::string(szBuffer);
}

///////////////////////////////////////////////////////////////////////////////
// GridResolver
///////////////////////////////////////////////////////////////////////////////

const char * GridResolver::AxisXName = ">>";

const char * GridResolver::AxisYName = "^^";

const char * GridResolver::YinYangName = "^>";

///////////////////////////////////////////////////////////////////////////////

void GridResolver::ReadLinkedRecord(
	RecordStore & store,
	const RecordMetadata & meta,
	const char * szName,
	RecordMetadata & metaLinked,
	std::vector<double> & vecData
) {
	RecordSearch search(szName);
	search.m_iIp1 = meta.m_iIg1;
	search.m_iIp2 = meta.m_iIg2;
	search.m_iIp3 = meta.m_iIg3;

	std::vector<RecordMetadata> vecLinked;
	store.FindRecords(search, vecLinked);

	if (vecLinked.size() == 0) {
		_EXCEPTIONX4(Exception::NoMatchingRecord,
			"Grid record \"%s\" with ip1/ip2/ip3 = %i/%i/%i not found",
			szName, meta.m_iIg1, meta.m_iIg2, meta.m_iIg3);
	}
	if (vecLinked.size() > 1) {
		Announce("WARNING: %lu grid records \"%s\" linked to \"%s\"; "
			"using the first", vecLinked.size(), szName,
			meta.m_strNomVar.c_str());
	}

	metaLinked = vecLinked[0];

	DataArray2D<double> data;
	store.ReadRecord(metaLinked, data);

	if ((data.GetRows() != 1) && (data.GetColumns() != 1)) {
		_EXCEPTIONX3(Exception::InconsistentGridShape,
			"Grid record \"%s\" must be one dimensional (found %lu x %lu)",
			szName, data.GetRows(), data.GetColumns());
	}

	vecData.resize(data.GetTotalSize());
	for (size_t i = 0; i < vecData.size(); i++) {
		vecData[i] = data.GetData()[i];
	}
}

///////////////////////////////////////////////////////////////////////////////

void GridResolver::ResolveZ(
	RecordStore & store,
	const RecordMetadata & meta,
	GridDescriptor & grid
) {
	RecordMetadata metaAx;
	RecordMetadata metaAy;

	ReadLinkedRecord(store, meta, AxisXName, metaAx, grid.m_vecAx);
	ReadLinkedRecord(store, meta, AxisYName, metaAy, grid.m_vecAy);

	if (grid.m_vecAx.size() != static_cast<size_t>(meta.m_nNi)) {
		_EXCEPTIONX3(Exception::InconsistentGridShape,
			"Grid record \"%s\" has %lu values but field has %i columns",
			AxisXName, grid.m_vecAx.size(), meta.m_nNi);
	}
	if (grid.m_vecAy.size() != static_cast<size_t>(meta.m_nNj)) {
		_EXCEPTIONX3(Exception::InconsistentGridShape,
			"Grid record \"%s\" has %lu values but field has %i rows",
			AxisYName, grid.m_vecAy.size(), meta.m_nNj);
	}

	grid.m_strRefGrTyp = metaAx.m_strGrTyp;

	if (grid.m_strRefGrTyp == "E") {
		grid.m_dXLat1 = metaAx.m_dXg1;
		grid.m_dXLon1 = metaAx.m_dXg2;
		grid.m_dXLat2 = metaAx.m_dXg3;
		grid.m_dXLon2 = metaAx.m_dXg4;

	} else if (grid.m_strRefGrTyp != "L") {
		_EXCEPTION1("Unsupported reference grid type \"%s\" of Z grid",
			grid.m_strRefGrTyp.c_str());
	}
}

///////////////////////////////////////////////////////////////////////////////

void GridResolver::ResolveU(
	RecordStore & store,
	const RecordMetadata & meta,
	GridDescriptor & grid
) {
	if ((meta.m_nNj % 2) != 0) {
		_EXCEPTIONX2(Exception::MalformedYinYangGrid,
			"Yin-Yang field \"%s\" has an odd number of rows (%i)",
			meta.m_strNomVar.c_str(), meta.m_nNj);
	}

	RecordMetadata metaYY;
	std::vector<double> vecYY;
	ReadLinkedRecord(store, meta, YinYangName, metaYY, vecYY);

	if (vecYY.size() < 3) {
		_EXCEPTIONX1(Exception::MalformedYinYangGrid,
			"Grid record \"%s\" is truncated", YinYangName);
	}

	int nSubGrids = static_cast<int>(vecYY[0]);
	int nSubNi = static_cast<int>(vecYY[1]);
	int nSubNj = static_cast<int>(vecYY[2]);

	if (nSubGrids != 2) {
		_EXCEPTIONX2(Exception::MalformedYinYangGrid,
			"Grid record \"%s\" describes %i sub-grids (expected 2)",
			YinYangName, nSubGrids);
	}
	if ((nSubNi != meta.m_nNi) || (2 * nSubNj != meta.m_nNj)) {
		_EXCEPTIONX4(Exception::MalformedYinYangGrid,
			"Yin-Yang sub-grids (%i x %i) do not tile the field (%i x %i)",
			nSubNj, nSubNi, meta.m_nNj, meta.m_nNi);
	}

	size_t sSubGridSize = 4 + nSubNi + nSubNj;
	if (vecYY.size() != 3 + 2 * sSubGridSize) {
		_EXCEPTIONX2(Exception::MalformedYinYangGrid,
			"Grid record \"%s\" has %lu values", YinYangName, vecYY.size());
	}

	grid.m_fYinYang = true;

	for (int s = 0; s < 2; s++) {
		std::shared_ptr<GridDescriptor> pSubGrid(new GridDescriptor);

		const double * dSub = &(vecYY[3 + s * sSubGridSize]);

		pSubGrid->m_strGrTyp = "Z";
		pSubGrid->m_strRefGrTyp = "E";
		pSubGrid->m_nNi = nSubNi;
		pSubGrid->m_nNj = nSubNj;
		pSubGrid->m_dXLat1 = dSub[0];
		pSubGrid->m_dXLon1 = dSub[1];
		pSubGrid->m_dXLat2 = dSub[2];
		pSubGrid->m_dXLon2 = dSub[3];
		pSubGrid->m_vecAx.assign(dSub + 4, dSub + 4 + nSubNi);
		pSubGrid->m_vecAy.assign(dSub + 4 + nSubNi, dSub + 4 + nSubNi + nSubNj);

		if (s == 0) {
			grid.m_pYin = pSubGrid;
		} else {
			grid.m_pYang = pSubGrid;
		}
	}
}

///////////////////////////////////////////////////////////////////////////////

void GridResolver::Resolve(
	RecordStore & store,
	const RecordMetadata & meta,
	GridDescriptor & grid
) {
	grid = GridDescriptor();

	grid.m_strGrTyp = meta.m_strGrTyp;
	grid.m_iIg1 = meta.m_iIg1;
	grid.m_iIg2 = meta.m_iIg2;
	grid.m_iIg3 = meta.m_iIg3;
	grid.m_iIg4 = meta.m_iIg4;
	grid.m_nNi = meta.m_nNi;
	grid.m_nNj = meta.m_nNj;

	if (meta.m_strGrTyp == "Z") {
		ResolveZ(store, meta, grid);

	} else if (meta.m_strGrTyp == "L") {
		grid.m_dLat0 = meta.m_dXg1;
		grid.m_dLon0 = meta.m_dXg2;
		grid.m_dDLat = meta.m_dXg3;
		grid.m_dDLon = meta.m_dXg4;

	} else if (meta.m_strGrTyp == "U") {
		ResolveU(store, meta, grid);

	} else {
		Announce(1, "Grid type \"%s\" of \"%s\" has no coordinates",
			meta.m_strGrTyp.c_str(), meta.m_strNomVar.c_str());
	}

	Announce(2, "Resolved grid %s", grid.ToString().c_str());
}

///////////////////////////////////////////////////////////////////////////////

void GridResolver::Resolve(
	RecordStore & store,
	const std::vector<RecordMetadata> & vecRecords,
	GridDescriptor & grid
) {
	if (vecRecords.size() == 0) {
		_EXCEPTIONXT(Exception::NoMatchingRecord,
			"No records to resolve the grid of");
	}

	for (size_t r = 1; r < vecRecords.size(); r++) {
		if (!vecRecords[r].SameGridAs(vecRecords[0])) {
			_EXCEPTIONX4(Exception::InconsistentGridShape,
				"Record at ip1 %i (%i x %i) is not on the grid of ip1 %i",
				vecRecords[r].m_iIp1,
				vecRecords[r].m_nNj,
				vecRecords[r].m_nNi,
				vecRecords[0].m_iIp1);
		}
	}

	Resolve(store, vecRecords[0], grid);
}

///////////////////////////////////////////////////////////////////////////////

void GridResolver::ComputeLatLon(
	const GridDescriptor & grid,
	DataArray2D<double> & dLat,
	DataArray2D<double> & dLon
) {
	// Yin-Yang grids
	if (grid.m_fYinYang) {
		if ((!grid.m_pYin) || (!grid.m_pYang)) {
			_EXCEPTIONXT(Exception::MalformedYinYangGrid,
				"Yin-Yang grid is missing a sub-grid");
		}

		DataArray2D<double> dLatYin;
		DataArray2D<double> dLonYin;
		DataArray2D<double> dLatYang;
		DataArray2D<double> dLonYang;

		ComputeLatLon(*(grid.m_pYin), dLatYin, dLonYin);
		ComputeLatLon(*(grid.m_pYang), dLatYang, dLonYang);

		if ((dLatYin.GetRows() != dLatYang.GetRows()) ||
		    (dLatYin.GetColumns() != dLatYang.GetColumns())
		) {
			_EXCEPTIONXT(Exception::MalformedYinYangGrid,
				"Yin and Yang sub-grids differ in shape");
		}

		size_t sHalf = dLatYin.GetRows();
		size_t sColumns = dLatYin.GetColumns();

		dLat.Allocate(2 * sHalf, sColumns);
		dLon.Allocate(2 * sHalf, sColumns);

		for (size_t i = 0; i < sHalf; i++) {
		for (size_t j = 0; j < sColumns; j++) {
			dLat(i,j) = dLatYin(i,j);
			dLon(i,j) = dLonYin(i,j);
			dLat(sHalf+i,j) = dLatYang(i,j);
			dLon(sHalf+i,j) = dLonYang(i,j);
		}
		}
		return;
	}

	// Regular latitude-longitude grids
	if (grid.m_strGrTyp == "L") {
		dLat.Allocate(grid.m_nNj, grid.m_nNi);
		dLon.Allocate(grid.m_nNj, grid.m_nNi);

		for (int i = 0; i < grid.m_nNj; i++) {
		for (int j = 0; j < grid.m_nNi; j++) {
			dLat(i,j) = grid.m_dLat0 + static_cast<double>(i) * grid.m_dDLat;
			dLon(i,j) = LonDegToStandardRange(
				grid.m_dLon0 + static_cast<double>(j) * grid.m_dDLon);
		}
		}
		return;
	}

	if (grid.m_strGrTyp != "Z") {
		_EXCEPTION1("Cannot compute coordinates of grid type \"%s\"",
			grid.m_strGrTyp.c_str());
	}

	size_t sRows = grid.m_vecAy.size();
	size_t sColumns = grid.m_vecAx.size();

	dLat.Allocate(sRows, sColumns);
	dLon.Allocate(sRows, sColumns);

	// Z grid with plain axes
	if (!grid.IsRotated()) {
		for (size_t i = 0; i < sRows; i++) {
		for (size_t j = 0; j < sColumns; j++) {
			dLat(i,j) = grid.m_vecAy[i];
			dLon(i,j) = LonDegToStandardRange(grid.m_vecAx[j]);
		}
		}
		return;
	}

	// Z grid on a rotated sphere; the transpose of the rotation matrix
	// takes rotated coordinates back to geographic coordinates
	double dR[3][3];
	RotatedGridMatrix(
		grid.m_dXLat1, grid.m_dXLon1,
		grid.m_dXLat2, grid.m_dXLon2,
		dR);

	for (size_t i = 0; i < sRows; i++) {
	for (size_t j = 0; j < sColumns; j++) {
		double dXYZr[3];
		RLLtoXYZ_Deg(
			grid.m_vecAx[j], grid.m_vecAy[i],
			dXYZr[0], dXYZr[1], dXYZr[2]);

		double dXYZ[3];
		MatrixVectorProduct3(dR, dXYZr, dXYZ, true);

		XYZtoRLL_Deg(
			dXYZ[0], dXYZ[1], dXYZ[2],
			dLon(i,j), dLat(i,j));
	}
	}
}

///////////////////////////////////////////////////////////////////////////////

int GridResolver::CopyGridRecords(
	RecordStore & storeFrom,
	const RecordMetadata & meta,
	RecordStore & storeTo
) {
	const char * szNames[3] = { AxisXName, AxisYName, YinYangName };

	int nCopied = 0;
	for (int n = 0; n < 3; n++) {
		RecordSearch search(szNames[n]);
		search.m_iIp1 = meta.m_iIg1;
		search.m_iIp2 = meta.m_iIg2;
		search.m_iIp3 = meta.m_iIg3;

		std::vector<RecordMetadata> vecLinked;
		storeFrom.FindRecords(search, vecLinked);

		for (size_t r = 0; r < vecLinked.size(); r++) {
			DataArray2D<double> data;
			storeFrom.ReadRecord(vecLinked[r], data);

			RecordMetadata metaCopy = vecLinked[r];
			storeTo.WriteRecord(metaCopy, data);
			nCopied++;
		}
	}
	return nCopied;
}

///////////////////////////////////////////////////////////////////////////////

