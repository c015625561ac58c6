///////////////////////////////////////////////////////////////////////////////
///
///	\file    FieldAssembler.cpp
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
#include "GridResolver.h"
#include "Announce.h"
#include "Exception.h"

#include <algorithm>
#include <cstring>
#include <set>

///////////////////////////////////////////////////////////////////////////////

const char * FieldAssembler::SurfacePressureName = "P0";

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Comparator putting the lowest level first.
///	</summary>
class LevelOrderComparator {

public:
	LevelOrderComparator(
		const std::vector<double> & vecKeys
	) :
		m_vecKeys(vecKeys)
	{ }

	bool operator()(size_t a, size_t b) const {
		return (m_vecKeys[a] < m_vecKeys[b]);
	}

protected:
	const std::vector<double> & m_vecKeys;
};

///////////////////////////////////////////////////////////////////////////////

void FieldAssembler::CheckRecords(
	const std::vector<RecordMetadata> & vecRecords
) {
	if (vecRecords.size() == 0) {
		_EXCEPTIONXT(Exception::NoMatchingRecord,
			"No records to assemble");
	}

	const RecordMetadata & metaRef = vecRecords[0];

	std::set<int> setIp1;
	setIp1.insert(metaRef.m_iIp1);

	for (size_t r = 1; r < vecRecords.size(); r++) {
		const RecordMetadata & meta = vecRecords[r];

		if (!meta.SameGridAs(metaRef)) {
			_EXCEPTIONX4(Exception::InconsistentGridShape,
				"Level %i of \"%s\" has shape (%i x %i) on another grid",
				meta.m_iIp1, meta.m_strNomVar.c_str(),
				meta.m_nNj, meta.m_nNi);
		}
		if (!meta.SameFieldAs(metaRef)) {
			_EXCEPTION2("Records at levels %i and %i differ in more than "
				"their level", metaRef.m_iIp1, meta.m_iIp1);
		}
		if (setIp1.find(meta.m_iIp1) != setIp1.end()) {
			_EXCEPTION2("Level %i of \"%s\" appears more than once",
				meta.m_iIp1, meta.m_strNomVar.c_str());
		}
		setIp1.insert(meta.m_iIp1);
	}
}

///////////////////////////////////////////////////////////////////////////////

RecordMetadata FieldAssembler::FindSurfacePressure(
	const RecordStore & store,
	const RecordMetadata & meta
) {
	RecordSearch search(SurfacePressureName);
	search.m_lDateV = meta.m_lDateV;

	std::vector<RecordMetadata> vecP0;
	store.FindRecords(search, vecP0);

	for (size_t r = 0; r < vecP0.size(); r++) {
		if (vecP0[r].SameGridAs(meta)) {
			return vecP0[r];
		}
	}

	if (vecP0.size() != 0) {
		_EXCEPTIONX2(Exception::InconsistentGridShape,
			"\"%s\" at stamp %li is not on the grid of the field",
			SurfacePressureName, meta.m_lDateV);
	}

	_EXCEPTIONX2(Exception::NoMatchingRecord,
		"No \"%s\" record at stamp %li",
		SurfacePressureName, meta.m_lDateV);
}

///////////////////////////////////////////////////////////////////////////////

void FieldAssembler::AttachPressure(
	RecordStore & store,
	AssembledField & field
) {
	size_t sLevels = field.m_pValues->GetSize(0);
	size_t sRows = field.m_pValues->GetSize(1);
	size_t sColumns = field.m_pValues->GetSize(2);

	field.m_pPressure.reset(new DataArray3D<float>(sLevels, sRows, sColumns));
	DataArray3D<float> & dPressure = *(field.m_pPressure);

	// Surface pressure is not needed on pressure levels
	bool fNeedsP0 = false;
	for (size_t k = 0; k < sLevels; k++) {
		if (field.m_vecLevels[k].m_eKind != LevelKind_Pressure) {
			fNeedsP0 = true;
		}
	}

	// Vertical coordinate linked to the field through ig1/ig2
	LevelCodec codec;

	DataArray2D<double> dP0;
	if (fNeedsP0) {
		codec = LevelCodec(store.GetVerticalDescriptor(field.m_meta));

		RecordMetadata metaP0 = FindSurfacePressure(store, field.m_meta);
		store.ReadRecord(metaP0, dP0);
	}

	for (size_t k = 0; k < sLevels; k++) {
	for (size_t i = 0; i < sRows; i++) {
	for (size_t j = 0; j < sColumns; j++) {
		double dSurface = (fNeedsP0)?(dP0(i,j)):(0.0);
		dPressure(k,i,j) = static_cast<float>(
			codec.GetLevelPressure(field.m_vecLevels[k], dSurface));
	}
	}
	}
}

///////////////////////////////////////////////////////////////////////////////

void FieldAssembler::SplitPanels(
	AssembledField & field
) {
	const GridDescriptor & grid = field.m_grid;

	if ((!grid.m_pYin) || (!grid.m_pYang)) {
		_EXCEPTIONXT(Exception::MalformedYinYangGrid,
			"Yin-Yang grid is missing a sub-grid");
	}

	std::shared_ptr<AssembledField> pYin(new AssembledField);
	std::shared_ptr<AssembledField> pYang(new AssembledField);

	pYin->m_meta = field.m_meta;
	pYin->m_meta.m_nNj = field.m_meta.m_nNj / 2;
	pYin->m_grid = *(grid.m_pYin);
	pYin->m_vecLevels = field.m_vecLevels;

	pYang->m_meta = pYin->m_meta;
	pYang->m_grid = *(grid.m_pYang);
	pYang->m_vecLevels = field.m_vecLevels;

	pYin->m_pValues.reset(new DataArray3D<float>);
	pYang->m_pValues.reset(new DataArray3D<float>);
	SplitYinYang(*(field.m_pValues), *(pYin->m_pValues), *(pYang->m_pValues));

	if (field.HasLatLon()) {
		pYin->m_pLat.reset(new DataArray2D<double>);
		pYin->m_pLon.reset(new DataArray2D<double>);
		pYang->m_pLat.reset(new DataArray2D<double>);
		pYang->m_pLon.reset(new DataArray2D<double>);
		SplitYinYang(*(field.m_pLat), *(pYin->m_pLat), *(pYang->m_pLat));
		SplitYinYang(*(field.m_pLon), *(pYin->m_pLon), *(pYang->m_pLon));
	}

	if (field.HasPressure()) {
		pYin->m_pPressure.reset(new DataArray3D<float>);
		pYang->m_pPressure.reset(new DataArray3D<float>);
		SplitYinYang(
			*(field.m_pPressure),
			*(pYin->m_pPressure),
			*(pYang->m_pPressure));
	}

	// The default view shares the arrays of the Yin panel
	field.m_pValues = pYin->m_pValues;
	field.m_pLat = pYin->m_pLat;
	field.m_pLon = pYin->m_pLon;
	field.m_pPressure = pYin->m_pPressure;

	field.m_pYin = pYin;
	field.m_pYang = pYang;
}

///////////////////////////////////////////////////////////////////////////////

void FieldAssembler::Assemble(
	RecordStore & store,
	const std::vector<RecordMetadata> & vecRecords,
	const AssemblyOptions & opts,
	AssembledField & field
) {
	CheckRecords(vecRecords);

	field = AssembledField();
	field.m_meta = vecRecords[0];

	// Level codes decode without the vertical coordinate
	LevelCodec codec;

	std::vector<LevelCode> vecLevels(vecRecords.size());
	std::vector<double> vecKeys(vecRecords.size());
	std::vector<size_t> vecOrder(vecRecords.size());

	for (size_t r = 0; r < vecRecords.size(); r++) {
		vecLevels[r] = codec.Decode(vecRecords[r].m_iIp1);
		vecKeys[r] = LevelCodec::OrderKey(vecLevels[r]);
		vecOrder[r] = r;
	}

	if (!opts.m_fPreserveOrder) {
		std::stable_sort(
			vecOrder.begin(),
			vecOrder.end(),
			LevelOrderComparator(vecKeys));
	}

	for (size_t k = 0; k < vecOrder.size(); k++) {
		field.m_vecLevels.push_back(vecLevels[vecOrder[k]]);
	}

	// Horizontal grid
	GridResolver::Resolve(store, vecRecords, field.m_grid);

	// Stack the payloads
	size_t sRows = static_cast<size_t>(field.m_meta.m_nNj);
	size_t sColumns = static_cast<size_t>(field.m_meta.m_nNi);

	field.m_pValues.reset(
		new DataArray3D<float>(vecOrder.size(), sRows, sColumns));

	DataArray3D<float> & dValues = *(field.m_pValues);

	for (size_t k = 0; k < vecOrder.size(); k++) {
		const RecordMetadata & meta = vecRecords[vecOrder[k]];

		DataArray2D<float> data;
		store.ReadRecord(meta, data);

		if ((data.GetRows() != sRows) || (data.GetColumns() != sColumns)) {
			_EXCEPTIONX4(Exception::InconsistentGridShape,
				"Payload of level %i is (%lu x %lu), expected %lu rows",
				meta.m_iIp1, data.GetRows(), data.GetColumns(), sRows);
		}

		memcpy(dValues[k], data.GetData(), sRows * sColumns * sizeof(float));
	}

	// Coordinates are level invariant
	if (opts.m_fLatLon) {
		field.m_pLat.reset(new DataArray2D<double>);
		field.m_pLon.reset(new DataArray2D<double>);
		GridResolver::ComputeLatLon(
			field.m_grid, *(field.m_pLat), *(field.m_pLon));
	}

	if (opts.m_fPressure) {
		AttachPressure(store, field);
	}

	if (field.m_grid.m_fYinYang) {
		SplitPanels(field);
	}

	Announce(1, "Assembled \"%s\" (%lu level(s), %lu x %lu)",
		field.m_meta.m_strNomVar.c_str(),
		field.m_vecLevels.size(), sRows, sColumns);
}

///////////////////////////////////////////////////////////////////////////////

