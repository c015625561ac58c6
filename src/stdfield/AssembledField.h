///////////////////////////////////////////////////////////////////////////////
///
///	\file    AssembledField.h
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


#ifndef _ASSEMBLEDFIELD_H_
#define _ASSEMBLEDFIELD_H_

#include "RecordStore.h"
#include "GridResolver.h"
#include "LevelCodec.h"
#include "DataArray2D.h"
#include "DataArray3D.h"

#include <vector>
#include <memory>

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		A field stacked over its levels.  Values are indexed
///		(level, row, column).
///
///		On a Yin-Yang grid the field carries both panels as their own
///		AssembledField and the arrays of the field itself are shared with
///		the Yin panel, so that a change made through one is seen through
///		the other.  The metadata and grid of the field remain those of the
///		combined record, so m_meta.m_nNj is 2N while m_pValues, m_pLat,
///		m_pLon and m_pPressure hold the N rows of the Yin panel.
///	</summary>
class AssembledField {

public:
	///	<summary>
	///		Number of levels.
	///	</summary>
	size_t GetLevelCount() const {
		return m_vecLevels.size();
	}

	///	<summary>
	///		True if the field is on a Yin-Yang grid.
	///	</summary>
	bool IsYinYang() const {
		return (m_pYin.get() != NULL);
	}

	///	<summary>
	///		True if latitude and longitude are attached.
	///	</summary>
	bool HasLatLon() const {
		return ((m_pLat.get() != NULL) && (m_pLon.get() != NULL));
	}

	///	<summary>
	///		True if the pressure field is attached.
	///	</summary>
	bool HasPressure() const {
		return (m_pPressure.get() != NULL);
	}

	///	<summary>
	///		Level codes of the field, in level order.
	///	</summary>
	std::vector<int> GetIp1List() const {
		std::vector<int> vecIp1;
		for (size_t k = 0; k < m_vecLevels.size(); k++) {
			vecIp1.push_back(m_vecLevels[k].m_iIp1);
		}
		return vecIp1;
	}

	///	<summary>
	///		Decoded level values of the field, in level order.
	///	</summary>
	std::vector<double> GetLevelValues() const {
		std::vector<double> vecValues;
		for (size_t k = 0; k < m_vecLevels.size(); k++) {
			vecValues.push_back(m_vecLevels[k].m_dValue);
		}
		return vecValues;
	}

public:
	///	<summary>
	///		Metadata of the first record of the field.
	///	</summary>
	RecordMetadata m_meta;

	///	<summary>
	///		Horizontal grid.
	///	</summary>
	GridDescriptor m_grid;

	///	<summary>
	///		Levels of the field.
	///	</summary>
	std::vector<LevelCode> m_vecLevels;

	///	<summary>
	///		Values.
	///	</summary>
	std::shared_ptr< DataArray3D<float> > m_pValues;

	///	<summary>
	///		Latitude and longitude (degrees).
	///	</summary>
	std::shared_ptr< DataArray2D<double> > m_pLat;
	std::shared_ptr< DataArray2D<double> > m_pLon;

	///	<summary>
	///		Pressure (hPa) at every point of the field.
	///	</summary>
	std::shared_ptr< DataArray3D<float> > m_pPressure;

	///	<summary>
	///		Yin and Yang panels.
	///	</summary>
	std::shared_ptr<AssembledField> m_pYin;
	std::shared_ptr<AssembledField> m_pYang;
};

///////////////////////////////////////////////////////////////////////////////

#endif

