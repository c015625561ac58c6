///////////////////////////////////////////////////////////////////////////////
///
///	\file    RecordStore.h
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

#ifndef _RECORDSTORE_H_
#define _RECORDSTORE_H_

#include "DataArray2D.h"
#include "LevelCodec.h"

#include <string>
#include <vector>

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Metadata of one record of a standard file.  The payload of a record
///		is a 2D array of nj rows and ni columns.
///	</summary>
class RecordMetadata {

public:
	///	<summary>
	///		Default constructor.
	///	</summary>
	RecordMetadata() :
		m_iIp1(0),
		m_iIp2(0),
		m_iIp3(0),
		m_lDateV(0),
		m_lDateO(0),
		m_iDeet(0),
		m_iNpas(0),
		m_iIg1(0),
		m_iIg2(0),
		m_iIg3(0),
		m_iIg4(0),
		m_dXg1(0.0),
		m_dXg2(0.0),
		m_dXg3(0.0),
		m_dXg4(0.0),
		m_nNi(0),
		m_nNj(0),
		m_lHandle(-1)
	{ }

	///	<summary>
	///		True if both records describe the same field, that is they are
	///		identical in everything but their level code (and handle).
	///	</summary>
	bool SameFieldAs(const RecordMetadata & meta) const {
		return ((m_strNomVar == meta.m_strNomVar) &&
		        (m_strTypVar == meta.m_strTypVar) &&
		        (m_strEtiket == meta.m_strEtiket) &&
		        (m_iIp2 == meta.m_iIp2) &&
		        (m_iIp3 == meta.m_iIp3) &&
		        (m_lDateV == meta.m_lDateV) &&
		        SameGridAs(meta));
	}

	///	<summary>
	///		True if both records are stored on the same horizontal grid.
	///	</summary>
	bool SameGridAs(const RecordMetadata & meta) const {
		return ((m_strGrTyp == meta.m_strGrTyp) &&
		        (m_iIg1 == meta.m_iIg1) &&
		        (m_iIg2 == meta.m_iIg2) &&
		        (m_iIg3 == meta.m_iIg3) &&
		        (m_iIg4 == meta.m_iIg4) &&
		        (m_nNi == meta.m_nNi) &&
		        (m_nNj == meta.m_nNj));
	}

	///	<summary>
	///		Output as a string, for diagnostics.
	///	</summary>
	std::string ToString() const;

public:
	///	<summary>
	///		Variable name.
	///	</summary>
	std::string m_strNomVar;

	///	<summary>
	///		Type of field.
	///	</summary>
	std::string m_strTypVar;

	///	<summary>
	///		Label.
	///	</summary>
	std::string m_strEtiket;

	///	<summary>
	///		Grid type.
	///	</summary>
	std::string m_strGrTyp;

	///	<summary>
	///		Level, forecast hour and user discriminators.
	///	</summary>
	int m_iIp1;
	int m_iIp2;
	int m_iIp3;

	///	<summary>
	///		Validity and origin date stamps.
	///	</summary>
	long m_lDateV;
	long m_lDateO;

	///	<summary>
	///		Time step length (seconds) and number of time steps.
	///	</summary>
	int m_iDeet;
	int m_iNpas;

	///	<summary>
	///		Grid descriptors.
	///	</summary>
	int m_iIg1;
	int m_iIg2;
	int m_iIg3;
	int m_iIg4;

	///	<summary>
	///		Real valued grid parameters.
	///	</summary>
	double m_dXg1;
	double m_dXg2;
	double m_dXg3;
	double m_dXg4;

	///	<summary>
	///		Number of columns and rows of the payload.
	///	</summary>
	int m_nNi;
	int m_nNj;

	///	<summary>
	///		Handle of the record in its store, or (-1).
	///	</summary>
	long m_lHandle;
};

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Predicate over record metadata.  Unset criteria match any record.
///	</summary>
class RecordSearch {

public:
	///	<summary>
	///		Value of an unset integer criterion.
	///	</summary>
	static const int Any = (-1);

public:
	///	<summary>
	///		Constructor matching every record.
	///	</summary>
	RecordSearch() :
		m_lDateV(Any),
		m_iIp1(Any),
		m_iIp2(Any),
		m_iIp3(Any),
		m_iIg1(Any),
		m_iIg2(Any),
		m_iIg3(Any)
	{ }

	///	<summary>
	///		Constructor matching a variable name.
	///	</summary>
	explicit RecordSearch(
		const std::string & strNomVar
	) :
		m_strNomVar(strNomVar),
		m_lDateV(Any),
		m_iIp1(Any),
		m_iIp2(Any),
		m_iIp3(Any),
		m_iIg1(Any),
		m_iIg2(Any),
		m_iIg3(Any)
	{ }

	///	<summary>
	///		Check a record against this predicate.
	///	</summary>
	bool Matches(const RecordMetadata & meta) const {
		if ((m_strNomVar != "") && (m_strNomVar != meta.m_strNomVar)) {
			return false;
		}
		if ((m_strTypVar != "") && (m_strTypVar != meta.m_strTypVar)) {
			return false;
		}
		if ((m_strEtiket != "") && (m_strEtiket != meta.m_strEtiket)) {
			return false;
		}
		if ((m_lDateV != Any) && (m_lDateV != meta.m_lDateV)) {
			return false;
		}
		if ((m_iIp1 != Any) && (m_iIp1 != meta.m_iIp1)) {
			return false;
		}
		if ((m_iIp2 != Any) && (m_iIp2 != meta.m_iIp2)) {
			return false;
		}
		if ((m_iIp3 != Any) && (m_iIp3 != meta.m_iIp3)) {
			return false;
		}
		if ((m_iIg1 != Any) && (m_iIg1 != meta.m_iIg1)) {
			return false;
		}
		if ((m_iIg2 != Any) && (m_iIg2 != meta.m_iIg2)) {
			return false;
		}
		if ((m_iIg3 != Any) && (m_iIg3 != meta.m_iIg3)) {
			return false;
		}
		return true;
	}

public:
	std::string m_strNomVar;
	std::string m_strTypVar;
	std::string m_strEtiket;
	long m_lDateV;
	int m_iIp1;
	int m_iIp2;
	int m_iIp3;
	int m_iIg1;
	int m_iIg2;
	int m_iIg3;
};

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Access to a collection of records.
///	</summary>
class RecordStore {

public:
	///	<summary>
	///		Virtual destructor.
	///	</summary>
	virtual ~RecordStore() { }

public:
	///	<summary>
	///		Open an existing collection for reading.
	///	</summary>
	virtual void Open(const std::string & strPath) = 0;

	///	<summary>
	///		Create a new, empty collection for writing (replacing any
	///		existing one).
	///	</summary>
	virtual void Create(const std::string & strPath) = 0;

	///	<summary>
	///		Close the collection.
	///	</summary>
	virtual void Close() = 0;

	///	<summary>
	///		True if the collection is open.
	///	</summary>
	virtual bool IsOpen() const = 0;

	///	<summary>
	///		Path of the collection.
	///	</summary>
	virtual const std::string & GetPath() const = 0;

	///	<summary>
	///		Find all records that match the given predicate, in storage
	///		order.
	///	</summary>
	virtual void FindRecords(
		const RecordSearch & search,
		std::vector<RecordMetadata> & vecRecords
	) const = 0;

	///	<summary>
	///		Read the payload of a record.
	///	</summary>
	virtual void ReadRecord(
		const RecordMetadata & meta,
		DataArray2D<float> & data
	) = 0;

	///	<summary>
	///		Read the payload of a record.
	///	</summary>
	virtual void ReadRecord(
		const RecordMetadata & meta,
		DataArray2D<double> & data
	) = 0;

	///	<summary>
	///		Vertical coordinate that applies to a record: the "!!" record
	///		whose ip1/ip2 equal the record's ig1/ig2, otherwise an absent
	///		descriptor.  The vertical coordinate code is not validated.
	///	</summary>
	virtual VerticalDescriptor GetVerticalDescriptor(
		const RecordMetadata & meta
	) = 0;

	///	<summary>
	///		Append a record.  The record handle and its ni/nj are updated
	///		from the payload.
	///	</summary>
	virtual void WriteRecord(
		RecordMetadata & meta,
		const DataArray2D<float> & data
	) = 0;

	///	<summary>
	///		Append a record.  The record handle and its ni/nj are updated
	///		from the payload.
	///	</summary>
	virtual void WriteRecord(
		RecordMetadata & meta,
		const DataArray2D<double> & data
	) = 0;
};

///////////////////////////////////////////////////////////////////////////////

#endif

