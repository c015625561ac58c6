///////////////////////////////////////////////////////////////////////////////
///
///	\file    NcRecordFile.h
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

#ifndef _NCRECORDFILE_H_
#define _NCRECORDFILE_H_

#include "RecordStore.h"

#include "netcdfcpp.h"

#include <string>
#include <vector>

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		A RecordStore kept in a NetCDF file.  Each record is a 2D variable
///		named "r" followed by its six digit handle, with dimensions
///		(nj, ni) and its metadata stored as attributes.  The file carries
///		the global attribute record_format = "stdfield".
///	</summary>
class NcRecordFile : public RecordStore {

public:
	///	<summary>
	///		Value of the record_format global attribute.
	///	</summary>
	static const char * RecordFormat;

public:
	///	<summary>
	///		Constructor.
	///	</summary>
	NcRecordFile();

	///	<summary>
	///		Destructor.
	///	</summary>
	virtual ~NcRecordFile();

	///	<summary>
	///		Determine if the given path is a record file.
	///	</summary>
	static bool IsRecordFile(const std::string & strPath);

public:
	virtual void Open(const std::string & strPath);

	virtual void Create(const std::string & strPath);

	virtual void Close();

	virtual bool IsOpen() const {
		return (m_pncFile != NULL);
	}

	virtual const std::string & GetPath() const {
		return m_strPath;
	}

	virtual void FindRecords(
		const RecordSearch & search,
		std::vector<RecordMetadata> & vecRecords
	) const;

	virtual void ReadRecord(
		const RecordMetadata & meta,
		DataArray2D<float> & data
	);

	virtual void ReadRecord(
		const RecordMetadata & meta,
		DataArray2D<double> & data
	);

	virtual VerticalDescriptor GetVerticalDescriptor(
		const RecordMetadata & meta
	);

	virtual void WriteRecord(
		RecordMetadata & meta,
		const DataArray2D<float> & data
	);

	virtual void WriteRecord(
		RecordMetadata & meta,
		const DataArray2D<double> & data
	);

private:
	///	<summary>
	///		Get the NetCDF variable of a record.
	///	</summary>
	NcVar * GetRecordVar(
		const RecordMetadata & meta
	) const;

	///	<summary>
	///		Add the NetCDF variable of a new record.
	///	</summary>
	NcVar * AddRecordVar(
		RecordMetadata & meta,
		NcType nctype,
		size_t sRows,
		size_t sColumns
	);

	///	<summary>
	///		Read the metadata of a record from its NetCDF variable.
	///	</summary>
	static void ReadMetadata(
		NcVar * var,
		long lHandle,
		RecordMetadata & meta
	);

private:
	// Not copyable
	NcRecordFile(const NcRecordFile &);
	NcRecordFile & operator=(const NcRecordFile &);

private:
	///	<summary>
	///		Path of the file.
	///	</summary>
	std::string m_strPath;

	///	<summary>
	///		The open NetCDF file, or NULL.
	///	</summary>
	NcFile * m_pncFile;

	///	<summary>
	///		True if the file was created for writing.
	///	</summary>
	bool m_fWritable;

	///	<summary>
	///		Index of records, in handle order.
	///	</summary>
	std::vector<RecordMetadata> m_vecRecords;
};

///////////////////////////////////////////////////////////////////////////////

#endif

