///////////////////////////////////////////////////////////////////////////////
///
///	\file    FieldAssembler.h
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


#ifndef _FIELDASSEMBLER_H_
#define _FIELDASSEMBLER_H_

#include "AssembledField.h"
#include "RecordStore.h"

#include <vector>

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Options of field assembly.
///	</summary>
class AssemblyOptions {

public:
	///	<summary>
	///		Constructor.
	///	</summary>
	AssemblyOptions() :
		m_fLatLon(false),
		m_fPressure(false),
		m_fPreserveOrder(false)
	{ }

public:
	///	<summary>
	///		Attach latitude and longitude.
	///	</summary>
	bool m_fLatLon;

	///	<summary>
	///		Attach the pressure at every point.
	///	</summary>
	bool m_fPressure;

	///	<summary>
	///		Keep the levels in the order of the records instead of sorting
	///		them lowest level first.
	///	</summary>
	bool m_fPreserveOrder;
};

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Stacks the records of a field into an AssembledField.
///	</summary>
class FieldAssembler {

public:
	///	<summary>
	///		Name of the surface pressure variable.
	///	</summary>
	static const char * SurfacePressureName;

public:
	///	<summary>
	///		Assemble the given records, which must differ only by level.
	///	</summary>
	static void Assemble(
		RecordStore & store,
		const std::vector<RecordMetadata> & vecRecords,
		const AssemblyOptions & opts,
		AssembledField & field
	);

	///	<summary>
	///		Find the surface pressure record on the grid of a field at its
	///		validity time.  Throws NoMatchingRecord if there is none.
	///	</summary>
	static RecordMetadata FindSurfacePressure(
		const RecordStore & store,
		const RecordMetadata & meta
	);

protected:
	///	<summary>
	///		Check that the records differ only by level.
	///	</summary>
	static void CheckRecords(
		const std::vector<RecordMetadata> & vecRecords
	);

	///	<summary>
	///		Compute the pressure at every point of the field.  Levels other
	///		than pressure levels use P0 and the linked vertical coordinate.
	///	</summary>
	static void AttachPressure(
		RecordStore & store,
		AssembledField & field
	);

	///	<summary>
	///		Build the Yin and Yang panels of a field and share the arrays
	///		of the field with the Yin panel.
	///	</summary>
	static void SplitPanels(
		AssembledField & field
	);
};

///////////////////////////////////////////////////////////////////////////////

#endif

