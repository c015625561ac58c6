///////////////////////////////////////////////////////////////////////////////
///
///	\file    PressureInterpolator.h
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


#ifndef _PRESSUREINTERPOLATOR_H_
#define _PRESSUREINTERPOLATOR_H_

#include "AssembledField.h"
#include "FieldAssembler.h"
#include "RecordStore.h"

#include <string>
#include <vector>

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		A scratch directory that is removed, together with everything in
///		it, when the workspace goes out of scope.
///	</summary>
class InterpolationWorkspace {

public:
	///	<summary>
	///		Create a new directory under strBaseDir, or under $TMPDIR or
	///		/tmp if strBaseDir is empty.  Throws WorkspaceIOError if the
	///		directory cannot be created.
	///	</summary>
	explicit InterpolationWorkspace(
		const std::string & strBaseDir = ""
	);

	///	<summary>
	///		Destructor.  Removes the directory.
	///	</summary>
	~InterpolationWorkspace();

	///	<summary>
	///		Path of the directory.
	///	</summary>
	const std::string & GetPath() const {
		return m_strPath;
	}

	///	<summary>
	///		Path of a file in the directory.
	///	</summary>
	std::string GetFilePath(const std::string & strName) const {
		return m_strPath + "/" + strName;
	}

	///	<summary>
	///		Remove the directory and its contents.  Returns false if
	///		anything could not be removed.
	///	</summary>
	bool Release();

private:
	// Not copyable
	InterpolationWorkspace(const InterpolationWorkspace &);
	InterpolationWorkspace & operator=(const InterpolationWorkspace &);

private:
	///	<summary>
	///		Path of the directory, or empty once released.
	///	</summary>
	std::string m_strPath;
};

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Options of pressure interpolation.
///	</summary>
class InterpolationOptions {

public:
	///	<summary>
	///		Default interpolation program.
	///	</summary>
	static const char * DefaultTool;

	///	<summary>
	///		Default timeout (seconds).
	///	</summary>
	static const double DefaultTimeout;

public:
	///	<summary>
	///		Constructor.
	///	</summary>
	InterpolationOptions() :
		m_dTimeout(DefaultTimeout)
	{
		m_vecTool.push_back(DefaultTool);
	}

public:
	///	<summary>
	///		Base directory of the workspace.
	///	</summary>
	std::string m_strTmpDir;

	///	<summary>
	///		Timeout of the interpolation program (seconds, 0 for none).
	///	</summary>
	double m_dTimeout;

	///	<summary>
	///		Interpolation program followed by any leading arguments.
	///	</summary>
	std::vector<std::string> m_vecTool;

	///	<summary>
	///		Options of the assembly of the interpolated field.
	///	</summary>
	AssemblyOptions m_optsAssembly;
};

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Interpolates an assembled field to pressure levels with the external
///		interpolation program.  The program is called as
///
///		  tool -s src -datev stamp -d dst -pxs pxs -plevs p1,p2,...
///		       -var CUB_name
///
///		where src holds the field, pxs holds the surface pressure, both
///		with the grid and vertical descriptor records, and dst receives the
///		field on the pressure levels p1, p2, ... (hPa).
///	</summary>
class PressureInterpolator {

public:
	///	<summary>
	///		Interpolate a field assembled from storeSource.  The result has
	///		exactly the requested levels, in the requested order.
	///	</summary>
	static void Interpolate(
		RecordStore & storeSource,
		const AssembledField & field,
		const std::vector<double> & vecPressureLevels,
		const InterpolationOptions & opts,
		AssembledField & fieldOut
	);

	///	<summary>
	///		Format pressure levels as the program expects ("0850.00,...").
	///	</summary>
	static std::string FormatPressureLevels(
		const std::vector<double> & vecPressureLevels
	);

	///	<summary>
	///		Level codes of pressure levels, as formatted for the program.
	///		Levels that share a level code are rejected.
	///	</summary>
	static std::vector<int> EncodePressureLevels(
		const std::vector<double> & vecPressureLevels
	);

	///	<summary>
	///		Replace the level values of an interpolated field, and of its
	///		panels, by the requested pressure levels.  Level codes carry
	///		a limited number of digits, so decoded values may differ from
	///		the requested ones.  An attached pressure field is set to the
	///		requested levels.
	///	</summary>
	static void SetRequestedLevels(
		const std::vector<double> & vecPressureLevels,
		AssembledField & field
	);

protected:
	///	<summary>
	///		Write the field, with its grid and vertical descriptor records,
	///		to a new record file.
	///	</summary>
	static void WriteSourceFile(
		RecordStore & storeSource,
		const AssembledField & field,
		const std::string & strPath
	);

	///	<summary>
	///		Write the surface pressure of the field, with its grid and
	///		vertical descriptor records, to a new record file.  Returns the
	///		surface pressure record.
	///	</summary>
	static RecordMetadata WriteSurfacePressureFile(
		RecordStore & storeSource,
		const AssembledField & field,
		const std::string & strPath
	);

	///	<summary>
	///		Copy the grid and vertical descriptor records of a field.
	///	</summary>
	static void WriteDescriptorRecords(
		RecordStore & storeSource,
		const RecordMetadata & meta,
		RecordStore & storeTo
	);
};

///////////////////////////////////////////////////////////////////////////////

#endif

