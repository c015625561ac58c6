///////////////////////////////////////////////////////////////////////////////
///
///	\file    ExtractField.cpp
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


#include "CommandLine.h"
#include "Exception.h"
#include "Announce.h"
#include "STLStringHelper.h"
#include "NetCDFUtilities.h"
#include "FieldQuery.h"
#include "GridResolver.h"
#include "StdDate.h"
#include "Defines.h"

#include "netcdfcpp.h"

#include <vector>
#include <string>

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Get the values of a field, with both panels of a Yin-Yang field.
///	</summary>
template <typename T>
static void GetCombinedArray(
	const AssembledField & field,
	std::shared_ptr< DataArray3D<T> > AssembledField::*pArray,
	DataArray3D<T> & data
) {
	if (field.IsYinYang()) {
		CombineYinYang(
			*((*(field.m_pYin)).*pArray),
			*((*(field.m_pYang)).*pArray),
			data);
	} else {
		data = *(field.*pArray);
	}
}

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Write a 3D array to the output file.
///	</summary>
static void WriteArray3D(
	NcFile & ncfile,
	const std::string & strName,
	const DataArray3D<float> & data,
	const char * szUnits
) {
	NcDim * dimLev = AddNcDimOrUseExisting(ncfile, "lev", data.GetSize(0));
	NcDim * dimY = AddNcDimOrUseExisting(ncfile, "y", data.GetSize(1));
	NcDim * dimX = AddNcDimOrUseExisting(ncfile, "x", data.GetSize(2));

	NcVar * var = ncfile.add_var(strName.c_str(), ncFloat, dimLev, dimY, dimX);
	if (var == NULL) {
		_EXCEPTION1("Unable to add variable \"%s\" to output file",
			strName.c_str());
	}
	if (szUnits != NULL) {
		var->add_att("units", szUnits);
	}
	if (!var->put(data.GetData(),
		data.GetSize(0), data.GetSize(1), data.GetSize(2))
	) {
		_EXCEPTION1("Unable to write variable \"%s\"", strName.c_str());
	}
}

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Write a 2D coordinate array to the output file.
///	</summary>
static void WriteCoordinate(
	NcFile & ncfile,
	const std::string & strName,
	const DataArray2D<double> & data,
	const char * szUnits
) {
	NcDim * dimY = AddNcDimOrUseExisting(ncfile, "y", data.GetRows());
	NcDim * dimX = AddNcDimOrUseExisting(ncfile, "x", data.GetColumns());

	NcVar * var = ncfile.add_var(strName.c_str(), ncDouble, dimY, dimX);
	if (var == NULL) {
		_EXCEPTION1("Unable to add variable \"%s\" to output file",
			strName.c_str());
	}
	var->add_att("units", szUnits);
	if (!var->put(data.GetData(), data.GetRows(), data.GetColumns())) {
		_EXCEPTION1("Unable to write variable \"%s\"", strName.c_str());
	}
}

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Write an assembled field, its levels and its attachments.
///	</summary>
static void WriteField(
	NcFile & ncfile,
	const AssembledField & field,
	bool fWriteCoordinates
) {
	const std::string & strName = field.m_meta.m_strNomVar;

	DataArray3D<float> dValues;
	GetCombinedArray(field, &AssembledField::m_pValues, dValues);
	WriteArray3D(ncfile, strName, dValues, NULL);

	NcVar * var = ncfile.get_var(strName.c_str());
	var->add_att("typvar", field.m_meta.m_strTypVar.c_str());
	var->add_att("etiket", field.m_meta.m_strEtiket.c_str());
	var->add_att("grtyp", field.m_meta.m_strGrTyp.c_str());
	var->add_att("datev", static_cast<int>(field.m_meta.m_lDateV));
	var->add_att("valid_time",
		StdDateToTime(field.m_meta.m_lDateV).ToString().c_str());

	if (field.HasPressure()) {
		DataArray3D<float> dPressure;
		GetCombinedArray(field, &AssembledField::m_pPressure, dPressure);
		WriteArray3D(ncfile, strName + "_pressure", dPressure, "hPa");
	}

	if (!fWriteCoordinates) {
		return;
	}

	// Levels
	NcDim * dimLev =
		AddNcDimOrUseExisting(ncfile, "lev", field.GetLevelCount());

	std::vector<int> vecIp1 = field.GetIp1List();
	std::vector<double> vecValues = field.GetLevelValues();

	NcVar * varIp1 = ncfile.add_var("ip1", ncInt, dimLev);
	NcVar * varLev = ncfile.add_var("lev", ncDouble, dimLev);
	if ((varIp1 == NULL) || (varLev == NULL)) {
		_EXCEPTIONT("Unable to add level variables to output file");
	}
	varIp1->put(&(vecIp1[0]), vecIp1.size());
	varLev->put(&(vecValues[0]), vecValues.size());
	if (field.GetLevelCount() != 0) {
		varLev->add_att("kind", LevelKindName(field.m_vecLevels[0].m_eKind));
	}

	// Coordinates
	if (field.HasLatLon()) {
		if (field.IsYinYang()) {
			DataArray2D<double> dLat;
			DataArray2D<double> dLon;
			CombineYinYang(*(field.m_pYin->m_pLat), *(field.m_pYang->m_pLat), dLat);
			CombineYinYang(*(field.m_pYin->m_pLon), *(field.m_pYang->m_pLon), dLon);
			WriteCoordinate(ncfile, "lat", dLat, "degrees_north");
			WriteCoordinate(ncfile, "lon", dLon, "degrees_east");

		} else {
			WriteCoordinate(ncfile, "lat", *(field.m_pLat), "degrees_north");
			WriteCoordinate(ncfile, "lon", *(field.m_pLon), "degrees_east");
		}
	}
}

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Get a wind array, with both panels of a Yin-Yang field.
///	</summary>
static void GetCombinedWind(
	const WindFields & wind,
	std::shared_ptr< DataArray3D<float> > WindFields::*pArray,
	DataArray3D<float> & data
) {
	if (wind.m_pYin.get() != NULL) {
		CombineYinYang(
			*((*(wind.m_pYin)).*pArray),
			*((*(wind.m_pYang)).*pArray),
			data);
	} else {
		data = *(wind.*pArray);
	}
}

///////////////////////////////////////////////////////////////////////////////

int main(int argc, char** argv) {

	// Turn off fatal errors in NetCDF
	NcError error(NcError::silent_nonfatal);

try {

	// Input file
	std::string strInputFile;

	// Input directory
	std::string strInputDir;

	// Filename prefix and suffix in the input directory
	std::string strPrefix;
	std::string strSuffix;

	// Variable name
	std::string strVariable;

	// Validity time
	std::string strDateV;

	// Tolerance on the validity time
	int nDateVTolerance;

	// Level codes
	std::string strIp1;

	// Secondary selectors
	int iIp2;
	int iIp3;
	int iIg1;
	int iIg2;
	int iIg3;
	std::string strTypVar;
	std::string strEtiket;

	// Attach coordinates
	bool fLatLon;

	// Attach pressure
	bool fPresFromVar;

	// Pressure levels
	std::string strPresLevels;

	// Workspace base directory
	std::string strTmpDir;

	// Interpolation timeout
	double dInterpTimeout;

	// Interpolation program
	std::string strInterpTool;

	// Output file
	std::string strOutputFile;

	// Verbosity
	int iVerbosity;

	// Parse the command line
	BeginCommandLine()
		CommandLineString(strInputFile, "in_file", "");
		CommandLineString(strInputDir, "in_dir", "");
		CommandLineString(strPrefix, "prefix", "");
		CommandLineString(strSuffix, "suffix", "");
		CommandLineStringD(strVariable, "var", "", "(name or " WIND_VECTORS_VARIABLE ")");
		CommandLineStringD(strDateV, "datev", "", "(stamp or yyyy-mm-dd-hh:mm:ss)");
		CommandLineIntD(nDateVTolerance, "datev_tol", 0, "(seconds)");
		CommandLineStringD(strIp1, "ip1", "", "(comma separated)");
		CommandLineInt(iIp2, "ip2", -1);
		CommandLineInt(iIp3, "ip3", -1);
		CommandLineInt(iIg1, "ig1", -1);
		CommandLineInt(iIg2, "ig2", -1);
		CommandLineInt(iIg3, "ig3", -1);
		CommandLineString(strTypVar, "typvar", "");
		CommandLineString(strEtiket, "etiket", "");
		CommandLineBool(fLatLon, "latlon");
		CommandLineBool(fPresFromVar, "pres_from_var");
		CommandLineStringD(strPresLevels, "pres_levels", "", "(hPa, comma separated)");
		CommandLineString(strTmpDir, "tmp_dir", "");
		CommandLineDoubleD(dInterpTimeout, "interp_timeout", 600.0, "(seconds)");
		CommandLineString(strInterpTool, "interp_tool", "d.pxs2pxt");
		CommandLineString(strOutputFile, "out_data", "");
		CommandLineInt(iVerbosity, "verbosity", 0);

		ParseCommandLine(argc, argv);
	EndCommandLine(argv)

	AnnounceBanner();

	AnnounceSetVerbosityLevel(iVerbosity);

	// Check arguments
	if ((strInputFile == "") && (strInputDir == "")) {
		_EXCEPTIONT("No input file (--in_file) or directory (--in_dir) specified");
	}
	if ((strInputFile != "") && (strInputDir != "")) {
		Announce("WARNING: --in_file supersedes --in_dir");
	}
	if (strVariable == "") {
		_EXCEPTIONT("No variable (--var) specified");
	}
	if (strOutputFile == "") {
		_EXCEPTIONT("No output file (--out_data) specified");
	}

	// Build the query
	FieldQuery fq;
	fq.m_strFileName = strInputFile;
	fq.m_strDirName = strInputDir;
	fq.m_strPrefix = strPrefix;
	fq.m_strSuffix = strSuffix;
	fq.m_strVarName = strVariable;
	fq.m_strDateV = strDateV;
	fq.m_lDateVTolerance = nDateVTolerance;
	fq.m_iIp2 = iIp2;
	fq.m_iIp3 = iIp3;
	fq.m_iIg1 = iIg1;
	fq.m_iIg2 = iIg2;
	fq.m_iIg3 = iIg3;
	fq.m_strTypVar = strTypVar;
	fq.m_strEtiket = strEtiket;
	fq.m_fLatLon = fLatLon;
	fq.m_fPresFromVar = fPresFromVar;
	fq.m_strTmpDir = strTmpDir;
	fq.m_dInterpTimeout = dInterpTimeout;

	fq.m_vecInterpTool.clear();
	STLStringHelper::ParseVariableList(strInterpTool, fq.m_vecInterpTool, " ");

	if (strIp1 != "") {
		STLStringHelper::ParseIntegerList(strIp1, fq.m_vecIp1);
	}
	if (strPresLevels != "") {
		STLStringHelper::ParseFloatList(strPresLevels, fq.m_vecPresLevels);
	}

	// Run the query
	AnnounceStartBlock("Extracting \"%s\"", strVariable.c_str());

	FieldQueryResult result;
	fq.Execute(result);

	Announce("Found in \"%s\"", result.m_strFileName.c_str());
	Announce("%lu level(s) on grid %s",
		result.m_pField->GetLevelCount(),
		result.m_pField->m_grid.ToString().c_str());

	AnnounceEndBlock("Done");

	// Write the output
	AnnounceStartBlock("Writing \"%s\"", strOutputFile.c_str());

	NcFile ncfileout(strOutputFile.c_str(), NcFile::Replace);
	if (!ncfileout.is_valid()) {
		_EXCEPTION1("Unable to open output file \"%s\"",
			strOutputFile.c_str());
	}

	ncfileout.add_att("source_file", result.m_strFileName.c_str());
	ncfileout.add_att("command_line", GetCommandLineAsString(argc, argv).c_str());

	WriteField(ncfileout, *(result.m_pField), true);

	if (result.m_pFieldV.get() != NULL) {
		WriteField(ncfileout, *(result.m_pFieldV), false);
	}

	if (result.HasWind()) {
		DataArray3D<float> data;

		GetCombinedWind(result.m_wind, &WindFields::m_pUUWE, data);
		WriteArray3D(ncfileout, "UUWE", data, "m/s");

		GetCombinedWind(result.m_wind, &WindFields::m_pVVSN, data);
		WriteArray3D(ncfileout, "VVSN", data, "m/s");

		GetCombinedWind(result.m_wind, &WindFields::m_pUV, data);
		WriteArray3D(ncfileout, "UV", data, "knots");

		GetCombinedWind(result.m_wind, &WindFields::m_pWD, data);
		WriteArray3D(ncfileout, "WD", data, "degrees");
	}

	ncfileout.close();

	AnnounceEndBlock("Done");

	AnnounceBanner();

} catch(Exception & e) {
	Announce(e.ToString().c_str());
	return (-1);
}

	return 0;
}

///////////////////////////////////////////////////////////////////////////////

