///////////////////////////////////////////////////////////////////////////////
///
///	\file    CommandLine.h
///	\author  Paul Ullrich
///	\version October 18, 2026
///
///	<remarks>
///		Copyright 2000-2010 Paul Ullrich
///
///		This file is distributed as part of the Tempest source code package.
///		Permission is granted to use, copy, modify and distribute this
///		source code and its documentation under the terms of the GNU General
///		Public License.  This software is provided "as is" without express
///		or implied warranty.
///	</remarks>

#ifndef _COMMANDLINE_H_
#define _COMMANDLINE_H_

#include "Announce.h"
#include "Exception.h"

#include <vector>
#include <string>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <cmath>

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		A command line parameter.  Each parameter binds a reference to a
///		local variable of the tool and fills it in during parsing.
///	</summary>
class CommandLineArgument {
public:
	///	<summary>
	///		Default constructor.  Names beginning with '*' are hidden from
	///		the usage listing.
	///	</summary>
	CommandLineArgument(
		std::string strName,
		std::string strDescription
	) :
		m_strName(std::string("--") + strName),
		m_strDescription(strDescription),
		m_fHidden(false)
	{
		if ((strName.length() > 0) && (strName[0] == '*')) {
			m_strName = std::string("--") + strName.substr(1);
			m_fHidden = true;
		}
	}

	///	<summary>
	///		Virtual destructor.
	///	</summary>
	virtual ~CommandLineArgument() {
	}

	///	<summary>
	///		Number of values required.
	///	</summary>
	virtual int GetValueCount() const = 0;

	///	<summary>
	///		Name of the value type, for the usage listing.
	///	</summary>
	virtual const char * GetTypeName() const = 0;

	///	<summary>
	///		Current value formatted for the usage listing.
	///	</summary>
	virtual std::string GetValueString() const = 0;

	///	<summary>
	///		Print the usage information of this parameter.
	///	</summary>
	void PrintUsage() const {
		if (!m_fHidden) {
			Announce("  %s <%s> [%s] %s",
				m_strName.c_str(),
				GetTypeName(),
				GetValueString().c_str(),
				m_strDescription.c_str());
		}
	}

	///	<summary>
	///		Activate this parameter.
	///	</summary>
	virtual void Activate() {
	}

	///	<summary>
	///		Set the value from a string.
	///	</summary>
	virtual void SetValue(
		int ix,
		std::string strValue
	) {
		_EXCEPTIONT("Invalid value index.");
	}

public:
	///	<summary>
	///		Name of this parameter.
	///	</summary>
	std::string m_strName;

	///	<summary>
	///		Description of this parameter.
	///	</summary>
	std::string m_strDescription;

	///	<summary>
	///		Flag indicating this argument is hidden.
	///	</summary>
	bool m_fHidden;
};

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		A command line boolean.
///	</summary>
class CommandLineArgumentBool : public CommandLineArgument {
public:
	CommandLineArgumentBool(
		bool & ref,
		std::string strName,
		std::string strDescription
	) :
		CommandLineArgument(strName, strDescription),
		m_fValue(ref)
	{
		m_fValue = false;
	}

	virtual int GetValueCount() const {
		return (0);
	}

	virtual const char * GetTypeName() const {
		return "bool";
	}

	virtual std::string GetValueString() const {
		return (m_fValue)?("true"):("false");
	}

	virtual void Activate() {
		m_fValue = true;
	}

public:
	///	<summary>
	///		Argument value.
	///	</summary>
	bool & m_fValue;
};

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		A command line string.
///	</summary>
class CommandLineArgumentString : public CommandLineArgument {
public:
	CommandLineArgumentString(
		std::string & ref,
		std::string strName,
	 	std::string strDefaultValue,
		std::string strDescription
	) :
		CommandLineArgument(strName, strDescription),
		m_strValue(ref)
	{
		m_strValue = strDefaultValue;
	}

	virtual int GetValueCount() const {
		return (1);
	}

	virtual const char * GetTypeName() const {
		return "string";
	}

	virtual std::string GetValueString() const {
		return std::string("\"") + m_strValue + std::string("\"");
	}

	virtual void SetValue(
		int ix,
		std::string strValue
	) {
		if (ix != 0) {
			_EXCEPTIONT("Invalid value index.");
		}
		m_strValue = strValue;
	}

public:
	///	<summary>
	///		Argument value.
	///	</summary>
	std::string & m_strValue;
};

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		A command line integer.
///	</summary>
class CommandLineArgumentInt : public CommandLineArgument {
public:
	CommandLineArgumentInt(
		int & ref,
		std::string strName,
		int iDefaultValue,
		std::string strDescription
	) :
		CommandLineArgument(strName, strDescription),
		m_iValue(ref)
	{
		m_iValue = iDefaultValue;
	}

	virtual int GetValueCount() const {
		return (1);
	}

	virtual const char * GetTypeName() const {
		return "integer";
	}

	virtual std::string GetValueString() const {
		char szBuffer[32];
		snprintf(szBuffer, 32, "%i", m_iValue);
		return std::string(szBuffer);
	}

	virtual void SetValue(
		int ix,
		std::string strValue
	) {
		if (ix != 0) {
			_EXCEPTIONT("Invalid value index.");
		}
		m_iValue = atoi(strValue.c_str());
	}

public:
	///	<summary>
	///		Argument value.
	///	</summary>
	int & m_iValue;
};

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		A command line double.
///	</summary>
class CommandLineArgumentDouble : public CommandLineArgument {
public:
	CommandLineArgumentDouble(
		double & ref,
		std::string strName,
		double dDefaultValue,
		std::string strDescription
	) :
		CommandLineArgument(strName, strDescription),
		m_dValue(ref)
	{
		m_dValue = dDefaultValue;
	}

	virtual int GetValueCount() const {
		return (1);
	}

	virtual const char * GetTypeName() const {
		return "double";
	}

	virtual std::string GetValueString() const {
		char szBuffer[32];
		if (fabs(m_dValue) < 1.0e6) {
			snprintf(szBuffer, 32, "%f", m_dValue);
		} else {
			snprintf(szBuffer, 32, "%e", m_dValue);
		}
		return std::string(szBuffer);
	}

	virtual void SetValue(
		int ix,
		std::string strValue
	) {
		if (ix != 0) {
			_EXCEPTIONT("Invalid value index.");
		}
		m_dValue = atof(strValue.c_str());
	}

public:
	///	<summary>
	///		Argument value.
	///	</summary>
	double & m_dValue;
};

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Begin the definition of command line parameters.
///	</summary>
#define BeginCommandLine() \
	{ bool _errorCommandLine = false; \
	  bool _invalidArgument = false; \
	  std::vector<CommandLineArgument*> _vecArguments;

///	<summary>
///		Define a new command line boolean parameter.
///	</summary>
#define CommandLineBool(ref, name) \
	_vecArguments.push_back( \
		new CommandLineArgumentBool(ref, name, ""));

#define CommandLineBoolD(ref, name, desc) \
	_vecArguments.push_back( \
		new CommandLineArgumentBool(ref, name, desc));

///	<summary>
///		Define a new command line string parameter.
///	</summary>
#define CommandLineString(ref, name, value) \
	_vecArguments.push_back( \
		new CommandLineArgumentString(ref, name, value, ""));

#define CommandLineStringD(ref, name, value, desc) \
	_vecArguments.push_back( \
		new CommandLineArgumentString(ref, name, value, desc));

///	<summary>
///		Define a new command line integer parameter.
///	</summary>
#define CommandLineInt(ref, name, value) \
	_vecArguments.push_back( \
		new CommandLineArgumentInt(ref, name, value, ""));

#define CommandLineIntD(ref, name, value, desc) \
	_vecArguments.push_back( \
		new CommandLineArgumentInt(ref, name, value, desc));

///	<summary>
///		Define a new command line double parameter.
///	</summary>
#define CommandLineDouble(ref, name, value) \
	_vecArguments.push_back( \
		new CommandLineArgumentDouble(ref, name, value, ""));

#define CommandLineDoubleD(ref, name, value, desc) \
	_vecArguments.push_back( \
		new CommandLineArgumentDouble(ref, name, value, desc));

///	<summary>
///		Parse the command line.  Unknown arguments and missing values
///		are reported and cause the usage to be printed.
///	</summary>
#define ParseCommandLine(argc, argv) \
	for(int _command = 1; _command < argc; _command++) { \
		bool _found = false; \
		for(size_t _p = 0; _p < _vecArguments.size(); _p++) { \
			if (_vecArguments[_p]->m_strName != argv[_command]) { \
				continue; \
			} \
			_found = true; \
			_vecArguments[_p]->Activate(); \
			int _nValues = _vecArguments[_p]->GetValueCount(); \
			if (_command + _nValues >= argc) { \
				Announce("Error: Insufficient values for option %s", \
					argv[_command]); \
				_errorCommandLine = true; \
				_command = argc; \
				break; \
			} \
			for (int _z = 0; _z < _nValues; _z++) { \
				_command++; \
				_vecArguments[_p]->SetValue(_z, argv[_command]); \
			} \
			break; \
		} \
		if ((!_found) && (_command < argc)) { \
			_invalidArgument = true; \
			Announce("ERROR: Invalid argument \"%s\"", argv[_command]); \
		} \
	}

///	<summary>
///		Print usage information, exiting if the command line was invalid.
///	</summary>
#define PrintCommandLineUsage(argv) \
	if ((_errorCommandLine) || (_invalidArgument)) \
		Announce("\nUsage: %s <Argument List>", argv[0]); \
	Announce("Arguments:"); \
	for (size_t _p = 0; _p < _vecArguments.size(); _p++) \
		_vecArguments[_p]->PrintUsage(); \
	if ((_errorCommandLine) || (_invalidArgument)) { \
		for (size_t _p = 0; _p < _vecArguments.size(); _p++) \
			delete _vecArguments[_p]; \
		exit(-1); \
	}

///	<summary>
///		End the definition of command line parameters.
///	</summary>
#define EndCommandLine(argv) \
		PrintCommandLineUsage(argv); \
		for (size_t _p = 0; _p < _vecArguments.size(); _p++) { \
			delete _vecArguments[_p]; \
		} \
	}

///	<summary>
///		Concatenate the command line into a string.
///	</summary>
inline std::string GetCommandLineAsString(int argc, char ** argv) {
	std::string strCommandLine;
	for (int i = 0; i < argc; i++) {
		strCommandLine += argv[i];
		if (i != argc-1) {
			strCommandLine += " ";
		}
	}
	return strCommandLine;
}

///////////////////////////////////////////////////////////////////////////////

#endif

