///////////////////////////////////////////////////////////////////////////////
///
///	\file    Exception.h
///	\author  Paul Ullrich
///	\version October 18, 2026
///
///	<summary>
///		This file provides functionality for formatted Exceptions.
///	</summary>
///	<remarks>
///		Copyright 2000-2010 Paul Ullrich
///
///		This file is distributed as part of the Tempest source code package.
///		Permission is granted to use, copy, modify and distribute this
///		source code and its documentation under the terms of the GNU General
///		Public License.  This software is provided "as is" without express
///		or implied warranty.
///	</remarks>

#ifndef _EXCEPTION_H_
#define _EXCEPTION_H_

///////////////////////////////////////////////////////////////////////////////

#include <string>
#include <cstdio>
#include <cstdarg>

///////////////////////////////////////////////////////////////////////////////

#define _EXCEPTION() \
throw Exception(__FILE__, __LINE__)

#define _EXCEPTIONT(text) \
throw Exception(__FILE__, __LINE__, text)

#define _EXCEPTION1(text, var1) \
throw Exception(__FILE__, __LINE__, text, var1)

#define _EXCEPTION2(text, var1, var2) \
throw Exception(__FILE__, __LINE__, text, var1, var2)

#define _EXCEPTION3(text, var1, var2, var3) \
throw Exception(__FILE__, __LINE__, text, var1, var2, var3)

#define _EXCEPTION4(text, var1, var2, var3, var4) \
throw Exception(__FILE__, __LINE__, text, var1, var2, var3, var4)

///////////////////////////////////////////////////////////////////////////////
//
// Typed exceptions.  The first argument is a member of Exception::Type.
//
#define _EXCEPTIONXT(type, text) \
throw Exception(type, __FILE__, __LINE__, text)

#define _EXCEPTIONX1(type, text, var1) \
throw Exception(type, __FILE__, __LINE__, text, var1)

#define _EXCEPTIONX2(type, text, var1, var2) \
throw Exception(type, __FILE__, __LINE__, text, var1, var2)

#define _EXCEPTIONX3(type, text, var1, var2, var3) \
throw Exception(type, __FILE__, __LINE__, text, var1, var2, var3)

#define _EXCEPTIONX4(type, text, var1, var2, var3, var4) \
throw Exception(type, __FILE__, __LINE__, text, var1, var2, var3, var4)

///////////////////////////////////////////////////////////////////////////////

#ifdef NDEBUG
#define _ASSERT(x)
#else
#define _ASSERT(x) \
	{ if (!(x)) { _EXCEPTION1("Assertion failure: %s", #x); } }
#endif

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		An Exception is a formatted error message that is generated from a
///		throw directive.  This class is automatically generated when using
///		the _EXCEPTION macros.
///	</summary>
class Exception {

public:
	///	<summary>
	///		Maximum buffer size for exception strings.
	///	</summary>
	static const int ExceptionBufferSize = 1024;

	///	<summary>
	///		Category of failure.  Every type other than General is terminal
	///		for the request that raised it.
	///	</summary>
	enum Type {
		General,
		NoMatchingRecord,
		AmbiguousMatch,
		UnsupportedVerticalCoordinate,
		MalformedYinYangGrid,
		InconsistentGridShape,
		PrecisionPolicyViolation,
		InterpolationToolFailed,
		InterpolationTimeout,
		WorkspaceIOError
	};

public:
	///	<summary>
	///		Generic constructor.
	///	</summary>
	Exception(
		const char * szFile,
		unsigned int uiLine
	) :
		m_eType(General),
		m_strText("General exception"),
		m_strFile(szFile),
		m_uiLine(uiLine)
	{ }

	///	<summary>
	///		Constructor with text and variables.
	///	</summary>
	Exception(
		const char * szFile,
		unsigned int uiLine,
		const char * szText,
		...
	) :
		m_eType(General),
		m_strFile(szFile),
		m_uiLine(uiLine)
	{
		char szBuffer[ExceptionBufferSize];

		va_list arguments;
		va_start(arguments, szText);
		vsnprintf(szBuffer, ExceptionBufferSize, szText, arguments);
		va_end(arguments);

		m_strText = szBuffer;
	}

	///	<summary>
	///		Constructor with type, text and variables.
	///	</summary>
	Exception(
		Type eType,
		const char * szFile,
		unsigned int uiLine,
		const char * szText,
		...
	) :
		m_eType(eType),
		m_strFile(szFile),
		m_uiLine(uiLine)
	{
		char szBuffer[ExceptionBufferSize];

		va_list arguments;
		va_start(arguments, szText);
		vsnprintf(szBuffer, ExceptionBufferSize, szText, arguments);
		va_end(arguments);

		m_strText = szBuffer;
	}

public:
	///	<summary>
	///		Name of the given exception type.
	///	</summary>
	static const char * TypeName(Type eType) {
		switch (eType) {
			case NoMatchingRecord:
				return "NoMatchingRecord";
			case AmbiguousMatch:
				return "AmbiguousMatch";
			case UnsupportedVerticalCoordinate:
				return "UnsupportedVerticalCoordinate";
			case MalformedYinYangGrid:
				return "MalformedYinYangGrid";
			case InconsistentGridShape:
				return "InconsistentGridShape";
			case PrecisionPolicyViolation:
				return "PrecisionPolicyViolation";
			case InterpolationToolFailed:
				return "InterpolationToolFailed";
			case InterpolationTimeout:
				return "InterpolationTimeout";
			case WorkspaceIOError:
				return "WorkspaceIOError";
			default:
				return "General";
		}
	}

	///	<summary>
	///		Get the category of this exception.
	///	</summary>
	Type GetType() const {
		return m_eType;
	}

	///	<summary>
	///		Get the text of this exception.
	///	</summary>
	const std::string & GetText() const {
		return m_strText;
	}

	///	<summary>
	///		Get a string representation of this exception.
	///	</summary>
	std::string ToString() const {
		std::string strReturn;

		char szBuffer[128];

		// Preamble
		if (m_eType == General) {
			snprintf(szBuffer, 128, "EXCEPTION (");
		} else {
			snprintf(szBuffer, 128, "EXCEPTION %s (", TypeName(m_eType));
		}
		strReturn.append(szBuffer);

		// File name
		strReturn.append(m_strFile);

		// Line number
		snprintf(szBuffer, 128, ", Line %u) ", m_uiLine);
		strReturn.append(szBuffer);

		// Text
		strReturn.append(m_strText);

		return strReturn;
	}

private:
	///	<summary>
	///		Category of this exception.
	///	</summary>
	Type m_eType;

	///	<summary>
	///		A string denoting the error in question.
	///	</summary>
	std::string m_strText;

	///	<summary>
	///		A string containing the filename where the exception occurred.
	///	</summary>
	std::string m_strFile;

	///	<summary>
	///		A constant containing the line number where the exception
	///		occurred.
	///	</summary>
	unsigned int m_uiLine;
};

///////////////////////////////////////////////////////////////////////////////

#endif

