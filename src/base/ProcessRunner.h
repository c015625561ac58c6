///////////////////////////////////////////////////////////////////////////////
///
///	\file    ProcessRunner.h
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


#ifndef _PROCESSRUNNER_H_
#define _PROCESSRUNNER_H_

#include <string>
#include <vector>

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Outcome of running an external program.
///	</summary>
class ProcessResult {

public:
	///	<summary>
	///		Constructor.
	///	</summary>
	ProcessResult() :
		m_iExitStatus(-1),
		m_iSignal(0),
		m_fExecFailed(false),
		m_fTimedOut(false)
	{ }

	///	<summary>
	///		True if the program ran and exited with status zero.
	///	</summary>
	bool Succeeded() const {
		return ((!m_fExecFailed) && (!m_fTimedOut) && (m_iExitStatus == 0));
	}

public:
	///	<summary>
	///		Exit status, or (-1) if the program did not exit normally.
	///	</summary>
	int m_iExitStatus;

	///	<summary>
	///		Signal that terminated the program, or 0.
	///	</summary>
	int m_iSignal;

	///	<summary>
	///		True if the program could not be started.
	///	</summary>
	bool m_fExecFailed;

	///	<summary>
	///		True if the program was killed after the timeout.
	///	</summary>
	bool m_fTimedOut;

	///	<summary>
	///		Standard output and standard error of the program.
	///	</summary>
	std::string m_strOutput;
};

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Runs an external program to completion, capturing its output.
///	</summary>
class ProcessRunner {

public:
	///	<summary>
	///		Run the program vecArgs[0] (searched on the PATH) with the
	///		given arguments and wait for it.  If dTimeout is positive the
	///		program and its children are killed after dTimeout seconds.
	///	</summary>
	static void Run(
		const std::vector<std::string> & vecArgs,
		double dTimeout,
		ProcessResult & result
	);
};

///////////////////////////////////////////////////////////////////////////////

#endif

