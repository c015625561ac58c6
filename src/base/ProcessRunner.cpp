///////////////////////////////////////////////////////////////////////////////
///
///	\file    ProcessRunner.cpp
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


#include "ProcessRunner.h"
#include "Announce.h"
#include "Exception.h"

#include <cerrno>
#include <cstring>
#include <ctime>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <unistd.h>
#include <sys/types.h>
#include <sys/wait.h>

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Seconds elapsed on the monotonic clock since tsStart.
///	</summary>
static double ElapsedSeconds(const struct timespec & tsStart) {
	struct timespec tsNow;
	clock_gettime(CLOCK_MONOTONIC, &tsNow);
	return static_cast<double>(tsNow.tv_sec - tsStart.tv_sec)
		+ 1.0e-9 * static_cast<double>(tsNow.tv_nsec - tsStart.tv_nsec);
}

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Append everything that can be read from fd without blocking.
///		Returns false once the write end is closed.
///	</summary>
static bool DrainPipe(int fd, std::string & strOutput) {
	char szBuffer[4096];
	for (;;) {
		ssize_t nRead = read(fd, szBuffer, sizeof(szBuffer));
		if (nRead > 0) {
			strOutput.append(szBuffer, nRead);
			continue;
		}
		if (nRead == 0) {
			return false;
		}
		if (errno == EINTR) {
			continue;
		}
		if ((errno == EAGAIN) || (errno == EWOULDBLOCK)) {
			return true;
		}
		return false;
	}
}

///////////////////////////////////////////////////////////////////////////////

void ProcessRunner::Run(
	const std::vector<std::string> & vecArgs,
	double dTimeout,
	ProcessResult & result
) {
	result = ProcessResult();

	if (vecArgs.size() == 0) {
		_EXCEPTIONT("No program to run");
	}

	std::vector<char *> vecArgv;
	for (size_t i = 0; i < vecArgs.size(); i++) {
		vecArgv.push_back(const_cast<char *>(vecArgs[i].c_str()));
	}
	vecArgv.push_back(NULL);

	// Output pipe, and a pipe that is closed on a successful exec
	int fdOutput[2];
	int fdExec[2];
	if (pipe(fdOutput) != 0) {
		_EXCEPTION1("Unable to create pipe (%s)", strerror(errno));
	}
	if (pipe(fdExec) != 0) {
		close(fdOutput[0]);
		close(fdOutput[1]);
		_EXCEPTION1("Unable to create pipe (%s)", strerror(errno));
	}
	fcntl(fdExec[1], F_SETFD, FD_CLOEXEC);

	Announce(1, "Running \"%s\"", vecArgs[0].c_str());

	pid_t pid = fork();
	if (pid < 0) {
		int iErrno = errno;
		close(fdOutput[0]);
		close(fdOutput[1]);
		close(fdExec[0]);
		close(fdExec[1]);
		_EXCEPTION1("Unable to fork (%s)", strerror(iErrno));
	}

	// Child: own process group so that a timeout kills all descendants
	if (pid == 0) {
		setpgid(0, 0);
		dup2(fdOutput[1], STDOUT_FILENO);
		dup2(fdOutput[1], STDERR_FILENO);
		close(fdOutput[0]);
		close(fdOutput[1]);
		close(fdExec[0]);

		execvp(vecArgv[0], &(vecArgv[0]));

		int iErrno = errno;
		ssize_t nWritten = write(fdExec[1], &iErrno, sizeof(int));
		(void)nWritten;
		_exit(127);
	}

	setpgid(pid, pid);

	close(fdOutput[1]);
	close(fdExec[1]);

	// Did the exec succeed
	int iExecErrno = 0;
	ssize_t nExecRead;
	do {
		nExecRead = read(fdExec[0], &iExecErrno, sizeof(int));
	} while ((nExecRead < 0) && (errno == EINTR));
	close(fdExec[0]);

	if (nExecRead == sizeof(int)) {
		close(fdOutput[0]);
		waitpid(pid, NULL, 0);

		result.m_fExecFailed = true;
		result.m_strOutput = std::string("Unable to execute \"")
			+ vecArgs[0] + "\": " + strerror(iExecErrno);
		return;
	}

	fcntl(fdOutput[0], F_SETFL, fcntl(fdOutput[0], F_GETFL) | O_NONBLOCK);

	struct timespec tsStart;
	clock_gettime(CLOCK_MONOTONIC, &tsStart);

	bool fPipeOpen = true;
	int iStatus = 0;

	for (;;) {
		struct pollfd pfd;
		pfd.fd = (fPipeOpen)?(fdOutput[0]):(-1);
		pfd.events = POLLIN;
		pfd.revents = 0;

		poll(&pfd, 1, 50);

		if (fPipeOpen) {
			fPipeOpen = DrainPipe(fdOutput[0], result.m_strOutput);
		}

		pid_t pidDone = waitpid(pid, &iStatus, WNOHANG);
		if (pidDone == pid) {
			break;
		}
		if ((pidDone < 0) && (errno != EINTR)) {
			int iErrno = errno;
			close(fdOutput[0]);
			_EXCEPTION1("Unable to wait for child process (%s)",
				strerror(iErrno));
		}

		if ((dTimeout > 0.0) && (ElapsedSeconds(tsStart) > dTimeout)) {
			kill(-pid, SIGKILL);
			while ((waitpid(pid, &iStatus, 0) < 0) && (errno == EINTR)) { }
			result.m_fTimedOut = true;
			break;
		}
	}

	if (fPipeOpen) {
		DrainPipe(fdOutput[0], result.m_strOutput);
	}
	close(fdOutput[0]);

	if (WIFEXITED(iStatus)) {
		result.m_iExitStatus = WEXITSTATUS(iStatus);
	} else if (WIFSIGNALED(iStatus)) {
		result.m_iSignal = WTERMSIG(iStatus);
	}

	Announce(1, "\"%s\" finished (status %i%s)",
		vecArgs[0].c_str(), result.m_iExitStatus,
		(result.m_fTimedOut)?(", timed out"):(""));
}

///////////////////////////////////////////////////////////////////////////////

