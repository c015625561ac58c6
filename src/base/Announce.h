///////////////////////////////////////////////////////////////////////////////
///
///	\file    Announce.h
///	\author  Paul Ullrich
///	\version October 18, 2026
///
///	<summary>
///		Functions for making announcements to standard output with
///		indented blocks and a verbosity threshold.
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

#ifndef _ANNOUNCE_H_
#define _ANNOUNCE_H_

#include <cstdio>

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Get the output buffer for announcements.
///	</summary>
FILE * AnnounceGetOutputBuffer();

///	<summary>
///		Redirect announcements to the given buffer.
///	</summary>
void AnnounceSetOutputBuffer(FILE * fpAnnounceOutput);

///	<summary>
///		Set the verbosity level.  Announcements with a verbosity above this
///		level are suppressed.
///	</summary>
void AnnounceSetVerbosityLevel(int iVerbosityLevel);

///	<summary>
///		Get the verbosity level.
///	</summary>
int AnnounceGetVerbosityLevel();

///	<summary>
///		Begin a new announcement block.
///	</summary>
void AnnounceStartBlock(const char * szText, ...);

///	<summary>
///		Begin a new announcement block at the given verbosity.
///	</summary>
void AnnounceStartBlock(int iVerbosity, const char * szText);

///	<summary>
///		End an announcement block.
///	</summary>
void AnnounceEndBlock(const char * szText, ...);

///	<summary>
///		End an announcement block at the given verbosity.
///	</summary>
void AnnounceEndBlock(int iVerbosity, const char * szText);

///	<summary>
///		Make an announcement.
///	</summary>
void Announce(const char * szText, ...);

///	<summary>
///		Make an announcement at the given verbosity.
///	</summary>
void Announce(int iVerbosity, const char * szText, ...);

///	<summary>
///		Create a banner / separator containing the specified text.
///	</summary>
void AnnounceBanner(const char * szText = NULL);

///	<summary>
///		Get the current indentation level.
///	</summary>
int AnnounceGetIndentationLevel();

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		An announcement block at the given verbosity that is closed when
///		it goes out of scope, including when an exception is thrown
///		inside it.
///	</summary>
class AnnounceBlock {

public:
	///	<summary>
	///		Constructor.  Begins the block.
	///	</summary>
	AnnounceBlock(
		int iVerbosity,
		const char * szText
	) :
		m_iVerbosity(iVerbosity),
		m_fOpen(true)
	{
		AnnounceStartBlock(iVerbosity, szText);
	}

	///	<summary>
	///		Destructor.  Ends the block if it is still open.
	///	</summary>
	~AnnounceBlock() {
		End(NULL);
	}

	///	<summary>
	///		End the block with the given text.
	///	</summary>
	void End(const char * szText) {
		if (m_fOpen) {
			m_fOpen = false;
			AnnounceEndBlock(m_iVerbosity, szText);
		}
	}

private:
	AnnounceBlock(const AnnounceBlock &);
	AnnounceBlock & operator=(const AnnounceBlock &);

private:
	///	<summary>
	///		Verbosity of the block.
	///	</summary>
	int m_iVerbosity;

	///	<summary>
	///		True until the block has been ended.
	///	</summary>
	bool m_fOpen;
};

///////////////////////////////////////////////////////////////////////////////

#endif

