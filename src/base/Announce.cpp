///////////////////////////////////////////////////////////////////////////////
///
///	\file    Announce.cpp
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

#include "Announce.h"

#include <cstdio>
#include <cstring>
#include <cstdarg>

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Verbosity level.
///	</summary>
static int s_iVerbosityLevel = 0;

///	<summary>
///		Output buffer (stdout if NULL).
///	</summary>
static FILE * s_fpAnnounceOutput = NULL;

///	<summary>
///		Maximum announcement buffer size.
///	</summary>
static const int AnnouncementBufferSize = 1024;

///	<summary>
///		Maximum indentation level.
///	</summary>
static const int MaximumIndentationLevel = 16;

///	<summary>
///		Banner size.
///	</summary>
static const int BannerSize = 60;

///	<summary>
///		Current indentation level.
///	</summary>
static int s_nIndentationLevel = 0;

///	<summary>
///		Flag indicating whether a start block is still dangling.
///	</summary>
static bool s_fBlockFlag = false;

///////////////////////////////////////////////////////////////////////////////

static void FormatAnnouncement(
	char * szBuffer,
	const char * szText,
	va_list arguments
) {
	int nc = vsnprintf(szBuffer, AnnouncementBufferSize, szText, arguments);
	if (nc > AnnouncementBufferSize-2) {
		szBuffer[AnnouncementBufferSize-4] = '.';
		szBuffer[AnnouncementBufferSize-3] = '.';
		szBuffer[AnnouncementBufferSize-2] = '.';
		szBuffer[AnnouncementBufferSize-1] = '\0';
	}
}

///////////////////////////////////////////////////////////////////////////////

static void WriteIndentedLine(const char * szBuffer) {
	FILE * fp = AnnounceGetOutputBuffer();

	if (s_fBlockFlag) {
		fprintf(fp, "\n");
		s_fBlockFlag = false;
	}
	for (int i = 0; i < s_nIndentationLevel; i++) {
		fprintf(fp, "..");
	}
	fprintf(fp, "%s\n", szBuffer);
	fflush(fp);
}

///////////////////////////////////////////////////////////////////////////////

FILE * AnnounceGetOutputBuffer() {
	if (s_fpAnnounceOutput == NULL) {
		return stdout;
	}
	return s_fpAnnounceOutput;
}

///////////////////////////////////////////////////////////////////////////////

void AnnounceSetOutputBuffer(FILE * fpAnnounceOutput) {
	s_fpAnnounceOutput = fpAnnounceOutput;
}

///////////////////////////////////////////////////////////////////////////////

void AnnounceSetVerbosityLevel(int iVerbosityLevel) {
	s_iVerbosityLevel = iVerbosityLevel;
}

///////////////////////////////////////////////////////////////////////////////

int AnnounceGetVerbosityLevel() {
	return s_iVerbosityLevel;
}

///////////////////////////////////////////////////////////////////////////////

void AnnounceStartBlock(
	const char * szText,
	...
) {
	// Do not start a block at maximum indentation level
	if (s_nIndentationLevel == MaximumIndentationLevel) {
		return;
	}
	if (szText == NULL) {
		return;
	}

	FILE * fp = AnnounceGetOutputBuffer();

	// Check the block flag
	if (s_fBlockFlag) {
		fprintf(fp, "\n");
	}

	char szBuffer[AnnouncementBufferSize];
	va_list arguments;
	va_start(arguments, szText);
	FormatAnnouncement(szBuffer, szText, arguments);
	va_end(arguments);

	// Output with proper indentation
	for (int i = 0; i < s_nIndentationLevel; i++) {
		fprintf(fp, "..");
	}
	fprintf(fp, "%s", szBuffer);

	s_fBlockFlag = true;
	s_nIndentationLevel++;

	fflush(fp);
}

///////////////////////////////////////////////////////////////////////////////

void AnnounceStartBlock(
	int iVerbosity,
	const char * szText
) {
	if (iVerbosity > s_iVerbosityLevel) {
		return;
	}

	AnnounceStartBlock("%s", szText);
}

///////////////////////////////////////////////////////////////////////////////

void AnnounceEndBlock(
	const char * szText,
	...
) {
	// Do not remove a block at minimum indentation level
	if (s_nIndentationLevel == 0) {
		return;
	}

	FILE * fp = AnnounceGetOutputBuffer();

	if (szText != NULL) {
		char szBuffer[AnnouncementBufferSize];
		va_list arguments;
		va_start(arguments, szText);
		FormatAnnouncement(szBuffer, szText, arguments);
		va_end(arguments);

		if (s_fBlockFlag) {
			s_fBlockFlag = false;
			fprintf(fp, ".. %s\n", szBuffer);

		} else {
			WriteIndentedLine(szBuffer);
		}

	} else if (s_fBlockFlag) {
		s_fBlockFlag = false;
		fprintf(fp, "\n");
	}

	s_nIndentationLevel--;

	fflush(fp);
}

///////////////////////////////////////////////////////////////////////////////

void AnnounceEndBlock(
	int iVerbosity,
	const char * szText
) {
	if (iVerbosity > s_iVerbosityLevel) {
		return;
	}

	if (szText == NULL) {
		AnnounceEndBlock(NULL);
	} else {
		AnnounceEndBlock("%s", szText);
	}
}

///////////////////////////////////////////////////////////////////////////////

void Announce(const char * szText, ...) {

	// If no text, only terminate a dangling block
	if (szText == NULL) {
		if (s_fBlockFlag) {
			fprintf(AnnounceGetOutputBuffer(), "\n");
			s_fBlockFlag = false;
		}
		return;
	}

	char szBuffer[AnnouncementBufferSize];
	va_list arguments;
	va_start(arguments, szText);
	FormatAnnouncement(szBuffer, szText, arguments);
	va_end(arguments);

	WriteIndentedLine(szBuffer);
}

///////////////////////////////////////////////////////////////////////////////

void Announce(
	int iVerbosity,
	const char * szText,
	...
) {
	// Check verbosity
	if (iVerbosity > s_iVerbosityLevel) {
		return;
	}
	if (szText == NULL) {
		return;
	}

	char szBuffer[AnnouncementBufferSize];
	va_list arguments;
	va_start(arguments, szText);
	FormatAnnouncement(szBuffer, szText, arguments);
	va_end(arguments);

	WriteIndentedLine(szBuffer);
}

///////////////////////////////////////////////////////////////////////////////

void AnnounceBanner(const char * szText) {

	FILE * fp = AnnounceGetOutputBuffer();

	// Turn off the block flag
	if (s_fBlockFlag) {
		fprintf(fp, "\n");
		s_fBlockFlag = false;
	}

	// No text in banner
	int i;
	if (szText == NULL) {
		for (i = 0; i < BannerSize; i++) {
			fprintf(fp, "-");
		}
		fprintf(fp, "\n");
		fflush(fp);
		return;
	}

	// Text in banner
	int nLen = strlen(szText) + 2;
	fprintf(fp, "--");
	if (nLen > BannerSize - 2) {
		fprintf(fp, "%s--", szText);
	} else {
		fprintf(fp, " %s ", szText);
		for (i = 0; i < BannerSize - nLen - 2; i++) {
			fprintf(fp, "-");
		}
	}
	fprintf(fp, "\n");
	fflush(fp);
}

///////////////////////////////////////////////////////////////////////////////

int AnnounceGetIndentationLevel() {
	return s_nIndentationLevel;
}

///////////////////////////////////////////////////////////////////////////////

