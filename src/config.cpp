/************************************************
 PNG Stash: implemented in C
 See LICENSE

 Reading the configuration file.

 The config file is a list of field=value lines.
 Lines beginning with '#' are comments.
 Only fields that already exist as parameters can be set,
 so a typo is caught instead of silently ignored.
 ************************************************/
// C headers
#include <stdlib.h>
#include <stdio.h>
#include <unistd.h>
#include <ctype.h>
#include <string.h>

#include "stash.hpp"
#include "config.hpp"

/**************************************
 ReadCfg(): Read the config file.
 A config file can overwrite any already-known parameters.
 Returns: Args, or exits on a bad config file.
 **************************************/
stashfield *	ReadCfg	(stashfield *Args)
{
  char *fname;
  FILE *fp;
  int c,b;
  int fieldlen,valuestart;
  /*****
   Finite state machine states
   0=read field
   1=read padding to =
   2=read padding after =
   3=read value
   4=ignore line (comment)
   *****/
  int LineNo,state;
  char Buf[1024]; // no more than 1K per line

  fname = StashGetText(Args,"config");
  if (!fname || !fname[0]) { return(Args); }
  if (access(fname, F_OK) != 0) // if file does not exist
    {
    return(Args);
    }

  fp=fopen(fname,"r");
  if (!fp)
    {
    fprintf(stderr," ERROR: Unable to read configuration file: '%s'\n",fname);
    exit(1);
    }

  /* Read the file; a final line without '\n' still counts */
  b=0;
  memset(Buf,0,1024);
  state = fieldlen = valuestart = 0;
  LineNo=1;
  do
    {
    c=fgetc(fp);
    if (b >= 1023)
	{
	fprintf(stderr," ERROR: configuration file line too long: line %d in '%s'\n",LineNo,fname);
	exit(1);
	}

    if ((c=='\n') || (c < 0)) // end of line!
	{
	// check for valid line
	if (state==4) { ; } // comment
	else if ((state==0) && (fieldlen==0)) { ; } // blank line
	else if (state==3) // good field/value
	  {
	  // trim trailing spaces from the value
	  while((b > valuestart) && isspace((unsigned char)Buf[b-1])) { b--; }
	  Buf[b]='\0';
	  Buf[fieldlen]='\0'; // null-terminate field name
	  if (!StashSearch(Args,Buf))
	    {
	    fprintf(stderr," ERROR: unknown field '%.*s': line %d in '%s'\n",fieldlen,Buf,LineNo,fname);
	    exit(1);
	    }
	  if (Verbose > 1) { DEBUGPRINT("Config line %d: %s='%s'",LineNo,Buf,Buf+valuestart); }
	  Args=StashSetText(Args,Buf,Buf+valuestart);
	  }
	else if (state==2) // field with an empty value
	  {
	  Buf[fieldlen]='\0';
	  if (!StashSearch(Args,Buf))
	    {
	    fprintf(stderr," ERROR: unknown field '%.*s': line %d in '%s'\n",fieldlen,Buf,LineNo,fname);
	    exit(1);
	    }
	  Args=StashSetText(Args,Buf,"");
	  }
	else // unknown line format
	  {
	  fprintf(stderr," ERROR: configuration file bad format: line %d in '%s'\n",LineNo,fname);
	  exit(1);
	  }

	// Reset for next line
	LineNo++;
	b=0;
	memset(Buf,0,1024);
	state = fieldlen = valuestart = 0;
	continue;
	}

    if (state==4) { continue; } // ignore it

    if (state==0) // reading field name
	{
	if ((fieldlen==0) && (c=='#')) { state=4; continue; } // comment
	if ((fieldlen==0) && isspace(c)) { continue; } // skip initial spaces
	if ((fieldlen==0) && !isalnum(c)) // bad start
	  {
	  fprintf(stderr," ERROR: configuration file bad initial character: line %d in '%s'\n",LineNo,fname);
	  exit(1);
	  }
	if (isalnum(c))
	  {
	  Buf[b]=c; b++;
	  fieldlen++;
	  continue;
	  }
	else if (isspace(c)) { Buf[b]=c; b++; state=1; continue; }
	else if (c=='=') { Buf[b]=c; b++; state=2; continue; }
	else
	  {
	  fprintf(stderr," ERROR: configuration file bad field name: line %d in '%s'\n",LineNo,fname);
	  exit(1);
	  }
	}

    if (state==1) // reading space before "="
	{
	if (isspace(c)) { continue; } // skip it
	else if (c=='=') // Got separator!
	  {
	  Buf[b]=c; b++;
	  state=2;
	  continue;
	  }
	fprintf(stderr," ERROR: configuration file missing '=': line %d in '%s'\n",LineNo,fname);
	exit(1);
	}

    if (state==2) // reading space after "="
	{
	if (isspace(c)) { continue; } // skip it
	valuestart=b; // Got start of value!
	state=3; // fall through to reading value
	}

    if (state==3) // reading value
	{
	Buf[b]=c; b++;
	}
    } while(c >= 0);

  fclose(fp);
  return(Args);
} /* ReadCfg() */
