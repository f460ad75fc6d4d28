/************************************************
 PNG Stash: implemented in C
 See LICENSE

 Functions for handling the parameters data structure,
 error codes, and debugging output.

 C doesn't have dynamic variables, so use these instead.
 Every field is a name with a text or binary value.
 ************************************************/
#include <stdlib.h>
#include <ctype.h>
#include <string.h>
#include "stash.hpp"

#define PAD 4 /* padding to prevent overflow; should not be needed */

int Verbose=0;

/*****
 Error names match the taxonomy used in messages and tests.
 Order must match enum StashError.
 *****/
static const char *ErrorNames[STASH_ERROR_MAX] = {
  "OK",
  "NotAPng",
  "MalformedChunk",
  "TruncatedStream",
  "InvalidToken",
  "TokenNotFound",
  "EmptyPlaintext",
  "PayloadTooLarge",
  "TokenCollision",
  "RandomFailure",
  "IoError"
  };

static const char *ErrorText[STASH_ERROR_MAX] = {
  "Success",
  "File does not begin with a PNG signature",
  "PNG chunk is corrupted (bad length, type, or CRC)",
  "PNG stream ended before the IEND chunk",
  "Token must be 4 letters (lower, lower, upper, lower)",
  "No message found for this token",
  "Message is empty; nothing to embed",
  "Message is too large for a PNG chunk",
  "Unable to generate an unused token",
  "Random number generator failed",
  "File access failed"
  };

/**************************************
 StashErrorName(): Short name for an error code.
 **************************************/
const char *	StashErrorName	(StashError Err)
{
  if ((Err < STASH_OK) || (Err >= STASH_ERROR_MAX)) { return("Unknown"); }
  return(ErrorNames[Err]);
} /* StashErrorName() */

/**************************************
 StashErrorText(): Human-readable description of an error code.
 **************************************/
const char *	StashErrorText	(StashError Err)
{
  if ((Err < STASH_OK) || (Err >= STASH_ERROR_MAX)) { return("Unknown error"); }
  return(ErrorText[Err]);
} /* StashErrorText() */

/**************************************
 DEBUGhexdump(): Display hexdump of data.
 Strictly for debugging.
 **************************************/
void	DEBUGhexdump	(size_t DataLen, const byte *Data)
{
  size_t line,i;

  for(line=0; line < DataLen; line+=16)
    {
    fprintf(stderr,"%08x | ",(int)line);
    for(i=0; i < 16; i++)
      {
      if (i==8) { fprintf(stderr," "); }
      if (line+i < DataLen) { fprintf(stderr,"%02x ",Data[line+i]); }
      else { fprintf(stderr,"   "); }
      }
    fprintf(stderr,"| ");
    for(i=0; i < 16; i++)
      {
      if (line+i >= DataLen) { break; }
      if (isspace(Data[line+i])) { fprintf(stderr," "); }
      else if (isprint(Data[line+i])) { fprintf(stderr,"%c",Data[line+i]); }
      else { fprintf(stderr,"."); }
      }
    fprintf(stderr,"\n");
    }
} /* DEBUGhexdump() */

/**************************************
 StashMalloc(): Allocate and clear memory.
 Aborts if memory is unavailable.
 Always allocates at least PAD bytes, so Len=0 is fine.
 **************************************/
void *	StashMalloc	(size_t Len)
{
  void *p;
  p = calloc(Len+PAD,1);
  if (!p)
    {
    fprintf(stderr," ERROR: Unable to allocate %lu bytes. Aborting.\n",(unsigned long)Len);
    exit(1);
    }
  return(p);
} /* StashMalloc() */

/**************************************
 StashFree(): Free the chain of stashfield records.
 Caller MUST not use vf anymore.
 **************************************/
void	StashFree	(stashfield *vf)
{
  stashfield *vfnext=NULL;

  while(vf)
    {
    if (vf->Field) { free(vf->Field); }
    if (vf->Value) { free(vf->Value); }
    vfnext = vf->Next;
    free(vf);
    vf = vfnext;
    }
} /* StashFree() */

/**************************************
 StashWalk(): DEBUGGING. Walk the chain of stashfield records.
 **************************************/
void	StashWalk	(stashfield *vf, bool ShowOne)
{
  int num=0;
  size_t i;
  for( ; vf; vf=vf->Next)
    {
    fprintf(stderr,"stashfield[%d]: '%.*s' (type %c, %lu bytes) =",
	num,
	(int)vf->FieldLen, vf->Field,
	vf->Type,
	(unsigned long)vf->ValueLen);
    switch(vf->Type)
	{
	case 'c': fprintf(stderr," '%.*s'\n",(int)vf->ValueLen, vf->Value); break;

	case 'x': // hex dump
	  fprintf(stderr,"\n");
	  DEBUGhexdump(vf->ValueLen,vf->Value);
	  break;

	case 'b':
	default:
	  fprintf(stderr," 0x");
	  for(i=0; i < vf->ValueLen; i++)
	    {
	    fprintf(stderr,"%02x",vf->Value[i]);
	    }
	  fprintf(stderr,"\n");
	  break;
	}
    num++;
    if (ShowOne) { break; }
    }
} /* StashWalk() */

/**************************************
 StashAlloc(): Clear and allocate memory in the stashfield chain.
 Replaces the value if the field already exists.
 Returns: head of stashfield chain.
 **************************************/
stashfield *	StashAlloc	(stashfield *vfhead, const char *Field, size_t ValueLen, const char Type)
{
  stashfield *vf;

  // Find element to replace
  vf = StashSearch(vfhead,Field);
  if (vf)
    {
    if (vf->Value) { free(vf->Value); }
    vf->Type = Type;
    vf->ValueLen = ValueLen;
    vf->Value = (byte*)StashMalloc(ValueLen);
    return(vfhead);
    }

  // Nothing to replace; add to the start of the chain
  vf = (stashfield*)StashMalloc(sizeof(stashfield));
  vf->FieldLen = strlen(Field);
  vf->Field = (char*)StashMalloc(vf->FieldLen); // padding ensures null termination
  memcpy(vf->Field,Field,vf->FieldLen);
  vf->Type = Type;
  vf->ValueLen = ValueLen;
  vf->Value = (byte*)StashMalloc(ValueLen);
  vf->Next = vfhead;
  return(vf);
} /* StashAlloc() */

/**************************************
 StashSetBin(): Insert binary data into the stashfield chain.
 Returns: head of stashfield chain.
 **************************************/
stashfield *	StashSetBin	(stashfield *vfhead, const char *Field, size_t ValueLen, const byte *Value)
{
  stashfield *vf;

  if (!Field) { return(vfhead); }
  if (!Value) { ValueLen=0; }
  vfhead = StashAlloc(vfhead,Field,ValueLen,'b');
  vf = StashSearch(vfhead,Field);
  if (ValueLen) { memcpy(vf->Value,Value,ValueLen); }
  return(vfhead);
} /* StashSetBin() */

/**************************************
 StashSetTextLen(): Put text in the stashfield chain.
 As text, it allocates extra bytes to ensure null termination.
 NOTE: Caller must ensure that Value has ValueLen bytes!
 Returns: head of stashfield chain.
 **************************************/
stashfield *	StashSetTextLen	(stashfield *vfhead, const char *Field, size_t ValueLen, const char *Value)
{
  stashfield *vf;

  if (!Field) { return(vfhead); }
  if (!Value) { ValueLen=0; }
  vfhead = StashAlloc(vfhead,Field,ValueLen,'c');
  vf = StashSearch(vfhead,Field);
  if (ValueLen) { memcpy(vf->Value,Value,ValueLen); }
  return(vfhead);
} /* StashSetTextLen() */

/**************************************
 StashSetText(): Put a null-terminated string in the stashfield chain.
 Returns: head of stashfield chain.
 **************************************/
stashfield *	StashSetText	(stashfield *vfhead, const char *Field, const char *Value)
{
  size_t ValueLen=0;
  if (Value) { ValueLen=strlen(Value); }
  return(StashSetTextLen(vfhead,Field,ValueLen,Value));
} /* StashSetText() */

/**************************************
 StashAddBin(): Append binary data in the stashfield chain.
 Creates the field if it does not exist.
 Returns: head of stashfield chain.
 **************************************/
stashfield *	StashAddBin	(stashfield *vfhead, const char *Field, size_t ValueLen, const byte *Value)
{
  stashfield *vf;
  byte *NewValue;

  // Base case: nothing to add
  if (!Field || !Value || (ValueLen == 0)) { return(vfhead); }

  vf = StashSearch(vfhead,Field);
  if (!vf) { return(StashSetBin(vfhead,Field,ValueLen,Value)); }

  // Found it! Reallocate space and append.
  NewValue = (byte*)StashMalloc(vf->ValueLen+ValueLen);
  memcpy(NewValue,vf->Value,vf->ValueLen);
  memcpy(NewValue+vf->ValueLen,Value,ValueLen);
  free(vf->Value);
  vf->Value = NewValue;
  vf->ValueLen += ValueLen;
  return(vfhead);
} /* StashAddBin() */

/**************************************
 StashAddText(): Append text to the stashfield chain.
 Keeps the field's type (text stays text).
 Returns: head of stashfield chain.
 **************************************/
stashfield *	StashAddText	(stashfield *vfhead, const char *Field, const char *Value)
{
  stashfield *vf;

  if (!Value || !Value[0]) { return(vfhead); }
  vf = StashSearch(vfhead,Field);
  if (!vf) { return(StashSetText(vfhead,Field,Value)); }
  return(StashAddBin(vfhead,Field,strlen(Value),(const byte*)Value));
} /* StashAddText() */

/**************************************
 StashSearch(): Find a field in the chain of stashfield records.
 Returns: stashfield* on match, NULL of missed.
 **************************************/
stashfield *	StashSearch	(stashfield *vf, const char *Field)
{
  size_t FieldLen;

  if (!Field || !vf) { return(NULL); } // idiot checking

  FieldLen = strlen(Field);
  for( ; vf; vf=vf->Next)
    {
    if ((vf->FieldLen == FieldLen) && !memcmp(vf->Field,Field,FieldLen))
	{ return(vf); }
    }
  return(NULL);
} /* StashSearch() */

/**************************************
 StashDel(): Delete a single element (if it exists)
 Returns: New head.
 **************************************/
stashfield *	StashDel	(stashfield *vfhead, const char *Field)
{
  stashfield **vfp, *vf;

  if (!vfhead || !Field) { return(vfhead); }

  // There should only be one element with this Field.
  // But just in case, remove every match.
  vfp = &vfhead;
  while(*vfp)
    {
    vf = *vfp;
    if (!strcmp(vf->Field,Field))
	{
	*vfp = vf->Next;
	free(vf->Field);
	free(vf->Value);
	free(vf);
	}
    else { vfp = &(vf->Next); }
    }
  return(vfhead);
} /* StashDel() */

/**************************************
 StashGetSize(): Find a field in the chain of stashfield records.
 Returns: length of data (0=no data, same as not found)
 **************************************/
size_t	StashGetSize	(stashfield *vfhead, const char *Field)
{
  stashfield *vf;

  vf = StashSearch(vfhead,Field);
  if (!vf) { return(0); }
  return(vf->ValueLen);
} /* StashGetSize() */

/**************************************
 StashGetText(): Find a field in the chain of stashfield records.
 Returns: value as char* on match, NULL if missed.
 **************************************/
char *	StashGetText	(stashfield *vfhead, const char *Field)
{
  stashfield *vf;

  vf = StashSearch(vfhead,Field);
  if (!vf) { return(NULL); }
  return( (char*)(vf->Value) );
} /* StashGetText() */

/**************************************
 StashGetBin(): Find a field in the chain of stashfield records.
 Returns: value as byte* on match, NULL if missed.
 **************************************/
byte *	StashGetBin	(stashfield *vfhead, const char *Field)
{
  stashfield *vf;

  vf = StashSearch(vfhead,Field);
  if (!vf) { return(NULL); }
  return(vf->Value);
} /* StashGetBin() */
