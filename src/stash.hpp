/************************************************
 PNG Stash: implemented in C
 See LICENSE

 Common types, macros, error codes, and the
 parameter data structure.

 C doesn't have dynamic variables, so the command-line
 and config-file parameters are kept in a linked list
 of field=value records.
 ************************************************/
#ifndef STASH_HPP
#define STASH_HPP

#include <stdlib.h>
#include <stdio.h>
#include <unistd.h>
#include <stdint.h>

// Revise the version if there is any significant change
#define STASH_VERSION "0.1.0"

extern int Verbose;

// Common data types
typedef unsigned char byte;

/*****
 Every operation returns one of these.
 STASH_OK means success; everything else is permanent for that input.
 *****/
enum StashError
  {
  STASH_OK=0,
  STASH_NOT_A_PNG,	// bad or missing signature
  STASH_MALFORMED_CHUNK,	// length overrun, bad type, or CRC mismatch
  STASH_TRUNCATED_STREAM,	// no IEND
  STASH_INVALID_TOKEN,	// token fails alphabet/length check
  STASH_TOKEN_NOT_FOUND,	// well-formed token, no matching chunk
  STASH_EMPTY_PLAINTEXT,	// nothing to embed
  STASH_PAYLOAD_TOO_LARGE,	// larger than a PNG chunk can hold
  STASH_TOKEN_COLLISION,	// every drawn token was already in use
  STASH_RANDOM_FAILURE,	// random source failed
  STASH_IO_ERROR,	// file access failed
  STASH_ERROR_MAX
  };

const char *	StashErrorName	(StashError Err);
const char *	StashErrorText	(StashError Err);

struct stashfield
  {
  /*****
   Data type for debugging
   Set by the StashSet* functions.
   'c' for char
   'b' for binary
   'x' for binary shown as a hexdump
   *****/
  char Type;

  /*****
   Data structure for storing field=value sets.
   *****/
  char *Field;
  byte *Value;
  size_t FieldLen; // length of field. e.g., "outfile" would be 7
  size_t ValueLen; // length of value
  struct stashfield *Next;
  };
typedef struct stashfield stashfield;

// Macros and code for debugging
#define WHERESTR  "DEBUG[%s:%d]"
#define WHEREARG  __FILE__, __LINE__
#define DEBUGPRINT2(...)       fprintf(stderr, __VA_ARGS__)
#define DEBUGPRINT(_fmt, ...)  DEBUGPRINT2(WHERESTR ": " _fmt "\n", WHEREARG, __VA_ARGS__)
#define DEBUGWHERE()  DEBUGPRINT2(WHERESTR "\n", WHEREARG)
#define DEBUGWALK(x,y) { DEBUGPRINT2(WHERESTR ": WALK: %s\n", WHEREARG, x); StashWalk(y,false); }
#define DEBUGSHOW(x,y) { DEBUGPRINT2(WHERESTR ": SHOW: %s\n", WHEREARG, x); StashWalk(y,true); }
void	DEBUGhexdump	(size_t DataLen, const byte *Data);

// Common macros
#define Min(x,y)  ( ((x) < (y)) ? (x) : (y) )

// PNG is big-endian everywhere
#define readbe32(buf)	( ((uint32_t)((buf)[0]&0xff)<<24) | ((uint32_t)((buf)[1]&0xff)<<16) | ((uint32_t)((buf)[2]&0xff)<<8) | (uint32_t)((buf)[3]&0xff) )
#define writebe32(buf,u32) { (buf)[0]=((u32)>>24)&0xff; (buf)[1]=((u32)>>16)&0xff; (buf)[2]=((u32)>>8)&0xff; (buf)[3]=(u32)&0xff; }

// Allocation that aborts on failure
void *	StashMalloc	(size_t Len);

// STASH structure functions
void	StashFree	(stashfield *vf);
void	StashWalk	(stashfield *vf, bool ShowOne);
stashfield *	StashDel	(stashfield *vf, const char *Field);
stashfield *	StashAlloc	(stashfield *vfhead, const char *Field, size_t Len, const char Type);
size_t	StashGetSize	(stashfield *vfhead, const char *Field); // value length in bytes
stashfield *	StashSearch	(stashfield *vf, const char *Field);

// Binary data
byte *	StashGetBin	(stashfield *vfhead, const char *Field);
stashfield *	StashSetBin	(stashfield *vfhead, const char *Field, size_t ValueLen, const byte *Value);
stashfield *	StashAddBin	(stashfield *vfhead, const char *Field, size_t ValueLen, const byte *Value);

// Text data
char *	StashGetText	(stashfield *vfhead, const char *Field);
stashfield *	StashSetText	(stashfield *vfhead, const char *Field, const char *Value);
stashfield *	StashSetTextLen	(stashfield *vfhead, const char *Field, size_t ValueLen, const char *Value);
stashfield *	StashAddText	(stashfield *vfhead, const char *Field, const char *Value);

#endif
