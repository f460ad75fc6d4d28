/************************************************
 PNG Stash: implemented in C
 See LICENSE

 Functions for walking a PNG file.

 PNG files are one of the nicest formats for parsing.
 It has an 8-byte magic header that identifies the file format:
    "137 P N G \r \n 26 \n"

 Then comes a series of chunks. (See png-chunk.cpp.)
 The first chunk is IHDR and the final chunk is IEND,
 which should have zero bytes of data:
    \0\0\0\0 IEND \xAE\x42\x60\x82

 The parser only cares about IHDR and IEND.
 Every other chunk is passed through untouched and in order,
 so writing out a parsed list reproduces the original file.
 ************************************************/
#include <stdlib.h>
#include <ctype.h>
#include <string.h>
#include "stash.hpp"
#include "png-chunk.hpp"
#include "png-stream.hpp"

/**************************************
 Stash_isPNG(): Does the buffer begin with a PNG signature?
 Returns: true or false.
 **************************************/
bool	Stash_isPNG	(size_t MemSize, const byte *Mem)
{
  if (!Mem || (MemSize < PNG_SIGNATURE_LEN)) { return(false); }
  if (memcmp(Mem,PNG_SIGNATURE,PNG_SIGNATURE_LEN)) { return(false); } // not a PNG!
  return(true);
} /* Stash_isPNG() */

/**************************************
 PNGListInit(): Start an empty list.
 **************************************/
void	PNGListInit	(pngchunklist *List)
{
  memset(List,0,sizeof(pngchunklist));
} /* PNGListInit() */

/**************************************
 PNGListFree(): Free every chunk and the list storage.
 The list is empty (and reusable) afterwards.
 **************************************/
void	PNGListFree	(pngchunklist *List)
{
  size_t i;
  if (!List) { return; }
  for(i=0; i < List->Count; i++) { PNGChunkFree(List->Chunks+i); }
  if (List->Chunks) { free(List->Chunks); }
  PNGListInit(List);
} /* PNGListFree() */

/**************************************
 PNGListInsert(): Insert a chunk at Index.
 The list takes ownership of the chunk's data;
 Chunk is cleared so the caller cannot free it twice.
 Index past the end appends.
 **************************************/
void	PNGListInsert	(pngchunklist *List, size_t Index, pngchunk *Chunk)
{
  pngchunk *NewChunks;

  if (Index > List->Count) { Index = List->Count; }

  // Grow as needed
  if (List->Count+1 > List->Alloc)
    {
    size_t NewAlloc;
    NewAlloc = (List->Alloc ? List->Alloc*2 : 16);
    NewChunks = (pngchunk*)StashMalloc(NewAlloc*sizeof(pngchunk));
    if (List->Count) { memcpy(NewChunks,List->Chunks,List->Count*sizeof(pngchunk)); }
    if (List->Chunks) { free(List->Chunks); }
    List->Chunks = NewChunks;
    List->Alloc = NewAlloc;
    }

  memmove(List->Chunks+Index+1,List->Chunks+Index,(List->Count-Index)*sizeof(pngchunk));
  List->Chunks[Index] = *Chunk;
  List->Count++;
  memset(Chunk,0,sizeof(pngchunk));
} /* PNGListInsert() */

/**************************************
 PNGListAppend(): Add a chunk to the end of the list.
 **************************************/
void	PNGListAppend	(pngchunklist *List, pngchunk *Chunk)
{
  PNGListInsert(List,List->Count,Chunk);
} /* PNGListAppend() */

/**************************************
 PNGListRemove(): Take the chunk at Index out of the list.
 The order of the remaining chunks is preserved.
 If Removed is set, it receives the chunk (caller must PNGChunkFree).
 Otherwise the chunk is freed.
 **************************************/
void	PNGListRemove	(pngchunklist *List, size_t Index, pngchunk *Removed)
{
  if (Index >= List->Count) { return; }
  if (Removed) { *Removed = List->Chunks[Index]; }
  else { PNGChunkFree(List->Chunks+Index); }
  memmove(List->Chunks+Index,List->Chunks+Index+1,(List->Count-Index-1)*sizeof(pngchunk));
  List->Count--;
} /* PNGListRemove() */

/**************************************
 PNGListFind(): Find the first chunk with this type.
 First match wins.
 Returns: true if found (and sets Index).
 **************************************/
bool	PNGListFind	(const pngchunklist *List, const byte Type[4], size_t *Index)
{
  size_t i;
  for(i=0; i < List->Count; i++)
    {
    if (!memcmp(List->Chunks[i].Type,Type,4))
      {
      if (Index) { *Index=i; }
      return(true);
      }
    }
  return(false);
} /* PNGListFind() */

/**************************************
 PNGParse(): Walk every chunk in the buffer.
 Stops at the IEND; any data after the IEND is ignored.
 On failure, List is left empty.
 Returns: STASH_OK, STASH_NOT_A_PNG, STASH_MALFORMED_CHUNK,
   or STASH_TRUNCATED_STREAM.
 **************************************/
StashError	PNGParse	(size_t MemSize, const byte *Mem, pngchunklist *List)
{
  size_t Offset, Consumed;
  pngchunk Chunk;
  StashError rc;

  PNGListInit(List);

  // Make sure it's a PNG.
  if (!Stash_isPNG(MemSize,Mem)) { return(STASH_NOT_A_PNG); }

  Offset=PNG_SIGNATURE_LEN; // skip PNG header
  while(Offset < MemSize)
    {
    rc = PNGChunkDecode(MemSize,Mem,Offset,&Chunk,&Consumed);
    if (rc != STASH_OK) { PNGListFree(List); return(rc); }
    if (Verbose > 1) { DEBUGPRINT("PNG chunk [%.4s] offset %lu length %lu",(char*)Chunk.Type,(unsigned long)Offset,(unsigned long)Chunk.Length); }

    // The header must come first.
    if ((List->Count==0) && !PNGChunkIs(&Chunk,"IHDR"))
      {
      if (Verbose) { DEBUGPRINT("First chunk is [%.4s], not IHDR",(char*)Chunk.Type); }
      PNGChunkFree(&Chunk);
      PNGListFree(List);
      return(STASH_MALFORMED_CHUNK);
      }

    Offset += Consumed;
    PNGListAppend(List,&Chunk);

    // Stop at the IEND
    if (PNGChunkIs(List->Chunks+List->Count-1,"IEND"))
      {
      if ((Offset < MemSize) && Verbose)
	{
	DEBUGPRINT("Ignoring %lu bytes after IEND",(unsigned long)(MemSize-Offset));
	}
      return(STASH_OK);
      }
    }

  // Ran out of data before IEND
  PNGListFree(List);
  return(STASH_TRUNCATED_STREAM);
} /* PNGParse() */

/**************************************
 PNGSerializedSize(): Bytes needed for the signature and every chunk.
 **************************************/
size_t	PNGSerializedSize	(const pngchunklist *List)
{
  size_t i, Total;
  Total = PNG_SIGNATURE_LEN;
  for(i=0; i < List->Count; i++) { Total += PNGChunkSize(List->Chunks+i); }
  return(Total);
} /* PNGSerializedSize() */

/**************************************
 PNGSerialize(): Write the signature and every chunk in order.
 Returns: allocated buffer (caller must free) and sets OutLen.
 **************************************/
byte *	PNGSerialize	(const pngchunklist *List, size_t *OutLen)
{
  byte *Out;
  size_t Len, Offset, i;

  Len = PNGSerializedSize(List);
  Out = (byte*)StashMalloc(Len);
  memcpy(Out,PNG_SIGNATURE,PNG_SIGNATURE_LEN);
  Offset = PNG_SIGNATURE_LEN;
  for(i=0; i < List->Count; i++)
    {
    Offset += PNGChunkEncode(List->Chunks+i,Out+Offset);
    }
  if (OutLen) { *OutLen = Len; }
  return(Out);
} /* PNGSerialize() */
