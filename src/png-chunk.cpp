/************************************************
 PNG Stash: implemented in C
 See LICENSE

 Functions for handling a single PNG chunk.

 Each 'chunk' consists of:

   4 bytes : length of the data (big-endian).
     No chunk can be longer than 2^31-1 bytes.

   4 bytes : Four character code (FCC) defining the type of chunk.
     Every byte is an ASCII letter. Bit 5 (0x20) of each byte is a flag:
     1st letter: uppercase is critical, lowercase is ancillary (optional)
     2nd letter: uppercase is public data, lowercase is private (unpublished)
     3rd letter: reserved, always uppercase.
     4th letter: "safe to copy", uppercase is unsafe, lowercase is safe.

   length bytes : the data for the chunk

   4 bytes : CRC checksum to detect chunk tampering.
     The CRC covers type+data, not the length or the CRC.

 Any PNG reader will reject a chunk with a bad CRC, so the CRC
 must be the standard one (polynomial 0xedb88320, reflected).
 ************************************************/
#include <stdlib.h>
#include <ctype.h>
#include <string.h>
#include "stash.hpp"
#include "png-chunk.hpp"

#pragma GCC visibility push(hidden)
static uint32_t _PNG_table[256];
static bool _PNG_table_ready=false;

/**************************************
 _PNGCrcUpdate(): Add data to a running CRC.
 Starts with 0xffffffff and ends by inverting the bits.
 **************************************/
static uint32_t	_PNGCrcUpdate	(uint32_t crc, size_t DataLen, const byte *Data)
{
  size_t n,j;
  uint32_t c;

  // Populate the CRC table
  if (!_PNG_table_ready)
    {
    for(n=0; n < 256; n++)
      {
      c = (uint32_t)n;
      for(j=0; j < 8; j++)
	{
	if (c & 1) { c = 0xedb88320L ^ (c>>1); }
	else { c = (c>>1); }
	}
      _PNG_table[n] = c;
      }
    _PNG_table_ready=true;
    }

  for(n=0; n < DataLen; n++)
    {
    crc = _PNG_table[(crc^Data[n]) & 0xff]^(crc>>8);
    }
  return(crc);
} /* _PNGCrcUpdate() */

#pragma GCC visibility pop

/**************************************
 PNGCrc32(): Calculate the PNG checksum over one buffer.
 **************************************/
uint32_t	PNGCrc32	(size_t DataLen, const byte *Data)
{
  return(_PNGCrcUpdate(0xffffffffL,DataLen,Data) ^ 0xffffffffL);
} /* PNGCrc32() */

/**************************************
 PNGChunkCrc(): Calculate the PNG checksum for a chunk.
 The type and the data may live in different buffers.
 **************************************/
uint32_t	PNGChunkCrc	(const byte Type[4], size_t DataLen, const byte *Data)
{
  uint32_t crc;
  crc = _PNGCrcUpdate(0xffffffffL,4,Type);
  crc = _PNGCrcUpdate(crc,DataLen,Data);
  return(crc ^ 0xffffffffL);
} /* PNGChunkCrc() */

/**************************************
 PNGTypeIsValid(): Is every byte an ASCII letter?
 (isalpha() is locale-dependent, so check the ranges.)
 **************************************/
bool	PNGTypeIsValid	(const byte Type[4])
{
  int i;
  for(i=0; i < 4; i++)
    {
    if ((Type[i] >= 'A') && (Type[i] <= 'Z')) { continue; }
    if ((Type[i] >= 'a') && (Type[i] <= 'z')) { continue; }
    return(false);
    }
  return(true);
} /* PNGTypeIsValid() */

/***** Property bits; each is bit 5 of one byte. *****/
bool	PNGTypeIsCritical	(const byte Type[4])
{
  return((Type[0] & 0x20) == 0);
}

bool	PNGTypeIsPublic	(const byte Type[4])
{
  return((Type[1] & 0x20) == 0);
}

bool	PNGTypeIsReservedValid	(const byte Type[4])
{
  return((Type[2] & 0x20) == 0);
}

bool	PNGTypeIsSafeToCopy	(const byte Type[4])
{
  return((Type[3] & 0x20) != 0);
}

/**************************************
 PNGChunkIs(): Does the chunk have this exact four character code?
 Case sensitive: "IEND" is not "iend".
 **************************************/
bool	PNGChunkIs	(const pngchunk *Chunk, const char *FourCC)
{
  if (!Chunk || !FourCC) { return(false); }
  return(memcmp(Chunk->Type,FourCC,4)==0);
} /* PNGChunkIs() */

/**************************************
 PNGChunkInit(): Create a chunk from a type and data.
 Copies the data and computes the CRC.
 Returns: STASH_OK or STASH_PAYLOAD_TOO_LARGE.
 **************************************/
StashError	PNGChunkInit	(pngchunk *Chunk, const byte Type[4], size_t DataLen, const byte *Data)
{
  memset(Chunk,0,sizeof(pngchunk));
  if (DataLen > PNG_MAX_CHUNK_LEN) { return(STASH_PAYLOAD_TOO_LARGE); }

  memcpy(Chunk->Type,Type,4);
  Chunk->Length = (uint32_t)DataLen;
  Chunk->Data = (byte*)StashMalloc(DataLen);
  if (DataLen) { memcpy(Chunk->Data,Data,DataLen); }
  Chunk->Crc = PNGChunkCrc(Chunk->Type,Chunk->Length,Chunk->Data);
  return(STASH_OK);
} /* PNGChunkInit() */

/**************************************
 PNGChunkFree(): Release the chunk's data.
 The pngchunk itself is owned by the caller.
 **************************************/
void	PNGChunkFree	(pngchunk *Chunk)
{
  if (!Chunk) { return; }
  if (Chunk->Data) { free(Chunk->Data); }
  memset(Chunk,0,sizeof(pngchunk));
} /* PNGChunkFree() */

/**************************************
 PNGChunkDecode(): Read one chunk starting at Mem+Offset.
 Verifies the length, the type, and the CRC.
 On success, Chunk holds a copy of the data and Consumed
 is the number of bytes used (length+12).
 Returns: STASH_OK or STASH_MALFORMED_CHUNK.
 **************************************/
StashError	PNGChunkDecode	(size_t MemSize, const byte *Mem, size_t Offset, pngchunk *Chunk, size_t *Consumed)
{
  size_t Remaining;
  uint32_t Length, StoredCrc, CalcCrc;
  const byte *p;

  memset(Chunk,0,sizeof(pngchunk));
  if (Consumed) { *Consumed=0; }

  // Every chunk has 4-byte size + 4-byte FourCC + 4-byte checksum.
  if ((Offset > MemSize) || (MemSize-Offset < PNG_CHUNK_OVERHEAD))
    {
    if (Verbose) { DEBUGPRINT("Chunk at offset %lu: header truncated",(unsigned long)Offset); }
    return(STASH_MALFORMED_CHUNK);
    }
  Remaining = MemSize-Offset;
  p = Mem+Offset;

  Length = readbe32(p);
  if ((Length > PNG_MAX_CHUNK_LEN) || ((size_t)Length > Remaining-PNG_CHUNK_OVERHEAD))
    {
    if (Verbose) { DEBUGPRINT("Chunk at offset %lu: length %lu overruns the data",(unsigned long)Offset,(unsigned long)Length); }
    return(STASH_MALFORMED_CHUNK);
    }

  if (!PNGTypeIsValid(p+4))
    {
    if (Verbose) { DEBUGPRINT("Chunk at offset %lu: invalid type code",(unsigned long)Offset); }
    return(STASH_MALFORMED_CHUNK);
    }

  // CRC covers type+data
  StoredCrc = readbe32(p+8+Length);
  CalcCrc = PNGCrc32((size_t)Length+4,p+4);
  if (StoredCrc != CalcCrc)
    {
    if (Verbose) { DEBUGPRINT("Chunk [%.4s] at offset %lu: CRC %08x != %08x",(const char*)(p+4),(unsigned long)Offset,StoredCrc,CalcCrc); }
    return(STASH_MALFORMED_CHUNK);
    }

  memcpy(Chunk->Type,p+4,4);
  Chunk->Length = Length;
  Chunk->Data = (byte*)StashMalloc(Length);
  if (Length) { memcpy(Chunk->Data,p+8,Length); }
  Chunk->Crc = StoredCrc;
  if (Consumed) { *Consumed = (size_t)Length + PNG_CHUNK_OVERHEAD; }
  return(STASH_OK);
} /* PNGChunkDecode() */

/**************************************
 PNGChunkSize(): Number of bytes needed to encode the chunk.
 **************************************/
size_t	PNGChunkSize	(const pngchunk *Chunk)
{
  return((size_t)Chunk->Length + PNG_CHUNK_OVERHEAD);
} /* PNGChunkSize() */

/**************************************
 PNGChunkEncode(): Write the chunk to Out.
 Out must have PNGChunkSize() bytes available.
 The CRC is always recomputed.
 Returns: number of bytes written.
 **************************************/
size_t	PNGChunkEncode	(const pngchunk *Chunk, byte *Out)
{
  uint32_t crc;

  writebe32(Out,Chunk->Length);
  memcpy(Out+4,Chunk->Type,4);
  if (Chunk->Length) { memcpy(Out+8,Chunk->Data,Chunk->Length); }
  crc = PNGChunkCrc(Chunk->Type,Chunk->Length,Chunk->Data);
  writebe32(Out+8+Chunk->Length,crc);
  return(PNGChunkSize(Chunk));
} /* PNGChunkEncode() */
