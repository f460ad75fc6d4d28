/************************************************
 PNG Stash: implemented in C
 See LICENSE

 Encoding and decoding a single PNG chunk.
 ************************************************/
#ifndef PNG_CHUNK_HPP
#define PNG_CHUNK_HPP

#include <stdlib.h>
#include "stash.hpp"

#define PNG_CHUNK_OVERHEAD 12 // length + type + CRC
#define PNG_MAX_CHUNK_LEN 0x7fffffffUL // 2^31-1

typedef struct
  {
  byte Type[4]; // four character code
  uint32_t Length; // always the size of Data
  byte *Data; // allocated; never NULL after init
  uint32_t Crc; // CRC over Type+Data
  } pngchunk;

// Checksums
uint32_t	PNGCrc32	(size_t DataLen, const byte *Data);
uint32_t	PNGChunkCrc	(const byte Type[4], size_t DataLen, const byte *Data);

// Four character code properties
bool	PNGTypeIsValid	(const byte Type[4]);
bool	PNGTypeIsCritical	(const byte Type[4]);
bool	PNGTypeIsPublic	(const byte Type[4]);
bool	PNGTypeIsReservedValid	(const byte Type[4]);
bool	PNGTypeIsSafeToCopy	(const byte Type[4]);
bool	PNGChunkIs	(const pngchunk *Chunk, const char *FourCC);

// Chunk handling
StashError	PNGChunkInit	(pngchunk *Chunk, const byte Type[4], size_t DataLen, const byte *Data);
void	PNGChunkFree	(pngchunk *Chunk);
StashError	PNGChunkDecode	(size_t MemSize, const byte *Mem, size_t Offset, pngchunk *Chunk, size_t *Consumed);
size_t	PNGChunkSize	(const pngchunk *Chunk);
size_t	PNGChunkEncode	(const pngchunk *Chunk, byte *Out);

#endif
