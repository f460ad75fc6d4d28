/************************************************
 PNG Stash: implemented in C
 See LICENSE

 Parsing a PNG byte stream into an ordered list of chunks,
 and writing the list back out.
 ************************************************/
#ifndef PNG_STREAM_HPP
#define PNG_STREAM_HPP

#include <stdlib.h>
#include <stdio.h>
#include "stash.hpp"
#include "png-chunk.hpp"

#define PNG_SIGNATURE "\x89PNG\r\n\x1a\n"
#define PNG_SIGNATURE_LEN 8

// Ordered, index-addressable list. First is IHDR, last is IEND.
typedef struct
  {
  pngchunk *Chunks;
  size_t Count;
  size_t Alloc;
  } pngchunklist;

bool	Stash_isPNG	(size_t MemSize, const byte *Mem);

StashError	PNGParse	(size_t MemSize, const byte *Mem, pngchunklist *List);
size_t	PNGSerializedSize	(const pngchunklist *List);
byte *	PNGSerialize	(const pngchunklist *List, size_t *OutLen);

void	PNGListInit	(pngchunklist *List);
void	PNGListFree	(pngchunklist *List);
void	PNGListInsert	(pngchunklist *List, size_t Index, pngchunk *Chunk);
void	PNGListAppend	(pngchunklist *List, pngchunk *Chunk);
void	PNGListRemove	(pngchunklist *List, size_t Index, pngchunk *Removed);
bool	PNGListFind	(const pngchunklist *List, const byte Type[4], size_t *Index);

#endif
