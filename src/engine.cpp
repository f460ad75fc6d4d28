/************************************************
 PNG Stash: implemented in C
 See LICENSE

 Hiding a message in a PNG.

 The message is stored as the data of a new ancillary,
 private chunk. The chunk type comes from the token
 (see token.cpp). PNG readers skip chunks they do not know,
 so the image still displays normally.

 Where does the chunk go?
   Right before the IEND.
   This never disturbs IHDR, PLTE, or the IDAT sequence,
   and the pixel data is never touched.

 Multiple messages can be stored in one file; each gets its own
 token. When looking up a token, the first matching chunk wins.
 ************************************************/
#include <stdlib.h>
#include <string.h>
#include "stash.hpp"
#include "png-chunk.hpp"
#include "png-stream.hpp"
#include "token.hpp"
#include "engine.hpp"

#pragma GCC visibility push(hidden)
/**************************************
 _CopyMessage(): Allocate a null-terminated copy of chunk data.
 The terminator is not counted in MsgLen.
 **************************************/
static void	_CopyMessage	(const pngchunk *Chunk, byte **Msg, size_t *MsgLen)
{
  *Msg = (byte*)StashMalloc(Chunk->Length); // padding supplies the null
  if (Chunk->Length) { memcpy(*Msg,Chunk->Data,Chunk->Length); }
  *MsgLen = Chunk->Length;
} /* _CopyMessage() */

/**************************************
 _FindToken(): Parse the image and locate the token's chunk.
 On success, List holds the parsed image and Index is the chunk.
 Returns: STASH_OK or the first failure.
 **************************************/
static StashError	_FindToken	(size_t ImgLen, const byte *Img, const char *Token,
				 pngchunklist *List, size_t *Index)
{
  StashError rc;
  byte Type[4];

  rc = PNGParse(ImgLen,Img,List);
  if (rc != STASH_OK) { return(rc); }

  rc = StashTokenToType(Token,Type);
  if (rc != STASH_OK) { PNGListFree(List); return(rc); }

  if (!PNGListFind(List,Type,Index))
    {
    if (Verbose) { DEBUGPRINT("No chunk [%.4s] in %lu chunks",(char*)Type,(unsigned long)List->Count); }
    PNGListFree(List);
    return(STASH_TOKEN_NOT_FOUND);
    }
  return(STASH_OK);
} /* _FindToken() */
#pragma GCC visibility pop

/**************************************
 StashEncode(): Hide a message.
 Adds one chunk right before the IEND.
 On success: Out (allocated; caller must free) holds the new image
 and Token holds the key needed to find the message.
 Returns: STASH_OK or the failure.
 **************************************/
StashError	StashEncode	(size_t SrcLen, const byte *Src,
			 size_t MsgLen, const byte *Msg,
			 stashrandom *Rnd,
			 byte **Out, size_t *OutLen,
			 char Token[STASH_TOKEN_LEN+1])
{
  pngchunklist List;
  pngchunk Chunk;
  byte Type[4];
  StashError rc;
  int Attempt;

  *Out=NULL;
  *OutLen=0;
  memset(Token,0,STASH_TOKEN_LEN+1);

  if (!Msg || (MsgLen == 0)) { return(STASH_EMPTY_PLAINTEXT); }
  if (MsgLen > PNG_MAX_CHUNK_LEN) { return(STASH_PAYLOAD_TOO_LARGE); }

  rc = PNGParse(SrcLen,Src,&List);
  if (rc != STASH_OK) { return(rc); }

  /*****
   Draw a token that is not already in the file.
   Otherwise the older chunk would win every lookup.
   *****/
  for(Attempt=0; Attempt < STASH_TOKEN_ATTEMPTS; Attempt++)
    {
    rc = StashNewToken(Rnd,Token,Type);
    if (rc != STASH_OK) { PNGListFree(&List); return(rc); }
    if (!PNGListFind(&List,Type,NULL)) { break; }
    if (Verbose) { DEBUGPRINT("Token %s already used; drawing another",Token); }
    }
  if (Attempt >= STASH_TOKEN_ATTEMPTS)
    {
    memset(Token,0,STASH_TOKEN_LEN+1);
    PNGListFree(&List);
    return(STASH_TOKEN_COLLISION);
    }

  rc = PNGChunkInit(&Chunk,Type,MsgLen,Msg);
  if (rc != STASH_OK)
    {
    memset(Token,0,STASH_TOKEN_LEN+1);
    PNGListFree(&List);
    return(rc);
    }

  // IEND is always the last chunk
  PNGListInsert(&List,List.Count-1,&Chunk);
  *Out = PNGSerialize(&List,OutLen);
  PNGListFree(&List);
  return(STASH_OK);
} /* StashEncode() */

/**************************************
 StashDecode(): Find a hidden message.
 The image is not modified.
 On success, Msg is allocated (caller must free) and null-terminated.
 Returns: STASH_OK or the failure.
 **************************************/
StashError	StashDecode	(size_t ImgLen, const byte *Img, const char *Token,
			 byte **Msg, size_t *MsgLen)
{
  pngchunklist List;
  size_t Index;
  StashError rc;

  *Msg=NULL;
  *MsgLen=0;

  rc = _FindToken(ImgLen,Img,Token,&List,&Index);
  if (rc != STASH_OK) { return(rc); }

  _CopyMessage(List.Chunks+Index,Msg,MsgLen);
  PNGListFree(&List);
  return(STASH_OK);
} /* StashDecode() */

/**************************************
 StashRemove(): Strip a hidden message.
 Removes the first matching chunk and keeps every other chunk in order.
 On success: Out holds the cleaned image and Msg holds the message
 that was removed. Both are allocated; caller must free.
 Returns: STASH_OK or the failure.
 **************************************/
StashError	StashRemove	(size_t ImgLen, const byte *Img, const char *Token,
			 byte **Out, size_t *OutLen,
			 byte **Msg, size_t *MsgLen)
{
  pngchunklist List;
  pngchunk Removed;
  size_t Index;
  StashError rc;

  *Out=NULL;
  *OutLen=0;
  *Msg=NULL;
  *MsgLen=0;

  rc = _FindToken(ImgLen,Img,Token,&List,&Index);
  if (rc != STASH_OK) { return(rc); }

  PNGListRemove(&List,Index,&Removed);
  _CopyMessage(&Removed,Msg,MsgLen);
  PNGChunkFree(&Removed);

  *Out = PNGSerialize(&List,OutLen);
  PNGListFree(&List);
  return(STASH_OK);
} /* StashRemove() */

/**************************************
 StashList(): Show every chunk in the image.
 Chunks that follow the token pattern may hold a message,
 so show the token that would retrieve them.
 Returns: STASH_OK or the parse failure.
 **************************************/
StashError	StashList	(FILE *fp, size_t ImgLen, const byte *Img)
{
  pngchunklist List;
  size_t i, Offset;
  const pngchunk *c;
  char Token[STASH_TOKEN_LEN+1];
  StashError rc;

  rc = PNGParse(ImgLen,Img,&List);
  if (rc != STASH_OK) { return(rc); }

  Offset = PNG_SIGNATURE_LEN;
  for(i=0; i < List.Count; i++)
    {
    c = List.Chunks+i;
    fprintf(fp," Chunk[%lu]: offset %lu, type '%.4s', length %lu, crc %08x",
	(unsigned long)i, (unsigned long)Offset, (const char*)c->Type,
	(unsigned long)c->Length, c->Crc);
    fprintf(fp," (%s, %s, %s, %s)",
	PNGTypeIsCritical(c->Type) ? "critical" : "ancillary",
	PNGTypeIsPublic(c->Type) ? "public" : "private",
	PNGTypeIsReservedValid(c->Type) ? "reserved-ok" : "reserved-bad",
	PNGTypeIsSafeToCopy(c->Type) ? "safe-to-copy" : "unsafe-to-copy");
    if (StashIsTokenType(c->Type))
      {
      StashTypeToToken(c->Type,Token);
      fprintf(fp," possible message: token %s",Token);
      }
    fprintf(fp,"\n");
    if (Verbose > 2) { DEBUGhexdump(c->Length,c->Data); }
    Offset += PNGChunkSize(c);
    }

  PNGListFree(&List);
  return(STASH_OK);
} /* StashList() */
