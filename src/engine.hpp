/************************************************
 PNG Stash: implemented in C
 See LICENSE

 Hiding, finding, and removing messages in a PNG.
 All buffers are in memory; nothing here touches files.
 ************************************************/
#ifndef ENGINE_HPP
#define ENGINE_HPP

#include <stdlib.h>
#include <stdio.h>
#include "stash.hpp"
#include "token.hpp"

// How many tokens to draw before giving up on collisions
#define STASH_TOKEN_ATTEMPTS 64

StashError	StashEncode	(size_t SrcLen, const byte *Src,
			 size_t MsgLen, const byte *Msg,
			 stashrandom *Rnd,
			 byte **Out, size_t *OutLen,
			 char Token[STASH_TOKEN_LEN+1]);
StashError	StashDecode	(size_t ImgLen, const byte *Img, const char *Token,
			 byte **Msg, size_t *MsgLen);
StashError	StashRemove	(size_t ImgLen, const byte *Img, const char *Token,
			 byte **Out, size_t *OutLen,
			 byte **Msg, size_t *MsgLen);
StashError	StashList	(FILE *fp, size_t ImgLen, const byte *Img);

#endif
