/************************************************
 PNG Stash: implemented in C
 See LICENSE

 Generating tokens and mapping them to chunk types.

 There is no database of tokens. The token IS the chunk type,
 so anyone holding the token can find the chunk in any copy
 of the file.

 Tokens are 4 ASCII letters. The case of each letter is fixed
 so that the chunk type has the right PNG property bits:
   1st letter: lowercase = ancillary (readers may ignore it)
   2nd letter: lowercase = private (not a registered chunk)
   3rd letter: uppercase = reserved bit clear (required)
   4th letter: lowercase = safe to copy
 For example: "abCd"

 A random letter is drawn for each position and the case bit
 (0x20) is forced with a mask. Going from a token to a chunk type
 only needs the mask check, so the mapping is its own inverse.
 ************************************************/
#include <stdlib.h>
#include <string.h>
#include "stash.hpp"
#include "png-chunk.hpp"
#include "token.hpp"

// For openssl 3.x
#include <openssl/rand.h>

#pragma GCC visibility push(hidden)
// Case bit required at each position
static const byte TokenCaseMask[STASH_TOKEN_LEN] = { 0x20, 0x20, 0x00, 0x20 };

/**************************************
 _RandomSystemFill(): Cryptographic random bytes from OpenSSL.
 **************************************/
static bool	_RandomSystemFill	(stashrandom *Rnd, size_t Len, byte *Buf)
{
  (void)Rnd;
  if (Len == 0) { return(true); }
  if (RAND_bytes(Buf,(int)Len) != 1)
    {
    if (Verbose) { DEBUGPRINT("RAND_bytes failed for %lu bytes",(unsigned long)Len); }
    return(false);
    }
  return(true);
} /* _RandomSystemFill() */

/**************************************
 _RandomSeededFill(): Deterministic bytes (splitmix64).
 Same seed, same bytes. For testing and debugging only.
 **************************************/
static bool	_RandomSeededFill	(stashrandom *Rnd, size_t Len, byte *Buf)
{
  size_t i;
  uint64_t z;

  for(i=0; i < Len; i++)
    {
    Rnd->State += 0x9e3779b97f4a7c15ULL;
    z = Rnd->State;
    z = (z ^ (z >> 30)) * 0xbf58476d1ce4e5b9ULL;
    z = (z ^ (z >> 27)) * 0x94d049bb133111ebULL;
    z = z ^ (z >> 31);
    Buf[i] = (byte)(z >> 56);
    }
  return(true);
} /* _RandomSeededFill() */

#pragma GCC visibility pop

/**************************************
 StashRandomSystem(): Use the system random source.
 **************************************/
void	StashRandomSystem	(stashrandom *Rnd)
{
  Rnd->Fill = _RandomSystemFill;
  Rnd->State = 0;
} /* StashRandomSystem() */

/**************************************
 StashRandomSeeded(): Use a deterministic source.
 **************************************/
void	StashRandomSeeded	(stashrandom *Rnd, uint64_t Seed)
{
  Rnd->Fill = _RandomSeededFill;
  Rnd->State = Seed;
} /* StashRandomSeeded() */

/**************************************
 StashNewToken(): Draw a new token and its chunk type.
 Letters use rejection sampling: bytes >= 234 (26*9)
 are thrown away so every letter is equally likely.
 Returns: STASH_OK or STASH_RANDOM_FAILURE.
 **************************************/
StashError	StashNewToken	(stashrandom *Rnd, char Token[STASH_TOKEN_LEN+1], byte Type[4])
{
  byte r;
  int i;

  memset(Token,0,STASH_TOKEN_LEN+1);
  if (!Rnd || !Rnd->Fill) { return(STASH_RANDOM_FAILURE); }

  for(i=0; i < STASH_TOKEN_LEN; i++)
    {
    do
      {
      if (!Rnd->Fill(Rnd,1,&r)) { return(STASH_RANDOM_FAILURE); }
      } while(r >= 234);
    // Uppercase letter, then force the case bit for this position
    Type[i] = (byte)(('A' + (r % 26)) | TokenCaseMask[i]);
    Token[i] = (char)Type[i];
    }
  return(STASH_OK);
} /* StashNewToken() */

/**************************************
 StashIsTokenType(): Could this chunk type have come from a token?
 Must be letters with the expected case at each position.
 **************************************/
bool	StashIsTokenType	(const byte Type[4])
{
  int i;
  if (!PNGTypeIsValid(Type)) { return(false); }
  for(i=0; i < STASH_TOKEN_LEN; i++)
    {
    if ((Type[i] & 0x20) != TokenCaseMask[i]) { return(false); }
    }
  return(true);
} /* StashIsTokenType() */

/**************************************
 StashTokenToType(): Convert a token to its chunk type.
 Case sensitive: "abCd" is valid, "ABCD" is not.
 Returns: STASH_OK or STASH_INVALID_TOKEN.
 **************************************/
StashError	StashTokenToType	(const char *Token, byte Type[4])
{
  if (!Token || (strlen(Token) != STASH_TOKEN_LEN)) { return(STASH_INVALID_TOKEN); }
  if (!StashIsTokenType((const byte*)Token)) { return(STASH_INVALID_TOKEN); }
  memcpy(Type,Token,STASH_TOKEN_LEN);
  return(STASH_OK);
} /* StashTokenToType() */

/**************************************
 StashTypeToToken(): Convert a chunk type back to its token.
 Caller should check StashIsTokenType() first.
 **************************************/
void	StashTypeToToken	(const byte Type[4], char Token[STASH_TOKEN_LEN+1])
{
  memcpy(Token,Type,STASH_TOKEN_LEN);
  Token[STASH_TOKEN_LEN]='\0';
} /* StashTypeToToken() */
