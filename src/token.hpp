/************************************************
 PNG Stash: implemented in C
 See LICENSE

 Tokens: the short key that names a hidden message.
 ************************************************/
#ifndef TOKEN_HPP
#define TOKEN_HPP

#include <stdlib.h>
#include "stash.hpp"

#define STASH_TOKEN_LEN 4

/*****
 Random source used for drawing tokens.
 Fill() stores Len random bytes in Buf and returns false on failure.
 State is only used by the seeded source.
 *****/
struct stashrandom
  {
  bool (*Fill)(struct stashrandom *Rnd, size_t Len, byte *Buf);
  uint64_t State;
  };
typedef struct stashrandom stashrandom;

void	StashRandomSystem	(stashrandom *Rnd);
void	StashRandomSeeded	(stashrandom *Rnd, uint64_t Seed);

StashError	StashNewToken	(stashrandom *Rnd, char Token[STASH_TOKEN_LEN+1], byte Type[4]);
StashError	StashTokenToType	(const char *Token, byte Type[4]);
void	StashTypeToToken	(const byte Type[4], char Token[STASH_TOKEN_LEN+1]);
bool	StashIsTokenType	(const byte Type[4]);

#endif
