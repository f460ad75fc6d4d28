/************************************************
 PNG Stash: implemented in C
 See LICENSE

 General file and I/O handling.
 ************************************************/
#ifndef FILES_HPP
#define FILES_HPP

// C headers
#include <stdlib.h>
#include <stdio.h>
#include <unistd.h>
#include <sys/stat.h>

#include "stash.hpp"

#ifdef __CYGWIN__
  #define fstat64(a,b) fstat(a,b)
  #define mmap64(a,b,c,d,e,f) mmap(a,b,c,d,e,f)
  typedef struct stat stat_t;
#else
  typedef struct stat64 stat_t;
#endif

typedef struct
  {
  FILE *fp;
  byte *mem;
  uint64_t memsize;
  } mmapfile;

char *	MakeFilename	(const char *Template, const char *Filename);

bool	StashWriteFile	(const char *Fname, size_t Len, const byte *Data);
bool	StashReplaceFile	(const char *Fname, size_t Len, const byte *Data);

mmapfile *	MmapFile	(const char *Filename);
void	MmapFree	(mmapfile *Mmap);

#endif
