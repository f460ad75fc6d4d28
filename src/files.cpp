/************************************************
 PNG Stash: implemented in C
 See LICENSE

 General file and I/O handling.
 Nothing here exits; failures are reported and returned
 so the caller can move on to the next file.
 ************************************************/
// C headers
#include <stdlib.h>
#include <stdio.h>
#include <unistd.h>
#include <stdint.h>
#include <string.h>
#include <ctype.h>
#include <limits.h> // UINT_MAX
#include <sys/types.h> // stat()
#include <sys/stat.h> // stat()
#include <libgen.h> // dirname(), basename()
#include <fcntl.h>
#include <sys/mman.h> /* for mmap() */

#include "stash.hpp"
#include "files.hpp"

/**************************************
 MakeFilename(): allocate and populate the output string.
 Template codes:
   %d = directory name without final /
   %b = base filename without extension
   %e = extension, including the '.'
   %% = percent sign
 Returns: allocated string with filename, or NULL on a bad code.
 Caller must free() string.
 **************************************/
char *	MakeFilename	(const char *Template, const char *Filename)
{
  stashfield *Name=NULL;
  char *Fname, *p;

  // Divide up Filename into directory, basename, and extension
  char *dcopy, *bcopy, *ecopy; // via malloc
  char *dname, *bname; // DO NOT FREE

  dcopy = strdup(Filename);
  bcopy = strdup(Filename);
  if (!dcopy || !bcopy)
    {
    fprintf(stderr," ERROR: Unable to allocate filename. Aborting.\n");
    exit(1);
    }
  dname = dirname(dcopy);
  bname = basename(bcopy);
  p = strrchr(bname,'.'); // is there an extension?
  if (p && (p != bname)) // ".hidden" has no extension
    {
    ecopy = strdup(p);
    p[0]='\0'; // Remove extension from bname
    }
  else
    {
    ecopy = strdup("");
    }

  /*****
   Now for the hard part:
   Add in the template, but replace every known '%' code.
   *****/
  Name = StashSetText(Name,"name","");
  for(p=(char*)strchr(Template,'%'); p; p=(char*)strchr(Template,'%'))
    {
    // Copy over the text before '%'
    Name = StashAddBin(Name,"name",p-Template,(const byte*)Template);
    Template = p;

    switch(p[1])
      {
      case 'b': Name = StashAddText(Name,"name",bname); break;
      case 'd': Name = StashAddText(Name,"name",dname); break;
      case 'e': Name = StashAddText(Name,"name",ecopy); break;
      case '%': Name = StashAddText(Name,"name","%"); break;
      default:
	fprintf(stderr," ERROR: Output filename contains illegal character: %%");
	if (isprint(p[1]) && !isspace(p[1])) { fprintf(stderr,"%c",p[1]); }
	fprintf(stderr,"\n");
	free(ecopy);
	free(bcopy);
	free(dcopy);
	StashFree(Name);
	return(NULL);
      }
    Template+=2; // move past '%'
    }

  // Copy any text after last '%'
  Name = StashAddText(Name,"name",Template);

  Fname = strdup(StashGetText(Name,"name"));
  StashFree(Name);
  free(ecopy);
  free(bcopy);
  free(dcopy);
  return(Fname);
} /* MakeFilename() */

#pragma GCC visibility push(hidden)
/**************************************
 _WriteAll(): Write an entire buffer to an open file and close it.
 Returns: true on success, false on failure.
 **************************************/
static bool	_WriteAll	(FILE *Fout, const char *Fname, size_t Len, const byte *Data)
{
  size_t Wrote,w;

  for(Wrote=0; Wrote < Len; Wrote += w)
    {
    w = fwrite(Data+Wrote, 1, Min(Len-Wrote,(size_t)UINT_MAX), Fout);
    if (w <= 0)
      {
      fprintf(stderr," ERROR: Failed to write to '%s'.\n",Fname);
      fclose(Fout);
      return(false);
      }
    }

  if (fclose(Fout) != 0)
    {
    fprintf(stderr," ERROR: Failed to write to '%s'.\n",Fname);
    return(false);
    }
  return(true);
} /* _WriteAll() */
#pragma GCC visibility pop

/**************************************
 StashWriteFile(): Write an entire buffer to a new file.
 Removes the partial file on failure.
 Returns: true on success, false on failure.
 **************************************/
bool	StashWriteFile	(const char *Fname, size_t Len, const byte *Data)
{
  FILE *Fout;

  Fout = fopen(Fname,"wb");
  if (!Fout)
	{
	fprintf(stderr," ERROR: Unable to create '%s'.\n",Fname);
	return(false);
	}

  if (!_WriteAll(Fout,Fname,Len,Data))
    {
    unlink(Fname);
    return(false);
    }
  return(true);
} /* StashWriteFile() */

/**************************************
 StashReplaceFile(): Replace a file's contents.
 A symlink is followed, so the file it points to is the one replaced.
 The data goes to a unique temp file in the same directory, which
 gets the original's permissions and is renamed over it.
 A failed write never leaves a half-written image.
 Returns: true on success, false on failure.
 **************************************/
bool	StashReplaceFile	(const char *Fname, size_t Len, const byte *Data)
{
  stashfield *Tmp=NULL;
  char *Realname, *Tmpname;
  struct stat Stat;
  FILE *Fout;
  int fd;
  bool rc=false;

  Realname = realpath(Fname,NULL);
  if (!Realname)
    {
    fprintf(stderr," ERROR: Unable to find '%s'.\n",Fname);
    return(false);
    }
  if (stat(Realname,&Stat) != 0)
    {
    fprintf(stderr," ERROR: Unable to read '%s'.\n",Fname);
    free(Realname);
    return(false);
    }

  // mkstemp() rewrites the template in place
  Tmp = StashSetText(Tmp,"tmp",Realname);
  Tmp = StashAddText(Tmp,"tmp",".XXXXXX");
  Tmpname = StashGetText(Tmp,"tmp");

  fd = mkstemp(Tmpname);
  if (fd < 0)
    {
    fprintf(stderr," ERROR: Unable to create a temporary file for '%s'.\n",Fname);
    goto Done;
    }
  if (fchmod(fd,Stat.st_mode & 07777) != 0)
    {
    fprintf(stderr," ERROR: Unable to set permissions on '%s'.\n",Tmpname);
    close(fd);
    unlink(Tmpname);
    goto Done;
    }
  Fout = fdopen(fd,"wb");
  if (!Fout)
    {
    fprintf(stderr," ERROR: Unable to create '%s'.\n",Tmpname);
    close(fd);
    unlink(Tmpname);
    goto Done;
    }

  if (!_WriteAll(Fout,Tmpname,Len,Data)) { unlink(Tmpname); }
  else if (rename(Tmpname,Realname) != 0)
    {
    fprintf(stderr," ERROR: Unable to replace '%s'.\n",Fname);
    unlink(Tmpname);
    }
  else { rc=true; }

Done:
  StashFree(Tmp);
  free(Realname);
  return(rc);
} /* StashReplaceFile() */

/**************************************
 MmapFile(): memory map the file (read-only) for quick access.
 An empty file maps to an empty buffer.
 Returns: mmapfile* or NULL on failure.
 **************************************/
mmapfile *	MmapFile	(const char *Filename)
{
  mmapfile *Mmap;
  int FileHandle;
  stat_t Stat;

  Mmap = (mmapfile*)StashMalloc(sizeof(mmapfile));

  // Open file and check it
  Mmap->fp = fopen(Filename,"rb");
  if (!Mmap->fp)
    {
    fprintf(stderr," ERROR: Cannot open file (%s)\n",Filename);
    free(Mmap);
    return(NULL);
    }

  // mmap requires file handle
  FileHandle = fileno(Mmap->fp);
  if ((fstat64(FileHandle,&Stat) == -1) || !S_ISREG(Stat.st_mode))
    {
    fprintf(stderr," ERROR: Not a regular file (%s)\n",Filename);
    fclose(Mmap->fp);
    free(Mmap);
    return(NULL);
    }

  Mmap->memsize = Stat.st_size;
  if (Mmap->memsize == 0) { return(Mmap); } // nothing to map

  Mmap->mem = (byte *)mmap64(0,Mmap->memsize,PROT_READ,MAP_SHARED,FileHandle,0);
  if (!Mmap->mem || (Mmap->mem == MAP_FAILED))
    {
    fprintf(stderr," ERROR: Memory map failed for file (%s)\n",Filename);
    fclose(Mmap->fp);
    free(Mmap);
    return(NULL);
    }

  return(Mmap);
} /* MmapFile() */

/**************************************
 MmapFree(): Free memory map from MmapFile.
 **************************************/
void	MmapFree	(mmapfile *Mmap)
{
  if (!Mmap) { return; }
  if (Mmap->mem) { munmap(Mmap->mem,Mmap->memsize); }
  fclose(Mmap->fp);
  free(Mmap);
} /* MmapFree() */
