/************************************************
 PNG Stash: implemented in C
 See LICENSE

 Main program.
 ************************************************/
// C headers
#include <stdlib.h>
#include <stdio.h>
#include <unistd.h>
#include <string.h>
#include <errno.h>
#include <getopt.h> // getopt()

#include "stash.hpp"
#include "config.hpp"
#include "files.hpp"
#include "token.hpp"
#include "engine.hpp"

/**************************************
 Usage(): Show usage and abort.
 **************************************/
void	Usage	(const char *progname)
{
  printf("Usage: %s [options] file [file...]\n",progname);
  printf("  -h, -?, --help    :: Show help; this usage\n");
  printf("  --config file.cfg :: Optional configuration file (default: $HOME/.stash.cfg)\n");
  printf("  -v                :: Verbose debugging (probably not what you want)\n");
  printf("  -V, --version     :: Show the code version and exit.\n");
  printf("  -W                :: Write the current options as a configuration file and exit.\n");
  printf("\n");
  printf("  Listing: (default)\n");
  printf("  -l, --list           :: List every chunk and any possible hidden messages\n");
  printf("\n");
  printf("  Hiding a message:\n");
  printf("  -e, --encode         :: Required: hide a message; prints the token\n");
  printf("  -m, --message text   :: The message to hide\n");
  printf("  -M, --msgfile fname  :: Read the message from a file\n");
  printf("  -o, --outfile fname  :: Output filename\n");
  printf("               Include '%%d' for directory name without final /\n");
  printf("               Include '%%b' for base filename\n");
  printf("               Include '%%e' for filename extension, including '.'\n");
  printf("               Include '%%%%' for a percent sign\n");
  printf("               Default: './%%b-stash%%e'\n");
  printf("  --seed number        :: Debugging: draw tokens from a fixed seed\n");
  printf("\n");
  printf("  Reading a message:\n");
  printf("  -d, --decode         :: Required: show the message for the token\n");
  printf("  -t, --token token    :: The token printed when the message was hidden\n");
  printf("\n");
  printf("  Removing a message:\n");
  printf("  -r, --remove         :: Required: remove the message for the token and show it\n");
  printf("  -t, --token token    :: The token printed when the message was hidden\n");
  printf("               The file is rewritten in place.\n");
  exit(1);
} /* Usage() */

/**************************************
 ReportError(): Show the error for a file.
 **************************************/
void	ReportError	(const char *Fname, StashError rc)
{
  fprintf(stderr," ERROR: %s: %s (%s)\n",StashErrorName(rc),StashErrorText(rc),Fname);
} /* ReportError() */

/**************************************
 LoadMessage(): Put the message to hide in '@message'.
 Uses -m text, or the contents of the -M file.
 Returns: Args; '@message' is unset on failure.
 **************************************/
stashfield *	LoadMessage	(stashfield *Args)
{
  char *fname;
  mmapfile *Mmap;

  Args = StashDel(Args,"@message");
  fname = StashGetText(Args,"msgfile");
  if (fname && fname[0])
    {
    Mmap = MmapFile(fname);
    if (!Mmap) { return(Args); }
    Args = StashSetBin(Args,"@message",Mmap->memsize,Mmap->mem);
    MmapFree(Mmap);
    }
  else
    {
    Args = StashSetBin(Args,"@message",StashGetSize(Args,"message"),StashGetBin(Args,"message"));
    }
  if (Verbose > 2) { DEBUGSHOW("Message",StashSearch(Args,"@message")); }
  return(Args);
} /* LoadMessage() */

/**************************************
 ProcessFile(): Apply the mode to one file.
 Returns: STASH_OK or the failure.
 **************************************/
StashError	ProcessFile	(stashfield *Args, int Mode, const char *Fname, stashrandom *Rnd)
{
  mmapfile *Mmap;
  byte *Out=NULL, *Msg=NULL;
  size_t OutLen=0, MsgLen=0;
  char Token[STASH_TOKEN_LEN+1];
  char *Outname;
  StashError rc=STASH_OK;

  // Memory map the file
  Mmap = MmapFile(Fname);
  if (!Mmap) { return(STASH_IO_ERROR); }

  switch(Mode)
    {
    case 'l': // list
      rc = StashList(stdout,Mmap->memsize,Mmap->mem);
      break;

    case 'e': // encode
      rc = StashEncode(Mmap->memsize,Mmap->mem,
		StashGetSize(Args,"@message"),StashGetBin(Args,"@message"),
		Rnd,&Out,&OutLen,Token);
      if (rc != STASH_OK) { break; }
      Outname = MakeFilename(StashGetText(Args,"outfile"),Fname);
      if (!Outname) { rc=STASH_IO_ERROR; break; }
      if (!StashWriteFile(Outname,OutLen,Out)) { rc=STASH_IO_ERROR; }
      else
	{
	printf(" Wrote: %s\n",Outname);
	printf(" Token: %s\n",Token);
	printf(" Keep the token secret. It is needed to read or remove the message.\n");
	}
      free(Outname);
      break;

    case 'd': // decode
      rc = StashDecode(Mmap->memsize,Mmap->mem,StashGetText(Args,"token"),&Msg,&MsgLen);
      if (rc == STASH_OK)
	{
	fwrite(Msg,1,MsgLen,stdout);
	printf("\n");
	}
      break;

    case 'r': // remove
      rc = StashRemove(Mmap->memsize,Mmap->mem,StashGetText(Args,"token"),&Out,&OutLen,&Msg,&MsgLen);
      if (rc != STASH_OK) { break; }
      MmapFree(Mmap); // done reading; about to replace it
      Mmap=NULL;
      if (!StashReplaceFile(Fname,OutLen,Out)) { rc=STASH_IO_ERROR; break; }
      fwrite(Msg,1,MsgLen,stdout);
      printf("\n");
      break;

    default: break; // never happens
    }

  if (Out) { free(Out); }
  if (Msg) { free(Msg); }
  MmapFree(Mmap);
  return(rc);
} /* ProcessFile() */

/**************************************
 main()
 **************************************/
int main (int argc, char *argv[])
{
  stashfield *Args=NULL;
  stashrandom Rnd;
  char *s;
  int c;
  int Mode='l';
  int Failed=0;

  // Set default values
  Args = StashSetText(Args,"outfile","./%b-stash%e");
  Args = StashSetText(Args,"message","");
  Args = StashSetText(Args,"msgfile","");
  Args = StashSetText(Args,"token","");
  Args = StashSetText(Args,"seed","");

  // Set default config file based on user's home.
  s = getenv("HOME");
  if (s && s[0])
    {
    Args = StashSetText(Args,"config",s);
    Args = StashAddText(Args,"config","/.stash.cfg");
    }
  else { Args = StashSetText(Args,"config",""); }
  Args = ReadCfg(Args);

  // Read command-line
  int long_option_index;
  struct option long_options[] = {
    {"help",      no_argument, NULL, 'h'},
    {"verbose",   no_argument, NULL, 'v'},
    {"version",   no_argument, NULL, 'V'},
    {"config",    required_argument, NULL, 9},
    {"encode",    no_argument, NULL, 'e'},
    {"decode",    no_argument, NULL, 'd'},
    {"remove",    no_argument, NULL, 'r'},
    {"list",      no_argument, NULL, 'l'},
    {"message",   required_argument, NULL, 'm'},
    {"msgfile",   required_argument, NULL, 'M'},
    {"outfile",   required_argument, NULL, 'o'},
    {"token",     required_argument, NULL, 't'},
    // long-only options
    {"seed",      required_argument, NULL, 1},
    {NULL,0,NULL,0}
    };
  bool ModeSet=false;
  while ((c = getopt_long(argc,argv,"dehlM:m:o:rt:VvW?",long_options,&long_option_index)) != -1)
    {
    switch(c)
      {
      case 1: // generic longopt with required_argument (and no single-letter mapping)
	Args = StashSetText(Args,long_options[long_option_index].name,optarg);
	break;
      case 9: // read configuration file
	Args = StashSetText(Args,"config",optarg);
	Args = ReadCfg(Args);
	break;
      case 'm': Args = StashSetText(Args,"message",optarg); break;
      case 'M': Args = StashSetText(Args,"msgfile",optarg); break;
      case 'o': Args = StashSetText(Args,"outfile",optarg); break;
      case 't': Args = StashSetText(Args,"token",optarg); break;

      case 'd': // decode
      case 'e': // encode
      case 'l': // list
      case 'r': // remove
	if (ModeSet && (Mode != c))
	  {
	  fprintf(stderr," ERROR: Only one -d, -e, -l, or -r permitted\n");
	  exit(1);
	  }
	ModeSet=true;
	Mode=c;
	break;

      case 'V': printf("%s\n",STASH_VERSION); exit(0);
      case 'v': Verbose++; break;

      case 'W': // write the data as a config file
	printf("# Hiding options (for use with -e)\n");
	printf("outfile=%s\n",StashGetText(Args,"outfile"));
	s=StashGetText(Args,"msgfile"); if (s && s[0]) { printf("msgfile=%s\n",s); } else { printf("#msgfile=\n"); }
	s=StashGetText(Args,"seed"); if (s && s[0]) { printf("seed=%s\n",s); } else { printf("#seed=\n"); }
	printf("\n");
	printf("# Reading and removing options (for use with -d or -r)\n");
	s=StashGetText(Args,"token"); if (s && s[0]) { printf("token=%s\n",s); } else { printf("#token=\n"); }
	printf("\n");
	exit(0);

      case 'h': // help
      case '?': // help
      default:  Usage(argv[0]); StashFree(Args); exit(1);
      }
    } // while reading args

  // Idiot check values
  if ((Mode=='d') || (Mode=='r'))
    {
    byte Type[4];
    if (StashTokenToType(StashGetText(Args,"token"),Type) != STASH_OK)
	{
	fprintf(stderr," ERROR: %s: %s\n",StashErrorName(STASH_INVALID_TOKEN),StashErrorText(STASH_INVALID_TOKEN));
	exit(1);
	}
    }
  if (Mode=='e')
    {
    Args = LoadMessage(Args);
    if (!StashSearch(Args,"@message")) { exit(1); } // msgfile failed to load
    if (StashGetSize(Args,"@message")==0)
	{
	fprintf(stderr," ERROR: %s: %s\n",StashErrorName(STASH_EMPTY_PLAINTEXT),StashErrorText(STASH_EMPTY_PLAINTEXT));
	exit(1);
	}
    }

  // Select the random source
  s = StashGetText(Args,"seed");
  if (s && s[0])
    {
    char *end;
    unsigned long long Seed;
    errno=0;
    Seed = strtoull(s,&end,10);
    if (errno || (end==s) || *end)
	{
	fprintf(stderr," ERROR: Invalid parameter: 'seed' value is not numeric.\n");
	exit(1);
	}
    StashRandomSeeded(&Rnd,(uint64_t)Seed);
    }
  else { StashRandomSystem(&Rnd); }
  if (Verbose > 3) { DEBUGWALK("Post-CLI Parameters",Args); } // DEBUGGING

  // Process all args (files required)
  if (optind >= argc)
    {
    fprintf(stderr," ERROR: No input files.\n");
    exit(1);
    }

  // Process command-line files.
  bool First=true;
  StashError rc;
  for( ; optind < argc; optind++)
    {
    // Show file being processed.
    if (First) { First=false; } else { printf("\n"); }
    printf("[%s]\n",argv[optind]);
    fflush(stdout);

    rc = ProcessFile(Args,Mode,argv[optind],&Rnd);
    fflush(stdout);
    if (rc != STASH_OK)
	{
	ReportError(argv[optind],rc);
	Failed++;
	}
    } // foreach command-line file

  // Clean up
  StashFree(Args); // free memory for completeness
  return(Failed ? 1 : 0);
} /* main() */
