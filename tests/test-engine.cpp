/************************************************
 PNG Stash: implemented in C
 See LICENSE

 Tests for hiding, reading, and removing messages.
 ************************************************/
#include <stdio.h>
#include <string.h>
#include <string>
#include <vector>
#include <gtest/gtest.h>

#include "stash.hpp"
#include "png-chunk.hpp"
#include "png-stream.hpp"
#include "token.hpp"
#include "engine.hpp"
#include "png-sample.hpp"

namespace {

// Every draw is 'a', so every token is "aaAa"
bool ConstantFill(stashrandom *Rnd, size_t Len, byte *Buf)
{
  (void)Rnd;
  memset(Buf,0,Len);
  return(true);
}

bool FailingFill(stashrandom *Rnd, size_t Len, byte *Buf)
{
  (void)Rnd; (void)Len; (void)Buf;
  return(false);
}

class StashEngine : public ::testing::Test
  {
  protected:
    stashrandom Rnd;
    byte *Out;
    size_t OutLen;
    char Token[STASH_TOKEN_LEN+1];

    void SetUp() override
      {
      StashRandomSeeded(&Rnd,1);
      Out=NULL;
      OutLen=0;
      memset(Token,0,sizeof(Token));
      }

    void TearDown() override
      {
      if (Out) { free(Out); }
      }

    // Hide a text message in Src; returns the new image
    std::vector<byte> Encode(const std::vector<byte> &Src, const std::string &Msg)
      {
      std::vector<byte> Img;
      if (Out) { free(Out); Out=NULL; }
      EXPECT_EQ(STASH_OK, StashEncode(Src.size(),Src.data(),Msg.size(),(const byte*)Msg.data(),
				   &Rnd,&Out,&OutLen,Token));
      if (Out) { Img.assign(Out,Out+OutLen); }
      return(Img);
      }

    // Returns the message, or the error name
    std::string Decode(const std::vector<byte> &Img, const char *Tok)
      {
      byte *Msg=NULL;
      size_t MsgLen=0;
      StashError rc = StashDecode(Img.size(),Img.data(),Tok,&Msg,&MsgLen);
      if (rc != STASH_OK)
	{
	EXPECT_TRUE(Msg == NULL);
	EXPECT_EQ(0U, MsgLen);
	return(StashErrorName(rc));
	}
      std::string r((const char*)Msg,MsgLen);
      EXPECT_EQ(0, Msg[MsgLen]); // null-terminated
      free(Msg);
      return(r);
      }
  };

} // namespace

TEST_F(StashEngine, HideReadRemove)
{
  std::vector<byte> Src = SampleBytes(SamplePNG,sizeof(SamplePNG));
  std::vector<byte> Img = Encode(Src,"hello");
  std::string Tok;
  byte *Clean=NULL, *Msg=NULL;
  size_t CleanLen=0, MsgLen=0;

  EXPECT_STREQ("piJj", Token);
  ASSERT_EQ(Src.size() + 12 + 5, Img.size());
  Tok = Token;

  EXPECT_EQ("hello", Decode(Img,Tok.c_str()));

  ASSERT_EQ(STASH_OK, StashRemove(Img.size(),Img.data(),Tok.c_str(),&Clean,&CleanLen,&Msg,&MsgLen));
  EXPECT_EQ("hello", AsString(Msg,MsgLen));
  std::vector<byte> Removed(Clean,Clean+CleanLen);
  free(Clean);
  free(Msg);

  EXPECT_EQ(Src, Removed); // byte-identical to the original
  EXPECT_EQ("TokenNotFound", Decode(Removed,Tok.c_str()));
}

TEST_F(StashEngine, ChunkGoesBeforeIend)
{
  std::vector<byte> Src = SampleBytes(SamplePNG2,sizeof(SamplePNG2));
  std::vector<byte> Img = Encode(Src,"secret");
  pngchunklist List;
  const char *Expected[] = { "IHDR", "gAMA", "tEXt", "IDAT", "IDAT", "piJj", "IEND" };

  // Everything before the IEND is unchanged
  ASSERT_GT(Img.size(), (size_t)SAMPLE_PNG2_IEND_OFFSET);
  EXPECT_EQ(0, memcmp(Src.data(),Img.data(),SAMPLE_PNG2_IEND_OFFSET));

  ASSERT_EQ(STASH_OK, PNGParse(Img.size(),Img.data(),&List));
  ASSERT_EQ(7U, List.Count);
  for(size_t i=0; i < List.Count; i++)
    {
    EXPECT_EQ(0, memcmp(Expected[i],List.Chunks[i].Type,4)) << "chunk " << i;
    }
  EXPECT_EQ("secret", AsString(List.Chunks[5].Data,List.Chunks[5].Length));
  PNGListFree(&List);
}

TEST_F(StashEngine, RemoveRestoresOriginal)
{
  std::vector<byte> Src = SampleBytes(SamplePNG2,sizeof(SamplePNG2));
  std::vector<byte> Img = Encode(Src,"secret");
  byte *Clean=NULL, *Msg=NULL;
  size_t CleanLen=0, MsgLen=0;

  ASSERT_EQ(STASH_OK, StashRemove(Img.size(),Img.data(),"piJj",&Clean,&CleanLen,&Msg,&MsgLen));
  ASSERT_EQ(Src.size(), CleanLen);
  EXPECT_EQ(0, memcmp(Src.data(),Clean,CleanLen));
  free(Clean);
  free(Msg);
}

TEST_F(StashEngine, RemoveMissingTokenIsIdempotent)
{
  std::vector<byte> Src = SampleBytes(SamplePNG2,sizeof(SamplePNG2));
  byte *Clean=NULL, *Msg=NULL;
  size_t CleanLen=0, MsgLen=0;

  for(int i=0; i < 2; i++)
    {
    EXPECT_EQ(STASH_TOKEN_NOT_FOUND, StashRemove(Src.size(),Src.data(),"abCd",&Clean,&CleanLen,&Msg,&MsgLen));
    EXPECT_TRUE(Clean == NULL);
    EXPECT_TRUE(Msg == NULL);
    EXPECT_EQ(0U, CleanLen);
    }
}

TEST_F(StashEngine, CorruptedMessageIsMalformed)
{
  std::vector<byte> Src = SampleBytes(SamplePNG2,sizeof(SamplePNG2));
  std::vector<byte> Img = Encode(Src,"secret");

  // The new chunk starts where the IEND was
  Img[SAMPLE_PNG2_IEND_OFFSET + 8] ^= 0x01;
  EXPECT_EQ("MalformedChunk", Decode(Img,"piJj"));
}

TEST_F(StashEngine, EmptyMessage)
{
  std::vector<byte> Src = SampleBytes(SamplePNG,sizeof(SamplePNG));

  EXPECT_EQ(STASH_EMPTY_PLAINTEXT, StashEncode(Src.size(),Src.data(),0,(const byte*)"",&Rnd,&Out,&OutLen,Token));
  EXPECT_TRUE(Out == NULL);
  EXPECT_EQ(0U, OutLen);
  EXPECT_STREQ("", Token);

  // Checked before the image
  EXPECT_EQ(STASH_EMPTY_PLAINTEXT, StashEncode(3,(const byte*)"abc",0,NULL,&Rnd,&Out,&OutLen,Token));
}

TEST_F(StashEngine, NotAPng)
{
  std::vector<byte> Junk(100,'x');

  EXPECT_EQ(STASH_NOT_A_PNG, StashEncode(Junk.size(),Junk.data(),5,(const byte*)"hello",&Rnd,&Out,&OutLen,Token));
  EXPECT_TRUE(Out == NULL);
  EXPECT_EQ("NotAPng", Decode(Junk,"abCd"));
  EXPECT_EQ("NotAPng", Decode(Junk,"bad token")); // image is checked first
}

TEST_F(StashEngine, InvalidToken)
{
  std::vector<byte> Src = SampleBytes(SamplePNG,sizeof(SamplePNG));
  std::vector<byte> Cut = SampleBytes(SamplePNG,sizeof(SamplePNG)-12);

  EXPECT_EQ("InvalidToken", Decode(Src,"ABCD"));
  EXPECT_EQ("InvalidToken", Decode(Src,"abc"));
  EXPECT_EQ("InvalidToken", Decode(Src,NULL));
  EXPECT_EQ("TruncatedStream", Decode(Cut,"ABCD"));
}

TEST_F(StashEngine, UsedTokenIsRedrawn)
{
  std::vector<byte> Src = SampleBytes(SamplePNG,sizeof(SamplePNG));
  std::vector<byte> Once = Encode(Src,"first");
  ASSERT_STREQ("piJj", Token);

  // Same seed would draw piJj again; it is already in the file
  StashRandomSeeded(&Rnd,1);
  std::vector<byte> Twice = Encode(Once,"second");
  EXPECT_STREQ("nqDv", Token);

  EXPECT_EQ("first", Decode(Twice,"piJj"));
  EXPECT_EQ("second", Decode(Twice,"nqDv"));
}

TEST_F(StashEngine, CollisionGivesUp)
{
  std::vector<byte> Src = SampleBytes(SamplePNG,sizeof(SamplePNG));

  Rnd.Fill = ConstantFill;
  std::vector<byte> Once = Encode(Src,"first");
  ASSERT_STREQ("aaAa", Token);
  free(Out);
  Out=NULL;

  EXPECT_EQ(STASH_TOKEN_COLLISION, StashEncode(Once.size(),Once.data(),6,(const byte*)"second",&Rnd,&Out,&OutLen,Token));
  EXPECT_TRUE(Out == NULL);
  EXPECT_STREQ("", Token);
}

TEST_F(StashEngine, RandomFailure)
{
  std::vector<byte> Src = SampleBytes(SamplePNG,sizeof(SamplePNG));

  Rnd.Fill = FailingFill;
  EXPECT_EQ(STASH_RANDOM_FAILURE, StashEncode(Src.size(),Src.data(),5,(const byte*)"hello",&Rnd,&Out,&OutLen,Token));
  EXPECT_TRUE(Out == NULL);
}

TEST_F(StashEngine, BinaryMessage)
{
  std::vector<byte> Src = SampleBytes(SamplePNG,sizeof(SamplePNG));
  std::string Bin("a\0b\xff\n",5);
  std::vector<byte> Img = Encode(Src,Bin);

  EXPECT_EQ(Bin, Decode(Img,Token));
}

TEST_F(StashEngine, SeveralMessages)
{
  std::vector<byte> Img = SampleBytes(SamplePNG2,sizeof(SamplePNG2));
  std::vector<std::string> Tokens;

  for(int i=0; i < 5; i++)
    {
    Img = Encode(Img,"message " + std::to_string(i));
    Tokens.push_back(Token);
    }
  for(int i=0; i < 5; i++)
    {
    EXPECT_EQ("message " + std::to_string(i), Decode(Img,Tokens[i].c_str()));
    }
}

TEST_F(StashEngine, TrailingBytesDropped)
{
  std::vector<byte> Src = SampleBytes(SamplePNG,sizeof(SamplePNG));
  Src.push_back('!');
  std::vector<byte> Img = Encode(Src,"hello");

  EXPECT_EQ(sizeof(SamplePNG) + 12 + 5, Img.size());
  EXPECT_EQ("hello", Decode(Img,Token));
}

TEST_F(StashEngine, RemoveOneOfSeveral)
{
  std::vector<byte> Img = SampleBytes(SamplePNG2,sizeof(SamplePNG2));
  std::vector<std::string> Tokens;
  byte *Clean=NULL, *Msg=NULL;
  size_t CleanLen=0, MsgLen=0;
  pngchunklist List;

  for(int i=0; i < 3; i++)
    {
    Img = Encode(Img,"message " + std::to_string(i));
    Tokens.push_back(Token);
    }

  ASSERT_EQ(STASH_OK, StashRemove(Img.size(),Img.data(),Tokens[1].c_str(),&Clean,&CleanLen,&Msg,&MsgLen));
  EXPECT_EQ("message 1", AsString(Msg,MsgLen));
  std::vector<byte> Left(Clean,Clean+CleanLen);
  free(Clean);
  free(Msg);

  // The others keep their place and still decode
  ASSERT_EQ(STASH_OK, PNGParse(Left.size(),Left.data(),&List));
  ASSERT_EQ(8U, List.Count);
  EXPECT_EQ(0, memcmp(Tokens[0].data(),List.Chunks[5].Type,4));
  EXPECT_EQ(0, memcmp(Tokens[2].data(),List.Chunks[6].Type,4));
  EXPECT_TRUE(PNGChunkIs(List.Chunks+7,"IEND"));
  PNGListFree(&List);

  EXPECT_EQ("message 0", Decode(Left,Tokens[0].c_str()));
  EXPECT_EQ("TokenNotFound", Decode(Left,Tokens[1].c_str()));
  EXPECT_EQ("message 2", Decode(Left,Tokens[2].c_str()));
  EXPECT_EQ(0, memcmp(SamplePNG2,Left.data(),SAMPLE_PNG2_IEND_OFFSET));
}

TEST_F(StashEngine, ListShowsTokens)
{
  std::vector<byte> Img = Encode(SampleBytes(SamplePNG2,sizeof(SamplePNG2)),"hi");
  FILE *fp;
  char Buf[4096];
  size_t Len;

  fp = tmpfile();
  ASSERT_TRUE(fp != NULL);
  EXPECT_EQ(STASH_OK, StashList(fp,Img.size(),Img.data()));
  rewind(fp);
  Len = fread(Buf,1,sizeof(Buf)-1,fp);
  Buf[Len]='\0';
  fclose(fp);

  std::string Text(Buf);
  EXPECT_NE(std::string::npos, Text.find("Chunk[0]: offset 8, type 'IHDR'"));
  EXPECT_NE(std::string::npos, Text.find("type 'gAMA'"));
  EXPECT_NE(std::string::npos, Text.find("possible message: token piJj"));
  EXPECT_EQ(std::string::npos, Text.find("token tEXt"));
}

TEST_F(StashEngine, ListRejectsBadImage)
{
  std::vector<byte> Junk(20,'x');

  EXPECT_EQ(STASH_NOT_A_PNG, StashList(stdout,Junk.size(),Junk.data()));
}
