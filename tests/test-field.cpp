/************************************************
 PNG Stash: implemented in C
 See LICENSE

 Tests for the field=value parameter store.
 ************************************************/
#include <string.h>
#include <string>
#include <gtest/gtest.h>

#include "stash.hpp"

TEST(StashField, SetAndGetText)
{
  stashfield *Args=NULL;

  Args = StashSetText(Args,"outfile","./%b-stash%e");
  ASSERT_NE((stashfield*)NULL, StashSearch(Args,"outfile"));
  EXPECT_STREQ("./%b-stash%e", StashGetText(Args,"outfile"));
  EXPECT_EQ(strlen("./%b-stash%e"), StashGetSize(Args,"outfile"));
  EXPECT_TRUE(StashGetText(Args,"missing") == NULL);
  EXPECT_EQ(0U, StashGetSize(Args,"missing"));
  StashFree(Args);
}

TEST(StashField, SetReplacesValue)
{
  stashfield *Args=NULL;

  Args = StashSetText(Args,"token","abCd");
  Args = StashSetText(Args,"token","wxYz");
  EXPECT_STREQ("wxYz", StashGetText(Args,"token"));
  EXPECT_EQ((stashfield*)NULL, Args->Next); // still one record
  StashFree(Args);
}

TEST(StashField, EmptyTextIsNullTerminated)
{
  stashfield *Args=NULL;

  Args = StashSetText(Args,"message","");
  ASSERT_NE((char*)NULL, StashGetText(Args,"message"));
  EXPECT_STREQ("", StashGetText(Args,"message"));
  EXPECT_EQ(0U, StashGetSize(Args,"message"));
  StashFree(Args);
}

TEST(StashField, AddTextAppends)
{
  stashfield *Args=NULL;

  Args = StashAddText(Args,"config","/home/user"); // creates it
  Args = StashAddText(Args,"config","/.stash.cfg");
  Args = StashAddText(Args,"config",""); // no change
  EXPECT_STREQ("/home/user/.stash.cfg", StashGetText(Args,"config"));
  EXPECT_EQ('c', StashSearch(Args,"config")->Type);
  StashFree(Args);
}

TEST(StashField, BinaryHoldsNulBytes)
{
  stashfield *Args=NULL;
  const byte Data[] = { 'a', 0x00, 0xff, 'b' };

  Args = StashSetBin(Args,"@message",sizeof(Data),Data);
  Args = StashAddBin(Args,"@message",1,Data);
  ASSERT_EQ(5U, StashGetSize(Args,"@message"));
  EXPECT_EQ(0, memcmp(Data, StashGetBin(Args,"@message"), 4));
  EXPECT_EQ('a', StashGetBin(Args,"@message")[4]);
  EXPECT_EQ('b', StashSearch(Args,"@message")->Type);
  StashFree(Args);
}

TEST(StashField, DelRemovesOnlyThatField)
{
  stashfield *Args=NULL;

  Args = StashSetText(Args,"a","1");
  Args = StashSetText(Args,"b","2");
  Args = StashSetText(Args,"c","3");
  Args = StashDel(Args,"b");
  EXPECT_TRUE(StashSearch(Args,"b") == NULL);
  EXPECT_STREQ("1", StashGetText(Args,"a"));
  EXPECT_STREQ("3", StashGetText(Args,"c"));
  Args = StashDel(Args,"nothing");
  EXPECT_STREQ("1", StashGetText(Args,"a"));
  StashFree(Args);
}

TEST(StashError, NamesAndText)
{
  EXPECT_STREQ("OK", StashErrorName(STASH_OK));
  EXPECT_STREQ("NotAPng", StashErrorName(STASH_NOT_A_PNG));
  EXPECT_STREQ("TokenNotFound", StashErrorName(STASH_TOKEN_NOT_FOUND));
  EXPECT_STREQ("IoError", StashErrorName(STASH_IO_ERROR));
  for(int e=STASH_OK; e < STASH_ERROR_MAX; e++)
    {
    EXPECT_NE((const char*)NULL, StashErrorText((StashError)e));
    EXPECT_STRNE("", StashErrorText((StashError)e));
    }
}
