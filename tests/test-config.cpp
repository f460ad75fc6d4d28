/************************************************
 PNG Stash: implemented in C
 See LICENSE

 Tests for reading the configuration file.
 ************************************************/
#include <stdio.h>
#include <stdlib.h>
#include <unistd.h>
#include <string>
#include <gtest/gtest.h>

#include "stash.hpp"
#include "config.hpp"

namespace {

class ReadCfgTest : public ::testing::Test
  {
  protected:
    std::string Cfgname;
    stashfield *Args;

    void SetUp() override
      {
      char Tmpl[] = "/tmp/stash-cfg-XXXXXX";
      int fd = mkstemp(Tmpl);
      ASSERT_GE(fd, 0);
      close(fd);
      Cfgname = Tmpl;

      Args = NULL;
      Args = StashSetText(Args,"outfile","./%b-stash%e");
      Args = StashSetText(Args,"message","");
      Args = StashSetText(Args,"token","");
      Args = StashSetText(Args,"config",Cfgname.c_str());
      }

    void TearDown() override
      {
      StashFree(Args);
      unlink(Cfgname.c_str());
      }

    void WriteCfg(const char *Text)
      {
      FILE *fp = fopen(Cfgname.c_str(),"w");
      ASSERT_TRUE(fp != NULL);
      fputs(Text,fp);
      fclose(fp);
      }
  };

} // namespace

TEST_F(ReadCfgTest, SetsKnownFields)
{
  WriteCfg("# comment line\n"
	   "outfile=/tmp/%b-out%e\n"
	   "\n"
	   "  token = abCd  \n");
  Args = ReadCfg(Args);
  EXPECT_STREQ("/tmp/%b-out%e", StashGetText(Args,"outfile"));
  EXPECT_STREQ("abCd", StashGetText(Args,"token"));
}

TEST_F(ReadCfgTest, LastLineWithoutNewline)
{
  WriteCfg("message=hello world");
  Args = ReadCfg(Args);
  EXPECT_STREQ("hello world", StashGetText(Args,"message"));
}

TEST_F(ReadCfgTest, EmptyValueClearsField)
{
  WriteCfg("outfile=\n");
  Args = ReadCfg(Args);
  EXPECT_STREQ("", StashGetText(Args,"outfile"));
}

TEST_F(ReadCfgTest, MissingFileIsIgnored)
{
  unlink(Cfgname.c_str());
  Args = ReadCfg(Args);
  EXPECT_STREQ("./%b-stash%e", StashGetText(Args,"outfile"));
}

TEST_F(ReadCfgTest, NoConfigName)
{
  Args = StashSetText(Args,"config","");
  Args = ReadCfg(Args);
  EXPECT_STREQ("./%b-stash%e", StashGetText(Args,"outfile"));
}

TEST_F(ReadCfgTest, UnknownFieldExits)
{
  WriteCfg("colour=blue\n");
  EXPECT_EXIT(ReadCfg(Args), ::testing::ExitedWithCode(1), "unknown field");
}

TEST_F(ReadCfgTest, MissingEqualsExits)
{
  WriteCfg("outfile value\n");
  EXPECT_EXIT(ReadCfg(Args), ::testing::ExitedWithCode(1), "missing '='");
}

TEST_F(ReadCfgTest, BadInitialCharacterExits)
{
  WriteCfg("=value\n");
  EXPECT_EXIT(ReadCfg(Args), ::testing::ExitedWithCode(1), "bad initial character");
}
