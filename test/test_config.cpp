#include "argparser.hpp"

#include <gtest/gtest.h>

#include <cstdlib>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

// Parses the arguments, the program name is prepended
void parse(objxfer::argparser& args, std::vector<std::string> argv) {
  argv.insert(argv.begin(), "objxfer");
  std::vector<char*> ptrs;
  for (auto& arg : argv) {
    ptrs.push_back(arg.data());
  }
  args.parse(static_cast<int>(ptrs.size()), ptrs.data());
}

objxfer::argparser make_parser() {
  objxfer::argparser args;
  args.set_env_prefix("OBJXFER_TEST");
  args.add_option("--bucket", "");
  args.add_option_alias("--bucket", "-b");
  args.add_option("--region", "us-east-1");
  args.add_option("--secret-access-key", "");
  args.add_bool_option("--no-owner-full-control");
  return args;
}

}  // namespace

TEST(Config, Options) {
  auto args = make_parser();
  parse(args, {"ls", "--bucket", "data", "--region=eu-west-1", "in/"});

  EXPECT_EQ(args.get_option("--bucket"), "data");
  EXPECT_EQ(args.get_option("--region"), "eu-west-1");
  ASSERT_EQ(args.size(), 2u);
  EXPECT_EQ(args[0], "ls");
  EXPECT_EQ(args[1], "in/");
}

TEST(Config, Defaults) {
  auto args = make_parser();
  parse(args, {"ls"});

  EXPECT_EQ(args.get_option("--region"), "us-east-1");
  EXPECT_FALSE(args.has_option("--region"));
  EXPECT_EQ(args.get_option("--bucket"), "");
  EXPECT_FALSE(args.has_option("--no-owner-full-control"));
}

TEST(Config, Alias) {
  auto args = make_parser();
  parse(args, {"-b", "data"});

  EXPECT_EQ(args.get_option("--bucket"), "data");
  EXPECT_TRUE(args.has_option("--bucket"));
}

TEST(Config, BoolOption) {
  auto args = make_parser();
  parse(args, {"--no-owner-full-control", "push", "/tmp/staging"});

  EXPECT_TRUE(args.has_option("--no-owner-full-control"));
  ASSERT_EQ(args.size(), 2u);
  EXPECT_EQ(args[1], "/tmp/staging");
  EXPECT_THROW(parse(args, {"--no-owner-full-control=yes"}), std::invalid_argument);
}

TEST(Config, Values) {
  auto args = make_parser();
  parse(args, {"pull", "/tmp/staging", "in/a", "in/b"});

  EXPECT_EQ(args.get_values(2), std::vector<std::string>({"in/a", "in/b"}));
  EXPECT_TRUE(args.get_values(4).empty());
  EXPECT_THROW(args.get_value(4), std::invalid_argument);
  EXPECT_EQ(args.get_value_path(1), std::filesystem::path("/tmp/staging"));
}

TEST(Config, Errors) {
  auto args = make_parser();
  EXPECT_THROW(parse(args, {"--unknown"}), std::invalid_argument);
  EXPECT_THROW(parse(args, {"--unknown=1"}), std::invalid_argument);
  EXPECT_THROW(parse(args, {"--bucket"}), std::invalid_argument);
  EXPECT_THROW(args.get_option("--unknown"), std::invalid_argument);
  EXPECT_THROW(args.add_option_alias("--unknown", "-u"), std::invalid_argument);
}

TEST(Config, Environment) {
  setenv("OBJXFER_TEST_SECRET_ACCESS_KEY", "from-env", 1);
  setenv("OBJXFER_TEST_REGION", "ap-south-1", 1);

  auto args = make_parser();
  parse(args, {"--region", "eu-north-1"});

  EXPECT_EQ(args.get_option("--secret-access-key"), "from-env");
  EXPECT_TRUE(args.has_option("--secret-access-key"));

  // Command line wins over the environment
  EXPECT_EQ(args.get_option("--region"), "eu-north-1");

  unsetenv("OBJXFER_TEST_SECRET_ACCESS_KEY");
  unsetenv("OBJXFER_TEST_REGION");
}
