#include "url.hpp"

#include <gtest/gtest.h>

TEST(Url, Parse) {
  objxfer::url url("http://localhost:9000/bucket/key");
  EXPECT_EQ(url.scheme(), "http");
  EXPECT_EQ(url.host(), "localhost:9000");
  EXPECT_EQ(url.path(), "/bucket/key");
  EXPECT_EQ(url.origin(), "http://localhost:9000");
}

TEST(Url, Parse_NoPort) {
  objxfer::url url("https://s3.us-west-2.amazonaws.com/path/to/file.html");
  EXPECT_EQ(url.scheme(), "https");
  EXPECT_EQ(url.host(), "s3.us-west-2.amazonaws.com");
  EXPECT_EQ(url.path(), "/path/to/file.html");
}

TEST(Url, Parse_NoPath) {
  objxfer::url url("http://localhost:9000");
  EXPECT_EQ(url.scheme(), "http");
  EXPECT_EQ(url.host(), "localhost:9000");
  EXPECT_EQ(url.path(), "/");
}

TEST(Url, Parse_TrailingSlash) {
  objxfer::url url("http://localhost:9000/");
  EXPECT_EQ(url.string(), "http://localhost:9000");
  EXPECT_EQ(url.host(), "localhost:9000");
  EXPECT_EQ(url.path(), "/");
}

TEST(Url, Parse_NoScheme) {
  objxfer::url url("minio.local:9000");
  EXPECT_EQ(url.scheme(), "");
  EXPECT_EQ(url.host(), "minio.local:9000");
  EXPECT_EQ(url.path(), "/");
  EXPECT_EQ(url.origin(), "https://minio.local:9000");
}

TEST(Url, Empty) {
  objxfer::url url;
  EXPECT_TRUE(url.empty());
  EXPECT_FALSE(objxfer::url("http://localhost").empty());
}
