#include <gtest/gtest.h>

#include <filesystem>
#include <functional>

#include "typeset_lsp/basic/uri.hpp"

using typeset_lsp::Uri;

TEST(Uri, FromPathPercentEncodes)
{
  const Uri uri = Uri::from_path("/home/user/my doc/ä.typ");
  EXPECT_EQ(uri.str(), "file:///home/user/my%20doc/%C3%A4.typ");
}

TEST(Uri, ToPathDecodes)
{
  const auto path = Uri("file:///home/user/my%20doc/%C3%A4.typ").to_path();
  ASSERT_TRUE(path.has_value());
  EXPECT_EQ(path->generic_string(), "/home/user/my doc/ä.typ");
}

TEST(Uri, RoundTripsThroughPath)
{
  const std::filesystem::path original = "/tmp/a b/c#d.typ";
  const auto back = Uri::from_path(original).to_path();
  ASSERT_TRUE(back.has_value());
  EXPECT_EQ(*back, original);
}

TEST(Uri, AcceptsLocalhostAndShortForms)
{
  EXPECT_EQ(Uri("file://localhost/a/b.typ").to_path()->generic_string(), "/a/b.typ");
  EXPECT_EQ(Uri("file:/a/b.typ").to_path()->generic_string(), "/a/b.typ");
}

TEST(Uri, RejectsRemoteHostsAndOtherSchemes)
{
  EXPECT_FALSE(Uri("file://server/share/a.typ").to_path().has_value());
  EXPECT_FALSE(Uri("untitled:Untitled-1").to_path().has_value());
  EXPECT_FALSE(Uri("untitled:Untitled-1").is_file());
}

TEST(Uri, StripsQueryAndFragment)
{
  EXPECT_EQ(Uri("file:///a/b.typ?x=1#frag").to_path()->generic_string(), "/a/b.typ");
}

TEST(Uri, NormalizesDotSegments)
{
  EXPECT_EQ(Uri::from_path("/a/./b/../c.typ").str(), "file:///a/c.typ");
}

TEST(Uri, SpellingsOfOneFileAreEqual)
{
  const Uri plain = Uri::from_path("/doc/a:b/\xC3\xA4.typ");
  const Uri escaped("file:///doc/a%3Ab/%c3%a4.typ");
  const Uri localhost("file://localhost/doc/./a:b/%C3%A4.typ");

  EXPECT_EQ(escaped, plain);
  EXPECT_EQ(localhost, plain);
  EXPECT_EQ(escaped.str(), "file:///doc/a:b/%C3%A4.typ");
  EXPECT_EQ(std::hash<Uri>{}(escaped), std::hash<Uri>{}(plain));
}

TEST(Uri, NonLocalUrisAreKeptVerbatim)
{
  EXPECT_EQ(Uri("untitled:Untitled-1").str(), "untitled:Untitled-1");
  EXPECT_EQ(Uri("file://server/share/a%3Ab.typ").str(), "file://server/share/a%3Ab.typ");
}
