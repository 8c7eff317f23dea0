// Unit tests for pastekeep/scraper/paste.hpp and URL splitting
// Tests: listing parser leniency, Paste persistence hooks

#include <gtest/gtest.h>

#include <pastekeep/codec.hpp>
#include <pastekeep/scraper/http.hpp>
#include <pastekeep/scraper/paste.hpp>

#include <string>
#include <vector>

namespace pastekeep::scraper {
namespace {

TEST(ParsePasteListTest, ParsesListingWithStringNumbers) {
  const std::string body = R"([
    {
      "scrape_url": "https://scrape.pastebin.com/api_scrape_item.php?i=0CeaNm8Y",
      "full_url": "https://pastebin.com/0CeaNm8Y",
      "date": "1442911802",
      "key": "0CeaNm8Y",
      "size": "890",
      "expire": "1442998159",
      "title": "Once we all know when we goto function",
      "syntax": "java",
      "user": "admin"
    }
  ])";

  std::vector<Paste> pastes;
  std::string error;
  ASSERT_TRUE(ParsePasteList(body, &pastes, &error)) << error;
  ASSERT_EQ(pastes.size(), 1u);

  const Paste& p = pastes[0];
  EXPECT_EQ(p.key, "0CeaNm8Y");
  EXPECT_EQ(p.scrape_url, "https://scrape.pastebin.com/api_scrape_item.php?i=0CeaNm8Y");
  EXPECT_EQ(p.date, 1442911802);
  EXPECT_EQ(p.size, 890u);
  EXPECT_EQ(p.expire, 1442998159);
  EXPECT_EQ(p.syntax, "java");
  EXPECT_EQ(p.user, "admin");
  EXPECT_TRUE(p.content.empty());
}

TEST(ParsePasteListTest, AcceptsNumericFieldsAndZeroesGarbage) {
  const std::string body =
      R"([{"key": "a", "date": 12, "size": "lots", "expire": "0"}])";

  std::vector<Paste> pastes;
  std::string error;
  ASSERT_TRUE(ParsePasteList(body, &pastes, &error)) << error;
  ASSERT_EQ(pastes.size(), 1u);
  EXPECT_EQ(pastes[0].date, 12);
  EXPECT_EQ(pastes[0].size, 0u);
  EXPECT_EQ(pastes[0].expire, 0);
  EXPECT_EQ(pastes[0].title, "");
}

TEST(ParsePasteListTest, SkipsEntriesWithoutKey) {
  const std::string body = R"([{"key": "a"}, {"title": "no key"}, {"key": ""}, 7, {"key": "b"}])";

  std::vector<Paste> pastes;
  std::string error;
  size_t skipped = 0;
  ASSERT_TRUE(ParsePasteList(body, &pastes, &error, &skipped)) << error;
  ASSERT_EQ(pastes.size(), 2u);
  EXPECT_EQ(pastes[0].key, "a");
  EXPECT_EQ(pastes[1].key, "b");
  EXPECT_EQ(skipped, 3u);
}

TEST(ParsePasteListTest, RejectsNonArrayPayload) {
  std::vector<Paste> pastes;
  std::string error;

  // The API answers with plain text when the client IP is not whitelisted.
  EXPECT_FALSE(ParsePasteList("YOUR IP: 10.0.0.1 DOES NOT HAVE ACCESS.", &pastes, &error));
  EXPECT_FALSE(error.empty());

  error.clear();
  EXPECT_FALSE(ParsePasteList(R"({"key": "a"})", &pastes, &error));
  EXPECT_FALSE(error.empty());
}

TEST(ParsePasteListTest, EmptyArrayIsFine) {
  std::vector<Paste> pastes{Paste{}};
  std::string error;
  ASSERT_TRUE(ParsePasteList("[]", &pastes, &error));
  EXPECT_TRUE(pastes.empty());
}

TEST(PasteCodecTest, RoundTripsThroughCodec) {
  Paste in;
  in.key = "k1";
  in.scrape_url = "https://scrape.example.test/i=k1";
  in.full_url = "https://example.test/k1";
  in.date = 1442911802;
  in.size = 3;
  in.expire = 0;
  in.title = "t";
  in.syntax = "text";
  in.user = "";
  in.content = "abc";

  std::string bytes;
  ASSERT_TRUE(EncodeValue(in, &bytes).ok());

  Paste out;
  ASSERT_TRUE(DecodeValue(bytes, &out).ok());
  EXPECT_EQ(out.key, in.key);
  EXPECT_EQ(out.scrape_url, in.scrape_url);
  EXPECT_EQ(out.date, in.date);
  EXPECT_EQ(out.size, in.size);
  EXPECT_EQ(out.content, in.content);
}

TEST(PasteCodecTest, WrongFieldTypeIsDecodeError) {
  Json::Value v(Json::objectValue);
  v["key"] = "k";
  v["date"] = "not a number";

  std::string bytes;
  ASSERT_TRUE(EncodeValue(v, &bytes).ok());
  Paste out;
  EXPECT_TRUE(IsDecodeError(DecodeValue(bytes, &out)));
}

TEST(SplitUrlTest, SplitsBaseAndTarget) {
  std::string base, target;
  ASSERT_TRUE(SplitUrl("https://scrape.pastebin.com/api_scraping.php?limit=100", &base, &target));
  EXPECT_EQ(base, "https://scrape.pastebin.com");
  EXPECT_EQ(target, "/api_scraping.php?limit=100");

  ASSERT_TRUE(SplitUrl("http://localhost:8080", &base, &target));
  EXPECT_EQ(base, "http://localhost:8080");
  EXPECT_EQ(target, "/");

  ASSERT_TRUE(SplitUrl("http://host?x=1", &base, &target));
  EXPECT_EQ(base, "http://host");
  EXPECT_EQ(target, "/?x=1");
}

TEST(SplitUrlTest, RejectsBadUrls) {
  std::string base, target;
  EXPECT_FALSE(SplitUrl("scrape.pastebin.com/x", &base, &target));
  EXPECT_FALSE(SplitUrl("ftp://host/x", &base, &target));
  EXPECT_FALSE(SplitUrl("https:///x", &base, &target));
}

}  // namespace
}  // namespace pastekeep::scraper
