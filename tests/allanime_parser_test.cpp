#include <gtest/gtest.h>
#include "allanime/allanime_parser.hpp"

using AllAnime::Parser;
using Shio::Error;
using Shio::ErrorKind;

static const char* SEARCH_RESPONSE = R"({
  "data": {
    "shows": {
      "edges": [
        {"_id": "cstcbG4EquLyDnAwN", "name": "Naruto", "englishName": "Naruto",
         "availableEpisodes": {"sub": 220, "dub": 220, "raw": 0}, "__typename": "Show"},
        {"_id": "", "name": "Broken entry"},
        {"_id": "R5cMSt6bqutBTr7Mc", "name": "Naruto: Shippuuden", "englishName": null,
         "availableEpisodes": {"sub": 500}, "__typename": "Show"}
      ]
    }
  }
})";

TEST(AllAnimeParserTest, DecryptXorsHexBytes)
{
    EXPECT_EQ(Parser::decrypt("504c4c484b"), "https");
    EXPECT_EQ(Parser::decrypt(""), "");
}

TEST(AllAnimeParserTest, DecryptRejectsMalformedHex)
{
    EXPECT_EQ(Parser::decrypt("504"), "");
    EXPECT_EQ(Parser::decrypt("zz4c"), "");
}

TEST(AllAnimeParserTest, DecodesObfuscatedClockUrl)
{
    // "--" + hex("/apivtwo/clock?id=abc" ^ 56)
    std::string raw = "--175948514e4c4f57175b54575b5307515c05595a5b";
    EXPECT_EQ(Parser::decode_source_url(raw), "https://allanime.day/apivtwo/clock.json?id=abc");
}

TEST(AllAnimeParserTest, DecodesProtocolRelativeUrl)
{
    EXPECT_EQ(Parser::decode_source_url("//embed.example.com/e/123"), "https://embed.example.com/e/123");
}

TEST(AllAnimeParserTest, LeavesAbsoluteUrlAlone)
{
    EXPECT_EQ(Parser::decode_source_url("https://cdn.example.com/v.mp4"), "https://cdn.example.com/v.mp4");
    EXPECT_EQ(Parser::decode_source_url("https://x.example.com/clock.json?id=1"),
              "https://x.example.com/clock.json?id=1");
}

TEST(AllAnimeParserTest, ParsesSearchEdges)
{
    Error error;
    auto results = Parser::parse_search(SEARCH_RESPONSE, "allanime:sub", "sub", error);

    ASSERT_TRUE(results.has_value());
    EXPECT_FALSE(error);
    ASSERT_EQ(results->size(), 2u);

    const auto& first = (*results)[0];
    EXPECT_EQ(first.adapter_id, "allanime:sub");
    EXPECT_EQ(first.id, "cstcbG4EquLyDnAwN");
    EXPECT_EQ(first.title, "Naruto");
    ASSERT_TRUE(first.english_title.has_value());
    EXPECT_EQ(*first.english_title, "Naruto");
    ASSERT_TRUE(first.episode_count.has_value());
    EXPECT_EQ(*first.episode_count, 220);
    EXPECT_EQ(first.get_key(), "allanime:sub:cstcbG4EquLyDnAwN");

    const auto& second = (*results)[1];
    EXPECT_EQ(second.title, "Naruto: Shippuuden");
    EXPECT_FALSE(second.english_title.has_value());
}

TEST(AllAnimeParserTest, SearchEpisodeCountFollowsMode)
{
    Error error;
    auto results = Parser::parse_search(SEARCH_RESPONSE, "allanime:dub", "dub", error);

    ASSERT_TRUE(results.has_value());
    ASSERT_EQ(results->size(), 2u);
    EXPECT_EQ((*results)[0].episode_count.value_or(-1), 220);
    EXPECT_FALSE((*results)[1].episode_count.has_value());
}

TEST(AllAnimeParserTest, EmptySearchIsNotAnError)
{
    Error error;
    auto results = Parser::parse_search(R"({"data":{"shows":{"edges":[]}}})", "allanime:sub", "sub", error);

    ASSERT_TRUE(results.has_value());
    EXPECT_TRUE(results->empty());
}

TEST(AllAnimeParserTest, GraphqlErrorsBecomeParseErrors)
{
    Error error;
    auto results = Parser::parse_search(
        R"({"errors":[{"message":"PersistedQueryNotFound"}],"data":null})", "allanime:sub", "sub", error);

    EXPECT_FALSE(results.has_value());
    EXPECT_EQ(error.kind, ErrorKind::Parse);
    EXPECT_EQ(error.message, "PersistedQueryNotFound");
}

TEST(AllAnimeParserTest, MalformedJsonIsParseError)
{
    Error error;
    auto results = Parser::parse_search("<html>Cloudflare</html>", "allanime:sub", "sub", error);

    EXPECT_FALSE(results.has_value());
    EXPECT_EQ(error.kind, ErrorKind::Parse);
}

TEST(AllAnimeParserTest, EpisodeListIsSortedNumerically)
{
    Error error;
    auto labels = Parser::parse_episode_list(
        R"({"data":{"show":{"_id":"x","availableEpisodesDetail":{"sub":["10","2","1.5","1"],"dub":[]}}}})",
        "sub", error);

    ASSERT_TRUE(labels.has_value());
    std::vector<std::string> expected = {"1", "1.5", "2", "10"};
    EXPECT_EQ(*labels, expected);
}

TEST(AllAnimeParserTest, EpisodeListMissingModeIsNotFound)
{
    Error error;
    auto labels = Parser::parse_episode_list(
        R"({"data":{"show":{"_id":"x","availableEpisodesDetail":{"sub":["1"],"dub":[]}}}})",
        "dub", error);

    EXPECT_FALSE(labels.has_value());
    EXPECT_EQ(error.kind, ErrorKind::NotFound);
    EXPECT_EQ(error.message, "no episodes found for mode 'dub'");
}

TEST(AllAnimeParserTest, MissingShowIsNotFound)
{
    Error error;
    auto labels = Parser::parse_episode_list(R"({"data":{"show":null}})", "sub", error);

    EXPECT_FALSE(labels.has_value());
    EXPECT_EQ(error.kind, ErrorKind::NotFound);
}

TEST(AllAnimeParserTest, SortKeepsOrderOfNonNumericLabels)
{
    std::vector<std::string> labels = {"3", "special", "1", "ova"};
    Parser::sort_episode_labels(labels);

    std::vector<std::string> expected = {"special", "ova", "1", "3"};
    EXPECT_EQ(labels, expected);
}

TEST(AllAnimeParserTest, SortTreatsNanAndInfinityAsNonNumeric)
{
    std::vector<std::string> labels = {"2", "nan", "1", "inf", "NaN", "-infinity", "1.5"};
    Parser::sort_episode_labels(labels);

    std::vector<std::string> expected = {"nan", "inf", "NaN", "-infinity", "1", "1.5", "2"};
    EXPECT_EQ(labels, expected);
}

TEST(AllAnimeParserTest, ParsesEpisodeSources)
{
    Error error;
    auto sources = Parser::parse_episode_sources(R"({"data":{"episode":{
        "episodeString":"1",
        "sourceUrls":[
            {"sourceName":"Default","sourceUrl":"--175948514e4c4f57175b54575b5307515c05595a5b"},
            {"sourceName":"Empty","sourceUrl":""},
            {"sourceName":"Mp4","sourceUrl":"https://mp4.example.com/e/1"}
        ]}}})", error);

    ASSERT_TRUE(sources.has_value());
    EXPECT_EQ(sources->episode_string, "1");
    ASSERT_EQ(sources->sources.size(), 2u);
    EXPECT_EQ(sources->sources[0].name, "Default");
    EXPECT_EQ(sources->sources[1].url, "https://mp4.example.com/e/1");
}

TEST(AllAnimeParserTest, MissingEpisodeIsNotFound)
{
    Error error;
    auto sources = Parser::parse_episode_sources(R"({"data":{"episode":null}})", error);

    EXPECT_FALSE(sources.has_value());
    EXPECT_EQ(error.kind, ErrorKind::NotFound);
}

TEST(AllAnimeParserTest, ParsesClockLink)
{
    Error error;
    auto link = Parser::parse_clock_link(
        R"({"links":[{"link":"https://cdn.example.com/master.m3u8","hls":true},{"link":"https://other"}]})",
        error);

    ASSERT_TRUE(link.has_value());
    EXPECT_EQ(*link, "https://cdn.example.com/master.m3u8");
}

TEST(AllAnimeParserTest, ClockWithoutLinksIsParseError)
{
    Error error;
    auto link = Parser::parse_clock_link(R"({"links":[]})", error);

    EXPECT_FALSE(link.has_value());
    EXPECT_EQ(error.kind, ErrorKind::Parse);
}
