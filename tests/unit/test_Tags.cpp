#include <gtest/gtest.h>
#include "db/encoding/tags.hpp"
#include "snapshot/model/Import.hpp"

using namespace fsnap;
using namespace fsnap::db::encoding;

TEST(TagEncodingTest, SortedDelimitedForm) {
    EXPECT_EQ(to_tag_string({{"site", "S01"}, {"protocol", "P1"}}), "/protocol:P1/site:S01/");
}

TEST(TagEncodingTest, EmptyMapIsEmptyString) {
    EXPECT_EQ(to_tag_string({}), "");
    EXPECT_TRUE(from_tag_string("").empty());
}

TEST(TagEncodingTest, RoundTrip) {
    const std::vector<std::map<std::string, std::string>> maps = {
        {},
        {{"a", "1"}},
        {{"protocol", "P 001"}, {"account", "acc.7"}, {"empty", ""}},
        {{"UPPER", "Case"}, {"lower", "case"}},
    };
    for (const auto& m : maps) EXPECT_EQ(from_tag_string(to_tag_string(m)), m);
}

TEST(TagEncodingTest, MalformedEntryIsAFormatError) {
    EXPECT_THROW(from_tag_string("/novalue/"), TagFormatError);
    EXPECT_THROW(from_tag_string("/a:b:c/"), TagFormatError);
    EXPECT_THROW(from_tag_string("/ok:1/broken/"), TagFormatError);
}

TEST(TagEncodingTest, UnencodableValuesAreRejectedOnWrite) {
    EXPECT_FALSE(isEncodable(std::map<std::string, std::string>{{"time", "12:30"}}));
    EXPECT_THROW(to_tag_string({{"time", "12:30"}}), TagFormatError);
    EXPECT_THROW(to_tag_string({{"a/b", "x"}}), TagFormatError);
}

TEST(TagEncodingTest, ImportTagKeysAreNormalized) {
    const auto tags = snapshot::model::normalizeTags({{"  Study ", "X"}, {"SITE", "s1"}});
    const snapshot::model::Tags expected{{"study", "X"}, {"site", "s1"}};
    EXPECT_EQ(tags, expected);
}

TEST(TagEncodingTest, ImportTagKeysCollidingAfterNormalizationAreRejected) {
    EXPECT_THROW((void)snapshot::model::normalizeTags({{"Site", "s1"}, {"site", "s2"}}), TagFormatError);
    EXPECT_THROW((void)snapshot::model::normalizeTags({{" study", "a"}, {"study ", "b"}}), TagFormatError);
}

TEST(ImportIdTest, HexFormRoundTripsThroughBothInputForms) {
    const auto id = snapshot::model::newImportId();
    const auto hex = snapshot::model::toHex(id);
    ASSERT_EQ(hex.size(), 32u);
    EXPECT_EQ(hex.find('-'), std::string::npos);
    EXPECT_EQ(snapshot::model::parseImportId(hex), id);

    auto dashed = hex;
    for (const size_t pos : {8u, 13u, 18u, 23u}) dashed.insert(pos, "-");
    EXPECT_EQ(snapshot::model::parseImportId(dashed), id);
    EXPECT_THROW((void)snapshot::model::parseImportId("not-an-id"), std::invalid_argument);
}
