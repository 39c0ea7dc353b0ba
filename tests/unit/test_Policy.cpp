#include <gtest/gtest.h>
#include "snapshot/model/Policy.hpp"

#include <fmt/format.h>

using namespace fsnap::snapshot::model;

TEST(PolicyTest, NotArchivedNeverArchives) {
    EXPECT_FALSE(isArchived(NotArchived{}, {{"archive", "archive"}}));
}

TEST(PolicyTest, HasMetadataMatchesListedValues) {
    const ArchivedBy policy = HasMetadata{"archive", {"archive", "archived"}};
    EXPECT_TRUE(isArchived(policy, {{"archive", "archived"}}));
    EXPECT_FALSE(isArchived(policy, {{"archive", "current"}}));
    EXPECT_FALSE(isArchived(policy, {{"other", "archive"}}));
}

TEST(PolicyTest, HasMetadataWithoutValuesNeedsOnlyTheKey) {
    const ArchivedBy policy = HasMetadata{"old", {}};
    EXPECT_TRUE(isArchived(policy, {{"old", "anything"}}));
    EXPECT_FALSE(isArchived(policy, {}));
}

TEST(PolicyTest, FromMetadataFormatsNamedFields) {
    const CalcBy policy = FromMetadata{"{protocol} // {account}"};
    EXPECT_EQ(calculate(policy, {{"protocol", "P1"}, {"account", "A7"}, {"extra", "x"}}), "P1 // A7");
}

TEST(PolicyTest, MissingFieldYieldsNoValue) {
    const CalcBy policy = FromMetadata{"{protocol} // {account}"};
    EXPECT_FALSE(calculate(policy, {{"protocol", "P1"}}).has_value());
}

TEST(PolicyTest, NoCalcYieldsNoValue) {
    EXPECT_FALSE(calculate(NoCalc{}, {{"protocol", "P1"}}).has_value());
}

TEST(PolicyTest, MalformedFormatThrowsInsteadOfYieldingNoValue) {
    const Metadata metadata{{"protocol", "P1"}};
    EXPECT_THROW((void)calculate(FromMetadata{"{protocol"}, metadata), fmt::format_error);
    EXPECT_THROW((void)calculate(FromMetadata{"{protocol:Q}"}, metadata), fmt::format_error);
}

TEST(PolicyTest, ValidateAcceptsNamedFieldsAndEscapes) {
    EXPECT_NO_THROW(validate(NoCalc{}));
    EXPECT_NO_THROW(validate(FromMetadata{"{protocol} // {account}"}));
    EXPECT_NO_THROW(validate(FromMetadata{"{{literal}} {kind:>4}"}));
}

TEST(PolicyTest, ValidateRejectsMalformedOrPositionalFormats) {
    EXPECT_THROW(validate(FromMetadata{"{protocol"}), fmt::format_error);
    EXPECT_THROW(validate(FromMetadata{"{protocol:Q}"}), fmt::format_error);
    EXPECT_THROW(validate(FromMetadata{"{} // {account}"}), fmt::format_error);
    EXPECT_THROW(validate(FromMetadata{"{0}"}), fmt::format_error);
}
