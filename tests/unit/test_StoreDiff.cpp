#include <gtest/gtest.h>
#include "cmd/commands.hpp"
#include "db/MemoryStore.hpp"
#include "log/Registry.hpp"
#include "util/errors.hpp"
#include "TempTree.hpp"

#include <algorithm>
#include <nlohmann/json.hpp>

using namespace fsnap;
using namespace fsnap::snapshot::model;

class StoreDiffTest : public ::testing::Test {
protected:
    test::TempTree tree;
    config::SnapshotSpec spec;
    int64_t now = 1000;
    std::shared_ptr<db::MemoryStore> store =
        std::make_shared<db::MemoryStore>(log::Registry::db(), [this] { return now++; });

    void SetUp() override {
        spec.name = "delivery";
        spec.root_dir = tree.root();
        spec.match_paths = {
            {"csv", {"{site}/{file}.csv"}},
            {"archive", {"{archive}/{site}/{file}.csv"}},
        };
        spec.archived_by = HasMetadata{"archive", {"archive"}};
    }

    [[nodiscard]] db::StoreFactory factory() const {
        return [s = store] { return s; };
    }

    static std::vector<std::string> sortedPaths(std::vector<FileRecord> records) {
        std::vector<std::string> out;
        for (const auto& r : records) out.push_back(r.fileName() + "@" + r.hexDigest());
        std::ranges::sort(out);
        return out;
    }
};

TEST_F(StoreDiffTest, MoveBetweenSnapshotsIsReportedAsMoved) {
    tree.write("A/1.csv", "a,b,c\n");
    const auto first = cmd::store(spec, factory()).id;

    tree.move("A/1.csv", "B/1.csv");
    const auto second = cmd::store(spec, factory()).id;

    const auto j = cmd::diff(spec, *store, first);
    EXPECT_EQ(j["original_id"], toHex(first));
    EXPECT_EQ(j["new_id"], toHex(second));
    ASSERT_EQ(j["actions"].size(), 1u);

    const auto& a = j["actions"][0];
    EXPECT_EQ(a["$type"], "Moved");
    EXPECT_EQ(a["original"]["dir_name"], "A");
    EXPECT_EQ(a["original"]["file_name"], "A/1.csv");
    EXPECT_EQ(a["dir_name"], "B");
    EXPECT_EQ(a["metadata"]["site"], "B");
}

TEST_F(StoreDiffTest, ArchivingKeepsOriginalAndCopies) {
    tree.write("A/1.csv", "payload");
    const auto first = cmd::store(spec, factory()).id;

    tree.copy("A/1.csv", "archive/A/1.csv");
    (void)cmd::store(spec, factory());

    const auto j = cmd::diff(spec, *store, first);
    ASSERT_EQ(j["actions"].size(), 1u);
    EXPECT_EQ(j["actions"][0]["$type"], "Copied");
    EXPECT_EQ(j["actions"][0]["copy"]["archived"], true);
}

TEST_F(StoreDiffTest, ArchivingAMoveIsArchived) {
    tree.write("A/1.csv", "payload");
    const auto first = cmd::store(spec, factory()).id;

    tree.move("A/1.csv", "archive/A/1.csv");
    (void)cmd::store(spec, factory());

    const auto j = cmd::diff(spec, *store, first);
    ASSERT_EQ(j["actions"].size(), 1u);
    EXPECT_EQ(j["actions"][0]["$type"], "Archived");
    EXPECT_EQ(j["actions"][0]["dir_name"], "archive/A");
}

TEST_F(StoreDiffTest, DiffAgainstLatestIsNoNewerVersion) {
    tree.write("A/1.csv", "x");
    const auto only = cmd::store(spec, factory()).id;
    EXPECT_THROW((void)cmd::diff(spec, *store, only), NoNewerVersionError);
    EXPECT_THROW((void)cmd::diff(spec, *store, newImportId()), NotFoundError);
}

TEST_F(StoreDiffTest, SingleAndMultiThreadedRecordTheSameSet) {
    tree.write("A/1.csv", "1");
    tree.write("A/2.csv", "2");
    tree.write("B/3.csv", "3");
    tree.write("archive/A/4.csv", "4");
    tree.write("archive/B/5.csv", "5");
    tree.write("loose/deep/file.bin", "6");
    tree.write("top.txt", "7");

    spec.multithread = true;
    const auto parallel = cmd::store(spec, factory());
    spec.multithread = false;
    const auto sequential = cmd::store(spec, factory());

    EXPECT_EQ(parallel.report.recorded_files, 7u);
    EXPECT_EQ(sequential.report.recorded_files, 7u);
    EXPECT_EQ(sortedPaths(store->fetchRecords(parallel.id)), sortedPaths(store->fetchRecords(sequential.id)));
}

TEST_F(StoreDiffTest, ScanFailureCreatesNoImport) {
    spec.root_dir = tree.root() / "missing";
    EXPECT_THROW((void)cmd::store(spec, factory()), ScanIOError);
    EXPECT_EQ(store->importCount(), 0u);
}
