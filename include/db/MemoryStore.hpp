#pragma once

#include "db/Store.hpp"

#include <map>
#include <mutex>

namespace fsnap::db {

// In-process store. One mutex serializes every call, which makes each call
// atomic with respect to the others.
class MemoryStore : public Store {
public:
    using Clock = std::function<int64_t()>;

    explicit MemoryStore(std::shared_ptr<spdlog::logger> log, Clock clock = {});

    snapshot::model::ImportId createImport(const std::string& name, const snapshot::model::Tags& tags) override;

    void importFiles(const snapshot::model::ImportId& id,
                     const std::vector<snapshot::model::FileRecord>& records) override;

    snapshot::model::Import fetchImport(const snapshot::model::ImportId& id) override;

    std::optional<snapshot::model::ImportId> fetchLatestImportId(const std::string& name) override;

    std::vector<snapshot::model::FileRecord> fetchRecords(const snapshot::model::ImportId& id) override;

    [[nodiscard]] size_t importCount() const;

private:
    struct Stored {
        snapshot::model::Import import;
        uint64_t seq;
        std::vector<snapshot::model::FileRecord> records;
    };

    mutable std::mutex mutex_;
    Clock clock_;
    uint64_t nextSeq_ = 0;
    std::map<snapshot::model::ImportId, Stored> imports_;
};

}
