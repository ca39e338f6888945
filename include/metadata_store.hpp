#pragma once

#include "types.hpp"
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace clipshelf {

// Persistent metadata keyed by file path. All operations are atomic per record.
class IMetadataStore {
public:
    virtual ~IMetadataStore() = default;
    virtual bool contains(const std::string& path) = 0;
    virtual std::optional<MetadataRecord> get(const std::string& path) = 0;
    virtual void insert(const MetadataRecord& record) = 0;
    virtual void update_stats(const MetadataRecord& record) = 0;
    virtual void update_metadata(const std::string& path,
                                 const std::set<std::string>& tags,
                                 const std::string& description) = 0;
    virtual bool remove(const std::string& path) = 0;
    virtual void rename(const std::string& old_path, const std::string& new_path) = 0;
    virtual std::vector<std::string> list_paths() = 0;
    virtual RecordList list_records() = 0;
    virtual std::vector<std::string> files_with_tag(const std::string& tag) = 0;
    virtual std::vector<std::string> all_tags() = 0;
};

class SqliteMetadataStore : public IMetadataStore {
private:
    struct Impl;
    std::unique_ptr<Impl> m_impl;

public:
    // ":memory:" opens a private in-memory database.
    explicit SqliteMetadataStore(const std::string& database_path);
    ~SqliteMetadataStore() override;

    bool contains(const std::string& path) override;
    std::optional<MetadataRecord> get(const std::string& path) override;
    void insert(const MetadataRecord& record) override;
    void update_stats(const MetadataRecord& record) override;
    void update_metadata(const std::string& path,
                         const std::set<std::string>& tags,
                         const std::string& description) override;
    bool remove(const std::string& path) override;
    void rename(const std::string& old_path, const std::string& new_path) override;
    std::vector<std::string> list_paths() override;
    RecordList list_records() override;
    std::vector<std::string> files_with_tag(const std::string& tag) override;
    std::vector<std::string> all_tags() override;
};

// Throws StorageError if the database cannot be opened or initialised.
std::unique_ptr<IMetadataStore> create_metadata_store(const std::string& database_path);

}
