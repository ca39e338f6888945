#pragma once

#include "types.hpp"
#include "file_scanner.hpp"
#include "metadata_store.hpp"
#include <memory>
#include <set>
#include <string>
#include <vector>

namespace clipshelf {

// Keeps the metadata store in agreement with the .wav files on disk.
class Librarian {
private:
    std::unique_ptr<IMetadataStore> m_store;
    std::unique_ptr<IFileScanner> m_file_scanner;

public:
    explicit Librarian(std::unique_ptr<IMetadataStore> store,
                       std::unique_ptr<IFileScanner> file_scanner = create_file_scanner());

    // Adds records for new files, drops records whose file is gone and
    // refreshes cached stats for files whose size or stamp changed.
    // Malformed files are reported in the result, never thrown. Files or
    // directories the scan could not read are reported too, and records
    // beneath them are kept.
    ReconcileReport reconcile(const std::string& directory);

    AudioFile load(const std::string& path);
    // Frames [start, end) of a clip, without decoding the rest.
    AudioFile load_region(const std::string& path, const Selection& region);

    void update_metadata(const std::string& path,
                         const std::set<std::string>& tags,
                         const std::string& description);

    MetadataRecord record(const std::string& path);
    RecordList records();
    // Records whose file name contains the keyword, ignoring case and
    // surrounding blanks. An empty keyword matches every record.
    RecordList search(const std::string& keyword);
    std::vector<std::string> files_with_tag(const std::string& tag);
    std::vector<std::string> all_tags();

    void rename(const std::string& old_path, const std::string& new_path);
    void remove(const std::string& path);
    MetadataRecord import_file(const std::string& source_path, const std::string& directory);

private:
    MetadataRecord describe_file(const ScannedFile& file);
    bool is_under(const std::string& path, const std::string& directory) const;
};

// Lexically normalised absolute form, used as the record key.
std::string normalize_path(const std::string& path);

}
