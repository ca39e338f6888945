#pragma once

#include "types.hpp"
#include <filesystem>
#include <string>
#include <system_error>
#include <vector>

namespace clipshelf {

class IFileScanner {
public:
    virtual ~IFileScanner() = default;
    virtual ScanResult scan_directory(const std::string& directory_path) = 0;
    virtual bool is_supported_format(const std::string& file_path) = 0;
};

// Recursive .wav walk. An entry or directory that cannot be read is reported
// in ScanResult::failures and the walk carries on with its siblings.
// Symlinked directories are not followed.
class FileScanner : public IFileScanner {
private:
    std::vector<std::string> m_supported_extensions;

public:
    FileScanner();
    ~FileScanner() override = default;

    ScanResult scan_directory(const std::string& directory_path) override;
    bool is_supported_format(const std::string& file_path) override;

private:
    void scan_into(const std::filesystem::path& directory, ScanResult& result);
    void visit_entry(const std::filesystem::directory_entry& entry, ScanResult& result);
    void record_failure(ScanResult& result, const std::filesystem::path& path, const std::error_code& ec);
    std::string get_file_extension(const std::string& file_path);
};

std::unique_ptr<IFileScanner> create_file_scanner();

// Case-insensitive ".wav" check.
bool has_wav_extension(const std::string& file_path);

// Size and modification stamp as seen by the file system right now.
// Throws std::filesystem::filesystem_error.
ScannedFile stat_file(const std::string& file_path);
ScannedFile stat_file(const std::string& file_path, std::error_code& ec);

}
