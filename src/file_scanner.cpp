#include "file_scanner.hpp"
#include <algorithm>
#include <chrono>
#include <cctype>
#include <cstdint>
#include <iostream>

namespace clipshelf {

namespace fs = std::filesystem;

FileScanner::FileScanner() {
    m_supported_extensions = {".wav"};
}

ScanResult FileScanner::scan_directory(const std::string& directory_path) {
    ScanResult result;
    scan_into(fs::path(directory_path), result);

    std::sort(result.files.begin(), result.files.end(),
              [](const ScannedFile& a, const ScannedFile& b) {
                  return a.path < b.path;
              });

    return result;
}

bool FileScanner::is_supported_format(const std::string& file_path) {
    std::string extension = get_file_extension(file_path);
    std::transform(extension.begin(), extension.end(), extension.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    return std::find(m_supported_extensions.begin(), m_supported_extensions.end(), extension)
           != m_supported_extensions.end();
}

void FileScanner::scan_into(const fs::path& directory, ScanResult& result) {
    std::error_code ec;
    fs::directory_iterator it(directory, ec);
    if (ec) {
        record_failure(result, directory, ec);
        return;
    }

    const fs::directory_iterator end;
    while (it != end) {
        visit_entry(*it, result);

        it.increment(ec);
        if (ec) {
            // The rest of this directory is unknown
            record_failure(result, directory, ec);
            return;
        }
    }
}

void FileScanner::visit_entry(const fs::directory_entry& entry, ScanResult& result) {
    std::error_code ec;
    const fs::path& path = entry.path();

    fs::file_status link_status = entry.symlink_status(ec);
    if (ec) {
        record_failure(result, path, ec);
        return;
    }
    if (fs::is_directory(link_status)) {
        scan_into(path, result);
        return;
    }
    if (!is_supported_format(path.string())) {
        return;
    }

    bool regular = entry.is_regular_file(ec);
    if (ec) {
        record_failure(result, path, ec);
        return;
    }
    if (!regular) {
        return;
    }

    ScannedFile file = stat_file(path.string(), ec);
    if (ec) {
        record_failure(result, path, ec);
        return;
    }
    result.files.push_back(file);
}

void FileScanner::record_failure(ScanResult& result, const fs::path& path, const std::error_code& ec) {
    std::cerr << "Scanner: cannot read " << path.string() << ": " << ec.message() << "\n";
    result.failures.push_back({path.string(), ec.message()});
}

std::string FileScanner::get_file_extension(const std::string& file_path) {
    return fs::path(file_path).extension().string();
}

std::unique_ptr<IFileScanner> create_file_scanner() {
    return std::make_unique<FileScanner>();
}

bool has_wav_extension(const std::string& file_path) {
    FileScanner scanner;
    return scanner.is_supported_format(file_path);
}

ScannedFile stat_file(const std::string& file_path) {
    std::error_code ec;
    ScannedFile file = stat_file(file_path, ec);
    if (ec) {
        throw fs::filesystem_error("Cannot stat file", fs::path(file_path), ec);
    }
    return file;
}

ScannedFile stat_file(const std::string& file_path, std::error_code& ec) {
    ScannedFile file;
    file.path = file_path;

    const std::uintmax_t size = fs::file_size(file_path, ec);
    if (ec) {
        return file;
    }
    file.size_bytes = size;

    auto stamp = fs::last_write_time(file_path, ec);
    if (ec) {
        return file;
    }
    file.modified = std::chrono::duration_cast<std::chrono::nanoseconds>(
        stamp.time_since_epoch()).count();

    return file;
}

}
