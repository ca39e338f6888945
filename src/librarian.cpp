#include "librarian.hpp"
#include "errors.hpp"
#include "wav_decoder.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <iostream>
#include <iterator>
#include <map>
#include <system_error>

namespace clipshelf {

namespace fs = std::filesystem;

std::string normalize_path(const std::string& path) {
    return fs::absolute(fs::path(path)).lexically_normal().string();
}

Librarian::Librarian(std::unique_ptr<IMetadataStore> store,
                     std::unique_ptr<IFileScanner> file_scanner)
    : m_store(std::move(store))
    , m_file_scanner(std::move(file_scanner)) {}

ReconcileReport Librarian::reconcile(const std::string& directory) {
    if (!fs::is_directory(directory)) {
        throw NotFoundError("Library directory does not exist: " + directory);
    }

    const std::string root = normalize_path(directory);
    ReconcileReport report;

    ScanResult scan = m_file_scanner->scan_directory(root);

    std::map<std::string, ScannedFile> on_disk;
    for (auto file : scan.files) {
        file.path = normalize_path(file.path);
        on_disk.emplace(file.path, file);
    }

    // Paths the walk could not see into; their records are left alone
    std::vector<std::string> unreadable;
    for (auto failure : scan.failures) {
        failure.path = normalize_path(failure.path);
        unreadable.push_back(failure.path);
        report.failures.push_back(failure);
    }

    for (const auto& record : m_store->list_records()) {
        if (!is_under(record.path, root)) {
            continue;
        }

        auto it = on_disk.find(record.path);
        if (it == on_disk.end()) {
            bool hidden = std::any_of(unreadable.begin(), unreadable.end(),
                                      [&](const std::string& path) { return is_under(record.path, path); });
            if (hidden) {
                std::cout << "Librarian: keeping record for " << record.path << ", it could not be read\n";
                continue;
            }
            if (m_store->remove(record.path)) {
                std::cout << "Librarian: removed record for missing file " << record.path << "\n";
                ++report.removed;
            }
            continue;
        }

        const ScannedFile& file = it->second;
        if (file.size_bytes != record.cached_size || file.modified != record.cached_mtime) {
            try {
                m_store->update_stats(describe_file(file));
                ++report.refreshed;
            } catch (const DecodeError& e) {
                std::cerr << "Librarian: " << e.what() << "\n";
                report.failures.push_back({file.path, e.what()});
            }
        }

        on_disk.erase(it);
    }

    // Whatever is left has never been seen before
    for (const auto& entry : on_disk) {
        try {
            m_store->insert(describe_file(entry.second));
            ++report.added;
        } catch (const DecodeError& e) {
            std::cerr << "Librarian: " << e.what() << "\n";
            report.failures.push_back({entry.first, e.what()});
        }
    }

    std::cout << "Librarian: " << root << ": " << report.added << " added, "
              << report.removed << " removed, " << report.refreshed << " refreshed";
    if (!report.failures.empty()) {
        std::cout << ", " << report.failures.size() << " unreadable";
    }
    std::cout << "\n";

    return report;
}

AudioFile Librarian::load(const std::string& path) {
    return decode_wav(normalize_path(path));
}

AudioFile Librarian::load_region(const std::string& path, const Selection& region) {
    return decode_wav_range(normalize_path(path), region);
}

void Librarian::update_metadata(const std::string& path,
                                const std::set<std::string>& tags,
                                const std::string& description) {
    m_store->update_metadata(normalize_path(path), tags, description);
}

MetadataRecord Librarian::record(const std::string& path) {
    const std::string key = normalize_path(path);
    auto record = m_store->get(key);
    if (!record) {
        throw NotFoundError("No metadata record for " + key);
    }
    return *record;
}

RecordList Librarian::records() {
    return m_store->list_records();
}

RecordList Librarian::search(const std::string& keyword) {
    auto lower = [](std::string text) {
        std::transform(text.begin(), text.end(), text.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return text;
    };

    const auto first = keyword.find_first_not_of(" \t");
    const std::string needle =
        first == std::string::npos ? "" : lower(keyword.substr(first, keyword.find_last_not_of(" \t") - first + 1));

    RecordList matches;
    for (auto& record : m_store->list_records()) {
        if (lower(fs::path(record.path).filename().string()).find(needle) != std::string::npos) {
            matches.push_back(std::move(record));
        }
    }
    return matches;
}

std::vector<std::string> Librarian::files_with_tag(const std::string& tag) {
    return m_store->files_with_tag(tag);
}

std::vector<std::string> Librarian::all_tags() {
    return m_store->all_tags();
}

void Librarian::rename(const std::string& old_path, const std::string& new_path) {
    const std::string from = normalize_path(old_path);
    const std::string to = normalize_path(new_path);

    if (!fs::is_regular_file(from)) {
        throw NotFoundError("No such audio file: " + from);
    }
    if (!m_store->contains(from)) {
        throw NotFoundError("No metadata record for " + from);
    }
    if (!has_wav_extension(to)) {
        throw InvalidArgument("New name must keep a .wav extension: " + to);
    }
    if (fs::exists(to)) {
        throw InvalidArgument("Target already exists: " + to);
    }

    std::error_code ec;
    fs::rename(from, to, ec);
    if (ec) {
        throw StorageError("Cannot rename " + from + ": " + ec.message());
    }

    try {
        m_store->rename(from, to);
    } catch (const Error&) {
        fs::rename(to, from, ec);
        if (ec) {
            std::cerr << "Librarian: could not restore " << from << ": " << ec.message() << "\n";
        }
        throw;
    }
}

void Librarian::remove(const std::string& path) {
    const std::string key = normalize_path(path);

    if (!fs::is_regular_file(key)) {
        throw NotFoundError("No such audio file: " + key);
    }

    std::error_code ec;
    fs::remove(key, ec);
    if (ec) {
        throw StorageError("Cannot delete " + key + ": " + ec.message());
    }

    m_store->remove(key);
}

MetadataRecord Librarian::import_file(const std::string& source_path, const std::string& directory) {
    if (!fs::is_regular_file(source_path)) {
        throw NotFoundError("No such audio file: " + source_path);
    }
    if (!has_wav_extension(source_path)) {
        throw InvalidArgument("Only .wav files can be imported: " + source_path);
    }
    if (!fs::is_directory(directory)) {
        throw NotFoundError("Library directory does not exist: " + directory);
    }

    const std::string destination =
        normalize_path((fs::path(directory) / fs::path(source_path).filename()).string());
    if (fs::exists(destination)) {
        throw InvalidArgument("A file with that name is already in the library: " + destination);
    }

    std::error_code ec;
    fs::copy_file(source_path, destination, ec);
    if (ec) {
        throw StorageError("Cannot copy " + source_path + ": " + ec.message());
    }

    MetadataRecord record;
    try {
        record = describe_file(stat_file(destination));
    } catch (const DecodeError&) {
        fs::remove(destination, ec);
        if (ec) {
            std::cerr << "Librarian: could not discard " << destination << ": " << ec.message() << "\n";
        }
        throw;
    }

    m_store->insert(record);
    std::cout << "Librarian: imported " << destination << "\n";
    return record;
}

MetadataRecord Librarian::describe_file(const ScannedFile& file) {
    AudioInfo info = probe_wav(file.path);

    MetadataRecord record;
    record.path = file.path;
    record.cached_duration = info.duration;
    record.cached_sample_rate = info.sample_rate;
    record.cached_channels = info.channels;
    record.cached_size = file.size_bytes;
    record.cached_mtime = file.modified;
    return record;
}

bool Librarian::is_under(const std::string& path, const std::string& directory) const {
    fs::path candidate(path);
    fs::path root(directory);

    auto mismatch = std::mismatch(root.begin(), root.end(), candidate.begin(), candidate.end());
    // A trailing separator yields an empty final element
    return mismatch.first == root.end() || (mismatch.first->empty() && std::next(mismatch.first) == root.end());
}

}
