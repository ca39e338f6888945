#include <gtest/gtest.h>
#include "librarian.hpp"
#include "errors.hpp"
#include "test_helpers.hpp"
#include <algorithm>
#include <filesystem>
#include <memory>

using namespace clipshelf;

// Lists the library through FileScanner, except that one directory can be
// made to look unreadable.
class ShadowingScanner : public IFileScanner {
private:
    FileScanner m_scanner;
    std::shared_ptr<std::string> m_unreadable;

public:
    explicit ShadowingScanner(std::shared_ptr<std::string> unreadable)
        : m_unreadable(std::move(unreadable)) {}

    ScanResult scan_directory(const std::string& directory_path) override {
        ScanResult result = m_scanner.scan_directory(directory_path);
        if (m_unreadable->empty()) {
            return result;
        }
        const std::string prefix = *m_unreadable + "/";
        result.files.erase(std::remove_if(result.files.begin(), result.files.end(),
                                          [&](const ScannedFile& file) {
                                              return normalize_path(file.path).rfind(prefix, 0) == 0;
                                          }),
                           result.files.end());
        result.failures.push_back({*m_unreadable, "Permission denied"});
        return result;
    }

    bool is_supported_format(const std::string& file_path) override {
        return m_scanner.is_supported_format(file_path);
    }
};

class LibrarianTest : public ::testing::Test {
protected:
    void SetUp() override {
        library = std::make_unique<Librarian>(create_metadata_store(":memory:"));
        std::filesystem::create_directories(dir.path() / "sub");

        kick = normalize_path(test::write_tone(dir.file("kick.wav"), 16000, 1, 1600));
        snare = normalize_path(test::write_tone(dir.file("sub/snare.WAV"), 44100, 2, 4410));
        test::write_text_file(dir.file("readme.txt"), "not audio");
    }

    test::TempDir dir;
    test::TempDir elsewhere;
    std::unique_ptr<Librarian> library;
    std::string kick;
    std::string snare;
};

TEST_F(LibrarianTest, ReconcileAddsNewFiles) {
    ReconcileReport report = library->reconcile(dir.path().string());

    EXPECT_EQ(report.added, 2u);
    EXPECT_EQ(report.removed, 0u);
    EXPECT_EQ(report.refreshed, 0u);
    EXPECT_TRUE(report.failures.empty());

    MetadataRecord record = library->record(kick);
    EXPECT_EQ(record.path, kick);
    EXPECT_TRUE(record.tags.empty());
    EXPECT_TRUE(record.description.empty());
    EXPECT_DOUBLE_EQ(record.cached_duration, 0.1);
    EXPECT_EQ(record.cached_sample_rate, 16000);
    EXPECT_EQ(record.cached_channels, 1);
    EXPECT_EQ(record.cached_size, std::filesystem::file_size(kick));

    EXPECT_EQ(library->record(snare).cached_channels, 2);
}

TEST_F(LibrarianTest, ReconcileIsIdempotent) {
    library->reconcile(dir.path().string());
    ReconcileReport second = library->reconcile(dir.path().string());

    EXPECT_EQ(second.added, 0u);
    EXPECT_EQ(second.removed, 0u);
    EXPECT_EQ(second.refreshed, 0u);
}

TEST_F(LibrarianTest, DeletedFileLosesItsRecord) {
    library->reconcile(dir.path().string());
    library->update_metadata(kick, {"drums"}, "punchy");

    std::filesystem::remove(kick);
    ReconcileReport report = library->reconcile(dir.path().string());
    EXPECT_EQ(report.removed, 1u);
    EXPECT_THROW(library->record(kick), NotFoundError);
    EXPECT_TRUE(library->files_with_tag("drums").empty());
}

TEST_F(LibrarianTest, ReaddedFileStartsWithEmptyMetadata) {
    library->reconcile(dir.path().string());
    library->update_metadata(kick, {"drums"}, "punchy");

    std::filesystem::remove(kick);
    library->reconcile(dir.path().string());

    test::write_tone(kick, 16000, 1, 1600);
    ReconcileReport report = library->reconcile(dir.path().string());
    EXPECT_EQ(report.added, 1u);

    MetadataRecord record = library->record(kick);
    EXPECT_TRUE(record.tags.empty());
    EXPECT_TRUE(record.description.empty());
}

TEST_F(LibrarianTest, ChangedFileIsRefreshedKeepingMetadata) {
    library->reconcile(dir.path().string());
    library->update_metadata(kick, {"drums"}, "punchy");

    test::write_tone(kick, 16000, 1, 3200);
    ReconcileReport report = library->reconcile(dir.path().string());
    EXPECT_EQ(report.refreshed, 1u);
    EXPECT_EQ(report.added, 0u);

    MetadataRecord record = library->record(kick);
    EXPECT_DOUBLE_EQ(record.cached_duration, 0.2);
    EXPECT_EQ(record.tags, std::set<std::string>{"drums"});
    EXPECT_EQ(record.description, "punchy");
}

TEST_F(LibrarianTest, MalformedFileIsReportedNotThrown) {
    const std::string broken = normalize_path(dir.file("broken.wav"));
    test::write_text_file(broken, "definitely not a wave file");

    ReconcileReport report = library->reconcile(dir.path().string());
    EXPECT_EQ(report.added, 2u);
    ASSERT_EQ(report.failures.size(), 1u);
    EXPECT_EQ(report.failures[0].path, broken);
    EXPECT_FALSE(report.failures[0].message.empty());
    EXPECT_THROW(library->record(broken), NotFoundError);
}

TEST_F(LibrarianTest, RecordsUnderAnUnreadableDirectoryAreKept) {
    auto unreadable = std::make_shared<std::string>();
    Librarian shadowed(create_metadata_store(":memory:"), std::make_unique<ShadowingScanner>(unreadable));
    shadowed.reconcile(dir.path().string());
    shadowed.update_metadata(snare, {"snare"}, "tight");

    *unreadable = normalize_path(dir.file("sub"));
    std::filesystem::remove(kick);
    ReconcileReport report = shadowed.reconcile(dir.path().string());

    EXPECT_EQ(report.removed, 1u);
    ASSERT_EQ(report.failures.size(), 1u);
    EXPECT_EQ(report.failures[0].path, *unreadable);
    EXPECT_THROW(shadowed.record(kick), NotFoundError);

    MetadataRecord record = shadowed.record(snare);
    EXPECT_EQ(record.tags, std::set<std::string>{"snare"});
    EXPECT_EQ(record.description, "tight");

    // Readable again: nothing to add, nothing lost
    unreadable->clear();
    report = shadowed.reconcile(dir.path().string());
    EXPECT_EQ(report.added, 0u);
    EXPECT_EQ(report.removed, 0u);
    EXPECT_TRUE(report.failures.empty());
}

TEST_F(LibrarianTest, UnreadableEntryKeepsItsRecordAndTheRestIsReconciled) {
    library->reconcile(dir.path().string());
    library->update_metadata(kick, {"drums"}, "punchy");

    // kick.wav turns into a link that cannot be resolved
    std::filesystem::remove(kick);
    std::filesystem::create_symlink("kick.wav", kick);
    test::write_tone(dir.file("sub/clap.wav"), 8000, 1, 800);

    ReconcileReport report = library->reconcile(dir.path().string());
    EXPECT_EQ(report.added, 1u);
    EXPECT_EQ(report.removed, 0u);
    ASSERT_EQ(report.failures.size(), 1u);
    EXPECT_EQ(report.failures[0].path, kick);
    EXPECT_EQ(library->record(kick).tags, std::set<std::string>{"drums"});
    EXPECT_NO_THROW(library->record(snare));
}

TEST_F(LibrarianTest, ReconcileOfMissingDirectoryIsNotFound) {
    EXPECT_THROW(library->reconcile(dir.file("missing")), NotFoundError);
}

TEST_F(LibrarianTest, RecordsOutsideTheScannedDirectoryAreLeftAlone) {
    const std::string other = normalize_path(test::write_tone(elsewhere.file("other.wav"), 8000, 1, 800));
    library->reconcile(elsewhere.path().string());

    ReconcileReport report = library->reconcile(dir.path().string());
    EXPECT_EQ(report.removed, 0u);
    EXPECT_NO_THROW(library->record(other));
    EXPECT_EQ(library->records().size(), 3u);
}

TEST_F(LibrarianTest, LoadDecodesTheWholeFile) {
    AudioFile audio = library->load(snare);
    EXPECT_EQ(audio.sample_rate, 44100);
    EXPECT_EQ(audio.channels, 2);
    EXPECT_EQ(audio.frame_count(), 4410u);

    EXPECT_THROW(library->load(dir.file("missing.wav")), NotFoundError);

    test::write_text_file(dir.file("broken.wav"), "garbage");
    EXPECT_THROW(library->load(dir.file("broken.wav")), DecodeError);
}

TEST_F(LibrarianTest, LoadRegionDecodesOnlyTheSelectedFrames) {
    AudioFile whole = library->load(kick);
    AudioFile region = library->load_region(kick, Selection{400, 800});

    EXPECT_EQ(region.sample_rate, 16000);
    ASSERT_EQ(region.frame_count(), 400u);
    EXPECT_EQ(region.samples.front(), whole.samples[400]);
    EXPECT_EQ(region.samples.back(), whole.samples[799]);
    EXPECT_THROW(library->load_region(kick, Selection{1000, 2000}), InvalidArgument);
}

TEST_F(LibrarianTest, UpdateMetadataWithoutRecordIsNotFound) {
    EXPECT_THROW(library->update_metadata(kick, {"x"}, "y"), NotFoundError);
}

TEST_F(LibrarianTest, TagQueries) {
    library->reconcile(dir.path().string());
    library->update_metadata(kick, {"drums", "one-shot"}, "");
    library->update_metadata(snare, {"drums"}, "");

    EXPECT_EQ(library->files_with_tag("drums"), (std::vector<std::string>{kick, snare}));
    EXPECT_EQ(library->files_with_tag("one-shot"), std::vector<std::string>{kick});
    EXPECT_EQ(library->all_tags(), (std::vector<std::string>{"drums", "one-shot"}));
}

TEST_F(LibrarianTest, SearchMatchesFileNamesIgnoringCase) {
    library->reconcile(dir.path().string());

    auto paths = [](const RecordList& records) {
        std::vector<std::string> result;
        for (const auto& record : records) {
            result.push_back(record.path);
        }
        return result;
    };

    EXPECT_EQ(paths(library->search("KI")), std::vector<std::string>{kick});
    EXPECT_EQ(paths(library->search("  snare ")), std::vector<std::string>{snare});
    EXPECT_EQ(paths(library->search(".wav")), (std::vector<std::string>{kick, snare}));
    EXPECT_EQ(library->search("").size(), 2u);
    // Directory names do not count
    EXPECT_TRUE(library->search("sub").empty());
    EXPECT_TRUE(library->search("hat").empty());
}

TEST_F(LibrarianTest, RelativeAndAbsolutePathsShareOneRecord) {
    library->reconcile(dir.path().string());
    const std::string roundabout = (dir.path() / "sub" / ".." / "kick.wav").string();

    library->update_metadata(roundabout, {"drums"}, "");
    EXPECT_EQ(library->record(kick).tags, std::set<std::string>{"drums"});
}

TEST_F(LibrarianTest, RenameMovesFileAndMetadata) {
    library->reconcile(dir.path().string());
    library->update_metadata(kick, {"drums"}, "punchy");

    const std::string renamed = normalize_path(dir.file("kick_808.wav"));
    library->rename(kick, renamed);

    EXPECT_FALSE(std::filesystem::exists(kick));
    EXPECT_TRUE(std::filesystem::exists(renamed));
    EXPECT_THROW(library->record(kick), NotFoundError);
    EXPECT_EQ(library->record(renamed).description, "punchy");

    ReconcileReport report = library->reconcile(dir.path().string());
    EXPECT_EQ(report.added, 0u);
    EXPECT_EQ(report.removed, 0u);
}

TEST_F(LibrarianTest, RenameRejectsBadTargets) {
    library->reconcile(dir.path().string());

    EXPECT_THROW(library->rename(dir.file("missing.wav"), dir.file("x.wav")), NotFoundError);
    EXPECT_THROW(library->rename(kick, dir.file("kick.txt")), InvalidArgument);
    EXPECT_THROW(library->rename(kick, snare), InvalidArgument);
    EXPECT_TRUE(std::filesystem::exists(kick));
}

TEST_F(LibrarianTest, RemoveDeletesFileAndRecord) {
    library->reconcile(dir.path().string());

    library->remove(kick);
    EXPECT_FALSE(std::filesystem::exists(kick));
    EXPECT_THROW(library->record(kick), NotFoundError);

    EXPECT_THROW(library->remove(kick), NotFoundError);
}

TEST_F(LibrarianTest, ImportCopiesAndRegisters) {
    const std::string source = test::write_tone(elsewhere.file("clap.wav"), 22050, 1, 2205);

    MetadataRecord record = library->import_file(source, dir.path().string());
    EXPECT_EQ(record.path, normalize_path(dir.file("clap.wav")));
    EXPECT_TRUE(std::filesystem::exists(record.path));
    EXPECT_TRUE(std::filesystem::exists(source));
    EXPECT_EQ(library->record(record.path).cached_sample_rate, 22050);

    EXPECT_THROW(library->import_file(source, dir.path().string()), InvalidArgument);
}

TEST_F(LibrarianTest, ImportRejectsBadSources) {
    test::write_text_file(elsewhere.file("notes.txt"), "text");
    EXPECT_THROW(library->import_file(elsewhere.file("notes.txt"), dir.path().string()), InvalidArgument);
    EXPECT_THROW(library->import_file(elsewhere.file("missing.wav"), dir.path().string()), NotFoundError);

    test::write_text_file(elsewhere.file("broken.wav"), "garbage");
    EXPECT_THROW(library->import_file(elsewhere.file("broken.wav"), dir.path().string()), DecodeError);
    EXPECT_FALSE(std::filesystem::exists(dir.file("broken.wav")));
}
