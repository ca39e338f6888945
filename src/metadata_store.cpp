#include "metadata_store.hpp"
#include "errors.hpp"
#include <sqlite3.h>
#include <filesystem>
#include <iostream>

namespace clipshelf {

namespace {

const char* const SCHEMA = R"SQL(
    PRAGMA foreign_keys = ON;
    CREATE TABLE IF NOT EXISTS audio_files (
        file_id INTEGER PRIMARY KEY AUTOINCREMENT,
        file_name TEXT NOT NULL,
        file_path TEXT NOT NULL UNIQUE,
        num_channels INTEGER,
        sample_rate INTEGER,
        file_size INTEGER,
        duration REAL,
        modified INTEGER,
        description TEXT NOT NULL DEFAULT ''
    );
    CREATE TABLE IF NOT EXISTS tags (
        tag_id INTEGER PRIMARY KEY AUTOINCREMENT,
        tag_name TEXT NOT NULL UNIQUE
    );
    CREATE TABLE IF NOT EXISTS file_tags (
        file_id INTEGER NOT NULL REFERENCES audio_files (file_id) ON DELETE CASCADE,
        tag_id INTEGER NOT NULL REFERENCES tags (tag_id) ON DELETE CASCADE,
        PRIMARY KEY (file_id, tag_id)
    );
)SQL";

const char* const SELECT_RECORD_COLUMNS =
    "SELECT file_id, file_path, num_channels, sample_rate, file_size, duration, modified, description "
    "FROM audio_files";

std::string file_name_of(const std::string& path) {
    return std::filesystem::path(path).filename().string();
}

class Statement {
private:
    sqlite3* m_db;
    sqlite3_stmt* m_stmt = nullptr;

public:
    Statement(sqlite3* db, const char* sql) : m_db(db) {
        if (sqlite3_prepare_v2(db, sql, -1, &m_stmt, nullptr) != SQLITE_OK) {
            throw StorageError(std::string("SQLite prepare failed: ") + sqlite3_errmsg(db));
        }
    }

    ~Statement() {
        sqlite3_finalize(m_stmt);
    }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    void bind(int index, const std::string& value) {
        check(sqlite3_bind_text(m_stmt, index, value.c_str(), -1, SQLITE_TRANSIENT));
    }

    void bind(int index, int64_t value) {
        check(sqlite3_bind_int64(m_stmt, index, value));
    }

    void bind(int index, double value) {
        check(sqlite3_bind_double(m_stmt, index, value));
    }

    // True while rows are available.
    bool step() {
        int rc = sqlite3_step(m_stmt);
        if (rc == SQLITE_ROW) {
            return true;
        }
        if (rc == SQLITE_DONE) {
            return false;
        }
        throw StorageError(std::string("SQLite step failed: ") + sqlite3_errmsg(m_db));
    }

    void execute() {
        while (step()) {
        }
    }

    std::string text(int column) const {
        const unsigned char* value = sqlite3_column_text(m_stmt, column);
        return value ? reinterpret_cast<const char*>(value) : "";
    }

    int64_t integer(int column) const {
        return sqlite3_column_int64(m_stmt, column);
    }

    double real(int column) const {
        return sqlite3_column_double(m_stmt, column);
    }

private:
    void check(int rc) {
        if (rc != SQLITE_OK) {
            throw StorageError(std::string("SQLite bind failed: ") + sqlite3_errmsg(m_db));
        }
    }
};

class Transaction {
private:
    sqlite3* m_db;
    bool m_committed = false;

public:
    explicit Transaction(sqlite3* db) : m_db(db) {
        exec("BEGIN IMMEDIATE");
    }

    ~Transaction() {
        if (!m_committed) {
            char* message = nullptr;
            if (sqlite3_exec(m_db, "ROLLBACK", nullptr, nullptr, &message) != SQLITE_OK) {
                std::cerr << "MetadataStore: rollback failed: " << (message ? message : "unknown") << "\n";
            }
            sqlite3_free(message);
        }
    }

    void commit() {
        exec("COMMIT");
        m_committed = true;
    }

private:
    void exec(const char* sql) {
        char* message = nullptr;
        if (sqlite3_exec(m_db, sql, nullptr, nullptr, &message) != SQLITE_OK) {
            std::string error = message ? message : "unknown error";
            sqlite3_free(message);
            throw StorageError(std::string("SQLite ") + sql + " failed: " + error);
        }
    }
};

}

struct SqliteMetadataStore::Impl {
    sqlite3* db = nullptr;

    void open(const std::string& database_path) {
        int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE;
        if (sqlite3_open_v2(database_path.c_str(), &db, flags, nullptr) != SQLITE_OK) {
            std::string error = db ? sqlite3_errmsg(db) : "out of memory";
            close();
            throw StorageError("Cannot open metadata database " + database_path + ": " + error);
        }

        char* message = nullptr;
        if (sqlite3_exec(db, SCHEMA, nullptr, nullptr, &message) != SQLITE_OK) {
            std::string error = message ? message : "unknown error";
            sqlite3_free(message);
            close();
            throw StorageError("Database initialization error: " + error);
        }
    }

    void close() {
        if (db) {
            sqlite3_close(db);
            db = nullptr;
        }
    }

    int64_t file_id(const std::string& path) {
        Statement stmt(db, "SELECT file_id FROM audio_files WHERE file_path = ?");
        stmt.bind(1, path);
        return stmt.step() ? stmt.integer(0) : -1;
    }

    std::set<std::string> tags_for(int64_t id) {
        Statement stmt(db,
            "SELECT t.tag_name FROM tags t JOIN file_tags ft ON ft.tag_id = t.tag_id "
            "WHERE ft.file_id = ? ORDER BY t.tag_name");
        stmt.bind(1, id);

        std::set<std::string> tags;
        while (stmt.step()) {
            tags.insert(stmt.text(0));
        }
        return tags;
    }

    void attach_tags(int64_t id, const std::set<std::string>& tags) {
        for (const auto& tag : tags) {
            Statement add_tag(db, "INSERT OR IGNORE INTO tags (tag_name) VALUES (?)");
            add_tag.bind(1, tag);
            add_tag.execute();

            Statement link(db,
                "INSERT OR IGNORE INTO file_tags (file_id, tag_id) "
                "VALUES (?, (SELECT tag_id FROM tags WHERE tag_name = ?))");
            link.bind(1, id);
            link.bind(2, tag);
            link.execute();
        }
    }

    MetadataRecord read_record(const Statement& stmt) {
        MetadataRecord record;
        record.path = stmt.text(1);
        record.cached_channels = static_cast<int>(stmt.integer(2));
        record.cached_sample_rate = static_cast<int>(stmt.integer(3));
        record.cached_size = static_cast<uint64_t>(stmt.integer(4));
        record.cached_duration = stmt.real(5);
        record.cached_mtime = stmt.integer(6);
        record.description = stmt.text(7);
        record.tags = tags_for(stmt.integer(0));
        return record;
    }
};

SqliteMetadataStore::SqliteMetadataStore(const std::string& database_path)
    : m_impl(std::make_unique<Impl>()) {
    m_impl->open(database_path);
}

SqliteMetadataStore::~SqliteMetadataStore() {
    m_impl->close();
}

bool SqliteMetadataStore::contains(const std::string& path) {
    return m_impl->file_id(path) >= 0;
}

std::optional<MetadataRecord> SqliteMetadataStore::get(const std::string& path) {
    std::string sql = std::string(SELECT_RECORD_COLUMNS) + " WHERE file_path = ?";
    Statement stmt(m_impl->db, sql.c_str());
    stmt.bind(1, path);

    if (!stmt.step()) {
        return std::nullopt;
    }
    return m_impl->read_record(stmt);
}

void SqliteMetadataStore::insert(const MetadataRecord& record) {
    Transaction transaction(m_impl->db);

    Statement stmt(m_impl->db,
        "INSERT INTO audio_files "
        "(file_name, file_path, num_channels, sample_rate, file_size, duration, modified, description) "
        "VALUES (?, ?, ?, ?, ?, ?, ?, ?)");
    stmt.bind(1, file_name_of(record.path));
    stmt.bind(2, record.path);
    stmt.bind(3, static_cast<int64_t>(record.cached_channels));
    stmt.bind(4, static_cast<int64_t>(record.cached_sample_rate));
    stmt.bind(5, static_cast<int64_t>(record.cached_size));
    stmt.bind(6, record.cached_duration);
    stmt.bind(7, record.cached_mtime);
    stmt.bind(8, record.description);
    stmt.execute();

    m_impl->attach_tags(sqlite3_last_insert_rowid(m_impl->db), record.tags);
    transaction.commit();
}

void SqliteMetadataStore::update_stats(const MetadataRecord& record) {
    Statement stmt(m_impl->db,
        "UPDATE audio_files SET num_channels = ?, sample_rate = ?, file_size = ?, "
        "duration = ?, modified = ? WHERE file_path = ?");
    stmt.bind(1, static_cast<int64_t>(record.cached_channels));
    stmt.bind(2, static_cast<int64_t>(record.cached_sample_rate));
    stmt.bind(3, static_cast<int64_t>(record.cached_size));
    stmt.bind(4, record.cached_duration);
    stmt.bind(5, record.cached_mtime);
    stmt.bind(6, record.path);
    stmt.execute();

    if (sqlite3_changes(m_impl->db) == 0) {
        throw NotFoundError("No metadata record for " + record.path);
    }
}

void SqliteMetadataStore::update_metadata(const std::string& path,
                                          const std::set<std::string>& tags,
                                          const std::string& description) {
    Transaction transaction(m_impl->db);

    int64_t id = m_impl->file_id(path);
    if (id < 0) {
        throw NotFoundError("No metadata record for " + path);
    }

    Statement set_description(m_impl->db, "UPDATE audio_files SET description = ? WHERE file_id = ?");
    set_description.bind(1, description);
    set_description.bind(2, id);
    set_description.execute();

    Statement clear_tags(m_impl->db, "DELETE FROM file_tags WHERE file_id = ?");
    clear_tags.bind(1, id);
    clear_tags.execute();

    m_impl->attach_tags(id, tags);
    transaction.commit();
}

bool SqliteMetadataStore::remove(const std::string& path) {
    Statement stmt(m_impl->db, "DELETE FROM audio_files WHERE file_path = ?");
    stmt.bind(1, path);
    stmt.execute();
    return sqlite3_changes(m_impl->db) > 0;
}

void SqliteMetadataStore::rename(const std::string& old_path, const std::string& new_path) {
    Transaction transaction(m_impl->db);

    if (m_impl->file_id(old_path) < 0) {
        throw NotFoundError("No metadata record for " + old_path);
    }
    if (m_impl->file_id(new_path) >= 0) {
        throw InvalidArgument("A metadata record already exists for " + new_path);
    }

    Statement stmt(m_impl->db,
        "UPDATE audio_files SET file_path = ?, file_name = ? WHERE file_path = ?");
    stmt.bind(1, new_path);
    stmt.bind(2, file_name_of(new_path));
    stmt.bind(3, old_path);
    stmt.execute();

    transaction.commit();
}

std::vector<std::string> SqliteMetadataStore::list_paths() {
    Statement stmt(m_impl->db, "SELECT file_path FROM audio_files ORDER BY file_path");

    std::vector<std::string> paths;
    while (stmt.step()) {
        paths.push_back(stmt.text(0));
    }
    return paths;
}

RecordList SqliteMetadataStore::list_records() {
    std::string sql = std::string(SELECT_RECORD_COLUMNS) + " ORDER BY file_path";
    Statement stmt(m_impl->db, sql.c_str());

    RecordList records;
    while (stmt.step()) {
        records.push_back(m_impl->read_record(stmt));
    }
    return records;
}

std::vector<std::string> SqliteMetadataStore::files_with_tag(const std::string& tag) {
    Statement stmt(m_impl->db,
        "SELECT f.file_path FROM audio_files f "
        "JOIN file_tags ft ON ft.file_id = f.file_id "
        "JOIN tags t ON t.tag_id = ft.tag_id "
        "WHERE t.tag_name = ? ORDER BY f.file_path");
    stmt.bind(1, tag);

    std::vector<std::string> paths;
    while (stmt.step()) {
        paths.push_back(stmt.text(0));
    }
    return paths;
}

std::vector<std::string> SqliteMetadataStore::all_tags() {
    // Only tags still attached to at least one file
    Statement stmt(m_impl->db,
        "SELECT DISTINCT t.tag_name FROM tags t "
        "JOIN file_tags ft ON ft.tag_id = t.tag_id ORDER BY t.tag_name");

    std::vector<std::string> tags;
    while (stmt.step()) {
        tags.push_back(stmt.text(0));
    }
    return tags;
}

std::unique_ptr<IMetadataStore> create_metadata_store(const std::string& database_path) {
    return std::make_unique<SqliteMetadataStore>(database_path);
}

}
