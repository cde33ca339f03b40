#include "source/ShotwellSource.hpp"
#include "fs/model/Image.hpp"
#include "util/timestamp.hpp"
#include "util/fsPath.hpp"
#include "logging/LogRegistry.hpp"

#include <cctype>
#include <cstdlib>
#include <sqlite3.h>
#include <sstream>
#include <unistd.h>
#include <unordered_map>
#include <vector>

using namespace pfs::source;
using namespace pfs::fs::model;
using namespace pfs::config;
using namespace pfs::logging;

namespace {

struct DatabaseCloser {
    void operator()(sqlite3* db) const { if (db) sqlite3_close(db); }
};

struct StatementFinalizer {
    void operator()(sqlite3_stmt* stmt) const { if (stmt) sqlite3_finalize(stmt); }
};

using Database = std::unique_ptr<sqlite3, DatabaseCloser>;
using Statement = std::unique_ptr<sqlite3_stmt, StatementFinalizer>;

Database openReadOnly(const std::filesystem::path& path) {
    sqlite3* raw = nullptr;
    const int rc = sqlite3_open_v2(path.c_str(), &raw, SQLITE_OPEN_READONLY | SQLITE_OPEN_NOMUTEX, nullptr);
    Database db(raw);
    if (rc != SQLITE_OK) {
        const std::string err = raw ? sqlite3_errmsg(raw) : sqlite3_errstr(rc);
        throw SourceError("Failed to open " + path.string() + ": " + err);
    }
    // Shotwell may be writing while we read
    sqlite3_busy_timeout(db.get(), 5000);
    return db;
}

Statement prepare(sqlite3* db, const std::string& sql) {
    sqlite3_stmt* raw = nullptr;
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &raw, nullptr) != SQLITE_OK) {
        Statement guard(raw);
        throw SourceError("Failed to prepare \"" + sql + "\": " + sqlite3_errmsg(db));
    }
    return Statement(raw);
}

// Returns false when the statement is exhausted.
bool step(sqlite3* db, sqlite3_stmt* stmt) {
    const int rc = sqlite3_step(stmt);
    if (rc == SQLITE_ROW) return true;
    if (rc == SQLITE_DONE) return false;
    throw SourceError(std::string("Query failed: ") + sqlite3_errmsg(db));
}

std::string columnText(sqlite3_stmt* stmt, const int idx) {
    const auto* text = sqlite3_column_text(stmt, idx);
    return text ? reinterpret_cast<const char*>(text) : std::string{};
}

// One row of PhotoTable or VideoTable
struct Record {
    std::string identity;
    std::string title;
    std::filesystem::path filename;
    long long exposureTime{};
    bool isVideo{};
};

// Shotwell's two media tables and the prefix their ids carry in TagTable
struct MediaTable {
    const char* table;
    const char* prefix;
    bool isVideo;
    std::unordered_map<long long, Record> records;
};

void loadRecords(sqlite3* db, MediaTable& media) {
    const auto stmt = prepare(db, std::string("SELECT id, filename, exposure_time, title FROM ") + media.table);
    while (step(db, stmt.get())) {
        Record r;
        const auto id = sqlite3_column_int64(stmt.get(), 0);
        r.identity = std::string(media.table) + ":" + std::to_string(id);
        r.filename = columnText(stmt.get(), 1);
        r.exposureTime = sqlite3_column_int64(stmt.get(), 2);
        r.title = columnText(stmt.get(), 3);
        r.isVideo = media.isVideo;
        media.records.emplace(id, std::move(r));
    }
}

// "thumb000000000000002a,video-0000000000000003,17," -> one entry per id
std::vector<std::string> splitIdList(const std::string& list) {
    std::vector<std::string> ids;
    std::stringstream ss(list);
    std::string id;
    while (std::getline(ss, id, ','))
        if (!id.empty()) ids.push_back(id);
    return ids;
}

const Record* resolveId(const std::string& id, const MediaTable& photos, const MediaTable& videos) {
    const auto lookup = [](const MediaTable& media, const long long key) -> const Record* {
        const auto it = media.records.find(key);
        return it == media.records.end() ? nullptr : &it->second;
    };

    try {
        // A leading digit is a legacy id straight into the photo table
        if (std::isdigit(static_cast<unsigned char>(id.front()))) return lookup(photos, std::stoll(id));

        for (const auto* media : {&photos, &videos}) {
            const std::string prefix = media->prefix;
            if (id.starts_with(prefix)) return lookup(*media, std::stoll(id.substr(prefix.size()), nullptr, 16));
        }
    } catch (const std::logic_error&) {
        LogRegistry::source()->warn("[ShotwellSource] Malformed media id '{}' in tag table", id);
    }
    return nullptr;
}

}

ShotwellSource::ShotwellSource(const SourceConfig& cfg)
    : FileBasedImageSource(cfg.database.empty() ? defaultLocation().value_or(std::filesystem::path{}) : cfg.database,
                           cfg.date_format) {}

std::optional<std::filesystem::path> ShotwellSource::defaultLocation() {
    std::vector<std::filesystem::path> dirs;

    if (const char* home = std::getenv("XDG_DATA_HOME"); home && *home) dirs.emplace_back(home);
    else if (const char* user = std::getenv("HOME"); user && *user) dirs.emplace_back(std::filesystem::path(user) / ".local" / "share");

    const char* env = std::getenv("XDG_DATA_DIRS");
    std::stringstream ss(env && *env ? env : "/usr/local/share:/usr/share");
    std::string dir;
    while (std::getline(ss, dir, ':'))
        if (!dir.empty()) dirs.emplace_back(dir);

    for (const auto& d : dirs) {
        const auto candidate = d / "shotwell" / "data" / "photo.db";
        if (::access(candidate.c_str(), R_OK) == 0) return candidate;
    }
    return std::nullopt;
}

void ShotwellSource::loadTags(Tag& root) {
    LogRegistry::source()->info("[ShotwellSource] Loading tags from {}", path().string());

    const auto db = openReadOnly(path());

    MediaTable photos{"PhotoTable", "thumb", false, {}};
    MediaTable videos{"VideoTable", "video-", true, {}};
    loadRecords(db.get(), photos);
    loadRecords(db.get(), videos);

    const auto stmt = prepare(db.get(), "SELECT name, photo_id_list FROM TagTable ORDER BY name");
    unsigned int tagCount = 0, imageCount = 0;
    while (step(db.get(), stmt.get())) {
        const auto name = columnText(stmt.get(), 0);
        const auto idList = columnText(stmt.get(), 1);

        // Ignore unused tags
        if (name.empty() || idList.empty()) continue;

        // Hierarchical tag names start with '/'; anything else hangs off the root
        const auto tagPath = name.front() == '/' ? name : "/" + name;
        if (pfs::util::breakPath(tagPath).empty()) {
            LogRegistry::source()->warn("[ShotwellSource] Skipping tag with empty name '{}'", name);
            continue;
        }

        Tag* tag = &makeTags(root, tagPath);
        ++tagCount;

        for (const auto& id : splitIdList(idList)) {
            const auto* record = resolveId(id, photos, videos);

            // The tag table may reference media that no longer exists
            if (!record) continue;

            const auto image = std::make_shared<FileBasedImage>(
                record->identity, record->title, record->filename,
                pfs::util::fromUnixSeconds(record->exposureTime), record->isVideo, dateFormat());

            // Shotwell lists a photo under every ancestor of its tag; only the deepest keeps it
            for (Tag* parent = tag->parent(); parent; parent = parent->parent())
                parent->remove(*image);

            tag->add(image);
            ++imageCount;
        }
    }

    LogRegistry::source()->info("[ShotwellSource] Loaded {} tags referencing {} images and videos", tagCount, imageCount);
}
