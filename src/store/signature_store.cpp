#include "signature_store.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include "utils/helpers.hpp"
#include <sqlite3.h>
#include <filesystem>

namespace fs = std::filesystem;

namespace {

struct StmtHandle {
    sqlite3_stmt* stmt = nullptr;
    ~StmtHandle() { if (stmt) sqlite3_finalize(stmt); }
};

std::string columnText(sqlite3_stmt* stmt, int col) {
    const unsigned char* text = sqlite3_column_text(stmt, col);
    return text ? reinterpret_cast<const char*>(text) : std::string();
}

std::optional<std::string> optionalColumnText(sqlite3_stmt* stmt, int col) {
    if (sqlite3_column_type(stmt, col) == SQLITE_NULL)
        return std::nullopt;
    return columnText(stmt, col);
}

void bindOptional(sqlite3_stmt* stmt, int index, const std::optional<std::string>& value) {
    if (value)
        sqlite3_bind_text(stmt, index, value->c_str(), -1, SQLITE_TRANSIENT);
    else
        sqlite3_bind_null(stmt, index);
}

}

SignatureStore::SignatureStore(const std::string& dbPath, Logger& logger)
    : dbPath(dbPath), logger(logger) {
    logger.debug("Initializing signature store at: " + dbPath);

    if (dbPath != ":memory:") {
        fs::path parent = fs::path(dbPath).parent_path();
        std::error_code ec;
        if (!parent.empty())
            fs::create_directories(parent, ec);
        if (ec)
            throw StoreError("Failed to create directory for signature store '" + dbPath + "': " + ec.message());
    }

    if (sqlite3_open_v2(dbPath.c_str(), &db, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE, nullptr) != SQLITE_OK) {
        std::string reason = db ? sqlite3_errmsg(db) : "out of memory";
        if (db) {
            sqlite3_close(db);
            db = nullptr;
        }
        logger.error("Failed to open signature store '" + dbPath + "': " + reason);
        throw StoreError("Failed to open signature store '" + dbPath + "': " + reason);
    }

    try {
        initializeSchema();
    } catch (...) {
        sqlite3_close(db);
        db = nullptr;
        throw;
    }
    logger.debug("Signature store ready: " + dbPath);
}

SignatureStore::~SignatureStore() {
    close();
}

void SignatureStore::initializeSchema() {
    static const char* schema =
        "CREATE TABLE IF NOT EXISTS signatures ("
        "  id INTEGER PRIMARY KEY AUTOINCREMENT,"
        "  extension TEXT NOT NULL,"
        "  magic_bytes TEXT NOT NULL,"
        "  byte_offset INTEGER NOT NULL DEFAULT 0,"
        "  description TEXT,"
        "  mime_type TEXT,"
        "  created_at TIMESTAMP DEFAULT CURRENT_TIMESTAMP,"
        "  UNIQUE(extension, magic_bytes, byte_offset)"
        ");"
        "CREATE INDEX IF NOT EXISTS idx_extension ON signatures(extension);";

    char* err = nullptr;
    if (sqlite3_exec(db, schema, nullptr, nullptr, &err) != SQLITE_OK) {
        std::string reason = err ? err : "unknown error";
        sqlite3_free(err);
        logger.error("Failed to create signature schema: " + reason);
        throw StoreError("Failed to create signature schema: " + reason);
    }
}

sqlite3* SignatureStore::handle(const char* operation) {
    if (!db)
        throw StoreError(std::string("Signature store is closed (") + operation + ")");
    return db;
}

std::vector<Signature> SignatureStore::getSignatures(const std::string& extension) {
    std::vector<Signature> signatures;
    for (auto& record : getRecords(extension))
        signatures.push_back({std::move(record.magicHex), record.offset});
    logger.debug("Found " + std::to_string(signatures.size()) + " signature(s) for '." +
                 normalize_extension(extension) + "'");
    return signatures;
}

std::vector<SignatureRecord> SignatureStore::getRecords(const std::string& extension) {
    sqlite3* conn = handle("getRecords");
    std::string ext = normalize_extension(extension);

    StmtHandle q;
    const char* sql =
        "SELECT extension, magic_bytes, byte_offset, description, mime_type "
        "FROM signatures WHERE extension = ? ORDER BY id";
    if (sqlite3_prepare_v2(conn, sql, -1, &q.stmt, nullptr) != SQLITE_OK)
        throw StoreError("Failed to query signatures for '." + ext + "': " + sqlite3_errmsg(conn));
    sqlite3_bind_text(q.stmt, 1, ext.c_str(), -1, SQLITE_TRANSIENT);

    std::vector<SignatureRecord> records;
    int rc;
    while ((rc = sqlite3_step(q.stmt)) == SQLITE_ROW) {
        SignatureRecord r;
        r.extension = columnText(q.stmt, 0);
        r.magicHex = columnText(q.stmt, 1);
        r.offset = static_cast<uint64_t>(sqlite3_column_int64(q.stmt, 2));
        r.description = optionalColumnText(q.stmt, 3);
        r.mimeType = optionalColumnText(q.stmt, 4);
        records.push_back(std::move(r));
    }
    if (rc != SQLITE_DONE)
        throw StoreError("Failed to query signatures for '." + ext + "': " + sqlite3_errmsg(conn));

    if (records.empty()) {
        logger.warn("No signature found for extension '." + ext + "'");
        throw SignatureNotFound("No signature found for extension '." + ext + "'");
    }
    return records;
}

void SignatureStore::addSignature(const std::string& extension,
                                  const std::string& magicHex,
                                  int64_t offset,
                                  const std::optional<std::string>& description,
                                  const std::optional<std::string>& mimeType) {
    std::string ext = normalize_extension(extension);
    std::string hex = normalize_hex(magicHex);

    if (ext.empty())
        throw InvalidInput("Extension cannot be empty");
    if (hex.empty())
        throw InvalidInput("Magic bytes cannot be empty");
    if (!is_hex(hex))
        throw InvalidInput("Invalid hex string for magic bytes: '" + magicHex + "'");
    if (offset < 0)
        throw InvalidInput("Offset cannot be negative: " + std::to_string(offset));

    sqlite3* conn = handle("addSignature");
    logger.debug("Adding signature for '." + ext + "': " + hex + " at offset " + std::to_string(offset));

    StmtHandle ins;
    const char* sql =
        "INSERT INTO signatures (extension, magic_bytes, byte_offset, description, mime_type) "
        "VALUES (?, ?, ?, ?, ?)";
    if (sqlite3_prepare_v2(conn, sql, -1, &ins.stmt, nullptr) != SQLITE_OK)
        throw StoreError("Failed to add signature for '." + ext + "': " + sqlite3_errmsg(conn));

    sqlite3_bind_text(ins.stmt, 1, ext.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(ins.stmt, 2, hex.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(ins.stmt, 3, offset);
    bindOptional(ins.stmt, 4, description);
    bindOptional(ins.stmt, 5, mimeType);

    int rc = sqlite3_step(ins.stmt);
    if ((rc & 0xFF) == SQLITE_CONSTRAINT) {
        std::string msg = "Signature for '." + ext + "' with magic bytes " + hex +
                          " at offset " + std::to_string(offset) + " already exists";
        logger.warn(msg);
        throw DuplicateSignature(msg);
    }
    if (rc != SQLITE_DONE)
        throw StoreError("Failed to add signature for '." + ext + "': " + sqlite3_errmsg(conn));

    logger.info("Added signature for '." + ext + "'");
}

std::vector<std::string> SignatureStore::allExtensions() {
    sqlite3* conn = handle("allExtensions");

    StmtHandle q;
    if (sqlite3_prepare_v2(conn, "SELECT DISTINCT extension FROM signatures ORDER BY extension",
                           -1, &q.stmt, nullptr) != SQLITE_OK)
        throw StoreError(std::string("Failed to retrieve extensions: ") + sqlite3_errmsg(conn));

    std::vector<std::string> extensions;
    int rc;
    while ((rc = sqlite3_step(q.stmt)) == SQLITE_ROW)
        extensions.push_back(columnText(q.stmt, 0));
    if (rc != SQLITE_DONE)
        throw StoreError(std::string("Failed to retrieve extensions: ") + sqlite3_errmsg(conn));

    return extensions;
}

size_t SignatureStore::count() {
    sqlite3* conn = handle("count");

    StmtHandle q;
    if (sqlite3_prepare_v2(conn, "SELECT COUNT(*) FROM signatures", -1, &q.stmt, nullptr) != SQLITE_OK ||
        sqlite3_step(q.stmt) != SQLITE_ROW)
        throw StoreError(std::string("Failed to count signatures: ") + sqlite3_errmsg(conn));

    return static_cast<size_t>(sqlite3_column_int64(q.stmt, 0));
}

void SignatureStore::close() {
    if (!db)
        return;
    logger.debug("Closing signature store " + dbPath);
    sqlite3_close(db);
    db = nullptr;
}
