#include <stdexcept>
#include <iostream>
#include "SQLiteStore.hpp"

SQLiteStore::SQLiteStore(std::string const& path)
    : db(nullptr)
{
    int rc = sqlite3_open(path.c_str(), &db);
    if (rc != SQLITE_OK)
    {
        std::string message = db ? sqlite3_errmsg(db) : "out of memory";
        if (db) sqlite3_close(db);
        db = nullptr;
        throw std::runtime_error("Failed to open SQLite DB " + path + ": " + message);
    }

    try
    {
        // Cascades from alerts to active_periods/informed_entities and from
        // users to subscriptions depend on this.
        execute("PRAGMA foreign_keys = ON;");
        createSchema();
    }
    catch (...)
    {
        sqlite3_close(db);
        db = nullptr;
        throw;
    }
}

SQLiteStore::~SQLiteStore()
{
    if (db) sqlite3_close(db);
}

void SQLiteStore::createSchema()
{
    const char* createSql =
        "CREATE TABLE IF NOT EXISTS stops ("
        "  stop_id TEXT PRIMARY KEY, "
        "  stop_name TEXT, "
        "  address TEXT, "
        "  trains TEXT"
        ");"
        "CREATE TABLE IF NOT EXISTS routes ("
        "  route_id TEXT PRIMARY KEY, "
        "  route_short_name TEXT, "
        "  route_long_name TEXT"
        ");"
        "CREATE TABLE IF NOT EXISTS trips_real_time ("
        "  trip_id TEXT PRIMARY KEY, "
        "  start_datetime INTEGER, "
        "  route_id TEXT"
        ");"
        "CREATE TABLE IF NOT EXISTS stop_time_update ("
        "  id INTEGER PRIMARY KEY AUTOINCREMENT, "
        "  trip_id TEXT, "
        "  stop_id TEXT, "
        "  arrival_time INTEGER, "
        "  departure_time INTEGER, "
        "  UNIQUE (trip_id, stop_id)"
        ");"
        "CREATE INDEX IF NOT EXISTS idx_stop_time_update_stop "
        "  ON stop_time_update (stop_id, departure_time);"
        "CREATE TABLE IF NOT EXISTS alerts ("
        "  id INTEGER PRIMARY KEY AUTOINCREMENT, "
        "  alert_id TEXT UNIQUE NOT NULL, "
        "  header_text TEXT, "
        "  description_text TEXT, "
        "  last_updated INTEGER"
        ");"
        "CREATE TABLE IF NOT EXISTS active_periods ("
        "  id INTEGER PRIMARY KEY AUTOINCREMENT, "
        "  alert_id TEXT REFERENCES alerts(alert_id) ON DELETE CASCADE, "
        "  start_time INTEGER, "
        "  end_time INTEGER"
        ");"
        "CREATE TABLE IF NOT EXISTS informed_entities ("
        "  id INTEGER PRIMARY KEY AUTOINCREMENT, "
        "  alert_id TEXT REFERENCES alerts(alert_id) ON DELETE CASCADE, "
        "  agency_id TEXT, "
        "  route_id TEXT, "
        "  stop_id TEXT"
        ");"
        "CREATE TABLE IF NOT EXISTS users ("
        "  user_id INTEGER PRIMARY KEY AUTOINCREMENT, "
        "  username TEXT UNIQUE NOT NULL"
        ");"
        "CREATE TABLE IF NOT EXISTS subscriptions ("
        "  subscription_id INTEGER PRIMARY KEY AUTOINCREMENT, "
        "  user_id INTEGER REFERENCES users(user_id) ON DELETE CASCADE, "
        "  stop_id TEXT, "
        "  route_id TEXT, "
        "  CHECK ((stop_id IS NULL) <> (route_id IS NULL))"
        ");";

    execute(createSql);
}

void SQLiteStore::execute(std::string const& sql)
{
    std::lock_guard<std::recursive_mutex> guard(mutex);

    char* errMsg = nullptr;
    int rc = sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &errMsg);
    if (rc != SQLITE_OK)
    {
        std::string message = errMsg ? errMsg : "unknown error";
        if (errMsg) sqlite3_free(errMsg);
        throw std::runtime_error("SQLite exec failed: " + message);
    }
}

std::int64_t SQLiteStore::lastInsertId()
{
    std::lock_guard<std::recursive_mutex> guard(mutex);
    return static_cast<std::int64_t>(sqlite3_last_insert_rowid(db));
}

int SQLiteStore::changes()
{
    std::lock_guard<std::recursive_mutex> guard(mutex);
    return sqlite3_changes(db);
}

void SQLiteStore::fail(std::string const& what) const
{
    throw std::runtime_error(what + ": " + sqlite3_errmsg(db));
}


SQLiteStore::Statement::Statement(SQLiteStore& s, std::string const& sql)
    : store(s), lock(s.mutex), stmt(nullptr)
{
    int rc = sqlite3_prepare_v2(store.db, sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK)
    {
        stmt = nullptr;
        store.fail("Failed to prepare statement");
    }
}

SQLiteStore::Statement::~Statement()
{
    if (stmt) sqlite3_finalize(stmt);
}

void SQLiteStore::Statement::bind(int index, std::int64_t value)
{
    if (sqlite3_bind_int64(stmt, index, static_cast<sqlite3_int64>(value)) != SQLITE_OK)
        store.fail("Failed to bind parameter " + std::to_string(index));
}

void SQLiteStore::Statement::bind(int index, std::string const& value)
{
    if (sqlite3_bind_text(stmt, index, value.c_str(), static_cast<int>(value.size()), SQLITE_TRANSIENT) != SQLITE_OK)
        store.fail("Failed to bind parameter " + std::to_string(index));
}

void SQLiteStore::Statement::bind(int index, char const* value)
{
    if (sqlite3_bind_text(stmt, index, value, -1, SQLITE_TRANSIENT) != SQLITE_OK)
        store.fail("Failed to bind parameter " + std::to_string(index));
}

void SQLiteStore::Statement::bind(int index, std::optional<std::int64_t> const& value)
{
    if (value)
        bind(index, *value);
    else
        bindNull(index);
}

void SQLiteStore::Statement::bind(int index, std::optional<std::string> const& value)
{
    if (value)
        bind(index, *value);
    else
        bindNull(index);
}

void SQLiteStore::Statement::bindNull(int index)
{
    if (sqlite3_bind_null(stmt, index) != SQLITE_OK)
        store.fail("Failed to bind parameter " + std::to_string(index));
}

bool SQLiteStore::Statement::step()
{
    int rc = sqlite3_step(stmt);
    if (rc == SQLITE_ROW)
        return true;
    if (rc == SQLITE_DONE)
        return false;

    store.fail("SQLite step failed");
}

void SQLiteStore::Statement::run()
{
    while (step())
    {
    }
}

void SQLiteStore::Statement::reset()
{
    sqlite3_reset(stmt);
    sqlite3_clear_bindings(stmt);
}

std::string SQLiteStore::Statement::text(int column) const
{
    const unsigned char* value = sqlite3_column_text(stmt, column);
    return value ? reinterpret_cast<const char*>(value) : "";
}

std::optional<std::string> SQLiteStore::Statement::optionalText(int column) const
{
    if (sqlite3_column_type(stmt, column) == SQLITE_NULL)
        return std::nullopt;
    return text(column);
}

std::int64_t SQLiteStore::Statement::int64(int column) const
{
    return static_cast<std::int64_t>(sqlite3_column_int64(stmt, column));
}

std::optional<std::int64_t> SQLiteStore::Statement::optionalInt64(int column) const
{
    if (sqlite3_column_type(stmt, column) == SQLITE_NULL)
        return std::nullopt;
    return int64(column);
}


SQLiteStore::Transaction::Transaction(SQLiteStore& s)
    : store(s), lock(s.mutex), finished(false)
{
    store.execute("BEGIN IMMEDIATE TRANSACTION;");
}

SQLiteStore::Transaction::~Transaction()
{
    if (finished)
        return;

    char* errMsg = nullptr;
    if (sqlite3_exec(store.db, "ROLLBACK;", nullptr, nullptr, &errMsg) != SQLITE_OK)
    {
        std::cerr << "[Storage] Rollback failed: " << (errMsg ? errMsg : "unknown error") << "\n";
        if (errMsg) sqlite3_free(errMsg);
    }
}

void SQLiteStore::Transaction::commit()
{
    store.execute("COMMIT;");
    finished = true;
}
