#pragma once
#include <string>
#include <optional>
#include <mutex>
#include <cstdint>
#include "sqlite3.h"

// Owns the SQLite connection that every component shares. All access goes
// through Statement and Transaction, which hold the store's mutex for their
// lifetime; a Transaction therefore keeps other threads out until it commits
// or rolls back.
class SQLiteStore
{
public:
    class Statement
    {
    public:
        Statement(SQLiteStore& store, std::string const& sql);
        ~Statement();
        Statement(Statement const&) = delete;
        Statement& operator=(Statement const&) = delete;

        void bind(int index, std::int64_t value);
        void bind(int index, std::string const& value);
        void bind(int index, char const* value);
        void bind(int index, std::optional<std::int64_t> const& value);
        void bind(int index, std::optional<std::string> const& value);
        void bindNull(int index);

        // Advances to the next row; false once the statement is done.
        bool step();
        // Runs a statement that returns no rows.
        void run();
        void reset();

        [[nodiscard]] std::string text(int column) const;
        [[nodiscard]] std::optional<std::string> optionalText(int column) const;
        [[nodiscard]] std::int64_t int64(int column) const;
        [[nodiscard]] std::optional<std::int64_t> optionalInt64(int column) const;

    private:
        SQLiteStore& store;
        std::unique_lock<std::recursive_mutex> lock;
        sqlite3_stmt* stmt;
    };

    class Transaction
    {
    public:
        explicit Transaction(SQLiteStore& store);
        ~Transaction();
        Transaction(Transaction const&) = delete;
        Transaction& operator=(Transaction const&) = delete;

        void commit();

    private:
        SQLiteStore& store;
        std::unique_lock<std::recursive_mutex> lock;
        bool finished;
    };

    SQLiteStore(std::string const& path);
    ~SQLiteStore();
    SQLiteStore(SQLiteStore const&) = delete;
    SQLiteStore& operator=(SQLiteStore const&) = delete;

    void execute(std::string const& sql);
    [[nodiscard]] std::int64_t lastInsertId();
    [[nodiscard]] int changes();

private:
    sqlite3* db;
    std::recursive_mutex mutex;

    void createSchema();
    [[noreturn]] void fail(std::string const& what) const;
};
