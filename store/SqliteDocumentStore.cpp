#include "SqliteDocumentStore.hpp"

#include <iostream>

namespace net_scout::store
{
    namespace
    {
        // Appends one EXISTS clause per term. Parameters are bound by BindFilter in the same order.
        std::string FilterClause(const Filter &filter)
        {
            std::string clause;
            for (const auto &term : filter)
            {
                const bool is_int = std::holds_alternative<std::int64_t>(term.value);
                const char *column = is_int ? "t.int_value" : "t.text_value";
                const char *op = term.op == FilterOp::Less ? "<" : "=";

                clause += " AND EXISTS (SELECT 1 FROM document_fields t WHERE t.document_id = d.id AND t.field = ? AND ";
                clause += column;
                clause += " ";
                clause += op;
                clause += " ?)";
            }
            return clause;
        }

        void BindValue(sqlite3_stmt *stmt, int index, const FieldValue &value)
        {
            if (const auto *i = std::get_if<std::int64_t>(&value))
                sqlite3_bind_int64(stmt, index, *i);
            else
                sqlite3_bind_text(stmt, index, std::get<std::string>(value).c_str(), -1, SQLITE_TRANSIENT);
        }

        int BindFilter(sqlite3_stmt *stmt, int index, const Filter &filter)
        {
            for (const auto &term : filter)
            {
                sqlite3_bind_text(stmt, index++, term.field.c_str(), -1, SQLITE_TRANSIENT);
                BindValue(stmt, index++, term.value);
            }
            return index;
        }
    }

    SqliteDocumentStore::SqliteDocumentStore() : m_db(nullptr) {}

    SqliteDocumentStore::~SqliteDocumentStore()
    {
        Close();
    }

    bool SqliteDocumentStore::Open(const std::string &db_path)
    {
        std::lock_guard<std::mutex> lock(m_mutex);

        if (m_db)
            return true;

        if (sqlite3_open(db_path.c_str(), &m_db) != SQLITE_OK)
        {
            std::cerr << "[Store] Open failed: " << sqlite3_errmsg(m_db) << std::endl;
            sqlite3_close(m_db);
            m_db = nullptr;
            return false;
        }

        sqlite3_busy_timeout(m_db, 2000);
        Exec("PRAGMA journal_mode=WAL;");
        Exec("PRAGMA foreign_keys = ON;");

        const char *sql_tables =
            "CREATE TABLE IF NOT EXISTS documents ("
            "id INTEGER PRIMARY KEY AUTOINCREMENT, "
            "collection TEXT NOT NULL, "
            "doc_key TEXT NOT NULL, "
            "UNIQUE(collection, doc_key)"
            ");"

            "CREATE TABLE IF NOT EXISTS document_fields ("
            "document_id INTEGER NOT NULL, "
            "field TEXT NOT NULL, "
            "text_value TEXT, "
            "int_value INTEGER, "
            "PRIMARY KEY(document_id, field), "
            "FOREIGN KEY(document_id) REFERENCES documents(id) ON DELETE CASCADE"
            ");"

            "CREATE INDEX IF NOT EXISTS idx_fields_lookup ON document_fields(field, int_value);";

        char *err_msg = nullptr;
        if (sqlite3_exec(m_db, sql_tables, nullptr, nullptr, &err_msg) != SQLITE_OK)
        {
            std::cerr << "[Store] Schema error: " << (err_msg ? err_msg : "unknown") << std::endl;
            sqlite3_free(err_msg);
            sqlite3_close(m_db);
            m_db = nullptr;
            return false;
        }
        return true;
    }

    void SqliteDocumentStore::Close()
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_db)
        {
            sqlite3_close(m_db);
            m_db = nullptr;
        }
    }

    bool SqliteDocumentStore::IsOpen()
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_db != nullptr;
    }

    bool SqliteDocumentStore::Exec(const char *sql)
    {
        char *err_msg = nullptr;
        if (sqlite3_exec(m_db, sql, nullptr, nullptr, &err_msg) != SQLITE_OK)
        {
            std::cerr << "[Store] '" << sql << "' failed: " << (err_msg ? err_msg : "unknown") << std::endl;
            sqlite3_free(err_msg);
            return false;
        }
        return true;
    }

    bool SqliteDocumentStore::WriteFields(sqlite3_int64 doc_id, const Document &fields, bool only_if_missing)
    {
        const char *sql = only_if_missing
                              ? "INSERT OR IGNORE INTO document_fields (document_id, field, text_value, int_value) VALUES (?, ?, ?, ?);"
                              : "INSERT OR REPLACE INTO document_fields (document_id, field, text_value, int_value) VALUES (?, ?, ?, ?);";

        sqlite3_stmt *stmt;
        if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK)
            return false;

        bool ok = true;
        for (const auto &[field, value] : fields)
        {
            sqlite3_reset(stmt);
            sqlite3_clear_bindings(stmt);
            sqlite3_bind_int64(stmt, 1, doc_id);
            sqlite3_bind_text(stmt, 2, field.c_str(), -1, SQLITE_TRANSIENT);
            if (const auto *i = std::get_if<std::int64_t>(&value))
            {
                sqlite3_bind_null(stmt, 3);
                sqlite3_bind_int64(stmt, 4, *i);
            }
            else
            {
                sqlite3_bind_text(stmt, 3, std::get<std::string>(value).c_str(), -1, SQLITE_TRANSIENT);
                sqlite3_bind_null(stmt, 4);
            }

            if (sqlite3_step(stmt) != SQLITE_DONE)
            {
                ok = false;
                break;
            }
        }
        sqlite3_finalize(stmt);
        return ok;
    }

    bool SqliteDocumentStore::Upsert(const std::string &collection, const std::string &key,
                                     const Document &fields_to_set, const Document &fields_to_set_on_insert)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_db)
            return false;

        if (!Exec("BEGIN IMMEDIATE;"))
            return false;

        sqlite3_stmt *stmt;
        bool ok = sqlite3_prepare_v2(m_db, "INSERT OR IGNORE INTO documents (collection, doc_key) VALUES (?, ?);", -1, &stmt, nullptr) == SQLITE_OK;
        if (ok)
        {
            sqlite3_bind_text(stmt, 1, collection.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_text(stmt, 2, key.c_str(), -1, SQLITE_TRANSIENT);
            ok = sqlite3_step(stmt) == SQLITE_DONE;
            sqlite3_finalize(stmt);
        }

        sqlite3_int64 doc_id = -1;
        if (ok && sqlite3_prepare_v2(m_db, "SELECT id FROM documents WHERE collection = ? AND doc_key = ?;", -1, &stmt, nullptr) == SQLITE_OK)
        {
            sqlite3_bind_text(stmt, 1, collection.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_text(stmt, 2, key.c_str(), -1, SQLITE_TRANSIENT);
            if (sqlite3_step(stmt) == SQLITE_ROW)
                doc_id = sqlite3_column_int64(stmt, 0);
            sqlite3_finalize(stmt);
        }
        ok = ok && doc_id != -1;

        ok = ok && WriteFields(doc_id, fields_to_set_on_insert, true);
        ok = ok && WriteFields(doc_id, fields_to_set, false);

        if (!ok)
        {
            std::cerr << "[Store] Upsert " << collection << "/" << key << " failed: " << sqlite3_errmsg(m_db) << std::endl;
            Exec("ROLLBACK;");
            return false;
        }
        if (!Exec("COMMIT;"))
        {
            std::cerr << "[Store] Commit of " << collection << "/" << key << " failed, rolling back" << std::endl;
            Exec("ROLLBACK;");
            return false;
        }
        return true;
    }

    std::vector<Document> SqliteDocumentStore::Find(const std::string &collection, const Filter &filter)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        std::vector<Document> documents;
        if (!m_db)
            return documents;

        std::string sql = "SELECT d.id, f.field, f.text_value, f.int_value FROM documents d "
                          "JOIN document_fields f ON f.document_id = d.id "
                          "WHERE d.collection = ?";
        sql += FilterClause(filter);
        sql += " ORDER BY d.id;";

        sqlite3_stmt *stmt;
        if (sqlite3_prepare_v2(m_db, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK)
        {
            std::cerr << "[Store] Find prepare failed: " << sqlite3_errmsg(m_db) << std::endl;
            return documents;
        }

        sqlite3_bind_text(stmt, 1, collection.c_str(), -1, SQLITE_TRANSIENT);
        BindFilter(stmt, 2, filter);

        sqlite3_int64 current_id = -1;
        int rc;
        while ((rc = sqlite3_step(stmt)) == SQLITE_ROW)
        {
            sqlite3_int64 id = sqlite3_column_int64(stmt, 0);
            if (id != current_id)
            {
                documents.emplace_back();
                current_id = id;
            }

            std::string field = reinterpret_cast<const char *>(sqlite3_column_text(stmt, 1));
            if (sqlite3_column_type(stmt, 3) != SQLITE_NULL)
            {
                documents.back()[field] = static_cast<std::int64_t>(sqlite3_column_int64(stmt, 3));
            }
            else
            {
                const char *text = reinterpret_cast<const char *>(sqlite3_column_text(stmt, 2));
                documents.back()[field] = std::string(text ? text : "");
            }
        }
        if (rc != SQLITE_DONE)
            std::cerr << "[Store] Find step failed: " << sqlite3_errmsg(m_db) << std::endl;

        sqlite3_finalize(stmt);
        return documents;
    }

    std::optional<int> SqliteDocumentStore::DeleteMany(const std::string &collection, const Filter &filter)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_db)
            return std::nullopt;

        std::string sql = "DELETE FROM documents WHERE id IN (SELECT d.id FROM documents d WHERE d.collection = ?";
        sql += FilterClause(filter);
        sql += ");";

        sqlite3_stmt *stmt;
        if (sqlite3_prepare_v2(m_db, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK)
        {
            std::cerr << "[Store] DeleteMany prepare failed: " << sqlite3_errmsg(m_db) << std::endl;
            return std::nullopt;
        }

        sqlite3_bind_text(stmt, 1, collection.c_str(), -1, SQLITE_TRANSIENT);
        BindFilter(stmt, 2, filter);

        bool ok = sqlite3_step(stmt) == SQLITE_DONE;
        sqlite3_finalize(stmt);
        if (!ok)
        {
            std::cerr << "[Store] DeleteMany failed: " << sqlite3_errmsg(m_db) << std::endl;
            return std::nullopt;
        }
        return sqlite3_changes(m_db);
    }
}
