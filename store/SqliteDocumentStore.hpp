#pragma once

#include <mutex>
#include <string>
#include <sqlite3.h>
#include "DocumentStore.hpp"

namespace net_scout::store
{
    // Document store over sqlite3. Each document is a row in `documents` keyed by
    // (collection, key); its fields live in `document_fields`, one typed row per field.
    class SqliteDocumentStore : public DocumentStore
    {
    public:
        SqliteDocumentStore();
        ~SqliteDocumentStore();

        SqliteDocumentStore(const SqliteDocumentStore &) = delete;
        SqliteDocumentStore &operator=(const SqliteDocumentStore &) = delete;

        // ":memory:" opens a private in-memory database.
        bool Open(const std::string &db_path);
        void Close();
        bool IsOpen();

        bool Upsert(const std::string &collection, const std::string &key,
                    const Document &fields_to_set, const Document &fields_to_set_on_insert) override;

        std::vector<Document> Find(const std::string &collection, const Filter &filter) override;

        std::optional<int> DeleteMany(const std::string &collection, const Filter &filter) override;

    private:
        bool Exec(const char *sql);
        bool WriteFields(sqlite3_int64 doc_id, const Document &fields, bool only_if_missing);

        sqlite3 *m_db;
        std::mutex m_mutex;
    };
}
