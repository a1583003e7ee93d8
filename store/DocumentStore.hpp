#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace net_scout::store
{
    using FieldValue = std::variant<std::string, std::int64_t>;
    using Document = std::map<std::string, FieldValue>;

    enum class FilterOp
    {
        Equal,
        Less
    };

    struct FilterTerm
    {
        std::string field;
        FilterOp op;
        FieldValue value;
    };

    // Conjunction of terms. Empty matches every document.
    using Filter = std::vector<FilterTerm>;

    class DocumentStore
    {
    public:
        virtual ~DocumentStore() = default;

        // fields_to_set are always written. fields_to_set_on_insert are written only
        // where the stored document does not have that field yet.
        virtual bool Upsert(const std::string &collection, const std::string &key,
                            const Document &fields_to_set, const Document &fields_to_set_on_insert) = 0;

        virtual std::vector<Document> Find(const std::string &collection, const Filter &filter) = 0;

        // Returns the number of documents removed, or nullopt on failure.
        virtual std::optional<int> DeleteMany(const std::string &collection, const Filter &filter) = 0;
    };

    std::optional<std::string> GetString(const Document &doc, const std::string &field);
    std::optional<std::int64_t> GetInt(const Document &doc, const std::string &field);
}
