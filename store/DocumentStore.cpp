#include "DocumentStore.hpp"

namespace net_scout::store
{
    std::optional<std::string> GetString(const Document &doc, const std::string &field)
    {
        auto it = doc.find(field);
        if (it == doc.end())
            return std::nullopt;
        if (const auto *s = std::get_if<std::string>(&it->second))
            return *s;
        return std::nullopt;
    }

    std::optional<std::int64_t> GetInt(const Document &doc, const std::string &field)
    {
        auto it = doc.find(field);
        if (it == doc.end())
            return std::nullopt;
        if (const auto *i = std::get_if<std::int64_t>(&it->second))
            return *i;
        return std::nullopt;
    }
}
