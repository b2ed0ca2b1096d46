#ifndef UUID_JSON_HPP
#define UUID_JSON_HPP
#include "uuid.hpp"
#include "uuid-errors.hpp"
#include <boost/json.hpp>

// Uuids travel through json documents as canonical strings.
namespace UUID{
    boost::json::value to_json(const Uuid& uuid);
    // Non string values fail with InvalidFormat in Section::DOCUMENT,
    // strings are handed to parse().
    ParseResult from_json(const boost::json::value& val);

    // Lets boost::json::value_from() and object::emplace() take a Uuid directly.
    void tag_invoke(const boost::json::value_from_tag&, boost::json::value& val, const Uuid& uuid);
}
#endif
