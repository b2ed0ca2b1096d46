#include "uuid-json.hpp"
#include "uuid-codec.hpp"

namespace UUID{
    boost::json::value to_json(const Uuid& uuid){
        FormatBuffer buf;
        std::string_view uuid_str = format(uuid, buf);
        return boost::json::value(boost::json::string(uuid_str.data(), uuid_str.size()));
    }

    ParseResult from_json(const boost::json::value& val){
        if(!val.is_string()){
            return ParseError{InvalidFormat{Section::DOCUMENT, CANONICAL_LENGTH, 0}};
        }
        const boost::json::string& json_uuid = val.as_string();
        return parse(std::string_view(json_uuid.data(), json_uuid.size()));
    }

    void tag_invoke(const boost::json::value_from_tag&, boost::json::value& val, const Uuid& uuid){
        val = to_json(uuid);
    }
}
