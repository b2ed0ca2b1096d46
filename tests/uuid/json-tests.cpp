#include "json-tests.hpp"
#include "../../src/uuid/uuid-codec.hpp"
#include <string>
#include <variant>

namespace tests{
    namespace {
        const std::string VECTOR("d20a21dc-d2bc-4219-ae33-7d8b90e76920");
    }

    JsonTests::JsonTests(JsonTests::ToJson)
      : passed_{false},
        uuid_{}
    {
        UUID::ParseResult res = UUID::parse(VECTOR);
        if(!res){
            return;
        }
        uuid_ = res.value();
        boost::json::value val = UUID::to_json(uuid_);
        if(!val.is_string()){
            return;
        }
        if(std::string(val.as_string().c_str()) != VECTOR){
            return;
        }
        boost::json::value from = boost::json::value_from(uuid_);
        if(from != val){
            return;
        }
        passed_ = true;
    }

    JsonTests::JsonTests(JsonTests::FromJson)
      : passed_{false},
        uuid_(UUID::Uuid::v4)
    {
        UUID::ParseResult res = UUID::from_json(UUID::to_json(uuid_));
        if(!res || res.value() != uuid_){
            return;
        }

        boost::json::value number(42);
        res = UUID::from_json(number);
        if(res){
            return;
        }
        const UUID::InvalidFormat* e = std::get_if<UUID::InvalidFormat>(&res.error());
        if(e == nullptr || e->section != UUID::Section::DOCUMENT){
            return;
        }

        boost::json::value short_str(boost::json::string("d20a21dc"));
        res = UUID::from_json(short_str);
        if(res || !std::holds_alternative<UUID::InvalidLength>(res.error())){
            return;
        }
        passed_ = true;
    }

    JsonTests::JsonTests(JsonTests::Document)
      : passed_{false},
        uuid_(UUID::Uuid::v4)
    {
        boost::json::object jo;
        jo.emplace("uuid", boost::json::value_from(uuid_));
        jo.emplace("peers", boost::json::array{"127.0.0.1:5200"});
        std::string doc = boost::json::serialize(jo);

        boost::json::value val = boost::json::parse(doc);
        if(!val.is_object()){
            return;
        }
        UUID::ParseResult res = UUID::from_json(val.as_object().at("uuid"));
        if(!res || res.value() != uuid_){
            return;
        }
        if(doc.find("\"uuid\":\"" + UUID::to_string(uuid_) + "\"") == std::string::npos){
            return;
        }
        passed_ = true;
    }
}
