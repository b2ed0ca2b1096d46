#ifndef UUID_JSON_TESTS_HPP
#define UUID_JSON_TESTS_HPP
#include "../../src/uuid/uuid-json.hpp"
namespace tests{
    class JsonTests
    {
    public:
        constexpr static struct ToJson{} test_to_json{};
        constexpr static struct FromJson{} test_from_json{};
        constexpr static struct Document{} test_document{};

        explicit JsonTests(ToJson);
        explicit JsonTests(FromJson);
        explicit JsonTests(Document);

        operator bool(){ return passed_; }
    private:
        bool passed_;
        UUID::Uuid uuid_;
    };
}
#endif
