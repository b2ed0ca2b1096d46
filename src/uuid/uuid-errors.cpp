#include "uuid-errors.hpp"
#include <string>

namespace UUID{
    const char* section_name(Section section){
        switch(section)
        {
            case Section::TIME_LOW:
                return "TimeLow";
            case Section::TIME_MID:
                return "TimeMid";
            case Section::VERSION_AND_TIME_HIGH:
                return "VersionAndTimeHigh";
            case Section::CLOCK_SEQ_HI_AND_RESERVED:
                return "ClockSeqHiAndReserved";
            case Section::CLOCK_SEQ_LOW:
                return "ClockSeqLow";
            case Section::NODE:
                return "Node";
            case Section::SEPARATOR:
                return "Separator";
            case Section::DOCUMENT:
                return "Document";
        }
        return "Unknown";
    }

    std::ostream& operator<<(std::ostream& os, const Section& section){
        os << section_name(section);
        return os;
    }

    namespace {
        struct ErrorPrinter
        {
            std::ostream& os;
            void operator()(const InvalidLength& e) const {
                os << "invalid length: expected " << e.expected << " characters, found " << e.actual;
            }
            void operator()(const InvalidFormat& e) const {
                os << "invalid format in " << e.section << ": expected " << e.expected << " characters, found " << e.actual;
            }
            void operator()(const InvalidVersion& e) const {
                os << "invalid version: expected " << e.expected << ", found " << e.actual;
            }
            void operator()(const ReadError& e) const {
                os << "read error: " << e.ec.message();
            }
        };

        class ParseCategory: public std::error_category
        {
        public:
            const char* name() const noexcept override { return "uuid"; }
            std::string message(int ev) const override {
                switch(static_cast<ParseErrc>(ev))
                {
                    case ParseErrc::INVALID_LENGTH:
                        return "uuid string has the wrong length";
                    case ParseErrc::INVALID_FORMAT:
                        return "uuid string is malformed";
                    case ParseErrc::INVALID_VERSION:
                        return "uuid has an unexpected version";
                    case ParseErrc::READ_ERROR:
                        return "uuid could not be read from the stream";
                }
                return "unknown uuid error";
            }
        };
    }

    std::ostream& operator<<(std::ostream& os, const ParseError& error){
        std::visit(ErrorPrinter{os}, error);
        return os;
    }

    const std::error_category& parse_category(){
        static ParseCategory category;
        return category;
    }

    std::error_code make_error_code(ParseErrc e){
        return std::error_code(static_cast<int>(e), parse_category());
    }

    ParseErrc kind(const ParseError& error){
        return static_cast<ParseErrc>(error.index() + 1);
    }
}
