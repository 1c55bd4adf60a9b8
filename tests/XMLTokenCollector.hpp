#ifndef XML_TOKEN_COLLECTOR_HPP
#define XML_TOKEN_COLLECTOR_HPP

#include <ostream>
#include <vector>
#include "xml.hpp"

class XMLTokenCollector : public XMLTokenSink {
public:
    std::vector<XMLToken> tokens;
    Status put(const XMLToken& tok) {
        tokens.push_back(tok);
        return STATUS_OK;
    }
};

// Accepts limit tokens, then fails every put.
class FailingSink : public XMLTokenSink {
    size_t limit;
public:
    size_t accepted;
    FailingSink(size_t limit_) : limit(limit_), accepted(0) {}
    Status put(const XMLToken&) {
        if (accepted == limit) return STATUS_WRITE_ERROR;
        accepted++;
        return STATUS_OK;
    }
};

inline std::ostream& operator<< (std::ostream& os, const XMLToken& tok) {
    switch (tok.kind) {
        case XMLToken::START_ELEMENT:
            os << "<" << tok.name;
            if (tok.has_attr) os << " name=\"" << tok.attr << "\"";
            return os << ">";
        case XMLToken::CHAR_DATA:
            return os << "data(" << tok.data << ")";
        case XMLToken::END_ELEMENT:
            return os << "</" << tok.name << ">";
        default:
            return os << "none";
    }
}

#endif //XML_TOKEN_COLLECTOR_HPP
