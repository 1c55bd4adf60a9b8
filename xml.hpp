#ifndef XML_HPP
#define XML_HPP

#include <ostream>
#include <string>
#include <vector>
#include "pugixml.hpp"
#include "status.hpp"

class XMLToken {
public:
    enum Kind {
        NONE,
        START_ELEMENT,
        CHAR_DATA,
        END_ELEMENT
    };
    Kind kind;
    std::string name;
    bool has_attr; // start element carries name="attr"
    std::string attr;
    std::string data;
    XMLToken(Kind kind_ = NONE) : kind(kind_), has_attr(false) {}

    static XMLToken start(const std::string& name_) {
        XMLToken tok(START_ELEMENT);
        tok.name = name_;
        return tok;
    }
    static XMLToken start(const std::string& name_, const std::string& attr_) {
        XMLToken tok = start(name_);
        tok.has_attr = true;
        tok.attr = attr_;
        return tok;
    }
    static XMLToken charData(const std::string& data_) {
        XMLToken tok(CHAR_DATA);
        tok.data = data_;
        return tok;
    }
    static XMLToken end(const std::string& name_) {
        XMLToken tok(END_ELEMENT);
        tok.name = name_;
        return tok;
    }
    bool operator== (const XMLToken& other) const {
        return kind == other.kind && name == other.name && has_attr == other.has_attr
            && attr == other.attr && data == other.data;
    }
};

class XMLTokenSink {
public:
    virtual ~XMLTokenSink() {}
    virtual Status put(const XMLToken& tok) = 0;
};

// Serializes tokens as XML text. Elements are never self-closed.
class XMLWriter : public XMLTokenSink {
    std::ostream& out;
    std::string sep;
    std::vector<std::string> open;
public:
    // sep is written after every closed top-level element
    XMLWriter(std::ostream& out_, const std::string& sep_ = "");
    Status put(const XMLToken& tok);
    Status flush();
    size_t depth() const { return open.size(); }
};

// Appends the elements under an existing pugixml node.
class XMLTreeBuilder : public XMLTokenSink {
    pugi::xml_node root;
    pugi::xml_node node;
public:
    XMLTreeBuilder(pugi::xml_node root_);
    Status put(const XMLToken& tok);
    pugi::xml_node current() const { return node; }
};

#endif //XML_HPP
