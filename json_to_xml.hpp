#ifndef JSON_TO_XML_HPP
#define JSON_TO_XML_HPP

#include <string>
#include <vector>
#include "status.hpp"
#include "json.hpp"
#include "xml.hpp"

// Converts JSON tokens to XML tokens, one XML token per call of next():
//
//   {"Location": {"Longitude": -1.8262}}
//
// becomes
//
//   <object><object name="Location"><number name="Longitude">-1.8262</number></object></object>
//
// Every value is wrapped in an element named after its type, a member of
// an object carries its key in the name attribute.
class JSONtoXML {
public:
    enum Type {
        OBJECT,
        ARRAY,
        BOOLEAN,
        NUMBER,
        STRING,
        NUL
    };
    static const char* typeName(Type typ);
    static bool isContainer(Type typ) { return typ == OBJECT || typ == ARRAY; }
private:
    JSONTokenSource& source;
    std::vector<Type> types;
    bool has_data;
    std::string data;
    inline bool top(Type typ) const {
        return !types.empty() && types.back() == typ;
    }
    void start(Type typ, const std::string* key, XMLToken& tok);
    void scalar(Type typ, const std::string& data_, const std::string* key, XMLToken& tok);
    void end(XMLToken& tok);
public:
    JSONtoXML(JSONTokenSource& source_);
    Status next(XMLToken& tok);
    // Forwards every token to sink; end of the source is STATUS_OK.
    Status convert(XMLTokenSink& sink);
    size_t depth() const { return types.size(); }
};

Status convert(JSONTokenSource& source, XMLTokenSink& sink);

#endif //JSON_TO_XML_HPP
