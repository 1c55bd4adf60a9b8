#include <stdio.h>
#include "json_to_xml.hpp"

static const char* const type_names[] = { "object", "array", "boolean", "number", "string", "null" };

const char* JSONtoXML::typeName(Type typ) {
    return type_names[typ];
}

JSONtoXML::JSONtoXML(JSONTokenSource& source_): source(source_), has_data(false) {}

void JSONtoXML::start(Type typ, const std::string* key, XMLToken& tok) {
    types.push_back(typ);
    if (key != NULL) {
        tok = XMLToken::start(typeName(typ), *key);
    } else {
        tok = XMLToken::start(typeName(typ));
    }
}

void JSONtoXML::scalar(Type typ, const std::string& data_, const std::string* key, XMLToken& tok) {
    data = data_;
    has_data = true;
    start(typ, key, tok);
}

void JSONtoXML::end(XMLToken& tok) {
    tok = XMLToken::end(typeName(types.back()));
    types.pop_back();
}

Status JSONtoXML::next(XMLToken& tok) {
    if (has_data) {
        tok = XMLToken::charData(data);
        has_data = false;
        data.clear();
        return STATUS_OK;
    }
    // a scalar or null got its start (and data) already, close it
    if (!types.empty() && !isContainer(types.back())) {
        end(tok);
        return STATUS_OK;
    }

    std::string key;
    bool has_key = false;
    JSONToken val;
    Status ret = source.next(val);
    if (ret != STATUS_OK) return ret;
    if (top(OBJECT) && val.kind != JSONToken::END_OBJECT) {
        if (val.kind == JSONToken::END_ARRAY) return STATUS_INVALID_TOKEN;
        if (val.kind != JSONToken::STRING) return STATUS_INVALID_KEY;
        key = val.text;
        has_key = true;
        ret = source.next(val);
        if (ret != STATUS_OK) return ret;
        if (val.kind == JSONToken::END_OBJECT || val.kind == JSONToken::END_ARRAY) return STATUS_INVALID_TOKEN;
    }
    const std::string* name = has_key ? &key : NULL;

    switch (val.kind) {
        case JSONToken::BEGIN_OBJECT:
            start(OBJECT, name, tok);
            return STATUS_OK;
        case JSONToken::BEGIN_ARRAY:
            start(ARRAY, name, tok);
            return STATUS_OK;
        case JSONToken::END_OBJECT:
            if (!top(OBJECT)) return STATUS_INVALID_TOKEN;
            end(tok);
            return STATUS_OK;
        case JSONToken::END_ARRAY:
            if (!top(ARRAY)) return STATUS_INVALID_TOKEN;
            end(tok);
            return STATUS_OK;
        case JSONToken::BOOLEAN:
            scalar(BOOLEAN, val.truth ? "true" : "false", name, tok);
            return STATUS_OK;
        case JSONToken::FLOAT:
            scalar(NUMBER, formatFloat(val.real), name, tok);
            return STATUS_OK;
        case JSONToken::NUMBER:
            scalar(NUMBER, val.text, name, tok);
            return STATUS_OK;
        case JSONToken::STRING:
            scalar(STRING, val.text, name, tok);
            return STATUS_OK;
        case JSONToken::NUL:
            start(NUL, name, tok);
            return STATUS_OK;
        default:
            return STATUS_UNKNOWN_TOKEN;
    }
}

Status JSONtoXML::convert(XMLTokenSink& sink) {
    XMLToken tok;
    for (;;) {
        Status ret = next(tok);
        if (ret == STATUS_EOF) return STATUS_OK;
        if (ret != STATUS_OK) return ret;
        ret = sink.put(tok);
        if (ret != STATUS_OK) return ret;
    }
}

Status convert(JSONTokenSource& source, XMLTokenSink& sink) {
    JSONtoXML conv(source);
    return conv.convert(sink);
}
