#ifndef JSON_HPP
#define JSON_HPP

#include <stdio.h>
#include <istream>
#include <string>
#include <vector>
#include "status.hpp"

class JSONToken {
public:
    enum Kind {
        NONE,
        BEGIN_OBJECT,
        END_OBJECT,
        BEGIN_ARRAY,
        END_ARRAY,
        STRING,
        NUMBER, // literal text exactly as written in the document
        FLOAT,
        BOOLEAN,
        NUL
    };
    Kind kind;
    std::string text;
    double real;
    bool truth;
    JSONToken(Kind kind_ = NONE) : kind(kind_), real(0), truth(false) {}

    static JSONToken makeString(const std::string& text_) {
        JSONToken tok(STRING);
        tok.text = text_;
        return tok;
    }
    static JSONToken makeNumber(const std::string& text_) {
        JSONToken tok(NUMBER);
        tok.text = text_;
        return tok;
    }
    static JSONToken makeFloat(double real_) {
        JSONToken tok(FLOAT);
        tok.real = real_;
        return tok;
    }
    static JSONToken makeBool(bool truth_) {
        JSONToken tok(BOOLEAN);
        tok.truth = truth_;
        return tok;
    }
};

class JSONTokenSource {
public:
    virtual ~JSONTokenSource() {}
    // Fills tok and returns STATUS_OK, or STATUS_EOF once the stream is exhausted.
    virtual Status next(JSONToken& tok) = 0;
};

// Replays tokens that were produced elsewhere.
class JSONTokenList : public JSONTokenSource {
    std::vector<JSONToken> tokens;
    size_t i;
public:
    JSONTokenList() : i(0) {}
    JSONTokenList(const std::vector<JSONToken>& tokens_) : tokens(tokens_), i(0) {}
    JSONTokenList& operator<< (const JSONToken& tok) {
        tokens.push_back(tok);
        return *this;
    }
    Status next(JSONToken& tok) {
        if (i >= tokens.size()) return STATUS_EOF;
        tok = tokens[i++];
        return STATUS_OK;
    }
};

// Pull tokenizer reading JSON text from a stream. A key is returned as a
// STRING token; the grammar (colons, commas, nesting) is checked here and
// never reaches the caller.
class JSONTokenizer : public JSONTokenSource {
    enum Expect {
        VALUE,
        FIRST_MEMBER,
        MEMBER,
        COLON,
        AFTER_MEMBER,
        FIRST_ELEMENT,
        AFTER_ELEMENT
    };
    std::istream& in;
    bool use_number_;
    Expect state;
    std::vector<char> stack;
    size_t i;
    std::string seen;
    std::string err;
    inline int now() {
        return in.peek();
    }
    inline char get() {
        char c = (char) in.get();
        i++;
        seen.push_back(c);
        if (seen.size() > 64) seen.erase(0, seen.size() - 32);
        return c;
    }
    inline bool expect(char c) {
        if (now() != c) return false;
        get(); return true;
    }
    inline bool digit() {
        int c = now();
        return c >= '0' && c <= '9';
    }
    void skip();
    bool delimited();
    bool hex(unsigned& code);
    bool str(std::string& val);
    bool rest(std::string& val);
    bool word(const char* w);
    void closed();
    Status fail(const std::string& msg);
    Status value(JSONToken& tok);
public:
    JSONTokenizer(std::istream& in_, bool use_number = true);
    // NUMBER literal tokens when true, FLOAT tokens when false
    void useNumber(bool use_number) { use_number_ = use_number; }
    Status next(JSONToken& tok);
    const std::string& error() const { return err; }
    size_t offset() const { return i; }
    void report(FILE* f);
};

std::string formatFloat(double real);

#endif //JSON_HPP
