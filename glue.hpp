#ifndef GLUE_HPP
#define GLUE_HPP

#include <string>
#include <sstream>

// Glue joins pieces of markup or messages with a separator, wrapped in
// begin/end strings: Glue(" ", "<", ">") << "number" << attr gives <number name="x">
class Glue {
public:
    class separator : public std::string { public: separator(const std::string& str_=""): std::string(str_) {} };
    class attribute {
        public:
            std::string name;
            std::string value;
            attribute(const std::string& name_, const std::string& value_): name(name_), value(value_) {}
    };
    // Length of the UTF-8 sequence at str[i] and its code point, 0 when malformed.
    static size_t decode(const std::string& str, size_t i, unsigned& code) {
        unsigned char c = (unsigned char) str[i];
        size_t n;
        if (c < 0x80) {
            code = c;
            return 1;
        } else if (c >= 0xC2 && c <= 0xDF) {
            n = 2;
            code = c & 0x1F;
        } else if (c >= 0xE0 && c <= 0xEF) {
            n = 3;
            code = c & 0x0F;
        } else if (c >= 0xF0 && c <= 0xF4) {
            n = 4;
            code = c & 0x07;
        } else {
            return 0;
        }
        if (i + n > str.size()) return 0;
        for (size_t k = 1; k < n; k++) {
            unsigned char d = (unsigned char) str[i + k];
            if ((d & 0xC0) != 0x80) return 0;
            code = (code << 6) | (d & 0x3F);
        }
        if (n == 3 && code < 0x800) return 0;
        if (n == 4 && (code < 0x10000 || code > 0x10FFFF)) return 0;
        if (code >= 0xD800 && code < 0xE000) return 0;
        return n;
    }
    static bool isChar(unsigned code) {
        return code == 0x9 || code == 0xA || code == 0xD
            || (code >= 0x20 && code <= 0xD7FF)
            || (code >= 0xE000 && code <= 0xFFFD)
            || (code >= 0x10000 && code <= 0x10FFFF);
    }
    // Replaces every malformed byte and every code point XML cannot carry with U+FFFD.
    static std::string sanitize(const std::string& str) {
        std::string ret;
        size_t i = 0;
        while (i < str.size()) {
            unsigned code;
            size_t n = decode(str, i, code);
            if (n == 0) {
                ret += "\xEF\xBF\xBD";
                i++;
                continue;
            }
            if (isChar(code)) {
                ret.append(str, i, n);
            } else {
                ret += "\xEF\xBF\xBD";
            }
            i += n;
        }
        return ret;
    }
    static std::string escapeText(const std::string& raw) {
        std::string str = sanitize(raw);
        std::string ret;
        for (size_t i = 0; i < str.size(); i++) {
            char c = str[i];
            if (c == '&') {
                ret += "&amp;";
            } else if (c == '<') {
                ret += "&lt;";
            } else if (c == '>') {
                ret += "&gt;";
            } else if (c == '\r') {
                ret += "&#xD;";
            } else {
                ret.push_back(c);
            }
        }
        return ret;
    }
    static std::string escapeAttr(const std::string& raw) {
        std::string str = sanitize(raw);
        std::string ret;
        for (size_t i = 0; i < str.size(); i++) {
            char c = str[i];
            if (c == '"') {
                ret += "&quot;";
            } else if (c == '\t') {
                ret += "&#x9;";
            } else if (c == '\n') {
                ret += "&#xA;";
            } else if (c == '\r') {
                ret += "&#xD;";
            } else if (c == '&' || c == '<' || c == '>') {
                ret += escapeText(std::string(1, c));
            } else {
                ret.push_back(c);
            }
        }
        return ret;
    }
private:
    std::stringstream s;
    std::string sep;
    std::string val;
    std::string begin;
    std::string end;
    bool omit_sep;
public:
    static inline const separator colon() { return separator(":"); }

    inline Glue(std::string sep_="", std::string begin_="", std::string end_="") : sep(sep_), begin(begin_), end(end_) {
        omit_sep = true;
    }
    template <class T> inline Glue& glue(const T& t) {
        s << t;
        return *this;
    }
    template <class T> inline Glue& add(const T& t) {
        if (sep == "" || omit_sep)
            s << t;
        else
            s << sep << t;
        omit_sep = false;
        return *this;
    }
    template <class T> inline Glue& operator<< (const T& t) {
        return this->add(t);
    }
    inline Glue& operator<< (const separator& t) {
        omit_sep = true;
        return this->glue(t);
    }
    inline Glue& operator<< (const attribute& t) {
        return this->add(t.name + "=\"" + escapeAttr(t.value) + "\"");
    }
    inline const std::string& str() {
        val = begin + s.str() + end;
        return val;
    }
    inline const char* c_str() {
        return this->str().c_str();
    }
};

#endif //GLUE_HPP
