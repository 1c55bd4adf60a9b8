#ifndef STATUS_HPP
#define STATUS_HPP

// Result of every token operation. STATUS_EOF is the normal end of a
// token stream, everything past it is a failure.
enum Status {
    STATUS_OK = 0,
    STATUS_EOF,
    STATUS_INVALID_KEY,
    STATUS_UNKNOWN_TOKEN,
    STATUS_INVALID_TOKEN,
    STATUS_SYNTAX_ERROR,
    STATUS_WRITE_ERROR,
    STATUS_MISMATCHED_END
};

inline const char* statusString(Status status) {
    switch (status) {
        case STATUS_OK:             return "ok";
        case STATUS_EOF:            return "end of stream";
        case STATUS_INVALID_KEY:    return "invalid key type";
        case STATUS_UNKNOWN_TOKEN:  return "unknown token type";
        case STATUS_INVALID_TOKEN:  return "invalid token";
        case STATUS_SYNTAX_ERROR:   return "JSON syntax error";
        case STATUS_WRITE_ERROR:    return "XML write error";
        case STATUS_MISMATCHED_END: return "mismatched end element";
    }
    return "unknown status";
}

#endif //STATUS_HPP
