#include "json.hpp"
#include <stdio.h>
#include <stdlib.h>
#include <errno.h>
#include <cmath>

static void utf8(unsigned code, std::string& val) {
	if (code < 0x80) {
		val.push_back((char) code);
	} else if (code < 0x800) {
		val.push_back((char) (0xC0 | (code >> 6)));
		val.push_back((char) (0x80 | (code & 0x3F)));
	} else if (code < 0x10000) {
		val.push_back((char) (0xE0 | (code >> 12)));
		val.push_back((char) (0x80 | ((code >> 6) & 0x3F)));
		val.push_back((char) (0x80 | (code & 0x3F)));
	} else {
		val.push_back((char) (0xF0 | (code >> 18)));
		val.push_back((char) (0x80 | ((code >> 12) & 0x3F)));
		val.push_back((char) (0x80 | ((code >> 6) & 0x3F)));
		val.push_back((char) (0x80 | (code & 0x3F)));
	}
}

static bool simpleEscape(char c, std::string& val) {
	switch (c) {
		case '"':
		case '\\':
		case '/': val.push_back(c); return true;
		case 'b': val.push_back('\b'); return true;
		case 'f': val.push_back('\f'); return true;
		case 'n': val.push_back('\n'); return true;
		case 'r': val.push_back('\r'); return true;
		case 't': val.push_back('\t'); return true;
	}
	return false;
}

static const unsigned REPLACEMENT = 0xFFFD;

JSONTokenizer::JSONTokenizer(std::istream& in_, bool use_number) : in(in_), use_number_(use_number), state(VALUE), i(0) {}

void JSONTokenizer::skip() {
	for (;;) {
		int c = now();
		if (c != ' ' && c != '\t' && c != '\n' && c != '\r') return;
		get();
	}
}

bool JSONTokenizer::delimited() {
	const std::string fin = " \t\r\n,]}:";
	int c = now();
	if (c == EOF) return true;
	return fin.find((char) c) != std::string::npos;
}

Status JSONTokenizer::fail(const std::string& msg) {
	if (err.empty()) err = msg;
	return STATUS_SYNTAX_ERROR;
}

bool JSONTokenizer::hex(unsigned& code) {
	code = 0;
	for (int k = 0; k < 4; k++) {
		int c = now();
		if (c >= '0' && c <= '9') {
			code = code * 16 + (c - '0');
		} else if (c >= 'a' && c <= 'f') {
			code = code * 16 + (c - 'a' + 10);
		} else if (c >= 'A' && c <= 'F') {
			code = code * 16 + (c - 'A' + 10);
		} else {
			return false;
		}
		get();
	}
	return true;
}

bool JSONTokenizer::str(std::string& val) {
	if (!expect('"')) {
		fail("expected string");
		return false;
	}
	while (now() != EOF) {
		char c = get();
		if (c == '"') return true;
		if ((unsigned char) c < 0x20) {
			fail("control character in string");
			return false;
		}
		if (c != '\\') {
			val.push_back(c);
			continue;
		}
		if (now() == EOF) break;
		c = get();
		if (simpleEscape(c, val)) continue;
		if (c != 'u') {
			fail("invalid escape in string");
			return false;
		}
		unsigned code;
		if (!hex(code)) {
			fail("invalid \\u escape in string");
			return false;
		}
		if (code >= 0xDC00 && code < 0xE000) {
			utf8(REPLACEMENT, val);
			continue;
		}
		if (code < 0xD800 || code >= 0xDC00) {
			utf8(code, val);
			continue;
		}
		// high surrogate, a low one has to follow as the next escape
		if (!expect('\\')) {
			utf8(REPLACEMENT, val);
			continue;
		}
		if (now() == EOF) break;
		c = get();
		if (c != 'u') {
			utf8(REPLACEMENT, val);
			if (simpleEscape(c, val)) continue;
			fail("invalid escape in string");
			return false;
		}
		unsigned low;
		if (!hex(low)) {
			fail("invalid \\u escape in string");
			return false;
		}
		if (low >= 0xDC00 && low < 0xE000) {
			utf8(0x10000 + ((code - 0xD800) << 10) + (low - 0xDC00), val);
		} else {
			utf8(REPLACEMENT, val);
			utf8(low >= 0xD800 && low < 0xDC00 ? REPLACEMENT : low, val);
		}
	}
	fail("unexpected end of input in string");
	return false;
}

bool JSONTokenizer::rest(std::string& val) {
	if (now() == '-') val.push_back(get());
	if (now() == '0') {
		val.push_back(get());
	} else if (digit()) {
		while (digit()) val.push_back(get());
	} else {
		return false;
	}
	if (now() == '.') {
		val.push_back(get());
		if (!digit()) return false;
		while (digit()) val.push_back(get());
	}
	if (now() == 'e' || now() == 'E') {
		val.push_back(get());
		if (now() == '+' || now() == '-') val.push_back(get());
		if (!digit()) return false;
		while (digit()) val.push_back(get());
	}
	return true;
}

bool JSONTokenizer::word(const char* w) {
	for (; *w != '\0'; w++) {
		if (!expect(*w)) return false;
	}
	return delimited();
}

void JSONTokenizer::closed() {
	if (stack.empty()) {
		state = VALUE;
	} else if (stack.back() == '{') {
		state = AFTER_MEMBER;
	} else {
		state = AFTER_ELEMENT;
	}
}

Status JSONTokenizer::value(JSONToken& tok) {
	int c = now();
	if (c == EOF) return fail("unexpected end of input");
	if (expect('{')) {
		stack.push_back('{');
		state = FIRST_MEMBER;
		tok = JSONToken(JSONToken::BEGIN_OBJECT);
		return STATUS_OK;
	}
	if (expect('[')) {
		stack.push_back('[');
		state = FIRST_ELEMENT;
		tok = JSONToken(JSONToken::BEGIN_ARRAY);
		return STATUS_OK;
	}
	if (c == '"') {
		std::string val;
		if (!str(val)) return STATUS_SYNTAX_ERROR;
		tok = JSONToken::makeString(val);
		closed();
		return STATUS_OK;
	}
	if (c == 't' || c == 'f' || c == 'n') {
		const char* w = c == 't' ? "true" : (c == 'f' ? "false" : "null");
		if (!word(w)) return fail(std::string("invalid literal, expected ") + w);
		if (c == 'n') {
			tok = JSONToken(JSONToken::NUL);
		} else {
			tok = JSONToken::makeBool(c == 't');
		}
		closed();
		return STATUS_OK;
	}
	if (c == '-' || digit()) {
		std::string val;
		if (!rest(val)) return fail("invalid number");
		if (!delimited()) return fail("invalid character after number");
		if (use_number_) {
			tok = JSONToken::makeNumber(val);
		} else {
			errno = 0;
			double real = strtod(val.c_str(), NULL);
			if (errno == ERANGE && (real == HUGE_VAL || real == -HUGE_VAL)) return fail("number out of range");
			tok = JSONToken::makeFloat(real);
		}
		closed();
		return STATUS_OK;
	}
	return fail("invalid character");
}

Status JSONTokenizer::next(JSONToken& tok) {
	if (!err.empty()) return STATUS_SYNTAX_ERROR;
	for (;;) {
		skip();
		int c = now();
		switch (state) {
			case FIRST_MEMBER:
				if (expect('}')) {
					stack.pop_back();
					closed();
					tok = JSONToken(JSONToken::END_OBJECT);
					return STATUS_OK;
				}
				// fall through
			case MEMBER: {
				if (c == EOF) return fail("unexpected end of input");
				if (c != '"') return fail("expected string as object key");
				std::string key;
				if (!str(key)) return STATUS_SYNTAX_ERROR;
				tok = JSONToken::makeString(key);
				state = COLON;
				return STATUS_OK;
			}
			case COLON:
				if (!expect(':')) return fail("expected ':' after object key");
				skip();
				return value(tok);
			case AFTER_MEMBER:
				if (expect('}')) {
					stack.pop_back();
					closed();
					tok = JSONToken(JSONToken::END_OBJECT);
					return STATUS_OK;
				}
				if (!expect(',')) return fail("expected ',' or '}' after object member");
				state = MEMBER;
				break;
			case FIRST_ELEMENT:
				if (expect(']')) {
					stack.pop_back();
					closed();
					tok = JSONToken(JSONToken::END_ARRAY);
					return STATUS_OK;
				}
				return value(tok);
			case AFTER_ELEMENT:
				if (expect(']')) {
					stack.pop_back();
					closed();
					tok = JSONToken(JSONToken::END_ARRAY);
					return STATUS_OK;
				}
				if (!expect(',')) return fail("expected ',' or ']' after array element");
				state = VALUE;
				break;
			case VALUE:
				if (c == EOF && stack.empty()) return STATUS_EOF;
				return value(tok);
		}
	}
}

void JSONTokenizer::report(FILE* f) {
	fprintf(f, "Something went wrong in JSON tokenizing at byte %lu: %s\n", (unsigned long) i, err.c_str());
	int c = now();
	if (c == EOF) {
		fprintf(f, "%s >>> EOF <<<\n", seen.c_str());
	} else {
		fprintf(f, "%s >>> %c <<<\n", seen.c_str(), (char) c);
	}
}

// Shortest digits that read back as the same double, laid out without an exponent.
std::string formatFloat(double real) {
	if (std::isnan(real)) return "NaN";
	if (std::isinf(real)) return real > 0 ? "+Inf" : "-Inf";
	if (real == 0) return std::signbit(real) ? "-0" : "0";
	char buf[64];
	for (int prec = 1; prec <= 17; prec++) {
		snprintf(buf, sizeof(buf), "%.*e", prec - 1, real);
		if (strtod(buf, NULL) == real) break;
	}
	std::string sci(buf);
	bool neg = false;
	std::string digits;
	size_t k = 0;
	if (sci[k] == '-') {
		neg = true;
		k++;
	}
	for (; k < sci.size() && sci[k] != 'e'; k++) {
		if (sci[k] != '.') digits.push_back(sci[k]);
	}
	int exp = atoi(sci.c_str() + k + 1);
	while (digits.size() > 1 && digits[digits.size() - 1] == '0') digits.erase(digits.size() - 1);

	std::string ret;
	if (neg) ret.push_back('-');
	int point = exp + 1;
	if (point <= 0) {
		ret += "0.";
		ret.append((size_t) -point, '0');
		ret += digits;
	} else if ((size_t) point >= digits.size()) {
		ret += digits;
		ret.append((size_t) point - digits.size(), '0');
	} else {
		ret += digits.substr(0, point);
		ret.push_back('.');
		ret += digits.substr(point);
	}
	return ret;
}
