#include <stdlib.h>
#include <stdio.h>
#include <string.h>
#include <string>
#include <iostream>
#include <fstream>
#include "glue.hpp"
#include "pugixml.hpp"
#include "json_to_xml.hpp"

// Prints every token on stderr before handing it on.
class TraceSink : public XMLTokenSink {
    XMLTokenSink& sink;
public:
    TraceSink(XMLTokenSink& sink_) : sink(sink_) {}
    Status put(const XMLToken& tok) {
        Glue line(" ");
        line << "json2xml";
        switch (tok.kind) {
            case XMLToken::START_ELEMENT:
                line << "start" << Glue::colon() << tok.name;
                if (tok.has_attr) line << Glue::attribute("name", tok.attr);
                break;
            case XMLToken::CHAR_DATA:
                line << "data" << Glue::colon() << Glue::escapeText(tok.data);
                break;
            case XMLToken::END_ELEMENT:
                line << "end" << Glue::colon() << tok.name;
                break;
            default:
                line << "?";
        }
        fprintf(stderr, "%s\n", line.c_str());
        return sink.put(tok);
    }
};

static void usage(FILE* f, const char* prog) {
    fprintf(f, "Usage: %s [-t|--tree] [-f|--float] [file]\n", prog);
    fprintf(f, "    Converts JSON from file (or stdin) to XML on stdout.\n");
    fprintf(f, "    -t, --tree   build a pugixml document and print it indented\n");
    fprintf(f, "    -f, --float  read numbers as doubles instead of literals\n");
    fprintf(f, "Environment:\n");
    fprintf(f, "    JSON2XML_DEBUG   trace every XML token on stderr\n");
    fprintf(f, "    JSON2XML_ROOT    root element for --tree (default: json)\n");
    fprintf(f, "    JSON2XML_INDENT  indentation for --tree (default: two spaces)\n");
}

static Status run(JSONTokenSource& source, XMLTokenSink& sink, bool debug) {
    if (debug) {
        TraceSink trace(sink);
        return convert(source, trace);
    }
    return convert(source, sink);
}

int main (int argc, char *argv[]) {
    bool tree = false;
    bool use_number = true;
    const char* path = NULL;
    for (int i = 1; i < argc; i++) {
        if (strcmp(argv[i], "-t") == 0 || strcmp(argv[i], "--tree") == 0) {
            tree = true;
        } else if (strcmp(argv[i], "-f") == 0 || strcmp(argv[i], "--float") == 0) {
            use_number = false;
        } else if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            usage(stdout, argv[0]);
            return 0;
        } else if (argv[i][0] == '-' && argv[i][1] != '\0') {
            fprintf(stderr, "%s: unknown option %s\n", argv[0], argv[i]);
            usage(stderr, argv[0]);
            return 2;
        } else if (path == NULL) {
            path = argv[i];
        } else {
            fprintf(stderr, "%s: more than one input file\n", argv[0]);
            usage(stderr, argv[0]);
            return 2;
        }
    }

    bool debug = getenv("JSON2XML_DEBUG") != NULL;
    const char* root = getenv("JSON2XML_ROOT");
    if (root == NULL || root[0] == '\0') root = "json";
    const char* indent = getenv("JSON2XML_INDENT");
    if (indent == NULL) indent = "  ";

    std::ifstream file;
    std::istream* in = &std::cin;
    if (path != NULL && strcmp(path, "-") != 0) {
        file.open(path, std::ios::in | std::ios::binary);
        if (!file.is_open()) {
            fprintf(stderr, "%s: cannot open %s\n", argv[0], path);
            return 2;
        }
        in = &file;
    }

    JSONTokenizer tokenizer(*in, use_number);
    Status ret;
    if (tree) {
        pugi::xml_document doc;
        pugi::xml_node node = doc.append_child(root);
        XMLTreeBuilder builder(node);
        ret = run(tokenizer, builder, debug);
        if (ret == STATUS_OK) {
            node.print(std::cout, indent, pugi::format_indent | pugi::format_no_empty_element_tags);
            std::cout.flush();
            if (!std::cout.good()) ret = STATUS_WRITE_ERROR;
        }
    } else {
        XMLWriter writer(std::cout, "\n");
        ret = run(tokenizer, writer, debug);
        if (ret == STATUS_OK) ret = writer.flush();
    }

    if (ret == STATUS_OK) return 0;
    if (ret == STATUS_SYNTAX_ERROR) {
        tokenizer.report(stderr);
    } else {
        fprintf(stderr, "Something went wrong in JSON to XML convertion: %s (byte %lu)\n",
                statusString(ret), (unsigned long) tokenizer.offset());
    }
    if (ret == STATUS_WRITE_ERROR) return 2;
    return 1;
}
