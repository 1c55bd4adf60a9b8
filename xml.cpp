#include "xml.hpp"
#include "glue.hpp"

XMLWriter::XMLWriter(std::ostream& out_, const std::string& sep_) : out(out_), sep(sep_) {}

Status XMLWriter::put(const XMLToken& tok) {
    switch (tok.kind) {
        case XMLToken::START_ELEMENT: {
            Glue tag(" ", "<", ">");
            tag << tok.name;
            if (tok.has_attr) tag << Glue::attribute("name", tok.attr);
            out << tag.str();
            open.push_back(tok.name);
            break;
        }
        case XMLToken::CHAR_DATA:
            out << Glue::escapeText(tok.data);
            break;
        case XMLToken::END_ELEMENT: {
            if (open.empty() || open.back() != tok.name) return STATUS_MISMATCHED_END;
            open.pop_back();
            Glue tag("", "</", ">");
            tag << tok.name;
            out << tag.str();
            if (open.empty()) out << sep;
            break;
        }
        default:
            return STATUS_UNKNOWN_TOKEN;
    }
    if (!out.good()) return STATUS_WRITE_ERROR;
    return STATUS_OK;
}

Status XMLWriter::flush() {
    out.flush();
    if (!out.good()) return STATUS_WRITE_ERROR;
    return STATUS_OK;
}

XMLTreeBuilder::XMLTreeBuilder(pugi::xml_node root_) : root(root_), node(root_) {}

Status XMLTreeBuilder::put(const XMLToken& tok) {
    switch (tok.kind) {
        case XMLToken::START_ELEMENT: {
            pugi::xml_node child = node.append_child(tok.name.c_str());
            if (!child) return STATUS_WRITE_ERROR;
            if (tok.has_attr) {
                if (!child.append_attribute("name").set_value(Glue::sanitize(tok.attr).c_str())) return STATUS_WRITE_ERROR;
            }
            node = child;
            return STATUS_OK;
        }
        case XMLToken::CHAR_DATA: {
            pugi::xml_node text = node.append_child(pugi::node_pcdata);
            if (!text || !text.set_value(Glue::sanitize(tok.data).c_str())) return STATUS_WRITE_ERROR;
            return STATUS_OK;
        }
        case XMLToken::END_ELEMENT:
            if (node == root || tok.name != node.name()) return STATUS_MISMATCHED_END;
            node = node.parent();
            return STATUS_OK;
        default:
            return STATUS_UNKNOWN_TOKEN;
    }
}
