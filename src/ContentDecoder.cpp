#include "tickhttp.hpp"

#include <libxml/parser.h>
#include <libxml/tree.h>
#include <libxml/xmlerror.h>

const XmlNode* XmlNode::find_child(const std::string& name) const {
    for (size_t i = 0; i < children_.size(); ++i) {
        if (children_[i].name_ == name) {
            return &children_[i];
        }
    }
    return NULL;
}

DecodedContent::DecodedContent() : data_type_(codes::DATA_TEXT) {}

void DecodedContent::clear() {
    data_type_ = codes::DATA_TEXT;
    text_.clear();
    json_ = nlohmann::json();
    xml_ = XmlNode();
    fragments_.clear();
}

ContentDecoder::ContentDecoder() { xmlInitParser(); }

ContentDecoder::~ContentDecoder() {}

std::string ContentDecoder::concat(const std::vector<std::string>& contents) {
    size_t total = 0;
    for (size_t i = 0; i < contents.size(); ++i) {
        total += contents[i].size();
    }

    std::string body;
    body.reserve(total);
    for (size_t i = 0; i < contents.size(); ++i) {
        body += contents[i];
    }
    return body;
}

bool ContentDecoder::decode(const std::vector<std::string>& contents,
                            codes::DataType data_type, DecodedContent& out,
                            std::string& error) const {
    out.clear();
    out.data_type_ = data_type;

    switch (data_type) {
        case codes::DATA_TEXT:
            out.text_ = concat(contents);
            return true;

        case codes::DATA_JSON:
            log(LOG_INFO, "Decoding JSON");
            return decode_json(concat(contents), out, error);

        case codes::DATA_XML:
            log(LOG_INFO, "Decoding XML");
            return decode_xml(concat(contents), out, error);

        case codes::DATA_LUA_TABLE:
            // Caller already understands the shape, hand the fragments over
            out.fragments_ = contents;
            return true;

        case codes::DATA_HTML:
            out.text_ = concat(contents);
            return true;

        case codes::DATA_OSC:
        case codes::DATA_LUA_SCRIPT:
            log(LOG_WARNING, "Data type %s is not decoded, passing through",
                data_type_name(data_type));
            out.fragments_ = contents;
            return true;
    }

    out.fragments_ = contents;
    return true;
}

bool ContentDecoder::decode_json(const std::string& body, DecodedContent& out,
                                 std::string& error) const {
    try {
        out.json_ = nlohmann::json::parse(body);
        return true;
    } catch (const nlohmann::json::exception& e) {
        error = e.what();
        log(LOG_ERROR, "Unable to decode: %s", error.c_str());
        out.json_ = nlohmann::json();
        out.text_ = body;
        return false;
    }
}

static std::string xml_string(const xmlChar* value) {
    if (value == NULL) {
        return "";
    }
    return std::string(reinterpret_cast<const char*>(value));
}

static void convert_xml_node(xmlDocPtr doc, xmlNodePtr node, XmlNode& out) {
    out.name_ = xml_string(node->name);

    for (xmlAttrPtr attr = node->properties; attr != NULL;
         attr = attr->next) {
        xmlChar* value = xmlNodeListGetString(doc, attr->children, 1);
        out.attributes_[xml_string(attr->name)] = xml_string(value);
        if (value != NULL) {
            xmlFree(value);
        }
    }

    for (xmlNodePtr child = node->children; child != NULL;
         child = child->next) {
        if (child->type == XML_ELEMENT_NODE) {
            out.children_.push_back(XmlNode());
            convert_xml_node(doc, child, out.children_.back());
        } else if (child->type == XML_TEXT_NODE ||
                   child->type == XML_CDATA_SECTION_NODE) {
            out.text_ += xml_string(child->content);
        }
    }

    out.text_ = trim(out.text_);
}

bool ContentDecoder::decode_xml(const std::string& body, DecodedContent& out,
                                std::string& error) const {
    xmlDocPtr doc =
        xmlReadMemory(body.data(), static_cast<int>(body.size()), NULL, NULL,
                      XML_PARSE_NONET | XML_PARSE_NOERROR |
                          XML_PARSE_NOWARNING | XML_PARSE_NOBLANKS);
    if (doc == NULL) {
        const xmlError* last = xmlGetLastError();
        error = last != NULL && last->message != NULL
                    ? trim(last->message)
                    : "malformed XML document";
        log(LOG_ERROR, "Unable to decode: %s", error.c_str());
        out.text_ = body;
        return false;
    }

    xmlNodePtr root = xmlDocGetRootElement(doc);
    if (root == NULL) {
        xmlFreeDoc(doc);
        error = "XML document has no root element";
        log(LOG_ERROR, "Unable to decode: %s", error.c_str());
        out.text_ = body;
        return false;
    }

    convert_xml_node(doc, root, out.xml_);
    xmlFreeDoc(doc);
    return true;
}
