#ifndef CONTENTDECODER_HPP
#define CONTENTDECODER_HPP

#include <nlohmann/json.hpp>

#include "tickhttp.hpp"

// Element tree produced by the XML decoder.
struct XmlNode {
    std::string name_;
    std::map<std::string, std::string> attributes_;
    std::string text_;  // Concatenated direct text and CDATA content
    std::vector<XmlNode> children_;

    // First direct child with the given name, NULL if there is none
    const XmlNode* find_child(const std::string& name) const;
};

// Decoded response body. Which member is populated depends on data_type_:
// TEXT and HTML fill text_, JSON fills json_, XML fills xml_, and the
// passthrough types (LUA_TABLE, OSC, LUA_SCRIPT) keep the raw fragments.
struct DecodedContent {
    codes::DataType data_type_;
    std::string text_;
    nlohmann::json json_;
    XmlNode xml_;
    std::vector<std::string> fragments_;

    DecodedContent();

    void clear();
};

// Converts the received body fragments according to the configured data
// type.
class ContentDecoder {
   public:
    ContentDecoder();
    ~ContentDecoder();

    // Returns false and sets error when the body cannot be parsed. On
    // failure out holds the concatenated raw body as text_.
    bool decode(const std::vector<std::string>& contents,
                codes::DataType data_type, DecodedContent& out,
                std::string& error) const;

    static std::string concat(const std::vector<std::string>& contents);

   private:
    bool decode_json(const std::string& body, DecodedContent& out,
                     std::string& error) const;
    bool decode_xml(const std::string& body, DecodedContent& out,
                    std::string& error) const;

    // Prevent copying
    ContentDecoder(const ContentDecoder&);
    ContentDecoder& operator=(const ContentDecoder&);

};  // class ContentDecoder

#endif  // CONTENTDECODER_HPP
