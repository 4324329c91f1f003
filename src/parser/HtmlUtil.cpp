#include "HtmlUtil.hpp"
#include <algorithm>
#include <cstring>

namespace WebCrawl {
namespace HtmlUtil {

DocumentPtr ParseDocument(const std::string& html) {
    DocumentPtr document(lxb_html_document_create());
    if (!document) return nullptr;

    lxb_status_t status = lxb_html_document_parse(document.get(),
        reinterpret_cast<const lxb_char_t*>(html.c_str()),
        html.length());

    if (status != LXB_STATUS_OK) {
        return nullptr;
    }
    return document;
}

std::string ToStdString(const lxb_char_t* lxb_str, size_t len) {
    if (lxb_str && len > 0) {
        return std::string(reinterpret_cast<const char*>(lxb_str), len);
    }
    return "";
}

std::string GetAttribute(lxb_dom_element_t* element, const char* key) {
    size_t len = 0;
    const lxb_char_t* value = lxb_dom_element_get_attribute(element, reinterpret_cast<const lxb_char_t*>(key), strlen(key), &len);
    return ToStdString(value, len);
}

std::string TextContent(lxb_dom_element_t* element) {
    lxb_dom_node_t* node = lxb_dom_interface_node(element);
    size_t len = 0;
    lxb_char_t* text = lxb_dom_node_text_content(node, &len);
    if (text == nullptr) return "";
    std::string out = ToStdString(text, len);
    lxb_dom_document_destroy_text(node->owner_document, text);
    return out;
}

std::vector<lxb_dom_element_t*> ElementsByTagName(lxb_dom_document_t* doc, lxb_dom_element_t* root, const char* tag) {
    std::vector<lxb_dom_element_t*> out;
    if (doc == nullptr || root == nullptr) return out;

    lxb_dom_collection_t* col = lxb_dom_collection_make(doc, 32);
    if (col == nullptr) return out;

    lxb_status_t status = lxb_dom_elements_by_tag_name(root, col,
        reinterpret_cast<const lxb_char_t*>(tag), strlen(tag));
    if (status == LXB_STATUS_OK) {
        const size_t count = lxb_dom_collection_length(col);
        out.reserve(count);
        for (size_t i = 0; i < count; ++i) {
            if (lxb_dom_element_t* el = lxb_dom_collection_element(col, i)) {
                out.push_back(el);
            }
        }
    }
    lxb_dom_collection_destroy(col, true);
    return out;
}

void AsciiToLowerInplace(std::string& s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){
        return (c >= 'A' && c <= 'Z') ? static_cast<char>(c + 32) : static_cast<char>(c);
    });
}

std::string CollapseWhitespace(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    bool pending_space = false;
    for (unsigned char c : s) {
        if (c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v') {
            pending_space = !out.empty();
            continue;
        }
        if (pending_space) {
            out.push_back(' ');
            pending_space = false;
        }
        out.push_back(static_cast<char>(c));
    }
    return out;
}

}
}
