#pragma once
#include <memory>
#include <string>
#include <vector>
#include <lexbor/html/html.h>
#include <lexbor/dom/dom.h>

namespace WebCrawl {
namespace HtmlUtil {

struct DocumentDeleter {
    void operator()(lxb_html_document_t* doc) const { lxb_html_document_destroy(doc); }
};
using DocumentPtr = std::unique_ptr<lxb_html_document_t, DocumentDeleter>;

// Returns nullptr when lexbor cannot create or parse the document.
DocumentPtr ParseDocument(const std::string& html);

std::string ToStdString(const lxb_char_t* lxb_str, size_t len);
std::string GetAttribute(lxb_dom_element_t* element, const char* key);
// Concatenated text of the element and its descendants.
std::string TextContent(lxb_dom_element_t* element);
std::vector<lxb_dom_element_t*> ElementsByTagName(lxb_dom_document_t* doc, lxb_dom_element_t* root, const char* tag);

void AsciiToLowerInplace(std::string& s);
// Trims and folds runs of whitespace into single spaces.
std::string CollapseWhitespace(const std::string& s);

}
}
