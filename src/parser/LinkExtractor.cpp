#include "LinkExtractor.hpp"
#include "HtmlUtil.hpp"

namespace WebCrawl {

std::vector<Link> LinkExtractor::Extract(const std::string& html_content) {
    std::vector<Link> links;
    if (html_content.empty()) return links;

    HtmlUtil::DocumentPtr document = HtmlUtil::ParseDocument(html_content);
    if (!document) return links;

    lxb_dom_document_t* dom_doc = lxb_html_document_original_ref(document.get());
    lxb_dom_element_t* root = lxb_dom_document_element(dom_doc);

    for (lxb_dom_element_t* el : HtmlUtil::ElementsByTagName(dom_doc, root, "a")) {
        std::string href = HtmlUtil::GetAttribute(el, "href");
        if (href.empty()) continue;
        links.push_back({href, HtmlUtil::CollapseWhitespace(HtmlUtil::TextContent(el))});
    }
    return links;
}

}
