#include "MetadataParser.hpp"
#include "HtmlUtil.hpp"
#include <lexbor/html/html.h>
#include <lexbor/dom/dom.h>
#include <optional>
#include <string>

namespace WebCrawl {

std::optional<Metadata> MetadataParser::Parse(const std::string& html_content) {
    HtmlUtil::DocumentPtr document = HtmlUtil::ParseDocument(html_content);
    if (!document) return std::nullopt;

    Metadata meta;
    // 1) title: use lexbor API for robustness
    {
        size_t tlen = 0;
        const lxb_char_t* t = lxb_html_document_title(document.get(), &tlen);
        if (t && tlen > 0) {
            meta.title = HtmlUtil::CollapseWhitespace(HtmlUtil::ToStdString(t, tlen));
        }
    }

    lxb_dom_document_t* dom_doc = lxb_html_document_original_ref(document.get());

    // 2) language from <html lang>
    if (lxb_dom_element_t* root = lxb_dom_document_element(dom_doc)) {
        meta.language = HtmlUtil::GetAttribute(root, "lang");
    }

    auto* head_el = lxb_html_document_head_element(document.get());
    if (head_el == nullptr) {
        if (!meta.title.empty()) return meta;
        return std::nullopt;
    }
    lxb_dom_element_t* head = lxb_dom_interface_element(head_el);

    // 3) meta tags in the head element
    for (lxb_dom_element_t* el : HtmlUtil::ElementsByTagName(dom_doc, head, "meta")) {
        std::string prop = HtmlUtil::GetAttribute(el, "property");
        if (prop.empty()) prop = HtmlUtil::GetAttribute(el, "name");
        std::string content = HtmlUtil::GetAttribute(el, "content");

        if (prop.empty() || content.empty()) continue;
        HtmlUtil::AsciiToLowerInplace(prop);

        if (prop == "og:title" && meta.title.empty()) meta.title = content;
        else if (prop == "og:description" && meta.description.empty()) meta.description = content;
        else if ((prop == "og:image" || prop == "og:image:url" || prop == "og:image:secure_url") && meta.image_url.empty()) meta.image_url = content;
        else if (prop == "og:site_name" && meta.site_name.empty()) meta.site_name = content;
        else if (prop == "og:url" && meta.canonical_url.empty()) meta.canonical_url = content;
        else if (prop == "twitter:title" && meta.title.empty()) meta.title = content;
        else if (prop == "twitter:description" && meta.description.empty()) meta.description = content;
        else if ((prop == "twitter:image" || prop == "twitter:image:src") && meta.image_url.empty()) meta.image_url = content;
        else if (prop == "description" && meta.description.empty()) meta.description = content;
    }

    // 4) <link rel="canonical"> wins over og:url
    for (lxb_dom_element_t* el : HtmlUtil::ElementsByTagName(dom_doc, head, "link")) {
        std::string rel = HtmlUtil::GetAttribute(el, "rel");
        HtmlUtil::AsciiToLowerInplace(rel);
        if (rel != "canonical") continue;
        std::string href = HtmlUtil::GetAttribute(el, "href");
        if (!href.empty()) {
            meta.canonical_url = href;
            break;
        }
    }

    if (!meta.title.empty() || !meta.description.empty() || !meta.image_url.empty() || !meta.site_name.empty()) {
        return meta;
    }

    return std::nullopt;
}

}
