#include "ParserRegistry.hpp"
#include <algorithm>
#include <stdexcept>

namespace WebCrawl {

void ParserRegistry::SetParser(const std::string& host, std::shared_ptr<IPageParser> parser) {
    if (!parser) {
        exact_.erase(host);
        return;
    }
    exact_[host] = std::move(parser);
}

void ParserRegistry::AddRule(ParserRule rule) {
    if (rule.pattern.empty()) {
        throw std::invalid_argument("parser rule pattern is empty");
    }
    if (!rule.parser) {
        throw std::invalid_argument("parser rule has no parser: " + rule.pattern);
    }

    CompiledRule entry{std::move(rule), std::regex(), rules_.size()};
    try {
        if (entry.rule.type == MatchType::Regex) {
            entry.compiled = std::regex(entry.rule.pattern, std::regex::ECMAScript);
        } else if (entry.rule.type == MatchType::Glob) {
            entry.compiled = std::regex(GlobToRegex(entry.rule.pattern), std::regex::ECMAScript);
        }
    } catch (const std::regex_error& e) {
        throw std::invalid_argument("invalid parser rule pattern \"" + entry.rule.pattern + "\": " + e.what());
    }

    rules_.push_back(std::move(entry));
    std::stable_sort(rules_.begin(), rules_.end(), [](const CompiledRule& a, const CompiledRule& b) {
        if (a.rule.priority != b.rule.priority) return a.rule.priority > b.rule.priority;
        return a.order < b.order;
    });
}

void ParserRegistry::SetDefaultParser(std::shared_ptr<IPageParser> parser) {
    default_parser_ = std::move(parser);
}

std::shared_ptr<IPageParser> ParserRegistry::Find(const std::string& host) const {
    auto it = exact_.find(host);
    if (it != exact_.end()) {
        return it->second;
    }
    for (const auto& rule : rules_) {
        if (Matches(rule, host)) {
            return rule.rule.parser;
        }
    }
    return default_parser_;
}

bool ParserRegistry::Empty() const {
    return exact_.empty() && rules_.empty() && !default_parser_;
}

bool ParserRegistry::Matches(const CompiledRule& rule, const std::string& host) {
    const std::string& p = rule.rule.pattern;
    switch (rule.rule.type) {
        case MatchType::Exact:
            return host == p;
        case MatchType::Prefix:
            return host.size() >= p.size() && host.compare(0, p.size(), p) == 0;
        case MatchType::Suffix:
            return host.size() >= p.size() && host.compare(host.size() - p.size(), p.size(), p) == 0;
        case MatchType::Glob:
        case MatchType::Regex:
            return std::regex_search(host, rule.compiled);
    }
    return false;
}

std::string ParserRegistry::GlobToRegex(const std::string& glob) {
    static const std::string special = R"(\^$.|+()[]{}/)";
    std::string out = "^";
    for (char c : glob) {
        if (c == '*') {
            out += ".*";
        } else if (c == '?') {
            out += '.';
        } else {
            if (special.find(c) != std::string::npos) out += '\\';
            out += c;
        }
    }
    out += '$';
    return out;
}

}
