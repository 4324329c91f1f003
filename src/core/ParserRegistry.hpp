#pragma once
#include <memory>
#include <regex>
#include <string>
#include <unordered_map>
#include <vector>
#include "../interfaces/IPageParser.hpp"

namespace WebCrawl {

    enum class MatchType {
        Exact,  // "example.com"
        Prefix, // "blog."
        Suffix, // ".example.com"
        Glob,   // "*.example.com", '?' matches one character
        Regex   // ECMAScript, matched against the whole host
    };

    struct ParserRule {
        std::string pattern;
        MatchType type = MatchType::Exact;
        std::shared_ptr<IPageParser> parser;
        int priority = 0; // higher is evaluated first
    };

    // Selects the parser for a page host. Lookup order: exact host map, then
    // rules by descending priority (ties keep insertion order), then the
    // default parser. Configure before a crawl starts; lookups are read-only.
    class ParserRegistry {
    public:
        void SetParser(const std::string& host, std::shared_ptr<IPageParser> parser);
        // Throws std::invalid_argument for an empty pattern, a null parser or
        // a pattern that does not compile.
        void AddRule(ParserRule rule);
        void SetDefaultParser(std::shared_ptr<IPageParser> parser);

        std::shared_ptr<IPageParser> Find(const std::string& host) const;
        bool Empty() const;

        static std::string GlobToRegex(const std::string& glob);

    private:
        struct CompiledRule {
            ParserRule rule;
            std::regex compiled;
            size_t order;
        };

        static bool Matches(const CompiledRule& rule, const std::string& host);

        std::unordered_map<std::string, std::shared_ptr<IPageParser>> exact_;
        std::vector<CompiledRule> rules_;
        std::shared_ptr<IPageParser> default_parser_;
    };
}
