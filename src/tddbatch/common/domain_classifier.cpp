/**
 * @file domain_classifier.cpp
 */
#include "tddbatch/common/domain_classifier.hpp"

#include <cctype>

namespace tddbatch
{

namespace
{

std::string to_lower(const std::string& text)
{
    std::string result;
    result.reserve(text.size());
    for (char c : text)
    {
        result.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    return result;
}

bool is_word_char(char c)
{
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

} // namespace

KeywordDomainClassifier::KeywordDomainClassifier()
    : m_keywords{default_keywords()}
{
}

KeywordDomainClassifier::KeywordDomainClassifier(DomainKeywordMap keywords)
    : m_keywords{}
{
    for (auto& [domain, list] : keywords)
    {
        set_keywords(domain, std::move(list));
    }
}

DomainKeywordMap KeywordDomainClassifier::default_keywords()
{
    return DomainKeywordMap{
        {DomainTag::Backend,
         {"api", "endpoint", "service", "route", "router", "server", "handler",
          "controller", "backend", "middleware", "repository"}},
        {DomainTag::Frontend,
         {"ui", "component", "page", "frontend", "react", "css", "button",
          "layout", "dashboard", "view", ".tsx", ".jsx"}},
        {DomainTag::Database,
         {"database", "db", "migration", "schema", "table", "sql", "alembic",
          "index", "column", "orm"}},
        {DomainTag::Test,
         {"test", "tests", "pytest", "fixture", "fixtures", "e2e", "coverage",
          "mock", "spec"}},
    };
}

void KeywordDomainClassifier::set_keywords(DomainTag domain, std::vector<std::string> keywords)
{
    for (auto& keyword : keywords)
    {
        keyword = to_lower(keyword);
    }
    keywords.erase(
        std::remove_if(keywords.begin(), keywords.end(),
                       [](const std::string& k) { return k.empty(); }),
        keywords.end());
    m_keywords[domain] = std::move(keywords);
}

DomainTag KeywordDomainClassifier::classify(const std::string& description) const
{
    const std::string text = to_lower(description);

    std::optional<DomainTag> matched;
    for (const auto& [domain, list] : m_keywords)
    {
        if (domain == DomainTag::General)
        {
            continue;
        }
        bool hit = std::any_of(list.begin(), list.end(),
                               [&text](const std::string& k) { return contains_keyword(text, k); });
        if (!hit)
        {
            continue;
        }
        if (matched.has_value())
        {
            // Several keyword sets matched.
            return DomainTag::General;
        }
        matched = domain;
    }
    return matched.value_or(DomainTag::General);
}

bool KeywordDomainClassifier::contains_keyword(const std::string& text, const std::string& keyword)
{
    const bool check_front = is_word_char(keyword.front());
    const bool check_back = is_word_char(keyword.back());

    size_t pos = text.find(keyword);
    while (pos != std::string::npos)
    {
        const size_t end = pos + keyword.size();
        bool front_ok = !check_front || pos == 0 || !is_word_char(text[pos - 1]);
        bool back_ok = !check_back || end == text.size() || !is_word_char(text[end]);
        if (front_ok && back_ok)
        {
            return true;
        }
        pos = text.find(keyword, pos + 1);
    }
    return false;
}

} // namespace tddbatch
