/**
 * @file task.cpp
 */
#include "tddbatch/common/task.hpp"

#include <cctype>

namespace tddbatch
{

const char* to_string(TddPhase phase) noexcept
{
    switch (phase)
    {
        case TddPhase::None:
            return "none";
        case TddPhase::FailingTest:
            return "failing-test";
        case TddPhase::MakePass:
            return "make-pass";
        case TddPhase::Cleanup:
            return "cleanup";
    }
    return "unknown";
}

const char* to_string(DomainTag domain) noexcept
{
    switch (domain)
    {
        case DomainTag::Backend:
            return "backend";
        case DomainTag::Frontend:
            return "frontend";
        case DomainTag::Database:
            return "database";
        case DomainTag::Test:
            return "test";
        case DomainTag::General:
            return "general";
    }
    return "unknown";
}

const char* to_string(RefOrigin origin) noexcept
{
    switch (origin)
    {
        case RefOrigin::None:
            return "none";
        case RefOrigin::Explicit:
            return "explicit";
        case RefOrigin::Inferred:
            return "inferred";
    }
    return "unknown";
}

std::optional<DomainTag> domain_from_string(const std::string& name)
{
    std::string lowered;
    lowered.reserve(name.size());
    for (char c : name)
    {
        lowered.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }

    for (DomainTag domain : {DomainTag::Backend,
                             DomainTag::Frontend,
                             DomainTag::Database,
                             DomainTag::Test,
                             DomainTag::General})
    {
        if (lowered == to_string(domain))
        {
            return domain;
        }
    }
    return std::nullopt;
}

std::string join_ids(const std::vector<TaskId>& ids, const std::string& separator)
{
    std::string result;
    for (size_t i = 0; i < ids.size(); ++i)
    {
        if (i > 0)
        {
            result += separator;
        }
        result += ids[i];
    }
    return result;
}

} // namespace tddbatch
