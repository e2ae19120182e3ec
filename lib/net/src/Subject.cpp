#include "hpl/net/Subject.hpp"

#include <cctype>

namespace HPL::Net {

std::vector<std::string> SplitSubject(const std::string& subject)
{
    std::vector<std::string> tokens;
    std::string::size_type start = 0;
    while (true) {
        auto dot = subject.find('.', start);
        if (dot == std::string::npos) {
            tokens.push_back(subject.substr(start));
            break;
        }
        tokens.push_back(subject.substr(start, dot - start));
        start = dot + 1;
    }
    return tokens;
}

bool IsValidSubject(const std::string& subject, bool allow_wildcards)
{
    if (subject.empty()) {
        return false;
    }

    auto tokens = SplitSubject(subject);
    for (size_t i = 0; i < tokens.size(); ++i) {
        const auto& token = tokens[i];
        if (token.empty()) {
            return false;
        }
        for (char c : token) {
            if (std::isspace(static_cast<unsigned char>(c))) {
                return false;
            }
        }

        bool has_wildcard_char =
            token.find('*') != std::string::npos || token.find('>') != std::string::npos;
        if (!has_wildcard_char) {
            continue;
        }
        if (!allow_wildcards) {
            return false;
        }
        if (token == "*") {
            continue;
        }
        // '>' must be the whole last token
        if (token == ">" && i + 1 == tokens.size()) {
            continue;
        }
        return false;
    }
    return true;
}

bool SubjectMatches(const std::string& pattern, const std::string& subject)
{
    auto pattern_tokens = SplitSubject(pattern);
    auto subject_tokens = SplitSubject(subject);

    for (size_t i = 0; i < pattern_tokens.size(); ++i) {
        const auto& token = pattern_tokens[i];
        if (token == ">") {
            // Needs at least one remaining token
            return subject_tokens.size() > i;
        }
        if (i >= subject_tokens.size()) {
            return false;
        }
        if (token != "*" && token != subject_tokens[i]) {
            return false;
        }
    }
    return pattern_tokens.size() == subject_tokens.size();
}

}  // namespace HPL::Net
