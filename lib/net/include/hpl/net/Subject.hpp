/**
 * @file Subject.hpp
 * @brief Subject naming rules and wildcard matching
 *
 * Subjects are '.'-separated tokens. In subscriptions, '*' matches exactly
 * one token and '>' matches one or more trailing tokens.
 */

#pragma once

#include <string>
#include <vector>

namespace HPL::Net {

/**
 * @brief Split a subject into its '.'-separated tokens
 */
std::vector<std::string> SplitSubject(const std::string& subject);

/**
 * @brief Check a subject against the naming rules
 * @param subject Subject to check
 * @param allow_wildcards true for subscription patterns, false for publish
 * @return true if every token is non-empty and free of whitespace, and
 *         wildcards (when allowed) appear only as whole tokens with '>' last
 */
bool IsValidSubject(const std::string& subject, bool allow_wildcards);

/**
 * @brief Check whether a concrete subject matches a subscription pattern
 */
bool SubjectMatches(const std::string& pattern, const std::string& subject);

}  // namespace HPL::Net
