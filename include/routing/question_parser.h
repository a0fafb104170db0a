// question_parser.h - normalization and parameter extraction for routing
#pragma once

#include <cstddef>
#include <initializer_list>
#include <string>

#include "routing/route.h"

namespace cqr {

// Longest question the matcher evaluates; longer input never matches a route.
constexpr std::size_t kMaxQuestionLength = 4096;

// Lower-case ASCII, replace everything except [a-z0-9-"] and whitespace with
// a space, collapse whitespace runs and trim.
std::string normalize_question(const std::string& question);

NormalizedQuestion make_normalized_question(const std::string& question);

// Substring containment of any of the terms.
bool mentions_any(const std::string& text, std::initializer_list<const char*> terms);

// "in the <ns> namespace", "from <ns> namespace", "namespace <ns>". Empty when absent.
std::string extract_namespace(const std::string& normalized);

// "last|past <n> hour(s)" clamped to >= 1, otherwise 1.
int extract_hours(const std::string& normalized);

// "logs from|for [the] [pod] <name>", "pod <name>". Empty when absent.
std::string extract_pod_name(const std::string& normalized);

// Quoted phrase of the raw question, then "search for", "find logs containing",
// "containing", "mentions" phrases, then the literal "timeout". Empty when absent.
std::string extract_search_query(const std::string& raw_question);

}  // namespace cqr
