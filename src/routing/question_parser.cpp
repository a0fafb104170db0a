#include "routing/question_parser.h"

#include <algorithm>
#include <cctype>
#include <climits>
#include <stdexcept>
#include <string>
#include <vector>

namespace cqr {

namespace {

bool is_kept_char(unsigned char c) {
    return (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '-' || c == '"';
}

std::string to_lower_ascii(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

std::string trim(const std::string& s) {
    auto a = s.find_first_not_of(" \t\r\n\f\v");
    auto b = s.find_last_not_of(" \t\r\n\f\v");
    if (a == std::string::npos) return "";
    return s.substr(a, b - a + 1);
}

using CharClass = bool (*)(unsigned char);

bool is_name_char(unsigned char c) {
    return (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '-';
}

bool is_pod_char(unsigned char c) { return is_name_char(c) || c == '*'; }

bool is_phrase_char(unsigned char c) {
    return is_name_char(c) || c == ' ' || c == '_' || c == '.';
}

bool is_digit(unsigned char c) { return c >= '0' && c <= '9'; }

bool is_unquoted(unsigned char c) { return c != '"'; }

bool starts_at(const std::string& text, size_t pos, const char* literal) {
    return text.compare(pos, std::char_traits<char>::length(literal), literal) == 0;
}

size_t run_length(const std::string& text, size_t pos, CharClass cls) {
    size_t end = pos;
    while (end < text.size() && cls(static_cast<unsigned char>(text[end]))) ++end;
    return end - pos;
}

// Leftmost occurrence of: one of `leads`, then the `optional` words (each
// taken when present, greedy first), then a non-empty run of `cls` chars
// followed by `tail`. Returns the run, or "" when nothing matches.
std::string scan_capture(const std::string& text,
                         std::initializer_list<const char*> leads,
                         std::initializer_list<const char*> optional,
                         CharClass cls,
                         const char* tail = "") {
    const std::vector<const char*> words(optional);
    const unsigned combos = 1u << words.size();
    for (size_t i = 0; i < text.size(); ++i) {
        for (const char* lead : leads) {
            if (!starts_at(text, i, lead)) continue;
            const size_t after_lead = i + std::char_traits<char>::length(lead);
            for (unsigned mask = combos; mask-- > 0;) {
                size_t pos = after_lead;
                bool ok = true;
                for (size_t w = 0; w < words.size() && ok; ++w) {
                    if (!(mask & (1u << (words.size() - 1 - w)))) continue;
                    ok = starts_at(text, pos, words[w]);
                    if (ok) pos += std::char_traits<char>::length(words[w]);
                }
                if (!ok) continue;
                const size_t len = run_length(text, pos, cls);
                if (len > 0 && starts_at(text, pos + len, tail)) {
                    return text.substr(pos, len);
                }
            }
        }
    }
    return "";
}

}  // namespace

std::string normalize_question(const std::string& question) {
    std::string out;
    out.reserve(question.size());
    bool pending_space = false;
    for (unsigned char c : to_lower_ascii(question)) {
        if (is_kept_char(c)) {
            if (pending_space && !out.empty()) out.push_back(' ');
            pending_space = false;
            out.push_back(static_cast<char>(c));
        } else {
            pending_space = true;
        }
    }
    return out;
}

NormalizedQuestion make_normalized_question(const std::string& question) {
    return NormalizedQuestion{question, normalize_question(question)};
}

bool mentions_any(const std::string& text, std::initializer_list<const char*> terms) {
    return std::any_of(terms.begin(), terms.end(),
                       [&](const char* term) { return text.find(term) != std::string::npos; });
}

std::string extract_namespace(const std::string& normalized) {
    std::string name = scan_capture(normalized, {"in ", "from "}, {"the "}, &is_name_char, " namespace");
    if (name.empty()) {
        name = scan_capture(normalized, {"namespace "}, {}, &is_name_char);
    }
    return name;
}

int extract_hours(const std::string& normalized) {
    const std::string digits = scan_capture(normalized, {"last ", "past "}, {}, &is_digit, " hour");
    if (digits.empty()) {
        return 1;
    }
    try {
        return std::max(1, std::stoi(digits));
    } catch (const std::out_of_range&) {
        return INT_MAX;
    }
}

std::string extract_pod_name(const std::string& normalized) {
    for (const char* lead : {"logs from ", "logs for "}) {
        std::string pod = scan_capture(normalized, {lead}, {"the ", "pod "}, &is_pod_char);
        if (!pod.empty()) return pod;
    }
    return scan_capture(normalized, {"pod "}, {}, &is_pod_char);
}

std::string extract_search_query(const std::string& raw_question) {
    std::string quoted = scan_capture(raw_question, {"\""}, {}, &is_unquoted, "\"");
    if (!quoted.empty()) {
        return quoted;
    }

    const std::string lowered = to_lower_ascii(raw_question);
    for (const char* lead : {"search for ", "find logs containing ", "containing ", "mentions "}) {
        std::string phrase = trim(scan_capture(lowered, {lead}, {}, &is_phrase_char));
        if (!phrase.empty()) return phrase;
    }
    if (lowered.find("timeout") != std::string::npos) {
        return "timeout";
    }
    return "";
}

}  // namespace cqr
