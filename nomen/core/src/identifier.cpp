#include "nomen/core/identifier.hpp"

#include "nomen/core/unicode.hpp"

#include <algorithm>
#include <array>
#include <charconv>
#include <utility>
#include <vector>

namespace nomen {

namespace {

constexpr std::array<std::pair<char32_t, std::string_view>, 32> special_tokens{{
    {U' ', "space"},   {U'!', "excl"},   {U'"', "quot"},   {U'#', "num"},
    {U'$', "dollar"},  {U'%', "percnt"}, {U'&', "amp"},    {U'\'', "apos"},
    {U'(', "lpar"},    {U')', "rpar"},   {U'*', "ast"},    {U'+', "plus"},
    {U',', "comma"},   {U'-', "hyphen"}, {U'.', "period"}, {U'/', "sol"},
    {U':', "colon"},   {U';', "semi"},   {U'<', "lt"},     {U'=', "equals"},
    {U'>', "gt"},      {U'?', "quest"},  {U'@', "commat"}, {U'[', "lsqb"},
    {U'\\', "bsol"},   {U']', "rsqb"},   {U'^', "hat"},    {U'`', "grave"},
    {U'{', "lcub"},    {U'|', "verbar"}, {U'}', "rcub"},   {U'~', "tilde"},
}};

constexpr std::array<std::string_view, 93> cpp_keywords{
    "alignas",      "alignof",     "and",          "and_eq",
    "asm",          "auto",        "bitand",       "bitor",
    "bool",         "break",       "case",         "catch",
    "char",         "char8_t",     "char16_t",     "char32_t",
    "class",        "compl",       "concept",      "const",
    "consteval",    "constexpr",   "constinit",    "const_cast",
    "continue",     "co_await",    "co_return",    "co_yield",
    "decltype",     "default",     "delete",       "do",
    "double",       "dynamic_cast", "else",        "enum",
    "explicit",     "export",      "extern",       "false",
    "float",        "for",         "friend",       "goto",
    "if",           "inline",      "int",          "long",
    "mutable",      "namespace",   "new",          "noexcept",
    "not",          "not_eq",      "nullptr",      "operator",
    "or",           "or_eq",       "private",      "protected",
    "public",       "register",    "reinterpret_cast", "requires",
    "return",       "short",       "signed",       "sizeof",
    "static",       "static_assert", "static_cast", "struct",
    "switch",       "template",    "this",         "thread_local",
    "throw",        "true",        "try",          "typedef",
    "typeid",       "typename",    "union",        "unsigned",
    "using",        "virtual",     "void",         "volatile",
    "wchar_t",      "while",       "xor",          "xor_eq",
    "NULL",
};

std::string_view special_token(char32_t cp) noexcept {
    for (const auto& [ch, token] : special_tokens) {
        if (ch == cp) {
            return token;
        }
    }
    return {};
}

void append_hex(std::string& out, char32_t cp) {
    std::array<char, 8> buf{};
    auto [end, ec] = std::to_chars(buf.data(), buf.data() + buf.size(),
                                   static_cast<uint32_t>(cp), 16);
    for (const char* p = buf.data(); p != end; ++p) {
        char c = *p;
        out.push_back(c >= 'a' && c <= 'f' ? static_cast<char>(c - 'a' + 'A') : c);
    }
}

// Word separators understood by the idiomatic strategy. Braces split words but never
// contribute characters.
constexpr bool is_separator(char32_t cp) noexcept {
    switch (cp) {
    case U'.':
    case U'-':
    case U'_':
    case U' ':
    case U'/':
    case U'{':
    case U'}':
    case U'+':
        return true;
    default:
        return false;
    }
}

bool all_digits(std::u32string_view word) noexcept {
    return !word.empty() && std::all_of(word.begin(), word.end(), unicode::is_digit);
}

// Lowers a leading run of capitals. A run longer than one keeps its last capital when that
// capital begins a lower-case word: "HTTPProxy" -> "httpProxy", "URL2" -> "url2".
void soften_leading_capitals(std::u32string& word) {
    size_t run = 0;
    while (run < word.size() && unicode::is_upper(word[run])) {
        ++run;
    }
    if (run == 0) {
        return;
    }
    size_t count = run;
    if (run >= 2 && run < word.size() && unicode::is_lower(word[run])) {
        count = run - 1;
    }
    for (size_t i = 0; i < count; ++i) {
        word[i] = unicode::to_lower(word[i]);
    }
}

std::string escape_keyword(std::string name) {
    if (is_cpp_keyword(name)) {
        name.insert(name.begin(), '_');
    }
    return name;
}

} // namespace

std::string defensive_name(std::string_view raw) {
    if (raw.empty()) {
        return "_empty";
    }

    auto cps = unicode::decode_utf8(raw);
    std::string out;
    out.reserve(raw.size() + 8);

    bool first = true;
    bool after_token = false;
    for (char32_t cp : cps) {
        if (unicode::is_letter(cp) || cp == U'_') {
            unicode::append_utf8(out, cp);
            after_token = false;
        } else if (unicode::is_digit(cp)) {
            if (first) {
                out.push_back('_');
            }
            out.push_back(static_cast<char>(cp));
            after_token = false;
        } else {
            // Adjacent tokens share one underscore: "a  b" -> "a_space_space_b", never "__".
            if (!after_token) {
                out.push_back('_');
            }
            auto token = special_token(cp);
            if (!token.empty()) {
                out.append(token);
            } else {
                out.push_back('x');
                append_hex(out, cp);
            }
            out.push_back('_');
            after_token = true;
        }
        first = false;
    }

    if (out == "_") {
        return "_underscore_";
    }
    return escape_keyword(std::move(out));
}

std::string idiomatic_name(std::string_view raw, identifier_role role) {
    auto cps = unicode::decode_utf8(raw);
    if (cps.empty()) {
        return defensive_name(raw);
    }
    for (char32_t cp : cps) {
        if (!unicode::is_letter(cp) && !unicode::is_digit(cp) && !is_separator(cp)) {
            return defensive_name(raw);
        }
    }

    size_t prefix = 0;
    while (prefix < cps.size() && cps[prefix] == U'_') {
        ++prefix;
    }
    std::u32string body = cps.substr(prefix);

    // SHOUTED_NAMES are title-cased through the word capitalization below.
    bool has_letter = false;
    bool has_lower = false;
    for (char32_t cp : body) {
        has_letter = has_letter || unicode::is_letter(cp);
        has_lower = has_lower || unicode::is_lower(cp);
    }
    if (has_letter && !has_lower) {
        for (auto& cp : body) {
            cp = unicode::to_lower(cp);
        }
    }

    std::vector<std::u32string> words;
    std::u32string current;
    for (char32_t cp : body) {
        if (is_separator(cp)) {
            if (!current.empty()) {
                words.push_back(std::move(current));
                current.clear();
            }
            continue;
        }
        current.push_back(cp);
    }
    if (!current.empty()) {
        words.push_back(std::move(current));
    }

    std::u32string joined;
    for (size_t i = 0; i < words.size(); ++i) {
        auto& word = words[i];
        // "2.0" must not collapse into "20".
        if (i > 0 && all_digits(words[i - 1]) && all_digits(word)) {
            joined.push_back(U'_');
        }
        word.front() = unicode::to_upper(word.front());
        joined += word;
    }
    if (joined.empty()) {
        return defensive_name(raw);
    }

    if (!is_capitalized(role)) {
        soften_leading_capitals(joined);
    }

    std::u32string result(prefix, U'_');
    result += joined;
    if (unicode::is_digit(result.front())) {
        result.insert(result.begin(), U'_');
    }
    return escape_keyword(unicode::encode_utf8(result));
}

std::string project(std::string_view raw, identifier_role role, const naming_config& config) {
    if (auto it = config.overrides.find(raw); it != config.overrides.end()) {
        return it->second;
    }
    switch (config.strategy) {
    case naming_strategy::idiomatic:
        return idiomatic_name(raw, role);
    case naming_strategy::defensive:
    default:
        return defensive_name(raw);
    }
}

std::string normalize_media_type(std::string_view media_type) {
    auto semicolon_pos = media_type.find(';');
    if (semicolon_pos != std::string_view::npos) {
        media_type = media_type.substr(0, semicolon_pos);
    }
    while (!media_type.empty() && (media_type.front() == ' ' || media_type.front() == '\t')) {
        media_type.remove_prefix(1);
    }
    while (!media_type.empty() && (media_type.back() == ' ' || media_type.back() == '\t')) {
        media_type.remove_suffix(1);
    }

    std::string out(media_type);
    for (auto& c : out) {
        if (c >= 'A' && c <= 'Z') {
            c = static_cast<char>(c - 'A' + 'a');
        }
    }
    return out;
}

std::string project_content_type(std::string_view media_type, const naming_config& config) {
    if (auto it = config.overrides.find(media_type); it != config.overrides.end()) {
        return it->second;
    }
    return project(normalize_media_type(media_type), identifier_role::content_type_token, config);
}

bool is_cpp_keyword(std::string_view name) noexcept {
    return std::find(cpp_keywords.begin(), cpp_keywords.end(), name) != cpp_keywords.end();
}

bool is_valid_identifier(std::string_view name) {
    if (name.empty() || is_cpp_keyword(name)) {
        return false;
    }
    auto cps = unicode::decode_utf8(name);
    if (!unicode::is_letter(cps.front()) && cps.front() != U'_') {
        return false;
    }
    return std::all_of(cps.begin(), cps.end(), [](char32_t cp) {
        return unicode::is_letter(cp) || unicode::is_digit(cp) || cp == U'_';
    });
}

} // namespace nomen
