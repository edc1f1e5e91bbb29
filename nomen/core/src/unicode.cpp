#include "nomen/core/unicode.hpp"

#include <algorithm>
#include <array>

namespace nomen::unicode {

namespace {

struct code_range {
    char32_t first;
    char32_t last;
};

// Sorted, non-overlapping. Only characters that are stable under NFC, since C++ identifiers
// must be in normalization form C; compatibility ideographs are left out.
constexpr std::array<code_range, 34> letter_ranges{{
    {0x0041, 0x005A}, {0x0061, 0x007A}, {0x00AA, 0x00AA}, {0x00B5, 0x00B5}, {0x00BA, 0x00BA},
    {0x00C0, 0x00D6}, {0x00D8, 0x00F6}, {0x00F8, 0x02AF}, // Latin-1, Latin Extended-A/B, IPA
    {0x0370, 0x0373}, {0x0376, 0x0377}, {0x037B, 0x037D}, {0x037F, 0x037F},
    {0x0386, 0x0386}, {0x0388, 0x038A}, {0x038C, 0x038C}, {0x038E, 0x03A1},
    {0x03A3, 0x03F5}, {0x03F7, 0x0481}, {0x048A, 0x052F}, // Greek, Cyrillic
    {0x0531, 0x0556}, {0x0561, 0x0587},                   // Armenian
    {0x05D0, 0x05EA},                                     // Hebrew
    {0x0620, 0x064A},                                     // Arabic
    {0x0904, 0x0939},                                     // Devanagari
    {0x1E00, 0x1EFF},                                     // Latin Extended Additional
    {0x3041, 0x3096}, {0x30A1, 0x30FA},                   // Hiragana, Katakana
    {0x3400, 0x4DBF}, {0x4E00, 0x9FFF},                   // CJK
    {0xAC00, 0xD7A3},                                     // Hangul syllables
    {0xFB00, 0xFB06}, {0xFF21, 0xFF3A}, {0xFF41, 0xFF5A},
    {0x20000, 0x2A6DF},
}};

bool in_ranges(char32_t cp) noexcept {
    auto it = std::upper_bound(letter_ranges.begin(),
                               letter_ranges.end(),
                               cp,
                               [](char32_t value, const code_range& r) { return value < r.first; });
    if (it == letter_ranges.begin()) {
        return false;
    }
    --it;
    return cp <= it->last;
}

bool is_latin_ext_a_upper(char32_t cp) noexcept {
    if (cp >= 0x0100 && cp <= 0x0137) {
        return cp % 2 == 0;
    }
    if (cp >= 0x0139 && cp <= 0x0148) {
        return cp % 2 == 1;
    }
    if (cp >= 0x014A && cp <= 0x0177) {
        return cp % 2 == 0;
    }
    if (cp == 0x0178) {
        return true;
    }
    if (cp >= 0x0179 && cp <= 0x017E) {
        return cp % 2 == 1;
    }
    return false;
}

bool is_greek_upper(char32_t cp) noexcept {
    return cp == 0x0386 || (cp >= 0x0388 && cp <= 0x038A) || cp == 0x038C ||
           cp == 0x038E || cp == 0x038F || (cp >= 0x0391 && cp <= 0x03A1) ||
           (cp >= 0x03A3 && cp <= 0x03AB);
}

bool is_greek_lower(char32_t cp) noexcept {
    return (cp >= 0x03AC && cp <= 0x03CE) || cp == 0x0390;
}

} // namespace

std::u32string decode_utf8(std::string_view text) {
    std::u32string out;
    out.reserve(text.size());

    size_t i = 0;
    while (i < text.size()) {
        auto lead = static_cast<unsigned char>(text[i]);
        if (lead < 0x80) {
            out.push_back(static_cast<char32_t>(lead));
            ++i;
            continue;
        }

        size_t length = 0;
        char32_t cp = 0;
        char32_t min_value = 0;
        if ((lead & 0xE0) == 0xC0) {
            length = 2;
            cp = lead & 0x1F;
            min_value = 0x80;
        } else if ((lead & 0xF0) == 0xE0) {
            length = 3;
            cp = lead & 0x0F;
            min_value = 0x800;
        } else if ((lead & 0xF8) == 0xF0) {
            length = 4;
            cp = lead & 0x07;
            min_value = 0x10000;
        } else {
            out.push_back(replacement_character);
            ++i;
            continue;
        }

        if (i + length > text.size()) {
            out.push_back(replacement_character);
            ++i;
            continue;
        }

        bool well_formed = true;
        for (size_t k = 1; k < length; ++k) {
            auto cont = static_cast<unsigned char>(text[i + k]);
            if ((cont & 0xC0) != 0x80) {
                well_formed = false;
                break;
            }
            cp = (cp << 6) | (cont & 0x3F);
        }

        if (!well_formed || cp < min_value || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
            out.push_back(replacement_character);
            ++i;
            continue;
        }

        out.push_back(cp);
        i += length;
    }
    return out;
}

void append_utf8(std::string& out, char32_t cp) {
    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

std::string encode_utf8(std::u32string_view cps) {
    std::string out;
    out.reserve(cps.size());
    for (char32_t cp : cps) {
        append_utf8(out, cp);
    }
    return out;
}

bool is_letter(char32_t cp) noexcept {
    return in_ranges(cp);
}

bool is_upper(char32_t cp) noexcept {
    if (cp < 0x80) {
        return cp >= U'A' && cp <= U'Z';
    }
    if (cp >= 0x00C0 && cp <= 0x00DE) {
        return cp != 0x00D7;
    }
    if (cp >= 0x0100 && cp <= 0x017F) {
        return is_latin_ext_a_upper(cp);
    }
    if (cp >= 0x0370 && cp <= 0x03FF) {
        return is_greek_upper(cp);
    }
    if (cp >= 0x0400 && cp <= 0x042F) {
        return true;
    }
    if (cp >= 0xFF21 && cp <= 0xFF3A) {
        return true;
    }
    return false;
}

bool is_lower(char32_t cp) noexcept {
    if (cp < 0x80) {
        return cp >= U'a' && cp <= U'z';
    }
    if (cp == 0x00B5 || (cp >= 0x00DF && cp <= 0x00FF)) {
        return cp != 0x00F7;
    }
    if (cp >= 0x0100 && cp <= 0x017F) {
        return !is_latin_ext_a_upper(cp);
    }
    if (cp >= 0x0370 && cp <= 0x03FF) {
        return is_greek_lower(cp);
    }
    if (cp >= 0x0430 && cp <= 0x045F) {
        return true;
    }
    if (cp >= 0xFF41 && cp <= 0xFF5A) {
        return true;
    }
    return false;
}

char32_t to_upper(char32_t cp) noexcept {
    if (cp >= U'a' && cp <= U'z') {
        return cp - 0x20;
    }
    if (cp < 0x80) {
        return cp;
    }
    if (cp >= 0x00E0 && cp <= 0x00FE && cp != 0x00F7) {
        return cp - 0x20;
    }
    if (cp == 0x00FF) {
        return 0x0178;
    }
    if (cp == 0x0131) {
        return U'I';
    }
    if (cp >= 0x0100 && cp <= 0x017E && cp != 0x0138 && cp != 0x0149 && is_lower(cp)) {
        return cp - 1;
    }
    if ((cp >= 0x03B1 && cp <= 0x03C1) || (cp >= 0x03C3 && cp <= 0x03CB)) {
        return cp - 0x20;
    }
    switch (cp) {
    case 0x03C2:
        return 0x03A3;
    case 0x03AC:
        return 0x0386;
    case 0x03CC:
        return 0x038C;
    default:
        break;
    }
    if (cp >= 0x03AD && cp <= 0x03AF) {
        return cp - 0x25;
    }
    if (cp == 0x03CD || cp == 0x03CE) {
        return cp - 0x3F;
    }
    if (cp >= 0x0430 && cp <= 0x044F) {
        return cp - 0x20;
    }
    if (cp >= 0x0450 && cp <= 0x045F) {
        return cp - 0x50;
    }
    if (cp >= 0xFF41 && cp <= 0xFF5A) {
        return cp - 0x20;
    }
    return cp;
}

char32_t to_lower(char32_t cp) noexcept {
    if (cp >= U'A' && cp <= U'Z') {
        return cp + 0x20;
    }
    if (cp < 0x80) {
        return cp;
    }
    if (cp >= 0x00C0 && cp <= 0x00DE && cp != 0x00D7) {
        return cp + 0x20;
    }
    if (cp == 0x0178) {
        return 0x00FF;
    }
    if (cp == 0x0130) {
        return U'i';
    }
    if (cp >= 0x0100 && cp <= 0x017F && is_latin_ext_a_upper(cp)) {
        return cp + 1;
    }
    if ((cp >= 0x0391 && cp <= 0x03A1) || (cp >= 0x03A3 && cp <= 0x03AB)) {
        return cp + 0x20;
    }
    switch (cp) {
    case 0x0386:
        return 0x03AC;
    case 0x038C:
        return 0x03CC;
    default:
        break;
    }
    if (cp >= 0x0388 && cp <= 0x038A) {
        return cp + 0x25;
    }
    if (cp == 0x038E || cp == 0x038F) {
        return cp + 0x3F;
    }
    if (cp >= 0x0410 && cp <= 0x042F) {
        return cp + 0x20;
    }
    if (cp >= 0x0400 && cp <= 0x040F) {
        return cp + 0x50;
    }
    if (cp >= 0xFF21 && cp <= 0xFF3A) {
        return cp + 0x20;
    }
    return cp;
}

} // namespace nomen::unicode
