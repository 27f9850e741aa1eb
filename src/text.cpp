#include <brvalid/text.hpp>

#include <cstdint>

namespace brvalid {

namespace {

// Latin-1 Supplement letters are encoded as 0xC3 followed by 0x80-0xBF
// (U+00C0-U+00FF). Index: (second byte - 0x80), value: ASCII fold or 0.
constexpr char kAccentFold[64] = {
    // U+00C0-U+00CF: A-grave..I-diaeresis
    'A', 'A', 'A', 'A', 'A', 0,   0,   'C', 'E', 'E', 'E', 'E', 'I', 'I', 'I', 'I',
    // U+00D0-U+00DF: eth, N-tilde, O-grave..O-diaeresis, times, O-stroke, U-grave..U-diaeresis
    0,   'N', 'O', 'O', 'O', 'O', 'O', 0,   0,   'U', 'U', 'U', 'U', 0,   0,   0,
    // U+00E0-U+00EF: lower case of the first row
    'a', 'a', 'a', 'a', 'a', 0,   0,   'c', 'e', 'e', 'e', 'e', 'i', 'i', 'i', 'i',
    // U+00F0-U+00FF
    0,   'n', 'o', 'o', 'o', 'o', 'o', 0,   0,   'u', 'u', 'u', 'u', 0,   0,   0,
};

constexpr uint8_t kLatin1Lead = 0xC3;

inline bool IsWhitespace(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' ||
           c == '\v' || c == '\f';
}

inline int UTF8ByteLength(uint8_t first_byte) {
    if ((first_byte & 0x80) == 0) return 1;      // 0xxxxxxx
    if ((first_byte & 0xE0) == 0xC0) return 2;   // 110xxxxx
    if ((first_byte & 0xF0) == 0xE0) return 3;   // 1110xxxx
    if ((first_byte & 0xF8) == 0xF0) return 4;   // 11110xxx
    return 1;  // Invalid, treat as single byte
}

// Second byte of an upper-case Latin-1 letter (0x80-0x9E, except 0x97 times)
inline bool IsLatin1Upper(uint8_t c2) { return c2 >= 0x80 && c2 <= 0x9E && c2 != 0x97; }

// Second byte of a lower-case Latin-1 letter with an upper-case form in
// the same block (0xA0-0xBE, except 0xB7 division). y-diaeresis and
// sharp s have no single-byte-pair upper case and are left alone.
inline bool IsLatin1Lower(uint8_t c2) { return c2 >= 0xA0 && c2 <= 0xBE && c2 != 0xB7; }

// Append one code point starting at word[i] with the requested case and
// return the number of bytes consumed.
size_t AppendCased(std::string_view word, size_t i, bool upper, std::string* out) {
    uint8_t c = static_cast<uint8_t>(word[i]);

    if (c < 0x80) {
        if (upper && c >= 'a' && c <= 'z') {
            *out += static_cast<char>(c - 'a' + 'A');
        } else if (!upper && c >= 'A' && c <= 'Z') {
            *out += static_cast<char>(c - 'A' + 'a');
        } else {
            *out += static_cast<char>(c);
        }
        return 1;
    }

    if (c == kLatin1Lead && i + 1 < word.size()) {
        uint8_t c2 = static_cast<uint8_t>(word[i + 1]);
        if (upper && IsLatin1Lower(c2)) c2 = static_cast<uint8_t>(c2 - 0x20);
        if (!upper && IsLatin1Upper(c2)) c2 = static_cast<uint8_t>(c2 + 0x20);
        *out += static_cast<char>(c);
        *out += static_cast<char>(c2);
        return 2;
    }

    // Pass through other sequences unchanged
    size_t n = static_cast<size_t>(UTF8ByteLength(c));
    if (n > word.size() - i) n = word.size() - i;
    out->append(word.substr(i, n));
    return n;
}

}  // namespace

std::string RemoveAccents(std::string_view input) {
    std::string result;
    result.reserve(input.size());

    size_t i = 0;
    while (i < input.size()) {
        uint8_t c = static_cast<uint8_t>(input[i]);

        if (c == kLatin1Lead && i + 1 < input.size()) {
            uint8_t c2 = static_cast<uint8_t>(input[i + 1]);
            if (c2 >= 0x80 && c2 <= 0xBF && kAccentFold[c2 - 0x80] != 0) {
                result += kAccentFold[c2 - 0x80];
                i += 2;
                continue;
            }
        }

        result += input[i++];
    }

    return result;
}

std::string TitleCase(std::string_view input) {
    std::string result;
    result.reserve(input.size());

    size_t i = 0;
    while (i < input.size()) {
        // Skip the whitespace run before the next word
        while (i < input.size() && IsWhitespace(input[i])) ++i;
        if (i == input.size()) break;

        size_t end = i;
        while (end < input.size() && !IsWhitespace(input[end])) ++end;
        std::string_view word = input.substr(i, end - i);

        if (!result.empty()) result += ' ';

        size_t j = AppendCased(word, 0, /*upper=*/true, &result);
        while (j < word.size()) {
            j += AppendCased(word, j, /*upper=*/false, &result);
        }

        i = end;
    }

    return result;
}

}  // namespace brvalid
