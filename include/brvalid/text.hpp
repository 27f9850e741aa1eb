#pragma once

#include <string>
#include <string_view>

namespace brvalid {

/**
 * Fold accented Latin letters to plain ASCII, preserving case.
 *
 * Covers the accents found in Portuguese and Spanish names:
 *   a: grave, acute, tilde, circumflex, diaeresis
 *   e/i/u: grave, acute, circumflex, diaeresis
 *   o: grave, acute, tilde, circumflex, diaeresis
 *   c-cedilla, n-tilde
 * Every other byte, including other UTF-8 sequences, is copied unchanged.
 */
std::string RemoveAccents(std::string_view input);

/**
 * Upper-case the first letter of each word and lower-case the rest.
 *
 * Words are separated by ASCII whitespace and re-joined with a single
 * space; leading and trailing whitespace is dropped. Case mapping covers
 * ASCII and the Latin-1 Supplement letters (U+00C0-U+00FE).
 */
std::string TitleCase(std::string_view input);

}  // namespace brvalid
