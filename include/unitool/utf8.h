#ifndef UNITOOL_UTF8_H
#define UNITOOL_UTF8_H

#include <cstddef>
#include <string>
#include <string_view>

constexpr char32_t utf_invalid = 0xFFFD;

// returns true if s is well-formed UTF-8 (no overlong forms, no
// surrogates, nothing past U+10FFFF). on failure, errpos (if not
// null) receives the byte offset of the sequence that failed.
bool utf8valid(std::string_view s, std::size_t* errpos = nullptr);

// number of code points in s; ill-formed sequences count once each
std::size_t utf8length(std::string_view s);

// decodes all of s, ill-formed sequences decode to utf_invalid
std::u32string utf8to32(std::string_view s);

// cp as UTF-8; surrogates and values past U+10FFFF encode utf_invalid
std::string utf8encode(char32_t cp);

#endif // UNITOOL_UTF8_H
