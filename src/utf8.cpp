#include "unitool/utf8.h"

#include "unicode/utf8.h"

// walks s with ICU's checked decoder, calling f(start, cp) for each
// sequence. cp is negative for an ill-formed sequence.
template <typename F>
static void each_code_point(std::string_view s, F&& f)
{
    const char* p = s.data();
    std::size_t len = s.size();
    std::size_t i = 0;
    while (i < len) {
        std::size_t start = i;
        UChar32 cp;
        U8_NEXT(p, i, len, cp);
        if (!f(start, cp))
            break;
    }
}

bool utf8valid(std::string_view s, std::size_t* errpos)
{
    bool valid = true;
    each_code_point(s, [&](std::size_t start, UChar32 cp) {
        if (cp < 0) {
            valid = false;
            if (errpos)
                *errpos = start;
        }
        return valid;
    });

    return valid;
}

std::size_t utf8length(std::string_view s)
{
    std::size_t count = 0;
    each_code_point(s, [&](std::size_t, UChar32) {
        count++;
        return true;
    });

    return count;
}

std::u32string utf8to32(std::string_view s)
{
    std::u32string out;
    out.reserve(s.size());
    each_code_point(s, [&](std::size_t, UChar32 cp) {
        out.push_back(cp < 0 ? utf_invalid : static_cast<char32_t>(cp));
        return true;
    });

    return out;
}

std::string utf8encode(char32_t cp)
{
    char buf[U8_MAX_LENGTH];
    int32_t len = 0;
    UBool error = false;
    U8_APPEND(buf, len, U8_MAX_LENGTH, static_cast<UChar32>(cp), error);
    if (error) {
        len = 0;
        U8_APPEND_UNSAFE(buf, len, static_cast<UChar32>(utf_invalid));
    }

    return {buf, static_cast<std::size_t>(len)};
}
