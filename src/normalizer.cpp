#include "unitool/normalizer.h"
#include "unitool/utf8.h"

#include "fmt/format.h"
#include "unicode/bytestream.h"
#include "unicode/normalizer2.h"
#include "unicode/stringpiece.h"
#include "unicode/utypes.h"

#include <cstdint>
#include <iterator>
#include <utility>

namespace norm {

static const icu::Normalizer2* instance(Form form)
{
    // instances are owned by ICU and live for the whole process
    UErrorCode status = U_ZERO_ERROR;
    const icu::Normalizer2* normalizer = nullptr;
    switch (form) {
        case Form::nfc:
            normalizer = icu::Normalizer2::getNFCInstance(status);
            break;
        case Form::nfkc:
            normalizer = icu::Normalizer2::getNFKCInstance(status);
            break;
    }

    if (U_FAILURE(status) || !normalizer)
        throw NormalizerError(fmt::format("unable to load normalizer: {}",
                u_errorName(status)));

    return normalizer;
}

static icu::StringPiece piece(std::string_view text)
{
    return icu::StringPiece(text.data(), static_cast<int32_t>(text.size()));
}

std::string normalize(std::string_view text, Form form)
{
    check_utf8(text);
    auto normalizer = instance(form);

    std::string result;
    result.reserve(text.size());
    icu::StringByteSink<std::string> sink(&result);

    UErrorCode status = U_ZERO_ERROR;
    normalizer->normalizeUTF8(0, piece(text), sink, nullptr, status);
    if (U_FAILURE(status))
        throw NormalizerError(fmt::format("normalization failed: {}",
                u_errorName(status)));

    return result;
}

bool is_normalized(std::string_view text, Form form)
{
    check_utf8(text);
    auto normalizer = instance(form);

    UErrorCode status = U_ZERO_ERROR;
    UBool result = normalizer->isNormalizedUTF8(piece(text), status);
    if (U_FAILURE(status))
        throw NormalizerError(fmt::format("normalization check failed: {}",
                u_errorName(status)));

    return result != 0;
}

bool is_equivalent(std::string_view a, std::string_view b)
{
    return normalize(a) == normalize(b);
}

std::string to_hex_code_points(std::string_view text)
{
    check_utf8(text);

    std::string hex;
    hex.reserve(text.size() * 4);
    for (auto cp : utf8to32(text))
        fmt::format_to(std::back_inserter(hex), "{:04X}",
                static_cast<uint32_t>(cp));

    return hex;
}

std::optional<NormalizationIssue> check_line(int line_number,
        std::string_view line)
{
    auto normalized = normalize(line);
    if (normalized == line)
        return std::nullopt;

    auto differences = diff(utf8to32(line), utf8to32(normalized));
    return NormalizationIssue{
            line_number,
            std::string{line},
            std::move(normalized),
            std::move(differences)};
}

std::vector<CharInfo> inspect(std::string_view text)
{
    check_utf8(text);

    std::vector<CharInfo> chars;
    for (auto cp : utf8to32(text)) {
        auto one = utf8encode(cp);
        chars.push_back({cp,
                is_normalized(one, Form::nfc),
                is_normalized(one, Form::nfkc)});
    }

    return chars;
}

} // namespace norm
