#ifndef UNITOOL_ERRORS_H
#define UNITOOL_ERRORS_H

#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>

namespace norm {

// text handed to the normalizer or the diff was not well-formed UTF-8
class InvalidInputError : public std::runtime_error
{
public:
    explicit InvalidInputError(std::size_t offset);

    InvalidInputError(const InvalidInputError&) = default;
    InvalidInputError& operator=(const InvalidInputError&) = default;
    InvalidInputError(InvalidInputError&&) = default;
    InvalidInputError& operator=(InvalidInputError&&) = default;

    virtual ~InvalidInputError();

    // byte offset of the first malformed sequence
    std::size_t offset() const { return m_offset; }

private:
    std::size_t m_offset;
};

// ICU could not provide a normalizer instance
class NormalizerError : public std::runtime_error
{
public:
    explicit NormalizerError(const std::string& arg);
    explicit NormalizerError(const char* arg);

    NormalizerError(const NormalizerError&) = default;
    NormalizerError& operator=(const NormalizerError&) = default;
    NormalizerError(NormalizerError&&) = default;
    NormalizerError& operator=(NormalizerError&&) = default;

    virtual ~NormalizerError();
};

// throws InvalidInputError if text is not valid UTF-8
void check_utf8(std::string_view text);

} // namespace norm

#endif // UNITOOL_ERRORS_H
