#include "unitool/errors.h"
#include "unitool/utf8.h"

#include "fmt/format.h"

namespace norm {

InvalidInputError::InvalidInputError(std::size_t offset) :
    std::runtime_error(fmt::format("invalid UTF-8 at byte {}", offset)),
    m_offset(offset)
{}

InvalidInputError::~InvalidInputError()
{}

NormalizerError::NormalizerError(const std::string& arg) :
    std::runtime_error(arg)
{}

NormalizerError::NormalizerError(const char* arg) :
    std::runtime_error(arg)
{}

NormalizerError::~NormalizerError()
{}

void check_utf8(std::string_view text)
{
    std::size_t pos = 0;
    if (!utf8valid(text, &pos))
        throw InvalidInputError(pos);
}

} // namespace norm
