#include "domain/PatternNameValidator.hpp"
#include "domain/TextUtils.hpp"
#include <cctype>
#include <stdexcept>

namespace patternkeeper::domain {

void PatternNameValidator::Validate(const std::string& name) {
    std::size_t length = TextUtils::Utf8Length(name);
    if (length < kMinLength || length > kMaxLength) {
        throw std::invalid_argument("Pattern must be 1-100 characters");
    }
    for (char c : name) {
        if (!IsAllowedChar(static_cast<unsigned char>(c))) {
            throw std::invalid_argument("Pattern name can only contain alphanumeric, dash and underscore characters");
        }
    }
}

bool PatternNameValidator::IsValid(const std::string& name) {
    try {
        Validate(name);
        return true;
    } catch (const std::invalid_argument&) {
        return false;
    }
}

bool PatternNameValidator::IsAllowedChar(unsigned char c) {
    return std::isalnum(c) || c == '-' || c == '_';
}

} // namespace patternkeeper::domain
