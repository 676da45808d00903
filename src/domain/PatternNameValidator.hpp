/**
 * @file PatternNameValidator.hpp
 * @brief Naming rules applied to a pattern before it is written to disk.
 */

#pragma once
#include <string>
#include <cstddef>

namespace patternkeeper::domain {

/**
 * @class PatternNameValidator
 * @brief Accepts 1-100 characters drawn from [A-Za-z0-9_-].
 *
 * The name becomes a file name, so the character rule is also what keeps
 * path separators and ".." out of the target path.
 */
class PatternNameValidator {
public:
    static constexpr std::size_t kMinLength = 1;
    static constexpr std::size_t kMaxLength = 100;

    /**
     * @brief Checks both rules.
     * @throws std::invalid_argument naming the rule that failed.
     */
    static void Validate(const std::string& name);

    /** @brief Non-throwing form of Validate. */
    static bool IsValid(const std::string& name);

private:
    static bool IsAllowedChar(unsigned char c);
};

} // namespace patternkeeper::domain
