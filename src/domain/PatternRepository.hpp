/**
 * @file PatternRepository.hpp
 * @brief Interface for loading and persisting pattern documents.
 */

#pragma once
#include <vector>
#include <filesystem>
#include "Pattern.hpp"

namespace patternkeeper::domain {

/**
 * @class PatternRepository
 * @brief Abstract storage for the pattern library.
 */
class PatternRepository {
public:
    virtual ~PatternRepository() = default;

    /**
     * @brief Loads every well-formed pattern in storage.
     * @return Patterns in enumeration order; empty if storage is unreadable.
     */
    virtual std::vector<Pattern> loadAll() = 0;

    /**
     * @brief Writes a new pattern document, replacing any document with the same name.
     * @param draft Already validated fields.
     * @return Location of the written document.
     * @throws std::runtime_error on I/O failure.
     */
    virtual std::filesystem::path save(const PatternDraft& draft) = 0;
};

} // namespace patternkeeper::domain
