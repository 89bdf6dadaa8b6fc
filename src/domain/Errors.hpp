/**
 * @file Errors.hpp
 * @brief Error taxonomy for the extraction engine.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace lextable::domain {

/**
 * @class LexTableError
 * @brief Common base so adapters can catch engine errors in one place.
 */
class LexTableError : public std::runtime_error {
public:
    explicit LexTableError(const std::string& message) : std::runtime_error(message) {}
};

/** @brief Malformed or invalid template. Fatal to the run. */
class TemplateError : public LexTableError {
public:
    explicit TemplateError(const std::string& message) : LexTableError("template: " + message) {}
};

/** @brief A document could not be segmented. Scoped to that document. */
class ParseError : public LexTableError {
public:
    ParseError(std::string documentId, const std::string& message)
        : LexTableError("parse [" + documentId + "]: " + message), m_documentId(std::move(documentId)) {}

    const std::string& documentId() const { return m_documentId; }

private:
    std::string m_documentId;
};

/** @brief Unexpected failure evaluating a pattern or normalizer for one field. */
class ExtractionError : public LexTableError {
public:
    ExtractionError(std::string fieldKey, const std::string& message)
        : LexTableError("extraction [" + fieldKey + "]: " + message), m_fieldKey(std::move(fieldKey)) {}

    const std::string& fieldKey() const { return m_fieldKey; }

private:
    std::string m_fieldKey;
};

/** @brief Malformed review input. No state change happened. */
class ValidationError : public LexTableError {
public:
    explicit ValidationError(const std::string& message) : LexTableError("validation: " + message) {}
};

/** @brief The cell changed since the caller last read it. */
class ConcurrencyError : public LexTableError {
public:
    ConcurrencyError(const std::string& cellId, int expected, int actual)
        : LexTableError("cell " + cellId + " is at version " + std::to_string(actual) +
                        ", expected " + std::to_string(expected)) {}
};

class NotFoundError : public LexTableError {
public:
    explicit NotFoundError(const std::string& what) : LexTableError("not found: " + what) {}
};

} // namespace lextable::domain
