/**
 * @file ImportErrors.hpp
 * @brief Exceptions raised by the import pipeline.
 *
 * The first four are fatal to a run. NoUniqueNameAvailable is raised by the
 * dataset writer and contained per row by the import service.
 */

#pragma once

#include <stdexcept>
#include <string>
#include <vector>

namespace hubingest::domain {

/** @brief The reference string cannot be turned into a RemoteReference. */
class InvalidReference : public std::runtime_error {
public:
    explicit InvalidReference(const std::string& message) : std::runtime_error(message) {}
};

/**
 * @struct FetchAttempt
 * @brief Diagnostics of one failed HTTP leg.
 */
struct FetchAttempt {
    std::string url;
    std::string repoKind;            ///< "datasets" or "models".
    bool authenticated = false;
    int status = 0;                  ///< 0 when no response was received.
    std::string reason;              ///< Status text or transport error.
    std::string hostErrorMessage;    ///< Value of the x-error-message header.
    std::string bodyPreview;         ///< First bytes of the error body.
};

/** @brief Every fetch strategy failed. Carries all attempts for self-diagnosis. */
class RemoteFetchError : public std::runtime_error {
public:
    RemoteFetchError(const std::string& message, std::vector<FetchAttempt> attempts)
        : std::runtime_error(message), m_attempts(std::move(attempts)) {}

    const std::vector<FetchAttempt>& attempts() const { return m_attempts; }

private:
    std::vector<FetchAttempt> m_attempts;
};

/** @brief Downloaded bytes are not a columnar archive. */
class InvalidContent : public std::runtime_error {
public:
    InvalidContent(const std::string& message, bool pointerDetected, bool markupDetected)
        : std::runtime_error(message), m_pointerDetected(pointerDetected), m_markupDetected(markupDetected) {}

    bool pointerDetected() const { return m_pointerDetected; }
    bool markupDetected() const { return m_markupDetected; }

private:
    bool m_pointerDetected;
    bool m_markupDetected;
};

/** @brief The isolated decoder failed; no rows are recovered. */
class DecodeError : public std::runtime_error {
public:
    explicit DecodeError(const std::string& message) : std::runtime_error(message) {}
};

/** @brief Every numbered variant of a file name is already taken. */
class NoUniqueNameAvailable : public std::runtime_error {
public:
    explicit NoUniqueNameAvailable(const std::string& message) : std::runtime_error(message) {}
};

} // namespace hubingest::domain
