#ifndef EXCEPTIONS_HPP
#define EXCEPTIONS_HPP

#include <stdexcept>
#include <string>

/**
 * @file exceptions.hpp
 * @brief Exception hierarchy for checkphrase derivation and wordlist handling.
 * @author Athos-0day
 * @date 2026
 */

namespace Checkphrase {

    /**
     * @class CheckphraseException
     * @brief Root of the checkphrase exception hierarchy.
     *
     * Catch this type if you want to handle every error raised by the library.
     */
    class CheckphraseException : public std::runtime_error
    {
    public:
        using std::runtime_error::runtime_error;
    };

    /**
     * @class CryptoException
     * @brief Thrown when an OpenSSL primitive (PBKDF2, SHA-256) reports failure.
     */
    class CryptoException : public CheckphraseException
    {
    public:
        using CheckphraseException::CheckphraseException;
    };

    /**
     * @class ForbiddenSize
     * @brief Thrown when a checksum length (in words) is out of range.
     *
     * @note Inherits from CheckphraseException.
     */
    class ForbiddenSize : public CheckphraseException
    {
    public:
        using CheckphraseException::CheckphraseException;
    };

    /**
     * @class InvalidWordlist
     * @brief Thrown when a wordlist breaks one of its invariants
     * (size, prefix uniqueness, separator-free words) or cannot be read.
     */
    class InvalidWordlist : public CheckphraseException
    {
    public:
        using CheckphraseException::CheckphraseException;
    };

    /**
     * @class InvalidAddress
     * @brief Thrown when derivation is requested for an empty address.
     */
    class InvalidAddress : public CheckphraseException
    {
    public:
        using CheckphraseException::CheckphraseException;
    };

    /**
     * @class CorpusException
     * @brief Thrown when a conformance corpus document is malformed or
     * its file cannot be read or written.
     */
    class CorpusException : public CheckphraseException
    {
    public:
        using CheckphraseException::CheckphraseException;
    };

} // namespace Checkphrase

#endif // EXCEPTIONS_HPP
