/**
 * @file    BookWatchErrors.hpp
 * @brief   Exception types raised by decoding, traversal and watcher setup
 *
 * Developer: Equix Technologies
 * Copyright: Equix Technologies Pty Ltd
 * Created: October 2026
 *
 * Description:
 *   All errors derive from BookWatchError (itself a std::runtime_error) so
 *   boundary code can catch std::exception, log and carry on the way the
 *   rest of the service does.
 */

#pragma once

#ifndef BOOK_WATCH_ERRORS_HPP_
#define BOOK_WATCH_ERRORS_HPP_

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace book_watch {

class BookWatchError : public std::runtime_error {
public:
    explicit BookWatchError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Raw buffer length differs from the fixed account size
 */
class DecodeSizeMismatch : public BookWatchError {
public:
    DecodeSizeMismatch(size_t actual, size_t expected)
        : BookWatchError("Book side data length (" + std::to_string(actual) +
                         ") does not match expected size (" + std::to_string(expected) + ")")
        , actual_(actual)
        , expected_(expected) {}

    size_t actual() const { return actual_; }
    size_t expected() const { return expected_; }

private:
    size_t actual_;
    size_t expected_;
};

/**
 * @brief Initial fetch found no data at the address
 */
class AccountNotFound : public BookWatchError {
public:
    explicit AccountNotFound(const std::string& address)
        : BookWatchError("Account not found at address '" + address + "'")
        , address_(address) {}

    const std::string& address() const { return address_; }

private:
    std::string address_;
};

/**
 * @brief A live update could not be decoded; the update is dropped
 */
class MalformedUpdate : public BookWatchError {
public:
    MalformedUpdate(const std::string& address, const std::string& reason)
        : BookWatchError("Malformed update for '" + address + "': " + reason)
        , address_(address) {}

    const std::string& address() const { return address_; }

private:
    std::string address_;
};

/**
 * @brief Traversal reached an invalid, repeated or non-traversable node
 */
class CorruptTree : public BookWatchError {
public:
    CorruptTree(uint64_t index, const std::string& reason)
        : BookWatchError("Corrupt book tree at node " + std::to_string(index) + ": " + reason)
        , index_(index) {}

    uint64_t index() const { return index_; }

private:
    uint64_t index_;
};

} // namespace book_watch

#endif /* BOOK_WATCH_ERRORS_HPP_ */
