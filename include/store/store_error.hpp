#ifndef BULK_STORE_ERROR_HPP
#define BULK_STORE_ERROR_HPP

#include <filesystem>
#include <stdexcept>
#include <string>
#include <system_error>

namespace bulk::store {

class StoreError : public std::runtime_error {
public:
    explicit StoreError(const std::string& message)
        : std::runtime_error(message) {}
};

// Raised before any path is derived from the offending string
class InvalidDigestFormat : public StoreError {
public:
    explicit InvalidDigestFormat(const std::string& candidate)
        : StoreError("Invalid digest format: '" + candidate + "' is not 64 lowercase hex digits")
        , candidate_(candidate) {}

    const std::string& candidate() const { return candidate_; }

private:
    std::string candidate_;
};

class IoError : public StoreError {
public:
    IoError(const std::string& message, const std::filesystem::path& path)
        : StoreError("I/O error: " + message + ": " + path.string())
        , path_(path) {}

    IoError(const std::string& message, const std::filesystem::path& path, const std::error_code& ec)
        : StoreError("I/O error: " + message + ": " + path.string() + ": " + ec.message())
        , path_(path)
        , code_(ec) {}

    const std::filesystem::path& path() const { return path_; }
    const std::error_code& code() const { return code_; }

private:
    std::filesystem::path path_;
    std::error_code code_;
};

class NotImplemented : public StoreError {
public:
    explicit NotImplemented(const std::string& operation)
        : StoreError("Not implemented: " + operation) {}
};

} // namespace bulk::store

#endif // BULK_STORE_ERROR_HPP
