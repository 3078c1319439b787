#pragma once

#include <stdexcept>
#include <string>

class PkgcdnException : public std::runtime_error {
public:
    explicit PkgcdnException(const std::string& message)
        : std::runtime_error(message) {}
};

// Registry transport, tarball download/verify/extract and manifest failures.
class UpstreamError : public PkgcdnException {
public:
    explicit UpstreamError(const std::string& message)
        : PkgcdnException(message) {}
};

// Unexpected I/O failures while resolving or stat'ing cached files.
class FilesystemError : public PkgcdnException {
public:
    explicit FilesystemError(const std::string& message)
        : PkgcdnException(message) {}
};
