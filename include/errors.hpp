#pragma once

#include <stdexcept>
#include <string>

namespace packager {

class PackagerError: public std::runtime_error {
    public:
    using std::runtime_error::runtime_error;
};

// Корень или подпапка не существует либо не является директорией.
class NotFoundError: public PackagerError {
    public:
    using PackagerError::PackagerError;
};

class ScanError: public PackagerError {
    public:
    using PackagerError::PackagerError;
};

class IOError: public PackagerError {
    public:
    using PackagerError::PackagerError;
};

class UsageError: public PackagerError {
    public:
    using PackagerError::PackagerError;
};

}  // namespace packager
