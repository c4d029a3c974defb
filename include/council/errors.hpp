#pragma once

#include <stdexcept>
#include <string>

namespace council {

// Fatal for the whole invocation; raised before any filesystem mutation.
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& msg) : std::runtime_error(msg) {}
};

// Fatal for one target only (its base directories cannot be created).
class TargetError : public std::runtime_error {
public:
    explicit TargetError(const std::string& msg) : std::runtime_error(msg) {}
};

// An expert record an adapter cannot turn into file content.
class FormatError : public std::runtime_error {
public:
    explicit FormatError(const std::string& msg) : std::runtime_error(msg) {}
};

class ExpertParseError : public std::runtime_error {
public:
    explicit ExpertParseError(const std::string& msg) : std::runtime_error(msg) {}
};

// No expert matches a lookup key, or more than one does.
class ExpertLookupError : public std::runtime_error {
public:
    explicit ExpertLookupError(const std::string& msg) : std::runtime_error(msg) {}
};

class TemplateError : public std::runtime_error {
public:
    explicit TemplateError(const std::string& msg) : std::runtime_error(msg) {}
};

}  // namespace council
