#pragma once
#include <stdexcept>
#include <string>

namespace ntm {

// Base for every failure the core reports to its caller.
class Error : public std::runtime_error {
public:
    explicit Error(const std::string& message) : std::runtime_error(message) {}
};

// A field violates its documented range (negative onset, volume > 1, ...).
class ValidationError : public Error {
public:
    explicit ValidationError(const std::string& message) : Error(message) {}
};

// Structured data is malformed or incomplete.
class FormatError : public Error {
public:
    explicit FormatError(const std::string& message) : Error(message) {}
};

class UnsupportedFormatError : public Error {
public:
    explicit UnsupportedFormatError(const std::string& selector)
        : Error("Unsupported export format: " + selector), m_Selector(selector) {}

    const std::string& Selector() const { return m_Selector; }

private:
    std::string m_Selector;
};

class IOError : public Error {
public:
    IOError(const std::string& message, const std::string& path)
        : Error(message + ": " + path), m_Path(path) {}

    const std::string& Path() const { return m_Path; }

private:
    std::string m_Path;
};

} // namespace ntm
