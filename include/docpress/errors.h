#pragma once

#include <stdexcept>
#include <string>

namespace docpress {

/// Base of every error the library raises
class Error : public std::runtime_error {
public:
    explicit Error(const std::string& message) : std::runtime_error(message) {}
};

/// Unknown page size, font, or source format. Fatal for the current document.
class LookupFailure : public Error {
public:
    explicit LookupFailure(const std::string& message) : Error(message) {}
};

/// Font metrics could not measure a run (e.g. missing glyph)
class MeasurementFailure : public Error {
public:
    explicit MeasurementFailure(const std::string& message) : Error(message) {}
};

/// A page sink failed to record a page or the document
class SinkFailure : public Error {
public:
    explicit SinkFailure(const std::string& message) : Error(message) {}
};

/// Malformed spreadsheet input
class ParseFailure : public Error {
public:
    explicit ParseFailure(const std::string& message) : Error(message) {}
};

} // namespace docpress
