#ifndef LEDGERLINE_EXCEPTIONS_H
#define LEDGERLINE_EXCEPTIONS_H

#include <stdexcept>
#include <string>

namespace Ledgerline {

class LedgerException : public std::runtime_error {
public:
    explicit LedgerException(const std::string& message) : std::runtime_error(message) {}
};

class IOException : public LedgerException {
public:
    explicit IOException(const std::string& message) : LedgerException("IO Error: " + message) {}
};

class DatasetException : public LedgerException {
public:
    explicit DatasetException(const std::string& message) : LedgerException("Dataset Error: " + message) {}
};

class ConfigurationException : public LedgerException {
public:
    explicit ConfigurationException(const std::string& message) : LedgerException("Configuration Error: " + message) {}
};

class EnrichmentException : public LedgerException {
public:
    explicit EnrichmentException(const std::string& message) : LedgerException("Enrichment Error: " + message) {}
};

} // namespace Ledgerline

#endif // LEDGERLINE_EXCEPTIONS_H
