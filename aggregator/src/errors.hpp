#pragma once

#include <stdexcept>
#include <string>

class InvalidFrequencyError : public std::invalid_argument {
public:
    explicit InvalidFrequencyError(const std::string& what) : std::invalid_argument(what) {}
};

class MalformedTickError : public std::runtime_error {
public:
    explicit MalformedTickError(const std::string& what) : std::runtime_error(what) {}
};

class ReconciliationSourceUnavailable : public std::runtime_error {
public:
    explicit ReconciliationSourceUnavailable(const std::string& what) : std::runtime_error(what) {}
};

class IdentityNormalizationError : public std::runtime_error {
public:
    explicit IdentityNormalizationError(const std::string& what) : std::runtime_error(what) {}
};

class StoreError : public std::runtime_error {
public:
    explicit StoreError(const std::string& what) : std::runtime_error(what) {}
};
