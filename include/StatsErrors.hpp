// include/StatsErrors.hpp
#pragma once
#include <stdexcept>
#include <string>

// Base of every error raised by the stats store / recorder / export layers.
class TuStatsError : public std::runtime_error {
public:
    explicit TuStatsError(const std::string& what) : std::runtime_error(what) {}
};

// Store path unusable: permission denied, corrupt file, not a database.
class StorageOpenError : public TuStatsError {
public:
    explicit StorageOpenError(const std::string& what) : TuStatsError(what) {}
};

// Serialization or write/commit failure while inserting a record.
class StorageWriteError : public TuStatsError {
public:
    explicit StorageWriteError(const std::string& what) : TuStatsError(what) {}
};

// A stored value could not be read back or deserialized.
class StorageReadError : public TuStatsError {
public:
    explicit StorageReadError(const std::string& what) : TuStatsError(what) {}
};

// No default stats location could be derived from the environment.
class ConfigResolutionError : public TuStatsError {
public:
    explicit ConfigResolutionError(const std::string& what) : TuStatsError(what) {}
};
