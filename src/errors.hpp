#ifndef ERRORS_HPP
#define ERRORS_HPP

#include <stdexcept>
#include <string>

struct InvalidArchitecture : std::invalid_argument
{
    explicit InvalidArchitecture(const std::string &message)
        : std::invalid_argument(message)
    {
    }
};

struct DimensionMismatch : std::invalid_argument
{
    explicit DimensionMismatch(const std::string &message)
        : std::invalid_argument(message)
    {
    }
};

struct EmptyDatasetError : std::invalid_argument
{
    explicit EmptyDatasetError(const std::string &message)
        : std::invalid_argument(message)
    {
    }
};

struct InvalidHyperparameter : std::invalid_argument
{
    explicit InvalidHyperparameter(const std::string &message)
        : std::invalid_argument(message)
    {
    }
};

struct PersistenceError : std::runtime_error
{
    explicit PersistenceError(const std::string &message)
        : std::runtime_error(message)
    {
    }
};

struct DatasetError : std::runtime_error
{
    explicit DatasetError(const std::string &message)
        : std::runtime_error(message)
    {
    }
};

#endif // ERRORS_HPP
