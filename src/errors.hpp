#ifndef CRUSTMODEL_ERRORS_HPP
#define CRUSTMODEL_ERRORS_HPP

#include <stdexcept>
#include <string>


/**
 * Archive could not be opened, is not a valid tar.gz file or does not contain a requested member.
 */
class ArchiveError : public std::runtime_error {
public:
    explicit ArchiveError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * Text or binary data does not have the expected structure, eg. wrong number of tokens in a line,
 * wrong number of rows or a token that is not a number.
 */
class ParseError : public std::runtime_error {
public:
    explicit ParseError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * Type code of a grid cell is not part of the codec.
 */
class LookupError : public std::runtime_error {
public:
    explicit LookupError(const std::string& what) : std::runtime_error(what) {}
};

#endif // CRUSTMODEL_ERRORS_HPP
