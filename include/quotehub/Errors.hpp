#pragma once
#include <stdexcept>
#include <string>

/*
Error taxonomy. Transport and parse errors are contained by the worker that
raised them (single record, single message, single poll); credential and
registry errors are fatal at startup and reach the caller of Engine::start().
*/

namespace qh {

// connect / subscribe / poll / HTTP failure
class TransportError : public std::runtime_error {
public:
    explicit TransportError(const std::string& what) : std::runtime_error(what) {}
};

// malformed message, response or record
class ParseError : public std::runtime_error {
public:
    explicit ParseError(const std::string& what) : std::runtime_error(what) {}
};

// missing or rejected provider credentials
class CredentialError : public std::runtime_error {
public:
    explicit CredentialError(const std::string& what) : std::runtime_error(what) {}
};

// the instrument registry cannot drive an engine (e.g. it is empty)
class RegistryError : public std::runtime_error {
public:
    explicit RegistryError(const std::string& what) : std::runtime_error(what) {}
};

} // namespace qh
