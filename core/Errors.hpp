#pragma once
#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>

namespace ct {

using SessionId = std::uint64_t;

// Base for every error raised by the core. Operation boundaries catch this
// and turn it into a notice; nothing here is allowed to end the process.
class Error : public std::runtime_error {
public:
    explicit Error(const std::string &what) : std::runtime_error(what) {}
};

// Malformed or missing configuration. field() names the offending key
// ("home_url", "macros[2].text", or the file path for unreadable files).
class ConfigError : public Error {
public:
    ConfigError(std::string field, const std::string &reason)
        : Error(field + ": " + reason), m_field(std::move(field)) {}

    const std::string &field() const { return m_field; }

private:
    std::string m_field;
};

class NotFound : public Error {
public:
    explicit NotFound(SessionId id)
        : Error("unknown session " + std::to_string(id)), m_id(id) {}

    SessionId id() const { return m_id; }

private:
    SessionId m_id;
};

class NoActiveSession : public Error {
public:
    NoActiveSession() : Error("no active session") {}
};

class InjectionError : public Error {
public:
    explicit InjectionError(const std::string &what) : Error(what) {}
};

class ViewHostError : public Error {
public:
    explicit ViewHostError(const std::string &what) : Error(what) {}
};

} // namespace ct
