#pragma once

#include <stdexcept>
#include <string>

#include <boost/system/error_code.hpp>

class PoolError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// nothing in the pool is eligible right now, caller decides whether to retry
class NoItemAvailableError : public PoolError {
public:
    using PoolError::PoolError;
};

class StoreError : public PoolError {
private:
    boost::system::error_code _code;

public:
    StoreError(const std::string& what, boost::system::error_code code = {})
        : PoolError(what), _code(code) {};

    const boost::system::error_code& code() const noexcept { return _code; }
};

class MalformedItemError : public PoolError {
public:
    using PoolError::PoolError;
};

class NotAMemberError : public PoolError {
public:
    using PoolError::PoolError;
};
