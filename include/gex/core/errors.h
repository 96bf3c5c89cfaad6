#pragma once

// Graph Explorer - Error Types
// Every failure of a draw request is one of these. They are raised
// synchronously and caught once by Graph_session.

#include <stdexcept>
#include <string>

namespace gex {

class Graph_error : public std::runtime_error
{
public:
    explicit Graph_error(const std::string& message)
        : std::runtime_error(message)
    {}
};

// Malformed or disallowed formula.
class Expression_error : public Graph_error
{
public:
    explicit Expression_error(const std::string& message)
        : Graph_error(message)
    {}
};

// Result length differs from the input domain, or x and y differ in length.
class Shape_mismatch_error : public Expression_error
{
public:
    explicit Shape_mismatch_error(const std::string& message)
        : Expression_error(message)
    {}
};

// No finite data left, or too few points supplied.
class Empty_data_error : public Graph_error
{
public:
    explicit Empty_data_error(const std::string& message)
        : Graph_error(message)
    {}
};

// Invalid x-range or point count.
class Domain_error : public Graph_error
{
public:
    explicit Domain_error(const std::string& message)
        : Graph_error(message)
    {}
};

// Malformed point-entry rows.
class Input_error : public Graph_error
{
public:
    explicit Input_error(const std::string& message)
        : Graph_error(message)
    {}
};

} // namespace gex
