#pragma once
#include <stdexcept>
#include <string>

// Programming defects in a component definition. Never recovered internally.
class TeacupError : public std::logic_error {
public:
    using std::logic_error::logic_error;
};

// view() / update() called on a type that does not provide them
class NotImplementedError : public TeacupError {
public:
    using TeacupError::TeacupError;
};

// A child selector resolved to something that cannot be constructed
class InvalidChildTypeError : public TeacupError {
public:
    using TeacupError::TeacupError;
};

// A child selector names a method the parent does not have
class MethodNotFoundError : public TeacupError {
public:
    using TeacupError::TeacupError;
};

class ComponentNotFoundError : public TeacupError {
public:
    using TeacupError::TeacupError;
};

// Unreadable or malformed configuration. Unlike the above this is an
// environment problem, not a code defect.
class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};
