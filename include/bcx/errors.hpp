/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace bcx {

class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Malformed hex text or a digest of the wrong length.
class DecodeError : public Error {
public:
    explicit DecodeError(const std::string& message) : Error(message) {}
};

// Empty or out-of-alphabet input handed to a decoder.
class InputError : public Error {
public:
    explicit InputError(const std::string& message) : Error(message) {}
};

} // namespace bcx
