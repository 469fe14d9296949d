/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include <stdexcept>
#include <string>

namespace darkcfg::dcb {
// Container bytes cannot be trusted past this point.
class FormatError : public std::runtime_error {
   public:
    explicit FormatError(const std::string& what) : std::runtime_error(what) {}
};

// Bad tag, bad count or unknown string id inside an entry payload.
class DecodeError : public FormatError {
   public:
    explicit DecodeError(const std::string& what) : FormatError(what) {}
};

// Well-formed container using a compression or encryption method we do not implement.
class UnsupportedFeatureError : public std::runtime_error {
   public:
    explicit UnsupportedFeatureError(const std::string& what) : std::runtime_error(what) {}
};
}  // namespace darkcfg::dcb
