/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include <string_view>

namespace darkcfg::dcb {
// Receives a decoded value tree as flat structured-document events. Inside a mapping, scalars
// alternate key, value; a value may be a nested mapping or sequence.
class EventSink {
   public:
    virtual ~EventSink() = default;

    virtual void start_mapping() = 0;
    virtual void end_mapping() = 0;
    virtual void start_sequence() = 0;
    virtual void end_sequence() = 0;
    virtual void scalar(std::string_view value) = 0;
};
}  // namespace darkcfg::dcb
