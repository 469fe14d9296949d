/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include "dcb_event_sink.h"

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

#include <nlohmann/json.hpp>

namespace darkcfg::dcb {
// Assembles the event stream into an ordered JSON document. Mappings become objects, sequences
// arrays, scalars strings (bytes widened with latin1_to_utf8). A mapping that repeats a key is
// written as an array of [key, value] pairs so that every pair survives. Only the innermost open
// container is ever written to, so the frame pointers into the document stay valid.
class JsonDocumentBuilder : public EventSink {
   public:
    void start_mapping() override;
    void end_mapping() override;
    void start_sequence() override;
    void end_sequence() override;
    void scalar(std::string_view value) override;

    bool complete() const { return _stack.empty(); }
    // Keys seen again within the same mapping.
    std::size_t duplicate_keys() const { return _duplicate_keys; }

    // Throws std::logic_error while containers are still open. Null if no events were seen.
    nlohmann::ordered_json take_document();

   private:
    struct Frame {
        nlohmann::ordered_json* node = nullptr;
        bool mapping = false;
        std::optional<std::string> pending_key;
        // Set once the mapping has been rewritten as [key, value] pairs.
        bool pairs = false;
        std::unordered_set<std::string> keys;
    };

    nlohmann::ordered_json* attach(nlohmann::ordered_json value);
    void close(bool mapping);
    static void convert_to_pairs(Frame& frame);

    nlohmann::ordered_json _root;
    bool _has_root = false;
    std::vector<Frame> _stack;
    std::size_t _duplicate_keys = 0;
};
}  // namespace darkcfg::dcb
