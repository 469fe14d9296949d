/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "dcb/dcb_json_sink.h"
#include "dcb/dcb_text.h"

#include <stdexcept>

namespace darkcfg::dcb {
nlohmann::ordered_json* JsonDocumentBuilder::attach(nlohmann::ordered_json value) {
    if (_stack.empty()) {
        if (_has_root) {
            throw std::logic_error("Multiple top-level values in one document");
        }
        _root = std::move(value);
        _has_root = true;
        return &_root;
    }

    Frame& top = _stack.back();
    if (!top.mapping) {
        top.node->push_back(std::move(value));
        return &top.node->back();
    }

    if (!top.pending_key.has_value()) {
        throw std::logic_error("Mapping key must be a scalar");
    }
    std::string key = std::move(*top.pending_key);
    top.pending_key.reset();

    if (!top.pairs) {
        if (!top.node->contains(key)) {
            auto& slot = (*top.node)[key];
            slot = std::move(value);
            return &slot;
        }
        convert_to_pairs(top);
    }

    if (!top.keys.insert(key).second) {
        _duplicate_keys++;
    }
    nlohmann::ordered_json pair = nlohmann::ordered_json::array();
    pair.push_back(std::move(key));
    pair.push_back(std::move(value));
    top.node->push_back(std::move(pair));
    return &top.node->back()[1];
}

void JsonDocumentBuilder::convert_to_pairs(Frame& frame) {
    nlohmann::ordered_json pairs = nlohmann::ordered_json::array();
    for (auto it = frame.node->begin(); it != frame.node->end(); ++it) {
        frame.keys.insert(it.key());
        nlohmann::ordered_json pair = nlohmann::ordered_json::array();
        pair.push_back(it.key());
        pair.push_back(std::move(it.value()));
        pairs.push_back(std::move(pair));
    }
    *frame.node = std::move(pairs);
    frame.pairs = true;
}

void JsonDocumentBuilder::close(bool mapping) {
    if (_stack.empty() || _stack.back().mapping != mapping) {
        throw std::logic_error(
            std::string("Unbalanced ") + (mapping ? "mapping" : "sequence") + " end"
        );
    }
    if (_stack.back().pending_key.has_value()) {
        throw std::logic_error("Mapping closed with key '" + *_stack.back().pending_key + "' but no value");
    }
    _stack.pop_back();
}

void JsonDocumentBuilder::start_mapping() {
    auto* node = attach(nlohmann::ordered_json::object());
    _stack.push_back({node, true, std::nullopt, false, {}});
}

void JsonDocumentBuilder::end_mapping() {
    close(true);
}

void JsonDocumentBuilder::start_sequence() {
    auto* node = attach(nlohmann::ordered_json::array());
    _stack.push_back({node, false, std::nullopt, false, {}});
}

void JsonDocumentBuilder::end_sequence() {
    close(false);
}

void JsonDocumentBuilder::scalar(std::string_view value) {
    std::string text = latin1_to_utf8(value);
    if (!_stack.empty() && _stack.back().mapping && !_stack.back().pending_key.has_value()) {
        _stack.back().pending_key = std::move(text);
        return;
    }
    attach(nlohmann::ordered_json(std::move(text)));
}

nlohmann::ordered_json JsonDocumentBuilder::take_document() {
    if (!_stack.empty()) {
        throw std::logic_error(
            "Document still has " + std::to_string(_stack.size()) + " open container(s)"
        );
    }
    _has_root = false;
    return std::move(_root);
}
}  // namespace darkcfg::dcb
