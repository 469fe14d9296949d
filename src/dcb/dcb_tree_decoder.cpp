/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "dcb/dcb_tree_decoder.h"
#include "dcb/dcb_packed.h"

#include <vector>

namespace darkcfg::dcb {
namespace {
enum class Op : std::uint8_t {
    Item,
    KeyValue,
    MappingEnd,
    SequenceEnd,
};

// `repeat` collapses n consecutive identical Item / KeyValue pushes into one frame.
struct Frame {
    Op op;
    std::uint32_t repeat;
};

// A count that wrapped negative in the fifth group means no children.
std::uint32_t read_count(ByteReader& reader, const char* what) {
    const std::size_t start = reader.position();
    const std::int32_t count = read_packed_int(reader);
    if (count <= 0) {
        return 0;
    }
    // Every child needs at least one byte.
    if (static_cast<std::size_t>(count) > reader.remaining()) {
        throw DecodeError(
            std::string(what) + " count " + std::to_string(count) + " at offset "
            + std::to_string(start) + " exceeds remaining data"
        );
    }
    return static_cast<std::uint32_t>(count);
}
}  // namespace

std::string read_scalar(ByteReader& reader, const StringTable& strings) {
    const std::size_t start = reader.position();
    const std::uint8_t tag = reader.read_u8();
    switch (static_cast<ScalarType>(tag)) {
        case ScalarType::Value:
            return read_string(reader);
        case ScalarType::Id: {
            const std::int32_t id = read_packed_int(reader);
            const std::string* value = strings.find(id);
            if (value == nullptr) {
                throw DecodeError(
                    "Unknown string table id " + std::to_string(id) + " at offset "
                    + std::to_string(start)
                );
            }
            return *value;
        }
    }
    throw DecodeError(
        "Unrecognized scalar type " + std::to_string(tag) + " at offset " + std::to_string(start)
    );
}

std::size_t decode_tree(ByteReader& reader, const StringTable& strings, EventSink& sink) {
    const std::size_t start = reader.position();

    std::vector<Frame> stack;
    stack.push_back({Op::Item, 1});

    while (!stack.empty()) {
        Frame& top = stack.back();
        const Op op = top.op;
        if (--top.repeat == 0) {
            stack.pop_back();
        }

        switch (op) {
            case Op::Item: {
                const std::size_t item_start = reader.position();
                const std::uint8_t tag = reader.read_u8();
                switch (static_cast<ItemType>(tag)) {
                    case ItemType::Mapping: {
                        sink.start_mapping();
                        stack.push_back({Op::MappingEnd, 1});
                        const std::uint32_t count = read_count(reader, "Pair");
                        if (count > 0) {
                            stack.push_back({Op::KeyValue, count});
                        }
                        break;
                    }
                    case ItemType::Sequence: {
                        sink.start_sequence();
                        stack.push_back({Op::SequenceEnd, 1});
                        const std::uint32_t count = read_count(reader, "Item");
                        if (count > 0) {
                            stack.push_back({Op::Item, count});
                        }
                        break;
                    }
                    case ItemType::Scalar:
                        sink.scalar(read_scalar(reader, strings));
                        break;
                    default:
                        throw DecodeError(
                            "Unrecognized item type " + std::to_string(tag) + " at offset "
                            + std::to_string(item_start)
                        );
                }
                break;
            }
            case Op::KeyValue:
                sink.scalar(read_scalar(reader, strings));
                // Value goes above the remaining sibling pairs.
                stack.push_back({Op::Item, 1});
                break;
            case Op::MappingEnd:
                sink.end_mapping();
                break;
            case Op::SequenceEnd:
                sink.end_sequence();
                break;
        }
    }

    return reader.position() - start;
}
}  // namespace darkcfg::dcb
