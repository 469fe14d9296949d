/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include "dcb_errors.h"

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>

namespace darkcfg::dcb {
enum class Endian : std::uint8_t {
    Little,
    Big,
};

class ByteReader {
   public:
    explicit ByteReader(std::span<const std::uint8_t> data, Endian endian = Endian::Little)
        : _data(data), _pos(0), _endian(endian) {}

    std::size_t position() const { return _pos; }
    std::size_t size() const { return _data.size(); }
    std::size_t remaining() const { return _data.size() - _pos; }
    bool at_end() const { return _pos >= _data.size(); }

    Endian endian() const { return _endian; }
    void set_endian(Endian endian) { _endian = endian; }

    std::uint8_t read_u8() {
        require(1);
        return _data[_pos++];
    }

    std::uint16_t read_u16() { return static_cast<std::uint16_t>(read_uint(2)); }
    std::uint32_t read_u32() { return static_cast<std::uint32_t>(read_uint(4)); }
    std::int32_t read_s32() { return static_cast<std::int32_t>(read_u32()); }
    std::uint64_t read_u64() { return read_uint(8); }
    std::int64_t read_s64() { return static_cast<std::int64_t>(read_u64()); }

    std::span<const std::uint8_t> read_bytes(std::size_t count) {
        require(count);
        const auto out = _data.subspan(_pos, count);
        _pos += count;
        return out;
    }

    void seek(std::size_t pos) {
        if (pos > _data.size()) {
            throw FormatError(std::string("Seek past end of data"));
        }
        _pos = pos;
    }

   private:
    void require(std::size_t count) const {
        if (count > remaining()) {
            throw FormatError(
                "Unexpected end of data at offset " + std::to_string(_pos) + " (need "
                + std::to_string(count) + " bytes, have " + std::to_string(remaining()) + ")"
            );
        }
    }

    std::uint64_t read_uint(int byte_count) {
        require(static_cast<std::size_t>(byte_count));
        std::uint64_t v = 0;
        if (_endian == Endian::Little) {
            for (int i = byte_count - 1; i >= 0; i--) {
                v = (v << 8) | _data[_pos + static_cast<std::size_t>(i)];
            }
        } else {
            for (int i = 0; i < byte_count; i++) {
                v = (v << 8) | _data[_pos + static_cast<std::size_t>(i)];
            }
        }
        _pos += static_cast<std::size_t>(byte_count);
        return v;
    }

    std::span<const std::uint8_t> _data;
    std::size_t _pos;
    Endian _endian;
};
}  // namespace darkcfg::dcb
