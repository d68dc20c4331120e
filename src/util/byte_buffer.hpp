#pragma once

#include <cstdint>
#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace deskstream {

// Big-endian field writer for message payloads.
// Strings and blobs are written as [length:4][bytes].
class ByteWriter {
public:
    void put_u8(uint8_t v) { m_data.push_back(v); }
    void put_bool(bool v) { put_u8(v ? 1 : 0); }
    void put_u16(uint16_t v);
    void put_u32(uint32_t v);
    void put_u64(uint64_t v);
    void put_i32(int32_t v) { put_u32(static_cast<uint32_t>(v)); }
    void put_i64(int64_t v) { put_u64(static_cast<uint64_t>(v)); }
    void put_f64(double v);
    void put_string(const std::string& s);
    void put_bytes(const std::vector<uint8_t>& bytes);
    void put_bytes(const uint8_t* data, size_t len);

    const std::vector<uint8_t>& data() const { return m_data; }
    std::vector<uint8_t> take() { return std::move(m_data); }
    size_t size() const { return m_data.size(); }

private:
    std::vector<uint8_t> m_data;
};

// Reader counterpart. Every getter returns false once the input is exhausted
// or a declared length runs past the end; the reader then stays failed.
class ByteReader {
public:
    ByteReader(const uint8_t* data, size_t size) : m_data(data), m_size(size) {}
    explicit ByteReader(const std::vector<uint8_t>& buf) : ByteReader(buf.data(), buf.size()) {}

    bool get_u8(uint8_t& v);
    bool get_bool(bool& v);
    bool get_u16(uint16_t& v);
    bool get_u32(uint32_t& v);
    bool get_u64(uint64_t& v);
    bool get_i32(int32_t& v);
    bool get_i64(int64_t& v);
    bool get_f64(double& v);
    bool get_string(std::string& s);
    bool get_bytes(std::vector<uint8_t>& bytes);

    size_t remaining() const { return m_failed ? 0 : m_size - m_pos; }
    bool ok() const { return !m_failed; }
    bool at_end() const { return !m_failed && m_pos == m_size; }

private:
    bool need(size_t n);

    const uint8_t* m_data = nullptr;
    size_t m_size = 0;
    size_t m_pos = 0;
    bool m_failed = false;
};

}  // namespace deskstream
