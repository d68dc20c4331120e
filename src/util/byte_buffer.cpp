#include "byte_buffer.hpp"
#include <cstring>

namespace deskstream {

void ByteWriter::put_u16(uint16_t v) {
    m_data.push_back((v >> 8) & 0xFF);
    m_data.push_back(v & 0xFF);
}

void ByteWriter::put_u32(uint32_t v) {
    m_data.push_back((v >> 24) & 0xFF);
    m_data.push_back((v >> 16) & 0xFF);
    m_data.push_back((v >> 8) & 0xFF);
    m_data.push_back(v & 0xFF);
}

void ByteWriter::put_u64(uint64_t v) {
    put_u32(static_cast<uint32_t>(v >> 32));
    put_u32(static_cast<uint32_t>(v & 0xFFFFFFFFu));
}

void ByteWriter::put_f64(double v) {
    uint64_t bits;
    static_assert(sizeof(bits) == sizeof(v), "double must be 64 bits");
    memcpy(&bits, &v, sizeof(bits));
    put_u64(bits);
}

void ByteWriter::put_string(const std::string& s) {
    put_bytes(reinterpret_cast<const uint8_t*>(s.data()), s.size());
}

void ByteWriter::put_bytes(const std::vector<uint8_t>& bytes) {
    put_bytes(bytes.data(), bytes.size());
}

void ByteWriter::put_bytes(const uint8_t* data, size_t len) {
    put_u32(static_cast<uint32_t>(len));
    if (len > 0) {
        m_data.insert(m_data.end(), data, data + len);
    }
}

bool ByteReader::need(size_t n) {
    if (m_failed || m_size - m_pos < n) {
        m_failed = true;
        return false;
    }
    return true;
}

bool ByteReader::get_u8(uint8_t& v) {
    if (!need(1)) return false;
    v = m_data[m_pos++];
    return true;
}

bool ByteReader::get_bool(bool& v) {
    uint8_t b;
    if (!get_u8(b)) return false;
    if (b > 1) {
        m_failed = true;
        return false;
    }
    v = (b == 1);
    return true;
}

bool ByteReader::get_u16(uint16_t& v) {
    if (!need(2)) return false;
    v = static_cast<uint16_t>((m_data[m_pos] << 8) | m_data[m_pos + 1]);
    m_pos += 2;
    return true;
}

bool ByteReader::get_u32(uint32_t& v) {
    if (!need(4)) return false;
    v = (static_cast<uint32_t>(m_data[m_pos]) << 24) |
        (static_cast<uint32_t>(m_data[m_pos + 1]) << 16) |
        (static_cast<uint32_t>(m_data[m_pos + 2]) << 8) |
        static_cast<uint32_t>(m_data[m_pos + 3]);
    m_pos += 4;
    return true;
}

bool ByteReader::get_u64(uint64_t& v) {
    uint32_t hi, lo;
    if (!get_u32(hi) || !get_u32(lo)) return false;
    v = (static_cast<uint64_t>(hi) << 32) | lo;
    return true;
}

bool ByteReader::get_i32(int32_t& v) {
    uint32_t u;
    if (!get_u32(u)) return false;
    v = static_cast<int32_t>(u);
    return true;
}

bool ByteReader::get_i64(int64_t& v) {
    uint64_t u;
    if (!get_u64(u)) return false;
    v = static_cast<int64_t>(u);
    return true;
}

bool ByteReader::get_f64(double& v) {
    uint64_t bits;
    if (!get_u64(bits)) return false;
    memcpy(&v, &bits, sizeof(v));
    return true;
}

bool ByteReader::get_string(std::string& s) {
    uint32_t len;
    if (!get_u32(len) || !need(len)) return false;
    s.assign(reinterpret_cast<const char*>(m_data + m_pos), len);
    m_pos += len;
    return true;
}

bool ByteReader::get_bytes(std::vector<uint8_t>& bytes) {
    uint32_t len;
    if (!get_u32(len) || !need(len)) return false;
    bytes.assign(m_data + m_pos, m_data + m_pos + len);
    m_pos += len;
    return true;
}

}  // namespace deskstream
