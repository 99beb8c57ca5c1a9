#include "mapstream/ReadBuffer.hpp"

#include "mapstream/Log.hpp"

#include <cerrno>
#include <cstring>

#include <unistd.h>

namespace mapstream {

bool readFully(int fd, uint64_t offset, uint8_t* dst, size_t length){
    size_t done = 0;
    while(done < length){
        ssize_t n = ::pread(fd, dst + done, length - done, (off_t)(offset + done));
        if(n < 0){
            if(errno == EINTR) continue;
            logWarn("ReadBuffer", str("read failed at offset ", offset + done, ": ", std::strerror(errno)));
            return false;
        }
        if(n == 0) return false;
        done += (size_t)n;
    }
    return true;
}

ReadBuffer ReadBuffer::fromBytes(const uint8_t* data, size_t size){
    ReadBuffer rb;
    rb.m_data.assign(data, data + size);
    return rb;
}

bool ReadBuffer::readFromFile(size_t length){
    return readFromFile(m_filePosition, length);
}

bool ReadBuffer::readFromFile(uint64_t offset, size_t length){
    m_error.clear();
    m_bufferPosition = 0;
    m_data.clear();

    if(length > MAXIMUM_BUFFER_SIZE){
        logWarn("ReadBuffer", str("invalid read length: ", length));
        return false;
    }
    if(m_fd < 0) return false;

    m_data.resize(length);
    if(!readFully(m_fd, offset, m_data.data(), length)){
        m_data.clear();
        return false;
    }
    m_filePosition = offset + length;
    return true;
}

void ReadBuffer::fail(const std::string& message){
    if(m_error.empty()) m_error = message;
}

bool ReadBuffer::require(size_t n, const char* what){
    if(!m_error.empty()) return false;
    if(n > remaining()){
        fail(str("buffer underflow reading ", what, " at position ", m_bufferPosition));
        return false;
    }
    return true;
}

int8_t ReadBuffer::readByte(){
    if(!require(1, "byte")) return 0;
    return (int8_t)m_data[m_bufferPosition++];
}

int16_t ReadBuffer::readShort(){
    if(!require(2, "short")) return 0;
    const uint8_t* p = m_data.data() + m_bufferPosition;
    m_bufferPosition += 2;
    return (int16_t)(((uint16_t)p[0] << 8) | (uint16_t)p[1]);
}

int32_t ReadBuffer::readInt(){
    if(!require(4, "int")) return 0;
    const uint8_t* p = m_data.data() + m_bufferPosition;
    m_bufferPosition += 4;
    return (int32_t)(((uint32_t)p[0] << 24) | ((uint32_t)p[1] << 16) | ((uint32_t)p[2] << 8) | (uint32_t)p[3]);
}

int64_t ReadBuffer::readLong(){
    if(!require(8, "long")) return 0;
    const uint8_t* p = m_data.data() + m_bufferPosition;
    m_bufferPosition += 8;
    uint64_t v = 0;
    for(int i=0;i<8;i++) v = (v << 8) | p[i];
    return (int64_t)v;
}

uint32_t ReadBuffer::readUnsignedInt(){
    if(!m_error.empty()) return 0;
    uint32_t value = 0;
    size_t pos = m_bufferPosition;
    for(int i=0;i<5;i++){
        if(pos >= m_data.size()){
            fail(str("buffer underflow reading variable length integer at position ", m_bufferPosition));
            return 0;
        }
        const uint8_t b = m_data[pos++];
        if(i == 4 && (b & 0xf0) != 0){
            // 4*7 bits already consumed; only four more fit into 32 bits
            fail(str("variable length integer exceeds 32 bits at position ", m_bufferPosition));
            return 0;
        }
        value |= (uint32_t)(b & 0x7f) << (7 * i);
        if((b & 0x80) == 0){
            m_bufferPosition = pos;
            return value;
        }
    }
    fail(str("variable length integer exceeds 32 bits at position ", m_bufferPosition));
    return 0;
}

int32_t ReadBuffer::readSignedInt(){
    if(!m_error.empty()) return 0;
    uint32_t value = 0;
    size_t pos = m_bufferPosition;
    for(int i=0;i<5;i++){
        if(pos >= m_data.size()){
            fail(str("buffer underflow reading variable length integer at position ", m_bufferPosition));
            return 0;
        }
        const uint8_t b = m_data[pos++];
        if(b & 0x80){
            if(i == 4) break;
            value |= (uint32_t)(b & 0x7f) << (7 * i);
            continue;
        }
        // last byte: sign bit plus six payload bits
        if(i == 4 && (b & 0x3f) > 0x07) break;
        value |= (uint32_t)(b & 0x3f) << (7 * i);
        m_bufferPosition = pos;
        return (b & 0x40) ? -(int32_t)value : (int32_t)value;
    }
    fail(str("variable length integer exceeds 32 bits at position ", m_bufferPosition));
    return 0;
}

std::optional<std::string> ReadBuffer::readUTF8EncodedString(){
    const size_t start = m_bufferPosition;
    const uint32_t length = readUnsignedInt();
    if(!good()) return std::nullopt;
    if(length == 0) return std::nullopt;
    if(length > remaining()){
        logWarn("ReadBuffer", str("invalid string length: ", length, " at position ", start));
        return std::nullopt;
    }
    return readUTF8EncodedString(length);
}

std::optional<std::string> ReadBuffer::readUTF8EncodedString(size_t length){
    if(!require(length, "string")) return std::nullopt;
    std::string s((const char*)m_data.data() + m_bufferPosition, length);
    m_bufferPosition += length;
    return s;
}

void ReadBuffer::skipBytes(size_t n){
    if(!require(n, "skipped bytes")) return;
    m_bufferPosition += n;
}

void ReadBuffer::setBufferPosition(size_t pos){
    if(pos > m_data.size()){
        fail(str("invalid buffer position: ", pos));
        return;
    }
    m_bufferPosition = pos;
}

} // namespace mapstream
