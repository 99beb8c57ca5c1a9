#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace mapstream {

// pread() until `length` bytes arrived; false on EOF or I/O error.
bool readFully(int fd, uint64_t offset, uint8_t* dst, size_t length);

// Working window over a map file plus a read cursor.
//
// Fixed-width integers are big-endian. Variable-length integers carry 7 payload
// bits per byte, lowest group first, with the high bit set on every byte except
// the last. Signed variable-length integers use bit 0x40 of the last byte as the
// sign and keep 6 payload bits there.
//
// Reads that would run past the end of the window set a sticky fail state,
// return 0 and leave the cursor where it was. Check good() after a group of
// reads, like a std::istream.
class ReadBuffer {
public:
    // Largest window readFromFile() will allocate.
    static constexpr size_t MAXIMUM_BUFFER_SIZE = 2500000;

    // Byte reader over a file descriptor owned by the caller.
    explicit ReadBuffer(int fd = -1) : m_fd(fd) {}

    // Byte reader over an in-memory region (no file behind it).
    static ReadBuffer fromBytes(const uint8_t* data, size_t size);

    // Load the next `length` bytes of the file into the window and rewind the
    // cursor. Returns false when fewer bytes are available.
    bool readFromFile(size_t length);
    // Same, starting at an absolute file offset.
    bool readFromFile(uint64_t offset, size_t length);

    int8_t readByte();
    int16_t readShort();
    int32_t readInt();
    int64_t readLong();

    uint32_t readUnsignedInt();
    int32_t readSignedInt();

    // Variable-length size prefix followed by UTF-8 bytes. Empty on a zero
    // length or a length beyond the window (no fail state in that case).
    std::optional<std::string> readUTF8EncodedString();
    std::optional<std::string> readUTF8EncodedString(size_t length);

    void skipBytes(size_t n);

    size_t getBufferPosition() const { return m_bufferPosition; }
    void setBufferPosition(size_t pos);
    size_t getBufferSize() const { return m_data.size(); }
    size_t remaining() const { return m_data.size() - m_bufferPosition; }

    bool good() const { return m_error.empty(); }
    explicit operator bool() const { return good(); }
    const std::string& error() const { return m_error; }
    void clearError(){ m_error.clear(); }

private:
    bool require(size_t n, const char* what);
    void fail(const std::string& message);

    int m_fd = -1;
    uint64_t m_filePosition = 0;
    std::vector<uint8_t> m_data;
    size_t m_bufferPosition = 0;
    std::string m_error;
};

} // namespace mapstream
