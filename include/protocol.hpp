#pragma once
#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>

namespace webrepl {

constexpr uint8_t  kRequestSig[2]  = {'W', 'A'};
constexpr uint8_t  kResponseSig[2] = {'W', 'B'};
constexpr size_t   kMaxNameLen = 64;
constexpr size_t   kPutChunkSize = 1024;
constexpr uint8_t  kAckByte = 0;
constexpr uint16_t kDefaultPort = 8266;

enum class Opcode : uint8_t { PUT = 1, GET = 2, GET_VER = 3 };

// Wire layout of a request ("<2sBBQLH64s"). All integers little-endian.
#pragma pack(push, 1)
struct RequestFrame {
    uint8_t  sig[2];
    uint8_t  op;
    uint8_t  flag;
    uint64_t reserved;
    uint32_t file_size;
    uint16_t name_len;
    uint8_t  name[kMaxNameLen];
};
#pragma pack(pop)
static_assert(sizeof(RequestFrame) == 82, "RequestFrame must be 82 bytes");

constexpr size_t kRequestFrameSize = sizeof(RequestFrame);
constexpr size_t kResponseFrameSize = 4;
constexpr size_t kChunkHeaderSize = 2;

enum class Error : uint8_t {
    None = 0,
    InvalidFrame,
    ChunkLengthMismatch,
    RemoteRejected,
    FilenameTooLong,
    InvalidFilename,
    SizeOverflow,
    Busy,
    Transport
};

const char* error_str(Error e);

enum class FilenamePolicy : uint8_t { Strict, Truncate };

bool encode_put_request(const std::string& filename, uint64_t size,
                        std::vector<uint8_t>& out, Error& err,
                        FilenamePolicy policy = FilenamePolicy::Strict);
bool encode_get_request(const std::string& filename,
                        std::vector<uint8_t>& out, Error& err,
                        FilenamePolicy policy = FilenamePolicy::Strict);
std::vector<uint8_t> encode_version_request();

// Returns false (InvalidFrame) on a short buffer or a bad signature.
bool decode_response(const uint8_t* data, size_t len, uint16_t& status);

// Chunk payload starts at kChunkHeaderSize.
bool decode_chunk_header(const uint8_t* data, size_t len, uint16_t& chunk_len);

bool is_valid_utf8(const std::string& s);

} // namespace webrepl
