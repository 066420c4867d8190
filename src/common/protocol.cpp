#include "protocol.hpp"
#include <cstring>

namespace webrepl {

static inline void store_le16(uint8_t *p, uint16_t v) {
  p[0] = (uint8_t)(v & 0xFF);
  p[1] = (uint8_t)((v >> 8) & 0xFF);
}

static inline void store_le32(uint8_t *p, uint32_t v) {
  p[0] = (uint8_t)(v & 0xFF);
  p[1] = (uint8_t)((v >> 8) & 0xFF);
  p[2] = (uint8_t)((v >> 16) & 0xFF);
  p[3] = (uint8_t)((v >> 24) & 0xFF);
}

static inline uint16_t load_le16(const uint8_t *p) {
  return (uint16_t)(p[0] | (p[1] << 8));
}

const char *error_str(Error e) {
  switch (e) {
  case Error::None:
    return "ok";
  case Error::InvalidFrame:
    return "invalid frame";
  case Error::ChunkLengthMismatch:
    return "chunk length mismatch";
  case Error::RemoteRejected:
    return "rejected by device";
  case Error::FilenameTooLong:
    return "filename too long";
  case Error::InvalidFilename:
    return "filename is not valid UTF-8";
  case Error::SizeOverflow:
    return "file too large";
  case Error::Busy:
    return "transfer already in progress";
  default:
    return "transport error";
  }
}

bool is_valid_utf8(const std::string &s) {
  size_t i = 0, n = s.size();
  while (i < n) {
    uint8_t c = (uint8_t)s[i];
    size_t extra;
    uint32_t cp;
    if (c < 0x80) {
      i++;
      continue;
    } else if ((c & 0xE0) == 0xC0) {
      extra = 1;
      cp = c & 0x1F;
    } else if ((c & 0xF0) == 0xE0) {
      extra = 2;
      cp = c & 0x0F;
    } else if ((c & 0xF8) == 0xF0) {
      extra = 3;
      cp = c & 0x07;
    } else {
      return false;
    }
    if (i + extra >= n)
      return false;
    for (size_t k = 1; k <= extra; k++) {
      uint8_t cc = (uint8_t)s[i + k];
      if ((cc & 0xC0) != 0x80)
        return false;
      cp = (cp << 6) | (cc & 0x3F);
    }
    // overlong forms, surrogates, out of range
    if ((extra == 1 && cp < 0x80) || (extra == 2 && cp < 0x800) ||
        (extra == 3 && cp < 0x10000) || cp > 0x10FFFF ||
        (cp >= 0xD800 && cp <= 0xDFFF))
      return false;
    i += extra + 1;
  }
  return true;
}

static bool build_request(Opcode op, const std::string &filename,
                          uint32_t size, std::vector<uint8_t> &out, Error &err,
                          FilenamePolicy policy) {
  size_t name_len = filename.size();
  if (policy == FilenamePolicy::Strict) {
    if (name_len > kMaxNameLen) {
      err = Error::FilenameTooLong;
      return false;
    }
    if (!is_valid_utf8(filename)) {
      err = Error::InvalidFilename;
      return false;
    }
  } else if (name_len > kMaxNameLen) {
    name_len = kMaxNameLen;
  }

  out.assign(kRequestFrameSize, 0);
  uint8_t *p = out.data();
  p[offsetof(RequestFrame, sig)] = kRequestSig[0];
  p[offsetof(RequestFrame, sig) + 1] = kRequestSig[1];
  p[offsetof(RequestFrame, op)] = static_cast<uint8_t>(op);
  store_le32(p + offsetof(RequestFrame, file_size), size);
  store_le16(p + offsetof(RequestFrame, name_len), (uint16_t)name_len);
  if (name_len)
    std::memcpy(p + offsetof(RequestFrame, name), filename.data(), name_len);
  err = Error::None;
  return true;
}

bool encode_put_request(const std::string &filename, uint64_t size,
                        std::vector<uint8_t> &out, Error &err,
                        FilenamePolicy policy) {
  if (size > 0xFFFFFFFFull) {
    err = Error::SizeOverflow;
    return false;
  }
  return build_request(Opcode::PUT, filename, (uint32_t)size, out, err,
                       policy);
}

bool encode_get_request(const std::string &filename, std::vector<uint8_t> &out,
                        Error &err, FilenamePolicy policy) {
  return build_request(Opcode::GET, filename, 0, out, err, policy);
}

std::vector<uint8_t> encode_version_request() {
  std::vector<uint8_t> out(kRequestFrameSize, 0);
  out[offsetof(RequestFrame, sig)] = kRequestSig[0];
  out[offsetof(RequestFrame, sig) + 1] = kRequestSig[1];
  out[offsetof(RequestFrame, op)] = static_cast<uint8_t>(Opcode::GET_VER);
  return out;
}

bool decode_response(const uint8_t *data, size_t len, uint16_t &status) {
  if (len < kResponseFrameSize)
    return false;
  if (data[0] != kResponseSig[0] || data[1] != kResponseSig[1])
    return false;
  status = load_le16(data + 2);
  return true;
}

bool decode_chunk_header(const uint8_t *data, size_t len, uint16_t &chunk_len) {
  if (len < kChunkHeaderSize)
    return false;
  chunk_len = load_le16(data);
  return true;
}

} // namespace webrepl
