#include "util.hpp"
#include <fstream>
#include <iterator>
#include <stdexcept>

namespace webrepl {

bool parse_host_port(const std::string &s, std::string &host, uint16_t &port) {
  auto pos = s.rfind(':');
  if (pos == std::string::npos) {
    host = s;
    return !host.empty();
  }
  host = s.substr(0, pos);
  if (host.empty())
    return false;
  try {
    size_t used = 0;
    int p = std::stoi(s.substr(pos + 1), &used);
    if (used != s.size() - pos - 1 || p <= 0 || p > 65535)
      return false;
    port = (uint16_t)p;
    return true;
  } catch (const std::exception &) {
    return false;
  }
}

std::string bytes_to_hex(const std::vector<uint8_t> &data) {
  static const char digits[] = "0123456789abcdef";
  std::string out;
  out.reserve(data.size() * 2);
  for (uint8_t b : data) {
    out.push_back(digits[b >> 4]);
    out.push_back(digits[b & 0xF]);
  }
  return out;
}

bool read_file(const std::string &path, std::vector<uint8_t> &out,
               std::string &err) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    err = "cannot open " + path;
    return false;
  }
  out.assign(std::istreambuf_iterator<char>(in),
             std::istreambuf_iterator<char>());
  if (in.bad()) {
    err = "read failed for " + path;
    return false;
  }
  return true;
}

bool write_file(const std::string &path, const std::vector<uint8_t> &data,
                std::string &err) {
  std::ofstream f(path, std::ios::binary | std::ios::trunc);
  if (!f) {
    err = "cannot create " + path;
    return false;
  }
  f.write(reinterpret_cast<const char *>(data.data()),
          static_cast<std::streamsize>(data.size()));
  f.flush();
  if (!f.good()) {
    err = "write failed for " + path;
    return false;
  }
  return true;
}

std::string base_name(const std::string &path) {
  auto pos = path.find_last_of('/');
  if (pos == std::string::npos)
    return path;
  return path.substr(pos + 1);
}

} // namespace webrepl
