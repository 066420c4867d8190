#pragma once
#include <string>
#include <cstdint>
#include <cstddef>
#include <vector>

namespace webrepl {

// "host" or "host:port"; port keeps its value when absent.
bool parse_host_port(const std::string& s, std::string& host, uint16_t& port);
std::string bytes_to_hex(const std::vector<uint8_t>& data);

bool read_file(const std::string& path, std::vector<uint8_t>& out, std::string& err);
bool write_file(const std::string& path, const std::vector<uint8_t>& data, std::string& err);

// Last path component, used as the default remote/local name.
std::string base_name(const std::string& path);

} // namespace webrepl
