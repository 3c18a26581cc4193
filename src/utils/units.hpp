#pragma once
#include <cstdint>
#include <string>

std::string bytes2human(uint64_t size, const char* default_unit = "");
std::string seconds2human(uint64_t seconds, size_t max_units = 2);
