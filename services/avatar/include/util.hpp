#pragma once
#include <string>

std::string getenv_or(const char* key, const std::string& def);
std::string trim(const std::string& s);
std::string gen_uuid_v4();
std::string sha1_hex(const std::string& data);
bool constant_time_equals(const std::string& a, const std::string& b);
