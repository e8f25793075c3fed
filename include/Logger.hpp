#pragma once
#include <string>

// Append-only line logger shared by every tustat component.
// Each line is written with a single write(2) on an O_APPEND descriptor.
void set_log_file(const std::string& path);
std::string log_file();

void log_info(const std::string& msg);
void log_warn(const std::string& msg);
void log_error(const std::string& msg);
