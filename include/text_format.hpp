#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace quickswitch {

std::string to_lower_ascii(std::string text);
std::string format_file_size(std::uintmax_t bytes);
std::string format_line_number(std::size_t number, std::size_t width = 4);
std::string format_visit_time(std::int64_t unix_seconds);
std::string format_remainder(std::size_t remaining, bool lower_bound);

// Makes tabs, carriage returns and other control bytes visible so arbitrary file
// content cannot drive the terminal.
std::string escape_control_characters(const std::string &line);

// Longest prefix of `text` that ends on a UTF-8 code point boundary and is at most
// `max_bytes` long.
std::string truncate_utf8(const std::string &text, std::size_t max_bytes);

bool is_valid_utf8(const std::string &data, bool allow_truncated_tail);

void pop_utf8_code_point(std::string &text);

}
