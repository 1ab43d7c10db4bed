#include "text_format.hpp"

#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace quickswitch {

namespace {

// C0, C1 and F5..FF never start a well-formed sequence.
std::size_t utf8_sequence_length(unsigned char lead) {
    if (lead < 0x80) return 1;
    if (lead >= 0xC2 && lead <= 0xDF) return 2;
    if (lead >= 0xE0 && lead <= 0xEF) return 3;
    if (lead >= 0xF0 && lead <= 0xF4) return 4;
    return 0;
}

bool is_continuation(unsigned char byte) {
    return (byte & 0xC0) == 0x80;
}

// The second byte carries the overlong, surrogate and > U+10FFFF restrictions.
bool valid_second_byte(unsigned char lead, unsigned char byte) {
    switch (lead) {
        case 0xE0: return byte >= 0xA0 && byte <= 0xBF;
        case 0xED: return byte >= 0x80 && byte <= 0x9F;
        case 0xF0: return byte >= 0x90 && byte <= 0xBF;
        case 0xF4: return byte >= 0x80 && byte <= 0x8F;
        default: return is_continuation(byte);
    }
}

}

std::string to_lower_ascii(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

std::string format_file_size(std::uintmax_t bytes) {
    std::ostringstream oss;
    if (bytes < 1024) {
        oss << bytes << " B";
    } else if (bytes < 1024 * 1024) {
        oss << std::fixed << std::setprecision(1) << (bytes / 1024.0) << " KB";
    } else if (bytes < 1024ULL * 1024 * 1024) {
        oss << std::fixed << std::setprecision(1) << (bytes / (1024.0 * 1024.0)) << " MB";
    } else {
        oss << std::fixed << std::setprecision(2) << (bytes / (1024.0 * 1024.0 * 1024.0)) << " GB";
    }
    return oss.str();
}

std::string format_line_number(std::size_t number, std::size_t width) {
    std::ostringstream oss;
    oss << std::setw(static_cast<int>(width)) << std::setfill(' ') << number << ' ';
    return oss.str();
}

std::string format_visit_time(std::int64_t unix_seconds) {
    if (unix_seconds <= 0) {
        return "never";
    }
    std::time_t time = static_cast<std::time_t>(unix_seconds);
    std::tm local{};
    if (localtime_r(&time, &local) == nullptr) {
        return "never";
    }
    std::ostringstream oss;
    oss << std::put_time(&local, "%Y-%m-%d %H:%M");
    return oss.str();
}

std::string format_remainder(std::size_t remaining, bool lower_bound) {
    if (remaining == 0) {
        return {};
    }
    std::string text = "+" + std::to_string(remaining);
    if (lower_bound) {
        text += "+";
    }
    return text + " more";
}

std::string escape_control_characters(const std::string &line) {
    std::string result;
    result.reserve(line.size());
    for (unsigned char c : line) {
        switch (c) {
            case '\t':
                result += "    ";
                break;
            case '\r':
                result += "\\r";
                break;
            case '\0':
                result += "\\0";
                break;
            default:
                if (c < 0x20 || c == 0x7F) {
                    std::ostringstream oss;
                    oss << "\\x" << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(c);
                    result += oss.str();
                } else {
                    result.push_back(static_cast<char>(c));
                }
                break;
        }
    }
    return result;
}

std::string truncate_utf8(const std::string &text, std::size_t max_bytes) {
    if (text.size() <= max_bytes) {
        return text;
    }
    std::size_t cut = max_bytes;
    while (cut > 0 && is_continuation(static_cast<unsigned char>(text[cut]))) {
        --cut;
    }
    return text.substr(0, cut);
}

bool is_valid_utf8(const std::string &data, bool allow_truncated_tail) {
    std::size_t i = 0;
    while (i < data.size()) {
        const auto lead = static_cast<unsigned char>(data[i]);
        const std::size_t length = utf8_sequence_length(lead);
        if (length == 0) {
            return false;
        }
        const bool truncated = i + length > data.size();
        if (truncated && !allow_truncated_tail) {
            return false;
        }
        const std::size_t available = truncated ? data.size() - i : length;
        if (available > 1 && !valid_second_byte(lead, static_cast<unsigned char>(data[i + 1]))) {
            return false;
        }
        for (std::size_t j = 2; j < available; ++j) {
            if (!is_continuation(static_cast<unsigned char>(data[i + j]))) {
                return false;
            }
        }
        i += available;
    }
    return true;
}

void pop_utf8_code_point(std::string &text) {
    if (text.empty()) {
        return;
    }
    std::size_t cut = text.size() - 1;
    while (cut > 0 && is_continuation(static_cast<unsigned char>(text[cut]))) {
        --cut;
    }
    text.erase(cut);
}

}
