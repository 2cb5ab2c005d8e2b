#include "remote_errors.hpp"
#include <cctype>
#include <cstdint>
#include <sstream>

static bool contains(const std::string& haystack, const char* needle) {
    return haystack.find(needle) != std::string::npos;
}

ErrorKind classify_remote_error(const std::string& message, bool& permanent) {
    permanent = false;

    if (contains(message, "No space left on device") ||
        contains(message, "Disk quota exceeded") ||
        contains(message, "quota exceeded")) {
        permanent = true;
        return ErrorKind::IOError;
    }

    if (contains(message, "Permission denied") ||
        contains(message, "No such file or directory") ||
        contains(message, "Not a directory") ||
        contains(message, "Is a directory") ||
        contains(message, "Read-only file system")) {
        return ErrorKind::InvalidDestination;
    }

    return ErrorKind::IOError;
}

std::string parse_sha256_from_output(const std::string& output) {
    size_t run = 0;
    for (size_t i = 0; i < output.size(); i++) {
        if (std::isxdigit(static_cast<unsigned char>(output[i]))) {
            run++;
            bool at_end = (i + 1 == output.size()) ||
                          !std::isxdigit(static_cast<unsigned char>(output[i + 1]));
            if (run == 64 && at_end) {
                std::string hex = output.substr(i + 1 - 64, 64);
                for (auto& c : hex) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
                return hex;
            }
        } else {
            run = 0;
        }
    }
    return "";
}

bool parse_int_from_output(const std::string& output, int64_t& value) {
    std::istringstream in(output);
    std::string token;
    while (in >> token) {
        size_t start = (token[0] == '-') ? 1 : 0;
        if (start == token.size()) continue;
        bool digits = true;
        for (size_t i = start; i < token.size(); i++) {
            if (!std::isdigit(static_cast<unsigned char>(token[i]))) { digits = false; break; }
        }
        if (!digits) continue;
        try {
            value = std::stoll(token);
            return true;
        } catch (const std::exception&) {
            continue;
        }
    }
    return false;
}
