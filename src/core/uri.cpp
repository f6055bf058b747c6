#include "reroute/core/uri.hpp"

#include <cctype>
#include <iomanip>
#include <sstream>

namespace reroute::uri {

namespace {

bool uri_safe(char c) {
    if (std::isalnum(static_cast<unsigned char>(c))) return true;
    switch (c) {
        case '-': case '_': case '.': case '!': case '~': case '*':
        case '\'': case '(': case ')': case ';': case '/': case '?':
        case ':': case '@': case '&': case '=': case '+': case '$':
        case ',': case '[': case ']':
            return true;
        default:
            return false;
    }
}

void append_encoded(std::ostringstream& oss, char c) {
    oss << '%' << std::hex << std::uppercase << std::setw(2) << std::setfill('0')
        << static_cast<int>(static_cast<unsigned char>(c));
}

void build_value(std::string& out, const ParamValue& value, const std::string& prefix) {
    auto append = [&out](const std::string& piece) {
        if (piece.empty()) return;
        if (!out.empty()) out += '&';
        out += piece;
    };

    if (value.is_array()) {
        for (const auto& item : value.as_array()) {
            build_value(out, item, prefix + "[]");
        }
    } else if (value.is_hash()) {
        for (const auto& [key, item] : value.as_hash()) {
            build_value(out, item, prefix.empty() ? escape(key) : prefix + "[" + escape(key) + "]");
        }
    } else if (value.is_null()) {
        append(prefix);
    } else {
        append(prefix + "=" + escape(*value.to_param()));
    }
}

} // anonymous namespace

std::string escape_uri(std::string_view value) {
    std::ostringstream oss;
    for (char c : value) {
        if (uri_safe(c)) {
            oss << c;
        } else {
            append_encoded(oss, c);
        }
    }
    return oss.str();
}

std::string escape(std::string_view value) {
    std::ostringstream oss;
    for (char c : value) {
        if (std::isalnum(static_cast<unsigned char>(c)) ||
            c == '-' || c == '_' || c == '.' || c == '~' || c == '*') {
            oss << c;
        } else if (c == ' ') {
            oss << '+';
        } else {
            append_encoded(oss, c);
        }
    }
    return oss.str();
}

std::string build_nested_query(const Params& params) {
    std::string out;
    for (const auto& [key, value] : params) {
        build_value(out, value, escape(key));
    }
    return out;
}

} // namespace reroute::uri
