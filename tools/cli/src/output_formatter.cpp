/**
 * @file output_formatter.cpp
 * @brief Output formatting implementation
 */

#include "output_formatter.hpp"

#include <cstdio>
#include <iostream>
#include <type_traits>

namespace uuidinfo::cli {

OutputFormatter::OutputFormatter(bool json_mode)
    : json_mode_(json_mode) {}

void OutputFormatter::print_report(const core::Report& report) {
    if (json_mode_) {
        JsonFields obj;
        obj.reserve(report.fields.size() + 1);
        obj.emplace_back("uuid", report.uuid);
        for (const auto& [label, value] : report.fields) {
            obj.emplace_back(label, value);
        }
        print_json(obj);
    } else {
        std::cout << core::renderText(report);
    }
}

void OutputFormatter::print_error(const std::string& input, const std::string& message) {
    if (json_mode_) {
        print_json(JsonFields{{"input", input}, {"error", message}});
    } else {
        std::cerr << "(error) " << message << "\n";
    }
}

void OutputFormatter::print_json(const JsonObject& obj) {
    std::cout << json_stringify(obj) << "\n";
}

void OutputFormatter::print_line(const std::string& text) {
    std::cout << text << "\n";
}

void OutputFormatter::flush() {
    std::cout.flush();
}

std::string OutputFormatter::escape_json_string(const std::string& s) const {
    std::string result;
    result.reserve(s.size());
    for (char c : s) {
        switch (c) {
            case '"':  result += "\\\""; break;
            case '\\': result += "\\\\"; break;
            case '\b': result += "\\b"; break;
            case '\f': result += "\\f"; break;
            case '\n': result += "\\n"; break;
            case '\r': result += "\\r"; break;
            case '\t': result += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned char>(c));
                    result += buf;
                } else {
                    result += c;
                }
        }
    }
    return result;
}

std::string OutputFormatter::json_stringify(const JsonObject& obj) const {
    return std::visit([this](const auto& val) -> std::string {
        using T = std::decay_t<decltype(val)>;

        if constexpr (std::is_same_v<T, std::string>) {
            return "\"" + escape_json_string(val) + "\"";
        } else {
            if (val.empty()) return "{}";
            std::string result = "{";
            bool first = true;
            for (const auto& [k, v] : val) {
                if (!first) result += ",";
                first = false;
                result += "\"" + escape_json_string(k) + "\":" + json_stringify(v);
            }
            result += "}";
            return result;
        }
    }, obj.value);
}

// OutputBuffer implementation
OutputBuffer::OutputBuffer() {
    old_cout_ = std::cout.rdbuf(buffer_.rdbuf());
}

OutputBuffer::~OutputBuffer() {
    std::cout.rdbuf(old_cout_);
}

std::string OutputBuffer::str() const {
    return buffer_.str();
}

} // namespace uuidinfo::cli
