/**
 * @file output_formatter.hpp
 * @brief Output formatting for uuidinfo-cli (text and JSON)
 */

#pragma once

#include <uuidinfo/core/report_builder.hpp>

#include <sstream>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace uuidinfo::cli {

struct JsonObject;

/// Object members in insertion order.
using JsonFields = std::vector<std::pair<std::string, JsonObject>>;

/**
 * @brief JSON value types for output
 */
using JsonValue = std::variant<std::string, JsonFields>;

struct JsonObject {
    JsonValue value;

    JsonObject() : value(std::string()) {}
    JsonObject(const char* s) : value(std::string(s)) {}
    JsonObject(const std::string& s) : value(s) {}
    JsonObject(JsonFields obj) : value(std::move(obj)) {}
};

/**
 * @brief Output formatter supporting text and JSON reports
 */
class OutputFormatter {
public:
    explicit OutputFormatter(bool json_mode = false);

    /**
     * @brief Print one report: the text block, or
     * {"uuid": ..., "<label>": ...} in JSON mode with fields in report order.
     */
    void print_report(const core::Report& report);

    /**
     * @brief Print a failure for one input.
     * @param input The text that failed
     * @param message Full cause chain
     */
    void print_error(const std::string& input, const std::string& message);

    void print_json(const JsonObject& obj);
    void print_line(const std::string& text);

    void flush();

    std::string json_stringify(const JsonObject& obj) const;

private:
    bool json_mode_;

    std::string escape_json_string(const std::string& s) const;
};

/**
 * @brief RAII helper for scoped std::cout capture
 */
class OutputBuffer {
public:
    OutputBuffer();
    ~OutputBuffer();

    std::string str() const;

private:
    std::stringstream buffer_;
    std::streambuf* old_cout_;
};

} // namespace uuidinfo::cli
