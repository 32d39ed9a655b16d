#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <variant>
#include <vector>
#include "core/errors/step_errors.hpp"

namespace stepgate::when {

// A value of the embedded guard language.
struct CelValue {
    using List = std::vector<CelValue>;
    using Data = std::variant<std::monostate, bool, std::int64_t, double, std::string, List>;

    Data data;

    CelValue() = default;
    CelValue(bool value) : data(value) {}
    CelValue(std::int64_t value) : data(value) {}
    CelValue(double value) : data(value) {}
    CelValue(std::string value) : data(std::move(value)) {}
    CelValue(List value) : data(std::move(value)) {}

    bool is_null() const { return std::holds_alternative<std::monostate>(data); }
    bool is_bool() const { return std::holds_alternative<bool>(data); }
    bool is_int() const { return std::holds_alternative<std::int64_t>(data); }
    bool is_double() const { return std::holds_alternative<double>(data); }
    bool is_string() const { return std::holds_alternative<std::string>(data); }
    bool is_list() const { return std::holds_alternative<List>(data); }
};

std::string type_name(const CelValue& value);

struct CelNode;

// A compiled guard expression. The language has literals, lists, the usual
// arithmetic / comparison / logical operators, `in`, `?:` and a handful of
// string functions, but no variables: every identifier is an undeclared
// reference and fails compilation.
class CelProgram {
public:
    static core::errors::Result<CelProgram> compile(const std::string& source);

    core::errors::Result<CelValue> evaluate() const;

    const std::string& source() const { return source_; }

private:
    CelProgram(std::string source, std::shared_ptr<const CelNode> root);

    std::string source_;
    std::shared_ptr<const CelNode> root_;
};

}  // namespace stepgate::when
