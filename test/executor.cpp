#include "../validator.hpp"
#include <cstdint>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>
#include <sstream>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

using namespace weft;

struct signature_json {
    std::vector<std::string> params;
    std::vector<std::string> results;
};

NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(signature_json, params, results)

struct body_context {
    std::vector<std::string> params;
    std::vector<std::string> results;
    std::vector<signature_json> types;
    bool memory = false;
};

namespace nlohmann {
template <> struct adl_serializer<body_context> {
    static void to_json(json &j, const body_context &opt) {
        j = json{{"params", opt.params},
                 {"results", opt.results},
                 {"types", opt.types},
                 {"memory", opt.memory}};
    }

    static void from_json(const json &j, body_context &opt) {
        if (j.contains("params"))
            opt.params = j["params"];
        if (j.contains("results"))
            opt.results = j["results"];
        if (j.contains("types"))
            opt.types = j["types"];
        if (j.contains("memory"))
            opt.memory = j["memory"];
    }
};
} // namespace nlohmann

struct test_valid {
    std::string type;
    int line;
    std::string name;
    std::string body;
    body_context context;
    int funclets = -1;
    int edges = -1;
};

namespace nlohmann {
template <> struct adl_serializer<test_valid> {
    static void to_json(json &j, const test_valid &opt) {
        j = json{{"type", opt.type}, {"line", opt.line},
                 {"name", opt.name}, {"body", opt.body},
                 {"funclets", opt.funclets}, {"edges", opt.edges}};
    }

    static void from_json(const json &j, test_valid &opt) {
        opt.type = j["type"];
        opt.line = j["line"];
        opt.name = j["name"];
        opt.body = j["body"];
        opt.context = j.get<body_context>();
        if (j.contains("funclets"))
            opt.funclets = j["funclets"];
        if (j.contains("edges"))
            opt.edges = j["edges"];
    }
};
} // namespace nlohmann

struct test_invalid {
    std::string type;
    int line;
    std::string name;
    std::string body;
    body_context context;
    std::string kind;
    std::string text;
};

namespace nlohmann {
template <> struct adl_serializer<test_invalid> {
    static void to_json(json &j, const test_invalid &opt) {
        j = json{{"type", opt.type}, {"line", opt.line}, {"name", opt.name},
                 {"body", opt.body}, {"kind", opt.kind}, {"text", opt.text}};
    }

    static void from_json(const json &j, test_invalid &opt) {
        opt.type = j["type"];
        opt.line = j["line"];
        opt.name = j["name"];
        opt.body = j["body"];
        opt.context = j.get<body_context>();
        opt.text = j["text"];
        if (j.contains("kind"))
            opt.kind = j["kind"];
        else
            opt.kind = error_kind_name(ErrorKind::malformed_encoding);
    }
};
} // namespace nlohmann

using Tests = std::variant<test_valid, test_invalid>;

namespace nlohmann {
template <> struct adl_serializer<Tests> {
    static void to_json(json &j, const Tests &opt) {
        std::visit([&j](auto &&arg) { j = arg; }, opt);
    }

    static void from_json(const json &j, Tests &opt) {
        if (j["type"] == "assert_valid") {
            opt = j.get<test_valid>();
        } else if (j["type"] == "assert_invalid" ||
                   j["type"] == "assert_malformed") {
            opt = j.get<test_invalid>();
        } else {
            throw std::runtime_error("unknown command type: " +
                                     j["type"].get<std::string>());
        }
    }
};
} // namespace nlohmann

struct funcletjson {
    std::string source_filename;
    std::vector<Tests> commands;
};

NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(funcletjson, source_filename, commands)

valtype_vector to_valtypes(const std::vector<std::string> &names) {
    valtype_vector types;
    for (auto &name : names) {
        auto type = valtype_from_name(name);
        if (!type)
            throw std::runtime_error("unknown value type: " + name);
        types.push_back(*type);
    }
    return types;
}

TypeContext to_context(const body_context &context) {
    auto result = TypeContext{};
    for (auto &type : context.types)
        result.types.push_back(
            Signature{to_valtypes(type.params), to_valtypes(type.results)});
    result.has_memory = context.memory;
    result.signature =
        Signature{to_valtypes(context.params), to_valtypes(context.results)};
    return result;
}

std::vector<uint8_t> from_hex(const std::string &text) {
    std::vector<uint8_t> bytes;
    std::istringstream in(text);
    std::string byte;
    while (in >> byte) {
        if (byte.size() != 2)
            throw std::runtime_error("bad hex byte: " + byte);
        bytes.push_back(static_cast<uint8_t>(std::stoul(byte, nullptr, 16)));
    }
    return bytes;
}

int main(int argv, char **argc) {
    if (argv != 2) {
        std::cerr << "Usage: " << argc[0] << " <filename>" << std::endl;
        return 1;
    }

    std::string filename = argc[1];

    std::ifstream ifs{filename};
    if (!ifs) {
        std::cerr << "Could not open file " << filename << std::endl;
        return 1;
    }
    nlohmann::json j;
    ifs >> j;

    auto suite = j.template get<funcletjson>();

    uint32_t passes = 0, soft_passes = 0, failures = 0;

    for (auto &t : suite.commands) {
        nlohmann::json command = t;
        std::cerr << "Running test: " << command << std::endl;

        if (std::holds_alternative<test_valid>(t)) {
            auto &m = std::get<test_valid>(t);
            auto bytes = from_hex(m.body);
            auto result = validate_function_body(bytes, to_context(m.context));

            if (auto e = std::get_if<ValidationError>(&result)) {
                std::cerr << m.name << " (line " << m.line
                          << "): expected a valid body but got: "
                          << e->to_string() << std::endl;
                failures++;
                continue;
            }

            auto &body = std::get<ValidatedBody>(result);
            if ((m.funclets >= 0 &&
                 body.stats.funclets != static_cast<uint32_t>(m.funclets)) ||
                (m.edges >= 0 &&
                 body.stats.edges != static_cast<uint32_t>(m.edges))) {
                std::cerr << m.name << " (line " << m.line << "): expected "
                          << m.funclets << " funclets and " << m.edges
                          << " edges but got " << body.stats.funclets
                          << " and " << body.stats.edges << std::endl;
                failures++;
                continue;
            }
            passes++;
        } else {
            auto &m = std::get<test_invalid>(t);
            auto bytes = from_hex(m.body);
            auto result = validate_function_body(bytes, to_context(m.context));

            auto e = std::get_if<ValidationError>(&result);
            if (!e) {
                std::cerr << m.name << " (line " << m.line << "): expected "
                          << m.kind << " but the body validated" << std::endl;
                failures++;
                continue;
            }
            if (m.kind != error_kind_name(e->kind)) {
                std::cerr << m.name << " (line " << m.line << "): expected "
                          << m.kind << " but got: " << e->to_string()
                          << std::endl;
                failures++;
                continue;
            }
            if (!e->message.starts_with(m.text) &&
                !m.text.starts_with(e->message)) {
                std::cerr << "Expected error message: " << m.text
                          << " but got: " << e->message << std::endl;
                soft_passes++;
                continue;
            }
            passes++;
        }
    }

    std::cout << "Passes: " << passes << std::endl;
    std::cout << "Soft passes: " << soft_passes << std::endl;
    std::cout << "Failures: " << failures << std::endl;

    return failures == 0 ? 0 : 1;
}
