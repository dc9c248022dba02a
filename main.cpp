#include "validator.hpp"
#include <chrono>
#include <cstdio>
#include <string>
#include <string_view>

using namespace weft;

// parses "i32,f64" into value types, the empty string is no types
bool parse_valtypes(std::string_view text, valtype_vector &types) {
    while (!text.empty()) {
        auto comma = text.find(',');
        auto name = text.substr(0, comma);
        auto type = valtype_from_name(name);
        if (!type) {
            printf("Unknown value type %.*s\n", static_cast<int>(name.size()),
                   name.data());
            return false;
        }
        types.push_back(*type);
        if (comma == std::string_view::npos)
            break;
        text.remove_prefix(comma + 1);
    }
    return true;
}

int main(int argc, const char **argv) {
    if (argc < 2 || argc > 4) {
        printf("Usage: %s <body.bin> [params [results]]\n", argv[0]);
        return 1;
    }

    auto filename = argv[1];

    auto context = TypeContext{};
    if (argc > 2 && !parse_valtypes(argv[2], context.signature.params))
        return 1;
    if (argc > 3 && !parse_valtypes(argv[3], context.signature.results))
        return 1;

    auto file = fopen(filename, "rb");
    if (!file) {
        printf("Could not open file %s\n", filename);
        return 1;
    }

    // pipes and other unseekable files have no length
    auto length = fseek(file, 0, SEEK_END) == 0 ? ftell(file) : -1;
    if (length < 0 || fseek(file, 0, SEEK_SET) != 0) {
        printf("Could not read file %s\n", filename);
        fclose(file);
        return 1;
    }

    auto bytes = std::vector<uint8_t>(length);
    auto read = fread(bytes.data(), 1, length, file);
    fclose(file);
    if (read != bytes.size()) {
        printf("Could not read file %s\n", filename);
        return 1;
    }

    auto start = std::chrono::high_resolution_clock::now();
    auto result = validate_function_body(bytes, context);
    auto end = std::chrono::high_resolution_clock::now();
    printf("Validation took %fms\n",
           std::chrono::duration<float, std::milli>(end - start).count());

    if (auto e = std::get_if<ValidationError>(&result)) {
        printf("%s\n", e->to_string().c_str());
        return 1;
    }

    auto &body = std::get<ValidatedBody>(result);
    auto &stats = body.stats;
    printf("%llu instructions, %u regions, %u funclets, %u edges\n",
           static_cast<unsigned long long>(stats.instructions), stats.regions,
           stats.funclets, stats.edges);
    printf("%zu values in %zu blocks, %zu live phis, %zu trivial phis "
           "removed\n",
           body.ssa.value_count(), body.ssa.block_count(), stats.live_phis,
           stats.removed_phis);

    for (auto &region : body.regions) {
        printf("region at offset %zu (depth %u): %s -> %s\n", region.offset,
               region.depth, to_string(region.signature.params).c_str(),
               to_string(region.signature.results).c_str());
        for (auto &funclet : region.funclets)
            printf("  funclet %u %s%s, %u backward predecessors\n",
                   funclet.index, to_string(funclet.params).c_str(),
                   funclet.explicit_signature ? "" : " (inferred)",
                   funclet.observed_preds);
    }

    return 0;
}
