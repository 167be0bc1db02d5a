#include <print>
#include <cstdio>
#include <string_view>

#include "stanza/stanza.hpp"

namespace {
    // Nesting limit for command-line input; deep enough for real code
    constexpr std::size_t max_depth = 256;

    void usage(std::string_view prog) {
        std::println(stderr, "Usage: {} <expression>", prog);
        std::println(stderr, "");
        std::println(stderr, "Parse a Rust expression and output structured JSON (Stanza {}).", STANZA_VERSION);
        std::println(stderr, "");
        std::println(stderr, "Examples:");
        std::println(stderr, "  {} \"1 + 2 * 3\"", prog);
        std::println(stderr, "  {} \"foo.bar(baz)\"", prog);
        std::println(stderr, "  {} \"if x > 0 {{ x }} else {{ -x }}\"", prog);
    }
} // namespace

int main(int argc, char** argv) {
    std::string_view prog = argc > 0 ? argv[0] : "expr-json";
    if (argc != 2) {
        usage(prog);
        return 1;
    }

    auto expr = Stanza::parse_expr(argv[1], { .max_depth = max_depth });
    if (!expr) {
        const auto& err = expr.error();
        std::println(stderr, "Parse error: {} at line {}, column {}", err.msg, err.line, err.column);
        return 1;
    }

    auto json = Stanza::dump(Stanza::to_value(**expr), { .pretty = true });
    if (!json) {
        std::println(stderr, "Error serializing JSON: {}", json.error().msg);
        return 1;
    }

    std::println("{}", *json);
    return 0;
}
