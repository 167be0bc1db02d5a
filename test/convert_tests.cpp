#include <catch2/catch_all.hpp>

#include "stanza/convert.hpp"
#include "stanza/parse.hpp"
#include "stanza/render.hpp"
#include "stanza/stanza.hpp"

#include <memory_resource>
#include <set>
#include <string>
#include <string_view>
#include <utility>

namespace {

    Stanza::ExprPtr parse_ok(std::string_view s) {
        auto r = Stanza::parse_expr(s);
        if (!r) FAIL("parse failed: " << r.error().msg);
        REQUIRE(*r);
        return std::move(*r);
    }

    Stanza::value convert(std::string_view s) {
        return Stanza::to_value(*parse_ok(s));
    }

    std::string text(const Stanza::value& v) {
        REQUIRE(v.is_string());
        const auto& s = v.as_string();
        return std::string(s.data(), s.size());
    }

    std::set<std::string> keys(const Stanza::value& v) {
        REQUIRE(v.is_object());
        std::set<std::string> out;
        for (const auto& [k, _] : v.as_object()) out.emplace(k.data(), k.size());
        return out;
    }

    std::string compact(const Stanza::value& v) {
        auto r = Stanza::dump(v);
        REQUIRE(r);
        return *r;
    }

    struct KindCase {
        const char* src;
        const char* kind;
        std::set<std::string> fields;
    };

}


TEST_CASE("Every Modeled Variant Converts To Its Tag") {
    const KindCase cases[] = {
        { "[1, 2]",             "Array",      { "elems" } },
        { "a = 1",              "Assign",     { "left", "right" } },
        { "async { 1 }",        "Async",      { "capture", "block" } },
        { "f.await",            "Await",      { "base" } },
        { "a + b",              "Binary",     { "left", "op", "right" } },
        { "{ 1 }",              "Block",      { "label", "block" } },
        { "break",              "Break",      { "label", "expr" } },
        { "f(1)",               "Call",       { "func", "args" } },
        { "x as u8",            "Cast",       { "expr", "ty" } },
        { "|x| x",              "Closure",    { "lifetimes", "constness", "movability", "asyncness", "capture", "inputs", "output", "body" } },
        { "const { 1 }",        "Const",      { "block" } },
        { "continue",           "Continue",   { "label" } },
        { "a.b",                "Field",      { "base", "member" } },
        { "for x in y {}",      "ForLoop",    { "label", "pat", "expr", "body" } },
        { "if a { b }",         "If",         { "cond", "then_branch", "else_branch" } },
        { "a[0]",               "Index",      { "expr", "index" } },
        { "_",                  "Infer",      {} },
        { "let Some(x) = y",    "Let",        { "pat", "expr" } },
        { "1",                  "Lit",        { "lit" } },
        { "loop {}",            "Loop",       { "label", "body" } },
        { "m!()",               "Macro",      { "mac" } },
        { "match x { _ => 1 }", "Match",      { "expr", "arms" } },
        { "a.b()",              "MethodCall", { "receiver", "method", "turbofish", "args" } },
        { "(a)",                "Paren",      { "expr" } },
        { "a",                  "Path",       { "qself", "path" } },
        { "a..b",               "Range",      { "start", "limits", "end" } },
        { "&raw const x",       "RawAddr",    { "mutability", "expr" } },
        { "&x",                 "Reference",  { "mutability", "expr" } },
        { "[0; 3]",             "Repeat",     { "expr", "len" } },
        { "return",             "Return",     { "expr" } },
        { "S { a: 1 }",         "Struct",     { "qself", "path", "fields", "dot2_token", "rest" } },
        { "f()?",               "Try",        { "expr" } },
        { "try { 1 }",          "TryBlock",   { "block" } },
        { "(1, 2)",             "Tuple",      { "elems" } },
        { "-x",                 "Unary",      { "op", "expr" } },
        { "unsafe { 1 }",       "Unsafe",     { "block" } },
        { "while a {}",         "While",      { "label", "cond", "body" } },
        { "yield 1",            "Yield",      { "expr" } },
    };

    for (const auto& c : cases) {
        CAPTURE(c.src);
        const Stanza::value v = convert(c.src);
        REQUIRE(text(v["kind"]) == c.kind);

        auto expected = c.fields;
        expected.insert("kind");
        expected.insert("attrs");
        REQUIRE(keys(v) == expected);
        REQUIRE(v["attrs"].is_array());
    }
}

TEST_CASE("Key Sets Do Not Depend On The Input") {
    REQUIRE(keys(convert("a + b")) == keys(convert("(x * y) - f(z)")));
    REQUIRE(keys(convert("break")) == keys(convert("break 'a 42")));
    REQUIRE(keys(convert("if a { b }")) == keys(convert("if a { b } else { c }")));
    REQUIRE(keys(convert("..")) == keys(convert("0..=9")));
    REQUIRE(keys(convert("|| 1")) == keys(convert("for<'a> async move |x: &'a u8| -> u8 { *x }")));
    REQUIRE(keys(convert("S {}")) == keys(convert("<T as Tr>::S { a, ..b }")));
}

TEST_CASE("Nested Parentheses Stay Nested") {
    const Stanza::value v = convert("((((a+b))))");
    const Stanza::value* cur = &v;
    for (int i = 0; i < 4; i++) {
        REQUIRE(text((*cur)["kind"]) == "Paren");
        cur = &(*cur)["expr"];
    }
    REQUIRE(text((*cur)["kind"]) == "Binary");
    REQUIRE(text((*cur)["op"]) == "+");
    REQUIRE(text((*cur)["left"]["path"]) == "a");
    REQUIRE(text((*cur)["right"]["path"]) == "b");
}

TEST_CASE("Optional Children Are Null") {
    const Stanza::value bare = convert("break");
    REQUIRE(bare["expr"].is_null());
    REQUIRE(bare["label"].is_null());

    const Stanza::value valued = convert("break 42");
    REQUIRE(text(valued["expr"]["kind"]) == "Lit");
    REQUIRE(text(valued["expr"]["lit"]["value"]) == "42");

    REQUIRE(convert("return")["expr"].is_null());
    REQUIRE(convert("a.b()")["turbofish"].is_null());
    REQUIRE(convert("a")["qself"].is_null());

    const Stanza::value open = convert("..");
    REQUIRE(open["start"].is_null());
    REQUIRE(open["end"].is_null());
    REQUIRE(text(open["limits"]) == "HalfOpen");
    REQUIRE(text(convert("a..=b")["limits"]) == "Closed");
}

TEST_CASE("Call Arguments Keep Their Order") {
    const Stanza::value v = convert("foo(1, 2, 3)");
    REQUIRE(text(v["func"]["path"]) == "foo");
    REQUIRE(v["args"].size() == 3);
    REQUIRE(text(v["args"][0]["lit"]["value"]) == "1");
    REQUIRE(text(v["args"][1]["lit"]["value"]) == "2");
    REQUIRE(text(v["args"][2]["lit"]["value"]) == "3");

    REQUIRE(convert("f()")["args"].size() == 0);
}

TEST_CASE("Struct Fields") {
    const Stanza::value v = convert("Point { x: 1, y: 2 }");
    REQUIRE(text(v["path"]) == "Point");
    REQUIRE(v["fields"].size() == 2);
    REQUIRE(text(v["fields"][0]["member"]["kind"]) == "Named");
    REQUIRE(text(v["fields"][0]["member"]["name"]) == "x");
    REQUIRE(text(v["fields"][0]["expr"]["lit"]["value"]) == "1");
    REQUIRE(text(v["fields"][1]["member"]["name"]) == "y");
    REQUIRE(v["fields"][1]["attrs"].is_array());
    REQUIRE_FALSE(v["dot2_token"].as_bool());
    REQUIRE(v["rest"].is_null());

    const Stanza::value shorthand = convert("Point { x, ..base }");
    REQUIRE(text(shorthand["fields"][0]["expr"]["kind"]) == "Path");
    REQUIRE(text(shorthand["fields"][0]["expr"]["path"]) == "x");
    REQUIRE(shorthand["dot2_token"].as_bool());
    REQUIRE(text(shorthand["rest"]["path"]) == "base");

    const Stanza::value qualified = convert("<T as Tr>::S { a: 1 }");
    REQUIRE(text(qualified["qself"]) == "T");
}

TEST_CASE("Members") {
    const Stanza::value named = convert("a.b")["member"];
    REQUIRE(text(named["kind"]) == "Named");
    REQUIRE(text(named["name"]) == "b");

    const Stanza::value unnamed = convert("t.0")["member"];
    REQUIRE(text(unnamed["kind"]) == "Unnamed");
    REQUIRE(unnamed["index"].as_number() == 0);
}

TEST_CASE("Else Branches") {
    const Stanza::value tail = convert("if c { a } else { -x }");
    REQUIRE(text(tail["then_branch"]) == "{ a }");
    REQUIRE(text(tail["else_branch"]["kind"]) == "Unary");
    REQUIRE(text(tail["else_branch"]["op"]) == "-");

    const Stanza::value block = convert("if c { a } else { let y = 1; y }");
    REQUIRE(text(block["else_branch"]["kind"]) == "Block");
    REQUIRE(text(block["else_branch"]["block"]) == "{ let y = 1 ; y }");

    const Stanza::value stmt = convert("if c { a } else { x; }");
    REQUIRE(text(stmt["else_branch"]["kind"]) == "Block");

    const Stanza::value chain = convert("if a { 1 } else if b { 2 }");
    REQUIRE(text(chain["else_branch"]["kind"]) == "If");
    REQUIRE(chain["else_branch"]["else_branch"].is_null());

    REQUIRE(convert("if a { b }")["else_branch"].is_null());
}

TEST_CASE("Labels Drop The Quote") {
    const Stanza::value v = convert("'outer: loop { break 'outer 1; }");
    REQUIRE(text(v["kind"]) == "Loop");
    REQUIRE(text(v["label"]) == "outer");
    REQUIRE(text(v["body"]) == "{ break 'outer 1 ; }");

    const Stanza::value brk = convert("break 'outer");
    REQUIRE(text(brk["label"]) == "outer");
    REQUIRE(text(convert("continue 'x")["label"]) == "x");
    REQUIRE(text(convert("'a: { 1 }")["label"]) == "a");
    REQUIRE(text(convert("'w: while x {}")["label"]) == "w");
}

TEST_CASE("Closures") {
    const Stanza::value v = convert("move |a, b: i32| -> i32 { a }");
    REQUIRE(v["capture"].as_bool());
    REQUIRE_FALSE(v["asyncness"].as_bool());
    REQUIRE_FALSE(v["constness"].as_bool());
    REQUIRE_FALSE(v["movability"].as_bool());
    REQUIRE(v["lifetimes"].is_null());
    REQUIRE(v["inputs"].size() == 2);
    REQUIRE(text(v["inputs"][0]) == "a");
    REQUIRE(text(v["inputs"][1]) == "b : i32");
    REQUIRE(text(v["output"]) == "-> i32");
    REQUIRE(text(v["body"]["kind"]) == "Block");

    const Stanza::value bare = convert("|| 1");
    REQUIRE(bare["inputs"].size() == 0);
    REQUIRE(text(bare["output"]).empty());
    REQUIRE(text(bare["body"]["kind"]) == "Lit");

    const Stanza::value hr = convert("for<'a> |x: &'a u8| *x");
    REQUIRE(text(hr["lifetimes"]) == "for < 'a >");
}

TEST_CASE("Match Arms Convert") {
    const Stanza::value v = convert("match x { Some(v) if v > 0 => v, _ => 0 }");
    REQUIRE(text(v["expr"]["path"]) == "x");
    REQUIRE(v["arms"].size() == 2);

    const Stanza::value& first = v["arms"][0];
    REQUIRE(keys(first) == std::set<std::string>{ "attrs", "pat", "guard", "body" });
    REQUIRE(text(first["pat"]) == "Some (v)");
    REQUIRE(text(first["guard"]["op"]) == ">");
    REQUIRE(text(first["body"]["path"]) == "v");

    REQUIRE(text(v["arms"][1]["pat"]) == "_");
    REQUIRE(v["arms"][1]["guard"].is_null());
}

TEST_CASE("Method Calls") {
    const Stanza::value v = convert("x.f::<u8>(1)");
    REQUIRE(text(v["method"]) == "f");
    REQUIRE(text(v["turbofish"]) == ":: < u8 >");
    REQUIRE(text(v["receiver"]["path"]) == "x");
    REQUIRE(v["args"].size() == 1);
}

TEST_CASE("Opaque Children Render") {
    REQUIRE(text(convert("x as Vec<u8>")["ty"]) == "Vec < u8 >");
    REQUIRE(text(convert("std::mem::swap")["path"]) == "std :: mem :: swap");
    REQUIRE(text(convert("vec![1, 2]")["mac"]) == "vec ! [1 , 2]");
    REQUIRE(text(convert("for (i, x) in v {}")["pat"]) == "(i , x)");
    REQUIRE(text(convert("unsafe { f() }")["block"]) == "{ f () }");
    REQUIRE(text(convert("<Vec<T> as IntoIterator>::Item")["qself"]) == "Vec < T >");
    REQUIRE(text(convert("<Vec<T> as IntoIterator>::Item")["path"]) == "IntoIterator :: Item");
}

TEST_CASE("Attributes Convert To Text") {
    const Stanza::value v = convert("#[inline] #[cfg(test)] f()");
    REQUIRE(text(v["kind"]) == "Call");
    REQUIRE(v["attrs"].size() == 2);
    REQUIRE(text(v["attrs"][0]) == "# [inline]");
    REQUIRE(text(v["attrs"][1]) == "# [cfg (test)]");

    const Stanza::value m = convert("match x { #![allow(unused)] _ => 1 }");
    REQUIRE(m["attrs"].size() == 1);
    REQUIRE(text(m["attrs"][0]) == "#! [allow (unused)]");
}

TEST_CASE("Literal Values") {
    const Stanza::value pi = convert("3.14")["lit"];
    REQUIRE(keys(pi) == std::set<std::string>{ "kind", "value", "suffix" });
    REQUIRE(text(pi["kind"]) == "Float");
    REQUIRE(text(pi["value"]) == "3.14");

    const Stanza::value f = convert("2.5f32")["lit"];
    REQUIRE(text(f["value"]) == "2.5");
    REQUIRE(text(f["suffix"]) == "f32");
    REQUIRE(text(convert("1_000.5")["lit"]["value"]) == "1000.5");

    REQUIRE(text(convert("0xFF")["lit"]["value"]) == "255");
    REQUIRE(text(convert("0b1010")["lit"]["value"]) == "10");
    REQUIRE(text(convert("0o17")["lit"]["value"]) == "15");
    const Stanza::value n = convert("1_000u32")["lit"];
    REQUIRE(text(n["kind"]) == "Int");
    REQUIRE(text(n["value"]) == "1000");
    REQUIRE(text(n["suffix"]) == "u32");

    const Stanza::value s = convert("\"hi\\n\"")["lit"];
    REQUIRE(text(s["kind"]) == "Str");
    REQUIRE(text(s["value"]) == "hi\n");
    REQUIRE(text(s["suffix"]).empty());

    const Stanza::value bytes = convert("b\"ab\"")["lit"];
    REQUIRE(text(bytes["kind"]) == "ByteStr");
    REQUIRE(bytes["value"].size() == 2);
    REQUIRE(bytes["value"][0].as_number() == 97);
    REQUIRE(bytes["value"][1].as_number() == 98);

    REQUIRE(text(convert("c\"hi\"")["lit"]["kind"]) == "CStr");
    REQUIRE(text(convert("c\"hi\"")["lit"]["value"]) == "hi");

    const Stanza::value byte = convert("b'a'")["lit"];
    REQUIRE(text(byte["kind"]) == "Byte");
    REQUIRE(byte["value"].as_number() == 97);

    REQUIRE(text(convert("'x'")["lit"]["value"]) == "x");
    REQUIRE(text(convert("'\\u{1F600}'")["lit"]["value"]) == "\xF0\x9F\x98\x80");

    const Stanza::value yes = convert("true")["lit"];
    REQUIRE(keys(yes) == std::set<std::string>{ "kind", "value" });
    REQUIRE(text(yes["kind"]) == "Bool");
    REQUIRE(yes["value"].as_bool());
}

TEST_CASE("Unmodeled Nodes Become Tokens") {
    const Stanza::value boxed = convert("box x");
    REQUIRE(keys(boxed) == std::set<std::string>{ "kind", "tokens" });
    REQUIRE(text(boxed["kind"]) == "Verbatim");
    REQUIRE(text(boxed["tokens"]) == "box x");

    Stanza::token_stream ts;
    ts.ident("yeet");
    ts.ident("x");
    auto ext = Stanza::make_expr(Stanza::ExprExtension{ "yeet", ts });
    const Stanza::value unknown = Stanza::to_value(*ext);
    REQUIRE(keys(unknown) == std::set<std::string>{ "kind", "tokens" });
    REQUIRE(text(unknown["kind"]) == "Unknown");
    REQUIRE(text(unknown["tokens"]) == "yeet x");

    auto lit = Stanza::make_expr(Stanza::ExprLit{ Stanza::LitVerbatim{ "1.0f128x" } });
    const Stanza::value verbatim = Stanza::to_value(*lit)["lit"];
    REQUIRE(text(verbatim["kind"]) == "Verbatim");
    REQUIRE(text(verbatim["tokens"]) == "1.0f128x");
}

TEST_CASE("Extension Literals Become Unknown") {
    Stanza::token_stream ts;
    ts.ident("c");
    ts.punct("!");
    ts.ident("x");
    auto lit = Stanza::make_expr(Stanza::ExprLit{ Stanza::LitExtension{ "custom", ts } });
    REQUIRE(Stanza::render(*lit) == ts.to_string());

    const Stanza::value v = Stanza::to_value(*lit);
    REQUIRE(text(v["kind"]) == "Lit");
    REQUIRE(keys(v["lit"]) == std::set<std::string>{ "kind", "tokens" });
    REQUIRE(text(v["lit"]["kind"]) == "Unknown");
    REQUIRE(text(v["lit"]["tokens"]) == ts.to_string());
}

TEST_CASE("Groups Convert Structurally") {
    auto group = Stanza::make_expr(Stanza::ExprGroup{ parse_ok("a + b") });
    const Stanza::value v = Stanza::to_value(*group);
    REQUIRE(keys(v) == std::set<std::string>{ "kind", "attrs", "expr" });
    REQUIRE(text(v["kind"]) == "Group");
    REQUIRE(text(v["expr"]["kind"]) == "Binary");
}

TEST_CASE("Operator Symbols") {
    using Stanza::BinOp;
    const std::pair<BinOp, std::string_view> binops[] = {
        { BinOp::add, "+" }, { BinOp::sub, "-" }, { BinOp::mul, "*" }, { BinOp::div, "/" },
        { BinOp::rem, "%" }, { BinOp::logical_and, "&&" }, { BinOp::logical_or, "||" },
        { BinOp::bit_xor, "^" }, { BinOp::bit_and, "&" }, { BinOp::bit_or, "|" },
        { BinOp::shl, "<<" }, { BinOp::shr, ">>" }, { BinOp::eq, "==" }, { BinOp::lt, "<" },
        { BinOp::le, "<=" }, { BinOp::ne, "!=" }, { BinOp::ge, ">=" }, { BinOp::gt, ">" },
        { BinOp::add_assign, "+=" }, { BinOp::sub_assign, "-=" }, { BinOp::mul_assign, "*=" },
        { BinOp::div_assign, "/=" }, { BinOp::rem_assign, "%=" }, { BinOp::bit_xor_assign, "^=" },
        { BinOp::bit_and_assign, "&=" }, { BinOp::bit_or_assign, "|=" },
        { BinOp::shl_assign, "<<=" }, { BinOp::shr_assign, ">>=" },
    };
    for (const auto& [op, sym] : binops) {
        CAPTURE(sym);
        REQUIRE(Stanza::binop_symbol(op) == sym);

        std::string src = "a " + std::string(sym) + " b";
        const Stanza::value v = convert(src);
        REQUIRE(text(v["kind"]) == "Binary");
        REQUIRE(text(v["op"]) == sym);
    }

    REQUIRE(Stanza::unop_symbol(Stanza::UnOp::deref) == "*");
    REQUIRE(Stanza::unop_symbol(Stanza::UnOp::logical_not) == "!");
    REQUIRE(Stanza::unop_symbol(Stanza::UnOp::neg) == "-");
    REQUIRE(text(convert("*p")["op"]) == "*");
    REQUIRE(text(convert("!p")["op"]) == "!");
    REQUIRE(text(convert("-p")["op"]) == "-");

    REQUIRE_FALSE(Stanza::binop_symbol(static_cast<BinOp>(200)));
    REQUIRE_FALSE(Stanza::unop_symbol(static_cast<Stanza::UnOp>(200)));
}

TEST_CASE("Operators Outside The Enumerated Set Use Their Spelling") {
    auto e = Stanza::make_expr(Stanza::ExprBinary{ parse_ok("a"), static_cast<Stanza::BinOp>(200), parse_ok("b"), "<=>" });
    REQUIRE(text(Stanza::to_value(*e)["op"]) == "<=>");
    REQUIRE(Stanza::render(*e) == "a <=> b");
}

TEST_CASE("Values Allocate From The Given Resource") {
    std::pmr::monotonic_buffer_resource pool;
    auto e = parse_ok("f(a + 1)");
    const Stanza::value v = Stanza::to_value(*e, &pool);
    REQUIRE(v.resource() == &pool);
    REQUIRE(v["args"].resource() == &pool);
    REQUIRE(v["args"][0]["left"].resource() == &pool);
}

TEST_CASE("End To End") {
    REQUIRE(compact(convert("1 + 2 * 3")) ==
        R"({"attrs":[],"kind":"Binary",)"
        R"("left":{"attrs":[],"kind":"Lit","lit":{"kind":"Int","suffix":"","value":"1"}},"op":"+",)"
        R"("right":{"attrs":[],"kind":"Binary",)"
        R"("left":{"attrs":[],"kind":"Lit","lit":{"kind":"Int","suffix":"","value":"2"}},"op":"*",)"
        R"("right":{"attrs":[],"kind":"Lit","lit":{"kind":"Int","suffix":"","value":"3"}}}})");

    REQUIRE(compact(convert("foo.bar(baz)")) ==
        R"({"args":[{"attrs":[],"kind":"Path","path":"baz","qself":null}],"attrs":[],)"
        R"("kind":"MethodCall","method":"bar",)"
        R"("receiver":{"attrs":[],"kind":"Path","path":"foo","qself":null},"turbofish":null})");

    REQUIRE(compact(convert("if x > 0 { x } else { -x }")) ==
        R"({"attrs":[],)"
        R"("cond":{"attrs":[],"kind":"Binary","left":{"attrs":[],"kind":"Path","path":"x","qself":null},"op":">",)"
        R"("right":{"attrs":[],"kind":"Lit","lit":{"kind":"Int","suffix":"","value":"0"}}},)"
        R"("else_branch":{"attrs":[],"expr":{"attrs":[],"kind":"Path","path":"x","qself":null},"kind":"Unary","op":"-"},)"
        R"("kind":"If","then_branch":"{ x }"})");
}

TEST_CASE("End To End Pretty") {
    auto r = Stanza::dump(convert("x"), { .pretty = true });
    REQUIRE(r);
    REQUIRE(*r ==
        "{\n"
        "  \"attrs\": [],\n"
        "  \"kind\": \"Path\",\n"
        "  \"path\": \"x\",\n"
        "  \"qself\": null\n"
        "}");
}
