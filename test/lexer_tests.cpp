#include <catch2/catch_all.hpp>

#include "stanza/parse.hpp"

#include "detail/lexer.hpp"
#include "detail/literal.hpp"

#include <string>
#include <variant>

namespace {

    Stanza::token_stream lex_ok(std::string_view s) {
        auto r = Stanza::tokenize(s);
        REQUIRE(r);
        return *std::move(r);
    }

    std::string canonical(std::string_view s) {
        return lex_ok(s).to_string();
    }

    Stanza::ParseError lex_fail(std::string_view s, Stanza::ParseError::code code) {
        auto r = Stanza::tokenize(s);
        REQUIRE_FALSE(r);
        REQUIRE(r.error().errc == code);
        return r.error();
    }

    template<class T>
    T decode_as(std::string_view repr) {
        auto r = Stanza::detail::decode_literal(repr);
        REQUIRE(r);
        REQUIRE(std::holds_alternative<T>(*r));
        return std::get<T>(*r);
    }

    std::string decode_error(std::string_view repr) {
        auto r = Stanza::detail::decode_literal(repr);
        REQUIRE_FALSE(r);
        return r.error();
    }
}


TEST_CASE("Multi-Character Operators Are Split Into Joint Puncts") {
    auto ts = lex_ok("a::b");
    REQUIRE(ts.size() == 4);
    REQUIRE(ts[0].is_ident("a"));
    REQUIRE(ts[1].is_punct(':'));
    REQUIRE(ts[1].is_joint());
    REQUIRE(ts[2].is_punct(':'));
    REQUIRE_FALSE(ts[2].is_joint());
    REQUIRE(ts[3].is_ident("b"));

    auto shift = lex_ok("x <<= 1");
    REQUIRE(shift.size() == 5);
    REQUIRE(shift[1].is_joint());
    REQUIRE(shift[2].is_joint());
    REQUIRE_FALSE(shift[3].is_joint());
}

TEST_CASE("Whitespace Separates Operators") {
    auto ts = lex_ok("a + - b");
    REQUIRE(ts.size() == 4);
    REQUIRE_FALSE(ts[1].is_joint());
    REQUIRE_FALSE(ts[2].is_joint());
}

TEST_CASE("Comment Start Breaks Joint Spacing") {
    auto ts = lex_ok("a +// trailing\n b");
    REQUIRE(ts.size() == 3);
    REQUIRE(ts[1].is_punct('+'));
    REQUIRE_FALSE(ts[1].is_joint());
}

TEST_CASE("Comments Are Skipped") {
    REQUIRE(canonical("a /* one /* nested */ still */ + b // done") == "a + b");
    REQUIRE(canonical("/// doc comment\nx") == "x");
}

TEST_CASE("Canonical Token Text") {
    REQUIRE(canonical("foo(1, 2)") == "foo (1 , 2)");
    REQUIRE(canonical("foo()") == "foo ()");
    REQUIRE(canonical("[1,2]") == "[1 , 2]");
    REQUIRE(canonical("{x}") == "{ x }");
    REQUIRE(canonical("{}") == "{ }");
    REQUIRE(canonical("std::vec::Vec<i32>") == "std :: vec :: Vec < i32 >");
    REQUIRE(canonical("x.0") == "x . 0");
    REQUIRE(canonical("|x| x+1") == "| x | x + 1");
    REQUIRE(canonical("a->b") == "a -> b");
    REQUIRE(canonical("#[inline]") == "# [inline]");
    REQUIRE(canonical("#![allow(dead_code)]") == "#! [allow (dead_code)]");
}

TEST_CASE("Canonical Text Ignores Source Layout") {
    REQUIRE(canonical("vec ! [ 1 ,2 ]") == canonical("vec![1, 2]"));
    REQUIRE(canonical("a\n\t::\r\n  b") == "a :: b");
}

TEST_CASE("Lifetimes and Labels") {
    auto ts = lex_ok("'a");
    REQUIRE(ts.size() == 2);
    REQUIRE(ts[0].is_punct('\''));
    REQUIRE(ts[0].is_joint());
    REQUIRE(ts[1].is_ident("a"));

    REQUIRE(canonical("& 'static str") == "& 'static str");
    REQUIRE(canonical("&'static str") == "&'static str");
    REQUIRE(canonical("'outer: loop {}") == "'outer : loop { }");
}

TEST_CASE("Character Literals Are Not Lifetimes") {
    auto ts = lex_ok("'a'");
    REQUIRE(ts.size() == 1);
    REQUIRE(ts[0].is_literal());
    REQUIRE(ts[0].text == "'a'");

    auto esc = lex_ok("'\\''");
    REQUIRE(esc.size() == 1);
    REQUIRE(esc[0].is_literal());
}

TEST_CASE("Numbers Followed by Dots") {
    auto range = lex_ok("1..2");
    REQUIRE(range.size() == 4);
    REQUIRE(range[0].text == "1");
    REQUIRE(range[1].is_punct('.'));
    REQUIRE(range[1].is_joint());
    REQUIRE(range[3].text == "2");

    auto method = lex_ok("1.max(2)");
    REQUIRE(method[0].text == "1");
    REQUIRE(method[1].is_punct('.'));
    REQUIRE(method[2].is_ident("max"));

    auto trailing = lex_ok("1.");
    REQUIRE(trailing.size() == 1);
    REQUIRE(trailing[0].text == "1.");

    auto tuple_field = lex_ok("t.0.1");
    REQUIRE(tuple_field[2].text == "0.1");
}

TEST_CASE("Literal Spellings Are Kept Verbatim") {
    for (auto s : { "0xFF", "1_000u32", "2.5E-3f64", "b'x'", "r#\"raw\"#", "c\"hi\"", "br\"x\"", "\"s\"suffix" }) {
        INFO("lexing: " << s);
        auto ts = lex_ok(s);
        REQUIRE(ts.size() == 1);
        REQUIRE(ts[0].is_literal());
        REQUIRE(ts[0].text == s);
    }
}

TEST_CASE("Raw Identifiers") {
    auto ts = lex_ok("r#match");
    REQUIRE(ts.size() == 1);
    REQUIRE(ts[0].is_ident("r#match"));
}

TEST_CASE("Token Positions Are One-Based") {
    auto ts = lex_ok("a\n  + b");
    REQUIRE(ts[0].pos.line == 1);
    REQUIRE(ts[0].pos.column == 1);
    REQUIRE(ts[1].pos.line == 2);
    REQUIRE(ts[1].pos.column == 3);
    REQUIRE(ts[1].pos.offset == 4);
}

TEST_CASE("Lexer Errors") {
    lex_fail("a \\ b", Stanza::ParseError::code::invalid_character);

    auto comment = lex_fail("a /* never closed", Stanza::ParseError::code::unterminated_comment);
    REQUIRE(comment.column == 3);
    REQUIRE(comment.msg == "unterminated block comment");

    auto str = lex_fail("\"open", Stanza::ParseError::code::unterminated_literal);
    REQUIRE(str.offset == 0);

    lex_fail("r#\"no end\"", Stanza::ParseError::code::unterminated_literal);
    lex_fail("'", Stanza::ParseError::code::unterminated_literal);
}

TEST_CASE("Unexpected Character Names the Character") {
    auto e = lex_fail("x + `y`", Stanza::ParseError::code::invalid_character);
    REQUIRE(e.msg == "unexpected character ```");
    REQUIRE(e.column == 5);
}

TEST_CASE("Non-Identifier Unicode Is Rejected") {
    auto e = lex_fail("\xC2\xA0x", Stanza::ParseError::code::invalid_character);
    REQUIRE(e.column == 1);
    lex_fail("a \xE2\x80\x83 b", Stanza::ParseError::code::invalid_character);

    REQUIRE_FALSE(Stanza::detail::is_ident_start(0xA0));
    REQUIRE_FALSE(Stanza::detail::is_ident_start(0x2003));
    REQUIRE(Stanza::detail::is_ident_start(0xE9));

    auto word = lex_ok("caf\xC3\xA9");
    REQUIRE(word.size() == 1);
    REQUIRE(word[0].is_ident("caf\xC3\xA9"));

    auto dotted = lex_ok("a\xC2\xB7b");
    REQUIRE(dotted.size() == 1);
    REQUIRE(dotted[0].is_ident("a\xC2\xB7b"));
}

TEST_CASE("Delimiter Balance") {
    auto unclosed = lex_fail("f(a, [b]", Stanza::ParseError::code::unbalanced_delimiter);
    REQUIRE(unclosed.msg == "unclosed delimiter `(`");
    REQUIRE(unclosed.column == 2);

    auto stray = lex_fail("a)", Stanza::ParseError::code::unbalanced_delimiter);
    REQUIRE(stray.msg == "unexpected closing delimiter: `)`");

    auto mismatched = lex_fail("(a]", Stanza::ParseError::code::unbalanced_delimiter);
    REQUIRE(mismatched.msg == "mismatched closing delimiter: `]`");
    REQUIRE(mismatched.column == 3);
}

TEST_CASE("Invalid UTF-8 Source Is Rejected") {
    std::string s = "ab\n c\xC0\xAF";
    auto e = lex_fail(s, Stanza::ParseError::code::invalid_utf8);
    REQUIRE(e.offset == 5);
    REQUIRE(e.line == 2);
    REQUIRE(e.column == 3);
}

TEST_CASE("Malformed Literals Are Lexer Errors") {
    auto e = lex_fail("0b102", Stanza::ParseError::code::invalid_literal);
    REQUIRE(e.msg == "invalid digit for a base 2 literal");

    lex_fail("\"\\q\"", Stanza::ParseError::code::invalid_literal);
    lex_fail("b'ab'", Stanza::ParseError::code::invalid_literal);
}

TEST_CASE("Integer Literals Decode to Base 10") {
    REQUIRE(decode_as<Stanza::LitInt>("0xFF").digits == "255");
    REQUIRE(decode_as<Stanza::LitInt>("0o777").digits == "511");
    REQUIRE(decode_as<Stanza::LitInt>("0b1010_1010").digits == "170");

    auto suffixed = decode_as<Stanza::LitInt>("1_000u32");
    REQUIRE(suffixed.digits == "1000");
    REQUIRE(suffixed.suffix == "u32");
    REQUIRE(suffixed.repr == "1_000u32");

    // Wider than any machine integer
    REQUIRE(decode_as<Stanza::LitInt>("0xffffffffffffffffffffffffffffffff").digits == "340282366920938463463374607431768211455");
}

TEST_CASE("Base Conversion") {
    REQUIRE(Stanza::detail::to_base10("", 10) == "0");
    REQUIRE(Stanza::detail::to_base10("0000", 16) == "0");
    REQUIRE(Stanza::detail::to_base10("ff", 16) == "255");
    REQUIRE(Stanza::detail::to_base10("10000000000", 2) == "1024");
    REQUIRE(Stanza::detail::to_base10("18446744073709551616", 10) == "18446744073709551616");
}

TEST_CASE("Float Literals Keep Their Digits") {
    REQUIRE(decode_as<Stanza::LitFloat>("3.14").digits == "3.14");
    REQUIRE(decode_as<Stanza::LitFloat>("1e10").digits == "1e10");
    REQUIRE(decode_as<Stanza::LitFloat>("1_000.5").digits == "1000.5");

    auto f = decode_as<Stanza::LitFloat>("2.5E-3f64");
    REQUIRE(f.digits == "2.5E-3");
    REQUIRE(f.suffix == "f64");

    auto typed = decode_as<Stanza::LitFloat>("1f32");
    REQUIRE(typed.digits == "1");
    REQUIRE(typed.suffix == "f32");
}

TEST_CASE("Numeric Literal Errors") {
    REQUIRE(decode_error("0x") == "no valid digits found for number");
    REQUIRE(decode_error("0o8") == "invalid digit for a base 8 literal");
    REQUIRE(decode_error("1e+") == "expected at least one digit in exponent");
}

TEST_CASE("String Literals Decode Escapes") {
    REQUIRE(decode_as<Stanza::LitStr>("\"a\\nb\"").value == "a\nb");
    REQUIRE(decode_as<Stanza::LitStr>("\"\\u{48}\\x49\"").value == "HI");
    REQUIRE(decode_as<Stanza::LitStr>("\"\\u{1F600}\"").value == "\xF0\x9F\x98\x80");
    REQUIRE(decode_as<Stanza::LitStr>("\"one \\\n     two\"").value == "one two");

    auto raw = decode_as<Stanza::LitStr>("r#\"say \"hi\"\"#");
    REQUIRE(raw.value == "say \"hi\"");
    REQUIRE(raw.suffix.empty());

    auto suffixed = decode_as<Stanza::LitStr>("\"s\"suffix");
    REQUIRE(suffixed.value == "s");
    REQUIRE(suffixed.suffix == "suffix");
}

TEST_CASE("Byte and C String Literals Decode to Bytes") {
    auto bs = decode_as<Stanza::LitByteStr>("b\"a\\xff\"");
    REQUIRE(bs.value == std::vector<uint8_t>{ 0x61, 0xFF });

    auto raw = decode_as<Stanza::LitByteStr>("br\"\\n\"");
    REQUIRE(raw.value == std::vector<uint8_t>{ '\\', 'n' });

    auto cs = decode_as<Stanza::LitCStr>("c\"hi\"");
    REQUIRE(cs.value == std::vector<uint8_t>{ 'h', 'i' });

    REQUIRE(decode_as<Stanza::LitByte>("b'\\xff'").value == 0xFF);
    REQUIRE(decode_as<Stanza::LitByte>("b'a'").value == 'a');
}

TEST_CASE("Char Literals Decode to One Code Point") {
    REQUIRE(decode_as<Stanza::LitChar>("'x'").value == U'x');
    REQUIRE(decode_as<Stanza::LitChar>("'\\n'").value == U'\n');
    REQUIRE(decode_as<Stanza::LitChar>("'\\u{1F600}'").value == U'\U0001F600');
    REQUIRE(decode_as<Stanza::LitChar>("'\xC3\xA9'").value == U'\u00E9');
}

TEST_CASE("Escape Errors") {
    REQUIRE(decode_error("\"\\x80\"") == "out of range hex escape");
    REQUIRE(decode_error("\"\\q\"") == "unknown character escape");
    REQUIRE(decode_error("\"\\u{D800}\"") == "invalid unicode character escape");
    REQUIRE(decode_error("\"\\u{}\"") == "empty unicode escape");
    REQUIRE(decode_error("\"\\u{1234567}\"") == "overlong unicode escape");
    REQUIRE(decode_error("b\"\\u{41}\"") == "unicode escape in byte literal");
    REQUIRE(decode_error("b\"\xC3\xA9\"") == "non-ASCII character in byte literal");
    REQUIRE(decode_error("c\"\\0\"") == "null characters in C string literals are not supported");
    REQUIRE(decode_error("'ab'") == "character literal may only contain one codepoint");
    REQUIRE(decode_error("''") == "empty character literal");
}

TEST_CASE("Parse Single Literal") {
    auto b = Stanza::parse_lit("true");
    REQUIRE(b);
    REQUIRE(std::get<Stanza::LitBool>(*b).value);

    auto i = Stanza::parse_lit("42u8");
    REQUIRE(i);
    REQUIRE(std::get<Stanza::LitInt>(*i).suffix == "u8");

    auto not_lit = Stanza::parse_lit("x");
    REQUIRE_FALSE(not_lit);
    REQUIRE(not_lit.error().errc == Stanza::ParseError::code::unexpected_token);

    auto two = Stanza::parse_lit("1 2");
    REQUIRE_FALSE(two);
    REQUIRE(two.error().errc == Stanza::ParseError::code::trailing_tokens);
}
