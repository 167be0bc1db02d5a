#include <catch2/catch_all.hpp>

#include "stanza/parse.hpp"
#include "stanza/render.hpp"

#include <string>
#include <utility>

namespace {

    Stanza::ExprPtr parse_ok(std::string_view s) {
        auto r = Stanza::parse_expr(s);
        if (!r) FAIL("parse failed: " << r.error().msg);
        REQUIRE(*r);
        return std::move(*r);
    }

    std::string rendered(std::string_view s) {
        return Stanza::render(*parse_ok(s));
    }

}


TEST_CASE("Operators Render Spaced") {
    REQUIRE(rendered("a+b*c") == "a + b * c");
    REQUIRE(rendered("x += 1") == "x += 1");
    REQUIRE(rendered("a&&b||!c") == "a && b || ! c");
    REQUIRE(rendered("x <<= 2") == "x <<= 2");
    REQUIRE(rendered("-x") == "- x");
    REQUIRE(rendered("*p = 1") == "* p = 1");
    REQUIRE(rendered("x as u8") == "x as u8");
}

TEST_CASE("Calls and Postfix Render Tight Groups") {
    REQUIRE(rendered("f(a, b)") == "f (a , b)");
    REQUIRE(rendered("f(g(1))") == "f (g (1))");
    REQUIRE(rendered("v.iter().map(f)") == "v . iter () . map (f)");
    REQUIRE(rendered("t.0") == "t . 0");
    REQUIRE(rendered("f()?") == "f () ?");
    REQUIRE(rendered("fut.await") == "fut . await");
    REQUIRE(rendered("a[i + 1]") == "a [i + 1]");
    REQUIRE(rendered("iter.collect::<Vec<_>>()") == "iter . collect :: < Vec < _ > > ()");
}

TEST_CASE("Sequences Drop Trailing Commas") {
    REQUIRE(rendered("[1, 2, 3,]") == "[1 , 2 , 3]");
    REQUIRE(rendered("[0; 4]") == "[0 ; 4]");
    REQUIRE(rendered("(1, 2,)") == "(1 , 2)");
    REQUIRE(rendered("()") == "()");
    REQUIRE(rendered("(a)") == "(a)");
}

TEST_CASE("One Element Tuple Keeps Its Comma") {
    REQUIRE(rendered("(1,)") == "(1 ,)");
    REQUIRE(rendered("(1,)") != rendered("(1)"));
}

TEST_CASE("Blocks Render With Padded Braces") {
    REQUIRE(rendered("{}") == "{ }");
    REQUIRE(rendered("{ x }") == "{ x }");
    REQUIRE(rendered("{ let x = 1; x }") == "{ let x = 1 ; x }");
    REQUIRE(rendered("{ a; b }") == "{ a ; b }");
    REQUIRE(rendered("{ let Some(x) = y else { return; }; x }") == "{ let Some (x) = y else { return ; } ; x }");
    REQUIRE(rendered("{ fn f() {} f() }") == "{ fn f () { } f () }");
    REQUIRE(rendered("unsafe { f() }") == "unsafe { f () }");
    REQUIRE(rendered("async move { 1 }") == "async move { 1 }");
    REQUIRE(rendered("const { 1 }") == "const { 1 }");
}

TEST_CASE("Control Flow") {
    REQUIRE(rendered("if x > 0 { x } else { -x }") == "if x > 0 { x } else { - x }");
    REQUIRE(rendered("if a { 1 } else if b { 2 } else { 3 }") == "if a { 1 } else if b { 2 } else { 3 }");
    REQUIRE(rendered("if let Some(x) = y { x }") == "if let Some (x) = y { x }");
    REQUIRE(rendered("while let Some(x) = it.next() {}") == "while let Some (x) = it . next () { }");
    REQUIRE(rendered("for (i, x) in v.iter().enumerate() {}") == "for (i , x) in v . iter () . enumerate () { }");
    REQUIRE(rendered("return Ok(())") == "return Ok (())");
    REQUIRE(rendered("return") == "return");
}

TEST_CASE("Labels Render With Their Quote") {
    REQUIRE(rendered("'outer: loop { break 'outer; }") == "'outer : loop { break 'outer ; }");
    REQUIRE(rendered("'a: { break 'a 1; }") == "'a : { break 'a 1 ; }");
    REQUIRE(rendered("continue 'x") == "continue 'x");
}

TEST_CASE("Match Arms") {
    REQUIRE(rendered("match x { 1 => a, _ => { b } }") == "match x { 1 => a , _ => { b } }");
    REQUIRE(rendered("match x { 1 => {} _ => 2 }") == "match x { 1 => { } _ => 2 }");
    REQUIRE(rendered("match x { Some(v) if v > 0 => v, _ => 0 }") == "match x { Some (v) if v > 0 => v , _ => 0 }");
}

TEST_CASE("Ranges") {
    REQUIRE(rendered("..") == "..");
    REQUIRE(rendered("a..") == "a ..");
    REQUIRE(rendered("..=b") == "..= b");
    REQUIRE(rendered("0..n") == "0 .. n");
}

TEST_CASE("References") {
    REQUIRE(rendered("&mut x") == "& mut x");
    REQUIRE(rendered("&x") == "& x");
    REQUIRE(rendered("&raw const x") == "& raw const x");
    REQUIRE(rendered("&raw mut x") == "& raw mut x");
}

TEST_CASE("Closures") {
    REQUIRE(rendered("|| 1") == "|| 1");
    REQUIRE(rendered("move |a, b| a + b") == "move | a , b | a + b");
    REQUIRE(rendered("|x: i32| -> i32 { x }") == "| x : i32 | -> i32 { x }");
}

TEST_CASE("Struct Literals") {
    REQUIRE(rendered("Point { x: 1, y: 2 }") == "Point { x : 1 , y : 2 }");
    REQUIRE(rendered("Point { x, y: 2 }") == "Point { x , y : 2 }");
    REQUIRE(rendered("Point { x: 1, ..base }") == "Point { x : 1 , .. base }");
    REQUIRE(rendered("S {}") == "S { }");
}

TEST_CASE("Paths and Qualified Self") {
    REQUIRE(rendered("std::mem::swap") == "std :: mem :: swap");
    REQUIRE(rendered("::std::mem::swap") == ":: std :: mem :: swap");
    REQUIRE(rendered("Vec::<i32>::new()") == "Vec :: < i32 > :: new ()");
    REQUIRE(rendered("<Vec<T> as IntoIterator>::Item") == "< Vec < T > as IntoIterator > :: Item");
}

TEST_CASE("Macros Keep Their Delimiter") {
    REQUIRE(rendered("vec![1, 2]") == "vec ! [1 , 2]");
    REQUIRE(rendered("m!{ a b }") == "m ! { a b }");
    REQUIRE(rendered("println!(\"{}\", x)") == "println ! (\"{}\" , x)");
}

TEST_CASE("Attributes") {
    REQUIRE(rendered("#[rustfmt::skip] x.y") == "# [rustfmt :: skip] x . y");
    REQUIRE(rendered("{ #![allow(unused)] x }") == "{ #! [allow (unused)] x }");
    REQUIRE(rendered("match x { #![allow(unused)] _ => 1 }") == "match x { #! [allow (unused)] _ => 1 }");
}

TEST_CASE("Literals Print Their Source Spelling") {
    REQUIRE(rendered("0xFF_u8") == "0xFF_u8");
    REQUIRE(rendered("1_000.5e3f64") == "1_000.5e3f64");
    REQUIRE(rendered("b\"hi\"") == "b\"hi\"");
    REQUIRE(rendered("r#\"raw\"#") == "r#\"raw\"#");
    REQUIRE(rendered("'x'") == "'x'");
    REQUIRE(rendered("true") == "true");
}

TEST_CASE("Formatting Does Not Change Opaque Text") {
    REQUIRE(rendered("f( a,b )") == rendered("f(a , b)"));
    REQUIRE(rendered("a /* note */ + // trailing\n b") == "a + b");
    REQUIRE(rendered("{\n    let x = 1;\n    x\n}") == rendered("{ let x=1; x }"));
}

TEST_CASE("Rendering Is Idempotent") {
    const char* inputs[] = {
        "a + b * c",
        "x += 1",
        "v.iter().map(|x| x * 2).collect::<Vec<_>>()",
        "(1,)",
        "match x { Some(v) if v > 0 => v, _ => { 0 } }",
        "if x > 0 { x } else { -x }",
        "'outer: loop { break 'outer; }",
        "Point { x: 1, ..base }",
        "<Vec<T> as IntoIterator>::Item",
        "{ #![allow(unused)] let Some(x) = y else { return; }; x }",
        "#[rustfmt::skip] x.y",
        "|| 1",
        "&raw const x",
        "vec![1, 2]",
        "a..=b",
    };

    for (const char* input : inputs) {
        CAPTURE(input);
        std::string once = rendered(input);
        REQUIRE(rendered(once) == once);
    }
}

TEST_CASE("Identical Subtrees Render Identically") {
    auto e = parse_ok("f(a + b) + f(a + b)");
    const auto& sum = *e->get_if<Stanza::ExprBinary>();
    REQUIRE(Stanza::render(*sum.left) == Stanza::render(*sum.right));
    REQUIRE(Stanza::render(*sum.left) == "f (a + b)");
}

TEST_CASE("Synthetic Nodes Render") {
    auto group = Stanza::make_expr(Stanza::ExprGroup{ parse_ok("a + b") });
    REQUIRE(Stanza::render(*group) == "a + b");

    Stanza::token_stream ts;
    ts.ident("yeet");
    ts.ident("x");
    auto ext = Stanza::make_expr(Stanza::ExprExtension{ "yeet", ts });
    REQUIRE(Stanza::render(*ext) == "yeet x");

    auto call = Stanza::make_expr(Stanza::ExprCall{ std::move(group), {} });
    REQUIRE(Stanza::render(*call) == "a + b ()");
}
