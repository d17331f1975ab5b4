#include <tint/writer.hpp>

#include <catch2/catch.hpp>

using namespace tint;

TEST_CASE("Write a string") {
    text_writer wr;
    wr.write("foo");
    CHECK(wr.string() == "foo");
    CHECK(wr.visual_size() == 3);
}

TEST_CASE("Write style transitions") {
    text_writer wr;
    wr.put_style(style{});
    CHECK(wr.string() == "");

    wr.put_style(style{}.bold().fg(basic_color::red));
    wr.write("a");
    CHECK(wr.string() == "\x1b[1;31ma");

    // Turning off one attribute is shorter than resetting everything
    wr.put_style(style{}.fg(basic_color::red));
    wr.write("b");
    CHECK(wr.string() == "\x1b[1;31ma\x1b[22mb");

    // Back to nothing is a plain reset
    wr.put_style(style{});
    wr.write("c");
    CHECK(wr.string() == "\x1b[1;31ma\x1b[22mb\x1b[0mc");
    CHECK(wr.visual_size() == 3);
    CHECK(wr.current_style() == style{});
}

TEST_CASE("Bold and dim are cleared together") {
    text_writer wr;
    auto        gray = color::rgb(100, 100, 100);
    wr.put_style(style{}.bold().dim().fg(gray));
    CHECK(wr.take_string() == "\x1b[1;2;38;2;100;100;100m");
    CHECK(wr.string().empty());

    // Dropping bold must keep dim
    wr.put_style(style{}.dim().fg(gray));
    CHECK(wr.take_string() == "\x1b[22;2m");

    wr.put_style(style{}.dim().italic().fg(gray));
    CHECK(wr.take_string() == "\x1b[3m");

    wr.put_style(style{}.dim().fg(gray));
    CHECK(wr.take_string() == "\x1b[23m");

    // Unchanged style writes nothing
    wr.put_style(style{}.fg(gray).dim());
    CHECK(wr.take_string() == "");
}

TEST_CASE("Choose the shorter transition") {
    text_writer wr;
    auto        busy = style{}
                    .bold()
                    .italic()
                    .strikethrough()
                    .curly_underline()
                    .fg(color::rgb(10, 20, 30))
                    .bg(basic_color::white);
    wr.put_style(busy);
    CHECK(wr.take_string() == "\x1b[1;3;9;4:3;38;2;10;20;30;47m");

    // Turning everything but one thing off is longer than starting over
    wr.put_style(style{}.blink());
    CHECK(wr.take_string() == "\x1b[0;5m");

    wr.put_style(style{}.blink().underline_color(color::indexed(5)));
    CHECK(wr.take_string() == "\x1b[58;5;5m");

    wr.put_style(style{}.blink().dotted_underline());
    CHECK(wr.take_string() == "\x1b[4:4;59m");
}

TEST_CASE("Toggle overline") {
    text_writer wr;
    auto        base = style{}.fg(color::rgb(1, 2, 3));
    wr.put_style(base);
    wr.take_string();
    wr.put_style(base.overline());
    CHECK(wr.take_string() == "\x1b[53m");
    wr.put_style(base);
    CHECK(wr.take_string() == "\x1b[55m");
}

TEST_CASE("Write styled content") {
    text_writer wr;
    wr.put_style(style{}.fg(basic_color::green));
    wr.write("a");
    wr.write(style{}.fg(basic_color::green).bold().applied_to("b"));
    wr.write("c");
    CHECK(wr.string() == "\x1b[32ma\x1b[1mb\x1b[22mc");
    CHECK(wr.visual_size() == 3);
    CHECK(wr.current_style() == style{}.fg(basic_color::green));

    wr.putc('!');
    CHECK(wr.visual_size() == 4);
}
