#include <gtest/gtest.h>

#include "cli/terminal_input.hpp"

using graphos::CellPos;
using graphos::InputDecoder;
using graphos::InputEvent;
using graphos::MouseEvent;

namespace {

InputEvent decode_one(const std::string& bytes) {
  InputDecoder d;
  d.feed(bytes);
  auto ev = d.next();
  EXPECT_TRUE(ev.has_value()) << "no event for input";
  EXPECT_FALSE(d.pending());
  return ev.value_or(InputEvent::make_key(graphos::UNKNOWN));
}

}  // namespace

TEST(TerminalInputTest, ArrowKeys) {
  EXPECT_TRUE(decode_one("\x1b[A").is_key(graphos::UP));
  EXPECT_TRUE(decode_one("\x1b[B").is_key(graphos::DOWN));
  EXPECT_TRUE(decode_one("\x1b[C").is_key(graphos::RIGHT));
  EXPECT_TRUE(decode_one("\x1b[D").is_key(graphos::LEFT));
  EXPECT_TRUE(decode_one("\x1bOB").is_key(graphos::DOWN));
  EXPECT_TRUE(decode_one("\x1b[3~").is_key(graphos::DEL));
  EXPECT_TRUE(decode_one("\x1b[15~").is_key(graphos::UNKNOWN));
}

TEST(TerminalInputTest, ControlKeys) {
  EXPECT_TRUE(decode_one("\x03").is_key(graphos::CTRL_C));
  EXPECT_TRUE(decode_one("\x7f").is_key(graphos::BACKSPACE));
  EXPECT_TRUE(decode_one("\x08").is_key(graphos::BACKSPACE));
  EXPECT_TRUE(decode_one("\r").is_key(graphos::ENTER));
  EXPECT_TRUE(decode_one("\t").is_key(graphos::TAB));
}

TEST(TerminalInputTest, PrintableAndUtf8Characters) {
  EXPECT_TRUE(decode_one("q").is_char("q"));
  EXPECT_TRUE(decode_one(" ").is_char(" "));

  InputDecoder d;
  d.feed(std::string("\xc3"));
  EXPECT_FALSE(d.next().has_value());
  d.feed(std::string("\xa9"));
  auto ev = d.next();
  ASSERT_TRUE(ev.has_value());
  EXPECT_TRUE(ev->is_char("\xc3\xa9"));
}

TEST(TerminalInputTest, BrokenUtf8IsNeverACharacter) {
  InputDecoder d;
  d.feed("caf\xe9" "!");
  EXPECT_TRUE(d.next()->is_char("c"));
  EXPECT_TRUE(d.next()->is_char("a"));
  EXPECT_TRUE(d.next()->is_char("f"));
  EXPECT_TRUE(d.next()->is_key(graphos::UNKNOWN));
  EXPECT_TRUE(d.next()->is_char("!"));
  EXPECT_FALSE(d.pending());

  // A continuation byte that is not 10xxxxxx after a two-byte lead.
  d.feed("\xc3" "A");
  EXPECT_TRUE(d.next()->is_key(graphos::UNKNOWN));
  EXPECT_TRUE(d.next()->is_char("A"));

  // Trailing lead byte waits for more input, then is dropped on flush.
  d.feed("\xe9");
  EXPECT_FALSE(d.next().has_value());
  EXPECT_TRUE(d.next(true)->is_key(graphos::UNKNOWN));
  EXPECT_FALSE(d.pending());
}

TEST(TerminalInputTest, LoneEscapeNeedsFlush) {
  InputDecoder d;
  d.feed(std::string("\x1b"));
  EXPECT_FALSE(d.next().has_value());
  EXPECT_TRUE(d.pending());
  auto ev = d.next(true);
  ASSERT_TRUE(ev.has_value());
  EXPECT_TRUE(ev->is_key(graphos::ESC));
  EXPECT_FALSE(d.pending());
}

TEST(TerminalInputTest, SplitSequenceIsReassembled) {
  InputDecoder d;
  d.feed(std::string("\x1b["));
  EXPECT_FALSE(d.next().has_value());
  d.feed(std::string("A"));
  auto ev = d.next();
  ASSERT_TRUE(ev.has_value());
  EXPECT_TRUE(ev->is_key(graphos::UP));
}

TEST(TerminalInputTest, SeveralEventsInOneRead) {
  InputDecoder d;
  d.feed(std::string("ab\x1b[Dc"));
  EXPECT_TRUE(d.next()->is_char("a"));
  EXPECT_TRUE(d.next()->is_char("b"));
  EXPECT_TRUE(d.next()->is_key(graphos::LEFT));
  EXPECT_TRUE(d.next()->is_char("c"));
  EXPECT_FALSE(d.next().has_value());
}

TEST(TerminalInputTest, SgrMouseReports) {
  InputEvent press = decode_one("\x1b[<0;10;5M");
  ASSERT_EQ(press.type, InputEvent::Type::Mouse);
  EXPECT_EQ(press.mouse.button, MouseEvent::Button::Left);
  EXPECT_EQ(press.mouse.action, MouseEvent::Action::Press);
  EXPECT_EQ(press.mouse.pos, (CellPos{9, 4}));

  InputEvent release = decode_one("\x1b[<0;10;5m");
  EXPECT_EQ(release.mouse.action, MouseEvent::Action::Release);

  InputEvent drag = decode_one("\x1b[<32;11;5M");
  EXPECT_EQ(drag.mouse.button, MouseEvent::Button::Left);
  EXPECT_EQ(drag.mouse.action, MouseEvent::Action::Drag);
  EXPECT_EQ(drag.mouse.pos, (CellPos{10, 4}));

  InputEvent right = decode_one("\x1b[<2;1;1M");
  EXPECT_EQ(right.mouse.button, MouseEvent::Button::Right);
  EXPECT_EQ(right.mouse.pos, (CellPos{0, 0}));

  EXPECT_EQ(decode_one("\x1b[<64;3;3M").mouse.button, MouseEvent::Button::WheelUp);
  EXPECT_EQ(decode_one("\x1b[<65;3;3M").mouse.button, MouseEvent::Button::WheelDown);

  InputEvent hover = decode_one("\x1b[<35;4;4M");
  EXPECT_EQ(hover.mouse.button, MouseEvent::Button::None);
  EXPECT_EQ(hover.mouse.action, MouseEvent::Action::Move);
}
