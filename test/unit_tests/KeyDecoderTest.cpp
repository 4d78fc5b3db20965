#include "KeyDecoder.hpp"
#include "KeyEncoder.hpp"
#include "TestHeaders.hpp"

using namespace archtui;

TEST_CASE("Plain bytes", "[KeyDecoder]") {
  auto events = KeyDecoder().decode("hi\r\t\x7f");
  REQUIRE(events.size() == 5);
  REQUIRE(events[0] == KeyEvent::ch('h'));
  REQUIRE(events[1] == KeyEvent::ch('i'));
  REQUIRE(events[2] == KeyEvent::key(KeyCode::ENTER));
  REQUIRE(events[3] == KeyEvent::key(KeyCode::TAB));
  REQUIRE(events[4] == KeyEvent::key(KeyCode::BACKSPACE));
}

TEST_CASE("Control letters", "[KeyDecoder]") {
  auto events = KeyDecoder().decode(string("\x03\x01\x1a"));
  REQUIRE(events.size() == 3);
  REQUIRE(events[0] == KeyEvent::ch('c', KEY_MOD_CONTROL));
  REQUIRE(events[1] == KeyEvent::ch('a', KEY_MOD_CONTROL));
  REQUIRE(events[2] == KeyEvent::ch('z', KEY_MOD_CONTROL));
}

TEST_CASE("UTF-8 characters", "[KeyDecoder]") {
  auto events = KeyDecoder().decode("\xc3\xa9\xe2\x94\x80");
  REQUIRE(events.size() == 2);
  REQUIRE(events[0] == KeyEvent::ch(U'é'));
  REQUIRE(events[1] == KeyEvent::ch(U'─'));

  SECTION("A character split across reads is completed") {
    KeyDecoder decoder;
    REQUIRE(decoder.decode("a\xc3").size() == 1);
    REQUIRE(decoder.decode("\xa9" "b") ==
            vector<KeyEvent>{KeyEvent::ch(U'\u00e9'), KeyEvent::ch('b')});
    REQUIRE(decoder.decode("\xe2").empty());
    REQUIRE(decoder.decode("\x94").empty());
    REQUIRE(decoder.decode("\x80") == vector<KeyEvent>{KeyEvent::ch(U'\u2500')});
  }

  SECTION("A broken split character is dropped") {
    KeyDecoder decoder;
    REQUIRE(decoder.decode("\xc3").empty());
    REQUIRE(decoder.decode("x") == vector<KeyEvent>{KeyEvent::ch('x')});
  }

  SECTION("Invalid bytes are dropped") {
    REQUIRE(KeyDecoder().decode("\xff" "a") ==
            vector<KeyEvent>{KeyEvent::ch('a')});
  }
}

TEST_CASE("Escape sequences", "[KeyDecoder]") {
  SECTION("Arrows in CSI and SS3 form") {
    auto events = KeyDecoder().decode("\x1b[A\x1b[B\x1bOC\x1bOD");
    REQUIRE(events.size() == 4);
    REQUIRE(events[0] == KeyEvent::key(KeyCode::UP));
    REQUIRE(events[1] == KeyEvent::key(KeyCode::DOWN));
    REQUIRE(events[2] == KeyEvent::key(KeyCode::RIGHT));
    REQUIRE(events[3] == KeyEvent::key(KeyCode::LEFT));
  }

  SECTION("Home and End") {
    auto events = KeyDecoder().decode("\x1b[H\x1bOF\x1b[1~\x1b[4~");
    REQUIRE(events.size() == 4);
    REQUIRE(events[0] == KeyEvent::key(KeyCode::HOME));
    REQUIRE(events[1] == KeyEvent::key(KeyCode::END));
    REQUIRE(events[2] == KeyEvent::key(KeyCode::HOME));
    REQUIRE(events[3] == KeyEvent::key(KeyCode::END));
  }

  SECTION("Tilde keys") {
    auto events = KeyDecoder().decode("\x1b[2~\x1b[3~\x1b[5~\x1b[6~");
    REQUIRE(events.size() == 4);
    REQUIRE(events[0] == KeyEvent::key(KeyCode::INSERT));
    REQUIRE(events[1] == KeyEvent::key(KeyCode::DELETE));
    REQUIRE(events[2] == KeyEvent::key(KeyCode::PAGE_UP));
    REQUIRE(events[3] == KeyEvent::key(KeyCode::PAGE_DOWN));
  }

  SECTION("Modified arrow") {
    auto events = KeyDecoder().decode("\x1b[1;5A");
    REQUIRE(events.size() == 1);
    REQUIRE(events[0] == KeyEvent::key(KeyCode::UP, KEY_MOD_CONTROL));
  }

  SECTION("Alt characters") {
    auto events = KeyDecoder().decode("\x1bx\x1b\x7f");
    REQUIRE(events.size() == 2);
    REQUIRE(events[0] == KeyEvent::ch('x', KEY_MOD_ALT));
    REQUIRE(events[1] == KeyEvent::key(KeyCode::BACKSPACE, KEY_MOD_ALT));
  }

  SECTION("Lone escape") {
    REQUIRE(KeyDecoder().decode("\x1b") ==
            vector<KeyEvent>{KeyEvent::key(KeyCode::ESC)});
    auto events = KeyDecoder().decode("\x1b\x1b[A");
    REQUIRE(events.size() == 2);
    REQUIRE(events[0] == KeyEvent::key(KeyCode::ESC));
    REQUIRE(events[1] == KeyEvent::key(KeyCode::UP));
  }

  SECTION("Unknown and truncated sequences are dropped") {
    REQUIRE(KeyDecoder().decode("\x1b[99~a") ==
            vector<KeyEvent>{KeyEvent::ch('a')});
    REQUIRE(KeyDecoder().decode("\x1b[12;").empty());
  }
}

TEST_CASE("Every encodable function key decodes back", "[KeyDecoder]") {
  for (int n = 1; n <= 12; n++) {
    INFO("F" << n);
    auto events = KeyDecoder().decode(KeyEncoder::encode(KeyEvent::function(n)));
    REQUIRE(events == vector<KeyEvent>{KeyEvent::function(n)});
  }
}
