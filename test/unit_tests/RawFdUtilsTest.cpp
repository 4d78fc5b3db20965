#include "RawFdUtils.hpp"
#include "TestHeaders.hpp"

using namespace archtui;

TEST_CASE("writeAll writes all data", "[RawFdUtils]") {
  int fds[2];
  REQUIRE(::pipe(fds) == 0);

  // Larger than a pipe buffer so the writer has to loop
  const string payload(256 * 1024, 'x');
  std::thread writer([&]() {
    RawFdUtils::writeAll(fds[1], payload.data(), payload.size());
    ::close(fds[1]);
  });

  string received;
  char buf[4096];
  while (true) {
    ssize_t rc = ::read(fds[0], buf, sizeof(buf));
    if (rc <= 0) {
      break;
    }
    received.append(buf, rc);
  }
  writer.join();
  ::close(fds[0]);
  REQUIRE(received == payload);
}

TEST_CASE("writeAll throws on a closed pipe", "[RawFdUtils]") {
  int fds[2];
  REQUIRE(::pipe(fds) == 0);
  ::close(fds[0]);

  const string payload = "test data";
  REQUIRE_THROWS_AS(
      RawFdUtils::writeAll(fds[1], payload.data(), payload.size()),
      std::runtime_error);
  ::close(fds[1]);

  REQUIRE_THROWS_AS(RawFdUtils::writeAll(-1, payload.data(), payload.size()),
                    std::runtime_error);
}

TEST_CASE("waitOnData", "[RawFdUtils]") {
  int fds[2];
  REQUIRE(::pipe(fds) == 0);

  REQUIRE_FALSE(RawFdUtils::waitOnData(fds[0], 10));
  RawFdUtils::writeAll(fds[1], "a", 1);
  REQUIRE(RawFdUtils::waitOnData(fds[0], 10));

  RawFdUtils::closeIfOpen(&fds[0]);
  RawFdUtils::closeIfOpen(&fds[1]);
  REQUIRE(fds[0] == -1);
  REQUIRE(fds[1] == -1);
  // Closing twice is harmless
  RawFdUtils::closeIfOpen(&fds[0]);
}
