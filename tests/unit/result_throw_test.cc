#include <gtest/gtest.h>

#include <cerrno>
#include <stdexcept>
#include <string>
#include <system_error>

#include "procgate/result.hpp"

namespace procgate {

TEST(ResultThrowTest, SystemCategoryThrowsSystemError) {
  Error error{std::error_code(ENOENT, std::system_category()), "open"};
  EXPECT_THROW(internal::throw_error(error), std::system_error);
}

TEST(ResultThrowTest, SystemCauseThrowsSystemErrorWithCause) {
  Error error{.code = make_error_code(errc::spawn_failed),
              .context = "could not start nope process",
              .cause = std::error_code(ENOENT, std::system_category())};
  try {
    internal::throw_error(error);
    FAIL() << "expected an exception";
  } catch (const std::system_error& e) {
    EXPECT_EQ(e.code().value(), ENOENT);
    EXPECT_NE(std::string(e.what()).find("could not start nope process"), std::string::npos);
  }
}

TEST(ResultThrowTest, ProcgateCategoryThrowsRuntimeError) {
  Error error{make_error_code(errc::exited_without_output), "vet exited with status 2"};
  try {
    internal::throw_error(error);
    FAIL() << "expected an exception";
  } catch (const std::system_error&) {
    FAIL() << "procgate codes without an OS cause are not system errors";
  } catch (const std::runtime_error& e) {
    EXPECT_STREQ(e.what(), "vet exited with status 2");
  }
}

}  // namespace procgate
