#include <gtest/gtest.h>

#include <sstream>

#include "floe/about.hpp"

TEST(About, MessageIncludesNameAndAuthor) {
  const auto message = floe::about_message();
  EXPECT_NE(message.find("floe"), std::string::npos);
  EXPECT_NE(message.find(floe::agent_author()), std::string::npos);
}

TEST(About, AuthorIsTheFloeDevelopers) {
  EXPECT_EQ(floe::agent_author(), "the floe developers");
  EXPECT_EQ(floe::about_message(),
            "floe - Hey, That's My Fish! agent (author: the floe developers)");
}

TEST(About, PrintWritesMessageWithNewline) {
  std::ostringstream buffer;
  floe::print_about(buffer);
  EXPECT_EQ(buffer.str(), floe::about_message() + '\n');
}
